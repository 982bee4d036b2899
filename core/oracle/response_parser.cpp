#include "oracle/response_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace gamemind {

namespace {

constexpr size_t kMinSubgoalLength = 4;

const std::array<const char*, 7> kActionWords = {
    "collect", "craft", "place", "defeat", "find", "move", "use"
};

/// Remove one enumeration marker from the front of an already trimmed line.
std::string stripMarker(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) i++;
    if (i > 0 && i < line.size() && line[i] == '.') {
        return trim(line.substr(i + 1));
    }

    if (line[0] == '-' || line[0] == '*') {
        return trim(line.substr(1));
    }

    static const std::string bullet = "\xE2\x80\xA2";  // U+2022
    if (line.compare(0, bullet.size(), bullet) == 0) {
        return trim(line.substr(bullet.size()));
    }
    return line;
}

} // namespace

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> parseSubgoals(const std::string& response, size_t max_items) {
    std::vector<std::string> subgoals;
    std::istringstream in(response);
    std::string line;

    while (subgoals.size() < max_items && std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        line = stripMarker(line);
        if (line.size() < kMinSubgoalLength) continue;

        subgoals.push_back(line);
    }
    return subgoals;
}

Complexity estimateComplexity(const std::string& rationale) {
    std::istringstream in(rationale);
    size_t words = 0;
    std::string w;
    while (in >> w) words++;

    if (words < 10) return Complexity::SIMPLE;
    if (words < 20) return Complexity::MEDIUM;
    return Complexity::COMPLEX;
}

int estimateSteps(const std::string& rationale) {
    std::string lower = toLower(rationale);
    int count = 0;
    for (const char* word : kActionWords) {
        if (lower.find(word) != std::string::npos) count++;
    }
    return std::max(2, std::min(count, 6));
}

} // namespace gamemind
