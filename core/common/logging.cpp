#include "common/logging.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace gamemind {

namespace {

std::mutex& loggerMutex() {
    static std::mutex m;
    return m;
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps anything unknown to "off"
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log level '" + name + "'");
    }
    return level;
}

} // namespace

void initLogging(const LoggingConfig& config) {
    auto level = parseLevel(config.log_level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (config.file) {
        std::string dir = config.log_dir;
        if (!dir.empty() && dir.back() != '/') dir += '/';
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            dir + "gamemind.log", 1048576 * 5, 3));
    }

    std::lock_guard<std::mutex> lock(loggerMutex());
    spdlog::drop(kLoggerName);
    auto log = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    log->set_level(level);
    spdlog::register_logger(log);
}

std::shared_ptr<spdlog::logger> logger() {
    auto log = spdlog::get(kLoggerName);
    if (log) return log;

    std::lock_guard<std::mutex> lock(loggerMutex());
    log = spdlog::get(kLoggerName);
    if (!log) {
        log = spdlog::stdout_color_mt(kLoggerName);
        log->set_level(spdlog::level::info);
    }
    return log;
}

} // namespace gamemind
