#include "oracle/http_backend.hpp"
#include "common/logging.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <mutex>

namespace gamemind {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    size_t total = size * nmemb;
    buffer->append(static_cast<char*>(contents), total);
    return total;
}

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string joinUrl(const std::string& base, const std::string& path) {
    if (!base.empty() && base.back() == '/') {
        return base.substr(0, base.size() - 1) + path;
    }
    return base + path;
}

bool isSuccess(long status) { return status >= 200 && status < 300; }

} // namespace

HttpOracleBackend::HttpOracleBackend(OracleConfig config)
    : config_(std::move(config)) {
    ensureCurlInitialized();
}

std::optional<HttpOracleBackend::HttpResponse> HttpOracleBackend::perform(
    const std::string& path, const std::string* post_body, long timeout_ms) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        logger()->warn("oracle: failed to initialize cURL");
        return std::nullopt;
    }

    std::string url = joinUrl(config_.base_url, path);
    HttpResponse response;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth;
    if (!config_.api_key.empty()) {
        auth = "Authorization: Bearer " + config_.api_key;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (post_body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, long(post_body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        logger()->warn("oracle: request to {} failed: {}", url, curl_easy_strerror(res));
        return std::nullopt;
    }
    return response;
}

std::optional<std::string> HttpOracleBackend::generate(const GenerateRequest& request) const {
    nlohmann::json payload = {
        {"model", config_.model_name},
        {"prompt", request.prompt},
        {"stream", false},
        {"options", {
            {"num_predict", request.max_tokens},
            {"temperature", request.temperature},
            {"top_p", 0.9},
            {"repeat_penalty", 1.1}
        }}
    };
    // invalid UTF-8 in the prompt is replaced rather than thrown
    std::string body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    auto response = perform("/api/generate", &body, config_.request_timeout_ms);
    if (!response) return std::nullopt;

    if (!isSuccess(response->status)) {
        logger()->warn("oracle: backend returned status {}", response->status);
        return std::nullopt;
    }

    try {
        auto reply = nlohmann::json::parse(response->body);
        if (!reply.contains("response") || !reply["response"].is_string()) {
            logger()->warn("oracle: reply has no 'response' text");
            return std::nullopt;
        }
        return reply["response"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("oracle: unreadable reply: {}", e.what());
        return std::nullopt;
    }
}

bool HttpOracleBackend::isAvailable() const {
    auto response = perform("/api/tags", nullptr, config_.probe_timeout_ms);
    return response && isSuccess(response->status);
}

std::vector<std::string> HttpOracleBackend::listModels() const {
    std::vector<std::string> models;
    auto response = perform("/api/tags", nullptr, config_.probe_timeout_ms);
    if (!response || !isSuccess(response->status)) return models;

    try {
        auto reply = nlohmann::json::parse(response->body);
        for (const auto& model : reply.value("models", nlohmann::json::array())) {
            if (model.contains("name") && model["name"].is_string()) {
                models.push_back(model["name"].get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("oracle: unreadable model list: {}", e.what());
        models.clear();
    }
    return models;
}

} // namespace gamemind
