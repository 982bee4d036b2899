#pragma once

#include "oracle/oracle_backend.hpp"
#include "oracle/oracle_config.hpp"

#include <optional>
#include <string>

namespace gamemind {

// ─── HTTP Oracle Backend ───────────────────────────────────────
// Ollama-style completion server over libcurl:
//   POST {base_url}/api/generate   (non-streaming)
//   GET  {base_url}/api/tags       (probe / model list)
//
// Every call uses its own curl easy handle, so one instance may be
// shared between threads.

class HttpOracleBackend : public OracleBackend {
public:
    explicit HttpOracleBackend(OracleConfig config);

    std::optional<std::string> generate(const GenerateRequest& request) const override;
    bool isAvailable() const override;
    std::vector<std::string> listModels() const override;

    const OracleConfig& config() const { return config_; }

private:
    OracleConfig config_;

    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    /// Perform one request. `post_body` selects POST; otherwise GET.
    /// Returns std::nullopt on transport failure (including timeouts).
    std::optional<HttpResponse> perform(const std::string& path,
                                        const std::string* post_body,
                                        long timeout_ms) const;
};

} // namespace gamemind
