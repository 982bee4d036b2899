#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace gamemind {

// ─── Logging Config ────────────────────────────────────────────

struct LoggingConfig {
    std::string log_dir = "logs/";
    std::string log_level = "info";  // trace|debug|info|warn|error|off
    bool file = false;               // also write <log_dir>/gamemind.log
};

/// Name of the shared spdlog logger used across the library.
constexpr const char* kLoggerName = "gamemind";

/// (Re)configure the shared logger. Throws ConfigError on an unknown level.
void initLogging(const LoggingConfig& config);

/// The shared logger. Created with a stdout sink on first use if
/// initLogging() was never called.
std::shared_ptr<spdlog::logger> logger();

} // namespace gamemind
