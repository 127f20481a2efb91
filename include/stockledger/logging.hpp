#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace stockledger {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Parse "debug", "info", "warn"/"warning", "error". Throws InvalidArgumentError.
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

/// Entries below this level are dropped. Defaults to Info.
void set_log_level(LogLevel level);
LogLevel log_level();

std::string now_iso8601();

/**
 * Write one JSON line to stdout:
 * {"level","message","domain","timestamp", ...fields}.
 */
void log_event(LogLevel level, const std::string& domain, const std::string& message,
               const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_event(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_event(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_event(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_event(LogLevel::Error, domain, message, fields);
}

} // namespace stockledger
