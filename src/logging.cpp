#include "stockledger/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include "stockledger/errors.hpp"

namespace stockledger {

namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};
std::mutex g_output_mutex;

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    throw InvalidArgumentError("Unknown log level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_min_level.load());
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

void log_event(LogLevel level, const std::string& domain, const std::string& message,
               const nlohmann::json& fields) {
    if (static_cast<int>(level) < g_min_level.load()) return;

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }

    auto line = log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << line << std::endl;
}

} // namespace stockledger
