#include "stockledger/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include "stockledger/errors.hpp"

namespace stockledger {

namespace {

long long parse_integer(const char* name, const std::string& value, long long min, long long max) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidArgumentError(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw InvalidArgumentError(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (parsed < min || parsed > max) {
        throw InvalidArgumentError(std::string(name) + " out of range: " + value);
    }
    return parsed;
}

} // anonymous namespace

const char* store_backend_name(StoreBackend backend) {
    return backend == StoreBackend::Postgres ? "postgres" : "memory";
}

Config Config::from_lookup(const std::function<const char*(const char*)>& lookup) {
    Config config;

    if (const char* port = lookup("PORT")) {
        config.port = static_cast<int>(parse_integer("PORT", port, 1, 65535));
    }

    if (const char* store = lookup("STOCKLEDGER_STORE")) {
        std::string name = store;
        if (name == "memory") {
            config.store = StoreBackend::Memory;
        } else if (name == "postgres") {
            config.store = StoreBackend::Postgres;
        } else {
            throw InvalidArgumentError("STOCKLEDGER_STORE must be 'memory' or 'postgres', got '" + name + "'");
        }
    }

    if (const char* dsn = lookup("STOCKLEDGER_PG_DSN")) {
        config.pg_dsn = dsn;
    }
    if (config.store == StoreBackend::Postgres && config.pg_dsn.empty()) {
        throw InvalidArgumentError("STOCKLEDGER_PG_DSN is required when STOCKLEDGER_STORE=postgres");
    }

    if (const char* timeout = lookup("STOCKLEDGER_LOCK_TIMEOUT_MS")) {
        config.lock_timeout = std::chrono::milliseconds(
            parse_integer("STOCKLEDGER_LOCK_TIMEOUT_MS", timeout, 1, 600000));
    }

    if (const char* recent = lookup("STOCKLEDGER_RECENT_ADJUSTMENTS")) {
        config.recent_adjustments = static_cast<std::size_t>(
            parse_integer("STOCKLEDGER_RECENT_ADJUSTMENTS", recent, 0, 1000));
    }

    if (const char* level = lookup("STOCKLEDGER_LOG_LEVEL")) {
        config.log_level = parse_log_level(level);
    }

    return config;
}

Config Config::from_env() {
    return from_lookup([](const char* name) { return std::getenv(name); });
}

} // namespace stockledger
