#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include "logging.hpp"

namespace stockledger {

enum class StoreBackend { Memory, Postgres };

/**
 * Process configuration, read once at startup from the environment.
 *
 *   PORT                             gRPC listen port (50061)
 *   STOCKLEDGER_STORE                "memory" or "postgres" (memory)
 *   STOCKLEDGER_PG_DSN               libpq connection string, required for postgres
 *   STOCKLEDGER_LOCK_TIMEOUT_MS      row lock wait before TransactionConflict (5000)
 *   STOCKLEDGER_RECENT_ADJUSTMENTS   adjustments returned by findBySkuId (10)
 *   STOCKLEDGER_LOG_LEVEL            debug|info|warn|error (info)
 */
struct Config {
    int port = 50061;
    StoreBackend store = StoreBackend::Memory;
    std::string pg_dsn;
    std::chrono::milliseconds lock_timeout{5000};
    std::size_t recent_adjustments = 10;
    LogLevel log_level = LogLevel::Info;

    std::string listen_address() const { return "0.0.0.0:" + std::to_string(port); }

    /// Lookup returns nullptr for unset variables. Throws InvalidArgumentError.
    static Config from_lookup(const std::function<const char*(const char*)>& lookup);
    static Config from_env();
};

const char* store_backend_name(StoreBackend backend);

} // namespace stockledger
