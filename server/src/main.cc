#include "inventory_ledger_service.hpp"
#include "stockledger/config.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/memory_ledger_store.hpp"
#ifdef STOCKLEDGER_HAVE_POSTGRES
#include "stockledger/postgres_ledger_store.hpp"
#endif
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

namespace {

constexpr const char* LOG_DOMAIN = "server";

std::unique_ptr<stockledger::LedgerStore> make_store(const stockledger::Config& config) {
    if (config.store == stockledger::StoreBackend::Postgres) {
#ifdef STOCKLEDGER_HAVE_POSTGRES
        auto store = std::make_unique<stockledger::PostgresLedgerStore>(config.pg_dsn, config.lock_timeout);
        store->ensure_schema();
        return store;
#else
        throw stockledger::InvalidArgumentError(
            "STOCKLEDGER_STORE=postgres but this build has no PostgreSQL support");
#endif
    }
    return std::make_unique<stockledger::InMemoryLedgerStore>(config.lock_timeout);
}

} // anonymous namespace

int main(int argc, char** argv) {
    stockledger::Config config;
    std::unique_ptr<stockledger::LedgerStore> store;
    try {
        config = stockledger::Config::from_env();
        stockledger::set_log_level(config.log_level);
        store = make_store(config);
    } catch (const stockledger::InventoryError& e) {
        stockledger::log_error(LOG_DOMAIN, "startup_failed", e.details());
        return 1;
    }

    stockledger::InventoryLedgerService service(*store, config.recent_adjustments);

    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    const std::string server_address = config.listen_address();
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        stockledger::log_error(LOG_DOMAIN, "server_start_failed", {{"address", server_address}});
        return 1;
    }

    stockledger::log_info(LOG_DOMAIN, "inventory_ledger_server_started",
                          {{"address", server_address},
                           {"store", stockledger::store_backend_name(config.store)},
                           {"lock_timeout_ms", config.lock_timeout.count()}});

    server->Wait();

    return 0;
}
