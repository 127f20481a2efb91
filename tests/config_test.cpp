#include <gtest/gtest.h>
#include <map>
#include <string>
#include "stockledger/config.hpp"
#include "stockledger/errors.hpp"

using namespace stockledger;

class ConfigTest : public ::testing::Test {
protected:
    Config load() {
        return Config::from_lookup([this](const char* name) -> const char* {
            auto it = env_.find(name);
            return it == env_.end() ? nullptr : it->second.c_str();
        });
    }

    std::map<std::string, std::string> env_;
};

TEST_F(ConfigTest, Defaults_ShouldUseMemoryStoreOnPort50061) {
    auto config = load();

    EXPECT_EQ(config.port, 50061);
    EXPECT_EQ(config.store, StoreBackend::Memory);
    EXPECT_EQ(config.lock_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.recent_adjustments, 10u);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.listen_address(), "0.0.0.0:50061");
}

TEST_F(ConfigTest, Overrides_ShouldBeApplied) {
    env_["PORT"] = "6000";
    env_["STOCKLEDGER_STORE"] = "postgres";
    env_["STOCKLEDGER_PG_DSN"] = "postgresql://ledger@localhost/ledger";
    env_["STOCKLEDGER_LOCK_TIMEOUT_MS"] = "250";
    env_["STOCKLEDGER_RECENT_ADJUSTMENTS"] = "25";
    env_["STOCKLEDGER_LOG_LEVEL"] = "DEBUG";

    auto config = load();

    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.store, StoreBackend::Postgres);
    EXPECT_EQ(config.pg_dsn, "postgresql://ledger@localhost/ledger");
    EXPECT_EQ(config.lock_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config.recent_adjustments, 25u);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_STREQ(store_backend_name(config.store), "postgres");
}

TEST_F(ConfigTest, PostgresWithoutDsn_ShouldThrowInvalidArgument) {
    env_["STOCKLEDGER_STORE"] = "postgres";
    EXPECT_THROW(load(), InvalidArgumentError);
}

TEST_F(ConfigTest, UnknownStore_ShouldThrowInvalidArgument) {
    env_["STOCKLEDGER_STORE"] = "redis";
    EXPECT_THROW(load(), InvalidArgumentError);
}

TEST_F(ConfigTest, MalformedNumbers_ShouldThrowInvalidArgument) {
    env_["PORT"] = "80a";
    EXPECT_THROW(load(), InvalidArgumentError);

    env_["PORT"] = "70000";
    EXPECT_THROW(load(), InvalidArgumentError);

    env_.erase("PORT");
    env_["STOCKLEDGER_LOCK_TIMEOUT_MS"] = "0";
    EXPECT_THROW(load(), InvalidArgumentError);
}

TEST_F(ConfigTest, UnknownLogLevel_ShouldThrowInvalidArgument) {
    env_["STOCKLEDGER_LOG_LEVEL"] = "verbose";
    EXPECT_THROW(load(), InvalidArgumentError);
}
