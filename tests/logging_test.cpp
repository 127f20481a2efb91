#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"

using namespace stockledger;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = log_level();
        previous_buffer_ = std::cout.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(previous_buffer_);
        set_log_level(previous_level_);
    }

    std::string output() const { return captured_.str(); }

    std::ostringstream captured_;
    std::streambuf* previous_buffer_ = nullptr;
    LogLevel previous_level_ = LogLevel::Info;
};

TEST_F(LoggingTest, LogInfo_ShouldWriteOneJsonLineWithFields) {
    set_log_level(LogLevel::Info);

    log_info("reservation", "stock_reserved", {{"order_id", "order-1"}, {"reservations", 2}});

    auto line = output();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');

    auto entry = nlohmann::json::parse(line);
    EXPECT_EQ(entry["level"], "info");
    EXPECT_EQ(entry["domain"], "reservation");
    EXPECT_EQ(entry["message"], "stock_reserved");
    EXPECT_EQ(entry["order_id"], "order-1");
    EXPECT_EQ(entry["reservations"], 2);
    EXPECT_TRUE(entry.contains("timestamp"));
}

TEST_F(LoggingTest, EntriesBelowMinimumLevel_ShouldBeDropped) {
    set_log_level(LogLevel::Warn);

    log_debug("test", "debug_message");
    log_info("test", "info_message");
    EXPECT_TRUE(output().empty());

    log_warn("test", "warn_message");
    EXPECT_NE(output().find("warn_message"), std::string::npos);
}

TEST(LogLevelTest, Parse_ShouldAcceptKnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("ERROR"), LogLevel::Error);
    EXPECT_STREQ(log_level_name(LogLevel::Warn), "warn");
    EXPECT_THROW(parse_log_level("trace"), InvalidArgumentError);
}
