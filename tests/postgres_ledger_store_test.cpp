#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include "stockledger/adjustment_engine.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/inventory_query.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/order_lifecycle.hpp"
#include "stockledger/postgres_ledger_store.hpp"
#include "stockledger/reservation_engine.hpp"

using namespace stockledger;

/**
 * Runs against a live database named by STOCKLEDGER_TEST_PG_DSN. Every test
 * uses a fresh organization id so reruns do not collide.
 */
class PostgresLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* dsn = std::getenv("STOCKLEDGER_TEST_PG_DSN");
        if (dsn == nullptr || *dsn == '\0') {
            GTEST_SKIP() << "STOCKLEDGER_TEST_PG_DSN not set";
        }
        set_log_level(LogLevel::Error);
        store_ = std::make_unique<PostgresLedgerStore>(dsn, std::chrono::milliseconds(200));
        store_->ensure_schema();

        auto now = std::chrono::system_clock::now().time_since_epoch();
        org_ = "org-" + std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
    }

    void record(const std::string& order_id, std::vector<OrderLine> lines) {
        ReservationEngine reservations(*store_);
        OrderLifecycle lifecycle(*store_, reservations);
        Order order;
        order.organization_id = org_;
        order.id = order_id;
        order.created_by = "user-1";
        order.lines = std::move(lines);
        lifecycle.record_order(order);
    }

    std::unique_ptr<PostgresLedgerStore> store_;
    std::string org_;
};

TEST_F(PostgresLedgerStoreTest, ReserveAndRelease_ShouldRoundTripCounters) {
    AdjustmentEngine adjustments(*store_);
    ReservationEngine reservations(*store_);
    adjustments.track_sku(org_, "SKU-A", 50, "user-1");
    adjustments.track_sku(org_, "SKU-B", 100, "user-1");
    record("order-1", {{"item-1", "SKU-A", 5}, {"item-2", "SKU-B", 3}});

    auto reserved = reservations.reserve_stock_for_order("order-1", org_);
    ASSERT_EQ(reserved.size(), 2u);
    EXPECT_EQ(store_->find_item(org_, "SKU-A")->quantity_available, 45);
    EXPECT_EQ(store_->find_item(org_, "SKU-B")->quantity_reserved, 3);

    auto again = reservations.reserve_stock_for_order("order-1", org_);
    EXPECT_EQ(again[0].id, reserved[0].id);

    auto released = reservations.release_stock_for_order("order-1", org_, RELEASE_REASON_RETURNED);
    ASSERT_EQ(released.size(), 2u);
    EXPECT_EQ(released[0].reason.value_or(""), "returned");
    EXPECT_EQ(store_->find_item(org_, "SKU-A")->quantity_available, 50);

    InventoryQuery query(*store_);
    auto detail = query.find_by_sku_id("SKU-A", org_);
    EXPECT_TRUE(detail.active_reservations.empty());
    ASSERT_EQ(detail.recent_adjustments.size(), 3u);
    EXPECT_EQ(detail.recent_adjustments[0].type, AdjustmentType::Return);
}

TEST_F(PostgresLedgerStoreTest, Reserve_WithShortSku_ShouldRollBackEverything) {
    AdjustmentEngine adjustments(*store_);
    ReservationEngine reservations(*store_);
    adjustments.track_sku(org_, "SKU-A", 50, "user-1");
    adjustments.track_sku(org_, "SKU-B", 1, "user-1");
    record("order-1", {{"item-1", "SKU-A", 5}, {"item-2", "SKU-B", 3}});

    EXPECT_THROW(reservations.reserve_stock_for_order("order-1", org_), InsufficientStockError);
    EXPECT_EQ(store_->find_item(org_, "SKU-A")->quantity_reserved, 0);
}

TEST_F(PostgresLedgerStoreTest, Adjust_BelowReserved_ShouldBeRejected) {
    AdjustmentEngine adjustments(*store_);
    ReservationEngine reservations(*store_);
    adjustments.track_sku(org_, "SKU-A", 100, "user-1");
    record("order-1", {{"item-1", "SKU-A", 20}});
    reservations.reserve_stock_for_order("order-1", org_);

    EXPECT_THROW(adjustments.adjust_stock("SKU-A", -85, "Shrinkage", "user-1", org_),
                 BelowReservedQuantityError);
    auto updated = adjustments.adjust_stock("SKU-A", -70, "Cycle count", "user-1", org_);
    EXPECT_EQ(updated.quantity_total, 30);
    EXPECT_EQ(updated.quantity_available, 10);
}

TEST_F(PostgresLedgerStoreTest, TrackSku_Twice_ShouldThrowAlreadyExists) {
    AdjustmentEngine adjustments(*store_);
    adjustments.track_sku(org_, "SKU-A", 1, "user-1");
    EXPECT_THROW(adjustments.track_sku(org_, "SKU-A", 1, "user-1"), AlreadyExistsError);
}

TEST_F(PostgresLedgerStoreTest, LockedItem_ShouldTimeOutSecondTransaction) {
    AdjustmentEngine adjustments(*store_);
    adjustments.track_sku(org_, "SKU-A", 1, "user-1");

    auto holder = store_->begin();
    ASSERT_TRUE(holder->get_item_for_update(org_, "SKU-A").has_value());

    auto contender = store_->begin();
    EXPECT_THROW(contender->get_item_for_update(org_, "SKU-A"), TransactionConflictError);
}

TEST_F(PostgresLedgerStoreTest, UncommittedWrites_ShouldBeInvisible) {
    AdjustmentEngine adjustments(*store_);
    adjustments.track_sku(org_, "SKU-A", 10, "user-1");

    {
        auto tx = store_->begin();
        auto item = tx->get_item_for_update(org_, "SKU-A");
        item->quantity_total = 4;
        item->quantity_available = 4;
        tx->update_item(*item);
        EXPECT_EQ(store_->find_item(org_, "SKU-A")->quantity_total, 10);
    }

    EXPECT_EQ(store_->find_item(org_, "SKU-A")->quantity_total, 10);
}
