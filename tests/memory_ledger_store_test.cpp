#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <stdexcept>
#include "stockledger/errors.hpp"
#include "stockledger/memory_ledger_store.hpp"

using namespace stockledger;

namespace {

InventoryItem new_item(const std::string& sku_id, Quantity quantity) {
    InventoryItem item;
    item.organization_id = "org-1";
    item.sku_id = sku_id;
    item.quantity_total = quantity;
    item.quantity_available = quantity;
    return item;
}

} // anonymous namespace

class InMemoryLedgerStoreTest : public ::testing::Test {
protected:
    InMemoryLedgerStoreTest() : store_(std::chrono::milliseconds(100)) {}

    InventoryItem seed(const std::string& sku_id, Quantity quantity) {
        return store_.with_transaction([&](LedgerTransaction& tx) {
            return tx.create_item(new_item(sku_id, quantity));
        });
    }

    InMemoryLedgerStore store_;
};

// =============================================================================
// Visibility
// =============================================================================

TEST_F(InMemoryLedgerStoreTest, Commit_ShouldPublishWrites) {
    auto created = seed("SKU-A", 10);

    auto found = store_.find_item("org-1", "SKU-A");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, created.id);
    EXPECT_EQ(found->quantity_total, 10);
}

TEST_F(InMemoryLedgerStoreTest, UncommittedWrites_ShouldBeInvisibleToReaders) {
    // Given a transaction that changed an item but has not committed
    seed("SKU-A", 10);
    auto tx = store_.begin();
    auto item = tx->get_item_for_update("org-1", "SKU-A");
    ASSERT_TRUE(item.has_value());
    item->quantity_total = 3;
    item->quantity_available = 3;
    tx->update_item(*item);

    // Then readers still see the committed row
    EXPECT_EQ(store_.find_item("org-1", "SKU-A")->quantity_total, 10);

    // And the transaction sees its own write
    EXPECT_EQ(tx->get_item_for_update("org-1", "SKU-A")->quantity_total, 3);
}

TEST_F(InMemoryLedgerStoreTest, DestroyWithoutCommit_ShouldRollBack) {
    seed("SKU-A", 10);
    {
        auto tx = store_.begin();
        auto item = tx->get_item_for_update("org-1", "SKU-A");
        item->quantity_total = 0;
        item->quantity_available = 0;
        tx->update_item(*item);
        tx->create_item(new_item("SKU-B", 5));
    }

    EXPECT_EQ(store_.find_item("org-1", "SKU-A")->quantity_total, 10);
    EXPECT_FALSE(store_.find_item("org-1", "SKU-B").has_value());

    // And the rolled back transaction released its locks
    auto tx = store_.begin();
    EXPECT_NO_THROW(tx->get_item_for_update("org-1", "SKU-A"));
}

TEST_F(InMemoryLedgerStoreTest, WithTransaction_WhenFnThrows_ShouldRollBackAndRethrow) {
    seed("SKU-A", 10);

    EXPECT_THROW(store_.with_transaction([&](LedgerTransaction& tx) {
        auto item = tx.get_item_for_update("org-1", "SKU-A");
        item->quantity_total = 1;
        item->quantity_available = 1;
        tx.update_item(*item);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(store_.find_item("org-1", "SKU-A")->quantity_total, 10);
}

TEST_F(InMemoryLedgerStoreTest, ListItems_ShouldBeSortedAndScopedToOrganization) {
    seed("SKU-B", 1);
    seed("SKU-A", 1);
    store_.with_transaction([&](LedgerTransaction& tx) {
        auto other = new_item("SKU-C", 1);
        other.organization_id = "org-2";
        tx.create_item(other);
    });

    auto items = store_.list_items("org-1");

    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].sku_id, "SKU-A");
    EXPECT_EQ(items[1].sku_id, "SKU-B");
}

// =============================================================================
// Locking
// =============================================================================

TEST_F(InMemoryLedgerStoreTest, LockedItem_ShouldTimeOutOtherTransactions) {
    // Given one transaction holding the row lock
    seed("SKU-A", 10);
    auto holder = store_.begin();
    holder->get_item_for_update("org-1", "SKU-A");

    // When another thread asks for the same row
    auto started = std::chrono::steady_clock::now();
    auto contender = std::async(std::launch::async, [&] {
        auto tx = store_.begin();
        tx->get_item_for_update("org-1", "SKU-A");
    });

    // Then it gives up with a retryable conflict after the lock timeout
    try {
        contender.get();
        FAIL() << "Expected TransactionConflictError";
    } catch (const TransactionConflictError& e) {
        EXPECT_TRUE(e.is_retryable());
    }
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));
}

TEST_F(InMemoryLedgerStoreTest, CommittedTransaction_ShouldReleaseLocks) {
    seed("SKU-A", 10);
    auto holder = store_.begin();
    holder->get_item_for_update("org-1", "SKU-A");
    holder->commit();

    auto contender = std::async(std::launch::async, [&] {
        auto tx = store_.begin();
        return tx->get_item_for_update("org-1", "SKU-A").has_value();
    });

    EXPECT_TRUE(contender.get());
}

TEST_F(InMemoryLedgerStoreTest, LockOrder_ForMissingOrder_ShouldReturnNothing) {
    auto tx = store_.begin();
    EXPECT_FALSE(tx->lock_order("org-1", "order-404").has_value());
}

TEST_F(InMemoryLedgerStoreTest, LockOrder_ShouldHideOtherOrganizations) {
    store_.with_transaction([&](LedgerTransaction& tx) {
        Order order;
        order.organization_id = "org-1";
        order.id = "order-1";
        order.lines = {{"item-1", "SKU-A", 1}};
        tx.upsert_order(order);
    });

    auto tx = store_.begin();
    EXPECT_TRUE(tx->lock_order("org-1", "order-1").has_value());
    EXPECT_FALSE(tx->lock_order("org-2", "order-1").has_value());
}

// =============================================================================
// Misuse
// =============================================================================

TEST_F(InMemoryLedgerStoreTest, CreateItem_Duplicate_ShouldThrowAlreadyExists) {
    seed("SKU-A", 1);
    auto tx = store_.begin();
    EXPECT_THROW(tx->create_item(new_item("SKU-A", 2)), AlreadyExistsError);
}

TEST_F(InMemoryLedgerStoreTest, UpdateItem_WithoutLock_ShouldThrowStorageError) {
    auto created = seed("SKU-A", 1);
    auto tx = store_.begin();
    EXPECT_THROW(tx->update_item(created), StorageError);
}

TEST_F(InMemoryLedgerStoreTest, Commit_Twice_ShouldThrowStorageError) {
    auto tx = store_.begin();
    tx->commit();
    EXPECT_THROW(tx->commit(), StorageError);
}

TEST_F(InMemoryLedgerStoreTest, ReleaseReservation_Twice_ShouldThrowStorageError) {
    auto created = seed("SKU-A", 5);
    auto reservation = store_.with_transaction([&](LedgerTransaction& tx) {
        InventoryReservation r;
        r.inventory_item_id = created.id;
        r.sku_id = "SKU-A";
        r.order_id = "order-1";
        r.order_item_id = "item-1";
        r.quantity_reserved = 1;
        return tx.create_reservation(r);
    });

    auto tx = store_.begin();
    tx->release_reservation(reservation.id, std::chrono::system_clock::now(), "cancelled");
    EXPECT_THROW(tx->release_reservation(reservation.id, std::chrono::system_clock::now(), "cancelled"),
                 StorageError);
}
