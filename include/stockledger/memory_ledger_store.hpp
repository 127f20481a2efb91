#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "ledger_store.hpp"

namespace stockledger {

/**
 * Embedded LedgerStore.
 *
 * Row locks are one timed mutex per key ("order/<org>/<id>",
 * "item/<org>/<sku>"). A transaction stages its writes privately and applies
 * them to the committed state in one step on commit, before releasing its
 * row locks, so readers never observe partial state.
 */
class InMemoryLedgerStore : public LedgerStore {
public:
    explicit InMemoryLedgerStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));
    ~InMemoryLedgerStore() override;

    InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
    InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

    std::unique_ptr<LedgerTransaction> begin() override;

    std::optional<InventoryItem> find_item(const std::string& organization_id,
                                           const std::string& sku_id) const override;
    std::optional<ItemDetail> find_item_detail(const std::string& organization_id,
                                               const std::string& sku_id,
                                               std::size_t recent_limit) const override;
    std::vector<InventoryItem> list_items(const std::string& organization_id) const override;

    /// Committed reservations of an order, active or not, ordered by id.
    std::vector<InventoryReservation> reservations_for_order(const std::string& order_id) const;

    /// Full adjustment log of an item, oldest first.
    std::vector<InventoryAdjustment> adjustments_for_item(RowId inventory_item_id) const;

    std::chrono::milliseconds lock_timeout() const { return lock_timeout_; }

private:
    class Transaction;

    static std::string item_key(const std::string& organization_id, const std::string& sku_id);
    static std::string order_key(const std::string& organization_id, const std::string& order_id);

    std::shared_ptr<std::timed_mutex> row_lock(const std::string& key);
    std::optional<InventoryItem> committed_item(const std::string& organization_id,
                                                const std::string& sku_id) const;

    std::chrono::milliseconds lock_timeout_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> row_locks_;
    std::map<std::string, RowId> item_index_;
    std::unordered_map<RowId, InventoryItem> items_;
    std::unordered_map<RowId, InventoryReservation> reservations_;
    std::unordered_map<std::string, std::vector<RowId>> reservations_by_order_;
    std::unordered_map<RowId, std::vector<RowId>> reservations_by_item_;
    std::unordered_map<RowId, std::vector<InventoryAdjustment>> adjustments_;
    std::unordered_map<std::string, Order> orders_;

    std::atomic<RowId> next_item_id_{1};
    std::atomic<RowId> next_reservation_id_{1};
    std::atomic<RowId> next_adjustment_id_{1};
};

} // namespace stockledger
