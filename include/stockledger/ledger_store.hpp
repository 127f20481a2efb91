#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "types.hpp"

namespace stockledger {

/**
 * One atomic unit of work against the ledger.
 *
 * Row locks taken by lock_order() and get_item_for_update() are held until
 * commit() or destruction. Destroying a transaction that was not committed
 * rolls it back; none of its writes are ever visible to other readers.
 *
 * Every operation that touches more than one item must lock the order first
 * and then items in ascending sku_id order.
 */
class LedgerTransaction {
public:
    virtual ~LedgerTransaction() = default;

    /// Exclusive lock on the order row. Returns nullopt for a missing or
    /// cross-tenant order (the lock is still held).
    virtual std::optional<Order> lock_order(const std::string& organization_id,
                                            const std::string& order_id) = 0;

    /// Insert or replace the order and its lines.
    virtual void upsert_order(const Order& order) = 0;

    /// Exclusive row lock on the item. Throws TransactionConflictError when
    /// the lock is not acquired within the store's lock timeout.
    virtual std::optional<InventoryItem> get_item_for_update(const std::string& organization_id,
                                                             const std::string& sku_id) = 0;

    /// Throws AlreadyExistsError if (organization, sku) is tracked. Returns
    /// the row with id and timestamps assigned.
    virtual InventoryItem create_item(const InventoryItem& item) = 0;

    /// The item must have been locked by this transaction.
    virtual void update_item(const InventoryItem& item) = 0;

    virtual std::vector<InventoryReservation> active_reservations_for_order(
        const std::string& organization_id, const std::string& order_id) = 0;

    virtual InventoryReservation create_reservation(const InventoryReservation& reservation) = 0;

    virtual InventoryReservation release_reservation(RowId reservation_id,
                                                     Timestamp released_at,
                                                     const std::string& reason) = 0;

    virtual InventoryAdjustment append_adjustment(const InventoryAdjustment& adjustment) = 0;

    virtual void commit() = 0;
};

/**
 * Transactional storage for inventory counters, reservations, the
 * adjustment log and the order mirror.
 *
 * Reads outside a transaction observe committed state only.
 */
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual std::unique_ptr<LedgerTransaction> begin() = 0;

    virtual std::optional<InventoryItem> find_item(const std::string& organization_id,
                                                   const std::string& sku_id) const = 0;

    /// Item, its active reservations and the newest recent_limit adjustments
    /// (newest first), read from one consistent snapshot.
    virtual std::optional<ItemDetail> find_item_detail(const std::string& organization_id,
                                                       const std::string& sku_id,
                                                       std::size_t recent_limit) const = 0;

    /// All items of the organization ordered by sku_id.
    virtual std::vector<InventoryItem> list_items(const std::string& organization_id) const = 0;

    /**
     * Run fn(tx) and commit. If fn throws, the transaction is rolled back
     * and the exception propagates.
     */
    template<typename Fn>
    auto with_transaction(Fn&& fn) -> decltype(fn(std::declval<LedgerTransaction&>())) {
        using Result = decltype(fn(std::declval<LedgerTransaction&>()));
        auto tx = begin();
        if constexpr (std::is_void_v<Result>) {
            std::forward<Fn>(fn)(*tx);
            tx->commit();
        } else {
            Result result = std::forward<Fn>(fn)(*tx);
            tx->commit();
            return result;
        }
    }
};

} // namespace stockledger
