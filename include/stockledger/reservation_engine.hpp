#pragma once

#include <string>
#include <vector>
#include "ledger_store.hpp"
#include "types.hpp"

namespace stockledger {

/**
 * Reserves and releases stock for whole orders ("Model C").
 *
 * Both operations run as one transaction: lock the order, re-check existing
 * reservations, then lock every item in ascending sku_id order before
 * touching any counter. Re-invoking either operation after it committed
 * has no further effect.
 */
class ReservationEngine {
public:
    explicit ReservationEngine(LedgerStore& store) : store_(store) {}

    /**
     * Reserve every line of the order, or nothing.
     *
     * Returns the order's active reservations; when the order was already
     * reserved these are the existing rows and nothing is written.
     *
     * @throws NotFoundError order or one of its items is missing
     * @throws InsufficientStockError some SKU cannot cover its lines
     * @throws TransactionConflictError a row lock timed out
     */
    std::vector<InventoryReservation> reserve_stock_for_order(const std::string& order_id,
                                                              const std::string& organization_id);

    /**
     * Release all active reservations of the order.
     *
     * Returns the released rows, or an empty list if nothing was active.
     * reason "returned" logs RETURN adjustments, anything else CORRECTION.
     *
     * @throws NotFoundError order is missing
     * @throws TransactionConflictError a row lock timed out
     */
    std::vector<InventoryReservation> release_stock_for_order(const std::string& order_id,
                                                              const std::string& organization_id,
                                                              const std::string& reason);

private:
    LedgerStore& store_;
};

} // namespace stockledger
