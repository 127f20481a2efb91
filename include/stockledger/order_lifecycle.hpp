#pragma once

#include <string>
#include <vector>
#include "ledger_store.hpp"
#include "reservation_engine.hpp"
#include "types.hpp"

namespace stockledger {

enum class OrderStatus {
    New,
    Reserved,
    ReadyToShip,
    LabelCreated,
    PickedUp,
    InTransit,
    OutForDelivery,
    Delivered,
    Cancelled,
    Failed,
    Returned
};

/// "NEW", "READY_TO_SHIP", ... (case-insensitive). Throws InvalidArgumentError.
OrderStatus parse_order_status(const std::string& name);
const char* order_status_name(OrderStatus status);

/// NEW and RESERVED hold stock.
bool should_reserve_inventory(OrderStatus status);
/// CANCELLED and RETURNED give it back.
bool should_release_inventory(OrderStatus status);

struct LifecycleResult {
    enum class Action { None, Reserved, Released };

    Action action = Action::None;
    std::vector<InventoryReservation> reservations;
};

const char* lifecycle_action_name(LifecycleResult::Action action);

/**
 * Turns order status transitions into reserve/release calls.
 *
 * DELIVERED keeps the reservation as is; converting it into a deduction
 * from quantity_total is not defined yet.
 */
class OrderLifecycle {
public:
    OrderLifecycle(LedgerStore& store, ReservationEngine& reservations)
        : store_(store), reservations_(reservations) {}

    /**
     * Record the order's lines (when given) and apply the inventory action
     * for status. Safe to call repeatedly with the same event.
     *
     * @throws InvalidArgumentError lines change while stock is reserved
     */
    LifecycleResult apply(const Order& order, OrderStatus status);

    /// Store the order mirror. An event without lines records nothing, so
    /// an unknown order stays unknown and a known one keeps its lines.
    void record_order(const Order& order);

private:
    LedgerStore& store_;
    ReservationEngine& reservations_;
};

} // namespace stockledger
