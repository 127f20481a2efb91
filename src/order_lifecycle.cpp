#include "stockledger/order_lifecycle.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/validation.hpp"

namespace stockledger {

namespace {

constexpr const char* LOG_DOMAIN = "order-lifecycle";

struct StatusName {
    OrderStatus status;
    const char* name;
};

constexpr StatusName STATUS_NAMES[] = {
    {OrderStatus::New, "NEW"},
    {OrderStatus::Reserved, "RESERVED"},
    {OrderStatus::ReadyToShip, "READY_TO_SHIP"},
    {OrderStatus::LabelCreated, "LABEL_CREATED"},
    {OrderStatus::PickedUp, "PICKED_UP"},
    {OrderStatus::InTransit, "IN_TRANSIT"},
    {OrderStatus::OutForDelivery, "OUT_FOR_DELIVERY"},
    {OrderStatus::Delivered, "DELIVERED"},
    {OrderStatus::Cancelled, "CANCELLED"},
    {OrderStatus::Failed, "FAILED"},
    {OrderStatus::Returned, "RETURNED"},
};

std::map<std::string, std::pair<std::string, Quantity>> lines_by_item(const std::vector<OrderLine>& lines) {
    std::map<std::string, std::pair<std::string, Quantity>> result;
    for (const auto& line : lines) {
        result[line.order_item_id] = {line.sku_id, line.quantity};
    }
    return result;
}

} // anonymous namespace

OrderStatus parse_order_status(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& entry : STATUS_NAMES) {
        if (upper == entry.name) return entry.status;
    }
    throw InvalidArgumentError("Unknown order status: " + name);
}

const char* order_status_name(OrderStatus status) {
    for (const auto& entry : STATUS_NAMES) {
        if (entry.status == status) return entry.name;
    }
    return "NEW";
}

bool should_reserve_inventory(OrderStatus status) {
    return status == OrderStatus::New || status == OrderStatus::Reserved;
}

bool should_release_inventory(OrderStatus status) {
    return status == OrderStatus::Cancelled || status == OrderStatus::Returned;
}

const char* lifecycle_action_name(LifecycleResult::Action action) {
    switch (action) {
        case LifecycleResult::Action::Reserved: return "reserved";
        case LifecycleResult::Action::Released: return "released";
        case LifecycleResult::Action::None: return "none";
    }
    return "none";
}

void OrderLifecycle::record_order(const Order& order) {
    validation::require_not_empty(order.organization_id, "organization_id");
    validation::require_not_empty(order.id, "order_id");
    std::set<std::string> item_ids;
    for (const auto& line : order.lines) {
        validation::require_not_empty(line.order_item_id, "order_item_id");
        validation::require_not_empty(line.sku_id, "sku_id");
        validation::require_positive(line.quantity, "quantity");
        if (!item_ids.insert(line.order_item_id).second) {
            throw InvalidArgumentError("Order " + order.id + " lists order item " + line.order_item_id +
                                       " more than once");
        }
    }
    if (order.lines.empty()) {
        return;
    }

    store_.with_transaction([&](LedgerTransaction& tx) {
        auto existing = tx.lock_order(order.organization_id, order.id);
        if (existing && lines_by_item(existing->lines) != lines_by_item(order.lines)) {
            auto active = tx.active_reservations_for_order(order.organization_id, order.id);
            if (!active.empty()) {
                throw InvalidArgumentError("Order " + order.id +
                                           " has active reservations; its lines cannot change");
            }
        }
        tx.upsert_order(order);
    });
}

LifecycleResult OrderLifecycle::apply(const Order& order, OrderStatus status) {
    record_order(order);

    LifecycleResult result;
    if (should_reserve_inventory(status)) {
        result.action = LifecycleResult::Action::Reserved;
        result.reservations = reservations_.reserve_stock_for_order(order.id, order.organization_id);
    } else if (should_release_inventory(status)) {
        const char* reason = status == OrderStatus::Returned ? RELEASE_REASON_RETURNED
                                                             : RELEASE_REASON_CANCELLED;
        result.action = LifecycleResult::Action::Released;
        result.reservations = reservations_.release_stock_for_order(order.id, order.organization_id, reason);
    }

    log_info(LOG_DOMAIN, "order_event_applied",
             {{"order_id", order.id},
              {"organization_id", order.organization_id},
              {"status", order_status_name(status)},
              {"action", lifecycle_action_name(result.action)},
              {"reservations", result.reservations.size()}});
    return result;
}

} // namespace stockledger
