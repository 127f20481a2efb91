#include "stockledger/reservation_engine.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/validation.hpp"

namespace stockledger {

namespace {

constexpr const char* LOG_DOMAIN = "reservation";
constexpr const char* ORDER_REFERENCE = "order";

std::string actor_for(const Order& order) {
    return order.created_by.empty() ? SYSTEM_ACTOR : order.created_by;
}

std::string order_label(const Order& order) {
    return order.order_number.empty() ? order.id : order.order_number;
}

/// Lock every SKU once, in ascending order. std::map keeps the keys sorted.
std::map<std::string, InventoryItem> lock_items_in_order(LedgerTransaction& tx,
                                                         const std::string& organization_id,
                                                         std::vector<std::string> sku_ids) {
    std::sort(sku_ids.begin(), sku_ids.end());
    sku_ids.erase(std::unique(sku_ids.begin(), sku_ids.end()), sku_ids.end());

    std::map<std::string, InventoryItem> locked;
    for (const auto& sku_id : sku_ids) {
        auto item = tx.get_item_for_update(organization_id, sku_id);
        if (!item) {
            throw NotFoundError(NotFoundError::Entity::InventoryItem, sku_id);
        }
        locked.emplace(sku_id, std::move(*item));
    }
    return locked;
}

} // anonymous namespace

std::vector<InventoryReservation> ReservationEngine::reserve_stock_for_order(
    const std::string& order_id, const std::string& organization_id) {
    validation::require_not_empty(order_id, "order_id");
    validation::require_not_empty(organization_id, "organization_id");

    log_debug(LOG_DOMAIN, "reserving_stock", {{"order_id", order_id}, {"organization_id", organization_id}});

    bool already_reserved = false;
    auto reservations = store_.with_transaction([&](LedgerTransaction& tx) {
        auto order = tx.lock_order(organization_id, order_id);
        if (!order) {
            throw NotFoundError(NotFoundError::Entity::Order, order_id);
        }

        // Checked under the order lock: a concurrent duplicate call that lost
        // the race sees the winner's rows here.
        auto existing = tx.active_reservations_for_order(organization_id, order_id);
        if (!existing.empty()) {
            already_reserved = true;
            return existing;
        }

        std::vector<OrderLine> lines = order->lines;
        std::sort(lines.begin(), lines.end(), [](const OrderLine& a, const OrderLine& b) {
            if (a.sku_id != b.sku_id) return a.sku_id < b.sku_id;
            return a.order_item_id < b.order_item_id;
        });

        std::vector<std::string> sku_ids;
        for (const auto& line : lines) {
            validation::require_positive(line.quantity, "quantity of order item " + line.order_item_id);
            sku_ids.push_back(line.sku_id);
        }

        auto items = lock_items_in_order(tx, organization_id, sku_ids);

        // Validate everything before the first write. required never exceeds
        // quantity_available, so the running sum cannot overflow.
        std::map<std::string, Quantity> required;
        for (const auto& line : lines) {
            const auto& item = items.at(line.sku_id);
            Quantity& needed = required[line.sku_id];
            if (line.quantity > item.quantity_available - needed) {
                const Quantity requested = line.quantity > std::numeric_limits<Quantity>::max() - needed
                                               ? std::numeric_limits<Quantity>::max()
                                               : needed + line.quantity;
                throw InsufficientStockError(line.sku_id, item.quantity_available, requested);
            }
            needed += line.quantity;
        }

        auto now = std::chrono::system_clock::now();
        std::vector<InventoryReservation> created;
        for (const auto& line : lines) {
            auto& item = items.at(line.sku_id);

            InventoryReservation reservation;
            reservation.inventory_item_id = item.id;
            reservation.sku_id = line.sku_id;
            reservation.order_id = order->id;
            reservation.order_item_id = line.order_item_id;
            reservation.quantity_reserved = line.quantity;
            reservation.reserved_at = now;
            created.push_back(tx.create_reservation(reservation));

            item.quantity_reserved += line.quantity;
            item.quantity_available -= line.quantity;

            InventoryAdjustment adjustment;
            adjustment.organization_id = organization_id;
            adjustment.inventory_item_id = item.id;
            adjustment.actor_id = actor_for(*order);
            adjustment.type = AdjustmentType::Sale;
            adjustment.quantity_change = -line.quantity;
            adjustment.reason = "Reserved for order";
            adjustment.reference_type = ORDER_REFERENCE;
            adjustment.reference_id = order->id;
            adjustment.notes = "Reserved " + std::to_string(line.quantity) + " units for order " +
                               order_label(*order);
            adjustment.created_at = now;
            tx.append_adjustment(adjustment);
        }

        for (const auto& [sku_id, item] : items) {
            tx.update_item(item);
        }
        return created;
    });

    if (already_reserved) {
        log_warn(LOG_DOMAIN, "order_already_reserved",
                 {{"order_id", order_id}, {"reservations", reservations.size()}});
    } else {
        log_info(LOG_DOMAIN, "stock_reserved",
                 {{"order_id", order_id},
                  {"organization_id", organization_id},
                  {"reservations", reservations.size()}});
    }
    return reservations;
}

std::vector<InventoryReservation> ReservationEngine::release_stock_for_order(
    const std::string& order_id, const std::string& organization_id, const std::string& reason) {
    validation::require_not_empty(order_id, "order_id");
    validation::require_not_empty(organization_id, "organization_id");
    validation::require_not_empty(reason, "reason");

    log_debug(LOG_DOMAIN, "releasing_stock", {{"order_id", order_id}, {"reason", reason}});

    auto released = store_.with_transaction([&](LedgerTransaction& tx) {
        auto order = tx.lock_order(organization_id, order_id);
        if (!order) {
            throw NotFoundError(NotFoundError::Entity::Order, order_id);
        }

        auto active = tx.active_reservations_for_order(organization_id, order_id);
        if (active.empty()) {
            return std::vector<InventoryReservation>{};
        }

        std::vector<std::string> sku_ids;
        for (const auto& reservation : active) sku_ids.push_back(reservation.sku_id);
        auto items = lock_items_in_order(tx, organization_id, sku_ids);

        const AdjustmentType type =
            reason == RELEASE_REASON_RETURNED ? AdjustmentType::Return : AdjustmentType::Correction;
        auto now = std::chrono::system_clock::now();

        std::vector<InventoryReservation> result;
        for (const auto& reservation : active) {
            auto& item = items.at(reservation.sku_id);
            result.push_back(tx.release_reservation(reservation.id, now, reason));

            item.quantity_reserved -= reservation.quantity_reserved;
            item.quantity_available += reservation.quantity_reserved;

            InventoryAdjustment adjustment;
            adjustment.organization_id = organization_id;
            adjustment.inventory_item_id = item.id;
            adjustment.actor_id = actor_for(*order);
            adjustment.type = type;
            adjustment.quantity_change = reservation.quantity_reserved;
            adjustment.reason = "Released from " + reason + " order";
            adjustment.reference_type = ORDER_REFERENCE;
            adjustment.reference_id = order->id;
            adjustment.notes = "Released " + std::to_string(reservation.quantity_reserved) +
                               " units from order " + order_label(*order) + " (" + reason + ")";
            adjustment.created_at = now;
            tx.append_adjustment(adjustment);
        }

        for (const auto& [sku_id, item] : items) {
            tx.update_item(item);
        }
        return result;
    });

    if (released.empty()) {
        log_warn(LOG_DOMAIN, "order_has_no_active_reservations", {{"order_id", order_id}});
    } else {
        log_info(LOG_DOMAIN, "stock_released",
                 {{"order_id", order_id},
                  {"organization_id", organization_id},
                  {"reason", reason},
                  {"reservations", released.size()}});
    }
    return released;
}

} // namespace stockledger
