#include "stockledger/adjustment_engine.hpp"

#include <limits>
#include <string>
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/validation.hpp"

namespace stockledger {

namespace {

constexpr const char* LOG_DOMAIN = "adjustment";

void check_adjustment(const InventoryItem& item, Quantity delta) {
    if (delta > 0 && item.quantity_total > std::numeric_limits<Quantity>::max() - delta) {
        throw InvalidArgumentError("Adjustment of " + std::to_string(delta) + " for SKU " + item.sku_id +
                                   " exceeds the maximum quantity");
    }
    const Quantity new_total = item.quantity_total + delta;
    if (new_total < 0) {
        throw NegativeInventoryError(item.sku_id, item.quantity_total, item.quantity_reserved, delta);
    }
    if (new_total < item.quantity_reserved) {
        throw BelowReservedQuantityError(item.sku_id, item.quantity_total, item.quantity_reserved, delta);
    }
    if (new_total - item.quantity_reserved < 0) {
        throw NegativeAvailableError(item.sku_id, item.quantity_total, item.quantity_reserved, delta);
    }
}

void validate_settings(const ItemSettings& settings) {
    if (settings.reorder_point) {
        validation::require_non_negative(*settings.reorder_point, "reorder_point");
    }
    if (settings.reorder_quantity) {
        validation::require_non_negative(*settings.reorder_quantity, "reorder_quantity");
    }
}

} // anonymous namespace

InventoryItem AdjustmentEngine::adjust_stock(const StockAdjustment& request) {
    validation::require_not_empty(request.organization_id, "organization_id");
    validation::require_not_empty(request.sku_id, "sku_id");
    validation::require_not_empty(request.reason, "reason");
    validation::require_not_empty(request.actor_id, "actor_id");
    validation::require_non_zero(request.delta, "delta");

    // Fail fast on the committed snapshot without taking the row lock.
    auto snapshot = store_.find_item(request.organization_id, request.sku_id);
    if (!snapshot) {
        throw NotFoundError(NotFoundError::Entity::InventoryItem, request.sku_id);
    }
    check_adjustment(*snapshot, request.delta);

    Quantity previous_total = 0;
    auto updated = store_.with_transaction([&](LedgerTransaction& tx) {
        auto item = tx.get_item_for_update(request.organization_id, request.sku_id);
        if (!item) {
            throw NotFoundError(NotFoundError::Entity::InventoryItem, request.sku_id);
        }
        check_adjustment(*item, request.delta);

        previous_total = item->quantity_total;
        item->quantity_total += request.delta;
        item->quantity_available = item->quantity_total - item->quantity_reserved;
        tx.update_item(*item);

        InventoryAdjustment adjustment;
        adjustment.organization_id = request.organization_id;
        adjustment.inventory_item_id = item->id;
        adjustment.actor_id = request.actor_id;
        adjustment.type = request.type;
        adjustment.quantity_change = request.delta;
        adjustment.reason = request.reason;
        adjustment.reference_type = request.reference_type;
        adjustment.reference_id = request.reference_id;
        adjustment.notes = request.notes ? request.notes
                                         : std::optional<std::string>("Adjusted " + request.sku_id + " by " +
                                                                      std::to_string(request.delta) + " units");
        tx.append_adjustment(adjustment);
        return *item;
    });

    log_info(LOG_DOMAIN, "stock_adjusted",
             {{"organization_id", request.organization_id},
              {"sku_id", request.sku_id},
              {"type", adjustment_type_name(request.type)},
              {"delta", request.delta},
              {"previous_total", previous_total},
              {"quantity_total", updated.quantity_total},
              {"quantity_available", updated.quantity_available}});
    return updated;
}

InventoryItem AdjustmentEngine::adjust_stock(const std::string& sku_id,
                                             Quantity delta,
                                             const std::string& reason,
                                             const std::string& actor_id,
                                             const std::string& organization_id,
                                             AdjustmentType type,
                                             std::optional<std::string> reference_type,
                                             std::optional<std::string> reference_id) {
    StockAdjustment request;
    request.organization_id = organization_id;
    request.sku_id = sku_id;
    request.delta = delta;
    request.reason = reason;
    request.actor_id = actor_id;
    request.type = type;
    request.reference_type = std::move(reference_type);
    request.reference_id = std::move(reference_id);
    return adjust_stock(request);
}

InventoryItem AdjustmentEngine::track_sku(const std::string& organization_id,
                                          const std::string& sku_id,
                                          Quantity initial_quantity,
                                          const std::string& actor_id,
                                          const ItemSettings& settings) {
    validation::require_not_empty(organization_id, "organization_id");
    validation::require_not_empty(sku_id, "sku_id");
    validation::require_not_empty(actor_id, "actor_id");
    validation::require_non_negative(initial_quantity, "initial_quantity");
    validate_settings(settings);

    auto created = store_.with_transaction([&](LedgerTransaction& tx) {
        InventoryItem item;
        item.organization_id = organization_id;
        item.sku_id = sku_id;
        item.quantity_total = initial_quantity;
        item.quantity_available = initial_quantity;
        item.reorder_point = settings.reorder_point;
        item.reorder_quantity = settings.reorder_quantity;
        item.location_bin = settings.location_bin;
        auto stored = tx.create_item(item);

        if (initial_quantity > 0) {
            InventoryAdjustment adjustment;
            adjustment.organization_id = organization_id;
            adjustment.inventory_item_id = stored.id;
            adjustment.actor_id = actor_id;
            adjustment.type = AdjustmentType::Purchase;
            adjustment.quantity_change = initial_quantity;
            adjustment.reason = "Initial stock";
            tx.append_adjustment(adjustment);
        }
        return stored;
    });

    log_info(LOG_DOMAIN, "sku_tracked",
             {{"organization_id", organization_id},
              {"sku_id", sku_id},
              {"quantity_total", created.quantity_total}});
    return created;
}

InventoryItem AdjustmentEngine::configure_item(const std::string& organization_id,
                                               const std::string& sku_id,
                                               const ItemSettings& settings) {
    validation::require_not_empty(organization_id, "organization_id");
    validation::require_not_empty(sku_id, "sku_id");
    validate_settings(settings);

    return store_.with_transaction([&](LedgerTransaction& tx) {
        auto item = tx.get_item_for_update(organization_id, sku_id);
        if (!item) {
            throw NotFoundError(NotFoundError::Entity::InventoryItem, sku_id);
        }
        item->reorder_point = settings.reorder_point;
        item->reorder_quantity = settings.reorder_quantity;
        item->location_bin = settings.location_bin;
        tx.update_item(*item);
        return *item;
    });
}

} // namespace stockledger
