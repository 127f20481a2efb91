#include "stockledger/errors.hpp"

namespace stockledger {

namespace {

std::string describe_entity(NotFoundError::Entity entity, const std::string& id) {
    switch (entity) {
        case NotFoundError::Entity::Order:
            return "Order not found: " + id;
        case NotFoundError::Entity::InventoryItem:
            return "Inventory item not found for SKU: " + id;
    }
    return "Not found: " + id;
}

} // anonymous namespace

NotFoundError::NotFoundError(Entity entity, const std::string& id)
    : InventoryError(describe_entity(entity, id)), entity_(entity), id_(id) {}

nlohmann::json NotFoundError::details() const {
    auto out = InventoryError::details();
    out["entity"] = entity_ == Entity::Order ? "order" : "inventory_item";
    out["id"] = id_;
    return out;
}

InsufficientStockError::InsufficientStockError(const std::string& sku_id,
                                               Quantity available,
                                               Quantity required)
    : InventoryError("Insufficient stock for SKU " + sku_id + ". Available: " +
                     std::to_string(available) + ", Required: " + std::to_string(required)),
      sku_id_(sku_id),
      available_(available),
      required_(required) {}

nlohmann::json InsufficientStockError::details() const {
    auto out = InventoryError::details();
    out["sku_id"] = sku_id_;
    out["available"] = available_;
    out["required"] = required_;
    return out;
}

nlohmann::json StockInvariantError::details() const {
    auto out = InventoryError::details();
    out["sku_id"] = sku_id_;
    out["current_total"] = current_total_;
    out["current_reserved"] = current_reserved_;
    out["delta"] = delta_;
    return out;
}

NegativeInventoryError::NegativeInventoryError(const std::string& sku_id,
                                               Quantity total,
                                               Quantity reserved,
                                               Quantity delta)
    : StockInvariantError("Adjustment would result in negative inventory for SKU " + sku_id +
                              ". Current: " + std::to_string(total) +
                              ", Attempted: " + std::to_string(delta),
                          sku_id, total, reserved, delta) {}

BelowReservedQuantityError::BelowReservedQuantityError(const std::string& sku_id,
                                                       Quantity total,
                                                       Quantity reserved,
                                                       Quantity delta)
    : StockInvariantError("Cannot adjust stock below reserved quantity for SKU " + sku_id +
                              ". Current total: " + std::to_string(total) +
                              ", Reserved: " + std::to_string(reserved) +
                              ", Attempted adjustment: " + std::to_string(delta),
                          sku_id, total, reserved, delta) {}

NegativeAvailableError::NegativeAvailableError(const std::string& sku_id,
                                               Quantity total,
                                               Quantity reserved,
                                               Quantity delta)
    : StockInvariantError("Adjustment would result in negative available quantity for SKU " +
                              sku_id + ". Available: " +
                              std::to_string(total + delta - reserved),
                          sku_id, total, reserved, delta) {}

} // namespace stockledger
