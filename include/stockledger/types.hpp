#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stockledger {

using Timestamp = std::chrono::system_clock::time_point;
using Quantity = std::int64_t;
using RowId = std::int64_t;

/// Adjustment classification, stored verbatim in the audit log.
enum class AdjustmentType { Sale, Return, Purchase, Damage, Loss, Correction };

const char* adjustment_type_name(AdjustmentType type);

/// Parse "SALE", "RETURN", ... (case-insensitive). Throws InvalidArgumentError.
AdjustmentType parse_adjustment_type(const std::string& name);

struct InventoryItem {
    RowId id = 0;
    std::string organization_id;
    std::string sku_id;
    Quantity quantity_total = 0;
    Quantity quantity_reserved = 0;
    Quantity quantity_available = 0;
    std::optional<Quantity> reorder_point;
    std::optional<Quantity> reorder_quantity;
    std::optional<std::string> location_bin;
    Timestamp created_at{};
    Timestamp updated_at{};

    bool is_low_stock() const {
        return reorder_point.has_value() && quantity_available <= *reorder_point;
    }
    bool is_out_of_stock() const { return quantity_available == 0; }
    bool counters_consistent() const {
        return quantity_available == quantity_total - quantity_reserved &&
               quantity_reserved >= 0 && quantity_total >= quantity_reserved &&
               quantity_available >= 0;
    }
};

struct InventoryReservation {
    RowId id = 0;
    RowId inventory_item_id = 0;
    std::string sku_id;
    std::string order_id;
    std::string order_item_id;
    Quantity quantity_reserved = 0;
    Timestamp reserved_at{};
    std::optional<Timestamp> released_at;
    std::optional<std::string> reason;

    bool is_active() const { return !released_at.has_value(); }
};

struct InventoryAdjustment {
    RowId id = 0;
    std::string organization_id;
    RowId inventory_item_id = 0;
    std::string actor_id;
    AdjustmentType type = AdjustmentType::Correction;
    Quantity quantity_change = 0;
    std::string reason;
    std::optional<std::string> reference_type;
    std::optional<std::string> reference_id;
    std::optional<std::string> notes;
    Timestamp created_at{};
};

struct OrderLine {
    std::string order_item_id;
    std::string sku_id;
    Quantity quantity = 0;
};

/// Line items of an order as seen by the ledger. Owned by the orders subsystem.
struct Order {
    std::string organization_id;
    std::string id;
    std::string order_number;
    std::string created_by;
    std::vector<OrderLine> lines;
};

struct ItemSettings {
    std::optional<Quantity> reorder_point;
    std::optional<Quantity> reorder_quantity;
    std::optional<std::string> location_bin;
};

/// InventoryItem with its active reservations and most recent adjustments.
struct ItemDetail {
    InventoryItem item;
    std::vector<InventoryReservation> active_reservations;
    std::vector<InventoryAdjustment> recent_adjustments;
};

struct InventorySummary {
    std::int64_t total_items = 0;
    Quantity total_quantity = 0;
    Quantity total_reserved = 0;
    Quantity total_available = 0;
    std::int64_t low_stock_count = 0;
    std::int64_t out_of_stock_count = 0;
};

constexpr const char* RELEASE_REASON_CANCELLED = "cancelled";
constexpr const char* RELEASE_REASON_RETURNED = "returned";
constexpr const char* SYSTEM_ACTOR = "system";

} // namespace stockledger
