#pragma once

#include <optional>
#include <string>
#include "ledger_store.hpp"
#include "types.hpp"

namespace stockledger {

struct StockAdjustment {
    std::string organization_id;
    std::string sku_id;
    Quantity delta = 0;
    std::string reason;
    std::string actor_id;
    AdjustmentType type = AdjustmentType::Correction;
    std::optional<std::string> reference_type;
    std::optional<std::string> reference_id;
    std::optional<std::string> notes;
};

/**
 * Changes physical stock outside of order reservations: receipts, damage,
 * loss and manual corrections. Also owns item tracking and reorder settings.
 */
class AdjustmentEngine {
public:
    explicit AdjustmentEngine(LedgerStore& store) : store_(store) {}

    /**
     * Apply delta to quantity_total and log it.
     *
     * The checks run against the committed snapshot first and again under
     * the row lock. quantity_reserved is never changed here.
     *
     * @throws NotFoundError no item for (organization, sku)
     * @throws NegativeInventoryError total would drop below zero
     * @throws BelowReservedQuantityError total would drop below reserved
     * @throws NegativeAvailableError available would drop below zero
     */
    InventoryItem adjust_stock(const StockAdjustment& request);

    /// Argument order of the public operation: (sku, delta, reason, actor, org, type, ref...).
    InventoryItem adjust_stock(const std::string& sku_id,
                               Quantity delta,
                               const std::string& reason,
                               const std::string& actor_id,
                               const std::string& organization_id,
                               AdjustmentType type = AdjustmentType::Correction,
                               std::optional<std::string> reference_type = std::nullopt,
                               std::optional<std::string> reference_id = std::nullopt);

    /**
     * Start tracking a SKU. A positive initial quantity is logged as PURCHASE.
     *
     * @throws AlreadyExistsError the SKU is already tracked
     */
    InventoryItem track_sku(const std::string& organization_id,
                            const std::string& sku_id,
                            Quantity initial_quantity,
                            const std::string& actor_id,
                            const ItemSettings& settings = {});

    /// Replace reorder settings. Unset fields are cleared.
    InventoryItem configure_item(const std::string& organization_id,
                                 const std::string& sku_id,
                                 const ItemSettings& settings);

private:
    LedgerStore& store_;
};

} // namespace stockledger
