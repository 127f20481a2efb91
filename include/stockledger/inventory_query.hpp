#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "ledger_store.hpp"
#include "types.hpp"

namespace stockledger {

struct ItemFilter {
    std::string search;        // case-insensitive substring of sku_id
    bool low_stock = false;
    bool out_of_stock = false;
    std::size_t page = 1;      // 1-based
    std::size_t limit = 20;
};

struct ItemPage {
    std::vector<InventoryItem> items;
    std::size_t total = 0;
    std::size_t page = 1;
    std::size_t limit = 20;
    std::size_t total_pages = 0;
};

/**
 * Read-only views over committed ledger state. No row locks are taken.
 */
class InventoryQuery {
public:
    explicit InventoryQuery(const LedgerStore& store, std::size_t recent_adjustments = 10)
        : store_(store), recent_adjustments_(recent_adjustments) {}

    /// @throws NotFoundError no item for (organization, sku)
    ItemDetail find_by_sku_id(const std::string& sku_id, const std::string& organization_id) const;

    /// Items with a reorder point whose available quantity is at or below it.
    std::vector<InventoryItem> get_low_stock_items(const std::string& organization_id) const;

    InventorySummary get_summary(const std::string& organization_id) const;

    ItemPage list_items(const std::string& organization_id, const ItemFilter& filter = {}) const;

private:
    const LedgerStore& store_;
    std::size_t recent_adjustments_;
};

} // namespace stockledger
