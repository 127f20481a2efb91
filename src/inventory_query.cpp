#include "stockledger/inventory_query.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include "stockledger/errors.hpp"
#include "stockledger/validation.hpp"

namespace stockledger {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

ItemDetail InventoryQuery::find_by_sku_id(const std::string& sku_id,
                                          const std::string& organization_id) const {
    validation::require_not_empty(organization_id, "organization_id");
    auto detail = store_.find_item_detail(organization_id, sku_id, recent_adjustments_);
    if (!detail) {
        throw NotFoundError(NotFoundError::Entity::InventoryItem, sku_id);
    }
    return *detail;
}

std::vector<InventoryItem> InventoryQuery::get_low_stock_items(const std::string& organization_id) const {
    validation::require_not_empty(organization_id, "organization_id");
    auto items = store_.list_items(organization_id);
    items.erase(std::remove_if(items.begin(), items.end(),
                               [](const InventoryItem& item) { return !item.is_low_stock(); }),
                items.end());
    return items;
}

InventorySummary InventoryQuery::get_summary(const std::string& organization_id) const {
    validation::require_not_empty(organization_id, "organization_id");
    InventorySummary summary;
    for (const auto& item : store_.list_items(organization_id)) {
        summary.total_items += 1;
        summary.total_quantity += item.quantity_total;
        summary.total_reserved += item.quantity_reserved;
        summary.total_available += item.quantity_available;
        if (item.is_low_stock()) summary.low_stock_count += 1;
        if (item.is_out_of_stock()) summary.out_of_stock_count += 1;
    }
    return summary;
}

ItemPage InventoryQuery::list_items(const std::string& organization_id, const ItemFilter& filter) const {
    validation::require_not_empty(organization_id, "organization_id");
    validation::require_positive(filter.page, "page");
    validation::require_positive(filter.limit, "limit");

    const std::string needle = to_lower(filter.search);
    std::vector<InventoryItem> matched;
    for (auto& item : store_.list_items(organization_id)) {
        if (!needle.empty() && to_lower(item.sku_id).find(needle) == std::string::npos) continue;
        if (filter.low_stock && !item.is_low_stock()) continue;
        if (filter.out_of_stock && !item.is_out_of_stock()) continue;
        matched.push_back(std::move(item));
    }

    ItemPage page;
    page.total = matched.size();
    page.page = filter.page;
    page.limit = filter.limit;
    page.total_pages = page.total / filter.limit + (page.total % filter.limit != 0 ? 1 : 0);

    // Compared by division so huge page or limit values cannot wrap.
    if (filter.page - 1 < page.total_pages) {
        const std::size_t skip = (filter.page - 1) * filter.limit;
        const std::size_t count = std::min(matched.size() - skip, filter.limit);
        auto first = matched.begin() + static_cast<std::ptrdiff_t>(skip);
        auto last = first + static_cast<std::ptrdiff_t>(count);
        page.items.assign(std::make_move_iterator(first), std::make_move_iterator(last));
    }
    return page;
}

} // namespace stockledger
