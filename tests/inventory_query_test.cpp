#include <gtest/gtest.h>
#include <limits>
#include "test_support.hpp"

using namespace stockledger;
using test_support::ACTOR;
using test_support::ORG;
using test_support::OTHER_ORG;

class InventoryQueryTest : public test_support::LedgerTest {
protected:
    void track_with_reorder_point(const std::string& sku_id, Quantity quantity, Quantity reorder_point) {
        ItemSettings settings;
        settings.reorder_point = reorder_point;
        adjustments_.track_sku(ORG, sku_id, quantity, ACTOR, settings);
    }
};

// =============================================================================
// find_by_sku_id
// =============================================================================

TEST_F(InventoryQueryTest, FindBySku_ShouldReturnItemReservationsAndRecentAdjustments) {
    // Given a reserved SKU with some history
    track("SKU-A", 50);
    adjustments_.adjust_stock("SKU-A", 10, "Delivery", ACTOR, ORG, AdjustmentType::Purchase);
    record("order-1", {{"item-1", "SKU-A", 4}});
    reservations_.reserve_stock_for_order("order-1", ORG);

    // When it is looked up
    auto detail = query_.find_by_sku_id("SKU-A", ORG);

    // Then the item, its active reservation and its log (newest first) come back
    EXPECT_EQ(detail.item.quantity_total, 60);
    EXPECT_EQ(detail.item.quantity_reserved, 4);
    ASSERT_EQ(detail.active_reservations.size(), 1u);
    EXPECT_EQ(detail.active_reservations[0].order_id, "order-1");
    ASSERT_EQ(detail.recent_adjustments.size(), 3u);
    EXPECT_EQ(detail.recent_adjustments[0].type, AdjustmentType::Sale);
    EXPECT_EQ(detail.recent_adjustments[2].reason, "Initial stock");
}

TEST_F(InventoryQueryTest, FindBySku_ShouldLimitRecentAdjustments) {
    track("SKU-A", 100);
    for (int i = 0; i < 15; ++i) {
        adjustments_.adjust_stock("SKU-A", -1, "Count " + std::to_string(i), ACTOR, ORG);
    }

    auto detail = query_.find_by_sku_id("SKU-A", ORG);

    ASSERT_EQ(detail.recent_adjustments.size(), 10u);
    EXPECT_EQ(detail.recent_adjustments.front().reason, "Count 14");
    EXPECT_EQ(detail.recent_adjustments.back().reason, "Count 5");
}

TEST_F(InventoryQueryTest, FindBySku_AfterRelease_ShouldListNoActiveReservations) {
    track("SKU-A", 5);
    record("order-1", {{"item-1", "SKU-A", 1}});
    reservations_.reserve_stock_for_order("order-1", ORG);
    reservations_.release_stock_for_order("order-1", ORG, RELEASE_REASON_CANCELLED);

    auto detail = query_.find_by_sku_id("SKU-A", ORG);

    EXPECT_TRUE(detail.active_reservations.empty());
}

TEST_F(InventoryQueryTest, FindBySku_Unknown_ShouldThrowNotFound) {
    track("SKU-A", 5);
    EXPECT_THROW(query_.find_by_sku_id("SKU-404", ORG), NotFoundError);
    EXPECT_THROW(query_.find_by_sku_id("SKU-A", OTHER_ORG), NotFoundError);
}

// =============================================================================
// get_low_stock_items / get_summary
// =============================================================================

TEST_F(InventoryQueryTest, LowStock_ShouldIncludeItemsAtOrBelowReorderPoint) {
    track_with_reorder_point("SKU-A", 5, 5);    // at the point
    track_with_reorder_point("SKU-B", 6, 5);    // above
    track_with_reorder_point("SKU-C", 0, 2);    // below
    track("SKU-D", 0);                          // no reorder point

    auto low = query_.get_low_stock_items(ORG);

    ASSERT_EQ(low.size(), 2u);
    EXPECT_EQ(low[0].sku_id, "SKU-A");
    EXPECT_EQ(low[1].sku_id, "SKU-C");
}

TEST_F(InventoryQueryTest, LowStock_ShouldUseAvailableNotTotal) {
    // Given 10 on hand with 8 reserved and a reorder point of 3
    track_with_reorder_point("SKU-A", 10, 3);
    record("order-1", {{"item-1", "SKU-A", 8}});
    reservations_.reserve_stock_for_order("order-1", ORG);

    auto low = query_.get_low_stock_items(ORG);

    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].quantity_available, 2);
}

TEST_F(InventoryQueryTest, Summary_ShouldAggregateOrganizationItems) {
    track_with_reorder_point("SKU-A", 10, 3);
    track("SKU-B", 0);
    track("SKU-C", 20);
    track("SKU-X", 99, OTHER_ORG);
    record("order-1", {{"item-1", "SKU-A", 8}, {"item-2", "SKU-C", 5}});
    reservations_.reserve_stock_for_order("order-1", ORG);

    auto summary = query_.get_summary(ORG);

    EXPECT_EQ(summary.total_items, 3);
    EXPECT_EQ(summary.total_quantity, 30);
    EXPECT_EQ(summary.total_reserved, 13);
    EXPECT_EQ(summary.total_available, 17);
    EXPECT_EQ(summary.low_stock_count, 1);
    EXPECT_EQ(summary.out_of_stock_count, 1);
}

TEST_F(InventoryQueryTest, Summary_ForEmptyOrganization_ShouldBeZero) {
    auto summary = query_.get_summary(ORG);
    EXPECT_EQ(summary.total_items, 0);
    EXPECT_EQ(summary.total_quantity, 0);
}

// =============================================================================
// list_items
// =============================================================================

TEST_F(InventoryQueryTest, ListItems_ShouldPaginateInSkuOrder) {
    for (const char* sku : {"SKU-E", "SKU-A", "SKU-D", "SKU-B", "SKU-C"}) track(sku, 1);

    ItemFilter filter;
    filter.page = 2;
    filter.limit = 2;
    auto page = query_.list_items(ORG, filter);

    EXPECT_EQ(page.total, 5u);
    EXPECT_EQ(page.total_pages, 3u);
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].sku_id, "SKU-C");
    EXPECT_EQ(page.items[1].sku_id, "SKU-D");
}

TEST_F(InventoryQueryTest, ListItems_PastLastPage_ShouldBeEmpty) {
    track("SKU-A", 1);

    ItemFilter filter;
    filter.page = 3;
    auto page = query_.list_items(ORG, filter);

    EXPECT_EQ(page.total, 1u);
    EXPECT_TRUE(page.items.empty());
}

TEST_F(InventoryQueryTest, ListItems_WithHugePageOrLimit_ShouldNotWrap) {
    for (const char* sku : {"SKU-A", "SKU-B", "SKU-C"}) track(sku, 1);

    // A page whose offset overflows size_t is past the end
    ItemFilter far;
    far.page = std::numeric_limits<std::size_t>::max() / 2 + 2;
    far.limit = 2;
    auto empty = query_.list_items(ORG, far);
    EXPECT_EQ(empty.total, 3u);
    EXPECT_EQ(empty.total_pages, 2u);
    EXPECT_TRUE(empty.items.empty());

    // A huge limit puts everything on the first page
    ItemFilter wide;
    wide.limit = std::numeric_limits<std::size_t>::max();
    auto all = query_.list_items(ORG, wide);
    EXPECT_EQ(all.total_pages, 1u);
    EXPECT_EQ(all.items.size(), 3u);

    wide.page = 2;
    EXPECT_TRUE(query_.list_items(ORG, wide).items.empty());
}

TEST_F(InventoryQueryTest, ListItems_ShouldFilterBySearchAndStockState) {
    track("widget-red", 0);
    track("WIDGET-blue", 4);
    track("gadget", 0);

    ItemFilter search;
    search.search = "Widget";
    EXPECT_EQ(query_.list_items(ORG, search).total, 2u);

    ItemFilter out_of_stock;
    out_of_stock.out_of_stock = true;
    auto page = query_.list_items(ORG, out_of_stock);
    ASSERT_EQ(page.total, 2u);
    EXPECT_EQ(page.items[0].sku_id, "gadget");
    EXPECT_EQ(page.items[1].sku_id, "widget-red");
}

TEST_F(InventoryQueryTest, ListItems_WithZeroLimit_ShouldThrowInvalidArgument) {
    ItemFilter filter;
    filter.limit = 0;
    EXPECT_THROW(query_.list_items(ORG, filter), InvalidArgumentError);
}
