#include "inventory_ledger_service.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>
#include "stockledger/logging.hpp"

namespace stockledger {

namespace {

constexpr const char* LOG_DOMAIN = "grpc";
constexpr std::size_t DEFAULT_PAGE_LIMIT = 20;

void set_timestamp(google::protobuf::Timestamp* out, Timestamp ts) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
    out->set_seconds(nanos / 1000000000);
    out->set_nanos(static_cast<std::int32_t>(nanos % 1000000000));
}

std::optional<std::string> non_empty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

v1::AdjustmentType to_proto(AdjustmentType type) {
    switch (type) {
        case AdjustmentType::Sale: return v1::ADJUSTMENT_TYPE_SALE;
        case AdjustmentType::Return: return v1::ADJUSTMENT_TYPE_RETURN;
        case AdjustmentType::Purchase: return v1::ADJUSTMENT_TYPE_PURCHASE;
        case AdjustmentType::Damage: return v1::ADJUSTMENT_TYPE_DAMAGE;
        case AdjustmentType::Loss: return v1::ADJUSTMENT_TYPE_LOSS;
        case AdjustmentType::Correction: return v1::ADJUSTMENT_TYPE_CORRECTION;
    }
    return v1::ADJUSTMENT_TYPE_UNSPECIFIED;
}

/// Unspecified means a manual correction.
AdjustmentType from_proto(v1::AdjustmentType type) {
    switch (type) {
        case v1::ADJUSTMENT_TYPE_SALE: return AdjustmentType::Sale;
        case v1::ADJUSTMENT_TYPE_RETURN: return AdjustmentType::Return;
        case v1::ADJUSTMENT_TYPE_PURCHASE: return AdjustmentType::Purchase;
        case v1::ADJUSTMENT_TYPE_DAMAGE: return AdjustmentType::Damage;
        case v1::ADJUSTMENT_TYPE_LOSS: return AdjustmentType::Loss;
        case v1::ADJUSTMENT_TYPE_CORRECTION:
        case v1::ADJUSTMENT_TYPE_UNSPECIFIED:
            return AdjustmentType::Correction;
        default:
            throw InvalidArgumentError("Unknown adjustment type: " + std::to_string(static_cast<int>(type)));
    }
}

OrderStatus from_proto(v1::OrderStatus status) {
    switch (status) {
        case v1::ORDER_STATUS_NEW: return OrderStatus::New;
        case v1::ORDER_STATUS_RESERVED: return OrderStatus::Reserved;
        case v1::ORDER_STATUS_READY_TO_SHIP: return OrderStatus::ReadyToShip;
        case v1::ORDER_STATUS_LABEL_CREATED: return OrderStatus::LabelCreated;
        case v1::ORDER_STATUS_PICKED_UP: return OrderStatus::PickedUp;
        case v1::ORDER_STATUS_IN_TRANSIT: return OrderStatus::InTransit;
        case v1::ORDER_STATUS_OUT_FOR_DELIVERY: return OrderStatus::OutForDelivery;
        case v1::ORDER_STATUS_DELIVERED: return OrderStatus::Delivered;
        case v1::ORDER_STATUS_CANCELLED: return OrderStatus::Cancelled;
        case v1::ORDER_STATUS_FAILED: return OrderStatus::Failed;
        case v1::ORDER_STATUS_RETURNED: return OrderStatus::Returned;
        default:
            throw InvalidArgumentError("Order status is required");
    }
}

ItemSettings from_proto(const v1::ItemSettings& settings) {
    ItemSettings result;
    if (settings.has_reorder_point()) result.reorder_point = settings.reorder_point();
    if (settings.has_reorder_quantity()) result.reorder_quantity = settings.reorder_quantity();
    if (settings.has_location_bin()) result.location_bin = settings.location_bin();
    return result;
}

void fill(v1::InventoryItem* out, const InventoryItem& item) {
    out->set_id(item.id);
    out->set_organization_id(item.organization_id);
    out->set_sku_id(item.sku_id);
    out->set_quantity_total(item.quantity_total);
    out->set_quantity_reserved(item.quantity_reserved);
    out->set_quantity_available(item.quantity_available);
    if (item.reorder_point) out->set_reorder_point(*item.reorder_point);
    if (item.reorder_quantity) out->set_reorder_quantity(*item.reorder_quantity);
    if (item.location_bin) out->set_location_bin(*item.location_bin);
    set_timestamp(out->mutable_created_at(), item.created_at);
    set_timestamp(out->mutable_updated_at(), item.updated_at);
    out->set_low_stock(item.is_low_stock());
}

void fill(v1::Reservation* out, const InventoryReservation& reservation) {
    out->set_id(reservation.id);
    out->set_inventory_item_id(reservation.inventory_item_id);
    out->set_sku_id(reservation.sku_id);
    out->set_order_id(reservation.order_id);
    out->set_order_item_id(reservation.order_item_id);
    out->set_quantity_reserved(reservation.quantity_reserved);
    set_timestamp(out->mutable_reserved_at(), reservation.reserved_at);
    if (reservation.released_at) set_timestamp(out->mutable_released_at(), *reservation.released_at);
    if (reservation.reason) out->set_reason(*reservation.reason);
}

void fill(v1::Adjustment* out, const InventoryAdjustment& adjustment) {
    out->set_id(adjustment.id);
    out->set_inventory_item_id(adjustment.inventory_item_id);
    out->set_actor_id(adjustment.actor_id);
    out->set_type(to_proto(adjustment.type));
    out->set_quantity_change(adjustment.quantity_change);
    out->set_reason(adjustment.reason);
    if (adjustment.reference_type) out->set_reference_type(*adjustment.reference_type);
    if (adjustment.reference_id) out->set_reference_id(*adjustment.reference_id);
    if (adjustment.notes) out->set_notes(*adjustment.notes);
    set_timestamp(out->mutable_created_at(), adjustment.created_at);
}

template<typename Repeated>
void fill_reservations(Repeated* out, const std::vector<InventoryReservation>& reservations) {
    for (const auto& reservation : reservations) fill(out->Add(), reservation);
}

/// Run fn and turn any escaping error into the matching status.
template<typename Fn>
grpc::Status handle(const char* rpc, Fn&& fn) {
    try {
        fn();
        return grpc::Status::OK;
    } catch (const StorageError& e) {
        log_error(LOG_DOMAIN, "rpc_failed", {{"rpc", rpc}, {"error", e.details()}});
        return to_grpc_status(e);
    } catch (const InventoryError& e) {
        log_warn(LOG_DOMAIN, "rpc_rejected", {{"rpc", rpc}, {"error", e.details()}});
        return to_grpc_status(e);
    } catch (const std::exception& e) {
        log_error(LOG_DOMAIN, "rpc_failed", {{"rpc", rpc}, {"message", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

} // anonymous namespace

grpc::Status to_grpc_status(const InventoryError& error) {
    grpc::StatusCode code = grpc::StatusCode::INTERNAL;
    if (error.is_not_found()) {
        code = grpc::StatusCode::NOT_FOUND;
    } else if (dynamic_cast<const AlreadyExistsError*>(&error) != nullptr) {
        code = grpc::StatusCode::ALREADY_EXISTS;
    } else if (error.is_precondition_failed()) {
        code = grpc::StatusCode::FAILED_PRECONDITION;
    } else if (error.is_retryable()) {
        code = grpc::StatusCode::ABORTED;
    } else if (error.is_invalid_argument()) {
        code = grpc::StatusCode::INVALID_ARGUMENT;
    }
    return grpc::Status(code, error.what(), error.details().dump());
}

InventoryLedgerService::InventoryLedgerService(LedgerStore& store, std::size_t recent_adjustments)
    : reservations_(store),
      adjustments_(store),
      query_(store, recent_adjustments),
      lifecycle_(store, reservations_) {}

grpc::Status InventoryLedgerService::ReserveStock(grpc::ServerContext* context,
                                                  const v1::ReserveStockRequest* request,
                                                  v1::ReservationsResponse* response) {
    return handle("ReserveStock", [&] {
        auto reservations = reservations_.reserve_stock_for_order(request->order_id(),
                                                                  request->organization_id());
        fill_reservations(response->mutable_reservations(), reservations);
    });
}

grpc::Status InventoryLedgerService::ReleaseStock(grpc::ServerContext* context,
                                                  const v1::ReleaseStockRequest* request,
                                                  v1::ReservationsResponse* response) {
    return handle("ReleaseStock", [&] {
        const std::string reason = request->reason().empty() ? RELEASE_REASON_CANCELLED : request->reason();
        auto released = reservations_.release_stock_for_order(request->order_id(),
                                                              request->organization_id(), reason);
        fill_reservations(response->mutable_reservations(), released);
    });
}

grpc::Status InventoryLedgerService::AdjustStock(grpc::ServerContext* context,
                                                 const v1::AdjustStockRequest* request,
                                                 v1::InventoryItem* response) {
    return handle("AdjustStock", [&] {
        StockAdjustment adjustment;
        adjustment.organization_id = request->organization_id();
        adjustment.sku_id = request->sku_id();
        adjustment.delta = request->delta();
        adjustment.reason = request->reason();
        adjustment.actor_id = request->actor_id();
        adjustment.type = from_proto(request->type());
        adjustment.reference_type = non_empty(request->reference_type());
        adjustment.reference_id = non_empty(request->reference_id());
        adjustment.notes = non_empty(request->notes());
        fill(response, adjustments_.adjust_stock(adjustment));
    });
}

grpc::Status InventoryLedgerService::TrackSku(grpc::ServerContext* context,
                                              const v1::TrackSkuRequest* request,
                                              v1::InventoryItem* response) {
    return handle("TrackSku", [&] {
        auto item = adjustments_.track_sku(request->organization_id(), request->sku_id(),
                                           request->initial_quantity(), request->actor_id(),
                                           from_proto(request->settings()));
        fill(response, item);
    });
}

grpc::Status InventoryLedgerService::ConfigureItem(grpc::ServerContext* context,
                                                   const v1::ConfigureItemRequest* request,
                                                   v1::InventoryItem* response) {
    return handle("ConfigureItem", [&] {
        auto item = adjustments_.configure_item(request->organization_id(), request->sku_id(),
                                                from_proto(request->settings()));
        fill(response, item);
    });
}

grpc::Status InventoryLedgerService::FindBySku(grpc::ServerContext* context,
                                               const v1::FindBySkuRequest* request,
                                               v1::ItemDetail* response) {
    return handle("FindBySku", [&] {
        auto detail = query_.find_by_sku_id(request->sku_id(), request->organization_id());
        fill(response->mutable_item(), detail.item);
        fill_reservations(response->mutable_active_reservations(), detail.active_reservations);
        for (const auto& adjustment : detail.recent_adjustments) {
            fill(response->add_recent_adjustments(), adjustment);
        }
    });
}

grpc::Status InventoryLedgerService::ListLowStock(grpc::ServerContext* context,
                                                  const v1::OrganizationRequest* request,
                                                  v1::ItemList* response) {
    return handle("ListLowStock", [&] {
        for (const auto& item : query_.get_low_stock_items(request->organization_id())) {
            fill(response->add_items(), item);
        }
    });
}

grpc::Status InventoryLedgerService::GetSummary(grpc::ServerContext* context,
                                                const v1::OrganizationRequest* request,
                                                v1::InventorySummary* response) {
    return handle("GetSummary", [&] {
        auto summary = query_.get_summary(request->organization_id());
        response->set_total_items(summary.total_items);
        response->set_total_quantity(summary.total_quantity);
        response->set_total_reserved(summary.total_reserved);
        response->set_total_available(summary.total_available);
        response->set_low_stock_count(summary.low_stock_count);
        response->set_out_of_stock_count(summary.out_of_stock_count);
    });
}

grpc::Status InventoryLedgerService::ListItems(grpc::ServerContext* context,
                                               const v1::ListItemsRequest* request,
                                               v1::ItemPage* response) {
    return handle("ListItems", [&] {
        ItemFilter filter;
        filter.search = request->search();
        filter.low_stock = request->low_stock();
        filter.out_of_stock = request->out_of_stock();
        filter.page = request->page() == 0 ? 1 : request->page();
        filter.limit = request->limit() == 0 ? DEFAULT_PAGE_LIMIT : request->limit();

        auto page = query_.list_items(request->organization_id(), filter);
        for (const auto& item : page.items) fill(response->add_items(), item);
        response->set_total(page.total);
        response->set_page(static_cast<std::uint32_t>(page.page));
        response->set_limit(static_cast<std::uint32_t>(page.limit));
        response->set_total_pages(static_cast<std::uint32_t>(page.total_pages));
    });
}

grpc::Status InventoryLedgerService::ApplyOrderEvent(grpc::ServerContext* context,
                                                     const v1::OrderEvent* request,
                                                     v1::OrderEventResult* response) {
    return handle("ApplyOrderEvent", [&] {
        Order order;
        order.organization_id = request->organization_id();
        order.id = request->order_id();
        order.order_number = request->order_number();
        order.created_by = request->created_by();
        for (const auto& line : request->lines()) {
            order.lines.push_back(OrderLine{line.order_item_id(), line.sku_id(), line.quantity()});
        }

        auto result = lifecycle_.apply(order, from_proto(request->status()));
        switch (result.action) {
            case LifecycleResult::Action::Reserved:
                response->set_action(v1::OrderEventResult::ACTION_RESERVED);
                break;
            case LifecycleResult::Action::Released:
                response->set_action(v1::OrderEventResult::ACTION_RELEASED);
                break;
            case LifecycleResult::Action::None:
                response->set_action(v1::OrderEventResult::ACTION_NONE);
                break;
        }
        fill_reservations(response->mutable_reservations(), result.reservations);
    });
}

} // namespace stockledger
