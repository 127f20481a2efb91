#pragma once

#include <cstddef>
#include <grpcpp/grpcpp.h>
#include "stockledger/adjustment_engine.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/inventory.grpc.pb.h"
#include "stockledger/inventory_query.hpp"
#include "stockledger/ledger_store.hpp"
#include "stockledger/order_lifecycle.hpp"
#include "stockledger/reservation_engine.hpp"

namespace stockledger {

/**
 * Map a ledger error to a gRPC status. The message is the error text and
 * the binary details carry details() as JSON.
 *
 *   NotFound                         NOT_FOUND
 *   InsufficientStock, invariants    FAILED_PRECONDITION
 *   AlreadyExists                    ALREADY_EXISTS
 *   TransactionConflict              ABORTED
 *   InvalidArgument                  INVALID_ARGUMENT
 *   Storage                          INTERNAL
 */
grpc::Status to_grpc_status(const InventoryError& error);

/// gRPC front of the ledger. Handlers translate messages and errors only.
class InventoryLedgerService final : public v1::InventoryLedger::Service {
public:
    InventoryLedgerService(LedgerStore& store, std::size_t recent_adjustments);

    grpc::Status ReserveStock(grpc::ServerContext* context,
                              const v1::ReserveStockRequest* request,
                              v1::ReservationsResponse* response) override;

    grpc::Status ReleaseStock(grpc::ServerContext* context,
                              const v1::ReleaseStockRequest* request,
                              v1::ReservationsResponse* response) override;

    grpc::Status AdjustStock(grpc::ServerContext* context,
                             const v1::AdjustStockRequest* request,
                             v1::InventoryItem* response) override;

    grpc::Status TrackSku(grpc::ServerContext* context,
                          const v1::TrackSkuRequest* request,
                          v1::InventoryItem* response) override;

    grpc::Status ConfigureItem(grpc::ServerContext* context,
                               const v1::ConfigureItemRequest* request,
                               v1::InventoryItem* response) override;

    grpc::Status FindBySku(grpc::ServerContext* context,
                           const v1::FindBySkuRequest* request,
                           v1::ItemDetail* response) override;

    grpc::Status ListLowStock(grpc::ServerContext* context,
                              const v1::OrganizationRequest* request,
                              v1::ItemList* response) override;

    grpc::Status GetSummary(grpc::ServerContext* context,
                            const v1::OrganizationRequest* request,
                            v1::InventorySummary* response) override;

    grpc::Status ListItems(grpc::ServerContext* context,
                           const v1::ListItemsRequest* request,
                           v1::ItemPage* response) override;

    grpc::Status ApplyOrderEvent(grpc::ServerContext* context,
                                 const v1::OrderEvent* request,
                                 v1::OrderEventResult* response) override;

private:
    ReservationEngine reservations_;
    AdjustmentEngine adjustments_;
    InventoryQuery query_;
    OrderLifecycle lifecycle_;
};

} // namespace stockledger
