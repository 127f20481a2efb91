#include "stockledger/postgres_ledger_store.hpp"

#include <utility>
#include <pqxx/pqxx>
#include "stockledger/errors.hpp"

namespace stockledger {

namespace {

constexpr const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS inventory_items (
    id                 BIGSERIAL PRIMARY KEY,
    organization_id    TEXT        NOT NULL,
    sku_id             TEXT        NOT NULL,
    quantity_total     BIGINT      NOT NULL DEFAULT 0,
    quantity_reserved  BIGINT      NOT NULL DEFAULT 0,
    quantity_available BIGINT      NOT NULL DEFAULT 0,
    reorder_point      BIGINT,
    reorder_quantity   BIGINT,
    location_bin       TEXT,
    created_at         TIMESTAMPTZ NOT NULL DEFAULT now(),
    updated_at         TIMESTAMPTZ NOT NULL DEFAULT now(),
    CONSTRAINT inventory_items_org_sku_key UNIQUE (organization_id, sku_id),
    CONSTRAINT inventory_items_reserved_non_negative CHECK (quantity_reserved >= 0),
    CONSTRAINT inventory_items_total_covers_reserved CHECK (quantity_total >= quantity_reserved),
    CONSTRAINT inventory_items_available_derived
        CHECK (quantity_available = quantity_total - quantity_reserved)
);

CREATE TABLE IF NOT EXISTS ledger_orders (
    organization_id TEXT NOT NULL,
    id              TEXT NOT NULL,
    order_number    TEXT NOT NULL DEFAULT '',
    created_by      TEXT NOT NULL DEFAULT '',
    PRIMARY KEY (organization_id, id)
);

CREATE TABLE IF NOT EXISTS ledger_order_items (
    organization_id TEXT   NOT NULL,
    order_id        TEXT   NOT NULL,
    order_item_id   TEXT   NOT NULL,
    sku_id          TEXT   NOT NULL,
    quantity        BIGINT NOT NULL CHECK (quantity > 0),
    PRIMARY KEY (organization_id, order_id, order_item_id),
    FOREIGN KEY (organization_id, order_id)
        REFERENCES ledger_orders (organization_id, id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS inventory_reservations (
    id                BIGSERIAL PRIMARY KEY,
    organization_id   TEXT        NOT NULL,
    inventory_item_id BIGINT      NOT NULL REFERENCES inventory_items (id),
    sku_id            TEXT        NOT NULL,
    order_id          TEXT        NOT NULL,
    order_item_id     TEXT        NOT NULL,
    quantity_reserved BIGINT      NOT NULL CHECK (quantity_reserved > 0),
    reserved_at       TIMESTAMPTZ NOT NULL DEFAULT now(),
    released_at       TIMESTAMPTZ,
    reason            TEXT
);

CREATE INDEX IF NOT EXISTS inventory_reservations_active_order_idx
    ON inventory_reservations (organization_id, order_id) WHERE released_at IS NULL;
CREATE INDEX IF NOT EXISTS inventory_reservations_active_item_idx
    ON inventory_reservations (inventory_item_id) WHERE released_at IS NULL;

CREATE TABLE IF NOT EXISTS inventory_adjustments (
    id                BIGSERIAL PRIMARY KEY,
    organization_id   TEXT        NOT NULL,
    inventory_item_id BIGINT      NOT NULL REFERENCES inventory_items (id),
    actor_id          TEXT        NOT NULL,
    type              TEXT        NOT NULL
        CHECK (type IN ('SALE', 'RETURN', 'PURCHASE', 'DAMAGE', 'LOSS', 'CORRECTION')),
    quantity_change   BIGINT      NOT NULL,
    reason            TEXT        NOT NULL,
    reference_type    TEXT,
    reference_id      TEXT,
    notes             TEXT,
    created_at        TIMESTAMPTZ NOT NULL DEFAULT now()
);

CREATE INDEX IF NOT EXISTS inventory_adjustments_item_idx
    ON inventory_adjustments (inventory_item_id, id DESC);
)SQL";

constexpr const char* ITEM_COLUMNS =
    "id, organization_id, sku_id, quantity_total, quantity_reserved, quantity_available, "
    "reorder_point, reorder_quantity, location_bin, "
    "(extract(epoch FROM created_at) * 1000)::bigint AS created_ms, "
    "(extract(epoch FROM updated_at) * 1000)::bigint AS updated_ms";

constexpr const char* RESERVATION_COLUMNS =
    "id, inventory_item_id, sku_id, order_id, order_item_id, quantity_reserved, "
    "(extract(epoch FROM reserved_at) * 1000)::bigint AS reserved_ms, "
    "(extract(epoch FROM released_at) * 1000)::bigint AS released_ms, reason";

constexpr const char* ADJUSTMENT_COLUMNS =
    "id, organization_id, inventory_item_id, actor_id, type, quantity_change, reason, "
    "reference_type, reference_id, notes, "
    "(extract(epoch FROM created_at) * 1000)::bigint AS created_ms";

using ReadSnapshot = pqxx::transaction<pqxx::isolation_level::repeatable_read,
                                       pqxx::write_policy::read_only>;

// lock_not_available, serialization_failure, deadlock_detected
bool is_conflict(const std::string& sqlstate) {
    return sqlstate == "55P03" || sqlstate == "40001" || sqlstate == "40P01";
}

/// Run fn, translating libpqxx failures into ledger errors.
template<typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::sql_error& e) {
        if (is_conflict(e.sqlstate())) {
            throw TransactionConflictError(std::string(operation) + ": " + e.what());
        }
        throw StorageError(std::string(operation) + ": " + e.what());
    } catch (const pqxx::failure& e) {
        throw StorageError(std::string(operation) + ": " + e.what());
    } catch (const pqxx::conversion_error& e) {
        throw StorageError(std::string(operation) + ": " + e.what());
    }
}

std::int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(std::int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

template<typename T>
std::optional<T> nullable(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<T>();
}

InventoryItem item_from_row(const pqxx::row& row) {
    InventoryItem item;
    item.id = row["id"].as<RowId>();
    item.organization_id = row["organization_id"].as<std::string>();
    item.sku_id = row["sku_id"].as<std::string>();
    item.quantity_total = row["quantity_total"].as<Quantity>();
    item.quantity_reserved = row["quantity_reserved"].as<Quantity>();
    item.quantity_available = row["quantity_available"].as<Quantity>();
    item.reorder_point = nullable<Quantity>(row["reorder_point"]);
    item.reorder_quantity = nullable<Quantity>(row["reorder_quantity"]);
    item.location_bin = nullable<std::string>(row["location_bin"]);
    item.created_at = from_epoch_ms(row["created_ms"].as<std::int64_t>());
    item.updated_at = from_epoch_ms(row["updated_ms"].as<std::int64_t>());
    return item;
}

InventoryReservation reservation_from_row(const pqxx::row& row) {
    InventoryReservation reservation;
    reservation.id = row["id"].as<RowId>();
    reservation.inventory_item_id = row["inventory_item_id"].as<RowId>();
    reservation.sku_id = row["sku_id"].as<std::string>();
    reservation.order_id = row["order_id"].as<std::string>();
    reservation.order_item_id = row["order_item_id"].as<std::string>();
    reservation.quantity_reserved = row["quantity_reserved"].as<Quantity>();
    reservation.reserved_at = from_epoch_ms(row["reserved_ms"].as<std::int64_t>());
    if (auto released = nullable<std::int64_t>(row["released_ms"])) {
        reservation.released_at = from_epoch_ms(*released);
    }
    reservation.reason = nullable<std::string>(row["reason"]);
    return reservation;
}

InventoryAdjustment adjustment_from_row(const pqxx::row& row) {
    InventoryAdjustment adjustment;
    adjustment.id = row["id"].as<RowId>();
    adjustment.organization_id = row["organization_id"].as<std::string>();
    adjustment.inventory_item_id = row["inventory_item_id"].as<RowId>();
    adjustment.actor_id = row["actor_id"].as<std::string>();
    adjustment.type = parse_adjustment_type(row["type"].as<std::string>());
    adjustment.quantity_change = row["quantity_change"].as<Quantity>();
    adjustment.reason = row["reason"].as<std::string>();
    adjustment.reference_type = nullable<std::string>(row["reference_type"]);
    adjustment.reference_id = nullable<std::string>(row["reference_id"]);
    adjustment.notes = nullable<std::string>(row["notes"]);
    adjustment.created_at = from_epoch_ms(row["created_ms"].as<std::int64_t>());
    return adjustment;
}

std::optional<InventoryItem> select_item(pqxx::transaction_base& tx,
                                         const std::string& organization_id,
                                         const std::string& sku_id,
                                         bool for_update) {
    std::string query = std::string("SELECT ") + ITEM_COLUMNS +
                        " FROM inventory_items WHERE organization_id = $1 AND sku_id = $2";
    if (for_update) query += " FOR UPDATE";
    auto result = tx.exec_params(query, organization_id, sku_id);
    if (result.empty()) return std::nullopt;
    return item_from_row(result[0]);
}

} // anonymous namespace

// =============================================================================
// Transaction
// =============================================================================

class PostgresLedgerStore::Transaction final : public LedgerTransaction {
public:
    Transaction(const std::string& dsn, std::chrono::milliseconds lock_timeout)
        : connection_(dsn), work_(connection_) {
        work_.exec("SET LOCAL lock_timeout = " + std::to_string(lock_timeout.count()));
    }

    // pqxx::work aborts on destruction when not committed.
    ~Transaction() override = default;

    std::optional<Order> lock_order(const std::string& organization_id,
                                    const std::string& order_id) override {
        return guarded("lock_order", [&]() -> std::optional<Order> {
            work_.exec_params("SELECT pg_advisory_xact_lock(hashtextextended($1 || chr(31) || $2, 0))",
                              organization_id, order_id);

            auto header = work_.exec_params(
                "SELECT order_number, created_by FROM ledger_orders "
                "WHERE organization_id = $1 AND id = $2",
                organization_id, order_id);
            if (header.empty()) return std::nullopt;

            Order order;
            order.organization_id = organization_id;
            order.id = order_id;
            order.order_number = header[0]["order_number"].as<std::string>();
            order.created_by = header[0]["created_by"].as<std::string>();

            auto lines = work_.exec_params(
                "SELECT order_item_id, sku_id, quantity FROM ledger_order_items "
                "WHERE organization_id = $1 AND order_id = $2 ORDER BY order_item_id",
                organization_id, order_id);
            for (const auto& row : lines) {
                order.lines.push_back(OrderLine{row["order_item_id"].as<std::string>(),
                                                row["sku_id"].as<std::string>(),
                                                row["quantity"].as<Quantity>()});
            }
            return order;
        });
    }

    void upsert_order(const Order& order) override {
        guarded("upsert_order", [&] {
            work_.exec_params(
                "INSERT INTO ledger_orders (organization_id, id, order_number, created_by) "
                "VALUES ($1, $2, $3, $4) "
                "ON CONFLICT (organization_id, id) DO UPDATE "
                "SET order_number = EXCLUDED.order_number, created_by = EXCLUDED.created_by",
                order.organization_id, order.id, order.order_number, order.created_by);
            work_.exec_params("DELETE FROM ledger_order_items WHERE organization_id = $1 AND order_id = $2",
                              order.organization_id, order.id);
            for (const auto& line : order.lines) {
                work_.exec_params(
                    "INSERT INTO ledger_order_items "
                    "(organization_id, order_id, order_item_id, sku_id, quantity) "
                    "VALUES ($1, $2, $3, $4, $5)",
                    order.organization_id, order.id, line.order_item_id, line.sku_id, line.quantity);
            }
        });
    }

    std::optional<InventoryItem> get_item_for_update(const std::string& organization_id,
                                                     const std::string& sku_id) override {
        return guarded("get_item_for_update",
                       [&] { return select_item(work_, organization_id, sku_id, true); });
    }

    InventoryItem create_item(const InventoryItem& item) override {
        auto created = guarded("create_item", [&]() -> std::optional<InventoryItem> {
            auto result = work_.exec_params(
                std::string("INSERT INTO inventory_items "
                            "(organization_id, sku_id, quantity_total, quantity_reserved, "
                            "quantity_available, reorder_point, reorder_quantity, location_bin) "
                            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) "
                            "ON CONFLICT (organization_id, sku_id) DO NOTHING RETURNING ") +
                    ITEM_COLUMNS,
                item.organization_id, item.sku_id, item.quantity_total, item.quantity_reserved,
                item.quantity_available, item.reorder_point, item.reorder_quantity, item.location_bin);
            if (result.empty()) return std::nullopt;
            return item_from_row(result[0]);
        });
        if (!created) {
            throw AlreadyExistsError("Inventory item already exists for SKU: " + item.sku_id);
        }
        return *created;
    }

    void update_item(const InventoryItem& item) override {
        auto updated = guarded("update_item", [&] {
            return work_.exec_params(
                "UPDATE inventory_items SET quantity_total = $2, quantity_reserved = $3, "
                "quantity_available = $4, reorder_point = $5, reorder_quantity = $6, "
                "location_bin = $7, updated_at = now() WHERE id = $1 RETURNING id",
                item.id, item.quantity_total, item.quantity_reserved, item.quantity_available,
                item.reorder_point, item.reorder_quantity, item.location_bin).size();
        });
        if (updated == 0) {
            throw StorageError("Inventory item row missing: " + std::to_string(item.id));
        }
    }

    std::vector<InventoryReservation> active_reservations_for_order(
        const std::string& organization_id, const std::string& order_id) override {
        return guarded("active_reservations_for_order", [&] {
            auto result = work_.exec_params(
                std::string("SELECT ") + RESERVATION_COLUMNS +
                    " FROM inventory_reservations "
                    "WHERE organization_id = $1 AND order_id = $2 AND released_at IS NULL "
                    "ORDER BY sku_id COLLATE \"C\", order_item_id COLLATE \"C\", id",
                organization_id, order_id);
            std::vector<InventoryReservation> active;
            for (const auto& row : result) active.push_back(reservation_from_row(row));
            return active;
        });
    }

    InventoryReservation create_reservation(const InventoryReservation& reservation) override {
        auto created = guarded("create_reservation", [&]() -> std::optional<InventoryReservation> {
            auto result = work_.exec_params(
                std::string("INSERT INTO inventory_reservations "
                            "(organization_id, inventory_item_id, sku_id, order_id, order_item_id, "
                            "quantity_reserved, reserved_at) "
                            "SELECT i.organization_id, i.id, $2, $3, $4, $5, "
                            "to_timestamp($6::double precision / 1000.0) "
                            "FROM inventory_items i WHERE i.id = $1 RETURNING ") +
                    RESERVATION_COLUMNS,
                reservation.inventory_item_id, reservation.sku_id, reservation.order_id,
                reservation.order_item_id, reservation.quantity_reserved,
                to_epoch_ms(reservation.reserved_at == Timestamp{} ? std::chrono::system_clock::now()
                                                                   : reservation.reserved_at));
            if (result.empty()) return std::nullopt;
            return reservation_from_row(result[0]);
        });
        if (!created) {
            throw StorageError("Inventory item row missing: " + std::to_string(reservation.inventory_item_id));
        }
        return *created;
    }

    InventoryReservation release_reservation(RowId reservation_id,
                                             Timestamp released_at,
                                             const std::string& reason) override {
        auto released = guarded("release_reservation", [&]() -> std::optional<InventoryReservation> {
            auto result = work_.exec_params(
                std::string("UPDATE inventory_reservations "
                            "SET released_at = to_timestamp($2::double precision / 1000.0), reason = $3 "
                            "WHERE id = $1 AND released_at IS NULL RETURNING ") +
                    RESERVATION_COLUMNS,
                reservation_id, to_epoch_ms(released_at), reason);
            if (result.empty()) return std::nullopt;
            return reservation_from_row(result[0]);
        });
        if (!released) {
            throw StorageError("Reservation not found or already released: " +
                               std::to_string(reservation_id));
        }
        return *released;
    }

    InventoryAdjustment append_adjustment(const InventoryAdjustment& adjustment) override {
        return guarded("append_adjustment", [&] {
            auto result = work_.exec_params(
                std::string("INSERT INTO inventory_adjustments "
                            "(organization_id, inventory_item_id, actor_id, type, quantity_change, "
                            "reason, reference_type, reference_id, notes, created_at) "
                            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, "
                            "to_timestamp($10::double precision / 1000.0)) RETURNING ") +
                    ADJUSTMENT_COLUMNS,
                adjustment.organization_id, adjustment.inventory_item_id, adjustment.actor_id,
                adjustment_type_name(adjustment.type), adjustment.quantity_change, adjustment.reason,
                adjustment.reference_type, adjustment.reference_id, adjustment.notes,
                to_epoch_ms(adjustment.created_at == Timestamp{} ? std::chrono::system_clock::now()
                                                                 : adjustment.created_at));
            return adjustment_from_row(result[0]);
        });
    }

    void commit() override {
        guarded("commit", [&] { work_.commit(); });
    }

private:
    pqxx::connection connection_;
    pqxx::work work_;
};

// =============================================================================
// PostgresLedgerStore
// =============================================================================

PostgresLedgerStore::PostgresLedgerStore(std::string dsn, std::chrono::milliseconds lock_timeout)
    : dsn_(std::move(dsn)), lock_timeout_(lock_timeout) {}

void PostgresLedgerStore::ensure_schema() {
    guarded("ensure_schema", [&] {
        pqxx::connection connection(dsn_);
        pqxx::work work(connection);
        work.exec(SCHEMA_SQL);
        work.commit();
    });
}

std::unique_ptr<LedgerTransaction> PostgresLedgerStore::begin() {
    return guarded("begin", [&]() -> std::unique_ptr<LedgerTransaction> {
        return std::make_unique<Transaction>(dsn_, lock_timeout_);
    });
}

std::optional<InventoryItem> PostgresLedgerStore::find_item(const std::string& organization_id,
                                                            const std::string& sku_id) const {
    return guarded("find_item", [&] {
        pqxx::connection connection(dsn_);
        pqxx::read_transaction tx(connection);
        return select_item(tx, organization_id, sku_id, false);
    });
}

std::optional<ItemDetail> PostgresLedgerStore::find_item_detail(const std::string& organization_id,
                                                                const std::string& sku_id,
                                                                std::size_t recent_limit) const {
    return guarded("find_item_detail", [&]() -> std::optional<ItemDetail> {
        pqxx::connection connection(dsn_);
        ReadSnapshot tx(connection);

        auto item = select_item(tx, organization_id, sku_id, false);
        if (!item) return std::nullopt;

        ItemDetail detail;
        detail.item = *item;

        auto reservations = tx.exec_params(
            std::string("SELECT ") + RESERVATION_COLUMNS +
                " FROM inventory_reservations WHERE inventory_item_id = $1 AND released_at IS NULL "
                "ORDER BY id",
            item->id);
        for (const auto& row : reservations) {
            detail.active_reservations.push_back(reservation_from_row(row));
        }

        auto adjustments = tx.exec_params(
            std::string("SELECT ") + ADJUSTMENT_COLUMNS +
                " FROM inventory_adjustments WHERE inventory_item_id = $1 ORDER BY id DESC LIMIT $2",
            item->id, static_cast<long long>(recent_limit));
        for (const auto& row : adjustments) {
            detail.recent_adjustments.push_back(adjustment_from_row(row));
        }
        return detail;
    });
}

std::vector<InventoryItem> PostgresLedgerStore::list_items(const std::string& organization_id) const {
    return guarded("list_items", [&] {
        pqxx::connection connection(dsn_);
        pqxx::read_transaction tx(connection);
        auto result = tx.exec_params(
            std::string("SELECT ") + ITEM_COLUMNS +
                " FROM inventory_items WHERE organization_id = $1 ORDER BY sku_id COLLATE \"C\"",
            organization_id);
        std::vector<InventoryItem> items;
        for (const auto& row : result) items.push_back(item_from_row(row));
        return items;
    });
}

} // namespace stockledger
