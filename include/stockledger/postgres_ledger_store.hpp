#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "ledger_store.hpp"

namespace stockledger {

/**
 * LedgerStore on PostgreSQL via libpqxx.
 *
 * Each transaction owns its own connection. Items are locked with
 * SELECT ... FOR UPDATE, orders with a transaction-scoped advisory lock so
 * that a missing order is locked too. Waits are bounded by lock_timeout;
 * lock timeouts, serialization failures and deadlocks surface as
 * TransactionConflictError, every other database failure as StorageError.
 */
class PostgresLedgerStore : public LedgerStore {
public:
    PostgresLedgerStore(std::string dsn, std::chrono::milliseconds lock_timeout);

    /// Create the ledger tables and indexes if they do not exist.
    void ensure_schema();

    std::unique_ptr<LedgerTransaction> begin() override;

    std::optional<InventoryItem> find_item(const std::string& organization_id,
                                           const std::string& sku_id) const override;
    std::optional<ItemDetail> find_item_detail(const std::string& organization_id,
                                               const std::string& sku_id,
                                               std::size_t recent_limit) const override;
    std::vector<InventoryItem> list_items(const std::string& organization_id) const override;

    const std::string& dsn() const { return dsn_; }

private:
    class Transaction;

    std::string dsn_;
    std::chrono::milliseconds lock_timeout_;
};

} // namespace stockledger
