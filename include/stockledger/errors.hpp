#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace stockledger {

/**
 * Base exception for all ledger errors.
 *
 * Every failure aborts the enclosing transaction before any write is
 * committed, so callers may assume the store is unchanged.
 */
class InventoryError : public std::runtime_error {
public:
    explicit InventoryError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the order or item is missing (or belongs to another
     * organization).
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the request is valid but current stock forbids it.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if the request itself is malformed.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if the caller may retry the same request unchanged.
     */
    virtual bool is_retryable() const { return false; }

    virtual const char* kind() const { return "InventoryError"; }

    /**
     * Structured detail for logs and RPC error payloads.
     */
    virtual nlohmann::json details() const {
        return {{"error", kind()}, {"message", what()}};
    }
};

/**
 * Thrown when an order or inventory item does not exist for the organization.
 */
class NotFoundError : public InventoryError {
public:
    enum class Entity { Order, InventoryItem };

    NotFoundError(Entity entity, const std::string& id);

    Entity entity() const { return entity_; }
    const std::string& id() const { return id_; }

    bool is_not_found() const override { return true; }
    const char* kind() const override { return "NotFound"; }
    nlohmann::json details() const override;

private:
    Entity entity_;
    std::string id_;
};

/**
 * Thrown by reserve when any SKU of the order lacks available stock.
 */
class InsufficientStockError : public InventoryError {
public:
    InsufficientStockError(const std::string& sku_id, Quantity available, Quantity required);

    const std::string& sku_id() const { return sku_id_; }
    Quantity available() const { return available_; }
    Quantity required() const { return required_; }

    bool is_precondition_failed() const override { return true; }
    const char* kind() const override { return "InsufficientStock"; }
    nlohmann::json details() const override;

private:
    std::string sku_id_;
    Quantity available_;
    Quantity required_;
};

/**
 * Common shape of the adjust-time invariant violations.
 */
class StockInvariantError : public InventoryError {
public:
    StockInvariantError(const std::string& message,
                        const std::string& sku_id,
                        Quantity current_total,
                        Quantity current_reserved,
                        Quantity delta)
        : InventoryError(message),
          sku_id_(sku_id),
          current_total_(current_total),
          current_reserved_(current_reserved),
          delta_(delta) {}

    const std::string& sku_id() const { return sku_id_; }
    Quantity current_total() const { return current_total_; }
    Quantity current_reserved() const { return current_reserved_; }
    Quantity delta() const { return delta_; }

    bool is_precondition_failed() const override { return true; }
    nlohmann::json details() const override;

private:
    std::string sku_id_;
    Quantity current_total_;
    Quantity current_reserved_;
    Quantity delta_;
};

class NegativeInventoryError : public StockInvariantError {
public:
    NegativeInventoryError(const std::string& sku_id, Quantity total, Quantity reserved, Quantity delta);
    const char* kind() const override { return "NegativeInventory"; }
};

/**
 * Stock cannot drop below what is already promised to open orders.
 */
class BelowReservedQuantityError : public StockInvariantError {
public:
    BelowReservedQuantityError(const std::string& sku_id, Quantity total, Quantity reserved, Quantity delta);
    const char* kind() const override { return "BelowReservedQuantity"; }
};

class NegativeAvailableError : public StockInvariantError {
public:
    NegativeAvailableError(const std::string& sku_id, Quantity total, Quantity reserved, Quantity delta);
    const char* kind() const override { return "NegativeAvailable"; }
};

/**
 * Thrown when a row lock is not acquired in time or the backend reports a
 * serialization failure or deadlock. The only retryable error.
 */
class TransactionConflictError : public InventoryError {
public:
    explicit TransactionConflictError(const std::string& message)
        : InventoryError(message) {}

    bool is_retryable() const override { return true; }
    const char* kind() const override { return "TransactionConflict"; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public InventoryError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : InventoryError(message) {}

    bool is_invalid_argument() const override { return true; }
    const char* kind() const override { return "InvalidArgument"; }
};

/**
 * Thrown when tracking a SKU that is already tracked for the organization.
 */
class AlreadyExistsError : public InventoryError {
public:
    explicit AlreadyExistsError(const std::string& message)
        : InventoryError(message) {}

    bool is_precondition_failed() const override { return true; }
    const char* kind() const override { return "AlreadyExists"; }
};

/**
 * Thrown when the storage backend fails for reasons other than contention.
 */
class StorageError : public InventoryError {
public:
    explicit StorageError(const std::string& message)
        : InventoryError(message) {}

    const char* kind() const override { return "StorageError"; }
};

} // namespace stockledger
