#include "stockledger/memory_ledger_store.hpp"

#include <algorithm>
#include "stockledger/errors.hpp"

namespace stockledger {

namespace {

constexpr char KEY_SEPARATOR = '\x1f';

bool reservation_less(const InventoryReservation& a, const InventoryReservation& b) {
    if (a.sku_id != b.sku_id) return a.sku_id < b.sku_id;
    if (a.order_item_id != b.order_item_id) return a.order_item_id < b.order_item_id;
    return a.id < b.id;
}

} // anonymous namespace

// =============================================================================
// Transaction
// =============================================================================

class InMemoryLedgerStore::Transaction final : public LedgerTransaction {
public:
    explicit Transaction(InMemoryLedgerStore& store) : store_(store) {}

    // Uncommitted staging is discarded; HeldLock members unlock on destruction.
    ~Transaction() override = default;

    std::optional<Order> lock_order(const std::string& organization_id,
                                    const std::string& order_id) override {
        auto key = order_key(organization_id, order_id);
        acquire(key);

        auto staged = orders_.find(key);
        if (staged != orders_.end()) return staged->second;

        std::lock_guard<std::mutex> lock(store_.mutex_);
        auto it = store_.orders_.find(key);
        if (it == store_.orders_.end()) return std::nullopt;
        return it->second;
    }

    void upsert_order(const Order& order) override {
        auto key = order_key(order.organization_id, order.id);
        acquire(key);
        orders_[key] = order;
    }

    std::optional<InventoryItem> get_item_for_update(const std::string& organization_id,
                                                     const std::string& sku_id) override {
        acquire(item_key(organization_id, sku_id));
        return visible_item(organization_id, sku_id);
    }

    InventoryItem create_item(const InventoryItem& item) override {
        acquire(item_key(item.organization_id, item.sku_id));
        if (visible_item(item.organization_id, item.sku_id)) {
            throw AlreadyExistsError("Inventory item already exists for SKU: " + item.sku_id);
        }

        InventoryItem created = item;
        created.id = store_.next_item_id_++;
        created.created_at = std::chrono::system_clock::now();
        created.updated_at = created.created_at;
        items_[created.id] = created;
        return created;
    }

    void update_item(const InventoryItem& item) override {
        require_held(item_key(item.organization_id, item.sku_id));
        InventoryItem updated = item;
        updated.updated_at = std::chrono::system_clock::now();
        items_[updated.id] = updated;
    }

    std::vector<InventoryReservation> active_reservations_for_order(
        const std::string& organization_id, const std::string& order_id) override {
        std::map<RowId, InventoryReservation> visible;
        {
            std::lock_guard<std::mutex> lock(store_.mutex_);
            auto ids = store_.reservations_by_order_.find(order_id);
            if (ids != store_.reservations_by_order_.end()) {
                for (RowId id : ids->second) {
                    const auto& reservation = store_.reservations_.at(id);
                    const auto& owner = store_.items_.at(reservation.inventory_item_id);
                    if (owner.organization_id == organization_id) {
                        visible[id] = reservation;
                    }
                }
            }
        }
        for (const auto& [id, reservation] : reservations_) {
            if (reservation.order_id == order_id && staged_owner_matches(reservation, organization_id)) {
                visible[id] = reservation;
            }
        }

        std::vector<InventoryReservation> active;
        for (const auto& [id, reservation] : visible) {
            if (reservation.is_active()) active.push_back(reservation);
        }
        std::sort(active.begin(), active.end(), reservation_less);
        return active;
    }

    InventoryReservation create_reservation(const InventoryReservation& reservation) override {
        InventoryReservation created = reservation;
        created.id = store_.next_reservation_id_++;
        if (created.reserved_at == Timestamp{}) {
            created.reserved_at = std::chrono::system_clock::now();
        }
        created.released_at.reset();
        created.reason.reset();
        reservations_[created.id] = created;
        return created;
    }

    InventoryReservation release_reservation(RowId reservation_id,
                                             Timestamp released_at,
                                             const std::string& reason) override {
        InventoryReservation reservation;
        auto staged = reservations_.find(reservation_id);
        if (staged != reservations_.end()) {
            reservation = staged->second;
        } else {
            std::lock_guard<std::mutex> lock(store_.mutex_);
            auto it = store_.reservations_.find(reservation_id);
            if (it == store_.reservations_.end()) {
                throw StorageError("Reservation not found: " + std::to_string(reservation_id));
            }
            reservation = it->second;
        }
        if (!reservation.is_active()) {
            throw StorageError("Reservation already released: " + std::to_string(reservation_id));
        }

        reservation.released_at = released_at;
        reservation.reason = reason;
        reservations_[reservation_id] = reservation;
        return reservation;
    }

    InventoryAdjustment append_adjustment(const InventoryAdjustment& adjustment) override {
        InventoryAdjustment appended = adjustment;
        appended.id = store_.next_adjustment_id_++;
        if (appended.created_at == Timestamp{}) {
            appended.created_at = std::chrono::system_clock::now();
        }
        adjustments_.push_back(appended);
        return appended;
    }

    void commit() override {
        if (finished_) {
            throw StorageError("Transaction already finished");
        }
        {
            std::lock_guard<std::mutex> lock(store_.mutex_);
            for (const auto& [id, item] : items_) {
                store_.item_index_[item_key(item.organization_id, item.sku_id)] = id;
                store_.items_[id] = item;
            }
            for (const auto& [id, reservation] : reservations_) {
                auto inserted = store_.reservations_.insert_or_assign(id, reservation).second;
                if (inserted) {
                    store_.reservations_by_order_[reservation.order_id].push_back(id);
                    store_.reservations_by_item_[reservation.inventory_item_id].push_back(id);
                }
            }
            for (const auto& adjustment : adjustments_) {
                store_.adjustments_[adjustment.inventory_item_id].push_back(adjustment);
            }
            for (const auto& [key, order] : orders_) {
                store_.orders_[key] = order;
            }
        }
        finished_ = true;
        // Locks are released only after the writes above are visible.
        held_.clear();
    }

private:
    struct HeldLock {
        std::string key;
        std::shared_ptr<std::timed_mutex> mutex;
        std::unique_lock<std::timed_mutex> lock;
    };

    bool holds(const std::string& key) const {
        return std::any_of(held_.begin(), held_.end(),
                           [&](const HeldLock& held) { return held.key == key; });
    }

    void acquire(const std::string& key) {
        if (finished_) {
            throw StorageError("Transaction already finished");
        }
        if (holds(key)) return;

        auto mutex = store_.row_lock(key);
        std::unique_lock<std::timed_mutex> lock(*mutex, std::defer_lock);
        if (!lock.try_lock_for(store_.lock_timeout_)) {
            throw TransactionConflictError("Timed out after " +
                                           std::to_string(store_.lock_timeout_.count()) +
                                           "ms waiting for row lock");
        }
        held_.push_back(HeldLock{key, std::move(mutex), std::move(lock)});
    }

    void require_held(const std::string& key) const {
        if (!holds(key)) {
            throw StorageError("Row written without holding its lock");
        }
    }

    std::optional<InventoryItem> visible_item(const std::string& organization_id,
                                              const std::string& sku_id) const {
        for (const auto& [id, item] : items_) {
            if (item.organization_id == organization_id && item.sku_id == sku_id) {
                return item;
            }
        }
        return store_.committed_item(organization_id, sku_id);
    }

    bool staged_owner_matches(const InventoryReservation& reservation,
                              const std::string& organization_id) const {
        auto staged = items_.find(reservation.inventory_item_id);
        if (staged != items_.end()) {
            return staged->second.organization_id == organization_id;
        }
        std::lock_guard<std::mutex> lock(store_.mutex_);
        auto it = store_.items_.find(reservation.inventory_item_id);
        return it != store_.items_.end() && it->second.organization_id == organization_id;
    }

    InMemoryLedgerStore& store_;
    bool finished_ = false;
    std::vector<HeldLock> held_;

    std::map<RowId, InventoryItem> items_;
    std::map<RowId, InventoryReservation> reservations_;
    std::vector<InventoryAdjustment> adjustments_;
    std::map<std::string, Order> orders_;
};

// =============================================================================
// InMemoryLedgerStore
// =============================================================================

InMemoryLedgerStore::InMemoryLedgerStore(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

InMemoryLedgerStore::~InMemoryLedgerStore() = default;

std::string InMemoryLedgerStore::item_key(const std::string& organization_id,
                                          const std::string& sku_id) {
    return "item/" + organization_id + KEY_SEPARATOR + sku_id;
}

std::string InMemoryLedgerStore::order_key(const std::string& organization_id,
                                           const std::string& order_id) {
    return "order/" + organization_id + KEY_SEPARATOR + order_id;
}

std::shared_ptr<std::timed_mutex> InMemoryLedgerStore::row_lock(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = row_locks_[key];
    if (!slot) slot = std::make_shared<std::timed_mutex>();
    return slot;
}

std::unique_ptr<LedgerTransaction> InMemoryLedgerStore::begin() {
    return std::make_unique<Transaction>(*this);
}

std::optional<InventoryItem> InMemoryLedgerStore::committed_item(const std::string& organization_id,
                                                                 const std::string& sku_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = item_index_.find(item_key(organization_id, sku_id));
    if (it == item_index_.end()) return std::nullopt;
    return items_.at(it->second);
}

std::optional<InventoryItem> InMemoryLedgerStore::find_item(const std::string& organization_id,
                                                            const std::string& sku_id) const {
    return committed_item(organization_id, sku_id);
}

std::optional<ItemDetail> InMemoryLedgerStore::find_item_detail(const std::string& organization_id,
                                                                const std::string& sku_id,
                                                                std::size_t recent_limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = item_index_.find(item_key(organization_id, sku_id));
    if (index == item_index_.end()) return std::nullopt;

    ItemDetail detail;
    detail.item = items_.at(index->second);

    auto reservation_ids = reservations_by_item_.find(detail.item.id);
    if (reservation_ids != reservations_by_item_.end()) {
        for (RowId id : reservation_ids->second) {
            const auto& reservation = reservations_.at(id);
            if (reservation.is_active()) detail.active_reservations.push_back(reservation);
        }
    }

    auto log = adjustments_.find(detail.item.id);
    if (log != adjustments_.end()) {
        auto count = std::min(recent_limit, log->second.size());
        detail.recent_adjustments.assign(log->second.rbegin(), log->second.rbegin() + count);
    }
    return detail;
}

std::vector<InventoryItem> InMemoryLedgerStore::list_items(const std::string& organization_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InventoryItem> result;
    for (const auto& [key, id] : item_index_) {
        const auto& item = items_.at(id);
        if (item.organization_id == organization_id) result.push_back(item);
    }
    std::sort(result.begin(), result.end(),
              [](const InventoryItem& a, const InventoryItem& b) { return a.sku_id < b.sku_id; });
    return result;
}

std::vector<InventoryReservation> InMemoryLedgerStore::reservations_for_order(
    const std::string& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InventoryReservation> result;
    auto ids = reservations_by_order_.find(order_id);
    if (ids != reservations_by_order_.end()) {
        for (RowId id : ids->second) result.push_back(reservations_.at(id));
    }
    std::sort(result.begin(), result.end(),
              [](const InventoryReservation& a, const InventoryReservation& b) { return a.id < b.id; });
    return result;
}

std::vector<InventoryAdjustment> InMemoryLedgerStore::adjustments_for_item(RowId inventory_item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adjustments_.find(inventory_item_id);
    if (it == adjustments_.end()) return {};
    return it->second;
}

} // namespace stockledger
