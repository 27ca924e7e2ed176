#pragma once

#include "adapters/secondary/persistence/InMemoryChangeSet.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <map>
#include <memory>
#include <tuple>

namespace inventory::adapters::secondary {

namespace detail {

/// Запомнить изменённую строку; версия объекта сразу получает значение после коммита
template <typename T, typename GetVersion, typename SetVersion>
void stageUpdate(std::map<std::string, StagedRow<T>>& staged, const std::string& id, T& value,
                 GetVersion getVersion, SetVersion setVersion) {
    auto it = staged.find(id);
    if (it != staged.end()) {
        setVersion(value, getVersion(it->second.value));
        it->second.value = value;
        return;
    }
    const int64_t expected = getVersion(value);
    setVersion(value, expected + 1);
    staged.emplace(id, StagedRow<T>{value, false, expected});
}

} // namespace detail

class InMemoryStockItemRepository : public ports::output::IStockItemRepository {
public:
    InMemoryStockItemRepository(const InMemoryInventoryStore& store, InMemoryChangeSet& changes)
        : store_(store), changes_(changes) {}

    void add(domain::StockItem& item) override {
        item.setVersion(1);
        changes_.items.insert_or_assign(item.id(), StagedRow<domain::StockItem>{item, true, 0});
    }

    void update(domain::StockItem& item) override {
        detail::stageUpdate(changes_.items, item.id(), item,
            [](const domain::StockItem& i) { return i.version(); },
            [](domain::StockItem& i, int64_t v) { i.setVersion(v); });
    }

    std::optional<domain::StockItem> findById(const std::string& id) override {
        auto it = changes_.items.find(id);
        if (it != changes_.items.end()) {
            return it->second.value;
        }
        return store_.findItem(id);
    }

    std::optional<domain::StockItem> findByVariantAndLocation(
        const std::string& variantId, const std::string& stockLocationId) override
    {
        for (const auto& [id, row] : changes_.items) {
            const auto& item = row.value;
            if (item.variantId() == variantId && item.stockLocationId() == stockLocationId && !item.isDeleted()) {
                return item;
            }
        }
        auto committedId = store_.findItemId(variantId, stockLocationId);
        if (!committedId || changes_.items.count(*committedId) > 0) {
            return std::nullopt;
        }
        return store_.findItem(*committedId);
    }

    std::vector<domain::StockItem> findByLocation(const std::string& stockLocationId) override {
        std::map<std::string, domain::StockItem> merged;
        for (auto& item : store_.itemsAtLocation(stockLocationId)) {
            merged.emplace(item.id(), item);
        }
        for (const auto& [id, row] : changes_.items) {
            if (row.value.stockLocationId() == stockLocationId) {
                merged.insert_or_assign(id, row.value);
            }
        }

        std::vector<domain::StockItem> result;
        for (auto& [id, item] : merged) {
            if (!item.isDeleted()) {
                result.push_back(item);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const domain::StockItem& a, const domain::StockItem& b) {
            return a.createdAt() < b.createdAt();
        });
        return result;
    }

private:
    const InMemoryInventoryStore& store_;
    InMemoryChangeSet& changes_;
};

class InMemoryStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    InMemoryStockMovementRepository(const InMemoryInventoryStore& store, InMemoryChangeSet& changes)
        : store_(store), changes_(changes) {}

    void append(const domain::StockMovement& movement) override {
        changes_.movements.push_back(movement);
    }

    std::vector<domain::StockMovement> findByStockItem(const std::string& stockItemId) override {
        auto result = store_.movementsForItem(stockItemId);
        for (const auto& movement : changes_.movements) {
            if (movement.stockItemId == stockItemId) {
                result.push_back(movement);
            }
        }
        return result;
    }

    std::vector<domain::StockMovement> findByTransfer(const std::string& stockTransferId) override {
        auto result = store_.movementsForTransfer(stockTransferId);
        for (const auto& movement : changes_.movements) {
            if (movement.stockTransferId == stockTransferId) {
                result.push_back(movement);
            }
        }
        return result;
    }

private:
    const InMemoryInventoryStore& store_;
    InMemoryChangeSet& changes_;
};

class InMemoryStockLocationRepository : public ports::output::IStockLocationRepository {
public:
    InMemoryStockLocationRepository(const InMemoryInventoryStore& store, InMemoryChangeSet& changes)
        : store_(store), changes_(changes) {}

    void add(domain::StockLocation& location) override {
        location.version = 1;
        changes_.locations.insert_or_assign(location.id, StagedRow<domain::StockLocation>{location, true, 0});
    }

    void update(domain::StockLocation& location) override {
        detail::stageUpdate(changes_.locations, location.id, location,
            [](const domain::StockLocation& l) { return l.version; },
            [](domain::StockLocation& l, int64_t v) { l.version = v; });
    }

    std::optional<domain::StockLocation> findById(const std::string& id) override {
        auto it = changes_.locations.find(id);
        if (it != changes_.locations.end()) {
            return it->second.value;
        }
        return store_.findLocation(id);
    }

    std::vector<domain::StockLocation> findAll() override {
        std::map<std::string, domain::StockLocation> merged;
        for (auto& location : store_.allLocations()) {
            merged.emplace(location.id, location);
        }
        for (const auto& [id, row] : changes_.locations) {
            merged.insert_or_assign(id, row.value);
        }

        std::vector<domain::StockLocation> result;
        for (auto& [id, location] : merged) {
            if (!location.isDeleted()) {
                result.push_back(location);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const domain::StockLocation& a, const domain::StockLocation& b) {
            return a.createdAt < b.createdAt;
        });
        return result;
    }

    std::optional<domain::StockLocation> findDefault() override {
        for (auto& location : findAll()) {
            if (location.isDefault) {
                return location;
            }
        }
        return std::nullopt;
    }

private:
    const InMemoryInventoryStore& store_;
    InMemoryChangeSet& changes_;
};

class InMemoryStockTransferRepository : public ports::output::IStockTransferRepository {
public:
    InMemoryStockTransferRepository(const InMemoryInventoryStore& store, InMemoryChangeSet& changes)
        : store_(store), changes_(changes) {}

    void add(const domain::StockTransfer& transfer) override {
        changes_.transfers.push_back(transfer);
    }

    std::optional<domain::StockTransfer> findById(const std::string& id) override {
        for (const auto& transfer : changes_.transfers) {
            if (transfer.id == id) return transfer;
        }
        return store_.findTransfer(id);
    }

private:
    const InMemoryInventoryStore& store_;
    InMemoryChangeSet& changes_;
};

class InMemoryInventoryUnitRepository : public ports::output::IInventoryUnitRepository {
public:
    InMemoryInventoryUnitRepository(const InMemoryInventoryStore& store, InMemoryChangeSet& changes)
        : store_(store), changes_(changes) {}

    void add(domain::InventoryUnit& unit) override {
        unit.setVersion(1);
        if (changes_.units.count(unit.id()) == 0) {
            changes_.newUnitOrder.push_back(unit.id());
        }
        changes_.units.insert_or_assign(unit.id(), StagedRow<domain::InventoryUnit>{unit, true, 0});
    }

    void update(domain::InventoryUnit& unit) override {
        detail::stageUpdate(changes_.units, unit.id(), unit,
            [](const domain::InventoryUnit& u) { return u.version(); },
            [](domain::InventoryUnit& u, int64_t v) { u.setVersion(v); });
    }

    std::optional<domain::InventoryUnit> findById(const std::string& id) override {
        auto it = changes_.units.find(id);
        if (it != changes_.units.end()) {
            return it->second.value;
        }
        auto stored = store_.findUnit(id);
        if (!stored) return std::nullopt;
        return domain::InventoryUnit::restore(stored->data);
    }

    std::vector<domain::InventoryUnit> findByOrder(const std::string& orderId) override {
        return select([&](const domain::InventoryUnitData& d) { return d.orderId == orderId; });
    }

    std::vector<domain::InventoryUnit> findBackordered(
        const std::string& variantId, const std::string& stockLocationId) override
    {
        return select([&](const domain::InventoryUnitData& d) {
            return d.state == domain::InventoryUnitState::BACKORDERED &&
                   d.variantId == variantId && d.stockLocationId == stockLocationId;
        });
    }

private:
    /// Зафиксированные и буферизованные единицы по предикату, в порядке создания
    std::vector<domain::InventoryUnit> select(const std::function<bool(const domain::InventoryUnitData&)>& predicate) {
        // id -> (данные, порядковый номер)
        std::map<std::string, std::pair<domain::InventoryUnitData, int64_t>> merged;
        for (auto& stored : store_.unitsWhere(predicate)) {
            if (changes_.units.count(stored.data.id) == 0) {
                merged.emplace(stored.data.id, std::make_pair(stored.data, stored.seq));
            }
        }
        for (const auto& [id, row] : changes_.units) {
            if (row.isNew) {
                continue;
            }
            auto stored = store_.findUnit(id);
            merged.insert_or_assign(id, std::make_pair(row.value.data(), stored ? stored->seq : 0));
        }
        int64_t pendingSeq = INT64_MAX - static_cast<int64_t>(changes_.newUnitOrder.size());
        for (const auto& id : changes_.newUnitOrder) {
            merged.insert_or_assign(id, std::make_pair(changes_.units.at(id).value.data(), pendingSeq++));
        }

        std::vector<std::pair<domain::InventoryUnitData, int64_t>> rows;
        for (auto& [id, row] : merged) {
            if (predicate(row.first)) {
                rows.push_back(row);
            }
        }
        std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
            return std::tie(a.first.createdAt.value, a.second) < std::tie(b.first.createdAt.value, b.second);
        });

        std::vector<domain::InventoryUnit> result;
        for (auto& row : rows) {
            result.push_back(domain::InventoryUnit::restore(row.first));
        }
        return result;
    }

    const InMemoryInventoryStore& store_;
    InMemoryChangeSet& changes_;
};

/**
 * @brief Единица работы поверх InMemoryInventoryStore
 *
 * Изменения копятся в InMemoryChangeSet и видны только этой единице работы.
 * commit() применяет их атомарно; без commit() они просто отбрасываются.
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(std::shared_ptr<InMemoryInventoryStore> store)
        : store_(std::move(store))
        , stockItems_(*store_, changes_)
        , stockMovements_(*store_, changes_)
        , stockLocations_(*store_, changes_)
        , stockTransfers_(*store_, changes_)
        , inventoryUnits_(*store_, changes_) {}

    ports::output::IStockItemRepository& stockItems() override { return stockItems_; }
    ports::output::IStockMovementRepository& stockMovements() override { return stockMovements_; }
    ports::output::IStockLocationRepository& stockLocations() override { return stockLocations_; }
    ports::output::IStockTransferRepository& stockTransfers() override { return stockTransfers_; }
    ports::output::IInventoryUnitRepository& inventoryUnits() override { return inventoryUnits_; }

    void commit() override {
        if (committed_) {
            throw std::logic_error("Unit of work already committed");
        }
        store_->apply(changes_);
        committed_ = true;
    }

private:
    std::shared_ptr<InMemoryInventoryStore> store_;
    InMemoryChangeSet changes_;
    bool committed_ = false;

    InMemoryStockItemRepository stockItems_;
    InMemoryStockMovementRepository stockMovements_;
    InMemoryStockLocationRepository stockLocations_;
    InMemoryStockTransferRepository stockTransfers_;
    InMemoryInventoryUnitRepository inventoryUnits_;
};

class InMemoryUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit InMemoryUnitOfWorkFactory(std::shared_ptr<InMemoryInventoryStore> store)
        : store_(std::move(store)) {}

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<InMemoryUnitOfWork>(store_);
    }

private:
    std::shared_ptr<InMemoryInventoryStore> store_;
};

} // namespace inventory::adapters::secondary
