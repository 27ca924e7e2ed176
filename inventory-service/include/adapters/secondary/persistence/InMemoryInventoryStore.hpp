#pragma once

#include "adapters/secondary/persistence/InMemoryChangeSet.hpp"
#include "ports/output/PersistenceExceptions.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <functional>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief Единица товара вместе с порядковым номером вставки
 */
struct StoredUnit {
    domain::InventoryUnitData data;
    int64_t seq;
};

/**
 * @brief Зафиксированное состояние in-memory хранилища
 *
 * Таблицы лежат в ThreadSafeMap. Коммит берёт stateMutex_ эксклюзивно:
 * сначала проверяются версии и уникальность всего набора изменений,
 * затем он применяется целиком. Чтение берёт stateMutex_ разделяемо
 * и видит состояние до коммита или после, но не между строками.
 */
class InMemoryInventoryStore {
public:
    InMemoryInventoryStore() {
        std::cout << "[InMemoryInventoryStore] Created" << std::endl;
    }

    // =========================================================================
    // Чтение
    // =========================================================================

    std::optional<domain::StockItem> findItem(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto row = items_.find(id);
        if (!row) return std::nullopt;
        return domain::StockItem::restore(*row);
    }

    std::optional<std::string> findItemId(const std::string& variantId, const std::string& locationId) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto id = itemKeys_.find(itemKey(locationId, variantId));
        if (!id) return std::nullopt;
        return *id;
    }

    std::vector<domain::StockItem> itemsAtLocation(const std::string& locationId) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        std::vector<domain::StockItem> result;
        for (const auto& row : items_.findIf([&](const domain::StockItemData& d) {
                 return d.stockLocationId == locationId && !d.deletedAt;
             })) {
            result.push_back(domain::StockItem::restore(*row));
        }
        return result;
    }

    std::vector<domain::StockMovement> movementsForItem(const std::string& stockItemId) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto rows = movementsByItem_.find(stockItemId);
        return rows ? *rows : std::vector<domain::StockMovement>{};
    }

    std::vector<domain::StockMovement> movementsForTransfer(const std::string& transferId) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto rows = movementsByTransfer_.find(transferId);
        return rows ? *rows : std::vector<domain::StockMovement>{};
    }

    std::optional<domain::StockLocation> findLocation(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto row = locations_.find(id);
        if (!row) return std::nullopt;
        return *row;
    }

    std::vector<domain::StockLocation> allLocations() const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        std::vector<domain::StockLocation> result;
        for (const auto& row : locations_.getAll()) {
            result.push_back(*row);
        }
        return result;
    }

    std::optional<domain::StockTransfer> findTransfer(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto row = transfers_.find(id);
        if (!row) return std::nullopt;
        return *row;
    }

    std::optional<StoredUnit> findUnit(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto row = units_.find(id);
        if (!row) return std::nullopt;
        return *row;
    }

    std::vector<StoredUnit> unitsWhere(const std::function<bool(const domain::InventoryUnitData&)>& predicate) const {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        std::vector<StoredUnit> result;
        for (const auto& row : units_.findIf([&](const StoredUnit& u) { return predicate(u.data); })) {
            result.push_back(*row);
        }
        return result;
    }

    // =========================================================================
    // Коммит
    // =========================================================================

    /**
     * @throws ports::output::ConcurrencyException версия строки изменилась после чтения
     * @throws ports::output::DuplicateKeyException позиция варианта на складе уже есть
     */
    void apply(const InMemoryChangeSet& changes) {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        verify(changes);

        for (const auto& [id, row] : changes.items) {
            const auto& data = row.value.data();
            const std::string key = itemKey(data.stockLocationId, data.variantId);
            items_.insert(id, std::make_shared<domain::StockItemData>(data));
            if (data.deletedAt) {
                auto owner = itemKeys_.find(key);
                if (owner && *owner == id) {
                    itemKeys_.remove(key);
                }
            } else {
                itemKeys_.insert(key, std::make_shared<std::string>(id));
            }
        }

        for (const auto& movement : changes.movements) {
            appendTo(movementsByItem_, movement.stockItemId, movement);
            if (movement.stockTransferId) {
                appendTo(movementsByTransfer_, *movement.stockTransferId, movement);
            }
        }

        for (const auto& [id, row] : changes.locations) {
            locations_.insert(id, std::make_shared<domain::StockLocation>(row.value));
        }

        for (const auto& transfer : changes.transfers) {
            transfers_.insert(transfer.id, std::make_shared<domain::StockTransfer>(transfer));
            transferNumbers_.insert(transfer.number, std::make_shared<std::string>(transfer.id));
        }

        for (const auto& [id, row] : changes.units) {
            if (!row.isNew) {
                auto existing = units_.find(id);
                units_.insert(id, std::make_shared<StoredUnit>(StoredUnit{row.value.data(), existing->seq}));
            }
        }
        for (const auto& id : changes.newUnitOrder) {
            const auto& row = changes.units.at(id);
            units_.insert(id, std::make_shared<StoredUnit>(StoredUnit{row.value.data(), ++unitSeq_}));
        }
    }

    static std::string itemKey(const std::string& locationId, const std::string& variantId) {
        return locationId + "|" + variantId;
    }

private:
    void verify(const InMemoryChangeSet& changes) const {
        std::vector<std::string> newKeys;

        for (const auto& [id, row] : changes.items) {
            const auto& data = row.value.data();
            if (row.isNew) {
                if (items_.contains(id)) {
                    throw ports::output::DuplicateKeyException("Stock item id already exists: " + id);
                }
                const std::string key = itemKey(data.stockLocationId, data.variantId);
                if (!data.deletedAt) {
                    if (itemKeys_.contains(key) ||
                        std::find(newKeys.begin(), newKeys.end(), key) != newKeys.end()) {
                        throw ports::output::DuplicateKeyException(
                            "Stock item for variant '" + data.variantId + "' already exists in stock location '" +
                            data.stockLocationId + "'");
                    }
                    newKeys.push_back(key);
                }
                continue;
            }
            auto committed = items_.find(id);
            if (!committed || committed->version != row.expectedVersion) {
                throw ports::output::ConcurrencyException("Stock item " + id + " was modified concurrently");
            }
        }

        for (const auto& [id, row] : changes.locations) {
            if (row.isNew) {
                continue;
            }
            auto committed = locations_.find(id);
            if (!committed || committed->version != row.expectedVersion) {
                throw ports::output::ConcurrencyException("Stock location " + id + " was modified concurrently");
            }
        }

        for (const auto& transfer : changes.transfers) {
            if (transferNumbers_.contains(transfer.number)) {
                throw ports::output::DuplicateKeyException("Stock transfer number already used: " + transfer.number);
            }
        }

        for (const auto& [id, row] : changes.units) {
            if (row.isNew) {
                continue;
            }
            auto committed = units_.find(id);
            if (!committed || committed->data.version != row.expectedVersion) {
                throw ports::output::ConcurrencyException("Inventory unit " + id + " was modified concurrently");
            }
        }
    }

    static void appendTo(ThreadSafeMap<std::string, std::vector<domain::StockMovement>>& index,
                         const std::string& key, const domain::StockMovement& movement) {
        auto current = index.find(key);
        auto next = current ? std::make_shared<std::vector<domain::StockMovement>>(*current)
                            : std::make_shared<std::vector<domain::StockMovement>>();
        next->push_back(movement);
        index.insert(key, next);
    }

    mutable std::shared_mutex stateMutex_;
    int64_t unitSeq_ = 0;

    ThreadSafeMap<std::string, domain::StockItemData> items_;
    ThreadSafeMap<std::string, std::string> itemKeys_;          ///< "location|variant" -> id неудалённой позиции
    ThreadSafeMap<std::string, std::vector<domain::StockMovement>> movementsByItem_;
    ThreadSafeMap<std::string, std::vector<domain::StockMovement>> movementsByTransfer_;
    ThreadSafeMap<std::string, domain::StockLocation> locations_;
    ThreadSafeMap<std::string, domain::StockTransfer> transfers_;
    ThreadSafeMap<std::string, std::string> transferNumbers_;
    ThreadSafeMap<std::string, StoredUnit> units_;
};

} // namespace inventory::adapters::secondary
