#pragma once

#include "domain/InventoryUnit.hpp"
#include "domain/StockItem.hpp"
#include "domain/StockLocation.hpp"
#include "domain/StockMovement.hpp"
#include "domain/StockTransfer.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief Строка, изменённая в единице работы
 */
template <typename T>
struct StagedRow {
    T value;
    bool isNew;
    int64_t expectedVersion;    ///< Версия, прочитанная до изменения (0 для новых)
};

/**
 * @brief Буфер изменений единицы работы до коммита
 */
struct InMemoryChangeSet {
    std::map<std::string, StagedRow<domain::StockItem>> items;
    std::vector<domain::StockMovement> movements;
    std::map<std::string, StagedRow<domain::StockLocation>> locations;
    std::vector<domain::StockTransfer> transfers;
    std::map<std::string, StagedRow<domain::InventoryUnit>> units;
    std::vector<std::string> newUnitOrder;      ///< Порядок добавления новых единиц (FIFO)

    bool empty() const {
        return items.empty() && movements.empty() && locations.empty() &&
               transfers.empty() && units.empty();
    }
};

} // namespace inventory::adapters::secondary
