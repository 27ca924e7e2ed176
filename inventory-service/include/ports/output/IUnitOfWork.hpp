#pragma once

#include "ports/output/IInventoryUnitRepository.hpp"
#include "ports/output/IStockItemRepository.hpp"
#include "ports/output/IStockLocationRepository.hpp"
#include "ports/output/IStockMovementRepository.hpp"
#include "ports/output/IStockTransferRepository.hpp"
#include <memory>

namespace inventory::ports::output {

/**
 * @brief Граница транзакции
 *
 * Все изменения агрегатов, движения и документы перемещения
 * фиксируются вместе при commit() либо не фиксируются вовсе.
 * Объект, разрушенный без commit(), откатывается.
 *
 * commit() бросает ConcurrencyException при несовпадении версий
 * и DuplicateKeyException при нарушении уникальности.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IStockItemRepository& stockItems() = 0;
    virtual IStockMovementRepository& stockMovements() = 0;
    virtual IStockLocationRepository& stockLocations() = 0;
    virtual IStockTransferRepository& stockTransfers() = 0;
    virtual IInventoryUnitRepository& inventoryUnits() = 0;

    virtual void commit() = 0;
};

/**
 * @brief Фабрика единиц работы
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace inventory::ports::output
