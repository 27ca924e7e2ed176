#pragma once

#include "DomainEvent.hpp"
#include "EventTypes.hpp"
#include "domain/StockItem.hpp"
#include "domain/StockMovement.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Событие жизненного цикла позиции: stock_item.created / stock_item.deleted
 */
struct StockItemLifecycleEvent : public DomainEvent {
    std::string stockItemId;
    std::string variantId;
    std::string stockLocationId;
    std::string sku;

    StockItemLifecycleEvent(const std::string& type, const StockItem& item)
        : DomainEvent(type)
        , stockItemId(item.id())
        , variantId(item.variantId())
        , stockLocationId(item.stockLocationId())
        , sku(item.sku()) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<StockItemLifecycleEvent>(*this);
    }
};

/**
 * @brief Количественное событие позиции
 *
 * stock.adjusted, stock.reserved, stock.released, stock.shipped,
 * stock.reservation_corrected. Несёт итоговые остатки после операции.
 */
struct StockQuantityEvent : public DomainEvent {
    std::string stockItemId;
    std::string variantId;
    std::string stockLocationId;
    std::string movementId;
    int64_t quantity = 0;               ///< Знаковое количество движения
    std::string originator;
    std::optional<std::string> reason;
    std::optional<std::string> stockTransferId;
    int64_t quantityOnHand = 0;
    int64_t quantityReserved = 0;
    int64_t countAvailable = 0;

    StockQuantityEvent(const std::string& type, const StockItem& item, const StockMovement& movement)
        : DomainEvent(type)
        , stockItemId(item.id())
        , variantId(item.variantId())
        , stockLocationId(item.stockLocationId())
        , movementId(movement.id)
        , quantity(movement.quantity)
        , originator(toString(movement.originator))
        , reason(movement.reason)
        , stockTransferId(movement.stockTransferId)
        , quantityOnHand(item.quantityOnHand())
        , quantityReserved(item.quantityReserved())
        , countAvailable(item.countAvailable()) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<StockQuantityEvent>(*this);
    }
};

} // namespace inventory::domain
