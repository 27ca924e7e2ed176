#pragma once

#include "DomainEvent.hpp"
#include "EventTypes.hpp"
#include "domain/InventoryUnit.hpp"

namespace inventory::domain {

/**
 * @brief Смена состояния/склада единицы товара
 *
 * inventory_unit.created, .backorder_filled, .shipped, .returned,
 * .canceled, .location_assigned
 */
struct InventoryUnitEvent : public DomainEvent {
    std::string unitId;
    std::string variantId;
    std::string orderId;
    std::string lineItemId;
    int64_t quantity = 0;
    std::string state;
    std::optional<std::string> stockLocationId;
    std::optional<std::string> shipmentId;
    std::optional<std::string> returnItemId;

    InventoryUnitEvent(const std::string& type, const InventoryUnit& unit)
        : DomainEvent(type)
        , unitId(unit.id())
        , variantId(unit.variantId())
        , orderId(unit.orderId())
        , lineItemId(unit.lineItemId())
        , quantity(unit.quantity())
        , state(toString(unit.state()))
        , stockLocationId(unit.stockLocationId())
        , shipmentId(unit.shipmentId())
        , returnItemId(unit.returnItemId()) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<InventoryUnitEvent>(*this);
    }
};

/**
 * @brief Событие: inventory_unit.split
 */
struct InventoryUnitSplitEvent : public DomainEvent {
    std::string originalUnitId;
    std::string newUnitId;
    int64_t originalQuantity = 0;       ///< До разделения
    int64_t extractedQuantity = 0;
    int64_t remainingQuantity = 0;

    InventoryUnitSplitEvent(const InventoryUnit& original, const InventoryUnit& extracted);

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<InventoryUnitSplitEvent>(*this);
    }
};

} // namespace inventory::domain
