#pragma once

#include "DomainEvent.hpp"
#include "EventTypes.hpp"
#include "domain/StockLocation.hpp"

namespace inventory::domain {

/**
 * @brief Событие склада: created, updated, deleted, restored, made_default
 */
struct StockLocationEvent : public DomainEvent {
    std::string stockLocationId;
    std::string name;
    bool active = true;
    bool isDefault = false;

    StockLocationEvent(const std::string& type, const StockLocation& location)
        : DomainEvent(type)
        , stockLocationId(location.id)
        , name(location.name)
        , active(location.active)
        , isDefault(location.isDefault) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<StockLocationEvent>(*this);
    }
};

} // namespace inventory::domain
