#pragma once

#include "application/EventDispatch.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/events/InventoryUnitEvents.hpp"
#include "ports/input/IInventoryUnitService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <functional>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Жизненный цикл единиц товара в заказах
 */
class InventoryUnitService : public ports::input::IInventoryUnitService {
public:
    InventoryUnitService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<RetryPolicy> retryPolicy)
        : uowFactory_(std::move(uowFactory))
        , eventPublisher_(std::move(eventPublisher))
        , retryPolicy_(std::move(retryPolicy))
    {
        std::cout << "[InventoryUnitService] Created" << std::endl;
    }

    domain::Result<domain::InventoryUnit> createUnit(const ports::input::CreateInventoryUnitRequest& request) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::InventoryUnit>("createUnit", [&]() -> domain::Result<domain::InventoryUnit> {
            events.clear();
            auto uow = uowFactory_->begin();

            if (request.stockLocationId) {
                auto location = uow->stockLocations().findById(*request.stockLocationId);
                if (!location || location->isDeleted()) {
                    return domain::Error::notFound("StockLocation", *request.stockLocationId);
                }
            }

            auto unit = domain::InventoryUnit::create(
                request.variantId, request.orderId, request.lineItemId, request.quantity,
                request.initialState, request.stockLocationId, request.shipmentId, request.serialNumber);
            if (!unit) {
                return unit;
            }
            uow->inventoryUnits().add(unit.value());
            events.push_back(std::make_unique<domain::InventoryUnitEvent>(domain::events::UNIT_CREATED, unit.value()));

            uow->commit();
            return unit;
        });

        if (result) {
            std::cout << "[InventoryUnitService] Created unit " << result->id() << " for order "
                      << request.orderId << " (" << domain::toString(result->state()) << ")" << std::endl;
            publishEvents(*eventPublisher_, events, "InventoryUnitService");
        }
        return result;
    }

    domain::Result<domain::InventoryUnit> fillBackorder(const std::string& unitId) override {
        return transition("fillBackorder", unitId, domain::events::UNIT_BACKORDER_FILLED,
                          [](domain::InventoryUnit& unit) { return unit.fillBackorder(); });
    }

    domain::Result<domain::InventoryUnit> ship(
        const std::string& unitId, const std::optional<std::string>& shipmentId = std::nullopt) override
    {
        return transition("ship", unitId, domain::events::UNIT_SHIPPED,
                          [&](domain::InventoryUnit& unit) { return unit.ship(shipmentId); });
    }

    domain::Result<domain::InventoryUnit> returnUnit(
        const std::string& unitId, const std::optional<std::string>& returnItemId = std::nullopt) override
    {
        return transition("return", unitId, domain::events::UNIT_RETURNED,
                          [&](domain::InventoryUnit& unit) { return unit.markReturned(returnItemId); });
    }

    domain::Result<domain::InventoryUnit> cancel(const std::string& unitId) override {
        return transition("cancel", unitId, domain::events::UNIT_CANCELED,
                          [](domain::InventoryUnit& unit) { return unit.cancel(); });
    }

    domain::Result<ports::input::SplitUnitResult> split(const std::string& unitId, int64_t extractQuantity) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<ports::input::SplitUnitResult>("split", [&]() -> domain::Result<ports::input::SplitUnitResult> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto unit = uow->inventoryUnits().findById(unitId);
            if (!unit) {
                return domain::Error::notFound("InventoryUnit", unitId);
            }

            auto extracted = unit->split(extractQuantity);
            if (!extracted) {
                return extracted.error();
            }
            uow->inventoryUnits().update(*unit);
            uow->inventoryUnits().add(extracted.value());
            events.push_back(std::make_unique<domain::InventoryUnitSplitEvent>(*unit, extracted.value()));

            uow->commit();
            return ports::input::SplitUnitResult{*unit, extracted.value()};
        });

        if (result) {
            std::cout << "[InventoryUnitService] Split unit " << unitId << ": "
                      << result->original.quantity() << " + " << result->extracted.quantity() << std::endl;
            publishEvents(*eventPublisher_, events, "InventoryUnitService");
        }
        return result;
    }

    domain::Result<domain::InventoryUnit> setStockLocation(
        const std::string& unitId, const std::string& stockLocationId) override
    {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::InventoryUnit>("setStockLocation", [&]() -> domain::Result<domain::InventoryUnit> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto unit = uow->inventoryUnits().findById(unitId);
            if (!unit) {
                return domain::Error::notFound("InventoryUnit", unitId);
            }
            auto location = uow->stockLocations().findById(stockLocationId);
            if (!location || location->isDeleted()) {
                return domain::Error::notFound("StockLocation", stockLocationId);
            }

            auto changed = unit->setStockLocation(stockLocationId);
            if (!changed) {
                return changed.error();
            }
            if (changed.value()) {
                uow->inventoryUnits().update(*unit);
                events.push_back(std::make_unique<domain::InventoryUnitEvent>(
                    domain::events::UNIT_LOCATION_ASSIGNED, *unit));
                uow->commit();
            }
            return *unit;
        });

        if (result) {
            publishEvents(*eventPublisher_, events, "InventoryUnitService");
        }
        return result;
    }

    domain::Result<domain::InventoryUnit> getUnit(const std::string& unitId) override {
        auto uow = uowFactory_->begin();
        auto unit = uow->inventoryUnits().findById(unitId);
        if (!unit) {
            return domain::Error::notFound("InventoryUnit", unitId);
        }
        return *unit;
    }

    std::vector<domain::InventoryUnit> getUnitsByOrder(const std::string& orderId) override {
        auto uow = uowFactory_->begin();
        return uow->inventoryUnits().findByOrder(orderId);
    }

    std::vector<domain::InventoryUnit> getBackorderedUnits(
        const std::string& variantId, const std::string& stockLocationId) override
    {
        auto uow = uowFactory_->begin();
        return uow->inventoryUnits().findBackordered(variantId, stockLocationId);
    }

private:
    using Transition = std::function<domain::Result<domain::Success>(domain::InventoryUnit&)>;

    /**
     * @brief Применить переход состояния
     *
     * Идемпотентный переход (состояние не изменилось) ничего не пишет и не публикует.
     */
    domain::Result<domain::InventoryUnit> transition(
        const std::string& operation, const std::string& unitId,
        const std::string& eventType, const Transition& apply)
    {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::InventoryUnit>(operation, [&]() -> domain::Result<domain::InventoryUnit> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto unit = uow->inventoryUnits().findById(unitId);
            if (!unit) {
                return domain::Error::notFound("InventoryUnit", unitId);
            }

            const auto before = unit->state();
            auto applied = apply(*unit);
            if (!applied) {
                return applied.error();
            }
            if (unit->state() != before) {
                uow->inventoryUnits().update(*unit);
                events.push_back(std::make_unique<domain::InventoryUnitEvent>(eventType, *unit));
                uow->commit();
            }
            return *unit;
        });

        if (result) {
            std::cout << "[InventoryUnitService] " << operation << " " << unitId << " -> "
                      << domain::toString(result->state()) << std::endl;
            publishEvents(*eventPublisher_, events, "InventoryUnitService");
        } else {
            std::cout << "[InventoryUnitService] " << operation << " " << unitId
                      << " rejected: " << result.error() << std::endl;
        }
        return result;
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<RetryPolicy> retryPolicy_;
};

} // namespace inventory::application
