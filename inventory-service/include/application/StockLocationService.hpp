#pragma once

#include "application/EventDispatch.hpp"
#include "application/RetryPolicy.hpp"
#include "application/StockLedger.hpp"
#include "domain/events/StockItemEvents.hpp"
#include "domain/events/StockLocationEvents.hpp"
#include "ports/input/IStockLocationService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Управление складами и массовое изменение остатков по складу
 */
class StockLocationService : public ports::input::IStockLocationService {
public:
    StockLocationService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<RetryPolicy> retryPolicy)
        : uowFactory_(std::move(uowFactory))
        , ledger_(std::move(ledger))
        , eventPublisher_(std::move(eventPublisher))
        , retryPolicy_(std::move(retryPolicy))
    {
        std::cout << "[StockLocationService] Created" << std::endl;
    }

    domain::Result<domain::StockLocation> createLocation(const ports::input::CreateStockLocationRequest& request) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockLocation>("createLocation", [&]() -> domain::Result<domain::StockLocation> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto location = domain::StockLocation::create(request.name, request.presentation,
                                                          request.active, request.isDefault, request.address);
            if (!location) {
                return location;
            }
            if (location->isDefault) {
                clearCurrentDefault(*uow, location->id);
            }
            uow->stockLocations().add(location.value());
            events.push_back(std::make_unique<domain::StockLocationEvent>(domain::events::LOCATION_CREATED, location.value()));

            uow->commit();
            return location;
        });

        if (result) {
            std::cout << "[StockLocationService] Created location " << result->id << " '" << result->name << "'" << std::endl;
            publishEvents(*eventPublisher_, events, "StockLocationService");
        }
        return result;
    }

    domain::Result<domain::StockLocation> updateLocation(
        const std::string& locationId, const domain::StockLocationUpdate& changes) override
    {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockLocation>("updateLocation", [&]() -> domain::Result<domain::StockLocation> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto location = uow->stockLocations().findById(locationId);
            if (!location || location->isDeleted()) {
                return domain::Error::notFound("StockLocation", locationId);
            }

            auto changed = location->update(changes);
            if (!changed) {
                return changed.error();
            }
            if (changed.value()) {
                uow->stockLocations().update(*location);
                events.push_back(std::make_unique<domain::StockLocationEvent>(domain::events::LOCATION_UPDATED, *location));
                uow->commit();
            }
            return *location;
        });

        if (result) {
            publishEvents(*eventPublisher_, events, "StockLocationService");
        }
        return result;
    }

    domain::Result<domain::StockLocation> makeDefault(const std::string& locationId) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockLocation>("makeDefault", [&]() -> domain::Result<domain::StockLocation> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto location = uow->stockLocations().findById(locationId);
            if (!location || location->isDeleted()) {
                return domain::Error::notFound("StockLocation", locationId);
            }
            if (!location->makeDefault()) {
                return *location;
            }

            clearCurrentDefault(*uow, locationId);
            uow->stockLocations().update(*location);
            events.push_back(std::make_unique<domain::StockLocationEvent>(domain::events::LOCATION_MADE_DEFAULT, *location));

            uow->commit();
            return *location;
        });

        if (result) {
            std::cout << "[StockLocationService] Default location is now " << locationId << std::endl;
            publishEvents(*eventPublisher_, events, "StockLocationService");
        }
        return result;
    }

    domain::Result<domain::Success> deleteLocation(const std::string& locationId) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::Success>("deleteLocation", [&]() -> domain::Result<domain::Success> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto location = uow->stockLocations().findById(locationId);
            if (!location || location->isDeleted()) {
                return domain::Error::notFound("StockLocation", locationId);
            }

            auto items = uow->stockItems().findByLocation(locationId);
            auto deletable = domain::StockLocation::checkDeletable(items);
            if (!deletable) {
                return deletable.error();
            }

            for (auto& item : items) {
                item.markDeleted();
                uow->stockItems().update(item);
                events.push_back(std::make_unique<domain::StockItemLifecycleEvent>(domain::events::STOCK_ITEM_DELETED, item));
            }

            location->markDeleted();
            uow->stockLocations().update(*location);
            events.push_back(std::make_unique<domain::StockLocationEvent>(domain::events::LOCATION_DELETED, *location));

            uow->commit();
            return domain::Success{};
        });

        if (result) {
            std::cout << "[StockLocationService] Deleted location " << locationId << std::endl;
            publishEvents(*eventPublisher_, events, "StockLocationService");
        } else {
            std::cout << "[StockLocationService] Delete of " << locationId << " rejected: " << result.error() << std::endl;
        }
        return result;
    }

    domain::Result<domain::StockLocation> restoreLocation(const std::string& locationId) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockLocation>("restoreLocation", [&]() -> domain::Result<domain::StockLocation> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto location = uow->stockLocations().findById(locationId);
            if (!location) {
                return domain::Error::notFound("StockLocation", locationId);
            }
            if (location->restore()) {
                uow->stockLocations().update(*location);
                events.push_back(std::make_unique<domain::StockLocationEvent>(domain::events::LOCATION_RESTORED, *location));
                uow->commit();
            }
            return *location;
        });

        if (result) {
            publishEvents(*eventPublisher_, events, "StockLocationService");
        }
        return result;
    }

    domain::Result<std::vector<domain::StockItem>> restock(const ports::input::StockLevelChangeRequest& request) override {
        return changeLevels("restock", request, 1);
    }

    domain::Result<std::vector<domain::StockItem>> unstock(const ports::input::StockLevelChangeRequest& request) override {
        return changeLevels("unstock", request, -1);
    }

    domain::Result<domain::StockLocation> getLocation(const std::string& locationId) override {
        auto uow = uowFactory_->begin();
        auto location = uow->stockLocations().findById(locationId);
        if (!location || location->isDeleted()) {
            return domain::Error::notFound("StockLocation", locationId);
        }
        return *location;
    }

    std::vector<domain::StockLocation> getLocations() override {
        auto uow = uowFactory_->begin();
        return uow->stockLocations().findAll();
    }

    domain::Result<domain::StockLocation> getDefaultLocation() override {
        auto uow = uowFactory_->begin();
        auto location = uow->stockLocations().findDefault();
        if (!location) {
            return domain::Error::notFound("StockLocation", "default");
        }
        return *location;
    }

    domain::Result<std::vector<domain::StockItem>> getStockItems(const std::string& locationId) override {
        auto uow = uowFactory_->begin();
        auto location = uow->stockLocations().findById(locationId);
        if (!location || location->isDeleted()) {
            return domain::Error::notFound("StockLocation", locationId);
        }
        return uow->stockItems().findByLocation(locationId);
    }

private:
    /// Снять признак основного со всех прочих складов
    static void clearCurrentDefault(ports::output::IUnitOfWork& uow, const std::string& exceptId) {
        auto current = uow.stockLocations().findDefault();
        if (current && current->id != exceptId && current->clearDefault()) {
            uow.stockLocations().update(*current);
        }
    }

    /**
     * @param sign 1 для поступления, -1 для списания
     */
    domain::Result<std::vector<domain::StockItem>> changeLevels(
        const std::string& operation, const ports::input::StockLevelChangeRequest& request, int sign)
    {
        auto lines = domain::StockTransfer::validateLines(request.variants);
        if (!lines) {
            return lines.error();
        }
        const std::optional<std::string> reason =
            request.reason ? request.reason : std::optional<std::string>(sign > 0 ? "Restock" : "Unstock");

        domain::DomainEvents events;
        auto result = retryPolicy_->execute<std::vector<domain::StockItem>>(operation,
            [&]() -> domain::Result<std::vector<domain::StockItem>> {
                events.clear();
                auto uow = uowFactory_->begin();

                auto location = uow->stockLocations().findById(request.stockLocationId);
                if (!location || location->isDeleted()) {
                    return domain::Error::notFound("StockLocation", request.stockLocationId);
                }

                std::vector<domain::StockItem> touched;
                for (const auto& [variantId, quantity] : request.variants) {
                    domain::Result<domain::StockItem> item = sign > 0
                        ? ledger_->findOrCreate(*uow, variantId, request.stockLocationId, "", true, events)
                        : findExisting(*uow, variantId, request.stockLocationId);
                    if (!item) {
                        return item.error();
                    }

                    auto movement = ledger_->adjust(*uow, item.value(), sign * quantity, request.originator,
                                                    reason, std::nullopt, events);
                    if (!movement) {
                        return movement.error();
                    }
                    touched.push_back(item.value());
                }

                uow->commit();
                return touched;
            });

        if (result) {
            std::cout << "[StockLocationService] " << operation << " at " << request.stockLocationId
                      << ": " << result->size() << " item(s)" << std::endl;
            publishEvents(*eventPublisher_, events, "StockLocationService");
        } else {
            std::cout << "[StockLocationService] " << operation << " at " << request.stockLocationId
                      << " rejected: " << result.error() << std::endl;
        }
        return result;
    }

    static domain::Result<domain::StockItem> findExisting(
        ports::output::IUnitOfWork& uow, const std::string& variantId, const std::string& locationId)
    {
        auto item = uow.stockItems().findByVariantAndLocation(variantId, locationId);
        if (!item) {
            return domain::Error::notFound("StockItem", variantId + "@" + locationId);
        }
        return *item;
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<RetryPolicy> retryPolicy_;
};

} // namespace inventory::application
