#pragma once

#include "application/EventDispatch.hpp"
#include "application/RetryPolicy.hpp"
#include "application/StockLedger.hpp"
#include "domain/events/StockItemEvents.hpp"
#include "ports/input/IStockItemService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <functional>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис остатков складской позиции
 *
 * Каждая мутирующая операция:
 * 1. открывает единицу работы и читает позицию
 * 2. вызывает метод агрегата (бизнес-ошибки возвращаются как есть)
 * 3. сохраняет позицию и движение, коммитит
 * 4. после коммита публикует события
 * При конфликте версий шаги 1-3 повторяются.
 */
class StockItemService : public ports::input::IStockItemService {
public:
    StockItemService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<RetryPolicy> retryPolicy)
        : uowFactory_(std::move(uowFactory))
        , ledger_(std::move(ledger))
        , eventPublisher_(std::move(eventPublisher))
        , retryPolicy_(std::move(retryPolicy))
    {
        std::cout << "[StockItemService] Created" << std::endl;
    }

    domain::Result<domain::StockItem> createStockItem(const ports::input::CreateStockItemRequest& request) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockItem>("createStockItem", [&]() -> domain::Result<domain::StockItem> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto location = StockLedger::claimLocation(*uow, request.stockLocationId);
            if (!location) {
                return location.error();
            }
            if (uow->stockItems().findByVariantAndLocation(request.variantId, request.stockLocationId)) {
                return duplicateSku(request.sku, request.stockLocationId);
            }

            auto item = domain::StockItem::create(request.variantId, request.stockLocationId, request.sku,
                                                  request.quantityOnHand, request.quantityReserved,
                                                  request.backorderable);
            if (!item) {
                return item;
            }
            uow->stockItems().add(item.value());
            events.push_back(std::make_unique<domain::StockItemLifecycleEvent>(
                domain::events::STOCK_ITEM_CREATED, item.value()));

            uow->commit();
            return item;
        });

        if (result) {
            std::cout << "[StockItemService] Created stock item " << result->id() << " (variant "
                      << request.variantId << " at " << request.stockLocationId << ")" << std::endl;
            publishEvents(*eventPublisher_, events, "StockItemService");
        } else if (result.error().code == domain::ErrorCode::DUPLICATE_SKU) {
            return duplicateSku(request.sku, request.stockLocationId);
        }
        return result;
    }

    domain::Result<domain::StockItem> adjust(const ports::input::AdjustStockRequest& request) override {
        return mutate("adjust", request.stockItemId,
            [&](ports::output::IUnitOfWork& uow, domain::StockItem& item, domain::DomainEvents& events)
                -> domain::Result<domain::Success> {
                auto movement = ledger_->adjust(uow, item, request.quantity, request.originator,
                                                request.reason, request.stockTransferId, events);
                if (!movement) {
                    return movement.error();
                }
                return domain::Success{};
            });
    }

    domain::Result<domain::StockItem> reserve(
        const std::string& stockItemId, int64_t quantity,
        const std::optional<std::string>& orderId = std::nullopt) override
    {
        return mutate("reserve", stockItemId,
            [&](ports::output::IUnitOfWork& uow, domain::StockItem& item, domain::DomainEvents& events)
                -> domain::Result<domain::Success> {
                auto movement = item.reserve(quantity, orderId);
                if (!movement) {
                    return movement.error();
                }
                ledger_->record(uow, item, movement.value(), domain::events::STOCK_RESERVED, events);
                return domain::Success{};
            });
    }

    domain::Result<domain::StockItem> release(
        const std::string& stockItemId, int64_t quantity, const std::string& orderId) override
    {
        return mutate("release", stockItemId,
            [&](ports::output::IUnitOfWork& uow, domain::StockItem& item, domain::DomainEvents& events)
                -> domain::Result<domain::Success> {
                auto movement = item.release(quantity, orderId);
                if (!movement) {
                    return movement.error();
                }
                ledger_->record(uow, item, movement.value(), domain::events::STOCK_RELEASED, events);
                return domain::Success{};
            });
    }

    domain::Result<domain::StockItem> confirmShipment(
        const std::string& stockItemId, int64_t quantity, const std::string& shipmentId) override
    {
        return mutate("confirmShipment", stockItemId,
            [&](ports::output::IUnitOfWork& uow, domain::StockItem& item, domain::DomainEvents& events)
                -> domain::Result<domain::Success> {
                auto movement = item.confirmShipment(quantity, shipmentId);
                if (!movement) {
                    return movement.error();
                }
                ledger_->record(uow, item, movement.value(), domain::events::STOCK_SHIPPED, events);
                return domain::Success{};
            });
    }

    domain::Result<domain::StockItem> correctReserved(
        const std::string& stockItemId, int64_t newQuantityReserved,
        const std::optional<std::string>& reason) override
    {
        return mutate("correctReserved", stockItemId,
            [&](ports::output::IUnitOfWork& uow, domain::StockItem& item, domain::DomainEvents& events)
                -> domain::Result<domain::Success> {
                auto movement = item.correctReserved(newQuantityReserved, reason);
                if (!movement) {
                    return movement.error();
                }
                ledger_->record(uow, item, movement.value(), domain::events::STOCK_RESERVATION_CORRECTED, events);
                return domain::Success{};
            });
    }

    domain::Result<domain::StockItem> updateDetails(
        const std::string& stockItemId, const std::string& sku, bool backorderable) override
    {
        return mutate("updateDetails", stockItemId,
            [&](ports::output::IUnitOfWork& uow, domain::StockItem& item, domain::DomainEvents&)
                -> domain::Result<domain::Success> {
                if (item.updateDetails(sku, backorderable)) {
                    uow.stockItems().update(item);
                }
                return domain::Success{};
            });
    }

    domain::Result<domain::Success> deleteStockItem(const std::string& stockItemId) override {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::Success>("deleteStockItem", [&]() -> domain::Result<domain::Success> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto item = uow->stockItems().findById(stockItemId);
            if (!item || item->isDeleted()) {
                return domain::Error::notFound("StockItem", stockItemId);
            }
            if (item->quantityReserved() > 0) {
                return domain::Error(domain::ErrorCode::HAS_RESERVED_STOCK,
                                     "Cannot delete a stock item with reserved stock.");
            }
            if (item->quantityOnHand() > 0) {
                return domain::Error(domain::ErrorCode::HAS_STOCK_ITEMS,
                                     "Cannot delete a stock item that still holds stock.");
            }

            item->markDeleted();
            uow->stockItems().update(*item);
            events.push_back(std::make_unique<domain::StockItemLifecycleEvent>(
                domain::events::STOCK_ITEM_DELETED, *item));

            uow->commit();
            return domain::Success{};
        });

        if (result) {
            std::cout << "[StockItemService] Deleted stock item " << stockItemId << std::endl;
            publishEvents(*eventPublisher_, events, "StockItemService");
        }
        return result;
    }

    domain::Result<domain::StockItem> getStockItem(const std::string& stockItemId) override {
        auto uow = uowFactory_->begin();
        auto item = uow->stockItems().findById(stockItemId);
        if (!item || item->isDeleted()) {
            return domain::Error::notFound("StockItem", stockItemId);
        }
        return *item;
    }

    domain::Result<domain::StockItem> findStockItem(
        const std::string& variantId, const std::string& stockLocationId) override
    {
        auto uow = uowFactory_->begin();
        auto item = uow->stockItems().findByVariantAndLocation(variantId, stockLocationId);
        if (!item) {
            return domain::Error::notFound("StockItem", variantId + "@" + stockLocationId);
        }
        return *item;
    }

    domain::Result<std::vector<domain::StockMovement>> getMovements(const std::string& stockItemId) override {
        auto uow = uowFactory_->begin();
        if (!uow->stockItems().findById(stockItemId)) {
            return domain::Error::notFound("StockItem", stockItemId);
        }
        return uow->stockMovements().findByStockItem(stockItemId);
    }

private:
    using Mutation = std::function<domain::Result<domain::Success>(
        ports::output::IUnitOfWork&, domain::StockItem&, domain::DomainEvents&)>;

    /// Прочитать позицию, применить изменение, закоммитить, опубликовать
    domain::Result<domain::StockItem> mutate(
        const std::string& operation, const std::string& stockItemId, const Mutation& mutation)
    {
        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockItem>(operation, [&]() -> domain::Result<domain::StockItem> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto item = uow->stockItems().findById(stockItemId);
            if (!item || item->isDeleted()) {
                return domain::Error::notFound("StockItem", stockItemId);
            }

            auto applied = mutation(*uow, *item, events);
            if (!applied) {
                return applied.error();
            }

            uow->commit();
            return *item;
        });

        if (result) {
            std::cout << "[StockItemService] " << operation << " " << stockItemId
                      << ": onHand=" << result->quantityOnHand()
                      << " reserved=" << result->quantityReserved() << std::endl;
            publishEvents(*eventPublisher_, events, "StockItemService");
        } else {
            std::cout << "[StockItemService] " << operation << " " << stockItemId
                      << " rejected: " << result.error() << std::endl;
        }
        return result;
    }

    static domain::Error duplicateSku(const std::string& sku, const std::string& stockLocationId) {
        return domain::Error(domain::ErrorCode::DUPLICATE_SKU,
                             "Stock item with SKU '" + sku + "' already exists in stock location '" +
                             stockLocationId + "'.");
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<RetryPolicy> retryPolicy_;
};

} // namespace inventory::application
