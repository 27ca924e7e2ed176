#pragma once

#include "application/EventDispatch.hpp"
#include "application/NumberGenerator.hpp"
#include "application/RetryPolicy.hpp"
#include "application/StockLedger.hpp"
#include "domain/events/StockTransferEvents.hpp"
#include "ports/input/IStockTransferService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/InventorySettings.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Перемещения между складами и поступления от поставщиков
 *
 * Все строки документа обрабатываются в одной единице работы:
 * ошибка любой строки откатывает документ целиком.
 */
class StockTransferService : public ports::input::IStockTransferService {
public:
    StockTransferService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<NumberGenerator> numberGenerator,
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<RetryPolicy> retryPolicy,
        std::shared_ptr<settings::InventorySettings> settings)
        : uowFactory_(std::move(uowFactory))
        , numberGenerator_(std::move(numberGenerator))
        , ledger_(std::move(ledger))
        , eventPublisher_(std::move(eventPublisher))
        , retryPolicy_(std::move(retryPolicy))
        , settings_(std::move(settings))
    {
        std::cout << "[StockTransferService] Created (prefix=" << settings_->getTransferPrefix() << ")" << std::endl;
    }

    domain::Result<domain::StockTransfer> transfer(const ports::input::TransferRequest& request) override {
        auto lines = domain::StockTransfer::validateLines(request.variants);
        if (!lines) {
            return lines.error();
        }
        if (request.sourceLocationId == request.destinationLocationId) {
            return domain::Error(domain::ErrorCode::SOURCE_EQUALS_DESTINATION,
                                 "Source and destination locations must differ.");
        }

        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockTransfer>("transfer", [&]() -> domain::Result<domain::StockTransfer> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto source = findActiveLocation(*uow, request.sourceLocationId);
            if (!source) {
                return source.error();
            }
            auto destination = findActiveLocation(*uow, request.destinationLocationId);
            if (!destination) {
                return destination.error();
            }

            auto transfer = domain::StockTransfer::create(
                numberGenerator_->generate(settings_->getTransferPrefix()),
                request.sourceLocationId, request.destinationLocationId, request.reference);
            if (!transfer) {
                return transfer;
            }

            for (const auto& [variantId, quantity] : request.variants) {
                auto sourceItem = uow->stockItems().findByVariantAndLocation(variantId, request.sourceLocationId);
                if (!sourceItem) {
                    return domain::Error::notFound("StockItem", variantId + "@" + request.sourceLocationId);
                }

                auto unstocked = ledger_->adjust(*uow, *sourceItem, -quantity,
                                                 domain::MovementOriginator::STOCK_TRANSFER,
                                                 std::string("Unstock"), transfer->id, events);
                if (!unstocked) {
                    return unstocked.error();
                }

                auto destinationItem = ledger_->findOrCreate(*uow, variantId, request.destinationLocationId,
                                                             sourceItem->sku(), sourceItem->backorderable(), events);
                if (!destinationItem) {
                    return destinationItem.error();
                }

                auto restocked = ledger_->adjust(*uow, destinationItem.value(), quantity,
                                                 domain::MovementOriginator::STOCK_TRANSFER,
                                                 std::string("Restock"), transfer->id, events);
                if (!restocked) {
                    return restocked.error();
                }
            }

            uow->stockTransfers().add(transfer.value());
            events.push_back(std::make_unique<domain::StockTransferEvent>(
                domain::events::STOCK_TRANSFERRED, transfer.value(), request.variants));

            uow->commit();
            return transfer;
        });

        log("transfer", result);
        if (result) {
            publishEvents(*eventPublisher_, events, "StockTransferService");
        }
        return result;
    }

    domain::Result<domain::StockTransfer> receive(const ports::input::ReceiveRequest& request) override {
        auto lines = domain::StockTransfer::validateLines(request.variants);
        if (!lines) {
            return lines.error();
        }

        domain::DomainEvents events;
        auto result = retryPolicy_->execute<domain::StockTransfer>("receive", [&]() -> domain::Result<domain::StockTransfer> {
            events.clear();
            auto uow = uowFactory_->begin();

            auto destination = findActiveLocation(*uow, request.destinationLocationId);
            if (!destination) {
                return destination.error();
            }

            auto transfer = domain::StockTransfer::create(
                numberGenerator_->generate(settings_->getTransferPrefix()),
                std::nullopt, request.destinationLocationId, request.reference);
            if (!transfer) {
                return transfer;
            }

            for (const auto& [variantId, quantity] : request.variants) {
                auto item = ledger_->findOrCreate(*uow, variantId, request.destinationLocationId, "", true, events);
                if (!item) {
                    return item.error();
                }

                auto received = ledger_->adjust(*uow, item.value(), quantity,
                                                domain::MovementOriginator::SUPPLIER,
                                                std::string("Restock"), transfer->id, events);
                if (!received) {
                    return received.error();
                }
            }

            uow->stockTransfers().add(transfer.value());
            events.push_back(std::make_unique<domain::StockTransferEvent>(
                domain::events::STOCK_RECEIVED, transfer.value(), request.variants));

            uow->commit();
            return transfer;
        });

        log("receive", result);
        if (result) {
            publishEvents(*eventPublisher_, events, "StockTransferService");
        }
        return result;
    }

    domain::Result<domain::StockTransfer> getTransfer(const std::string& transferId) override {
        auto uow = uowFactory_->begin();
        auto transfer = uow->stockTransfers().findById(transferId);
        if (!transfer) {
            return domain::Error::notFound("StockTransfer", transferId);
        }
        return *transfer;
    }

    domain::Result<std::vector<domain::StockMovement>> getTransferMovements(const std::string& transferId) override {
        auto uow = uowFactory_->begin();
        if (!uow->stockTransfers().findById(transferId)) {
            return domain::Error::notFound("StockTransfer", transferId);
        }
        return uow->stockMovements().findByTransfer(transferId);
    }

private:
    static domain::Result<domain::StockLocation> findActiveLocation(
        ports::output::IUnitOfWork& uow, const std::string& locationId)
    {
        auto location = uow.stockLocations().findById(locationId);
        if (!location || location->isDeleted()) {
            return domain::Error::notFound("StockLocation", locationId);
        }
        return *location;
    }

    static void log(const std::string& operation, const domain::Result<domain::StockTransfer>& result) {
        if (result) {
            std::cout << "[StockTransferService] " << operation << " " << result->number
                      << " committed" << std::endl;
        } else {
            std::cout << "[StockTransferService] " << operation << " rejected: " << result.error() << std::endl;
        }
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<NumberGenerator> numberGenerator_;
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<RetryPolicy> retryPolicy_;
    std::shared_ptr<settings::InventorySettings> settings_;
};

} // namespace inventory::application
