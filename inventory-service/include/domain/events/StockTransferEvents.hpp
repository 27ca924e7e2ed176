#pragma once

#include "DomainEvent.hpp"
#include "EventTypes.hpp"
#include "domain/StockTransfer.hpp"

namespace inventory::domain {

/**
 * @brief Событие: stock_transfer.transferred / stock_transfer.received
 */
struct StockTransferEvent : public DomainEvent {
    std::string stockTransferId;
    std::string number;
    std::optional<std::string> sourceLocationId;
    std::optional<std::string> destinationLocationId;
    std::optional<std::string> reference;
    VariantQuantities variantsByQuantity;

    StockTransferEvent(const std::string& type, const StockTransfer& transfer, VariantQuantities lines)
        : DomainEvent(type)
        , stockTransferId(transfer.id)
        , number(transfer.number)
        , sourceLocationId(transfer.sourceLocationId)
        , destinationLocationId(transfer.destinationLocationId)
        , reference(transfer.reference)
        , variantsByQuantity(std::move(lines)) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<StockTransferEvent>(*this);
    }
};

} // namespace inventory::domain
