#include "domain/InventoryUnit.hpp"
#include "utils/UuidGenerator.hpp"

namespace inventory::domain {

Result<InventoryUnit> InventoryUnit::create(
    const std::string& variantId,
    const std::string& orderId,
    const std::string& lineItemId,
    int64_t quantity,
    InventoryUnitState initialState,
    std::optional<std::string> stockLocationId,
    std::optional<std::string> shipmentId,
    std::optional<std::string> serialNumber)
{
    if (quantity < 1) {
        return Error::invalidQuantity("Inventory unit quantity must be at least 1.");
    }
    if (initialState != InventoryUnitState::ON_HAND && initialState != InventoryUnitState::BACKORDERED) {
        return Error(ErrorCode::INVALID_STATE_TRANSITION,
                     "Inventory unit cannot be created in state " + toString(initialState) + ".");
    }

    InventoryUnitData data;
    data.id = utils::UuidGenerator::generate();
    data.variantId = variantId;
    data.orderId = orderId;
    data.lineItemId = lineItemId;
    data.quantity = quantity;
    data.state = initialState;
    data.stockLocationId = std::move(stockLocationId);
    data.shipmentId = std::move(shipmentId);
    data.serialNumber = std::move(serialNumber);
    data.createdAt = Timestamp::now();
    data.updatedAt = data.createdAt;
    data.stateChangedAt = data.createdAt;
    return InventoryUnit(std::move(data));
}

InventoryUnit InventoryUnit::restore(InventoryUnitData data) {
    return InventoryUnit(std::move(data));
}

Result<Success> InventoryUnit::fillBackorder() {
    if (data_.state == InventoryUnitState::ON_HAND) {
        return Success{};
    }
    if (data_.state != InventoryUnitState::BACKORDERED) {
        return Error::invalidTransition(toString(data_.state), "fill backorder for");
    }
    transitionTo(InventoryUnitState::ON_HAND);
    return Success{};
}

Result<Success> InventoryUnit::ship(const std::optional<std::string>& shipmentId) {
    if (data_.state == InventoryUnitState::BACKORDERED) {
        return Error(ErrorCode::CANNOT_SHIP_FROM_BACKORDERED, "Cannot ship a backordered inventory unit.");
    }
    if (data_.state != InventoryUnitState::ON_HAND) {
        return Error::invalidTransition(toString(data_.state), "ship");
    }
    if (shipmentId) {
        data_.shipmentId = shipmentId;
    }
    transitionTo(InventoryUnitState::SHIPPED);
    return Success{};
}

Result<Success> InventoryUnit::markReturned(const std::optional<std::string>& returnItemId) {
    if (data_.state == InventoryUnitState::RETURNED) {
        return Success{};
    }
    if (data_.state != InventoryUnitState::SHIPPED) {
        return Error(ErrorCode::CANNOT_RETURN_FROM_NON_SHIPPED, "Only shipped inventory units can be returned.");
    }
    if (returnItemId) {
        data_.returnItemId = returnItemId;
    }
    transitionTo(InventoryUnitState::RETURNED);
    return Success{};
}

Result<Success> InventoryUnit::cancel() {
    if (data_.state == InventoryUnitState::CANCELED) {
        return Success{};
    }
    if (data_.state != InventoryUnitState::ON_HAND && data_.state != InventoryUnitState::BACKORDERED) {
        return Error::invalidTransition(toString(data_.state), "cancel");
    }
    transitionTo(InventoryUnitState::CANCELED);
    return Success{};
}

Result<InventoryUnit> InventoryUnit::split(int64_t extractQuantity) {
    if (!canBeSplit()) {
        return Error(ErrorCode::CANNOT_SPLIT_IN_TERMINAL_STATE,
                     "Cannot split an inventory unit in state " + toString(data_.state) + ".");
    }
    if (extractQuantity <= 0 || extractQuantity >= data_.quantity) {
        return Error(ErrorCode::INVALID_SPLIT_QUANTITY,
                     "Split quantity must be between 1 and " + std::to_string(data_.quantity - 1) + ".");
    }

    InventoryUnitData extracted;
    extracted.id = utils::UuidGenerator::generate();
    extracted.variantId = data_.variantId;
    extracted.orderId = data_.orderId;
    extracted.lineItemId = data_.lineItemId;
    extracted.quantity = extractQuantity;
    extracted.state = data_.state;
    extracted.stockLocationId = data_.stockLocationId;
    extracted.shipmentId = data_.shipmentId;
    extracted.createdAt = Timestamp::now();
    extracted.updatedAt = extracted.createdAt;
    extracted.stateChangedAt = extracted.createdAt;

    data_.quantity -= extractQuantity;
    data_.updatedAt = extracted.createdAt;
    return InventoryUnit(std::move(extracted));
}

Result<bool> InventoryUnit::setStockLocation(const std::string& stockLocationId) {
    if (isInTerminalState()) {
        return Error::invalidTransition(toString(data_.state), "relocate");
    }
    if (data_.stockLocationId == stockLocationId) {
        return false;
    }
    data_.stockLocationId = stockLocationId;
    data_.updatedAt = Timestamp::now();
    return true;
}

void InventoryUnit::transitionTo(InventoryUnitState state) {
    data_.state = state;
    data_.stateChangedAt = Timestamp::now();
    data_.updatedAt = data_.stateChangedAt;
}

} // namespace inventory::domain
