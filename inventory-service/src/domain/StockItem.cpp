#include "domain/StockItem.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <limits>

namespace inventory::domain {

Result<StockItem> StockItem::create(
    const std::string& variantId,
    const std::string& stockLocationId,
    const std::string& sku,
    int64_t quantityOnHand,
    int64_t quantityReserved,
    bool backorderable)
{
    if (quantityOnHand < 0 || quantityReserved < 0) {
        return Error::invalidQuantity("Stock quantities cannot be negative.");
    }

    StockItemData data;
    data.id = utils::UuidGenerator::generate();
    data.variantId = variantId;
    data.stockLocationId = stockLocationId;
    data.sku = sku;
    data.quantityOnHand = quantityOnHand;
    data.quantityReserved = quantityReserved;
    data.backorderable = backorderable;
    data.createdAt = Timestamp::now();
    data.updatedAt = data.createdAt;
    return StockItem(std::move(data));
}

StockItem StockItem::restore(StockItemData data) {
    return StockItem(std::move(data));
}

int64_t StockItem::countAvailable() const {
    return std::max<int64_t>(0, data_.quantityOnHand - data_.quantityReserved);
}

Result<StockMovement> StockItem::adjust(
    int64_t quantity,
    MovementOriginator originator,
    std::optional<std::string> reason,
    std::optional<std::string> stockTransferId)
{
    if (quantity == 0) {
        return Error::invalidQuantity("Adjustment quantity cannot be zero.");
    }
    if (quantity > 0 && quantity > std::numeric_limits<int64_t>::max() - data_.quantityOnHand) {
        return Error::invalidQuantity("Adjustment exceeds the maximum on-hand quantity.");
    }
    if (data_.quantityOnHand + quantity < 0) {
        return Error::insufficientStock();
    }

    auto movement = record(quantity, originator, MovementAction::ADJUSTMENT,
                           std::move(reason), std::move(stockTransferId));
    if (!movement) {
        return movement;
    }
    data_.quantityOnHand += quantity;
    return movement;
}

Result<StockMovement> StockItem::reserve(int64_t quantity, const std::optional<std::string>& orderId) {
    if (quantity <= 0) {
        return Error::invalidQuantity("Reserve quantity must be positive.");
    }
    if (quantity > std::numeric_limits<int64_t>::max() - data_.quantityReserved) {
        return Error::invalidQuantity("Reservation exceeds the maximum reserved quantity.");
    }
    if (!data_.backorderable && countAvailable() < quantity) {
        return Error::insufficientStock();
    }

    std::optional<std::string> reason;
    if (orderId) {
        reason = "Order " + *orderId;
    }
    auto movement = record(-quantity, MovementOriginator::ORDER, MovementAction::RESERVED, reason);
    if (!movement) {
        return movement;
    }
    data_.quantityReserved += quantity;
    return movement;
}

Result<StockMovement> StockItem::release(int64_t quantity, const std::string& orderId) {
    if (quantity <= 0) {
        return Error::invalidQuantity("Release quantity must be positive.");
    }
    if (quantity > data_.quantityReserved) {
        return Error(ErrorCode::INVALID_RELEASE, "Cannot release more quantity than is currently reserved.");
    }

    auto movement = record(quantity, MovementOriginator::ORDER, MovementAction::RELEASED,
                           "Order " + orderId + " canceled");
    if (!movement) {
        return movement;
    }
    data_.quantityReserved -= quantity;
    return movement;
}

Result<StockMovement> StockItem::confirmShipment(int64_t quantity, const std::string& shipmentId) {
    if (quantity <= 0) {
        return Error::invalidQuantity("Shipment quantity must be positive.");
    }
    if (quantity > data_.quantityReserved) {
        return Error(ErrorCode::INVALID_SHIPMENT, "Cannot ship more quantity than is currently reserved.");
    }
    // Бэкордерный резерв может опережать поступление, отгружать можно только наличие
    if (quantity > data_.quantityOnHand) {
        return Error::insufficientStock();
    }

    auto movement = record(-quantity, MovementOriginator::SHIPMENT, MovementAction::SOLD,
                           "Shipment " + shipmentId);
    if (!movement) {
        return movement;
    }
    data_.quantityReserved -= quantity;
    data_.quantityOnHand -= quantity;
    return movement;
}

Result<StockMovement> StockItem::correctReserved(int64_t newQuantityReserved, std::optional<std::string> reason) {
    if (newQuantityReserved < 0) {
        return Error::invalidQuantity("Reserved quantity cannot be negative.");
    }
    if (newQuantityReserved == data_.quantityReserved) {
        return Error::invalidQuantity("Reserved quantity is unchanged.");
    }
    if (!data_.backorderable && newQuantityReserved > data_.quantityOnHand) {
        return Error::insufficientStock();
    }

    const int64_t delta = newQuantityReserved - data_.quantityReserved;
    auto movement = record(-delta, MovementOriginator::RECOUNT, MovementAction::ADJUSTMENT,
                           reason ? std::move(reason) : std::optional<std::string>("Reserved quantity correction"));
    if (!movement) {
        return movement;
    }
    data_.quantityReserved = newQuantityReserved;
    return movement;
}

bool StockItem::updateDetails(const std::string& sku, bool backorderable) {
    if (data_.sku == sku && data_.backorderable == backorderable) {
        return false;
    }
    data_.sku = sku;
    data_.backorderable = backorderable;
    data_.updatedAt = Timestamp::now();
    return true;
}

void StockItem::markDeleted() {
    if (data_.deletedAt) {
        return;
    }
    data_.deletedAt = Timestamp::now();
    data_.updatedAt = *data_.deletedAt;
}

Result<StockMovement> StockItem::record(
    int64_t quantity,
    MovementOriginator originator,
    MovementAction action,
    std::optional<std::string> reason,
    std::optional<std::string> stockTransferId)
{
    auto movement = StockMovement::create(data_.id, quantity, originator, action,
                                          std::move(reason), std::move(stockTransferId));
    if (movement) {
        data_.updatedAt = movement->createdAt;
    }
    return movement;
}

} // namespace inventory::domain
