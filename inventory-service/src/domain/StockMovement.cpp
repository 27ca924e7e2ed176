#include "domain/StockMovement.hpp"
#include "utils/UuidGenerator.hpp"

namespace inventory::domain {

Result<StockMovement> StockMovement::create(
    const std::string& stockItemId,
    int64_t quantity,
    MovementOriginator originator,
    MovementAction action,
    std::optional<std::string> reason,
    std::optional<std::string> stockTransferId)
{
    if (quantity == 0) {
        return Error::invalidQuantity("Movement quantity cannot be zero.");
    }

    StockMovement movement;
    movement.id = utils::UuidGenerator::generate();
    movement.stockItemId = stockItemId;
    movement.quantity = quantity;
    movement.originator = originator;
    movement.action = action;
    movement.reason = std::move(reason);
    movement.stockTransferId = std::move(stockTransferId);
    movement.createdAt = Timestamp::now();
    return movement;
}

} // namespace inventory::domain
