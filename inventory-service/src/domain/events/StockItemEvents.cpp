#include "domain/events/StockItemEvents.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

std::string StockItemLifecycleEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["stockItemId"] = stockItemId;
    j["variantId"] = variantId;
    j["stockLocationId"] = stockLocationId;
    j["sku"] = sku;
    return j.dump();
}

std::string StockQuantityEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["stockItemId"] = stockItemId;
    j["variantId"] = variantId;
    j["stockLocationId"] = stockLocationId;
    j["movementId"] = movementId;
    j["quantity"] = quantity;
    j["originator"] = originator;
    j["reason"] = optionalString(reason);
    j["stockTransferId"] = optionalString(stockTransferId);
    j["quantityOnHand"] = quantityOnHand;
    j["quantityReserved"] = quantityReserved;
    j["countAvailable"] = countAvailable;
    return j.dump();
}

} // namespace inventory::domain
