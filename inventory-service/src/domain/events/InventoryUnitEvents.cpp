#include "domain/events/InventoryUnitEvents.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

std::string InventoryUnitEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["unitId"] = unitId;
    j["variantId"] = variantId;
    j["orderId"] = orderId;
    j["lineItemId"] = lineItemId;
    j["quantity"] = quantity;
    j["state"] = state;
    j["stockLocationId"] = optionalString(stockLocationId);
    j["shipmentId"] = optionalString(shipmentId);
    j["returnItemId"] = optionalString(returnItemId);
    return j.dump();
}

InventoryUnitSplitEvent::InventoryUnitSplitEvent(const InventoryUnit& original, const InventoryUnit& extracted)
    : DomainEvent(events::UNIT_SPLIT)
    , originalUnitId(original.id())
    , newUnitId(extracted.id())
    , originalQuantity(original.quantity() + extracted.quantity())
    , extractedQuantity(extracted.quantity())
    , remainingQuantity(original.quantity())
{
}

std::string InventoryUnitSplitEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["originalUnitId"] = originalUnitId;
    j["newUnitId"] = newUnitId;
    j["originalQuantity"] = originalQuantity;
    j["extractedQuantity"] = extractedQuantity;
    j["remainingQuantity"] = remainingQuantity;
    return j.dump();
}

} // namespace inventory::domain
