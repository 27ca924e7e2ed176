#include "domain/events/StockTransferEvents.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

std::string StockTransferEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["stockTransferId"] = stockTransferId;
    j["number"] = number;
    j["sourceLocationId"] = sourceLocationId ? nlohmann::json(*sourceLocationId) : nlohmann::json(nullptr);
    j["destinationLocationId"] = destinationLocationId ? nlohmann::json(*destinationLocationId) : nlohmann::json(nullptr);
    j["reference"] = reference ? nlohmann::json(*reference) : nlohmann::json(nullptr);

    nlohmann::json lines = nlohmann::json::object();
    for (const auto& [variantId, quantity] : variantsByQuantity) {
        lines[variantId] = quantity;
    }
    j["variantsByQuantity"] = lines;
    return j.dump();
}

} // namespace inventory::domain
