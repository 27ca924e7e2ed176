#include "domain/events/StockLocationEvents.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

std::string StockLocationEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["stockLocationId"] = stockLocationId;
    j["name"] = name;
    j["active"] = active;
    j["isDefault"] = isDefault;
    return j.dump();
}

} // namespace inventory::domain
