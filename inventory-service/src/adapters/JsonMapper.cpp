#include "adapters/primary/JsonMapper.hpp"
#include <stdexcept>

namespace inventory::adapters::primary {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optionalTimestamp(const std::optional<domain::Timestamp>& value) {
    return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
}

std::optional<std::string> optionalField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

} // namespace

nlohmann::json toJson(const domain::StockItem& item) {
    nlohmann::json j;
    j["id"] = item.id();
    j["variantId"] = item.variantId();
    j["stockLocationId"] = item.stockLocationId();
    j["sku"] = item.sku();
    j["quantityOnHand"] = item.quantityOnHand();
    j["quantityReserved"] = item.quantityReserved();
    j["countAvailable"] = item.countAvailable();
    j["backorderable"] = item.backorderable();
    j["inStock"] = item.inStock();
    j["version"] = item.version();
    j["createdAt"] = item.createdAt().toString();
    j["updatedAt"] = item.updatedAt().toString();
    j["deletedAt"] = optionalTimestamp(item.deletedAt());
    return j;
}

nlohmann::json toJson(const domain::StockMovement& movement) {
    nlohmann::json j;
    j["id"] = movement.id;
    j["stockItemId"] = movement.stockItemId;
    j["quantity"] = movement.quantity;
    j["originator"] = domain::toString(movement.originator);
    j["action"] = domain::toString(movement.action);
    j["reason"] = optionalString(movement.reason);
    j["stockTransferId"] = optionalString(movement.stockTransferId);
    j["createdAt"] = movement.createdAt.toString();
    return j;
}

nlohmann::json toJson(const domain::StockLocation& location) {
    nlohmann::json address;
    address["address1"] = location.address.address1;
    address["address2"] = location.address.address2;
    address["city"] = location.address.city;
    address["zipcode"] = location.address.zipcode;
    address["phone"] = location.address.phone;
    address["company"] = location.address.company;
    address["countryId"] = optionalString(location.address.countryId);
    address["stateId"] = optionalString(location.address.stateId);

    nlohmann::json j;
    j["id"] = location.id;
    j["name"] = location.name;
    j["presentation"] = location.presentation;
    j["active"] = location.active;
    j["isDefault"] = location.isDefault;
    j["address"] = address;
    j["version"] = location.version;
    j["createdAt"] = location.createdAt.toString();
    j["updatedAt"] = location.updatedAt.toString();
    j["deletedAt"] = optionalTimestamp(location.deletedAt);
    return j;
}

nlohmann::json toJson(const domain::StockTransfer& transfer) {
    nlohmann::json j;
    j["id"] = transfer.id;
    j["number"] = transfer.number;
    j["sourceLocationId"] = optionalString(transfer.sourceLocationId);
    j["destinationLocationId"] = optionalString(transfer.destinationLocationId);
    j["reference"] = optionalString(transfer.reference);
    j["createdAt"] = transfer.createdAt.toString();
    return j;
}

nlohmann::json toJson(const domain::InventoryUnit& unit) {
    nlohmann::json j;
    j["id"] = unit.id();
    j["variantId"] = unit.variantId();
    j["orderId"] = unit.orderId();
    j["lineItemId"] = unit.lineItemId();
    j["quantity"] = unit.quantity();
    j["state"] = domain::toString(unit.state());
    j["stockLocationId"] = optionalString(unit.stockLocationId());
    j["shipmentId"] = optionalString(unit.shipmentId());
    j["serialNumber"] = optionalString(unit.serialNumber());
    j["returnItemId"] = optionalString(unit.returnItemId());
    j["version"] = unit.version();
    j["createdAt"] = unit.createdAt().toString();
    j["updatedAt"] = unit.updatedAt().toString();
    j["stateChangedAt"] = unit.stateChangedAt().toString();
    return j;
}

nlohmann::json toJson(const domain::Error& error) {
    nlohmann::json j;
    j["code"] = domain::toString(error.code);
    j["kind"] = domain::toString(error.kind());
    j["message"] = error.message;
    return j;
}

domain::Address addressFromJson(const nlohmann::json& j) {
    domain::Address address;
    address.address1 = j.value("address1", "");
    address.address2 = j.value("address2", "");
    address.city = j.value("city", "");
    address.zipcode = j.value("zipcode", "");
    address.phone = j.value("phone", "");
    address.company = j.value("company", "");
    address.countryId = optionalField(j, "countryId");
    address.stateId = optionalField(j, "stateId");
    return address;
}

domain::VariantQuantities variantsFromJson(const nlohmann::json& j) {
    domain::VariantQuantities variants;
    if (!j.is_object()) {
        throw std::invalid_argument("variants must be an object {variantId: quantity}");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        variants[it.key()] = it.value().get<int64_t>();
    }
    return variants;
}

} // namespace inventory::adapters::primary
