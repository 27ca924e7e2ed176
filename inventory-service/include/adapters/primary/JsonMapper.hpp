#pragma once

#include "domain/Error.hpp"
#include "domain/InventoryUnit.hpp"
#include "domain/StockItem.hpp"
#include "domain/StockLocation.hpp"
#include "domain/StockMovement.hpp"
#include "domain/StockTransfer.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace inventory::adapters::primary {

/**
 * @brief Преобразование доменных объектов в JSON и обратно
 *
 * Ключи в camelCase, отсутствующие optional-поля выводятся как null.
 */
nlohmann::json toJson(const domain::StockItem& item);
nlohmann::json toJson(const domain::StockMovement& movement);
nlohmann::json toJson(const domain::StockLocation& location);
nlohmann::json toJson(const domain::StockTransfer& transfer);
nlohmann::json toJson(const domain::InventoryUnit& unit);
nlohmann::json toJson(const domain::Error& error);

template <typename T>
nlohmann::json toJson(const std::vector<T>& values) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& value : values) {
        array.push_back(toJson(value));
    }
    return array;
}

/// @throws nlohmann::json::exception при неверных типах полей
domain::Address addressFromJson(const nlohmann::json& j);

/// Объект {variantId: quantity}
domain::VariantQuantities variantsFromJson(const nlohmann::json& j);

} // namespace inventory::adapters::primary
