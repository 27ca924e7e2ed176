#pragma once

#include "domain/InventoryUnit.hpp"
#include "domain/Result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Запрос на создание единицы товара для строки заказа
 */
struct CreateInventoryUnitRequest {
    std::string variantId;
    std::string orderId;
    std::string lineItemId;
    int64_t quantity = 1;
    domain::InventoryUnitState initialState = domain::InventoryUnitState::ON_HAND;
    std::optional<std::string> stockLocationId;
    std::optional<std::string> shipmentId;
    std::optional<std::string> serialNumber;
};

/**
 * @brief Результат разделения единицы
 */
struct SplitUnitResult {
    domain::InventoryUnit original;     ///< С уменьшенным количеством
    domain::InventoryUnit extracted;    ///< Новая единица
};

class IInventoryUnitService {
public:
    virtual ~IInventoryUnitService() = default;

    virtual domain::Result<domain::InventoryUnit> createUnit(const CreateInventoryUnitRequest& request) = 0;

    virtual domain::Result<domain::InventoryUnit> fillBackorder(const std::string& unitId) = 0;

    virtual domain::Result<domain::InventoryUnit> ship(
        const std::string& unitId, const std::optional<std::string>& shipmentId = std::nullopt) = 0;

    virtual domain::Result<domain::InventoryUnit> returnUnit(
        const std::string& unitId, const std::optional<std::string>& returnItemId = std::nullopt) = 0;

    virtual domain::Result<domain::InventoryUnit> cancel(const std::string& unitId) = 0;

    virtual domain::Result<SplitUnitResult> split(const std::string& unitId, int64_t extractQuantity) = 0;

    /// @return NOT_FOUND, если склада нет
    virtual domain::Result<domain::InventoryUnit> setStockLocation(
        const std::string& unitId, const std::string& stockLocationId) = 0;

    virtual domain::Result<domain::InventoryUnit> getUnit(const std::string& unitId) = 0;
    virtual std::vector<domain::InventoryUnit> getUnitsByOrder(const std::string& orderId) = 0;
    virtual std::vector<domain::InventoryUnit> getBackorderedUnits(
        const std::string& variantId, const std::string& stockLocationId) = 0;
};

} // namespace inventory::ports::input
