#pragma once

#include "domain/Result.hpp"
#include "domain/StockItem.hpp"
#include "domain/StockLocation.hpp"
#include "domain/StockTransfer.hpp"
#include "domain/enums/MovementOriginator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Запрос на создание склада
 */
struct CreateStockLocationRequest {
    std::string name;
    std::optional<std::string> presentation;
    bool active = true;
    bool isDefault = false;
    domain::Address address;
};

/**
 * @brief Массовое поступление/списание по складу
 */
struct StockLevelChangeRequest {
    std::string stockLocationId;
    domain::VariantQuantities variants;     ///< Положительные количества
    domain::MovementOriginator originator = domain::MovementOriginator::ADJUSTMENT;
    std::optional<std::string> reason;
};

class IStockLocationService {
public:
    virtual ~IStockLocationService() = default;

    virtual domain::Result<domain::StockLocation> createLocation(const CreateStockLocationRequest& request) = 0;

    virtual domain::Result<domain::StockLocation> updateLocation(
        const std::string& locationId, const domain::StockLocationUpdate& changes) = 0;

    /// Снимает признак основного с прежнего склада в той же транзакции
    virtual domain::Result<domain::StockLocation> makeDefault(const std::string& locationId) = 0;

    /**
     * @brief Мягко удалить склад
     * @return HAS_RESERVED_STOCK, затем HAS_STOCK_ITEMS
     */
    virtual domain::Result<domain::Success> deleteLocation(const std::string& locationId) = 0;

    virtual domain::Result<domain::StockLocation> restoreLocation(const std::string& locationId) = 0;

    /// Недостающие позиции создаются; закрывает бэкордеры
    virtual domain::Result<std::vector<domain::StockItem>> restock(const StockLevelChangeRequest& request) = 0;

    /// Позиции должны существовать
    virtual domain::Result<std::vector<domain::StockItem>> unstock(const StockLevelChangeRequest& request) = 0;

    virtual domain::Result<domain::StockLocation> getLocation(const std::string& locationId) = 0;
    virtual std::vector<domain::StockLocation> getLocations() = 0;
    virtual domain::Result<domain::StockLocation> getDefaultLocation() = 0;
    virtual domain::Result<std::vector<domain::StockItem>> getStockItems(const std::string& locationId) = 0;
};

} // namespace inventory::ports::input
