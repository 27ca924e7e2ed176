#pragma once

#include "domain/Result.hpp"
#include "domain/StockItem.hpp"
#include "domain/StockMovement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Запрос на создание складской позиции
 */
struct CreateStockItemRequest {
    std::string variantId;
    std::string stockLocationId;
    std::string sku;
    int64_t quantityOnHand = 0;
    int64_t quantityReserved = 0;
    bool backorderable = true;
};

/**
 * @brief Запрос на изменение физического остатка
 */
struct AdjustStockRequest {
    std::string stockItemId;
    int64_t quantity = 0;           ///< Знаковое, не 0
    domain::MovementOriginator originator = domain::MovementOriginator::ADJUSTMENT;
    std::optional<std::string> reason;
    std::optional<std::string> stockTransferId;
};

/**
 * @brief Операции над остатком одной позиции (для Orders/Fulfillment)
 *
 * Каждая мутирующая операция выполняется в одной единице работы
 * и при конфликте версий повторяется.
 */
class IStockItemService {
public:
    virtual ~IStockItemService() = default;

    /// @return DUPLICATE_SKU, если позиция варианта на складе уже есть
    virtual domain::Result<domain::StockItem> createStockItem(const CreateStockItemRequest& request) = 0;

    /**
     * @brief Изменить остаток; при поступлении закрывает бэкордеры (FIFO)
     */
    virtual domain::Result<domain::StockItem> adjust(const AdjustStockRequest& request) = 0;

    virtual domain::Result<domain::StockItem> reserve(
        const std::string& stockItemId, int64_t quantity,
        const std::optional<std::string>& orderId = std::nullopt) = 0;

    virtual domain::Result<domain::StockItem> release(
        const std::string& stockItemId, int64_t quantity, const std::string& orderId) = 0;

    virtual domain::Result<domain::StockItem> confirmShipment(
        const std::string& stockItemId, int64_t quantity, const std::string& shipmentId) = 0;

    /// Административная корректировка резерва
    virtual domain::Result<domain::StockItem> correctReserved(
        const std::string& stockItemId, int64_t newQuantityReserved,
        const std::optional<std::string>& reason = std::nullopt) = 0;

    virtual domain::Result<domain::StockItem> updateDetails(
        const std::string& stockItemId, const std::string& sku, bool backorderable) = 0;

    /// @return HAS_RESERVED_STOCK / HAS_STOCK_ITEMS при ненулевом балансе
    virtual domain::Result<domain::Success> deleteStockItem(const std::string& stockItemId) = 0;

    virtual domain::Result<domain::StockItem> getStockItem(const std::string& stockItemId) = 0;

    virtual domain::Result<domain::StockItem> findStockItem(
        const std::string& variantId, const std::string& stockLocationId) = 0;

    virtual domain::Result<std::vector<domain::StockMovement>> getMovements(const std::string& stockItemId) = 0;
};

} // namespace inventory::ports::input
