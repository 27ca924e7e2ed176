#pragma once

#include "domain/Result.hpp"
#include "domain/StockMovement.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Хранимое состояние складской позиции
 *
 * Используется адаптерами хранения для чтения/записи строки.
 */
struct StockItemData {
    std::string id;
    std::string variantId;
    std::string stockLocationId;
    std::string sku;
    int64_t quantityOnHand = 0;
    int64_t quantityReserved = 0;
    bool backorderable = true;
    int64_t version = 0;                    ///< Токен оптимистичной блокировки
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> deletedAt;
};

/**
 * @brief Складская позиция: остаток варианта товара на складе
 *
 * Количества меняются только методами этого класса.
 * Каждая количественная операция возвращает ровно одно StockMovement,
 * которое сервис сохраняет в той же единице работы.
 *
 * Инварианты:
 * - quantityOnHand >= 0, quantityReserved >= 0
 * - если !backorderable, резерв не превышает физический остаток
 */
class StockItem {
public:
    /**
     * @brief Создать новую позицию
     * @return INVALID_QUANTITY при отрицательных количествах
     */
    static Result<StockItem> create(
        const std::string& variantId,
        const std::string& stockLocationId,
        const std::string& sku,
        int64_t quantityOnHand = 0,
        int64_t quantityReserved = 0,
        bool backorderable = true);

    /// Восстановить из хранилища без проверок
    static StockItem restore(StockItemData data);

    /**
     * @brief Изменить физический остаток
     * @param quantity Знаковое изменение (не 0)
     * @return INVALID_QUANTITY, INSUFFICIENT_STOCK
     */
    Result<StockMovement> adjust(
        int64_t quantity,
        MovementOriginator originator,
        std::optional<std::string> reason = std::nullopt,
        std::optional<std::string> stockTransferId = std::nullopt);

    /// Зарезервировать под заказ
    Result<StockMovement> reserve(int64_t quantity, const std::optional<std::string>& orderId = std::nullopt);

    /// Снять резерв (отмена заказа)
    Result<StockMovement> release(int64_t quantity, const std::string& orderId);

    /// Отгрузка: списывает и резерв, и физический остаток
    Result<StockMovement> confirmShipment(int64_t quantity, const std::string& shipmentId);

    /**
     * @brief Административная корректировка резерва (инвентаризация)
     *
     * Не связана с заказами. Движение: ADJUSTMENT, quantity = -(new - old), RECOUNT.
     */
    Result<StockMovement> correctReserved(int64_t newQuantityReserved, std::optional<std::string> reason = std::nullopt);

    /// @return true, если атрибуты изменились
    bool updateDetails(const std::string& sku, bool backorderable);

    void markDeleted();

    const std::string& id() const { return data_.id; }
    const std::string& variantId() const { return data_.variantId; }
    const std::string& stockLocationId() const { return data_.stockLocationId; }
    const std::string& sku() const { return data_.sku; }
    int64_t quantityOnHand() const { return data_.quantityOnHand; }
    int64_t quantityReserved() const { return data_.quantityReserved; }
    bool backorderable() const { return data_.backorderable; }
    int64_t version() const { return data_.version; }
    const Timestamp& createdAt() const { return data_.createdAt; }
    const Timestamp& updatedAt() const { return data_.updatedAt; }
    const std::optional<Timestamp>& deletedAt() const { return data_.deletedAt; }
    bool isDeleted() const { return data_.deletedAt.has_value(); }

    int64_t countAvailable() const;
    bool inStock() const { return countAvailable() > 0 || data_.backorderable; }

    const StockItemData& data() const { return data_; }

    /// Выставляется адаптером хранения после записи строки
    void setVersion(int64_t version) { data_.version = version; }

private:
    explicit StockItem(StockItemData data) : data_(std::move(data)) {}

    Result<StockMovement> record(
        int64_t quantity,
        MovementOriginator originator,
        MovementAction action,
        std::optional<std::string> reason,
        std::optional<std::string> stockTransferId = std::nullopt);

    StockItemData data_;
};

} // namespace inventory::domain
