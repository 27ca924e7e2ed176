#pragma once

#include "domain/Result.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/InventoryUnitState.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/// Хранимое состояние единицы товара
struct InventoryUnitData {
    std::string id;
    std::string variantId;
    std::string orderId;
    std::string lineItemId;
    int64_t quantity = 1;
    InventoryUnitState state = InventoryUnitState::ON_HAND;
    std::optional<std::string> stockLocationId;
    std::optional<std::string> shipmentId;
    std::optional<std::string> serialNumber;
    std::optional<std::string> returnItemId;
    int64_t version = 0;
    Timestamp createdAt;
    Timestamp updatedAt;
    Timestamp stateChangedAt;
};

/**
 * @brief Физическая единица (или пачка) товара, привязанная к строке заказа
 *
 * Машина состояний:
 * @code
 *   BACKORDERED --fillBackorder--> ON_HAND --ship--> SHIPPED --markReturned--> RETURNED
 *   ON_HAND | BACKORDERED --cancel--> CANCELED
 * @endcode
 * RETURNED и CANCELED терминальные. Единица никогда не удаляется физически.
 */
class InventoryUnit {
public:
    /**
     * @return INVALID_QUANTITY при quantity < 1,
     *         INVALID_STATE_TRANSITION если начальное состояние не ON_HAND/BACKORDERED
     */
    static Result<InventoryUnit> create(
        const std::string& variantId,
        const std::string& orderId,
        const std::string& lineItemId,
        int64_t quantity,
        InventoryUnitState initialState = InventoryUnitState::ON_HAND,
        std::optional<std::string> stockLocationId = std::nullopt,
        std::optional<std::string> shipmentId = std::nullopt,
        std::optional<std::string> serialNumber = std::nullopt);

    static InventoryUnit restore(InventoryUnitData data);

    /// BACKORDERED -> ON_HAND; для ON_HAND ничего не делает
    Result<Success> fillBackorder();

    /// ON_HAND -> SHIPPED
    Result<Success> ship(const std::optional<std::string>& shipmentId = std::nullopt);

    /// SHIPPED -> RETURNED; для RETURNED ничего не делает
    Result<Success> markReturned(const std::optional<std::string>& returnItemId = std::nullopt);

    /// ON_HAND | BACKORDERED -> CANCELED; для CANCELED ничего не делает
    Result<Success> cancel();

    /**
     * @brief Выделить часть количества в новую единицу
     *
     * Новая единица наследует состояние, вариант, заказ, строку, склад и отгрузку,
     * но не серийный номер. Сумма количеств сохраняется.
     */
    Result<InventoryUnit> split(int64_t extractQuantity);

    /// @return true, если склад изменился
    Result<bool> setStockLocation(const std::string& stockLocationId);

    bool isInTerminalState() const {
        return data_.state == InventoryUnitState::RETURNED || data_.state == InventoryUnitState::CANCELED;
    }
    bool canBeShipped() const { return data_.state == InventoryUnitState::ON_HAND; }
    bool canBeSplit() const { return !isInTerminalState() && data_.state != InventoryUnitState::SHIPPED; }
    bool isAvailableForFulfillment() const {
        return data_.state == InventoryUnitState::ON_HAND || data_.state == InventoryUnitState::BACKORDERED;
    }
    bool hasActiveReturn() const { return data_.returnItemId.has_value(); }

    const std::string& id() const { return data_.id; }
    const std::string& variantId() const { return data_.variantId; }
    const std::string& orderId() const { return data_.orderId; }
    const std::string& lineItemId() const { return data_.lineItemId; }
    int64_t quantity() const { return data_.quantity; }
    InventoryUnitState state() const { return data_.state; }
    const std::optional<std::string>& stockLocationId() const { return data_.stockLocationId; }
    const std::optional<std::string>& shipmentId() const { return data_.shipmentId; }
    const std::optional<std::string>& serialNumber() const { return data_.serialNumber; }
    const std::optional<std::string>& returnItemId() const { return data_.returnItemId; }
    int64_t version() const { return data_.version; }
    const Timestamp& createdAt() const { return data_.createdAt; }
    const Timestamp& updatedAt() const { return data_.updatedAt; }
    const Timestamp& stateChangedAt() const { return data_.stateChangedAt; }

    const InventoryUnitData& data() const { return data_; }

    void setVersion(int64_t version) { data_.version = version; }

private:
    explicit InventoryUnit(InventoryUnitData data) : data_(std::move(data)) {}

    void transitionTo(InventoryUnitState state);

    InventoryUnitData data_;
};

} // namespace inventory::domain
