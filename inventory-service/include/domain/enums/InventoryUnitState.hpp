#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Состояние единицы товара в заказе
 *
 * RETURNED и CANCELED терминальные.
 */
enum class InventoryUnitState {
    ON_HAND,
    BACKORDERED,
    SHIPPED,
    RETURNED,
    CANCELED
};

inline std::string toString(InventoryUnitState state) {
    switch (state) {
        case InventoryUnitState::ON_HAND: return "ON_HAND";
        case InventoryUnitState::BACKORDERED: return "BACKORDERED";
        case InventoryUnitState::SHIPPED: return "SHIPPED";
        case InventoryUnitState::RETURNED: return "RETURNED";
        case InventoryUnitState::CANCELED: return "CANCELED";
        default: return "UNKNOWN";
    }
}

inline InventoryUnitState parseInventoryUnitState(const std::string& str) {
    if (str == "ON_HAND") return InventoryUnitState::ON_HAND;
    if (str == "BACKORDERED") return InventoryUnitState::BACKORDERED;
    if (str == "SHIPPED") return InventoryUnitState::SHIPPED;
    if (str == "RETURNED") return InventoryUnitState::RETURNED;
    if (str == "CANCELED") return InventoryUnitState::CANCELED;
    throw std::invalid_argument("Unknown inventory unit state: " + str);
}

} // namespace inventory::domain
