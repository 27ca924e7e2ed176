#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/// Вид движения остатка
enum class MovementAction {
    RECEIVED,
    SOLD,
    RETURNED,
    DAMAGED,
    LOST,
    ADJUSTMENT,
    RESERVED,
    RELEASED
};

inline std::string toString(MovementAction action) {
    switch (action) {
        case MovementAction::RECEIVED: return "RECEIVED";
        case MovementAction::SOLD: return "SOLD";
        case MovementAction::RETURNED: return "RETURNED";
        case MovementAction::DAMAGED: return "DAMAGED";
        case MovementAction::LOST: return "LOST";
        case MovementAction::ADJUSTMENT: return "ADJUSTMENT";
        case MovementAction::RESERVED: return "RESERVED";
        case MovementAction::RELEASED: return "RELEASED";
        default: return "UNKNOWN";
    }
}

inline MovementAction parseMovementAction(const std::string& str) {
    if (str == "RECEIVED") return MovementAction::RECEIVED;
    if (str == "SOLD") return MovementAction::SOLD;
    if (str == "RETURNED") return MovementAction::RETURNED;
    if (str == "DAMAGED") return MovementAction::DAMAGED;
    if (str == "LOST") return MovementAction::LOST;
    if (str == "ADJUSTMENT") return MovementAction::ADJUSTMENT;
    if (str == "RESERVED") return MovementAction::RESERVED;
    if (str == "RELEASED") return MovementAction::RELEASED;
    throw std::invalid_argument("Unknown movement action: " + str);
}

} // namespace inventory::domain
