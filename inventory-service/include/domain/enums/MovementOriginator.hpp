#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/// Бизнес-причина движения остатка (закрытый словарь)
enum class MovementOriginator {
    STOCK_TRANSFER,
    ORDER,
    RETURN,
    DAMAGE,
    LOSS,
    FOUND,
    PROMOTION,
    ADJUSTMENT,
    RECOUNT,
    SHIPMENT,
    SUPPLIER,
    CUSTOMER
};

inline std::string toString(MovementOriginator originator) {
    switch (originator) {
        case MovementOriginator::STOCK_TRANSFER: return "STOCK_TRANSFER";
        case MovementOriginator::ORDER: return "ORDER";
        case MovementOriginator::RETURN: return "RETURN";
        case MovementOriginator::DAMAGE: return "DAMAGE";
        case MovementOriginator::LOSS: return "LOSS";
        case MovementOriginator::FOUND: return "FOUND";
        case MovementOriginator::PROMOTION: return "PROMOTION";
        case MovementOriginator::ADJUSTMENT: return "ADJUSTMENT";
        case MovementOriginator::RECOUNT: return "RECOUNT";
        case MovementOriginator::SHIPMENT: return "SHIPMENT";
        case MovementOriginator::SUPPLIER: return "SUPPLIER";
        case MovementOriginator::CUSTOMER: return "CUSTOMER";
        default: return "UNKNOWN";
    }
}

inline MovementOriginator parseMovementOriginator(const std::string& str) {
    if (str == "STOCK_TRANSFER") return MovementOriginator::STOCK_TRANSFER;
    if (str == "ORDER") return MovementOriginator::ORDER;
    if (str == "RETURN") return MovementOriginator::RETURN;
    if (str == "DAMAGE") return MovementOriginator::DAMAGE;
    if (str == "LOSS") return MovementOriginator::LOSS;
    if (str == "FOUND") return MovementOriginator::FOUND;
    if (str == "PROMOTION") return MovementOriginator::PROMOTION;
    if (str == "ADJUSTMENT") return MovementOriginator::ADJUSTMENT;
    if (str == "RECOUNT") return MovementOriginator::RECOUNT;
    if (str == "SHIPMENT") return MovementOriginator::SHIPMENT;
    if (str == "SUPPLIER") return MovementOriginator::SUPPLIER;
    if (str == "CUSTOMER") return MovementOriginator::CUSTOMER;
    throw std::invalid_argument("Unknown movement originator: " + str);
}

} // namespace inventory::domain
