#pragma once

#include <string>
#include <ostream>

namespace inventory::domain {

/**
 * @brief Коды бизнес-ошибок
 *
 * Ожидаемые отказы операций всегда возвращаются через Result, а не исключениями.
 */
enum class ErrorCode {
    INVALID_QUANTITY,
    INVALID_RELEASE,
    INVALID_SHIPMENT,
    INVALID_SPLIT_QUANTITY,
    NO_VARIANTS,
    SOURCE_EQUALS_DESTINATION,
    MISSING_LOCATION,
    INVALID_NAME,
    DUPLICATE_SKU,
    HAS_STOCK_ITEMS,
    HAS_RESERVED_STOCK,
    INSUFFICIENT_STOCK,
    NOT_FOUND,
    INVALID_STATE_TRANSITION,
    CANNOT_SHIP_FROM_BACKORDERED,
    CANNOT_RETURN_FROM_NON_SHIPPED,
    CANNOT_SPLIT_IN_TERMINAL_STATE,
    CONCURRENCY_CONFLICT
};

/**
 * @brief Категория ошибки (для маппинга на внешний протокол)
 */
enum class ErrorKind {
    VALIDATION,
    CONFLICT,
    INSUFFICIENT_STOCK,
    NOT_FOUND,
    STATE_TRANSITION,
    CONCURRENCY
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_QUANTITY:               return "INVALID_QUANTITY";
        case ErrorCode::INVALID_RELEASE:                return "INVALID_RELEASE";
        case ErrorCode::INVALID_SHIPMENT:               return "INVALID_SHIPMENT";
        case ErrorCode::INVALID_SPLIT_QUANTITY:         return "INVALID_SPLIT_QUANTITY";
        case ErrorCode::NO_VARIANTS:                    return "NO_VARIANTS";
        case ErrorCode::SOURCE_EQUALS_DESTINATION:      return "SOURCE_EQUALS_DESTINATION";
        case ErrorCode::MISSING_LOCATION:               return "MISSING_LOCATION";
        case ErrorCode::INVALID_NAME:                   return "INVALID_NAME";
        case ErrorCode::DUPLICATE_SKU:                  return "DUPLICATE_SKU";
        case ErrorCode::HAS_STOCK_ITEMS:                return "HAS_STOCK_ITEMS";
        case ErrorCode::HAS_RESERVED_STOCK:             return "HAS_RESERVED_STOCK";
        case ErrorCode::INSUFFICIENT_STOCK:             return "INSUFFICIENT_STOCK";
        case ErrorCode::NOT_FOUND:                      return "NOT_FOUND";
        case ErrorCode::INVALID_STATE_TRANSITION:       return "INVALID_STATE_TRANSITION";
        case ErrorCode::CANNOT_SHIP_FROM_BACKORDERED:   return "CANNOT_SHIP_FROM_BACKORDERED";
        case ErrorCode::CANNOT_RETURN_FROM_NON_SHIPPED: return "CANNOT_RETURN_FROM_NON_SHIPPED";
        case ErrorCode::CANNOT_SPLIT_IN_TERMINAL_STATE: return "CANNOT_SPLIT_IN_TERMINAL_STATE";
        case ErrorCode::CONCURRENCY_CONFLICT:           return "CONCURRENCY_CONFLICT";
    }
    return "UNKNOWN";
}

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:         return "VALIDATION";
        case ErrorKind::CONFLICT:           return "CONFLICT";
        case ErrorKind::INSUFFICIENT_STOCK: return "INSUFFICIENT_STOCK";
        case ErrorKind::NOT_FOUND:          return "NOT_FOUND";
        case ErrorKind::STATE_TRANSITION:   return "STATE_TRANSITION";
        case ErrorKind::CONCURRENCY:        return "CONCURRENCY";
    }
    return "UNKNOWN";
}

inline ErrorKind kindOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::DUPLICATE_SKU:
        case ErrorCode::HAS_STOCK_ITEMS:
        case ErrorCode::HAS_RESERVED_STOCK:
            return ErrorKind::CONFLICT;
        case ErrorCode::INSUFFICIENT_STOCK:
            return ErrorKind::INSUFFICIENT_STOCK;
        case ErrorCode::NOT_FOUND:
            return ErrorKind::NOT_FOUND;
        case ErrorCode::INVALID_STATE_TRANSITION:
        case ErrorCode::CANNOT_SHIP_FROM_BACKORDERED:
        case ErrorCode::CANNOT_RETURN_FROM_NON_SHIPPED:
        case ErrorCode::CANNOT_SPLIT_IN_TERMINAL_STATE:
            return ErrorKind::STATE_TRANSITION;
        case ErrorCode::CONCURRENCY_CONFLICT:
            return ErrorKind::CONCURRENCY;
        default:
            return ErrorKind::VALIDATION;
    }
}

/**
 * @brief Бизнес-ошибка: код + человекочитаемое сообщение
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    ErrorKind kind() const { return kindOf(code); }

    static Error invalidQuantity(const std::string& msg = "Quantity must be positive.") {
        return Error(ErrorCode::INVALID_QUANTITY, msg);
    }

    static Error insufficientStock() {
        return Error(ErrorCode::INSUFFICIENT_STOCK, "Insufficient stock available for this operation.");
    }

    static Error notFound(const std::string& entity, const std::string& id) {
        return Error(ErrorCode::NOT_FOUND, entity + " '" + id + "' was not found.");
    }

    static Error invalidTransition(const std::string& from, const std::string& action) {
        return Error(ErrorCode::INVALID_STATE_TRANSITION,
                     "Cannot " + action + " an inventory unit in state " + from + ".");
    }

    static Error concurrencyConflict(const std::string& operation) {
        return Error(ErrorCode::CONCURRENCY_CONFLICT,
                     "Operation '" + operation + "' kept conflicting with concurrent updates.");
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << toString(error.code) << ": " << error.message;
}

} // namespace inventory::domain
