#pragma once

#include "domain/Result.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/MovementAction.hpp"
#include "domain/enums/MovementOriginator.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Неизменяемая запись об изменении остатка
 *
 * Создаётся только операциями StockItem и только дописывается в журнал.
 * Знак quantity: плюс увеличивает доступный остаток, минус уменьшает.
 */
struct StockMovement {
    std::string id;
    std::string stockItemId;
    int64_t quantity = 0;                           ///< Знаковое количество, никогда не 0
    MovementOriginator originator = MovementOriginator::ADJUSTMENT;
    MovementAction action = MovementAction::ADJUSTMENT;
    std::optional<std::string> reason;
    std::optional<std::string> stockTransferId;     ///< Заполняется для движений перемещения
    Timestamp createdAt;

    /**
     * @brief Создать движение
     * @return INVALID_QUANTITY при quantity == 0
     */
    static Result<StockMovement> create(
        const std::string& stockItemId,
        int64_t quantity,
        MovementOriginator originator,
        MovementAction action,
        std::optional<std::string> reason = std::nullopt,
        std::optional<std::string> stockTransferId = std::nullopt);

    bool isIncrease() const { return quantity > 0; }
    bool isDecrease() const { return quantity < 0; }
};

} // namespace inventory::domain
