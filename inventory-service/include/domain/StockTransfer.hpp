#pragma once

#include "domain/Result.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace inventory::domain {

/// Строки перемещения: variantId -> количество (упорядочены для детерминированной обработки)
using VariantQuantities = std::map<std::string, int64_t>;

/**
 * @brief Документ перемещения между складами или поступления от поставщика
 *
 * Номер: {PREFIX}{yyMMdd}{COUNTER}. Id документа проставляется
 * во все движения, созданные по нему.
 */
struct StockTransfer {
    std::string id;
    std::string number;
    std::optional<std::string> sourceLocationId;        ///< Пусто для поступления
    std::optional<std::string> destinationLocationId;
    std::optional<std::string> reference;
    Timestamp createdAt;

    /**
     * @param number Номер, выданный NumberGenerator
     * @return SOURCE_EQUALS_DESTINATION, MISSING_LOCATION
     */
    static Result<StockTransfer> create(
        const std::string& number,
        const std::optional<std::string>& sourceLocationId,
        const std::optional<std::string>& destinationLocationId,
        const std::optional<std::string>& reference = std::nullopt);

    /// @return NO_VARIANTS для пустого набора, INVALID_QUANTITY для qty <= 0
    static Result<Success> validateLines(const VariantQuantities& lines);

};

} // namespace inventory::domain
