#pragma once

#include "domain/StockMovement.hpp"
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Журнал движений (только дозапись)
 */
class IStockMovementRepository {
public:
    virtual ~IStockMovementRepository() = default;

    virtual void append(const domain::StockMovement& movement) = 0;

    /// В порядке создания
    virtual std::vector<domain::StockMovement> findByStockItem(const std::string& stockItemId) = 0;
    virtual std::vector<domain::StockMovement> findByTransfer(const std::string& stockTransferId) = 0;
};

} // namespace inventory::ports::output
