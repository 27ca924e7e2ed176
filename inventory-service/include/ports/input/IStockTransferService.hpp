#pragma once

#include "domain/Result.hpp"
#include "domain/StockMovement.hpp"
#include "domain/StockTransfer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Запрос на перемещение между складами
 */
struct TransferRequest {
    std::string sourceLocationId;
    std::string destinationLocationId;
    domain::VariantQuantities variants;
    std::optional<std::string> reference;
};

/**
 * @brief Запрос на поступление от поставщика
 */
struct ReceiveRequest {
    std::string destinationLocationId;
    domain::VariantQuantities variants;
    std::optional<std::string> reference;
};

class IStockTransferService {
public:
    virtual ~IStockTransferService() = default;

    /**
     * @brief Переместить остаток; любая неудачная строка откатывает всё перемещение
     */
    virtual domain::Result<domain::StockTransfer> transfer(const TransferRequest& request) = 0;

    /// Одностороннее поступление (originator SUPPLIER)
    virtual domain::Result<domain::StockTransfer> receive(const ReceiveRequest& request) = 0;

    virtual domain::Result<domain::StockTransfer> getTransfer(const std::string& transferId) = 0;

    virtual domain::Result<std::vector<domain::StockMovement>> getTransferMovements(const std::string& transferId) = 0;
};

} // namespace inventory::ports::input
