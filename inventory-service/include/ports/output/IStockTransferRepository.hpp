#pragma once

#include "domain/StockTransfer.hpp"
#include <optional>
#include <string>

namespace inventory::ports::output {

class IStockTransferRepository {
public:
    virtual ~IStockTransferRepository() = default;

    virtual void add(const domain::StockTransfer& transfer) = 0;
    virtual std::optional<domain::StockTransfer> findById(const std::string& id) = 0;
};

} // namespace inventory::ports::output
