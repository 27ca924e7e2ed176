#pragma once

#include "domain/StockLocation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

class IStockLocationRepository {
public:
    virtual ~IStockLocationRepository() = default;

    virtual void add(domain::StockLocation& location) = 0;
    virtual void update(domain::StockLocation& location) = 0;

    /// Включая мягко удалённые
    virtual std::optional<domain::StockLocation> findById(const std::string& id) = 0;

    /// Неудалённые склады в порядке создания
    virtual std::vector<domain::StockLocation> findAll() = 0;

    virtual std::optional<domain::StockLocation> findDefault() = 0;
};

} // namespace inventory::ports::output
