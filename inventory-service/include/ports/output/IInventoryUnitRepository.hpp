#pragma once

#include "domain/InventoryUnit.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

class IInventoryUnitRepository {
public:
    virtual ~IInventoryUnitRepository() = default;

    virtual void add(domain::InventoryUnit& unit) = 0;
    virtual void update(domain::InventoryUnit& unit) = 0;

    virtual std::optional<domain::InventoryUnit> findById(const std::string& id) = 0;
    virtual std::vector<domain::InventoryUnit> findByOrder(const std::string& orderId) = 0;

    /**
     * @brief Бэкордеры варианта на складе в порядке создания (FIFO)
     */
    virtual std::vector<domain::InventoryUnit> findBackordered(
        const std::string& variantId, const std::string& stockLocationId) = 0;
};

} // namespace inventory::ports::output
