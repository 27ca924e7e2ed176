#pragma once

#include "domain/StockItem.hpp"
#include "domain/events/InventoryUnitEvents.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Закрытие бэкордеров при поступлении остатка
 *
 * Бэкордеры варианта на складе обходятся строго в порядке создания.
 * Каждая единица закрывается целиком, пока её количество укладывается
 * в только что поступивший объём; на первой не поместившейся обход
 * останавливается (последующие не обгоняют очередь).
 */
class BackorderAllocator {
public:
    BackorderAllocator() = default;

    /**
     * @param restockedQuantity Объём поступления (> 0)
     * @return Количество закрытых единиц
     */
    int fill(ports::output::IUnitOfWork& uow,
             const domain::StockItem& item,
             int64_t restockedQuantity,
             domain::DomainEvents& events) const
    {
        if (restockedQuantity <= 0) {
            return 0;
        }

        auto backorders = uow.inventoryUnits().findBackordered(item.variantId(), item.stockLocationId());
        int64_t budget = restockedQuantity;
        int filled = 0;

        for (auto& unit : backorders) {
            if (unit.quantity() > budget) {
                break;
            }
            auto result = unit.fillBackorder();
            if (!result) {
                std::cerr << "[BackorderAllocator] Unit " << unit.id() << " skipped: "
                          << result.error() << std::endl;
                break;
            }
            uow.inventoryUnits().update(unit);
            events.push_back(std::make_unique<domain::InventoryUnitEvent>(domain::events::UNIT_BACKORDER_FILLED, unit));
            budget -= unit.quantity();
            ++filled;
        }

        if (filled > 0) {
            std::cout << "[BackorderAllocator] Filled " << filled << " backordered unit(s) for variant "
                      << item.variantId() << " at " << item.stockLocationId() << std::endl;
        }
        return filled;
    }
};

} // namespace inventory::application
