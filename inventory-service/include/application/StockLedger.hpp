#pragma once

#include "application/BackorderAllocator.hpp"
#include "domain/StockItem.hpp"
#include "domain/events/StockItemEvents.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <optional>
#include <string>

namespace inventory::application {

/**
 * @brief Общие шаги изменения остатка внутри единицы работы
 *
 * Используется всеми сервисами, которые двигают остаток:
 * запись позиции, дозапись движения, событие и закрытие бэкордеров.
 */
class StockLedger {
public:
    explicit StockLedger(std::shared_ptr<BackorderAllocator> allocator)
        : allocator_(std::move(allocator)) {}

    /**
     * @brief Изменить физический остаток позиции
     *
     * При quantity > 0 в той же единице работы закрываются бэкордеры.
     */
    domain::Result<domain::StockMovement> adjust(
        ports::output::IUnitOfWork& uow,
        domain::StockItem& item,
        int64_t quantity,
        domain::MovementOriginator originator,
        const std::optional<std::string>& reason,
        const std::optional<std::string>& stockTransferId,
        domain::DomainEvents& events) const
    {
        auto movement = item.adjust(quantity, originator, reason, stockTransferId);
        if (!movement) {
            return movement;
        }
        record(uow, item, movement.value(), domain::events::STOCK_ADJUSTED, events);

        if (quantity > 0) {
            allocator_->fill(uow, item, quantity, events);
        }
        return movement;
    }

    /// Сохранить позицию и движение, добавить количественное событие
    void record(
        ports::output::IUnitOfWork& uow,
        domain::StockItem& item,
        const domain::StockMovement& movement,
        const std::string& eventType,
        domain::DomainEvents& events) const
    {
        uow.stockItems().update(item);
        uow.stockMovements().append(movement);
        events.push_back(std::make_unique<domain::StockQuantityEvent>(eventType, item, movement));
    }

    /**
     * @brief Найти позицию варианта на складе или завести пустую
     */
    domain::Result<domain::StockItem> findOrCreate(
        ports::output::IUnitOfWork& uow,
        const std::string& variantId,
        const std::string& stockLocationId,
        const std::string& sku,
        bool backorderable,
        domain::DomainEvents& events) const
    {
        auto existing = uow.stockItems().findByVariantAndLocation(variantId, stockLocationId);
        if (existing) {
            return *existing;
        }
        auto location = claimLocation(uow, stockLocationId);
        if (!location) {
            return location.error();
        }

        auto created = domain::StockItem::create(variantId, stockLocationId, sku, 0, 0, backorderable);
        if (!created) {
            return created;
        }
        uow.stockItems().add(created.value());
        events.push_back(std::make_unique<domain::StockItemLifecycleEvent>(domain::events::STOCK_ITEM_CREATED, created.value()));
        return created;
    }

    /**
     * @brief Прочитать действующий склад и записать его в единицу работы
     *
     * Заведение позиции сдвигает версию склада, поэтому конкурирует
     * с параллельным deleteLocation по версии.
     */
    static domain::Result<domain::StockLocation> claimLocation(
        ports::output::IUnitOfWork& uow, const std::string& stockLocationId)
    {
        auto location = uow.stockLocations().findById(stockLocationId);
        if (!location || location->isDeleted()) {
            return domain::Error::notFound("StockLocation", stockLocationId);
        }
        uow.stockLocations().update(*location);
        return *location;
    }

private:
    std::shared_ptr<BackorderAllocator> allocator_;
};

} // namespace inventory::application
