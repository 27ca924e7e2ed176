#pragma once

#include "domain/StockItem.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Репозиторий складских позиций в рамках единицы работы
 *
 * update() запоминает прочитанную версию; сравнение и инкремент версии
 * выполняются при коммите. После update() объект несёт новую версию.
 */
class IStockItemRepository {
public:
    virtual ~IStockItemRepository() = default;

    virtual void add(domain::StockItem& item) = 0;
    virtual void update(domain::StockItem& item) = 0;

    /// Включая логически удалённые
    virtual std::optional<domain::StockItem> findById(const std::string& id) = 0;

    /// Только неудалённая позиция
    virtual std::optional<domain::StockItem> findByVariantAndLocation(
        const std::string& variantId, const std::string& stockLocationId) = 0;

    /// Неудалённые позиции склада
    virtual std::vector<domain::StockItem> findByLocation(const std::string& stockLocationId) = 0;
};

} // namespace inventory::ports::output
