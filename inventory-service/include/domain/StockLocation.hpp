#pragma once

#include "domain/Result.hpp"
#include "domain/StockItem.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/// Адрес склада
struct Address {
    std::string address1;
    std::string address2;
    std::string city;
    std::string zipcode;
    std::string phone;
    std::string company;
    std::optional<std::string> countryId;
    std::optional<std::string> stateId;
};

/**
 * @brief Частичное обновление склада: заданы только изменяемые поля
 */
struct StockLocationUpdate {
    std::optional<std::string> name;
    std::optional<std::string> presentation;
    std::optional<bool> active;
    std::optional<Address> address;
};

/**
 * @brief Склад (физическое место хранения)
 *
 * Владеет складскими позициями через внешний ключ stockItem.stockLocationId.
 * Удаление мягкое: выставляется deletedAt.
 */
struct StockLocation {
    std::string id;
    std::string name;
    std::string presentation;       ///< Отображаемое имя, по умолчанию = name
    bool active = true;
    bool isDefault = false;
    Address address;
    int64_t version = 0;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> deletedAt;

    /**
     * @return INVALID_NAME для пустого имени
     */
    static Result<StockLocation> create(
        const std::string& name,
        const std::optional<std::string>& presentation = std::nullopt,
        bool active = true,
        bool isDefault = false,
        const Address& address = Address{});

    /// @return true, если что-то изменилось
    Result<bool> update(const StockLocationUpdate& changes);

    /// @return true, если склад не был основным
    bool makeDefault();

    /// Снять признак основного (при назначении другого склада)
    bool clearDefault();

    /**
     * @brief Проверить, можно ли удалить склад с данными позициями
     * @return HAS_RESERVED_STOCK, затем HAS_STOCK_ITEMS
     */
    static Result<Success> checkDeletable(const std::vector<StockItem>& ownedItems);

    void markDeleted();

    /// @return true, если склад был удалён и восстановлен
    bool restore();

    bool isDeleted() const { return deletedAt.has_value(); }
};

} // namespace inventory::domain
