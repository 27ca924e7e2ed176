#pragma once

#include "domain/Timestamp.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Базовый класс доменных событий
 *
 * Сервисы собирают события во время операции и публикуют их
 * через IEventPublisher только после успешного коммита.
 * Тип события используется как routing key.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (stock.adjusted, inventory_unit.shipped)
    Timestamp timestamp;        ///< Время создания события

    explicit DomainEvent(const std::string& type)
        : eventId(utils::UuidGenerator::generate()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

/// События одной операции в порядке возникновения
using DomainEvents = std::vector<std::unique_ptr<DomainEvent>>;

} // namespace inventory::domain
