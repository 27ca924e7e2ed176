#pragma once

#include <string>

namespace inventory::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQEventPublisher и LoggingEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "stock.adjusted")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace inventory::ports::output
