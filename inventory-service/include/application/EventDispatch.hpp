#pragma once

#include "domain/events/DomainEvent.hpp"
#include "ports/output/IEventPublisher.hpp"
#include <iostream>
#include <string>

namespace inventory::application {

/**
 * @brief Опубликовать события закоммиченной операции
 *
 * Ошибка публикации логируется и не откатывает уже зафиксированное состояние.
 */
inline void publishEvents(ports::output::IEventPublisher& publisher,
                          const domain::DomainEvents& events,
                          const std::string& component) {
    for (const auto& event : events) {
        try {
            publisher.publish(event->eventType, event->toJson());
        } catch (const std::exception& e) {
            std::cerr << "[" << component << "] Failed to publish " << event->eventType
                      << ": " << e.what() << std::endl;
        }
    }
}

} // namespace inventory::application
