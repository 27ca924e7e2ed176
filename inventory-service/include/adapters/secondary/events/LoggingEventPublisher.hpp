#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief Публикация событий в лог (без брокера)
 */
class LoggingEventPublisher : public ports::output::IEventPublisher {
public:
    LoggingEventPublisher() {
        std::cout << "[LoggingEventPublisher] Created" << std::endl;
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        std::cout << "[LoggingEventPublisher] " << routingKey << " " << message << std::endl;
    }
};

} // namespace inventory::adapters::secondary
