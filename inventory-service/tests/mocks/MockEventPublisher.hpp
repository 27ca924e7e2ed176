#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace inventory::tests {

/**
 * @brief Mock реализация IEventPublisher для тестов
 *
 * Запоминает опубликованные сообщения; может имитировать недоступность брокера.
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;

        nlohmann::json json() const { return nlohmann::json::parse(message); }
    };

    // Получение опубликованных сообщений
    const std::vector<PublishedMessage>& getPublishedMessages() const {
        return messages_;
    }

    std::vector<std::string> routingKeys() const {
        std::vector<std::string> keys;
        for (const auto& m : messages_) {
            keys.push_back(m.routingKey);
        }
        return keys;
    }

    void clearMessages() {
        messages_.clear();
    }

    int publishCallCount() const { return static_cast<int>(messages_.size()); }

    void setFailing(bool failing) { failing_ = failing; }

    // IEventPublisher implementation
    void publish(const std::string& routingKey, const std::string& message) override {
        if (failing_) {
            throw std::runtime_error("Broker unavailable");
        }
        messages_.push_back({routingKey, message});
    }

private:
    std::vector<PublishedMessage> messages_;
    bool failing_ = false;
};

} // namespace inventory::tests
