#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace inventory::adapters::secondary {

/**
 * @brief Очередь сообщений, ожидающих готовности канала
 *
 * Пока канал не открыт, submit() откладывает сообщения; open() отправляет
 * их в исходном порядке, дальше submit() отправляет сразу.
 * Не потокобезопасна: вызывается только из потока io_context.
 */
class PublishBuffer {
public:
    using Sender = std::function<void(const std::string& routingKey, const std::string& message)>;

    void submit(const std::string& routingKey, const std::string& message, const Sender& send) {
        if (ready_) {
            send(routingKey, message);
            return;
        }
        pending_.emplace_back(routingKey, message);
    }

    /// @return сколько отложенных сообщений отправлено
    size_t open(const Sender& send) {
        ready_ = true;
        size_t sent = 0;
        while (!pending_.empty()) {
            auto [routingKey, message] = std::move(pending_.front());
            pending_.pop_front();
            send(routingKey, message);
            ++sent;
        }
        return sent;
    }

    /**
     * @brief Выбросить отложенные сообщения, записав каждое в лог
     * @return сколько сообщений потеряно
     */
    size_t discard(const std::string& reason) {
        const size_t dropped = pending_.size();
        for (const auto& [routingKey, message] : pending_) {
            std::cerr << "[RabbitMQEventPublisher] Dropped " << routingKey << " (" << reason << "): "
                      << message.substr(0, 100) << std::endl;
        }
        pending_.clear();
        ready_ = false;
        return dropped;
    }

    bool ready() const { return ready_; }
    size_t pendingCount() const { return pending_.size(); }

private:
    bool ready_ = false;
    std::deque<std::pair<std::string, std::string>> pending_;
};

} // namespace inventory::adapters::secondary
