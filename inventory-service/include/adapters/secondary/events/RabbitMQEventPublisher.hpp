#pragma once

#include "adapters/secondary/events/PublishBuffer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace inventory::adapters::secondary {

/**
 * @brief Публикация доменных событий в RabbitMQ
 *
 * Архитектура:
 * - Exchange: topic (inventory.events), durable
 * - Routing key = тип события (stock.adjusted, inventory_unit.shipped, ...)
 * - Соединение и канал живут в отдельном потоке io_context
 * - publish() кладёт сообщение в outbox_ и будит поток io_context;
 *   до объявления exchange сообщения ждут в PublishBuffer
 * - stop() ждёт отправки принятых сообщений не дольше DRAIN_TIMEOUT,
 *   всё, что осталось неотправленным, пишется в лог поштучно
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    static constexpr std::chrono::seconds DRAIN_TIMEOUT{5};

    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ioContext_()
        , work_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQEventPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
        start();
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQEventPublisher] Dropped " << routingKey << " (not running): "
                      << message.substr(0, 100) << std::endl;
            return;
        }
        {
            std::lock_guard<std::mutex> lock(outboxMutex_);
            outbox_.emplace_back(routingKey, message);
        }
        boost::asio::post(ioContext_, [this]() { pump(); });
    }

    void start() {
        if (running_) return;
        running_ = true;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                workerFailed_ = true;
                std::cerr << "[RabbitMQEventPublisher] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQEventPublisher] Started" << std::endl;
    }

    void stop() {
        if (!running_) return;
        running_ = false;

        if (!workerFailed_) {
            auto closed = std::make_shared<std::promise<void>>();
            auto done = closed->get_future();
            boost::asio::post(ioContext_, [this, closed]() { closeWhenDrained(closed); });
            if (done.wait_for(DRAIN_TIMEOUT) != std::future_status::ready) {
                std::cerr << "[RabbitMQEventPublisher] Drain timed out after "
                          << DRAIN_TIMEOUT.count() << "s" << std::endl;
            }
        }

        work_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        // Поток io_context остановлен: остатки буфера и outbox_ уже никто не отправит
        size_t dropped = buffer_.discard("publisher stopped");
        {
            std::lock_guard<std::mutex> lock(outboxMutex_);
            for (const auto& [routingKey, message] : outbox_) {
                buffer_.submit(routingKey, message, nullptr);
            }
            outbox_.clear();
        }
        dropped += buffer_.discard("publisher stopped");

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQEventPublisher] Stopped";
        if (dropped > 0) {
            std::cout << ", " << dropped << " event(s) dropped";
        }
        std::cout << std::endl;
    }

private:
    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQEventPublisher] Exchange declared: " << exchangeName_ << std::endl;
                const size_t flushed = buffer_.open([this](const std::string& r, const std::string& m) { send(r, m); });
                if (flushed > 0) {
                    std::cout << "[RabbitMQEventPublisher] Flushed " << flushed << " buffered event(s)" << std::endl;
                }
                if (closing_) {
                    closeChannel();
                }
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Exchange error: " << msg << std::endl;
                exchangeFailed_ = true;
                buffer_.discard("exchange not declared");
                resolveClose();
            });
    }

    /// Поток io_context: перенести новые сообщения из outbox_ в канал или буфер
    void pump() {
        std::deque<std::pair<std::string, std::string>> batch;
        {
            std::lock_guard<std::mutex> lock(outboxMutex_);
            batch.swap(outbox_);
        }
        for (const auto& [routingKey, message] : batch) {
            if (exchangeFailed_) {
                std::cerr << "[RabbitMQEventPublisher] Dropped " << routingKey << " (exchange not declared): "
                          << message.substr(0, 100) << std::endl;
                continue;
            }
            buffer_.submit(routingKey, message, [this](const std::string& r, const std::string& m) { send(r, m); });
        }
    }

    void send(const std::string& routingKey, const std::string& message) {
        try {
            channel_->publish(exchangeName_, routingKey, message);
            std::cout << "[RabbitMQEventPublisher] Published " << routingKey
                      << ": " << message.substr(0, 100) << "..." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[RabbitMQEventPublisher] Dropped " << routingKey << " (publish error: "
                      << e.what() << ")" << std::endl;
        }
    }

    /**
     * @brief Поток io_context: закрыть канал после отправки всего принятого
     *
     * Закрытие канала подтверждается брокером после обработки всех
     * предыдущих кадров публикации. Если exchange ещё не объявлен,
     * закрытие откладывается до его объявления.
     */
    void closeWhenDrained(std::shared_ptr<std::promise<void>> closed) {
        pump();
        closing_ = std::move(closed);
        if (exchangeFailed_ || !channel_) {
            resolveClose();
        } else if (buffer_.ready()) {
            closeChannel();
        }
    }

    void closeChannel() {
        channel_->close()
            .onSuccess([this]() {
                connection_->close();
                resolveClose();
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Channel close error: " << msg << std::endl;
                resolveClose();
            });
    }

    void resolveClose() {
        if (closing_) {
            closing_->set_value();
            closing_.reset();
        }
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> workerFailed_{false};
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::mutex outboxMutex_;
    std::deque<std::pair<std::string, std::string>> outbox_;

    // Состояние потока io_context
    PublishBuffer buffer_;
    bool exchangeFailed_ = false;
    std::shared_ptr<std::promise<void>> closing_;

    std::thread workerThread_;
};

} // namespace inventory::adapters::secondary
