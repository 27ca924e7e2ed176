#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdlib>

namespace inventory::settings {

/**
 * @brief Настройки RabbitMQ
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER (default: "guest")
 * - RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_EXCHANGE (default: "inventory.events")
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* exchange = std::getenv("RABBITMQ_EXCHANGE")) {
            exchange_ = exchange;
        }
    }

    /// Перекрыть значения из секции "rabbitmq" JSON-конфига
    void applyJson(const nlohmann::json& config) {
        if (!config.contains("rabbitmq")) return;
        const auto& rabbit = config.at("rabbitmq");
        host_ = rabbit.value("host", host_);
        port_ = rabbit.value("port", port_);
        user_ = rabbit.value("user", user_);
        password_ = rabbit.value("password", password_);
        exchange_ = rabbit.value("exchange", exchange_);
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getExchange() const { return exchange_; }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string exchange_ = "inventory.events";
};

} // namespace inventory::settings
