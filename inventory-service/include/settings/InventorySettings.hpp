#pragma once

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace inventory::settings {

/// Хранилище: in-memory или PostgreSQL
enum class StorageBackend {
    MEMORY,
    POSTGRES
};

/// Куда уходят доменные события
enum class EventSink {
    LOG,
    RABBITMQ
};

inline StorageBackend parseStorageBackend(const std::string& str) {
    if (str == "memory") return StorageBackend::MEMORY;
    if (str == "postgres") return StorageBackend::POSTGRES;
    throw std::invalid_argument("Unknown storage backend: " + str);
}

inline EventSink parseEventSink(const std::string& str) {
    if (str == "log") return EventSink::LOG;
    if (str == "rabbitmq") return EventSink::RABBITMQ;
    throw std::invalid_argument("Unknown event sink: " + str);
}

/**
 * @brief Настройки сервиса остатков
 *
 * Читает из ENV:
 * - INVENTORY_STORAGE (memory | postgres, default: memory)
 * - INVENTORY_EVENTS (log | rabbitmq, default: log)
 * - INVENTORY_MAX_RETRIES (default: 3)
 * - INVENTORY_TRANSFER_PREFIX (default: "T")
 *
 * Секция "inventory" JSON-конфига перекрывает переменные окружения.
 */
class InventorySettings {
public:
    InventorySettings() {
        if (const char* storage = std::getenv("INVENTORY_STORAGE")) {
            storage_ = parseStorageBackend(storage);
        }
        if (const char* events = std::getenv("INVENTORY_EVENTS")) {
            events_ = parseEventSink(events);
        }
        if (const char* retries = std::getenv("INVENTORY_MAX_RETRIES")) {
            maxRetries_ = std::stoi(retries);
        }
        if (const char* prefix = std::getenv("INVENTORY_TRANSFER_PREFIX")) {
            transferPrefix_ = prefix;
        }
        validate();
    }

    void applyJson(const nlohmann::json& config) {
        if (!config.contains("inventory")) return;
        const auto& inventory = config.at("inventory");
        if (inventory.contains("storage")) {
            storage_ = parseStorageBackend(inventory.at("storage").get<std::string>());
        }
        if (inventory.contains("events")) {
            events_ = parseEventSink(inventory.at("events").get<std::string>());
        }
        maxRetries_ = inventory.value("maxRetries", maxRetries_);
        transferPrefix_ = inventory.value("transferPrefix", transferPrefix_);
        validate();
    }

    StorageBackend getStorage() const { return storage_; }
    EventSink getEvents() const { return events_; }
    int getMaxRetries() const { return maxRetries_; }
    std::string getTransferPrefix() const { return transferPrefix_; }

private:
    void validate() const {
        if (maxRetries_ < 1) {
            throw std::invalid_argument("INVENTORY_MAX_RETRIES must be at least 1");
        }
        if (transferPrefix_.empty()) {
            throw std::invalid_argument("INVENTORY_TRANSFER_PREFIX must not be empty");
        }
    }

    StorageBackend storage_ = StorageBackend::MEMORY;
    EventSink events_ = EventSink::LOG;
    int maxRetries_ = 3;
    std::string transferPrefix_ = "T";
};

} // namespace inventory::settings
