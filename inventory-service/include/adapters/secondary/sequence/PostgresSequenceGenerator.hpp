#pragma once

#include "ports/output/ISequenceGenerator.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace inventory::adapters::secondary {

/**
 * @brief Последовательности PostgreSQL (nextval)
 *
 * Общие для всех экземпляров сервиса, работающих с одной БД.
 * Последовательность создаётся при первом обращении.
 */
class PostgresSequenceGenerator : public ports::output::ISequenceGenerator {
public:
    explicit PostgresSequenceGenerator(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSequenceGenerator] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresSequenceGenerator] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSequenceGenerator] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresSequenceGenerator() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    int64_t next(const std::string& sequenceName) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            // nextval не откатывается вместе с транзакцией, поэтому отдельная work
            pqxx::work txn(*connection_);
            const std::string name = txn.quote_name(sequenceName);
            txn.exec("CREATE SEQUENCE IF NOT EXISTS " + name);
            auto result = txn.exec("SELECT nextval('" + txn.esc(name) + "')");
            txn.commit();
            return result[0][0].as<int64_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSequenceGenerator] next(" << sequenceName << ") failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace inventory::adapters::secondary
