// include/InventoryApp.hpp
#pragma once

#include <boost/di.hpp>
#include <nlohmann/json.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/InventorySettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Ports
#include "ports/input/IInventoryUnitService.hpp"
#include "ports/input/IStockItemService.hpp"
#include "ports/input/IStockLocationService.hpp"
#include "ports/input/IStockTransferService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/ISequenceGenerator.hpp"
#include "ports/output/IUnitOfWork.hpp"

// Application
#include "application/BackorderAllocator.hpp"
#include "application/InventoryUnitService.hpp"
#include "application/NumberGenerator.hpp"
#include "application/RetryPolicy.hpp"
#include "application/StockItemService.hpp"
#include "application/StockLedger.hpp"
#include "application/StockLocationService.hpp"
#include "application/StockTransferService.hpp"

// Secondary Adapters
#include "adapters/secondary/events/LoggingEventPublisher.hpp"
#include "adapters/secondary/events/RabbitMQEventPublisher.hpp"
#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"
#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"
#include "adapters/secondary/sequence/AtomicSequenceGenerator.hpp"
#include "adapters/secondary/sequence/PostgresSequenceGenerator.hpp"

// Primary Adapters
#include "adapters/primary/CommandBatchRunner.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace di = boost::di;

namespace inventory
{

    /**
     * @brief Inventory Ledger Application
     *
     * Хранилище: in-memory или PostgreSQL (INVENTORY_STORAGE)
     * События: лог или RabbitMQ (INVENTORY_EVENTS), exchange inventory.events
     * Вход: пакет JSON-команд из файла (--batch) или stdin
     *
     * Аргументы:
     *   --config <path>  JSON-конфиг, перекрывает переменные окружения
     *   --batch <path>   пакет команд (по умолчанию stdin)
     *   --output <path>  куда писать результаты (по умолчанию stdout)
     */
    class InventoryApp
    {
    public:
        InventoryApp() { std::cout << "[InventoryApp] Initializing..." << std::endl; }

        ~InventoryApp()
        {
            if (rabbitMQPublisher_)
            {
                rabbitMQPublisher_->stop();
            }
            std::cout << "[InventoryApp] Shutting down..." << std::endl;
        }

        /**
         * @brief Template Method: loadEnvironment → configureInjection → start
         * @return Код выхода: 0, если все команды пакета выполнены успешно
         */
        int run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            return start();
        }

        /// Остановить после текущей команды
        void stop() { stopRequested_ = true; }

    protected:
        void loadEnvironment(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];
                if (i + 1 >= argc)
                {
                    throw std::invalid_argument("Missing value for argument " + arg);
                }
                if (arg == "--config")
                    configPath_ = argv[++i];
                else if (arg == "--batch")
                    batchPath_ = argv[++i];
                else if (arg == "--output")
                    outputPath_ = argv[++i];
                else
                    throw std::invalid_argument("Unknown argument: " + arg);
            }

            dbSettings_ = std::make_shared<settings::DbSettings>();
            rabbitMQSettings_ = std::make_shared<settings::RabbitMQSettings>();
            inventorySettings_ = std::make_shared<settings::InventorySettings>();

            if (configPath_)
            {
                auto config = readJsonFile(*configPath_);
                dbSettings_->applyJson(config);
                rabbitMQSettings_->applyJson(config);
                inventorySettings_->applyJson(config);
                std::cout << "[InventoryApp] Config loaded from " << *configPath_ << std::endl;
            }

            std::cout << "[InventoryApp] Environment loaded" << std::endl;
        }

        void configureInjection()
        {
            std::cout << "[InventoryApp] Configuring DI..." << std::endl;

            // Шаг 1: адаптеры выбираются настройками, в injector попадают готовые экземпляры
            std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory;
            std::shared_ptr<ports::output::ISequenceGenerator> sequenceGenerator;

            if (inventorySettings_->getStorage() == settings::StorageBackend::POSTGRES)
            {
                uowFactory = std::make_shared<adapters::secondary::PostgresUnitOfWorkFactory>(dbSettings_);
                sequenceGenerator = std::make_shared<adapters::secondary::PostgresSequenceGenerator>(dbSettings_);
            }
            else
            {
                auto store = std::make_shared<adapters::secondary::InMemoryInventoryStore>();
                uowFactory = std::make_shared<adapters::secondary::InMemoryUnitOfWorkFactory>(store);
                sequenceGenerator = std::make_shared<adapters::secondary::AtomicSequenceGenerator>();
            }

            std::shared_ptr<ports::output::IEventPublisher> eventPublisher;
            if (inventorySettings_->getEvents() == settings::EventSink::RABBITMQ)
            {
                rabbitMQPublisher_ = std::make_shared<adapters::secondary::RabbitMQEventPublisher>(rabbitMQSettings_);
                eventPublisher = rabbitMQPublisher_;
            }
            else
            {
                eventPublisher = std::make_shared<adapters::secondary::LoggingEventPublisher>();
            }

            auto retryPolicy = std::make_shared<application::RetryPolicy>(inventorySettings_->getMaxRetries());

            // Шаг 2: основной injector с instance binding для адаптеров
            auto injector = di::make_injector(
                di::bind<settings::InventorySettings>().to(inventorySettings_),

                di::bind<ports::output::IUnitOfWorkFactory>().to(uowFactory),
                di::bind<ports::output::ISequenceGenerator>().to(sequenceGenerator),
                di::bind<ports::output::IEventPublisher>().to(eventPublisher),
                di::bind<application::RetryPolicy>().to(retryPolicy),

                di::bind<application::BackorderAllocator>().in(di::singleton),
                di::bind<application::StockLedger>().in(di::singleton),
                di::bind<application::NumberGenerator>().in(di::singleton),

                di::bind<ports::input::IStockItemService>().to<application::StockItemService>().in(di::singleton),
                di::bind<ports::input::IStockTransferService>().to<application::StockTransferService>().in(di::singleton),
                di::bind<ports::input::IInventoryUnitService>().to<application::InventoryUnitService>().in(di::singleton),
                di::bind<ports::input::IStockLocationService>().to<application::StockLocationService>().in(di::singleton));

            // Шаг 3: первичный адаптер
            runner_ = injector.create<std::shared_ptr<adapters::primary::CommandBatchRunner>>();

            std::cout << "[InventoryApp] Ready" << std::endl;
        }

        int start()
        {
            auto batch = batchPath_ ? readJsonFile(*batchPath_) : nlohmann::json::parse(std::cin);
            const auto &commands = adapters::primary::CommandBatchRunner::commandsOf(batch);

            nlohmann::json results = nlohmann::json::array();
            int failed = 0;
            for (const auto &command : commands)
            {
                if (stopRequested_)
                {
                    std::cout << "[InventoryApp] Stop requested, " << results.size()
                              << " of " << commands.size() << " commands executed" << std::endl;
                    break;
                }
                auto response = runner_->runOne(command);
                if (!response.at("ok").get<bool>())
                {
                    ++failed;
                }
                results.push_back(std::move(response));
            }

            writeResults(results);
            if (rabbitMQPublisher_)
            {
                rabbitMQPublisher_->stop();
            }
            std::cout << "[InventoryApp] Batch finished: " << results.size() << " executed, "
                      << failed << " failed" << std::endl;
            return failed == 0 ? 0 : 2;
        }

    private:
        static nlohmann::json readJsonFile(const std::string &path)
        {
            std::ifstream in(path);
            if (!in)
            {
                throw std::runtime_error("Cannot open file: " + path);
            }
            return nlohmann::json::parse(in);
        }

        void writeResults(const nlohmann::json &results) const
        {
            if (!outputPath_)
            {
                std::cout << results.dump(2) << std::endl;
                return;
            }
            std::ofstream out(*outputPath_);
            if (!out)
            {
                throw std::runtime_error("Cannot write file: " + *outputPath_);
            }
            out << results.dump(2) << std::endl;
        }

        std::optional<std::string> configPath_;
        std::optional<std::string> batchPath_;
        std::optional<std::string> outputPath_;

        std::shared_ptr<settings::DbSettings> dbSettings_;
        std::shared_ptr<settings::RabbitMQSettings> rabbitMQSettings_;
        std::shared_ptr<settings::InventorySettings> inventorySettings_;

        std::shared_ptr<adapters::secondary::RabbitMQEventPublisher> rabbitMQPublisher_;
        std::shared_ptr<adapters::primary::CommandBatchRunner> runner_;
        std::atomic<bool> stopRequested_{false};
    };

} // namespace inventory
