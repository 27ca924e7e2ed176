#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>

namespace inventory::adapters::secondary {

class PostgresStockItemRepository : public ports::output::IStockItemRepository {
public:
    explicit PostgresStockItemRepository(pqxx::work& txn) : txn_(txn) {}

    void add(domain::StockItem& item) override;
    void update(domain::StockItem& item) override;
    std::optional<domain::StockItem> findById(const std::string& id) override;
    std::optional<domain::StockItem> findByVariantAndLocation(
        const std::string& variantId, const std::string& stockLocationId) override;
    std::vector<domain::StockItem> findByLocation(const std::string& stockLocationId) override;

private:
    pqxx::work& txn_;
};

class PostgresStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    explicit PostgresStockMovementRepository(pqxx::work& txn) : txn_(txn) {}

    void append(const domain::StockMovement& movement) override;
    std::vector<domain::StockMovement> findByStockItem(const std::string& stockItemId) override;
    std::vector<domain::StockMovement> findByTransfer(const std::string& stockTransferId) override;

private:
    pqxx::work& txn_;
};

class PostgresStockLocationRepository : public ports::output::IStockLocationRepository {
public:
    explicit PostgresStockLocationRepository(pqxx::work& txn) : txn_(txn) {}

    void add(domain::StockLocation& location) override;
    void update(domain::StockLocation& location) override;
    std::optional<domain::StockLocation> findById(const std::string& id) override;
    std::vector<domain::StockLocation> findAll() override;
    std::optional<domain::StockLocation> findDefault() override;

private:
    pqxx::work& txn_;
};

class PostgresStockTransferRepository : public ports::output::IStockTransferRepository {
public:
    explicit PostgresStockTransferRepository(pqxx::work& txn) : txn_(txn) {}

    void add(const domain::StockTransfer& transfer) override;
    std::optional<domain::StockTransfer> findById(const std::string& id) override;

private:
    pqxx::work& txn_;
};

class PostgresInventoryUnitRepository : public ports::output::IInventoryUnitRepository {
public:
    explicit PostgresInventoryUnitRepository(pqxx::work& txn) : txn_(txn) {}

    void add(domain::InventoryUnit& unit) override;
    void update(domain::InventoryUnit& unit) override;
    std::optional<domain::InventoryUnit> findById(const std::string& id) override;
    std::vector<domain::InventoryUnit> findByOrder(const std::string& orderId) override;
    std::vector<domain::InventoryUnit> findBackordered(
        const std::string& variantId, const std::string& stockLocationId) override;

private:
    pqxx::work& txn_;
};

/**
 * @brief Единица работы = одна транзакция pqxx::work
 *
 * Держит блокировку соединения фабрики на всё время жизни.
 * Разрушение без commit() откатывает транзакцию (деструктор pqxx::work).
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    PostgresUnitOfWork(pqxx::connection& connection, std::unique_lock<std::mutex> lock);

    ports::output::IStockItemRepository& stockItems() override { return stockItems_; }
    ports::output::IStockMovementRepository& stockMovements() override { return stockMovements_; }
    ports::output::IStockLocationRepository& stockLocations() override { return stockLocations_; }
    ports::output::IStockTransferRepository& stockTransfers() override { return stockTransfers_; }
    ports::output::IInventoryUnitRepository& inventoryUnits() override { return inventoryUnits_; }

    void commit() override;

private:
    std::unique_lock<std::mutex> lock_;
    pqxx::work txn_;

    PostgresStockItemRepository stockItems_;
    PostgresStockMovementRepository stockMovements_;
    PostgresStockLocationRepository stockLocations_;
    PostgresStockTransferRepository stockTransfers_;
    PostgresInventoryUnitRepository inventoryUnits_;
};

/**
 * @brief Фабрика транзакций PostgreSQL
 *
 * Подключается при создании и создаёт схему (initSchema).
 */
class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings);
    ~PostgresUnitOfWorkFactory() override;

    std::unique_ptr<ports::output::IUnitOfWork> begin() override;

private:
    void initSchema();

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace inventory::adapters::secondary
