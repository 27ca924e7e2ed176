#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"
#include "ports/output/PersistenceExceptions.hpp"
#include <iostream>

namespace inventory::adapters::secondary {

namespace {

const char* const ITEM_COLUMNS =
    "id, variant_id, stock_location_id, sku, quantity_on_hand, quantity_reserved, backorderable, "
    "row_version, created_at, updated_at, deleted_at";

const char* const MOVEMENT_COLUMNS =
    "id, stock_item_id, quantity, originator, action, reason, stock_transfer_id, created_at";

const char* const LOCATION_COLUMNS =
    "id, name, presentation, active, is_default, address1, address2, city, zipcode, phone, company, "
    "country_id, state_id, row_version, created_at, updated_at, deleted_at";

const char* const TRANSFER_COLUMNS =
    "id, number, source_location_id, destination_location_id, reference, created_at";

const char* const UNIT_COLUMNS =
    "id, variant_id, order_id, line_item_id, quantity, state, stock_location_id, shipment_id, "
    "serial_number, return_item_id, row_version, created_at, updated_at, state_changed_at";

std::optional<std::string> optionalText(const pqxx::row& row, const char* column) {
    if (row[column].is_null()) return std::nullopt;
    return row[column].as<std::string>();
}

domain::Timestamp timestampOf(const pqxx::row& row, const char* column) {
    return domain::Timestamp::fromString(row[column].as<std::string>());
}

std::optional<domain::Timestamp> optionalTimestamp(const pqxx::row& row, const char* column) {
    if (row[column].is_null()) return std::nullopt;
    return timestampOf(row, column);
}

std::optional<std::string> toText(const std::optional<domain::Timestamp>& ts) {
    if (!ts) return std::nullopt;
    return ts->toString();
}

domain::StockItem rowToItem(const pqxx::row& row) {
    domain::StockItemData data;
    data.id = row["id"].as<std::string>();
    data.variantId = row["variant_id"].as<std::string>();
    data.stockLocationId = row["stock_location_id"].as<std::string>();
    data.sku = row["sku"].as<std::string>();
    data.quantityOnHand = row["quantity_on_hand"].as<int64_t>();
    data.quantityReserved = row["quantity_reserved"].as<int64_t>();
    data.backorderable = row["backorderable"].as<bool>();
    data.version = row["row_version"].as<int64_t>();
    data.createdAt = timestampOf(row, "created_at");
    data.updatedAt = timestampOf(row, "updated_at");
    data.deletedAt = optionalTimestamp(row, "deleted_at");
    return domain::StockItem::restore(std::move(data));
}

domain::StockMovement rowToMovement(const pqxx::row& row) {
    domain::StockMovement movement;
    movement.id = row["id"].as<std::string>();
    movement.stockItemId = row["stock_item_id"].as<std::string>();
    movement.quantity = row["quantity"].as<int64_t>();
    movement.originator = domain::parseMovementOriginator(row["originator"].as<std::string>());
    movement.action = domain::parseMovementAction(row["action"].as<std::string>());
    movement.reason = optionalText(row, "reason");
    movement.stockTransferId = optionalText(row, "stock_transfer_id");
    movement.createdAt = timestampOf(row, "created_at");
    return movement;
}

domain::StockLocation rowToLocation(const pqxx::row& row) {
    domain::StockLocation location;
    location.id = row["id"].as<std::string>();
    location.name = row["name"].as<std::string>();
    location.presentation = row["presentation"].as<std::string>();
    location.active = row["active"].as<bool>();
    location.isDefault = row["is_default"].as<bool>();
    location.address.address1 = row["address1"].as<std::string>();
    location.address.address2 = row["address2"].as<std::string>();
    location.address.city = row["city"].as<std::string>();
    location.address.zipcode = row["zipcode"].as<std::string>();
    location.address.phone = row["phone"].as<std::string>();
    location.address.company = row["company"].as<std::string>();
    location.address.countryId = optionalText(row, "country_id");
    location.address.stateId = optionalText(row, "state_id");
    location.version = row["row_version"].as<int64_t>();
    location.createdAt = timestampOf(row, "created_at");
    location.updatedAt = timestampOf(row, "updated_at");
    location.deletedAt = optionalTimestamp(row, "deleted_at");
    return location;
}

domain::StockTransfer rowToTransfer(const pqxx::row& row) {
    domain::StockTransfer transfer;
    transfer.id = row["id"].as<std::string>();
    transfer.number = row["number"].as<std::string>();
    transfer.sourceLocationId = optionalText(row, "source_location_id");
    transfer.destinationLocationId = optionalText(row, "destination_location_id");
    transfer.reference = optionalText(row, "reference");
    transfer.createdAt = timestampOf(row, "created_at");
    return transfer;
}

domain::InventoryUnit rowToUnit(const pqxx::row& row) {
    domain::InventoryUnitData data;
    data.id = row["id"].as<std::string>();
    data.variantId = row["variant_id"].as<std::string>();
    data.orderId = row["order_id"].as<std::string>();
    data.lineItemId = row["line_item_id"].as<std::string>();
    data.quantity = row["quantity"].as<int64_t>();
    data.state = domain::parseInventoryUnitState(row["state"].as<std::string>());
    data.stockLocationId = optionalText(row, "stock_location_id");
    data.shipmentId = optionalText(row, "shipment_id");
    data.serialNumber = optionalText(row, "serial_number");
    data.returnItemId = optionalText(row, "return_item_id");
    data.version = row["row_version"].as<int64_t>();
    data.createdAt = timestampOf(row, "created_at");
    data.updatedAt = timestampOf(row, "updated_at");
    data.stateChangedAt = timestampOf(row, "state_changed_at");
    return domain::InventoryUnit::restore(std::move(data));
}

/// Ноль затронутых строк при UPDATE ... WHERE row_version = $N означает конфликт
void requireUpdated(const pqxx::result& result, const std::string& entity, const std::string& id) {
    if (result.affected_rows() == 0) {
        throw ports::output::ConcurrencyException(entity + " " + id + " was modified concurrently");
    }
}

} // namespace

// ============================================================================
// StockItem
// ============================================================================

void PostgresStockItemRepository::add(domain::StockItem& item) {
    const auto& d = item.data();
    try {
        txn_.exec_params(
            R"(INSERT INTO stock_items
                   (id, variant_id, stock_location_id, sku, quantity_on_hand, quantity_reserved,
                    backorderable, row_version, created_at, updated_at, deleted_at)
               VALUES ($1, $2, $3, $4, $5, $6, $7, 1, $8, $9, $10))",
            d.id, d.variantId, d.stockLocationId, d.sku, d.quantityOnHand, d.quantityReserved,
            d.backorderable, d.createdAt.toString(), d.updatedAt.toString(), toText(d.deletedAt));
    } catch (const pqxx::unique_violation& e) {
        throw ports::output::DuplicateKeyException(
            "Stock item for variant '" + d.variantId + "' already exists in stock location '" +
            d.stockLocationId + "'");
    }
    item.setVersion(1);
}

void PostgresStockItemRepository::update(domain::StockItem& item) {
    const auto& d = item.data();
    auto result = txn_.exec_params(
        R"(UPDATE stock_items
           SET sku = $2, quantity_on_hand = $3, quantity_reserved = $4, backorderable = $5,
               updated_at = $6, deleted_at = $7, row_version = row_version + 1
           WHERE id = $1 AND row_version = $8)",
        d.id, d.sku, d.quantityOnHand, d.quantityReserved, d.backorderable,
        d.updatedAt.toString(), toText(d.deletedAt), d.version);
    requireUpdated(result, "Stock item", d.id);
    item.setVersion(d.version + 1);
}

std::optional<domain::StockItem> PostgresStockItemRepository::findById(const std::string& id) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + ITEM_COLUMNS + " FROM stock_items WHERE id = $1", id);
    if (result.empty()) return std::nullopt;
    return rowToItem(result[0]);
}

std::optional<domain::StockItem> PostgresStockItemRepository::findByVariantAndLocation(
    const std::string& variantId, const std::string& stockLocationId)
{
    auto result = txn_.exec_params(
        std::string("SELECT ") + ITEM_COLUMNS +
            " FROM stock_items WHERE variant_id = $1 AND stock_location_id = $2 AND deleted_at IS NULL",
        variantId, stockLocationId);
    if (result.empty()) return std::nullopt;
    return rowToItem(result[0]);
}

std::vector<domain::StockItem> PostgresStockItemRepository::findByLocation(const std::string& stockLocationId) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + ITEM_COLUMNS +
            " FROM stock_items WHERE stock_location_id = $1 AND deleted_at IS NULL ORDER BY created_at, id",
        stockLocationId);

    std::vector<domain::StockItem> items;
    for (const auto& row : result) {
        items.push_back(rowToItem(row));
    }
    return items;
}

// ============================================================================
// StockMovement
// ============================================================================

void PostgresStockMovementRepository::append(const domain::StockMovement& m) {
    txn_.exec_params(
        R"(INSERT INTO stock_movements
               (id, stock_item_id, quantity, originator, action, reason, stock_transfer_id, created_at)
           VALUES ($1, $2, $3, $4, $5, $6, $7, $8))",
        m.id, m.stockItemId, m.quantity, domain::toString(m.originator), domain::toString(m.action),
        m.reason, m.stockTransferId, m.createdAt.toString());
}

std::vector<domain::StockMovement> PostgresStockMovementRepository::findByStockItem(const std::string& stockItemId) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + MOVEMENT_COLUMNS +
            " FROM stock_movements WHERE stock_item_id = $1 ORDER BY seq",
        stockItemId);

    std::vector<domain::StockMovement> movements;
    for (const auto& row : result) {
        movements.push_back(rowToMovement(row));
    }
    return movements;
}

std::vector<domain::StockMovement> PostgresStockMovementRepository::findByTransfer(const std::string& stockTransferId) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + MOVEMENT_COLUMNS +
            " FROM stock_movements WHERE stock_transfer_id = $1 ORDER BY seq",
        stockTransferId);

    std::vector<domain::StockMovement> movements;
    for (const auto& row : result) {
        movements.push_back(rowToMovement(row));
    }
    return movements;
}

// ============================================================================
// StockLocation
// ============================================================================

void PostgresStockLocationRepository::add(domain::StockLocation& l) {
    txn_.exec_params(
        R"(INSERT INTO stock_locations
               (id, name, presentation, active, is_default, address1, address2, city, zipcode, phone,
                company, country_id, state_id, row_version, created_at, updated_at, deleted_at)
           VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, 1, $14, $15, $16))",
        l.id, l.name, l.presentation, l.active, l.isDefault, l.address.address1, l.address.address2,
        l.address.city, l.address.zipcode, l.address.phone, l.address.company, l.address.countryId,
        l.address.stateId, l.createdAt.toString(), l.updatedAt.toString(), toText(l.deletedAt));
    l.version = 1;
}

void PostgresStockLocationRepository::update(domain::StockLocation& l) {
    auto result = txn_.exec_params(
        R"(UPDATE stock_locations
           SET name = $2, presentation = $3, active = $4, is_default = $5, address1 = $6, address2 = $7,
               city = $8, zipcode = $9, phone = $10, company = $11, country_id = $12, state_id = $13,
               updated_at = $14, deleted_at = $15, row_version = row_version + 1
           WHERE id = $1 AND row_version = $16)",
        l.id, l.name, l.presentation, l.active, l.isDefault, l.address.address1, l.address.address2,
        l.address.city, l.address.zipcode, l.address.phone, l.address.company, l.address.countryId,
        l.address.stateId, l.updatedAt.toString(), toText(l.deletedAt), l.version);
    requireUpdated(result, "Stock location", l.id);
    l.version += 1;
}

std::optional<domain::StockLocation> PostgresStockLocationRepository::findById(const std::string& id) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + LOCATION_COLUMNS + " FROM stock_locations WHERE id = $1", id);
    if (result.empty()) return std::nullopt;
    return rowToLocation(result[0]);
}

std::vector<domain::StockLocation> PostgresStockLocationRepository::findAll() {
    auto result = txn_.exec(
        std::string("SELECT ") + LOCATION_COLUMNS +
        " FROM stock_locations WHERE deleted_at IS NULL ORDER BY created_at, id");

    std::vector<domain::StockLocation> locations;
    for (const auto& row : result) {
        locations.push_back(rowToLocation(row));
    }
    return locations;
}

std::optional<domain::StockLocation> PostgresStockLocationRepository::findDefault() {
    auto result = txn_.exec(
        std::string("SELECT ") + LOCATION_COLUMNS +
        " FROM stock_locations WHERE deleted_at IS NULL AND is_default ORDER BY updated_at DESC LIMIT 1");
    if (result.empty()) return std::nullopt;
    return rowToLocation(result[0]);
}

// ============================================================================
// StockTransfer
// ============================================================================

void PostgresStockTransferRepository::add(const domain::StockTransfer& t) {
    try {
        txn_.exec_params(
            R"(INSERT INTO stock_transfers
                   (id, number, source_location_id, destination_location_id, reference, created_at)
               VALUES ($1, $2, $3, $4, $5, $6))",
            t.id, t.number, t.sourceLocationId, t.destinationLocationId, t.reference, t.createdAt.toString());
    } catch (const pqxx::unique_violation& e) {
        throw ports::output::DuplicateKeyException("Stock transfer number already used: " + t.number);
    }
}

std::optional<domain::StockTransfer> PostgresStockTransferRepository::findById(const std::string& id) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + TRANSFER_COLUMNS + " FROM stock_transfers WHERE id = $1", id);
    if (result.empty()) return std::nullopt;
    return rowToTransfer(result[0]);
}

// ============================================================================
// InventoryUnit
// ============================================================================

void PostgresInventoryUnitRepository::add(domain::InventoryUnit& unit) {
    const auto& d = unit.data();
    txn_.exec_params(
        R"(INSERT INTO inventory_units
               (id, variant_id, order_id, line_item_id, quantity, state, stock_location_id, shipment_id,
                serial_number, return_item_id, row_version, created_at, updated_at, state_changed_at)
           VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, 1, $11, $12, $13))",
        d.id, d.variantId, d.orderId, d.lineItemId, d.quantity, domain::toString(d.state),
        d.stockLocationId, d.shipmentId, d.serialNumber, d.returnItemId,
        d.createdAt.toString(), d.updatedAt.toString(), d.stateChangedAt.toString());
    unit.setVersion(1);
}

void PostgresInventoryUnitRepository::update(domain::InventoryUnit& unit) {
    const auto& d = unit.data();
    auto result = txn_.exec_params(
        R"(UPDATE inventory_units
           SET quantity = $2, state = $3, stock_location_id = $4, shipment_id = $5, return_item_id = $6,
               updated_at = $7, state_changed_at = $8, row_version = row_version + 1
           WHERE id = $1 AND row_version = $9)",
        d.id, d.quantity, domain::toString(d.state), d.stockLocationId, d.shipmentId, d.returnItemId,
        d.updatedAt.toString(), d.stateChangedAt.toString(), d.version);
    requireUpdated(result, "Inventory unit", d.id);
    unit.setVersion(d.version + 1);
}

std::optional<domain::InventoryUnit> PostgresInventoryUnitRepository::findById(const std::string& id) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + UNIT_COLUMNS + " FROM inventory_units WHERE id = $1", id);
    if (result.empty()) return std::nullopt;
    return rowToUnit(result[0]);
}

std::vector<domain::InventoryUnit> PostgresInventoryUnitRepository::findByOrder(const std::string& orderId) {
    auto result = txn_.exec_params(
        std::string("SELECT ") + UNIT_COLUMNS +
            " FROM inventory_units WHERE order_id = $1 ORDER BY created_at, seq",
        orderId);

    std::vector<domain::InventoryUnit> units;
    for (const auto& row : result) {
        units.push_back(rowToUnit(row));
    }
    return units;
}

std::vector<domain::InventoryUnit> PostgresInventoryUnitRepository::findBackordered(
    const std::string& variantId, const std::string& stockLocationId)
{
    auto result = txn_.exec_params(
        std::string("SELECT ") + UNIT_COLUMNS +
            " FROM inventory_units"
            " WHERE variant_id = $1 AND stock_location_id = $2 AND state = 'BACKORDERED'"
            " ORDER BY created_at, seq",
        variantId, stockLocationId);

    std::vector<domain::InventoryUnit> units;
    for (const auto& row : result) {
        units.push_back(rowToUnit(row));
    }
    return units;
}

// ============================================================================
// Unit of work
// ============================================================================

PostgresUnitOfWork::PostgresUnitOfWork(pqxx::connection& connection, std::unique_lock<std::mutex> lock)
    : lock_(std::move(lock))
    , txn_(connection)
    , stockItems_(txn_)
    , stockMovements_(txn_)
    , stockLocations_(txn_)
    , stockTransfers_(txn_)
    , inventoryUnits_(txn_)
{
}

void PostgresUnitOfWork::commit() {
    try {
        txn_.commit();
    } catch (const pqxx::transaction_rollback& e) {
        throw ports::output::ConcurrencyException(e.what());
    } catch (const pqxx::unique_violation& e) {
        throw ports::output::DuplicateKeyException(e.what());
    }
}

PostgresUnitOfWorkFactory::PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
    : settings_(std::move(settings))
{
    std::cout << "[PostgresUnitOfWorkFactory] Connecting to " << settings_->getHost() << ":"
              << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;
    try {
        connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        std::cout << "[PostgresUnitOfWorkFactory] Connected" << std::endl;
        initSchema();
    } catch (const std::exception& e) {
        std::cerr << "[PostgresUnitOfWorkFactory] Initialization failed: " << e.what() << std::endl;
        throw;
    }
}

PostgresUnitOfWorkFactory::~PostgresUnitOfWorkFactory() {
    if (connection_ && connection_->is_open()) {
        connection_->close();
    }
}

std::unique_ptr<ports::output::IUnitOfWork> PostgresUnitOfWorkFactory::begin() {
    std::unique_lock<std::mutex> lock(mutex_);
    return std::make_unique<PostgresUnitOfWork>(*connection_, std::move(lock));
}

void PostgresUnitOfWorkFactory::initSchema() {
    pqxx::work txn(*connection_);

    txn.exec("SET TIME ZONE 'UTC'");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS stock_locations (
            id            TEXT PRIMARY KEY,
            name          TEXT NOT NULL,
            presentation  TEXT NOT NULL,
            active        BOOLEAN NOT NULL DEFAULT TRUE,
            is_default    BOOLEAN NOT NULL DEFAULT FALSE,
            address1      TEXT NOT NULL DEFAULT '',
            address2      TEXT NOT NULL DEFAULT '',
            city          TEXT NOT NULL DEFAULT '',
            zipcode       TEXT NOT NULL DEFAULT '',
            phone         TEXT NOT NULL DEFAULT '',
            company       TEXT NOT NULL DEFAULT '',
            country_id    TEXT,
            state_id      TEXT,
            row_version   BIGINT NOT NULL DEFAULT 1,
            created_at    TIMESTAMPTZ NOT NULL,
            updated_at    TIMESTAMPTZ NOT NULL,
            deleted_at    TIMESTAMPTZ
        )
    )");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS stock_items (
            id                 TEXT PRIMARY KEY,
            variant_id         TEXT NOT NULL,
            stock_location_id  TEXT NOT NULL REFERENCES stock_locations(id),
            sku                TEXT NOT NULL DEFAULT '',
            quantity_on_hand   BIGINT NOT NULL CHECK (quantity_on_hand >= 0),
            quantity_reserved  BIGINT NOT NULL CHECK (quantity_reserved >= 0),
            backorderable      BOOLEAN NOT NULL DEFAULT TRUE,
            row_version        BIGINT NOT NULL DEFAULT 1,
            created_at         TIMESTAMPTZ NOT NULL,
            updated_at         TIMESTAMPTZ NOT NULL,
            deleted_at         TIMESTAMPTZ
        )
    )");

    txn.exec(R"(
        CREATE UNIQUE INDEX IF NOT EXISTS ux_stock_items_location_variant
            ON stock_items (stock_location_id, variant_id) WHERE deleted_at IS NULL
    )");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS stock_movements (
            seq                BIGSERIAL,
            id                 TEXT PRIMARY KEY,
            stock_item_id      TEXT NOT NULL REFERENCES stock_items(id),
            quantity           BIGINT NOT NULL CHECK (quantity <> 0),
            originator         TEXT NOT NULL,
            action             TEXT NOT NULL,
            reason             TEXT,
            stock_transfer_id  TEXT,
            created_at         TIMESTAMPTZ NOT NULL
        )
    )");

    txn.exec("CREATE INDEX IF NOT EXISTS ix_stock_movements_item ON stock_movements (stock_item_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS ix_stock_movements_transfer ON stock_movements (stock_transfer_id)");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS stock_transfers (
            id                       TEXT PRIMARY KEY,
            number                   TEXT NOT NULL UNIQUE,
            source_location_id       TEXT REFERENCES stock_locations(id),
            destination_location_id  TEXT REFERENCES stock_locations(id),
            reference                TEXT,
            created_at               TIMESTAMPTZ NOT NULL
        )
    )");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS inventory_units (
            seq                BIGSERIAL,
            id                 TEXT PRIMARY KEY,
            variant_id         TEXT NOT NULL,
            order_id           TEXT NOT NULL,
            line_item_id       TEXT NOT NULL,
            quantity           BIGINT NOT NULL CHECK (quantity >= 1),
            state              TEXT NOT NULL,
            stock_location_id  TEXT,
            shipment_id        TEXT,
            serial_number      TEXT,
            return_item_id     TEXT,
            row_version        BIGINT NOT NULL DEFAULT 1,
            created_at         TIMESTAMPTZ NOT NULL,
            updated_at         TIMESTAMPTZ NOT NULL,
            state_changed_at   TIMESTAMPTZ NOT NULL
        )
    )");

    txn.exec(R"(
        CREATE INDEX IF NOT EXISTS ix_inventory_units_backorders
            ON inventory_units (variant_id, stock_location_id, state, created_at, seq)
    )");
    txn.exec("CREATE INDEX IF NOT EXISTS ix_inventory_units_order ON inventory_units (order_id)");

    txn.commit();

    // Для всех последующих транзакций соединения
    connection_->set_session_var("TimeZone", "UTC");

    std::cout << "[PostgresUnitOfWorkFactory] Schema initialized" << std::endl;
}

} // namespace inventory::adapters::secondary
