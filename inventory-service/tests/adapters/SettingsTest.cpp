/**
 * @file SettingsTest.cpp
 * @brief Unit tests for environment and JSON configuration
 */

#include <gtest/gtest.h>
#include "settings/DbSettings.hpp"
#include "settings/InventorySettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <cstdlib>

using namespace inventory::settings;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : {"INVENTORY_STORAGE", "INVENTORY_EVENTS", "INVENTORY_MAX_RETRIES",
                                 "INVENTORY_TRANSFER_PREFIX", "INVENTORY_DB_HOST", "INVENTORY_DB_PORT",
                                 "RABBITMQ_HOST", "RABBITMQ_EXCHANGE"}) {
            unsetenv(name);
        }
    }
};

// ============================================================================
// InventorySettings
// ============================================================================

TEST_F(SettingsTest, Inventory_Defaults) {
    InventorySettings settings;

    EXPECT_EQ(settings.getStorage(), StorageBackend::MEMORY);
    EXPECT_EQ(settings.getEvents(), EventSink::LOG);
    EXPECT_EQ(settings.getMaxRetries(), 3);
    EXPECT_EQ(settings.getTransferPrefix(), "T");
}

TEST_F(SettingsTest, Inventory_ReadsEnvironment) {
    setenv("INVENTORY_STORAGE", "postgres", 1);
    setenv("INVENTORY_EVENTS", "rabbitmq", 1);
    setenv("INVENTORY_MAX_RETRIES", "5", 1);
    setenv("INVENTORY_TRANSFER_PREFIX", "TR", 1);

    InventorySettings settings;

    EXPECT_EQ(settings.getStorage(), StorageBackend::POSTGRES);
    EXPECT_EQ(settings.getEvents(), EventSink::RABBITMQ);
    EXPECT_EQ(settings.getMaxRetries(), 5);
    EXPECT_EQ(settings.getTransferPrefix(), "TR");
}

TEST_F(SettingsTest, Inventory_JsonOverridesEnvironment) {
    setenv("INVENTORY_MAX_RETRIES", "5", 1);
    InventorySettings settings;

    settings.applyJson(nlohmann::json::parse(R"({"inventory": {"maxRetries": 7, "storage": "postgres"}})"));

    EXPECT_EQ(settings.getMaxRetries(), 7);
    EXPECT_EQ(settings.getStorage(), StorageBackend::POSTGRES);
    EXPECT_EQ(settings.getTransferPrefix(), "T");
}

TEST_F(SettingsTest, Inventory_UnknownBackend_Throws) {
    setenv("INVENTORY_STORAGE", "redis", 1);

    EXPECT_THROW(InventorySettings(), std::invalid_argument);
}

TEST_F(SettingsTest, Inventory_ZeroRetries_Throws) {
    InventorySettings settings;

    EXPECT_THROW(settings.applyJson(nlohmann::json::parse(R"({"inventory": {"maxRetries": 0}})")),
                 std::invalid_argument);
}

TEST_F(SettingsTest, Inventory_EmptyPrefix_Throws) {
    setenv("INVENTORY_TRANSFER_PREFIX", "", 1);

    EXPECT_THROW(InventorySettings(), std::invalid_argument);
}

// ============================================================================
// DbSettings / RabbitMQSettings
// ============================================================================

TEST_F(SettingsTest, Db_ConnectionStringFromEnvironment) {
    setenv("INVENTORY_DB_HOST", "localhost", 1);
    setenv("INVENTORY_DB_PORT", "6543", 1);

    DbSettings settings;

    EXPECT_EQ(settings.getHost(), "localhost");
    EXPECT_EQ(settings.getPort(), 6543);
    EXPECT_NE(settings.getConnectionString().find("host=localhost port=6543"), std::string::npos);
}

TEST_F(SettingsTest, Db_JsonSectionOverrides) {
    DbSettings settings;

    settings.applyJson(nlohmann::json::parse(R"({"db": {"host": "db.internal", "name": "ledger"}})"));

    EXPECT_EQ(settings.getHost(), "db.internal");
    EXPECT_EQ(settings.getName(), "ledger");
    EXPECT_EQ(settings.getPort(), 5432);
}

TEST_F(SettingsTest, RabbitMQ_DefaultsAndOverrides) {
    setenv("RABBITMQ_HOST", "broker", 1);
    RabbitMQSettings settings;

    EXPECT_EQ(settings.getHost(), "broker");
    EXPECT_EQ(settings.getExchange(), "inventory.events");

    settings.applyJson(nlohmann::json::parse(R"({"rabbitmq": {"exchange": "ledger.events"}})"));
    EXPECT_EQ(settings.getExchange(), "ledger.events");
    EXPECT_EQ(settings.getHost(), "broker");
}
