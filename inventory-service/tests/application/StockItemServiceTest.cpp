/**
 * @file StockItemServiceTest.cpp
 * @brief Unit tests for StockItemService
 */

#include "ServiceFixture.hpp"
#include "mocks/ConflictingUnitOfWorkFactory.hpp"
#include "mocks/InterleavingUnitOfWorkFactory.hpp"
#include "domain/events/EventTypes.hpp"

using namespace inventory;
using namespace inventory::domain;
using inventory::tests::ServiceFixture;

class StockItemServiceTest : public ServiceFixture {
protected:
    void SetUp() override {
        ServiceFixture::SetUp();
        locationId_ = createLocation("Main", true);
    }

    Result<StockItem> adjust(const std::string& itemId, int64_t quantity,
                             const std::optional<std::string>& reason = std::nullopt) {
        ports::input::AdjustStockRequest request;
        request.stockItemId = itemId;
        request.quantity = quantity;
        request.reason = reason;
        return stockItems_->adjust(request);
    }

    std::string locationId_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(StockItemServiceTest, Create_PublishesCreatedEvent) {
    publisher_->clearMessages();

    auto item = createItem("variant-1", locationId_, 10);

    EXPECT_EQ(item.quantityOnHand(), 10);
    ASSERT_EQ(publisher_->publishCallCount(), 1);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].routingKey, events::STOCK_ITEM_CREATED);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].json()["stockItemId"], item.id());
}

TEST_F(StockItemServiceTest, Create_SameVariantAndLocation_DuplicateSku) {
    createItem("variant-1", locationId_, 10);

    ports::input::CreateStockItemRequest request;
    request.variantId = "variant-1";
    request.stockLocationId = locationId_;
    request.sku = "SKU-OTHER";
    auto result = stockItems_->createStockItem(request);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::DUPLICATE_SKU);
    EXPECT_EQ(result.error().kind(), ErrorKind::CONFLICT);
}

TEST_F(StockItemServiceTest, Create_UnknownLocation_NotFound) {
    ports::input::CreateStockItemRequest request;
    request.variantId = "variant-1";
    request.stockLocationId = "missing";
    auto result = stockItems_->createStockItem(request);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// RESERVE / SHIP
// ============================================================================

TEST_F(StockItemServiceTest, Reserve_NonBackorderable_RejectedThenAccepted) {
    auto item = createItem("variant-1", locationId_, 10, false);
    publisher_->clearMessages();

    auto rejected = stockItems_->reserve(item.id(), 12);
    ASSERT_TRUE(rejected.isError());
    EXPECT_EQ(rejected.error().code, ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(publisher_->publishCallCount(), 0);

    auto accepted = stockItems_->reserve(item.id(), 10, std::string("order-1"));
    ASSERT_TRUE(accepted.isSuccess());
    EXPECT_EQ(accepted->countAvailable(), 0);

    auto stored = stockItems_->getStockItem(item.id());
    EXPECT_EQ(stored->quantityReserved(), 10);
    ASSERT_EQ(publisher_->publishCallCount(), 1);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].routingKey, events::STOCK_RESERVED);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].json()["countAvailable"], 0);
}

TEST_F(StockItemServiceTest, ConfirmShipment_MoreThanReserved_InvalidShipment) {
    auto item = createItem("variant-1", locationId_, 10);
    ASSERT_TRUE(stockItems_->reserve(item.id(), 5).isSuccess());

    auto result = stockItems_->confirmShipment(item.id(), 6, "shipment-1");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_SHIPMENT);
    auto stored = stockItems_->getStockItem(item.id());
    EXPECT_EQ(stored->quantityOnHand(), 10);
    EXPECT_EQ(stored->quantityReserved(), 5);
}

TEST_F(StockItemServiceTest, ConfirmShipment_DecrementsBothCounters) {
    auto item = createItem("variant-1", locationId_, 10);
    ASSERT_TRUE(stockItems_->reserve(item.id(), 5).isSuccess());

    auto result = stockItems_->confirmShipment(item.id(), 5, "shipment-1");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->quantityOnHand(), 5);
    EXPECT_EQ(result->quantityReserved(), 0);
}

TEST_F(StockItemServiceTest, Release_RestoresAvailability) {
    auto item = createItem("variant-1", locationId_, 10);
    ASSERT_TRUE(stockItems_->reserve(item.id(), 4, std::string("order-1")).isSuccess());

    auto result = stockItems_->release(item.id(), 4, "order-1");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->quantityReserved(), 0);
    EXPECT_EQ(result->countAvailable(), 10);
}

TEST_F(StockItemServiceTest, Reserve_UnknownItem_NotFound) {
    auto result = stockItems_->reserve("missing", 1);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// ADJUST + BACKORDERS
// ============================================================================

TEST_F(StockItemServiceTest, Adjust_FillsOldestBackorderOnly) {
    auto item = createItem("variant-1", locationId_, 0);
    auto first = createBackorder("variant-1", locationId_, 4, "order-1");
    auto second = createBackorder("variant-1", locationId_, 3, "order-2");
    publisher_->clearMessages();

    auto result = adjust(item.id(), 4, std::string("restock"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->quantityOnHand(), 4);
    EXPECT_EQ(stateOf(first.id()), InventoryUnitState::ON_HAND);
    EXPECT_EQ(stateOf(second.id()), InventoryUnitState::BACKORDERED);

    std::vector<std::string> expected = {events::STOCK_ADJUSTED, events::UNIT_BACKORDER_FILLED};
    EXPECT_EQ(publisher_->routingKeys(), expected);
}

TEST_F(StockItemServiceTest, Adjust_FifoStopsAtFirstUnitThatDoesNotFit) {
    auto item = createItem("variant-1", locationId_, 0);
    auto first = createBackorder("variant-1", locationId_, 5, "order-1");
    auto second = createBackorder("variant-1", locationId_, 5, "order-2");
    auto third = createBackorder("variant-1", locationId_, 1, "order-3");

    ASSERT_TRUE(adjust(item.id(), 7).isSuccess());

    EXPECT_EQ(stateOf(first.id()), InventoryUnitState::ON_HAND);
    EXPECT_EQ(stateOf(second.id()), InventoryUnitState::BACKORDERED);
    EXPECT_EQ(stateOf(third.id()), InventoryUnitState::BACKORDERED);
}

TEST_F(StockItemServiceTest, Adjust_Negative_NoBackorderFill) {
    auto item = createItem("variant-1", locationId_, 10);
    auto unit = createBackorder("variant-1", locationId_, 1);

    ASSERT_TRUE(adjust(item.id(), -3).isSuccess());

    EXPECT_EQ(stateOf(unit.id()), InventoryUnitState::BACKORDERED);
}

TEST_F(StockItemServiceTest, Adjust_BelowZero_InsufficientStock) {
    auto item = createItem("variant-1", locationId_, 2);

    auto result = adjust(item.id(), -3);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(stockItems_->getStockItem(item.id())->quantityOnHand(), 2);
}

TEST_F(StockItemServiceTest, Adjust_Zero_InvalidQuantity) {
    auto item = createItem("variant-1", locationId_, 2);

    auto result = adjust(item.id(), 0);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_QUANTITY);
}

// ============================================================================
// MOVEMENTS
// ============================================================================

TEST_F(StockItemServiceTest, GetMovements_OnePerQuantityOperation) {
    auto item = createItem("variant-1", locationId_, 10);
    ASSERT_TRUE(adjust(item.id(), 5).isSuccess());
    ASSERT_TRUE(stockItems_->reserve(item.id(), 2).isSuccess());
    ASSERT_TRUE(stockItems_->reserve(item.id(), 100).isSuccess());
    ASSERT_TRUE(stockItems_->release(item.id(), 100, "order-1").isSuccess());

    auto movements = stockItems_->getMovements(item.id());

    ASSERT_TRUE(movements.isSuccess());
    ASSERT_EQ(movements->size(), 4u);
    EXPECT_EQ(movements->at(0).quantity, 5);
    EXPECT_EQ(movements->at(0).originator, MovementOriginator::ADJUSTMENT);
    for (const auto& movement : movements.value()) {
        EXPECT_EQ(movement.stockItemId, item.id());
        EXPECT_NE(movement.quantity, 0);
    }
}

TEST_F(StockItemServiceTest, CorrectReserved_SetsReservedDirectly) {
    auto item = createItem("variant-1", locationId_, 10);
    ASSERT_TRUE(stockItems_->reserve(item.id(), 6).isSuccess());

    auto result = stockItems_->correctReserved(item.id(), 2, std::string("recount"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->quantityReserved(), 2);
    EXPECT_EQ(result->quantityOnHand(), 10);
}

// ============================================================================
// DELETE
// ============================================================================

TEST_F(StockItemServiceTest, Delete_ReservedCheckedBeforeOnHand) {
    auto item = createItem("variant-1", locationId_, 10);
    ASSERT_TRUE(stockItems_->reserve(item.id(), 1).isSuccess());

    auto result = stockItems_->deleteStockItem(item.id());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::HAS_RESERVED_STOCK);
}

TEST_F(StockItemServiceTest, Delete_OnHandOnly_HasStockItems) {
    auto item = createItem("variant-1", locationId_, 10);

    auto result = stockItems_->deleteStockItem(item.id());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::HAS_STOCK_ITEMS);
}

TEST_F(StockItemServiceTest, Delete_Empty_SoftDeletedAndHidden) {
    auto item = createItem("variant-1", locationId_, 0);

    ASSERT_TRUE(stockItems_->deleteStockItem(item.id()).isSuccess());

    EXPECT_EQ(stockItems_->getStockItem(item.id()).error().code, ErrorCode::NOT_FOUND);
    EXPECT_TRUE(stockItems_->findStockItem("variant-1", locationId_).isError());
    EXPECT_EQ(stockItems_->reserve(item.id(), 1).error().code, ErrorCode::NOT_FOUND);

    // Вариант можно завести на складе заново
    auto recreated = createItem("variant-1", locationId_, 1);
    EXPECT_NE(recreated.id(), item.id());
}

// ============================================================================
// CONCURRENCY / EVENTS
// ============================================================================

TEST_F(StockItemServiceTest, Reserve_ConflictsBelowLimit_RetriedAndApplied) {
    auto item = createItem("variant-1", locationId_, 10);
    auto conflicting = std::make_shared<tests::ConflictingUnitOfWorkFactory>(store_, 2);
    buildServices(conflicting);

    auto result = stockItems_->reserve(item.id(), 3);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(conflicting->begun(), 3);
    EXPECT_EQ(conflicting->commits(), 1);
    EXPECT_EQ(stockItems_->getStockItem(item.id())->quantityReserved(), 3);
    // События только от успешной попытки
    EXPECT_EQ(publisher_->publishCallCount(), 1);
}

TEST_F(StockItemServiceTest, Reserve_ConflictsExhausted_NothingApplied) {
    auto item = createItem("variant-1", locationId_, 10);
    buildServices(std::make_shared<tests::ConflictingUnitOfWorkFactory>(store_, 3));

    auto result = stockItems_->reserve(item.id(), 3);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::CONCURRENCY_CONFLICT);
    EXPECT_EQ(stockItems_->getStockItem(item.id())->quantityReserved(), 0);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(StockItemServiceTest, Create_LocationDeletedBeforeCommit_RetriedAndNotFound) {
    auto otherLocations = locations_;
    bool deleted = false;
    buildServices(std::make_shared<tests::InterleavingUnitOfWorkFactory>(store_, [&]() {
        deleted = otherLocations->deleteLocation(locationId_).isSuccess();
    }));

    ports::input::CreateStockItemRequest request;
    request.variantId = "variant-1";
    request.stockLocationId = locationId_;
    request.sku = "SKU-1";
    request.quantityOnHand = 5;
    auto result = stockItems_->createStockItem(request);

    EXPECT_TRUE(deleted);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
    EXPECT_TRUE(store_->itemsAtLocation(locationId_).empty());
}

TEST_F(StockItemServiceTest, Publish_BrokerDown_StateStillCommitted) {
    auto item = createItem("variant-1", locationId_, 10);
    publisher_->setFailing(true);

    auto result = stockItems_->reserve(item.id(), 3);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(stockItems_->getStockItem(item.id())->quantityReserved(), 3);
}
