/**
 * @file InventoryUnitServiceTest.cpp
 * @brief Unit tests for InventoryUnitService
 */

#include "ServiceFixture.hpp"
#include "domain/events/EventTypes.hpp"

using namespace inventory;
using namespace inventory::domain;
using inventory::tests::ServiceFixture;

class InventoryUnitServiceTest : public ServiceFixture {
protected:
    void SetUp() override {
        ServiceFixture::SetUp();
        locationId_ = createLocation("Main", true);
    }

    InventoryUnit createOnHand(int64_t quantity, const std::string& orderId = "order-1") {
        ports::input::CreateInventoryUnitRequest request;
        request.variantId = "variant-1";
        request.orderId = orderId;
        request.lineItemId = "line-1";
        request.quantity = quantity;
        request.stockLocationId = locationId_;
        auto result = units_->createUnit(request);
        EXPECT_TRUE(result.isSuccess());
        return std::move(result).value();
    }

    std::string locationId_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(InventoryUnitServiceTest, Create_PersistsAndPublishes) {
    publisher_->clearMessages();

    auto unit = createOnHand(2);

    auto stored = units_->getUnit(unit.id());
    ASSERT_TRUE(stored.isSuccess());
    EXPECT_EQ(stored->state(), InventoryUnitState::ON_HAND);
    EXPECT_EQ(stored->quantity(), 2);
    ASSERT_EQ(publisher_->publishCallCount(), 1);
    EXPECT_EQ(publisher_->getPublishedMessages()[0].routingKey, events::UNIT_CREATED);
}

TEST_F(InventoryUnitServiceTest, Create_UnknownLocation_NotFound) {
    ports::input::CreateInventoryUnitRequest request;
    request.variantId = "variant-1";
    request.orderId = "order-1";
    request.stockLocationId = std::string("missing");

    auto result = units_->createUnit(request);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

TEST_F(InventoryUnitServiceTest, Create_ShippedState_Rejected) {
    ports::input::CreateInventoryUnitRequest request;
    request.variantId = "variant-1";
    request.orderId = "order-1";
    request.initialState = InventoryUnitState::SHIPPED;

    auto result = units_->createUnit(request);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_STATE_TRANSITION);
}

// ============================================================================
// TRANSITIONS
// ============================================================================

TEST_F(InventoryUnitServiceTest, ShipThenReturn_FullLifecycle) {
    auto unit = createOnHand(1);

    auto shipped = units_->ship(unit.id(), std::string("shipment-1"));
    ASSERT_TRUE(shipped.isSuccess());
    EXPECT_EQ(shipped->state(), InventoryUnitState::SHIPPED);
    EXPECT_EQ(shipped->shipmentId().value_or(""), "shipment-1");

    auto returned = units_->returnUnit(unit.id(), std::string("return-1"));
    ASSERT_TRUE(returned.isSuccess());
    EXPECT_EQ(stateOf(unit.id()), InventoryUnitState::RETURNED);
}

TEST_F(InventoryUnitServiceTest, Ship_Backordered_Rejected) {
    auto unit = createBackorder("variant-1", locationId_, 1);

    auto result = units_->ship(unit.id());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::CANNOT_SHIP_FROM_BACKORDERED);
    EXPECT_EQ(stateOf(unit.id()), InventoryUnitState::BACKORDERED);
}

TEST_F(InventoryUnitServiceTest, Return_NotShipped_Rejected) {
    auto unit = createOnHand(1);

    auto result = units_->returnUnit(unit.id());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::CANNOT_RETURN_FROM_NON_SHIPPED);
}

TEST_F(InventoryUnitServiceTest, Cancel_Twice_SecondCallPublishesNothing) {
    auto unit = createOnHand(1);
    publisher_->clearMessages();

    ASSERT_TRUE(units_->cancel(unit.id()).isSuccess());
    auto again = units_->cancel(unit.id());

    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again->state(), InventoryUnitState::CANCELED);
    std::vector<std::string> expected = {events::UNIT_CANCELED};
    EXPECT_EQ(publisher_->routingKeys(), expected);
}

TEST_F(InventoryUnitServiceTest, FillBackorder_OnHand_Idempotent) {
    auto unit = createOnHand(1);
    publisher_->clearMessages();

    auto result = units_->fillBackorder(unit.id());

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->version(), unit.version());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(InventoryUnitServiceTest, Cancel_Shipped_InvalidTransition) {
    auto unit = createOnHand(1);
    ASSERT_TRUE(units_->ship(unit.id()).isSuccess());

    auto result = units_->cancel(unit.id());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_STATE_TRANSITION);
    EXPECT_EQ(result.error().kind(), ErrorKind::STATE_TRANSITION);
}

TEST_F(InventoryUnitServiceTest, Transition_UnknownUnit_NotFound) {
    EXPECT_EQ(units_->ship("missing").error().code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// SPLIT
// ============================================================================

TEST_F(InventoryUnitServiceTest, Split_BothPartsPersisted) {
    auto unit = createOnHand(5);
    publisher_->clearMessages();

    auto result = units_->split(unit.id(), 2);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(units_->getUnit(unit.id())->quantity(), 3);
    auto extracted = units_->getUnit(result->extracted.id());
    ASSERT_TRUE(extracted.isSuccess());
    EXPECT_EQ(extracted->quantity(), 2);
    EXPECT_EQ(extracted->orderId(), "order-1");
    EXPECT_EQ(extracted->state(), InventoryUnitState::ON_HAND);
    EXPECT_EQ(units_->getUnitsByOrder("order-1").size(), 2u);

    std::vector<std::string> expected = {events::UNIT_SPLIT};
    EXPECT_EQ(publisher_->routingKeys(), expected);
}

TEST_F(InventoryUnitServiceTest, Split_WholeQuantity_Rejected) {
    auto unit = createOnHand(2);

    auto result = units_->split(unit.id(), 2);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_SPLIT_QUANTITY);
    EXPECT_EQ(units_->getUnit(unit.id())->quantity(), 2);
}

TEST_F(InventoryUnitServiceTest, Split_Canceled_Rejected) {
    auto unit = createOnHand(2);
    ASSERT_TRUE(units_->cancel(unit.id()).isSuccess());

    auto result = units_->split(unit.id(), 1);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::CANNOT_SPLIT_IN_TERMINAL_STATE);
}

// ============================================================================
// LOCATION / QUERIES
// ============================================================================

TEST_F(InventoryUnitServiceTest, SetStockLocation_Reassigns) {
    auto other = createLocation("Overflow");
    auto unit = createOnHand(1);

    auto result = units_->setStockLocation(unit.id(), other);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(units_->getUnit(unit.id())->stockLocationId().value_or(""), other);
}

TEST_F(InventoryUnitServiceTest, SetStockLocation_UnknownLocation_NotFound) {
    auto unit = createOnHand(1);

    auto result = units_->setStockLocation(unit.id(), "missing");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

TEST_F(InventoryUnitServiceTest, GetBackorderedUnits_InCreationOrder) {
    auto first = createBackorder("variant-1", locationId_, 2, "order-1");
    auto second = createBackorder("variant-1", locationId_, 1, "order-2");
    createOnHand(1, "order-3");

    auto backorders = units_->getBackorderedUnits("variant-1", locationId_);

    ASSERT_EQ(backorders.size(), 2u);
    EXPECT_EQ(backorders[0].id(), first.id());
    EXPECT_EQ(backorders[1].id(), second.id());
}
