/**
 * @file StockItemTest.cpp
 * @brief Unit tests for StockItem
 */

#include <gtest/gtest.h>
#include "domain/StockItem.hpp"
#include <limits>

using namespace inventory::domain;

class StockItemTest : public ::testing::Test {
protected:
    static StockItem makeItem(int64_t onHand, bool backorderable = true, int64_t reserved = 0) {
        auto result = StockItem::create("variant-1", "loc-1", "SKU-1", onHand, reserved, backorderable);
        EXPECT_TRUE(result.isSuccess());
        return std::move(result).value();
    }
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(StockItemTest, Create_SetsFieldsAndDefaults) {
    auto result = StockItem::create("variant-1", "loc-1", "SKU-1");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_FALSE(result->id().empty());
    EXPECT_EQ(result->variantId(), "variant-1");
    EXPECT_EQ(result->stockLocationId(), "loc-1");
    EXPECT_EQ(result->quantityOnHand(), 0);
    EXPECT_EQ(result->quantityReserved(), 0);
    EXPECT_TRUE(result->backorderable());
    EXPECT_FALSE(result->isDeleted());
}

TEST_F(StockItemTest, Create_NegativeQuantity_Fails) {
    auto result = StockItem::create("variant-1", "loc-1", "SKU-1", -1);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(result.error().kind(), ErrorKind::VALIDATION);
}

// ============================================================================
// COUNT AVAILABLE
// ============================================================================

TEST_F(StockItemTest, CountAvailable_NeverNegative) {
    auto item = makeItem(3, true);

    ASSERT_TRUE(item.reserve(5).isSuccess());

    EXPECT_EQ(item.quantityReserved(), 5);
    EXPECT_EQ(item.countAvailable(), 0);
    EXPECT_TRUE(item.inStock());
}

TEST_F(StockItemTest, InStock_NonBackorderableWithoutAvailable_False) {
    auto item = makeItem(0, false);
    EXPECT_FALSE(item.inStock());
}

// ============================================================================
// ADJUST
// ============================================================================

TEST_F(StockItemTest, Adjust_Positive_IncreasesOnHand) {
    auto item = makeItem(10);

    auto movement = item.adjust(5, MovementOriginator::SUPPLIER, std::string("restock"));

    ASSERT_TRUE(movement.isSuccess());
    EXPECT_EQ(item.quantityOnHand(), 15);
    EXPECT_EQ(movement->quantity, 5);
    EXPECT_EQ(movement->action, MovementAction::ADJUSTMENT);
    EXPECT_EQ(movement->originator, MovementOriginator::SUPPLIER);
    EXPECT_EQ(movement->stockItemId, item.id());
    EXPECT_EQ(movement->reason, std::optional<std::string>("restock"));
}

TEST_F(StockItemTest, Adjust_Zero_Fails) {
    auto item = makeItem(10);

    auto movement = item.adjust(0, MovementOriginator::ADJUSTMENT);

    ASSERT_TRUE(movement.isError());
    EXPECT_EQ(movement.error().code, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(item.quantityOnHand(), 10);
}

TEST_F(StockItemTest, Adjust_BelowZero_FailsWithoutChange) {
    auto item = makeItem(2);

    auto movement = item.adjust(-3, MovementOriginator::DAMAGE);

    ASSERT_TRUE(movement.isError());
    EXPECT_EQ(movement.error().code, ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(item.quantityOnHand(), 2);
}

TEST_F(StockItemTest, Adjust_BeyondMaximum_FailsWithoutChange) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    auto item = makeItem(max - 1);

    auto overflow = item.adjust(2, MovementOriginator::SUPPLIER);

    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.error().code, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(overflow.error().kind(), ErrorKind::VALIDATION);
    EXPECT_EQ(item.quantityOnHand(), max - 1);

    ASSERT_TRUE(item.adjust(1, MovementOriginator::SUPPLIER).isSuccess());
    EXPECT_EQ(item.quantityOnHand(), max);
}

TEST_F(StockItemTest, Adjust_StampsTransferId) {
    auto item = makeItem(5);

    auto movement = item.adjust(-2, MovementOriginator::STOCK_TRANSFER, std::string("Unstock"), std::string("transfer-1"));

    ASSERT_TRUE(movement.isSuccess());
    EXPECT_EQ(movement->stockTransferId, std::optional<std::string>("transfer-1"));
    EXPECT_TRUE(movement->isDecrease());
}

// ============================================================================
// RESERVE / RELEASE
// ============================================================================

// Остаток 10, без бэкордеров: 12 не резервируется, 10 резервируется полностью
TEST_F(StockItemTest, Reserve_NonBackorderable_BoundedByAvailable) {
    auto item = makeItem(10, false);

    auto tooMuch = item.reserve(12);
    ASSERT_TRUE(tooMuch.isError());
    EXPECT_EQ(tooMuch.error().code, ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(tooMuch.error().kind(), ErrorKind::INSUFFICIENT_STOCK);
    EXPECT_EQ(item.quantityReserved(), 0);

    auto exact = item.reserve(10);
    ASSERT_TRUE(exact.isSuccess());
    EXPECT_EQ(item.countAvailable(), 0);
    EXPECT_EQ(item.quantityReserved(), 10);
}

TEST_F(StockItemTest, Reserve_Backorderable_MayExceedOnHand) {
    auto item = makeItem(2, true);

    ASSERT_TRUE(item.reserve(7).isSuccess());
    EXPECT_EQ(item.quantityReserved(), 7);
    EXPECT_EQ(item.quantityOnHand(), 2);
}

TEST_F(StockItemTest, Reserve_RecordsOrderMovement) {
    auto item = makeItem(10);

    auto movement = item.reserve(4, std::string("order-7"));

    ASSERT_TRUE(movement.isSuccess());
    EXPECT_EQ(movement->quantity, -4);
    EXPECT_EQ(movement->originator, MovementOriginator::ORDER);
    EXPECT_EQ(movement->action, MovementAction::RESERVED);
    EXPECT_EQ(movement->reason, std::optional<std::string>("Order order-7"));
}

TEST_F(StockItemTest, Reserve_NonPositive_Fails) {
    auto item = makeItem(10);
    EXPECT_EQ(item.reserve(0).error().code, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(item.reserve(-1).error().code, ErrorCode::INVALID_QUANTITY);
}

TEST_F(StockItemTest, Reserve_BeyondMaximum_FailsWithoutChange) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    auto item = makeItem(0, true, max);

    auto overflow = item.reserve(1);

    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.error().code, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(item.quantityReserved(), max);
}

TEST_F(StockItemTest, ReserveThenRelease_RestoresReserved) {
    auto item = makeItem(10);

    auto reserved = item.reserve(6, std::string("order-1"));
    auto released = item.release(6, "order-1");

    ASSERT_TRUE(reserved.isSuccess());
    ASSERT_TRUE(released.isSuccess());
    EXPECT_EQ(item.quantityReserved(), 0);
    EXPECT_EQ(item.quantityOnHand(), 10);
    EXPECT_EQ(reserved->quantity + released->quantity, 0);
    EXPECT_EQ(released->action, MovementAction::RELEASED);
    EXPECT_EQ(released->reason, std::optional<std::string>("Order order-1 canceled"));
}

TEST_F(StockItemTest, Release_MoreThanReserved_Fails) {
    auto item = makeItem(10);
    ASSERT_TRUE(item.reserve(2).isSuccess());

    auto result = item.release(3, "order-1");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_RELEASE);
    EXPECT_EQ(item.quantityReserved(), 2);
}

// ============================================================================
// CONFIRM SHIPMENT
// ============================================================================

TEST_F(StockItemTest, ConfirmShipment_MoreThanReserved_Fails) {
    auto item = makeItem(10);
    ASSERT_TRUE(item.reserve(5).isSuccess());

    auto result = item.confirmShipment(6, "shipment-1");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_SHIPMENT);
    EXPECT_EQ(item.quantityReserved(), 5);
    EXPECT_EQ(item.quantityOnHand(), 10);
}

TEST_F(StockItemTest, ConfirmShipment_DecrementsBoth) {
    auto item = makeItem(10);
    ASSERT_TRUE(item.reserve(5).isSuccess());

    auto movement = item.confirmShipment(4, "shipment-1");

    ASSERT_TRUE(movement.isSuccess());
    EXPECT_EQ(item.quantityReserved(), 1);
    EXPECT_EQ(item.quantityOnHand(), 6);
    EXPECT_EQ(movement->quantity, -4);
    EXPECT_EQ(movement->originator, MovementOriginator::SHIPMENT);
    EXPECT_EQ(movement->action, MovementAction::SOLD);
}

TEST_F(StockItemTest, ConfirmShipment_BeyondOnHand_Fails) {
    auto item = makeItem(1, true);
    ASSERT_TRUE(item.reserve(3).isSuccess());

    auto result = item.confirmShipment(3, "shipment-1");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INSUFFICIENT_STOCK);
}

// ============================================================================
// CORRECT RESERVED
// ============================================================================

TEST_F(StockItemTest, CorrectReserved_RecordsRecountAdjustment) {
    auto item = makeItem(10);
    ASSERT_TRUE(item.reserve(2).isSuccess());

    auto movement = item.correctReserved(5);

    ASSERT_TRUE(movement.isSuccess());
    EXPECT_EQ(item.quantityReserved(), 5);
    EXPECT_EQ(movement->quantity, -3);
    EXPECT_EQ(movement->originator, MovementOriginator::RECOUNT);
    EXPECT_EQ(movement->action, MovementAction::ADJUSTMENT);
    EXPECT_EQ(movement->reason, std::optional<std::string>("Reserved quantity correction"));
}

TEST_F(StockItemTest, CorrectReserved_UnchangedOrNegative_Fails) {
    auto item = makeItem(10);
    EXPECT_EQ(item.correctReserved(0).error().code, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(item.correctReserved(-2).error().code, ErrorCode::INVALID_QUANTITY);
}

TEST_F(StockItemTest, CorrectReserved_NonBackorderableAboveOnHand_Fails) {
    auto item = makeItem(4, false);
    EXPECT_EQ(item.correctReserved(5).error().code, ErrorCode::INSUFFICIENT_STOCK);
}

// ============================================================================
// DETAILS / DELETE
// ============================================================================

TEST_F(StockItemTest, UpdateDetails_ReportsChange) {
    auto item = makeItem(0);

    EXPECT_TRUE(item.updateDetails("SKU-2", false));
    EXPECT_FALSE(item.updateDetails("SKU-2", false));
    EXPECT_EQ(item.sku(), "SKU-2");
    EXPECT_FALSE(item.backorderable());
}

TEST_F(StockItemTest, MarkDeleted_SetsDeletedAt) {
    auto item = makeItem(0);

    item.markDeleted();

    EXPECT_TRUE(item.isDeleted());
    ASSERT_TRUE(item.deletedAt().has_value());
}
