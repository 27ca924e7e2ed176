#include <gtest/gtest.h>
#include "domain/StockMovement.hpp"

using namespace inventory::domain;

TEST(StockMovementTest, Create_ZeroQuantity_Fails) {
    auto result = StockMovement::create("item-1", 0, MovementOriginator::ADJUSTMENT, MovementAction::ADJUSTMENT);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_QUANTITY);
}

TEST(StockMovementTest, Create_SignDeterminesDirection) {
    auto increase = StockMovement::create("item-1", 3, MovementOriginator::FOUND, MovementAction::ADJUSTMENT);
    auto decrease = StockMovement::create("item-1", -3, MovementOriginator::LOSS, MovementAction::LOST,
                                          std::string("shrinkage"));

    ASSERT_TRUE(increase.isSuccess());
    ASSERT_TRUE(decrease.isSuccess());
    EXPECT_TRUE(increase->isIncrease());
    EXPECT_FALSE(increase->isDecrease());
    EXPECT_TRUE(decrease->isDecrease());
    EXPECT_EQ(decrease->reason, std::optional<std::string>("shrinkage"));
    EXPECT_NE(increase->id, decrease->id);
}

TEST(StockMovementTest, EnumStrings_RoundTrip) {
    EXPECT_EQ(parseMovementOriginator(toString(MovementOriginator::STOCK_TRANSFER)), MovementOriginator::STOCK_TRANSFER);
    EXPECT_EQ(parseMovementAction(toString(MovementAction::RELEASED)), MovementAction::RELEASED);
    EXPECT_THROW(parseMovementOriginator("BOGUS"), std::invalid_argument);
}
