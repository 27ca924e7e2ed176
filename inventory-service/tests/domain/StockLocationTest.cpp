#include <gtest/gtest.h>
#include "domain/StockLocation.hpp"

using namespace inventory::domain;

namespace {

StockItem itemWith(int64_t onHand, int64_t reserved) {
    auto result = StockItem::create("variant-" + std::to_string(onHand) + "-" + std::to_string(reserved),
                                    "loc-1", "SKU", onHand, reserved);
    return std::move(result).value();
}

} // namespace

TEST(StockLocationTest, Create_BlankName_Fails) {
    auto result = StockLocation::create("   ");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_NAME);
    EXPECT_EQ(result.error().kind(), ErrorKind::VALIDATION);
}

TEST(StockLocationTest, Create_PresentationDefaultsToName) {
    Address address;
    address.city = "  Berlin ";

    auto result = StockLocation::create(" Main warehouse ", std::nullopt, true, false, address);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result->name, "Main warehouse");
    EXPECT_EQ(result->presentation, "Main warehouse");
    EXPECT_EQ(result->address.city, "Berlin");
    EXPECT_TRUE(result->active);
    EXPECT_FALSE(result->isDefault);
}

TEST(StockLocationTest, Update_ChangesOnlyGivenFields) {
    auto location = StockLocation::create("Main", std::string("Main WH")).value();

    StockLocationUpdate changes;
    changes.active = false;
    auto result = location.update(changes);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value());
    EXPECT_FALSE(location.active);
    EXPECT_EQ(location.name, "Main");
    EXPECT_EQ(location.presentation, "Main WH");

    EXPECT_FALSE(location.update(changes).value());
}

TEST(StockLocationTest, Update_BlankName_Fails) {
    auto location = StockLocation::create("Main").value();

    StockLocationUpdate changes;
    changes.name = "";

    EXPECT_EQ(location.update(changes).error().code, ErrorCode::INVALID_NAME);
    EXPECT_EQ(location.name, "Main");
}

TEST(StockLocationTest, MakeDefaultAndClear) {
    auto location = StockLocation::create("Main").value();

    EXPECT_TRUE(location.makeDefault());
    EXPECT_FALSE(location.makeDefault());
    EXPECT_TRUE(location.isDefault);
    EXPECT_TRUE(location.clearDefault());
    EXPECT_FALSE(location.isDefault);
}

TEST(StockLocationTest, CheckDeletable_ReservedReportedFirst) {
    std::vector<StockItem> items{itemWith(5, 0), itemWith(3, 2)};

    auto result = StockLocation::checkDeletable(items);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::HAS_RESERVED_STOCK);
    EXPECT_EQ(result.error().kind(), ErrorKind::CONFLICT);
}

TEST(StockLocationTest, CheckDeletable_OnHandOnly) {
    std::vector<StockItem> items{itemWith(0, 0), itemWith(4, 0)};

    EXPECT_EQ(StockLocation::checkDeletable(items).error().code, ErrorCode::HAS_STOCK_ITEMS);
}

TEST(StockLocationTest, CheckDeletable_ZeroBalances_Succeeds) {
    std::vector<StockItem> items{itemWith(0, 0)};

    EXPECT_TRUE(StockLocation::checkDeletable(items).isSuccess());
    EXPECT_TRUE(StockLocation::checkDeletable({}).isSuccess());
}

TEST(StockLocationTest, MarkDeletedAndRestore) {
    auto location = StockLocation::create("Main", std::nullopt, true, true).value();

    location.markDeleted();
    EXPECT_TRUE(location.isDeleted());
    EXPECT_FALSE(location.isDefault);

    EXPECT_TRUE(location.restore());
    EXPECT_FALSE(location.isDeleted());
    EXPECT_FALSE(location.restore());
}
