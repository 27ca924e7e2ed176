/**
 * @file InMemoryUnitOfWorkTest.cpp
 * @brief Unit tests for the in-memory unit of work
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"

using namespace inventory;
using namespace inventory::domain;
using inventory::adapters::secondary::InMemoryInventoryStore;
using inventory::adapters::secondary::InMemoryUnitOfWorkFactory;
using inventory::ports::output::ConcurrencyException;
using inventory::ports::output::DuplicateKeyException;

class InMemoryUnitOfWorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryInventoryStore>();
        factory_ = std::make_unique<InMemoryUnitOfWorkFactory>(store_);
    }

    static StockItem newItem(const std::string& variantId, int64_t onHand = 0) {
        return StockItem::create(variantId, "loc-1", "SKU-" + variantId, onHand).value();
    }

    std::string seedItem(const std::string& variantId, int64_t onHand = 10) {
        auto uow = factory_->begin();
        auto item = newItem(variantId, onHand);
        uow->stockItems().add(item);
        uow->commit();
        return item.id();
    }

    std::shared_ptr<InMemoryInventoryStore> store_;
    std::unique_ptr<InMemoryUnitOfWorkFactory> factory_;
};

// ============================================================================
// TRANSACTION BOUNDARY
// ============================================================================

TEST_F(InMemoryUnitOfWorkTest, NoCommit_ChangesDiscarded) {
    std::string id;
    {
        auto uow = factory_->begin();
        auto item = newItem("variant-1");
        uow->stockItems().add(item);
        id = item.id();
    }

    auto reader = factory_->begin();
    EXPECT_FALSE(reader->stockItems().findById(id).has_value());
    EXPECT_FALSE(reader->stockItems().findByVariantAndLocation("variant-1", "loc-1").has_value());
}

TEST_F(InMemoryUnitOfWorkTest, StagedChanges_VisibleOnlyInsideUnitOfWork) {
    auto writer = factory_->begin();
    auto item = newItem("variant-1", 3);
    writer->stockItems().add(item);

    auto other = factory_->begin();
    EXPECT_TRUE(writer->stockItems().findByVariantAndLocation("variant-1", "loc-1").has_value());
    EXPECT_FALSE(other->stockItems().findById(item.id()).has_value());

    writer->commit();
    auto reader = factory_->begin();
    ASSERT_TRUE(reader->stockItems().findById(item.id()).has_value());
    EXPECT_EQ(reader->stockItems().findById(item.id())->quantityOnHand(), 3);
}

TEST_F(InMemoryUnitOfWorkTest, Commit_Twice_Throws) {
    auto uow = factory_->begin();
    uow->commit();

    EXPECT_THROW(uow->commit(), std::logic_error);
}

TEST_F(InMemoryUnitOfWorkTest, MovementsAndItems_CommittedTogether) {
    auto id = seedItem("variant-1");

    {
        auto uow = factory_->begin();
        auto item = uow->stockItems().findById(id).value();
        auto movement = item.adjust(5, MovementOriginator::ADJUSTMENT);
        ASSERT_TRUE(movement.isSuccess());
        uow->stockItems().update(item);
        uow->stockMovements().append(movement.value());
        // без commit
    }

    auto reader = factory_->begin();
    EXPECT_EQ(reader->stockItems().findById(id)->quantityOnHand(), 10);
    EXPECT_TRUE(reader->stockMovements().findByStockItem(id).empty());
}

// ============================================================================
// OPTIMISTIC VERSIONING
// ============================================================================

TEST_F(InMemoryUnitOfWorkTest, Update_BumpsVersion) {
    auto id = seedItem("variant-1");

    auto uow = factory_->begin();
    auto item = uow->stockItems().findById(id).value();
    EXPECT_EQ(item.version(), 1);
    ASSERT_TRUE(item.reserve(1).isSuccess());
    uow->stockItems().update(item);
    uow->commit();

    auto reader = factory_->begin();
    EXPECT_EQ(reader->stockItems().findById(id)->version(), 2);
}

TEST_F(InMemoryUnitOfWorkTest, ConcurrentUpdates_SecondCommitConflicts) {
    auto id = seedItem("variant-1");

    auto first = factory_->begin();
    auto second = factory_->begin();
    auto a = first->stockItems().findById(id).value();
    auto b = second->stockItems().findById(id).value();

    ASSERT_TRUE(a.reserve(3).isSuccess());
    ASSERT_TRUE(b.reserve(4).isSuccess());
    first->stockItems().update(a);
    second->stockItems().update(b);

    first->commit();
    EXPECT_THROW(second->commit(), ConcurrencyException);

    auto reader = factory_->begin();
    EXPECT_EQ(reader->stockItems().findById(id)->quantityReserved(), 3);
}

TEST_F(InMemoryUnitOfWorkTest, ConflictingCommit_AppliesNothing) {
    auto id = seedItem("variant-1");

    auto stale = factory_->begin();
    auto item = stale->stockItems().findById(id).value();

    auto winner = factory_->begin();
    auto fresh = winner->stockItems().findById(id).value();
    ASSERT_TRUE(fresh.reserve(1).isSuccess());
    winner->stockItems().update(fresh);
    winner->commit();

    auto movement = item.adjust(2, MovementOriginator::ADJUSTMENT);
    ASSERT_TRUE(movement.isSuccess());
    stale->stockItems().update(item);
    stale->stockMovements().append(movement.value());
    auto extra = newItem("variant-2");
    stale->stockItems().add(extra);

    EXPECT_THROW(stale->commit(), ConcurrencyException);

    auto reader = factory_->begin();
    EXPECT_TRUE(reader->stockMovements().findByStockItem(id).empty());
    EXPECT_FALSE(reader->stockItems().findById(extra.id()).has_value());
}

// ============================================================================
// UNIQUENESS
// ============================================================================

TEST_F(InMemoryUnitOfWorkTest, SameVariantAndLocation_SecondInsertRejected) {
    auto first = factory_->begin();
    auto second = factory_->begin();
    auto a = newItem("variant-1");
    auto b = newItem("variant-1");
    first->stockItems().add(a);
    second->stockItems().add(b);

    first->commit();
    EXPECT_THROW(second->commit(), DuplicateKeyException);
}

TEST_F(InMemoryUnitOfWorkTest, DeletedItem_FreesVariantSlot) {
    auto id = seedItem("variant-1", 0);
    {
        auto uow = factory_->begin();
        auto item = uow->stockItems().findById(id).value();
        item.markDeleted();
        uow->stockItems().update(item);
        uow->commit();
    }

    auto uow = factory_->begin();
    auto replacement = newItem("variant-1");
    uow->stockItems().add(replacement);
    EXPECT_NO_THROW(uow->commit());

    auto reader = factory_->begin();
    auto found = reader->stockItems().findByVariantAndLocation("variant-1", "loc-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id(), replacement.id());
}

TEST_F(InMemoryUnitOfWorkTest, TransferNumber_MustBeUnique) {
    auto first = StockTransfer::create("T2405010001", std::string("loc-1"), std::string("loc-2")).value();
    auto second = StockTransfer::create("T2405010001", std::string("loc-1"), std::string("loc-2")).value();

    auto a = factory_->begin();
    a->stockTransfers().add(first);
    a->commit();

    auto b = factory_->begin();
    b->stockTransfers().add(second);
    EXPECT_THROW(b->commit(), DuplicateKeyException);

    auto reader = factory_->begin();
    EXPECT_TRUE(reader->stockTransfers().findById(first.id).has_value());
    EXPECT_FALSE(reader->stockTransfers().findById(second.id).has_value());
}

// ============================================================================
// INVENTORY UNITS
// ============================================================================

TEST_F(InMemoryUnitOfWorkTest, FindBackordered_CreationOrderAcrossCommits) {
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto uow = factory_->begin();
        auto unit = InventoryUnit::create("variant-1", "order-" + std::to_string(i), "line", 1,
                                          InventoryUnitState::BACKORDERED, std::string("loc-1")).value();
        uow->inventoryUnits().add(unit);
        uow->commit();
        ids.push_back(unit.id());
    }

    auto uow = factory_->begin();
    auto pending = InventoryUnit::create("variant-1", "order-3", "line", 1,
                                         InventoryUnitState::BACKORDERED, std::string("loc-1")).value();
    uow->inventoryUnits().add(pending);
    ids.push_back(pending.id());

    auto backorders = uow->inventoryUnits().findBackordered("variant-1", "loc-1");

    ASSERT_EQ(backorders.size(), 4u);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(backorders[i].id(), ids[i]);
    }
}

TEST_F(InMemoryUnitOfWorkTest, FindBackordered_SkipsStagedFill) {
    std::string id;
    {
        auto uow = factory_->begin();
        auto unit = InventoryUnit::create("variant-1", "order-1", "line", 1,
                                          InventoryUnitState::BACKORDERED, std::string("loc-1")).value();
        uow->inventoryUnits().add(unit);
        uow->commit();
        id = unit.id();
    }

    auto uow = factory_->begin();
    auto unit = uow->inventoryUnits().findById(id).value();
    ASSERT_TRUE(unit.fillBackorder().isSuccess());
    uow->inventoryUnits().update(unit);

    EXPECT_TRUE(uow->inventoryUnits().findBackordered("variant-1", "loc-1").empty());
}
