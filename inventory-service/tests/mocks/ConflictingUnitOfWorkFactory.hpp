#pragma once

#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"
#include "ports/output/PersistenceExceptions.hpp"
#include <memory>

namespace inventory::tests {

/**
 * @brief Фабрика, чьи первые N коммитов проигрывают конкурентной записи
 *
 * Оборачивает in-memory единицу работы: commit() бросает ConcurrencyException,
 * пока не исчерпан заданный счётчик, затем фиксирует изменения как обычно.
 */
class ConflictingUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    ConflictingUnitOfWorkFactory(std::shared_ptr<adapters::secondary::InMemoryInventoryStore> store, int conflicts)
        : inner_(std::move(store)), remainingConflicts_(conflicts) {}

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        ++begun_;
        return std::make_unique<UnitOfWork>(inner_.begin(), remainingConflicts_, commits_);
    }

    int begun() const { return begun_; }
    int commits() const { return commits_; }

private:
    class UnitOfWork : public ports::output::IUnitOfWork {
    public:
        UnitOfWork(std::unique_ptr<ports::output::IUnitOfWork> inner, int& remainingConflicts, int& commits)
            : inner_(std::move(inner)), remainingConflicts_(remainingConflicts), commits_(commits) {}

        ports::output::IStockItemRepository& stockItems() override { return inner_->stockItems(); }
        ports::output::IStockMovementRepository& stockMovements() override { return inner_->stockMovements(); }
        ports::output::IStockLocationRepository& stockLocations() override { return inner_->stockLocations(); }
        ports::output::IStockTransferRepository& stockTransfers() override { return inner_->stockTransfers(); }
        ports::output::IInventoryUnitRepository& inventoryUnits() override { return inner_->inventoryUnits(); }

        void commit() override {
            if (remainingConflicts_ > 0) {
                --remainingConflicts_;
                throw ports::output::ConcurrencyException("simulated concurrent update");
            }
            inner_->commit();
            ++commits_;
        }

    private:
        std::unique_ptr<ports::output::IUnitOfWork> inner_;
        int& remainingConflicts_;
        int& commits_;
    };

    adapters::secondary::InMemoryUnitOfWorkFactory inner_;
    int remainingConflicts_;
    int begun_ = 0;
    int commits_ = 0;
};

} // namespace inventory::tests
