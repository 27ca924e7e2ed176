#pragma once

#include "ports/output/ISequenceGenerator.hpp"
#include <ThreadSafeMap.hpp>
#include <atomic>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Последовательности в памяти процесса
 *
 * Подходит для одного экземпляра сервиса (in-memory хранилище, тесты).
 */
class AtomicSequenceGenerator : public ports::output::ISequenceGenerator {
public:
    int64_t next(const std::string& sequenceName) override {
        auto counter = counters_.find(sequenceName);
        if (!counter) {
            counters_.insertIfAbsent(sequenceName, std::make_shared<std::atomic<int64_t>>(0));
            counter = counters_.find(sequenceName);
        }
        return ++(*counter);
    }

private:
    ThreadSafeMap<std::string, std::atomic<int64_t>> counters_;
};

} // namespace inventory::adapters::secondary
