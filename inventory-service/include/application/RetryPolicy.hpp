#pragma once

#include "domain/Result.hpp"
#include "ports/output/PersistenceExceptions.hpp"
#include <iostream>
#include <string>

namespace inventory::application {

/**
 * @brief Повтор операции при оптимистичных конфликтах
 *
 * Операция перезапускается целиком: новая единица работы, повторное чтение,
 * повторная валидация. Бизнес-ошибки (Result) не повторяются.
 *
 * @example
 * ```cpp
 * auto result = retryPolicy_->execute<domain::StockItem>("reserve", [&]() -> domain::Result<domain::StockItem> {
 *     auto uow = uowFactory_->begin();
 *     ...
 *     uow->commit();
 *     return item;
 * });
 * ```
 */
class RetryPolicy {
public:
    explicit RetryPolicy(int maxAttempts = 3)
        : maxAttempts_(maxAttempts < 1 ? 1 : maxAttempts) {}

    int maxAttempts() const { return maxAttempts_; }

    template <typename T, typename Operation>
    domain::Result<T> execute(const std::string& name, Operation&& operation) const {
        for (int attempt = 1;; ++attempt) {
            try {
                return operation();
            } catch (const ports::output::ConcurrencyException& e) {
                std::cout << "[RetryPolicy] " << name << ": version conflict on attempt "
                          << attempt << "/" << maxAttempts_ << " (" << e.what() << ")" << std::endl;
                if (attempt >= maxAttempts_) {
                    return domain::Error::concurrencyConflict(name);
                }
            } catch (const ports::output::DuplicateKeyException& e) {
                std::cout << "[RetryPolicy] " << name << ": duplicate key on attempt "
                          << attempt << "/" << maxAttempts_ << " (" << e.what() << ")" << std::endl;
                if (attempt >= maxAttempts_) {
                    return domain::Error(domain::ErrorCode::DUPLICATE_SKU, e.what());
                }
            }
        }
    }

private:
    int maxAttempts_;
};

} // namespace inventory::application
