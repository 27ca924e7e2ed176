#pragma once

#include <stdexcept>
#include <string>

namespace inventory::ports::output {

/**
 * @brief Строка изменена другой транзакцией (не совпала версия)
 *
 * Бросается при коммите единицы работы. Сервис повторяет операцию целиком.
 */
class ConcurrencyException : public std::runtime_error {
public:
    explicit ConcurrencyException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Нарушено ограничение уникальности (склад + вариант)
 */
class DuplicateKeyException : public std::runtime_error {
public:
    explicit DuplicateKeyException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace inventory::ports::output
