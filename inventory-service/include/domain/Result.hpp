#pragma once

#include "domain/Error.hpp"
#include <optional>
#include <stdexcept>
#include <utility>

namespace inventory::domain {

/// Маркер успешного результата без значения
struct Success {};

/**
 * @brief Значение либо бизнес-ошибка
 *
 * Доступ к value() у ошибочного результата (и к error() у успешного)
 * является ошибкой программиста и бросает std::logic_error.
 */
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool isSuccess() const { return value_.has_value(); }
    bool isError() const { return !value_.has_value(); }
    explicit operator bool() const { return isSuccess(); }

    T& value() & {
        ensureValue();
        return *value_;
    }

    const T& value() const& {
        ensureValue();
        return *value_;
    }

    T&& value() && {
        ensureValue();
        return std::move(*value_);
    }

    const Error& error() const {
        if (!error_) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return *error_;
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    void ensureValue() const {
        if (!value_) {
            throw std::logic_error("Result holds an error: " + error_->message);
        }
    }

    std::optional<T> value_;
    std::optional<Error> error_;
};

} // namespace inventory::domain
