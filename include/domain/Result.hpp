#pragma once

#include "Error.hpp"
#include <optional>
#include <utility>
#include <variant>

namespace nimbasms::domain {

/**
 * @brief Значение либо Error
 *
 * Все операции клиента возвращают Result вместо исключений:
 * вызывающий код обязан явно различать VALIDATION / DECODE / API / TRANSPORT.
 */
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Error error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(state_); }
    T& value() & { return std::get<T>(state_); }
    T&& value() && { return std::get<T>(std::move(state_)); }

    const T& operator*() const& { return value(); }
    const T* operator->() const { return &std::get<T>(state_); }

    const Error& error() const { return std::get<Error>(state_); }

private:
    std::variant<T, Error> state_;
};

/**
 * @brief Результат операции без значения (например, удаление)
 */
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    static Result success() { return Result(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

} // namespace nimbasms::domain
