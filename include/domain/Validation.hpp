#pragma once

#include "Error.hpp"
#include "utils/Url.hpp"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>

namespace nimbasms::domain::validation {

using Check = std::optional<Error>;

/**
 * @brief Длина в символах Unicode (UTF-8 continuation-байты не считаются)
 */
inline size_t characterCount(const std::string& value) {
    size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

inline Check maxLength(const std::string& field, const std::string& value, size_t max) {
    if (characterCount(value) > max) {
        return Error::validation(field, "must be at most " + std::to_string(max) + " characters");
    }
    return std::nullopt;
}

inline Check maxLength(const std::string& field, const std::optional<std::string>& value, size_t max) {
    return value ? maxLength(field, *value, max) : std::nullopt;
}

inline Check notEmpty(const std::string& field, const std::string& value) {
    if (value.empty()) {
        return Error::validation(field, "must not be empty");
    }
    return std::nullopt;
}

inline Check inRange(const std::string& field, int64_t value, int64_t min, int64_t max) {
    if (value < min || value > max) {
        return Error::validation(field, "must be between " + std::to_string(min)
                                 + " and " + std::to_string(max));
    }
    return std::nullopt;
}

/**
 * @brief Диапазон проверяется только если значение задано (иначе дефолт сервера)
 */
inline Check inRange(const std::string& field, const std::optional<int>& value, int64_t min, int64_t max) {
    return value ? inRange(field, *value, min, max) : std::nullopt;
}

inline Check atLeast(const std::string& field, int64_t value, int64_t min) {
    if (value < min) {
        return Error::validation(field, "must be at least " + std::to_string(min));
    }
    return std::nullopt;
}

inline Check url(const std::string& field, const std::string& value) {
    if (!utils::Url::isValid(value)) {
        return Error::validation(field, "must be a valid http(s) URL");
    }
    return std::nullopt;
}

inline Check url(const std::string& field, const std::optional<std::string>& value) {
    return value ? url(field, *value) : std::nullopt;
}

/**
 * @brief Первая нарушенная проверка в порядке перечисления
 */
inline Check firstFailure(std::initializer_list<Check> checks) {
    for (const auto& check : checks) {
        if (check) return check;
    }
    return std::nullopt;
}

} // namespace nimbasms::domain::validation
