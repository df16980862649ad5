#pragma once

#include <optional>
#include <string>

namespace nimbasms::domain {

/**
 * @brief Тип аутентификации расширения
 */
enum class AuthType {
    NONE,
    API_KEY,
    OAUTH2
};

inline std::string toString(AuthType type) {
    switch (type) {
        case AuthType::NONE:    return "none";
        case AuthType::API_KEY: return "api_key";
        case AuthType::OAUTH2:  return "oauth2";
        default: return "unknown";
    }
}

/**
 * @brief Преобразовать wire-значение в AuthType
 * @return nullopt если строка не распознана (сравнение регистрозависимое)
 */
inline std::optional<AuthType> parseAuthType(const std::string& str) {
    if (str == "none")    return AuthType::NONE;
    if (str == "api_key") return AuthType::API_KEY;
    if (str == "oauth2")  return AuthType::OAUTH2;
    return std::nullopt;
}

} // namespace nimbasms::domain
