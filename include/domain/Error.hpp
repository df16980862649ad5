#pragma once

#include "enums/ErrorKind.hpp"
#include <string>

namespace nimbasms::domain {

/**
 * @brief Структурированная ошибка клиента
 *
 * Несёт достаточно информации, чтобы слой команд отрисовал её
 * без разбора текста: категорию, поле, HTTP статус.
 */
struct Error {
    ErrorKind kind = ErrorKind::TRANSPORT;
    std::string message;    ///< Нарушенное ограничение, причина, detail сервера
    std::string field;      ///< Поле (VALIDATION / DECODE), путь к файлу (FILE_NOT_FOUND), иначе пусто
    int status = 0;         ///< HTTP статус (только API)

    static Error validation(const std::string& field, const std::string& constraint) {
        return Error{ErrorKind::VALIDATION, constraint, field, 0};
    }

    static Error decode(const std::string& field, const std::string& reason) {
        return Error{ErrorKind::DECODE, reason, field, 0};
    }

    static Error api(int status, const std::string& detail) {
        return Error{ErrorKind::API, detail, "", status};
    }

    static Error transport(const std::string& message) {
        return Error{ErrorKind::TRANSPORT, message, "", 0};
    }

    static Error fileNotFound(const std::string& path) {
        return Error{ErrorKind::FILE_NOT_FOUND, "File not found: " + path, path, 0};
    }

    bool isUnauthorized() const { return kind == ErrorKind::API && status == 401; }
    bool isRateLimited() const { return kind == ErrorKind::API && status == 429; }

    /**
     * @brief Однострочное описание для логов и вывода
     */
    std::string describe() const {
        switch (kind) {
            case ErrorKind::VALIDATION:
                return "Invalid value for '" + field + "': " + message;
            case ErrorKind::DECODE:
                return "Malformed response field '" + field + "': " + message;
            case ErrorKind::API:
                return "API error " + std::to_string(status) + ": " + message;
            case ErrorKind::TRANSPORT:
                return "Connection error: " + message;
            case ErrorKind::FILE_NOT_FOUND:
                return message;
        }
        return message;
    }
};

inline bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.kind == rhs.kind && lhs.message == rhs.message
        && lhs.field == rhs.field && lhs.status == rhs.status;
}

} // namespace nimbasms::domain
