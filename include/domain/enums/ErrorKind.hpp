#pragma once

#include <string>

namespace nimbasms::domain {

/**
 * @brief Категория ошибки клиента
 */
enum class ErrorKind {
    VALIDATION,     ///< Входные данные нарушают ограничение домена (до сетевого вызова)
    DECODE,         ///< Ответ 2xx не соответствует ожидаемой структуре
    API,            ///< Сервер ответил статусом >= 400
    TRANSPORT,      ///< Ошибка соединения, HTTP ответа нет
    FILE_NOT_FOUND  ///< Локальный файл не найден
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::DECODE: return "DECODE";
        case ErrorKind::API: return "API";
        case ErrorKind::TRANSPORT: return "TRANSPORT";
        case ErrorKind::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        default: return "UNKNOWN";
    }
}

} // namespace nimbasms::domain
