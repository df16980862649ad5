#pragma once

#include <optional>
#include <string>

namespace nimbasms::domain {

/**
 * @brief Статус сообщения (и доставки на отдельный номер)
 */
enum class MessageStatus {
    PENDING,
    SENT,
    FAILURE,
    NOT_AVAILABLE,
    RECEIVED,
    TOSEND
};

inline std::string toString(MessageStatus status) {
    switch (status) {
        case MessageStatus::PENDING: return "pending";
        case MessageStatus::SENT: return "sent";
        case MessageStatus::FAILURE: return "failure";
        case MessageStatus::NOT_AVAILABLE: return "not_available";
        case MessageStatus::RECEIVED: return "received";
        case MessageStatus::TOSEND: return "tosend";
        default: return "unknown";
    }
}

/**
 * @brief Преобразовать wire-значение в MessageStatus
 * @return nullopt для неизвестного значения, без подстановки дефолта
 */
inline std::optional<MessageStatus> parseMessageStatus(const std::string& str) {
    if (str == "pending") return MessageStatus::PENDING;
    if (str == "sent") return MessageStatus::SENT;
    if (str == "failure") return MessageStatus::FAILURE;
    if (str == "not_available") return MessageStatus::NOT_AVAILABLE;
    if (str == "received") return MessageStatus::RECEIVED;
    if (str == "tosend") return MessageStatus::TOSEND;
    return std::nullopt;
}

} // namespace nimbasms::domain
