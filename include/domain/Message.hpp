#pragma once

#include "Page.hpp"
#include "Result.hpp"
#include "Timestamp.hpp"
#include "Uuid.hpp"
#include "Validation.hpp"
#include "enums/MessageStatus.hpp"
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace nimbasms::domain {

/**
 * @brief Статус доставки на один номер
 */
struct DeliveryMessage {
    Uuid id;
    std::string contact;
    MessageStatus status = MessageStatus::PENDING;
};

inline bool operator==(const DeliveryMessage& lhs, const DeliveryMessage& rhs) {
    return std::tie(lhs.id, lhs.contact, lhs.status) == std::tie(rhs.id, rhs.contact, rhs.status);
}

/**
 * @brief SMS сообщение с построчным статусом доставки
 */
struct Message {
    static constexpr size_t SENDER_NAME_MAX = 11;
    static constexpr size_t MESSAGE_MAX = 665;

    Uuid messageid;
    std::string senderName;
    std::string message;
    MessageStatus status = MessageStatus::PENDING;
    Timestamp sentAt;
    std::vector<DeliveryMessage> numbers;
};

inline bool operator==(const Message& lhs, const Message& rhs) {
    return std::tie(lhs.messageid, lhs.senderName, lhs.message, lhs.status, lhs.sentAt, lhs.numbers)
        == std::tie(rhs.messageid, rhs.senderName, rhs.message, rhs.status, rhs.sentAt, rhs.numbers);
}

/**
 * @brief Запрос на отправку сообщения
 */
struct CreateMessage {
    static constexpr size_t RECIPIENTS_MAX = 10;

    std::string senderName;
    std::vector<std::string> to;
    std::string message;

    static Result<CreateMessage> create(
        const std::string& senderName,
        const std::vector<std::string>& to,
        const std::string& message
    ) {
        if (auto failure = validation::firstFailure({
                validation::notEmpty("sender_name", senderName),
                validation::maxLength("sender_name", senderName, Message::SENDER_NAME_MAX),
                validation::inRange("to", static_cast<int64_t>(to.size()), 1, RECIPIENTS_MAX),
                validation::notEmpty("message", message),
                validation::maxLength("message", message, Message::MESSAGE_MAX)})) {
            return *failure;
        }
        for (size_t i = 0; i < to.size(); ++i) {
            if (auto failure = validation::notEmpty("to[" + std::to_string(i) + "]", to[i])) {
                return *failure;
            }
        }

        CreateMessage request;
        request.senderName = senderName;
        request.to = to;
        request.message = message;
        return request;
    }
};

inline bool operator==(const CreateMessage& lhs, const CreateMessage& rhs) {
    return std::tie(lhs.senderName, lhs.to, lhs.message) == std::tie(rhs.senderName, rhs.to, rhs.message);
}

/**
 * @brief Ответ на отправку: ID сообщения и URL для проверки статуса
 */
struct MessageReceipt {
    Uuid messageid;
    std::string url;
};

/**
 * @brief Фильтр списка сообщений
 *
 * Незаданные фильтры не попадают в query string.
 */
struct MessageFilter {
    Page page;
    std::optional<MessageStatus> status;
    std::optional<std::string> sentAtGte;
    std::optional<std::string> sentAtLte;
};

} // namespace nimbasms::domain
