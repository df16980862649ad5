#pragma once

#include "Result.hpp"
#include "Uuid.hpp"
#include "Validation.hpp"
#include "enums/VerificationStatus.hpp"
#include <optional>
#include <string>
#include <tuple>

namespace nimbasms::domain {

/**
 * @brief Запрос одноразового кода на номер
 *
 * Ограничения диапазонов проверяются только для заданных полей:
 * отсутствие значения означает дефолт сервера.
 */
struct Verification {
    static constexpr const char* PLACEHOLDER_ID = "c195e2f8-bca2-4173-886d-4820fd578d21";
    static constexpr const char* CODE_PLACEHOLDER = "<1234>";

    static constexpr size_t TO_MAX = 128;
    static constexpr size_t MESSAGE_MAX = 153;
    static constexpr size_t SENDER_NAME_MAX = 11;
    static constexpr int EXPIRY_MIN = 5;
    static constexpr int EXPIRY_MAX = 30;
    static constexpr int ATTEMPTS_MIN = 3;
    static constexpr int ATTEMPTS_MAX = 10;
    static constexpr int CODE_LENGTH_MIN = 4;
    static constexpr int CODE_LENGTH_MAX = 8;

    Uuid verificationid = *Uuid::parse(PLACEHOLDER_ID);
    std::string to;
    std::optional<std::string> message;     ///< Может содержать CODE_PLACEHOLDER
    std::optional<std::string> senderName;
    std::optional<int> expiryTime;          ///< Минуты, 5..30
    std::optional<int> attempts;            ///< 3..10
    std::optional<std::string> code;
    std::optional<int> codeLength;          ///< 4..8
    std::optional<std::string> url;

    static Result<Verification> create(
        const std::string& to,
        const std::optional<std::string>& message = std::nullopt,
        const std::optional<std::string>& senderName = std::nullopt,
        const std::optional<int>& expiryTime = std::nullopt,
        const std::optional<int>& attempts = std::nullopt,
        const std::optional<int>& codeLength = std::nullopt
    ) {
        Verification draft;
        draft.to = to;
        draft.message = message;
        draft.senderName = senderName;
        draft.expiryTime = expiryTime;
        draft.attempts = attempts;
        draft.codeLength = codeLength;
        return validate(draft);
    }

    /**
     * @brief Проверить все поля по порядку
     *
     * Используется и при создании запроса, и при декодировании ответа.
     */
    static Result<Verification> validate(const Verification& draft) {
        if (auto failure = validation::firstFailure({
                validation::notEmpty("to", draft.to),
                validation::maxLength("to", draft.to, TO_MAX),
                validation::maxLength("message", draft.message, MESSAGE_MAX),
                validation::maxLength("sender_name", draft.senderName, SENDER_NAME_MAX),
                validation::inRange("expiry_time", draft.expiryTime, EXPIRY_MIN, EXPIRY_MAX),
                validation::inRange("attempts", draft.attempts, ATTEMPTS_MIN, ATTEMPTS_MAX),
                validation::inRange("code_length", draft.codeLength, CODE_LENGTH_MIN, CODE_LENGTH_MAX),
                validation::url("url", draft.url)})) {
            return *failure;
        }
        return draft;
    }

    bool hasCodePlaceholder() const {
        return message && message->find(CODE_PLACEHOLDER) != std::string::npos;
    }
};

inline bool operator==(const Verification& lhs, const Verification& rhs) {
    return std::tie(lhs.verificationid, lhs.to, lhs.message, lhs.senderName, lhs.expiryTime,
                    lhs.attempts, lhs.code, lhs.codeLength, lhs.url)
        == std::tie(rhs.verificationid, rhs.to, rhs.message, rhs.senderName, rhs.expiryTime,
                    rhs.attempts, rhs.code, rhs.codeLength, rhs.url);
}

/**
 * @brief Проверка кода: запрос (только code) и ответ (code + status)
 */
struct CheckVerification {
    static constexpr int64_t CODE_MIN = 1000;
    static constexpr int64_t CODE_MAX = 999999;

    int64_t code = 0;
    std::optional<VerificationStatus> status;

    static Result<CheckVerification> create(int64_t code) {
        if (auto failure = validation::inRange("code", code, CODE_MIN, CODE_MAX)) {
            return *failure;
        }
        CheckVerification check;
        check.code = code;
        return check;
    }
};

inline bool operator==(const CheckVerification& lhs, const CheckVerification& rhs) {
    return lhs.code == rhs.code && lhs.status == rhs.status;
}

} // namespace nimbasms::domain
