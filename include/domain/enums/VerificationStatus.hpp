#pragma once

#include <optional>
#include <string>

namespace nimbasms::domain {

/**
 * @brief Статус проверки одноразового кода
 */
enum class VerificationStatus {
    PENDING,
    SENT,
    EXPIRED,
    FAILURE,
    RECEIVED,
    TOO_MANY_ATTEMPTS,
    APPROVED
};

inline std::string toString(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::PENDING: return "pending";
        case VerificationStatus::SENT: return "sent";
        case VerificationStatus::EXPIRED: return "expired";
        case VerificationStatus::FAILURE: return "failure";
        case VerificationStatus::RECEIVED: return "received";
        case VerificationStatus::TOO_MANY_ATTEMPTS: return "too_many_attempts";
        case VerificationStatus::APPROVED: return "approved";
        default: return "unknown";
    }
}

inline std::optional<VerificationStatus> parseVerificationStatus(const std::string& str) {
    if (str == "pending") return VerificationStatus::PENDING;
    if (str == "sent") return VerificationStatus::SENT;
    if (str == "expired") return VerificationStatus::EXPIRED;
    if (str == "failure") return VerificationStatus::FAILURE;
    if (str == "received") return VerificationStatus::RECEIVED;
    if (str == "too_many_attempts") return VerificationStatus::TOO_MANY_ATTEMPTS;
    if (str == "approved") return VerificationStatus::APPROVED;
    return std::nullopt;
}

} // namespace nimbasms::domain
