#pragma once

#include <optional>
#include <string>

namespace nimbasms::domain {

/**
 * @brief Статус модерации имени отправителя
 */
enum class SenderNameStatus {
    PENDING,
    REFUSED,
    ACCEPTED
};

inline std::string toString(SenderNameStatus status) {
    switch (status) {
        case SenderNameStatus::PENDING:  return "pending";
        case SenderNameStatus::REFUSED:  return "refused";
        case SenderNameStatus::ACCEPTED: return "accepted";
        default: return "unknown";
    }
}

inline std::optional<SenderNameStatus> parseSenderNameStatus(const std::string& str) {
    if (str == "pending")  return SenderNameStatus::PENDING;
    if (str == "refused")  return SenderNameStatus::REFUSED;
    if (str == "accepted") return SenderNameStatus::ACCEPTED;
    return std::nullopt;
}

} // namespace nimbasms::domain
