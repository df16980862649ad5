#pragma once

#include "Timestamp.hpp"
#include "Uuid.hpp"
#include "enums/SenderNameStatus.hpp"
#include <string>
#include <tuple>

namespace nimbasms::domain {

/**
 * @brief Зарегистрированное имя отправителя
 */
struct SenderName {
    Uuid sendernameId;
    std::string name;
    SenderNameStatus status = SenderNameStatus::PENDING;
    Timestamp addedAt;
};

inline bool operator==(const SenderName& lhs, const SenderName& rhs) {
    return std::tie(lhs.sendernameId, lhs.name, lhs.status, lhs.addedAt)
        == std::tie(rhs.sendernameId, rhs.name, rhs.status, rhs.addedAt);
}

} // namespace nimbasms::domain
