#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace nimbasms::domain {

/**
 * @brief Информация об аккаунте: SID, баланс SMS, webhook
 */
struct Account {
    std::string sid;
    int64_t balance = 0;                    ///< >= 0, проверяется при декодировании
    std::optional<std::string> webhookUrl;
};

inline bool operator==(const Account& lhs, const Account& rhs) {
    return std::tie(lhs.sid, lhs.balance, lhs.webhookUrl)
        == std::tie(rhs.sid, rhs.balance, rhs.webhookUrl);
}

} // namespace nimbasms::domain
