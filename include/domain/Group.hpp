#pragma once

#include "Timestamp.hpp"
#include "Uuid.hpp"
#include <cstdint>
#include <string>
#include <tuple>

namespace nimbasms::domain {

/**
 * @brief Группа контактов
 */
struct Group {
    Uuid groupeId;
    std::string name;           ///< <= 100 символов
    Timestamp addedAt;
    int64_t totalContact = 0;   ///< >= 0
};

inline bool operator==(const Group& lhs, const Group& rhs) {
    return std::tie(lhs.groupeId, lhs.name, lhs.addedAt, lhs.totalContact)
        == std::tie(rhs.groupeId, rhs.name, rhs.addedAt, rhs.totalContact);
}

} // namespace nimbasms::domain
