#pragma once

#include <optional>
#include <string>

namespace nimbasms::domain {

/**
 * @brief Учётные данные API (service id + secret token)
 *
 * Оба поля обязательны для любого аутентифицированного вызова.
 */
struct Credentials {
    std::optional<std::string> serviceId;
    std::optional<std::string> secretToken;

    bool isComplete() const {
        return serviceId && !serviceId->empty() && secretToken && !secretToken->empty();
    }
};

} // namespace nimbasms::domain
