#pragma once

#include "ports/output/INimbaSmsGateway.hpp"
#include <memory>
#include <stdexcept>

namespace nimbasms::ports::input {

/**
 * @brief Учётные данные не заданы или неполные
 */
class CredentialsNotConfigured : public std::runtime_error {
public:
    CredentialsNotConfigured()
        : std::runtime_error(
              "Credentials are not configured. Run 'nimbasms config set service_id <value>' "
              "and 'nimbasms config set secret_token <value>'")
    {}
};

/**
 * @brief Выдаёт аутентифицированный шлюз для команд
 */
class IGatewayProvider {
public:
    virtual ~IGatewayProvider() = default;

    /**
     * @throws CredentialsNotConfigured если service_id или secret_token отсутствуют
     */
    virtual std::shared_ptr<ports::output::INimbaSmsGateway> gateway() = 0;
};

} // namespace nimbasms::ports::input
