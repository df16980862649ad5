#pragma once

#include "ports/output/ICredentialStore.hpp"
#include <string>

namespace nimbasms::adapters::secondary {

/**
 * @brief Учётные данные в {configDir}/config.json
 *
 * Формат: {"service_id": "...", "secret_token": "..."}
 */
class FileCredentialStore : public ports::output::ICredentialStore {
public:
    explicit FileCredentialStore(std::string configDir);

    domain::Credentials load() override;

    void save(const std::optional<std::string>& serviceId,
              const std::optional<std::string>& secretToken) override;

    std::string getPath() const;

private:
    std::string configDir_;
};

} // namespace nimbasms::adapters::secondary
