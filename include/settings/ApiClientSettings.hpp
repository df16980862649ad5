#pragma once

#include "settings/IApiClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace nimbasms::settings {

/**
 * @brief Настройки подключения к Nimba SMS API
 *
 * Читает из ENV:
 * - NIMBASMS_BASE_URL (default: "https://api.test.nimbasms.com/v1")
 */
class ApiClientSettings : public IApiClientSettings {
public:
    ApiClientSettings() {
        if (const char* url = std::getenv("NIMBASMS_BASE_URL")) {
            baseUrl_ = url;
        }
    }

    std::string getBaseUrl() const override { return baseUrl_; }

private:
    std::string baseUrl_ = "https://api.test.nimbasms.com/v1";
};

} // namespace nimbasms::settings
