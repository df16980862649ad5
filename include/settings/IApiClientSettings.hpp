#pragma once

#include <string>

namespace nimbasms::settings {

class IApiClientSettings {
public:
    virtual ~IApiClientSettings() = default;

    /**
     * @brief Базовый URL API, например "https://api.nimbasms.com/v1"
     */
    virtual std::string getBaseUrl() const = 0;
};

} // namespace nimbasms::settings
