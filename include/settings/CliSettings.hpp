#pragma once

#include <cstdlib>
#include <string>

namespace nimbasms::settings {

/**
 * @brief Настройки CLI
 *
 * Читает из ENV:
 * - NIMBASMS_CONFIG_DIR (default: "$HOME/.config/nimbasms")
 * - NIMBASMS_VERBOSE (любое непустое значение кроме "0" включает диагностику в stderr)
 */
class CliSettings {
public:
    CliSettings() {
        if (const char* dir = std::getenv("NIMBASMS_CONFIG_DIR")) {
            configDir_ = dir;
        } else if (const char* home = std::getenv("HOME")) {
            configDir_ = std::string(home) + "/.config/nimbasms";
        }
        if (const char* verbose = std::getenv("NIMBASMS_VERBOSE")) {
            verbose_ = std::string(verbose) != "" && std::string(verbose) != "0";
        }
    }

    std::string getConfigDir() const { return configDir_; }
    bool isVerbose() const { return verbose_; }

private:
    std::string configDir_ = ".nimbasms";
    bool verbose_ = false;
};

} // namespace nimbasms::settings
