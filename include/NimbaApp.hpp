#pragma once

#include "adapters/primary/cli/CommandDispatcher.hpp"
#include "settings/CliSettings.hpp"
#include <memory>

/**
 * @class NimbaApp
 * @brief Приложение командной строки Nimba SMS
 *
 * Порядок работы run():
 * 1. loadEnvironment() - чтение настроек из ENV
 * 2. configureInjection() - Boost.DI: порты -> адаптеры, регистрация обработчиков команд
 * 3. dispatch - выполнение команды
 *
 * Диагностика ([NimbaApp] ...) идёт в stderr и только при NIMBASMS_VERBOSE,
 * stdout остаётся пригодным для --output json.
 */
class NimbaApp {
public:
    NimbaApp();
    ~NimbaApp();

    /**
     * @return Код выхода процесса
     */
    int run(int argc, char* argv[]);

private:
    std::shared_ptr<nimbasms::settings::CliSettings> cliSettings_;
    std::unique_ptr<nimbasms::adapters::primary::cli::CommandDispatcher> dispatcher_;

    void loadEnvironment();
    void configureInjection();
    void log(const std::string& message) const;
};
