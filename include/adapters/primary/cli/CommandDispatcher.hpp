#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief Маршрутизация argv к обработчику группы команд
 *
 * Коды выхода: 0 - успех, 1 - ошибка операции, 2 - неверное использование.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(bool verbose = false);

    void registerHandler(std::shared_ptr<ICommandHandler> handler);

    /**
     * @param args Аргументы без имени программы
     */
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    void printUsage(std::ostream& out) const;

private:
    bool verbose_;
    std::vector<std::shared_ptr<ICommandHandler>> handlers_;
};

} // namespace nimbasms::adapters::primary::cli
