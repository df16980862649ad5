#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief Неверное использование команды (exit code 2)
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Обработчик группы команд верхнего уровня ("messages", "contacts", ...)
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    /**
     * @brief Имя группы в командной строке
     */
    virtual std::string name() const = 0;

    /**
     * @brief Строка справки: подкоманды группы
     */
    virtual std::string usage() const = 0;

    /**
     * @brief Выполнить подкоманду
     *
     * @param args Аргументы после имени группы (args[0] - подкоманда)
     * @return 0 при успехе, 1 при ошибке операции
     * @throws UsageError, boost::program_options::error при неверных аргументах
     */
    virtual int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) = 0;
};

} // namespace nimbasms::adapters::primary::cli
