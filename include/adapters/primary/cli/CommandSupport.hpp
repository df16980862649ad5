#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "adapters/primary/cli/OutputFormatter.hpp"
#include "domain/Error.hpp"
#include "domain/Page.hpp"
#include "domain/Result.hpp"
#include "domain/Uuid.hpp"
#include <boost/program_options.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace nimbasms::adapters::primary::cli {

namespace po = boost::program_options;

/**
 * @brief Разобрать аргументы подкоманды и проверить обязательные опции
 * @throws po::error при неизвестной опции или отсутствии обязательной
 */
po::variables_map parseArguments(
    const std::vector<std::string>& args,
    const po::options_description& options,
    const po::positional_options_description& positional = {}
);

void addOutputOption(po::options_description& options);
void addPageOptions(po::options_description& options);

/**
 * @throws UsageError если --output не table/json
 */
OutputFormat outputFormat(const po::variables_map& vm);

domain::Result<domain::Page> pageFrom(const po::variables_map& vm);

/**
 * @throws UsageError если значение не UUID
 */
domain::Uuid uuidArgument(const po::variables_map& vm, const std::string& name);

std::optional<std::string> optionalArgument(const po::variables_map& vm, const std::string& name);
std::optional<int> optionalInt(const po::variables_map& vm, const std::string& name);

/**
 * @brief Подкоманда и её аргументы
 * @throws UsageError если подкоманда не указана
 */
std::pair<std::string, std::vector<std::string>> splitSubcommand(
    const std::vector<std::string>& args,
    const std::string& usage
);

/**
 * @brief Напечатать "Error: ..." в err
 * @return Код выхода 1
 */
int reportError(std::ostream& err, const domain::Error& error);

/**
 * @brief Напечатать результат операции или ошибку
 * @return Код выхода
 */
template <typename T>
int render(std::ostream& out, std::ostream& err, OutputFormat format, const domain::Result<T>& result) {
    if (!result) {
        return reportError(err, result.error());
    }
    print(out, format, *result);
    return 0;
}

} // namespace nimbasms::adapters::primary::cli
