#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

po::variables_map parseArguments(
    const std::vector<std::string>& args,
    const po::options_description& options,
    const po::positional_options_description& positional
) {
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(options).positional(positional).run(), vm);
    po::notify(vm);
    return vm;
}

void addOutputOption(po::options_description& options) {
    options.add_options()
        ("output,o", po::value<std::string>()->default_value("table"), "output format: table|json");
}

void addPageOptions(po::options_description& options) {
    options.add_options()
        ("limit", po::value<int>()->default_value(domain::Page::DEFAULT_LIMIT), "page size")
        ("offset", po::value<int>()->default_value(0), "items to skip");
}

OutputFormat outputFormat(const po::variables_map& vm) {
    const auto& value = vm["output"].as<std::string>();
    auto format = parseOutputFormat(value);
    if (!format) {
        throw UsageError("Unknown output format '" + value + "', expected table or json");
    }
    return *format;
}

domain::Result<domain::Page> pageFrom(const po::variables_map& vm) {
    return domain::Page::create(vm["limit"].as<int>(), vm["offset"].as<int>());
}

domain::Uuid uuidArgument(const po::variables_map& vm, const std::string& name) {
    const auto& value = vm[name].as<std::string>();
    auto uuid = domain::Uuid::parse(value);
    if (!uuid) {
        throw UsageError("Invalid " + name + " '" + value + "': expected a UUID");
    }
    return *uuid;
}

std::optional<std::string> optionalArgument(const po::variables_map& vm, const std::string& name) {
    if (!vm.count(name)) {
        return std::nullopt;
    }
    return vm[name].as<std::string>();
}

std::optional<int> optionalInt(const po::variables_map& vm, const std::string& name) {
    if (!vm.count(name)) {
        return std::nullopt;
    }
    return vm[name].as<int>();
}

std::pair<std::string, std::vector<std::string>> splitSubcommand(
    const std::vector<std::string>& args,
    const std::string& usage
) {
    if (args.empty()) {
        throw UsageError("Missing subcommand. Usage: " + usage);
    }
    return {args.front(), std::vector<std::string>(args.begin() + 1, args.end())};
}

int reportError(std::ostream& err, const domain::Error& error) {
    err << "Error: " << formatError(error) << "\n";
    return 1;
}

} // namespace nimbasms::adapters::primary::cli
