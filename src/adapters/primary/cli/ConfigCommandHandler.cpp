#include "adapters/primary/cli/ConfigCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

ConfigCommandHandler::ConfigCommandHandler(std::shared_ptr<ports::output::ICredentialStore> store)
    : store_(std::move(store))
{}

int ConfigCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& /*err*/) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand != "set") {
        throw UsageError("Unknown subcommand 'config " + subcommand + "'. Usage: " + usage());
    }

    po::options_description options("config set");
    options.add_options()
        ("key", po::value<std::string>()->required(), "service_id or secret_token")
        ("value", po::value<std::string>()->required(), "value to store");
    po::positional_options_description positional;
    positional.add("key", 1).add("value", 1);

    auto vm = parseArguments(rest, options, positional);
    const auto& key = vm["key"].as<std::string>();
    const auto& value = vm["value"].as<std::string>();

    if (key == "service_id") {
        store_->save(value, std::nullopt);
    } else if (key == "secret_token") {
        store_->save(std::nullopt, value);
    } else {
        throw UsageError("Unknown config key '" + key + "', expected service_id or secret_token");
    }

    out << "Saved " << key << "\n";
    return 0;
}

} // namespace nimbasms::adapters::primary::cli
