#include "adapters/primary/cli/AccountCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

AccountCommandHandler::AccountCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int AccountCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand != "balance") {
        throw UsageError("Unknown subcommand 'account " + subcommand + "'. Usage: " + usage());
    }

    po::options_description options("account balance");
    addOutputOption(options);
    auto vm = parseArguments(rest, options);
    auto format = outputFormat(vm);

    return render(out, err, format, provider_->gateway()->getAccount());
}

} // namespace nimbasms::adapters::primary::cli
