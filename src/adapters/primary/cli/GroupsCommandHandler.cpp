#include "adapters/primary/cli/GroupsCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

GroupsCommandHandler::GroupsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int GroupsCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand != "list") {
        throw UsageError("Unknown subcommand 'groups " + subcommand + "'. Usage: " + usage());
    }

    po::options_description options("groups list");
    addPageOptions(options);
    addOutputOption(options);
    auto vm = parseArguments(rest, options);
    auto format = outputFormat(vm);

    auto page = pageFrom(vm);
    if (!page) return reportError(err, page.error());

    return render(out, err, format, provider_->gateway()->listGroups(*page));
}

} // namespace nimbasms::adapters::primary::cli
