#include "adapters/primary/cli/SenderNamesCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

SenderNamesCommandHandler::SenderNamesCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int SenderNamesCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand != "list") {
        throw UsageError("Unknown subcommand 'sendernames " + subcommand + "'. Usage: " + usage());
    }

    po::options_description options("sendernames list");
    addPageOptions(options);
    addOutputOption(options);
    auto vm = parseArguments(rest, options);
    auto format = outputFormat(vm);

    auto page = pageFrom(vm);
    if (!page) return reportError(err, page.error());

    return render(out, err, format, provider_->gateway()->listSenderNames(*page));
}

} // namespace nimbasms::adapters::primary::cli
