#include "adapters/primary/cli/ContactsCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

ContactsCommandHandler::ContactsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int ContactsCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand == "list") return list(rest, out, err);
    if (subcommand == "create") return create(rest, out, err);
    throw UsageError("Unknown subcommand 'contacts " + subcommand + "'. Usage: " + usage());
}

int ContactsCommandHandler::list(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("contacts list");
    addPageOptions(options);
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    auto page = pageFrom(vm);
    if (!page) return reportError(err, page.error());

    return render(out, err, format, provider_->gateway()->listContacts(*page));
}

int ContactsCommandHandler::create(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("contacts create");
    options.add_options()
        ("numero", po::value<std::string>()->required(), "phone number")
        ("name", po::value<std::string>(), "contact name")
        ("group", po::value<std::vector<std::string>>()->composing(), "group name, repeatable");
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    std::vector<std::string> groups;
    if (vm.count("group")) {
        groups = vm["group"].as<std::vector<std::string>>();
    }

    auto request = domain::CreateContact::create(
        vm["numero"].as<std::string>(), optionalArgument(vm, "name"), groups);
    if (!request) return reportError(err, request.error());

    return render(out, err, format, provider_->gateway()->createContact(*request));
}

} // namespace nimbasms::adapters::primary::cli
