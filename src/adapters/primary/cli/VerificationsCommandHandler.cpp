#include "adapters/primary/cli/VerificationsCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

VerificationsCommandHandler::VerificationsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int VerificationsCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand == "create") return create(rest, out, err);
    if (subcommand == "verify") return verify(rest, out, err);
    throw UsageError("Unknown subcommand 'verifications " + subcommand + "'. Usage: " + usage());
}

int VerificationsCommandHandler::create(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("verifications create");
    options.add_options()
        ("to", po::value<std::string>()->required(), "phone number")
        ("message", po::value<std::string>(), "message text, may contain <1234>")
        ("sender-name", po::value<std::string>(), "sender name")
        ("expiry-time", po::value<int>(), "minutes, 5..30")
        ("attempts", po::value<int>(), "3..10")
        ("code-length", po::value<int>(), "4..8");
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    auto request = domain::Verification::create(
        vm["to"].as<std::string>(),
        optionalArgument(vm, "message"),
        optionalArgument(vm, "sender-name"),
        optionalInt(vm, "expiry-time"),
        optionalInt(vm, "attempts"),
        optionalInt(vm, "code-length"));
    if (!request) return reportError(err, request.error());

    return render(out, err, format, provider_->gateway()->createVerification(*request));
}

int VerificationsCommandHandler::verify(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("verifications verify");
    options.add_options()
        ("verification-id", po::value<std::string>()->required(), "verification UUID")
        ("code", po::value<int64_t>()->required(), "code received by SMS");
    addOutputOption(options);
    po::positional_options_description positional;
    positional.add("verification-id", 1);
    auto vm = parseArguments(args, options, positional);
    auto format = outputFormat(vm);

    auto id = uuidArgument(vm, "verification-id");
    auto check = domain::CheckVerification::create(vm["code"].as<int64_t>());
    if (!check) return reportError(err, check.error());

    return render(out, err, format, provider_->gateway()->checkVerification(id, *check));
}

} // namespace nimbasms::adapters::primary::cli
