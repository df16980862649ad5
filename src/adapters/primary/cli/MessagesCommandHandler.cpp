#include "adapters/primary/cli/MessagesCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"

namespace nimbasms::adapters::primary::cli {

MessagesCommandHandler::MessagesCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int MessagesCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand == "list") return list(rest, out, err);
    if (subcommand == "send") return send(rest, out, err);
    if (subcommand == "get") return get(rest, out, err);
    throw UsageError("Unknown subcommand 'messages " + subcommand + "'. Usage: " + usage());
}

int MessagesCommandHandler::list(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("messages list");
    addPageOptions(options);
    options.add_options()
        ("status", po::value<std::string>(), "pending|sent|failure|not_available|received|tosend")
        ("sent-after", po::value<std::string>(), "sent_at lower bound")
        ("sent-before", po::value<std::string>(), "sent_at upper bound");
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    auto page = pageFrom(vm);
    if (!page) return reportError(err, page.error());

    domain::MessageFilter filter;
    filter.page = *page;
    if (auto status = optionalArgument(vm, "status")) {
        filter.status = domain::parseMessageStatus(*status);
        if (!filter.status) {
            throw UsageError("Unknown message status '" + *status + "'");
        }
    }
    filter.sentAtGte = optionalArgument(vm, "sent-after");
    filter.sentAtLte = optionalArgument(vm, "sent-before");

    return render(out, err, format, provider_->gateway()->listMessages(filter));
}

int MessagesCommandHandler::send(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("messages send");
    options.add_options()
        ("sender-name", po::value<std::string>()->required(), "registered sender name")
        ("to", po::value<std::vector<std::string>>()->required()->composing(), "recipient, repeatable")
        ("message", po::value<std::string>()->required(), "message text");
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    auto request = domain::CreateMessage::create(
        vm["sender-name"].as<std::string>(),
        vm["to"].as<std::vector<std::string>>(),
        vm["message"].as<std::string>());
    if (!request) return reportError(err, request.error());

    return render(out, err, format, provider_->gateway()->sendMessage(*request));
}

int MessagesCommandHandler::get(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("messages get");
    options.add_options()
        ("message-id", po::value<std::string>()->required(), "message UUID");
    addOutputOption(options);
    po::positional_options_description positional;
    positional.add("message-id", 1);
    auto vm = parseArguments(args, options, positional);
    auto format = outputFormat(vm);

    return render(out, err, format, provider_->gateway()->getMessage(uuidArgument(vm, "message-id")));
}

} // namespace nimbasms::adapters::primary::cli
