#include "adapters/primary/cli/CommandDispatcher.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <boost/program_options/errors.hpp>
#include <iostream>

namespace nimbasms::adapters::primary::cli {

CommandDispatcher::CommandDispatcher(bool verbose)
    : verbose_(verbose)
{}

void CommandDispatcher::registerHandler(std::shared_ptr<ICommandHandler> handler) {
    handlers_.push_back(std::move(handler));
}

void CommandDispatcher::printUsage(std::ostream& out) const {
    out << "Usage: nimbasms <command> <subcommand> [options]\n\nCommands:\n";
    for (const auto& handler : handlers_) {
        out << "  " << handler->usage() << "\n";
    }
}

int CommandDispatcher::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty() || args.front() == "--help" || args.front() == "-h" || args.front() == "help") {
        printUsage(args.empty() ? err : out);
        return args.empty() ? 2 : 0;
    }

    const auto& command = args.front();
    std::shared_ptr<ICommandHandler> handler;
    for (const auto& candidate : handlers_) {
        if (candidate->name() == command) {
            handler = candidate;
            break;
        }
    }

    if (!handler) {
        err << "Error: unknown command '" << command << "'\n";
        printUsage(err);
        return 2;
    }

    if (verbose_) {
        std::cerr << "[CommandDispatcher] Running '" << command << "'" << std::endl;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        int code = handler->handle(rest, out, err);
        if (verbose_) {
            std::cerr << "[CommandDispatcher] '" << command << "' finished with code " << code << std::endl;
        }
        return code;
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n";
        return 2;
    } catch (const boost::program_options::error& e) {
        err << "Error: " << e.what() << "\nUsage: nimbasms " << handler->usage() << "\n";
        return 2;
    } catch (const ports::input::CredentialsNotConfigured& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace nimbasms::adapters::primary::cli
