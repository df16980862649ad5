#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief contacts list | contacts create --numero N [--name X] [--group G ...]
 */
class ContactsCommandHandler : public ICommandHandler {
public:
    explicit ContactsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "contacts"; }
    std::string usage() const override {
        return "contacts list [--limit N] [--offset N] | contacts create --numero <number> [--name <name>] [--group <group>...]";
    }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;

    int list(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int create(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
};

} // namespace nimbasms::adapters::primary::cli
