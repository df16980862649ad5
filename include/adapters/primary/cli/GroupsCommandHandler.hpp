#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

class GroupsCommandHandler : public ICommandHandler {
public:
    explicit GroupsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "groups"; }
    std::string usage() const override { return "groups list [--limit N] [--offset N] [--output table|json]"; }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;
};

} // namespace nimbasms::adapters::primary::cli
