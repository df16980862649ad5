#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

class SenderNamesCommandHandler : public ICommandHandler {
public:
    explicit SenderNamesCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "sendernames"; }
    std::string usage() const override { return "sendernames list [--limit N] [--offset N] [--output table|json]"; }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;
};

} // namespace nimbasms::adapters::primary::cli
