#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief account balance [--output table|json]
 */
class AccountCommandHandler : public ICommandHandler {
public:
    explicit AccountCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "account"; }
    std::string usage() const override { return "account balance [--output table|json]"; }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;
};

} // namespace nimbasms::adapters::primary::cli
