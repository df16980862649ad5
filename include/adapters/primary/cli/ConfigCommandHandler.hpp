#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/output/ICredentialStore.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief config set <service_id|secret_token> <value>
 *
 * Сохраняет одно поле учётных данных, второе остаётся прежним.
 */
class ConfigCommandHandler : public ICommandHandler {
public:
    explicit ConfigCommandHandler(std::shared_ptr<ports::output::ICredentialStore> store);

    std::string name() const override { return "config"; }
    std::string usage() const override { return "config set <service_id|secret_token> <value>"; }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::output::ICredentialStore> store_;
};

} // namespace nimbasms::adapters::primary::cli
