#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief Команды верификации
 *
 * verifications create --to NUMBER [--message TEXT] [--sender-name NAME]
 *                      [--expiry-time MIN] [--attempts N] [--code-length N]
 * verifications verify <verification_id> --code CODE
 */
class VerificationsCommandHandler : public ICommandHandler {
public:
    explicit VerificationsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "verifications"; }
    std::string usage() const override { return "verifications create|verify [options]"; }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;

    int create(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int verify(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
};

} // namespace nimbasms::adapters::primary::cli
