#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief Команды сообщений
 *
 * messages list [--limit N] [--offset N] [--status S] [--sent-after T] [--sent-before T]
 * messages send --sender-name NAME --to NUMBER... --message TEXT
 * messages get <message_id>
 */
class MessagesCommandHandler : public ICommandHandler {
public:
    explicit MessagesCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "messages"; }
    std::string usage() const override { return "messages list|send|get [options]"; }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;

    int list(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int send(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int get(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
};

} // namespace nimbasms::adapters::primary::cli
