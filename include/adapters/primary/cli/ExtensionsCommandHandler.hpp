#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include <memory>

namespace nimbasms::adapters::primary::cli {

/**
 * @brief Команды расширений и их действий
 *
 * extensions list|create|get|update|upload-logo
 * extensions actions list|create|update|delete|publish
 */
class ExtensionsCommandHandler : public ICommandHandler {
public:
    explicit ExtensionsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider);

    std::string name() const override { return "extensions"; }
    std::string usage() const override {
        return "extensions list|create|get|update|upload-logo [options] | "
               "extensions actions list|create|update|delete|publish [options]";
    }

    int handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) override;

private:
    std::shared_ptr<ports::input::IGatewayProvider> provider_;

    int list(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int create(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int get(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int update(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int uploadLogo(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    int actions(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int listActions(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int createAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int updateAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int deleteAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
    int publishAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
};

} // namespace nimbasms::adapters::primary::cli
