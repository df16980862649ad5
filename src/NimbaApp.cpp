#include "NimbaApp.hpp"

// Command Handlers (Primary Adapters)
#include "adapters/primary/cli/AccountCommandHandler.hpp"
#include "adapters/primary/cli/ConfigCommandHandler.hpp"
#include "adapters/primary/cli/ContactsCommandHandler.hpp"
#include "adapters/primary/cli/ExtensionsCommandHandler.hpp"
#include "adapters/primary/cli/GroupsCommandHandler.hpp"
#include "adapters/primary/cli/MessagesCommandHandler.hpp"
#include "adapters/primary/cli/SenderNamesCommandHandler.hpp"
#include "adapters/primary/cli/VerificationsCommandHandler.hpp"

// Application
#include "application/AuthenticatedGatewayProvider.hpp"

// Secondary Adapters
#include "adapters/secondary/BeastHttpTransport.hpp"
#include "adapters/secondary/FileCredentialStore.hpp"

// Settings
#include "settings/ApiClientSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

using namespace nimbasms;

NimbaApp::NimbaApp() = default;

NimbaApp::~NimbaApp() {
    log("Application destroyed");
}

int NimbaApp::run(int argc, char* argv[]) {
    loadEnvironment();
    configureInjection();

    std::vector<std::string> args(argv + 1, argv + argc);
    return dispatcher_->run(args, std::cout, std::cerr);
}

void NimbaApp::loadEnvironment() {
    cliSettings_ = std::make_shared<settings::CliSettings>();
    log("Config directory: " + cliSettings_->getConfigDir());
}

void NimbaApp::configureInjection() {
    log("Configuring Boost.DI injection...");

    auto injector = di::make_injector(

        // ====================================================================
        // Secondary Adapters (Output Ports)
        // ====================================================================

        di::bind<settings::IApiClientSettings>()
            .to<settings::ApiClientSettings>()
            .in(di::singleton),

        // Одно соединение на процесс
        di::bind<ports::output::IHttpTransport>()
            .to<adapters::secondary::BeastHttpTransport>()
            .in(di::singleton),

        di::bind<ports::output::ICredentialStore>()
            .to(std::make_shared<adapters::secondary::FileCredentialStore>(cliSettings_->getConfigDir())),

        // ====================================================================
        // Application (Input Ports)
        // ====================================================================

        di::bind<ports::input::IGatewayProvider>()
            .to<application::AuthenticatedGatewayProvider>()
            .in(di::singleton)
    );

    dispatcher_ = std::make_unique<adapters::primary::cli::CommandDispatcher>(cliSettings_->isVerbose());

    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::ConfigCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::AccountCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::ExtensionsCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::MessagesCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::ContactsCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::GroupsCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::SenderNamesCommandHandler>>());
    dispatcher_->registerHandler(injector.create<std::shared_ptr<adapters::primary::cli::VerificationsCommandHandler>>());

    log("DI configuration completed");
}

void NimbaApp::log(const std::string& message) const {
    if (cliSettings_ && cliSettings_->isVerbose()) {
        std::cerr << "[NimbaApp] " << message << std::endl;
    }
}
