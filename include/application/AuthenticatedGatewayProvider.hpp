#pragma once

#include "adapters/secondary/HttpNimbaSmsGateway.hpp"
#include "ports/input/IGatewayProvider.hpp"
#include "ports/output/ICredentialStore.hpp"
#include "ports/output/IHttpTransport.hpp"
#include "settings/IApiClientSettings.hpp"
#include <memory>

namespace nimbasms::application {

/**
 * @brief Создаёт HttpNimbaSmsGateway из сохранённых учётных данных
 *
 * Шлюз создаётся один раз на процесс и разделяет транспорт
 * (и его соединение) между вызовами.
 */
class AuthenticatedGatewayProvider : public ports::input::IGatewayProvider {
public:
    AuthenticatedGatewayProvider(
        std::shared_ptr<ports::output::ICredentialStore> credentialStore,
        std::shared_ptr<ports::output::IHttpTransport> transport,
        std::shared_ptr<settings::IApiClientSettings> settings
    ) : credentialStore_(std::move(credentialStore))
      , transport_(std::move(transport))
      , settings_(std::move(settings))
    {}

    std::shared_ptr<ports::output::INimbaSmsGateway> gateway() override {
        if (gateway_) {
            return gateway_;
        }

        auto credentials = credentialStore_->load();
        if (!credentials.isComplete()) {
            throw ports::input::CredentialsNotConfigured();
        }

        gateway_ = std::make_shared<adapters::secondary::HttpNimbaSmsGateway>(
            transport_, settings_, credentials);
        return gateway_;
    }

private:
    std::shared_ptr<ports::output::ICredentialStore> credentialStore_;
    std::shared_ptr<ports::output::IHttpTransport> transport_;
    std::shared_ptr<settings::IApiClientSettings> settings_;
    std::shared_ptr<ports::output::INimbaSmsGateway> gateway_;
};

} // namespace nimbasms::application
