#pragma once

#include "ports/input/IGatewayProvider.hpp"
#include "ports/output/INimbaSmsGateway.hpp"
#include <gmock/gmock.h>

namespace nimbasms::tests {

class MockNimbaSmsGateway : public ports::output::INimbaSmsGateway {
public:
    MOCK_METHOD(domain::Result<domain::Account>, getAccount, (), (override));

    MOCK_METHOD(domain::Result<std::vector<domain::Extension>>, listExtensions,
                (const domain::Page& page), (override));
    MOCK_METHOD(domain::Result<domain::Extension>, createExtension,
                (const domain::CreateExtension& request), (override));
    MOCK_METHOD(domain::Result<domain::Extension>, getExtension,
                (const domain::Uuid& extensionId), (override));
    MOCK_METHOD(domain::Result<domain::Extension>, updateExtension,
                (const domain::Uuid& extensionId, const domain::ExtensionUpdate& update), (override));
    MOCK_METHOD(domain::Result<domain::Extension>, uploadLogo,
                (const domain::Uuid& extensionId, const std::string& logoPath), (override));

    MOCK_METHOD(domain::Result<std::vector<domain::ExtensionAction>>, listActions,
                (const domain::Uuid& extensionId, const domain::Page& page), (override));
    MOCK_METHOD(domain::Result<domain::ExtensionAction>, createAction,
                (const domain::Uuid& extensionId, const domain::ActionRequest& request), (override));
    MOCK_METHOD(domain::Result<domain::ExtensionAction>, updateAction,
                (const domain::Uuid& extensionId, const domain::Uuid& actionId,
                 const domain::ActionUpdate& update), (override));
    MOCK_METHOD(domain::Result<void>, deleteAction,
                (const domain::Uuid& extensionId, const domain::Uuid& actionId), (override));
    MOCK_METHOD(domain::Result<domain::ExtensionPublish>, publishAction,
                (const domain::Uuid& extensionId, const domain::Uuid& actionId), (override));

    MOCK_METHOD(domain::Result<std::vector<domain::Message>>, listMessages,
                (const domain::MessageFilter& filter), (override));
    MOCK_METHOD(domain::Result<domain::MessageReceipt>, sendMessage,
                (const domain::CreateMessage& request), (override));
    MOCK_METHOD(domain::Result<domain::Message>, getMessage,
                (const domain::Uuid& messageId), (override));

    MOCK_METHOD(domain::Result<std::vector<domain::Contact>>, listContacts,
                (const domain::Page& page), (override));
    MOCK_METHOD(domain::Result<domain::Contact>, createContact,
                (const domain::CreateContact& request), (override));

    MOCK_METHOD(domain::Result<std::vector<domain::Group>>, listGroups,
                (const domain::Page& page), (override));
    MOCK_METHOD(domain::Result<std::vector<domain::SenderName>>, listSenderNames,
                (const domain::Page& page), (override));

    MOCK_METHOD(domain::Result<domain::Verification>, createVerification,
                (const domain::Verification& request), (override));
    MOCK_METHOD(domain::Result<domain::CheckVerification>, checkVerification,
                (const domain::Uuid& verificationId, const domain::CheckVerification& check), (override));
};

/**
 * @brief Провайдер, всегда возвращающий заданный шлюз
 */
class FixedGatewayProvider : public ports::input::IGatewayProvider {
public:
    explicit FixedGatewayProvider(std::shared_ptr<ports::output::INimbaSmsGateway> gateway)
        : gateway_(std::move(gateway)) {}

    std::shared_ptr<ports::output::INimbaSmsGateway> gateway() override { return gateway_; }

private:
    std::shared_ptr<ports::output::INimbaSmsGateway> gateway_;
};

} // namespace nimbasms::tests
