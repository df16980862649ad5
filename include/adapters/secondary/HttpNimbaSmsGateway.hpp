#pragma once

#include "domain/Credentials.hpp"
#include "ports/output/IHttpTransport.hpp"
#include "ports/output/INimbaSmsGateway.hpp"
#include "serialization/WireDecoder.hpp"
#include "settings/IApiClientSettings.hpp"
#include "utils/Url.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nimbasms::adapters::secondary {

/**
 * @brief HTTP клиент к Nimba SMS API
 *
 * Реализует INimbaSmsGateway: строит URL от базового (settings),
 * добавляет Basic-аутентификацию, сериализует запросы и
 * декодирует ответы. Повторов нет: одна операция - один вызов транспорта.
 */
class HttpNimbaSmsGateway : public ports::output::INimbaSmsGateway {
public:
    /**
     * @throws std::invalid_argument если базовый URL некорректен или
     *         credentials неполные
     */
    HttpNimbaSmsGateway(
        std::shared_ptr<ports::output::IHttpTransport> transport,
        std::shared_ptr<settings::IApiClientSettings> settings,
        const domain::Credentials& credentials
    );

    domain::Result<domain::Account> getAccount() override;

    domain::Result<std::vector<domain::Extension>> listExtensions(const domain::Page& page) override;
    domain::Result<domain::Extension> createExtension(const domain::CreateExtension& request) override;
    domain::Result<domain::Extension> getExtension(const domain::Uuid& extensionId) override;
    domain::Result<domain::Extension> updateExtension(
        const domain::Uuid& extensionId,
        const domain::ExtensionUpdate& update
    ) override;
    domain::Result<domain::Extension> uploadLogo(
        const domain::Uuid& extensionId,
        const std::string& logoPath
    ) override;

    domain::Result<std::vector<domain::ExtensionAction>> listActions(
        const domain::Uuid& extensionId,
        const domain::Page& page
    ) override;
    domain::Result<domain::ExtensionAction> createAction(
        const domain::Uuid& extensionId,
        const domain::ActionRequest& request
    ) override;
    domain::Result<domain::ExtensionAction> updateAction(
        const domain::Uuid& extensionId,
        const domain::Uuid& actionId,
        const domain::ActionUpdate& update
    ) override;
    domain::Result<void> deleteAction(
        const domain::Uuid& extensionId,
        const domain::Uuid& actionId
    ) override;
    domain::Result<domain::ExtensionPublish> publishAction(
        const domain::Uuid& extensionId,
        const domain::Uuid& actionId
    ) override;

    domain::Result<std::vector<domain::Message>> listMessages(const domain::MessageFilter& filter) override;
    domain::Result<domain::MessageReceipt> sendMessage(const domain::CreateMessage& request) override;
    domain::Result<domain::Message> getMessage(const domain::Uuid& messageId) override;

    domain::Result<std::vector<domain::Contact>> listContacts(const domain::Page& page) override;
    domain::Result<domain::Contact> createContact(const domain::CreateContact& request) override;

    domain::Result<std::vector<domain::Group>> listGroups(const domain::Page& page) override;
    domain::Result<std::vector<domain::SenderName>> listSenderNames(const domain::Page& page) override;

    domain::Result<domain::Verification> createVerification(const domain::Verification& request) override;
    domain::Result<domain::CheckVerification> checkVerification(
        const domain::Uuid& verificationId,
        const domain::CheckVerification& check
    ) override;

private:
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    std::shared_ptr<ports::output::IHttpTransport> transport_;
    std::shared_ptr<settings::IApiClientSettings> settings_;
    utils::Url baseUrl_;
    std::string authorization_;

    ports::output::HttpRequest makeRequest(
        const std::string& method,
        const std::string& resource,
        const QueryParams& query = {}
    ) const;

    ports::output::HttpRequest makeJsonRequest(
        const std::string& method,
        const std::string& resource,
        const nlohmann::json& body
    ) const;

    static QueryParams pageParams(const domain::Page& page);

    /**
     * @brief Отправить запрос; не-2xx превращается в API ошибку с detail
     * @return Сырое тело успешного ответа
     */
    domain::Result<std::string> execute(const ports::output::HttpRequest& request);

    template <typename T>
    domain::Result<T> fetch(
        const ports::output::HttpRequest& request,
        domain::Result<T> (*decode)(const nlohmann::json&)
    );

    template <typename T>
    domain::Result<std::vector<T>> fetchList(
        const ports::output::HttpRequest& request,
        serialization::Envelope envelope,
        domain::Result<T> (*decode)(const nlohmann::json&)
    );
};

} // namespace nimbasms::adapters::secondary
