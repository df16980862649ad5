#pragma once

#include "domain/Account.hpp"
#include "domain/Contact.hpp"
#include "domain/Extension.hpp"
#include "domain/ExtensionAction.hpp"
#include "domain/Group.hpp"
#include "domain/Message.hpp"
#include "domain/Page.hpp"
#include "domain/Result.hpp"
#include "domain/SenderName.hpp"
#include "domain/Uuid.hpp"
#include "domain/Verification.hpp"
#include <string>
#include <vector>

namespace nimbasms::ports::output {

/**
 * @brief Интерфейс шлюза к Nimba SMS API
 *
 * Одна операция - один HTTP вызов. Ошибки не обрабатываются локально,
 * а возвращаются вызывающему как Error (API / TRANSPORT / DECODE / FILE_NOT_FOUND).
 */
class INimbaSmsGateway {
public:
    virtual ~INimbaSmsGateway() = default;

    // ============================================
    // АККАУНТ
    // ============================================

    virtual domain::Result<domain::Account> getAccount() = 0;

    // ============================================
    // РАСШИРЕНИЯ
    // ============================================

    virtual domain::Result<std::vector<domain::Extension>> listExtensions(const domain::Page& page) = 0;

    virtual domain::Result<domain::Extension> createExtension(const domain::CreateExtension& request) = 0;

    virtual domain::Result<domain::Extension> getExtension(const domain::Uuid& extensionId) = 0;

    virtual domain::Result<domain::Extension> updateExtension(
        const domain::Uuid& extensionId,
        const domain::ExtensionUpdate& update
    ) = 0;

    /**
     * @brief Загрузить логотип (multipart, поле "logo", image/png)
     *
     * Несуществующий файл - FILE_NOT_FOUND без единого HTTP запроса.
     */
    virtual domain::Result<domain::Extension> uploadLogo(
        const domain::Uuid& extensionId,
        const std::string& logoPath
    ) = 0;

    // ============================================
    // ДЕЙСТВИЯ РАСШИРЕНИЙ
    // ============================================

    virtual domain::Result<std::vector<domain::ExtensionAction>> listActions(
        const domain::Uuid& extensionId,
        const domain::Page& page
    ) = 0;

    virtual domain::Result<domain::ExtensionAction> createAction(
        const domain::Uuid& extensionId,
        const domain::ActionRequest& request
    ) = 0;

    virtual domain::Result<domain::ExtensionAction> updateAction(
        const domain::Uuid& extensionId,
        const domain::Uuid& actionId,
        const domain::ActionUpdate& update
    ) = 0;

    virtual domain::Result<void> deleteAction(
        const domain::Uuid& extensionId,
        const domain::Uuid& actionId
    ) = 0;

    virtual domain::Result<domain::ExtensionPublish> publishAction(
        const domain::Uuid& extensionId,
        const domain::Uuid& actionId
    ) = 0;

    // ============================================
    // СООБЩЕНИЯ
    // ============================================

    virtual domain::Result<std::vector<domain::Message>> listMessages(const domain::MessageFilter& filter) = 0;

    virtual domain::Result<domain::MessageReceipt> sendMessage(const domain::CreateMessage& request) = 0;

    virtual domain::Result<domain::Message> getMessage(const domain::Uuid& messageId) = 0;

    // ============================================
    // КОНТАКТЫ, ГРУППЫ, ИМЕНА ОТПРАВИТЕЛЕЙ
    // ============================================

    /**
     * @brief Список контактов (ответ - голый массив, без "results")
     */
    virtual domain::Result<std::vector<domain::Contact>> listContacts(const domain::Page& page) = 0;

    virtual domain::Result<domain::Contact> createContact(const domain::CreateContact& request) = 0;

    virtual domain::Result<std::vector<domain::Group>> listGroups(const domain::Page& page) = 0;

    virtual domain::Result<std::vector<domain::SenderName>> listSenderNames(const domain::Page& page) = 0;

    // ============================================
    // ВЕРИФИКАЦИЯ
    // ============================================

    virtual domain::Result<domain::Verification> createVerification(const domain::Verification& request) = 0;

    virtual domain::Result<domain::CheckVerification> checkVerification(
        const domain::Uuid& verificationId,
        const domain::CheckVerification& check
    ) = 0;
};

} // namespace nimbasms::ports::output
