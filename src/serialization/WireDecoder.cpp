#include "serialization/WireDecoder.hpp"
#include "serialization/WireReader.hpp"

namespace nimbasms::serialization {

using domain::Error;
using domain::Result;

Result<nlohmann::json> parseBody(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return Error::decode("body", "response is not valid JSON");
    }
    return json;
}

namespace {

domain::ParamMap toParamMap(const nlohmann::json& object) {
    domain::ParamMap params;
    for (auto it = object.begin(); it != object.end(); ++it) {
        params[it.key()] = it.value();
    }
    return params;
}

} // namespace

Result<domain::Account> decodeAccount(const nlohmann::json& j) {
    WireReader r(j);
    auto sid = r.requireString("sid");
    auto balance = r.requireInt("balance", 0);
    auto webhookUrl = r.optionalString("webhook_url");
    if (r.failed()) return r.error();

    domain::Account account;
    account.sid = *sid;
    account.balance = *balance;
    account.webhookUrl = webhookUrl;
    return account;
}

Result<domain::Extension> decodeExtension(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("extensionid");
    auto name = r.requireString("name", domain::Extension::NAME_MAX_LENGTH);
    auto description = r.requireString("description", domain::Extension::DESCRIPTION_MAX);
    auto logo = r.optionalUrl("logo");
    auto baseApiUrl = r.requireUrl("base_api_url");
    auto authType = r.requireEnum<domain::AuthType>("auth_type", domain::parseAuthType);
    auto isPaid = r.requireBool("is_paid");
    auto isApproved = r.optionalBool("is_approved", false);
    auto isPublished = r.optionalBool("is_published", false);
    auto documentationUrl = r.optionalUrl("documentation_url");
    auto websiteUrl = r.optionalUrl("website_url");
    auto createdAt = r.requireTimestamp("created_at");
    auto updatedAt = r.requireTimestamp("updated_at");
    auto url = r.optionalUrl("url");
    if (r.failed()) return r.error();

    domain::Extension extension;
    extension.extensionid = *id;
    extension.name = *name;
    extension.description = *description;
    extension.logo = logo;
    extension.baseApiUrl = *baseApiUrl;
    extension.authType = *authType;
    extension.isPaid = *isPaid;
    extension.isApproved = *isApproved;
    extension.isPublished = *isPublished;
    extension.documentationUrl = documentationUrl;
    extension.websiteUrl = websiteUrl;
    extension.createdAt = *createdAt;
    extension.updatedAt = *updatedAt;
    extension.url = url;
    return extension;
}

Result<domain::ExtensionAction> decodeExtensionAction(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("actionid");
    auto name = r.requireString("name", domain::ExtensionAction::NAME_MAX_LENGTH);
    auto method = r.requireEnum<domain::HttpMethod>("method", domain::parseHttpMethod);
    auto endpoint = r.requireString("endpoint", domain::ExtensionAction::ENDPOINT_MAX);
    auto description = r.requireString("description", domain::ExtensionAction::DESCRIPTION_MAX);
    auto requiredParams = r.object("required_params");
    auto optionalParams = r.object("optional_params");
    auto responseFormat = r.object("response_format");
    if (r.failed()) return r.error();

    domain::ExtensionAction action;
    action.actionid = *id;
    action.name = *name;
    action.method = *method;
    action.endpoint = *endpoint;
    action.description = *description;
    action.requiredParams = toParamMap(*requiredParams);
    action.optionalParams = toParamMap(*optionalParams);
    action.responseFormat = toParamMap(*responseFormat);
    return action;
}

Result<domain::ExtensionPublish> decodeExtensionPublish(const nlohmann::json& j) {
    WireReader r(j);
    auto isPublished = r.requireBool("is_published");
    auto status = r.optionalString("status");
    if (r.failed()) return r.error();

    domain::ExtensionPublish publish;
    publish.isPublished = *isPublished;
    publish.status = status.value_or("OK");
    return publish;
}

Result<domain::Contact> decodeContact(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("contact_id");
    auto name = r.optionalString("name", domain::Contact::NAME_MAX_LENGTH);
    auto numero = r.requireString("numero", domain::Contact::NUMERO_MAX);
    auto groups = r.stringList("groups");
    auto createdAt = r.requireTimestamp("created_at");
    if (!r.failed() && numero->empty()) {
        r.fail("numero", "must not be empty");
    }
    if (r.failed()) return r.error();

    domain::Contact contact;
    contact.contactId = *id;
    contact.name = name;
    contact.numero = *numero;
    contact.groups = *groups;
    contact.createdAt = *createdAt;
    return contact;
}

Result<domain::Group> decodeGroup(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("groupe_id");
    auto name = r.requireString("name", 100);
    auto addedAt = r.requireTimestamp("added_at");
    auto totalContact = r.requireInt("total_contact", 0);
    if (r.failed()) return r.error();

    domain::Group group;
    group.groupeId = *id;
    group.name = *name;
    group.addedAt = *addedAt;
    group.totalContact = *totalContact;
    return group;
}

Result<domain::SenderName> decodeSenderName(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("sendername_id");
    auto name = r.requireString("name");
    auto status = r.requireEnum<domain::SenderNameStatus>("status", domain::parseSenderNameStatus);
    auto addedAt = r.requireTimestamp("added_at");
    if (r.failed()) return r.error();

    domain::SenderName senderName;
    senderName.sendernameId = *id;
    senderName.name = *name;
    senderName.status = *status;
    senderName.addedAt = *addedAt;
    return senderName;
}

Result<domain::DeliveryMessage> decodeDeliveryMessage(const nlohmann::json& j, const std::string& path) {
    WireReader r(j, path);
    auto id = r.requireUuid("id");
    auto contact = r.requireString("contact");
    auto status = r.requireEnum<domain::MessageStatus>("status", domain::parseMessageStatus);
    if (r.failed()) return r.error();

    domain::DeliveryMessage delivery;
    delivery.id = *id;
    delivery.contact = *contact;
    delivery.status = *status;
    return delivery;
}

Result<domain::Message> decodeMessage(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("messageid");
    auto senderName = r.requireString("sender_name", domain::Message::SENDER_NAME_MAX);
    auto text = r.requireString("message", domain::Message::MESSAGE_MAX);
    auto status = r.requireEnum<domain::MessageStatus>("status", domain::parseMessageStatus);
    auto sentAt = r.requireTimestamp("sent_at");
    if (r.failed()) return r.error();

    domain::Message message;
    message.messageid = *id;
    message.senderName = *senderName;
    message.message = *text;
    message.status = *status;
    message.sentAt = *sentAt;

    auto numbers = j.find("numbers");
    if (numbers != j.end() && !numbers->is_null()) {
        if (!numbers->is_array()) {
            return Error::decode("numbers", "expected an array");
        }
        for (size_t i = 0; i < numbers->size(); ++i) {
            auto delivery = decodeDeliveryMessage((*numbers)[i], "numbers[" + std::to_string(i) + "]");
            if (!delivery) return delivery.error();
            message.numbers.push_back(std::move(delivery).value());
        }
    }
    return message;
}

Result<domain::MessageReceipt> decodeMessageReceipt(const nlohmann::json& j) {
    WireReader r(j);
    auto id = r.requireUuid("messageid");
    auto url = r.requireUrl("url");
    if (r.failed()) return r.error();

    domain::MessageReceipt receipt;
    receipt.messageid = *id;
    receipt.url = *url;
    return receipt;
}

Result<domain::Verification> decodeVerification(const nlohmann::json& j) {
    WireReader r(j);
    auto to = r.requireString("to");
    auto message = r.optionalString("message");
    auto senderName = r.optionalString("sender_name");
    auto expiryTime = r.optionalInt("expiry_time", domain::Verification::EXPIRY_MIN, domain::Verification::EXPIRY_MAX);
    auto attempts = r.optionalInt("attempts", domain::Verification::ATTEMPTS_MIN, domain::Verification::ATTEMPTS_MAX);
    auto code = r.optionalString("code");
    auto codeLength = r.optionalInt("code_length", domain::Verification::CODE_LENGTH_MIN, domain::Verification::CODE_LENGTH_MAX);
    auto url = r.optionalString("url");
    if (r.failed()) return r.error();

    domain::Verification draft;
    if (j.contains("verificationid") && !j.at("verificationid").is_null()) {
        auto id = r.requireUuid("verificationid");
        if (r.failed()) return r.error();
        draft.verificationid = *id;
    }
    draft.to = *to;
    draft.message = message;
    draft.senderName = senderName;
    draft.code = code;
    draft.url = url;
    if (expiryTime) draft.expiryTime = static_cast<int>(*expiryTime);
    if (attempts) draft.attempts = static_cast<int>(*attempts);
    if (codeLength) draft.codeLength = static_cast<int>(*codeLength);

    // Ограничения те же, что и для запроса; нарушение в ответе - ошибка декодирования
    auto checked = domain::Verification::validate(draft);
    if (!checked) {
        return Error::decode(checked.error().field, checked.error().message);
    }
    return checked;
}

Result<domain::CheckVerification> decodeCheckVerification(const nlohmann::json& j) {
    WireReader r(j);
    auto code = r.requireInt("code", domain::CheckVerification::CODE_MIN, domain::CheckVerification::CODE_MAX);
    auto status = r.optionalEnum<domain::VerificationStatus>("status", domain::parseVerificationStatus);
    if (r.failed()) return r.error();

    domain::CheckVerification check;
    check.code = *code;
    check.status = status;
    return check;
}

} // namespace nimbasms::serialization
