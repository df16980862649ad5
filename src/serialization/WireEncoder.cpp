#include "serialization/WireEncoder.hpp"

namespace nimbasms::serialization {

namespace {

template <typename T>
void putIfPresent(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

nlohmann::json toObject(const domain::ParamMap& params) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [key, value] : params) {
        object[key] = value;
    }
    return object;
}

} // namespace

// ============================================
// ЗАПРОСЫ
// ============================================

nlohmann::json encode(const domain::OAuth2Config& config) {
    nlohmann::json j;
    j["client_id"] = config.clientId;
    j["client_secret"] = config.clientSecret;
    j["authorization_url"] = config.authorizationUrl;
    j["token_url"] = config.tokenUrl;
    j["scope_separator"] = config.scopeSeparator;
    j["redirect_url"] = config.redirectUrl;
    j["available_scopes"] = config.availableScopes;
    j["required_scopes"] = config.requiredScopes;
    return j;
}

nlohmann::json encode(const domain::CreateExtension& request) {
    nlohmann::json j;
    j["name"] = request.name;
    j["description"] = request.description;
    j["base_api_url"] = request.baseApiUrl;
    j["auth_type"] = domain::toString(request.authType);
    j["is_paid"] = request.isPaid;
    putIfPresent(j, "documentation_url", request.documentationUrl);
    putIfPresent(j, "website_url", request.websiteUrl);
    if (request.oauth2Config) {
        j["oauth2_config"] = encode(*request.oauth2Config);
    }
    return j;
}

nlohmann::json encode(const domain::ExtensionUpdate& update) {
    nlohmann::json j = nlohmann::json::object();
    putIfPresent(j, "name", update.name);
    putIfPresent(j, "description", update.description);
    putIfPresent(j, "base_api_url", update.baseApiUrl);
    putIfPresent(j, "documentation_url", update.documentationUrl);
    putIfPresent(j, "website_url", update.websiteUrl);
    return j;
}

nlohmann::json encode(const domain::ActionRequest& request) {
    nlohmann::json j;
    j["name"] = request.name;
    j["method"] = domain::toString(request.method);
    j["endpoint"] = request.endpoint;
    j["description"] = request.description;
    j["required_params"] = toObject(request.requiredParams);
    j["optional_params"] = toObject(request.optionalParams);
    j["response_format"] = toObject(request.responseFormat);
    return j;
}

nlohmann::json encode(const domain::ActionUpdate& update) {
    nlohmann::json j = nlohmann::json::object();
    putIfPresent(j, "name", update.name);
    if (update.method) {
        j["method"] = domain::toString(*update.method);
    }
    putIfPresent(j, "endpoint", update.endpoint);
    putIfPresent(j, "description", update.description);
    if (update.requiredParams) j["required_params"] = toObject(*update.requiredParams);
    if (update.optionalParams) j["optional_params"] = toObject(*update.optionalParams);
    if (update.responseFormat) j["response_format"] = toObject(*update.responseFormat);
    return j;
}

nlohmann::json encode(const domain::CreateContact& request) {
    nlohmann::json j;
    putIfPresent(j, "name", request.name);
    j["numero"] = request.numero;
    j["groups"] = request.groups;
    return j;
}

nlohmann::json encode(const domain::CreateMessage& request) {
    nlohmann::json j;
    j["sender_name"] = request.senderName;
    j["to"] = request.to;
    j["message"] = request.message;
    return j;
}

nlohmann::json encode(const domain::Verification& verification) {
    nlohmann::json j;
    j["verificationid"] = verification.verificationid.toString();
    j["to"] = verification.to;
    putIfPresent(j, "message", verification.message);
    putIfPresent(j, "sender_name", verification.senderName);
    putIfPresent(j, "expiry_time", verification.expiryTime);
    putIfPresent(j, "attempts", verification.attempts);
    putIfPresent(j, "code", verification.code);
    putIfPresent(j, "code_length", verification.codeLength);
    putIfPresent(j, "url", verification.url);
    return j;
}

nlohmann::json encode(const domain::CheckVerification& check) {
    nlohmann::json j;
    j["code"] = check.code;
    if (check.status) {
        j["status"] = domain::toString(*check.status);
    }
    return j;
}

// ============================================
// СУЩНОСТИ ОТВЕТОВ
// ============================================

nlohmann::json encode(const domain::Account& account) {
    nlohmann::json j;
    j["sid"] = account.sid;
    j["balance"] = account.balance;
    putIfPresent(j, "webhook_url", account.webhookUrl);
    return j;
}

nlohmann::json encode(const domain::Extension& extension) {
    nlohmann::json j;
    j["extensionid"] = extension.extensionid.toString();
    j["name"] = extension.name;
    j["description"] = extension.description;
    putIfPresent(j, "logo", extension.logo);
    j["base_api_url"] = extension.baseApiUrl;
    j["auth_type"] = domain::toString(extension.authType);
    j["is_paid"] = extension.isPaid;
    j["is_approved"] = extension.isApproved;
    j["is_published"] = extension.isPublished;
    putIfPresent(j, "documentation_url", extension.documentationUrl);
    putIfPresent(j, "website_url", extension.websiteUrl);
    j["created_at"] = extension.createdAt.toString();
    j["updated_at"] = extension.updatedAt.toString();
    putIfPresent(j, "url", extension.url);
    return j;
}

nlohmann::json encode(const domain::ExtensionAction& action) {
    nlohmann::json j;
    j["actionid"] = action.actionid.toString();
    j["name"] = action.name;
    j["method"] = domain::toString(action.method);
    j["endpoint"] = action.endpoint;
    j["description"] = action.description;
    j["required_params"] = toObject(action.requiredParams);
    j["optional_params"] = toObject(action.optionalParams);
    j["response_format"] = toObject(action.responseFormat);
    return j;
}

nlohmann::json encode(const domain::ExtensionPublish& publish) {
    return {{"is_published", publish.isPublished}, {"status", publish.status}};
}

nlohmann::json encode(const domain::Contact& contact) {
    nlohmann::json j;
    j["contact_id"] = contact.contactId.toString();
    putIfPresent(j, "name", contact.name);
    j["numero"] = contact.numero;
    j["groups"] = contact.groups;
    j["created_at"] = contact.createdAt.toEpochSeconds();
    return j;
}

nlohmann::json encode(const domain::Group& group) {
    nlohmann::json j;
    j["groupe_id"] = group.groupeId.toString();
    j["name"] = group.name;
    j["added_at"] = group.addedAt.toEpochSeconds();
    j["total_contact"] = group.totalContact;
    return j;
}

nlohmann::json encode(const domain::SenderName& senderName) {
    nlohmann::json j;
    j["sendername_id"] = senderName.sendernameId.toString();
    j["name"] = senderName.name;
    j["status"] = domain::toString(senderName.status);
    j["added_at"] = senderName.addedAt.toEpochSeconds();
    return j;
}

nlohmann::json encode(const domain::DeliveryMessage& delivery) {
    nlohmann::json j;
    j["id"] = delivery.id.toString();
    j["contact"] = delivery.contact;
    j["status"] = domain::toString(delivery.status);
    return j;
}

nlohmann::json encode(const domain::Message& message) {
    nlohmann::json j;
    j["messageid"] = message.messageid.toString();
    j["sender_name"] = message.senderName;
    j["message"] = message.message;
    j["status"] = domain::toString(message.status);
    j["sent_at"] = message.sentAt.toEpochSeconds();
    j["numbers"] = encodeList(message.numbers);
    return j;
}

nlohmann::json encode(const domain::MessageReceipt& receipt) {
    nlohmann::json j;
    j["messageid"] = receipt.messageid.toString();
    j["url"] = receipt.url;
    return j;
}

} // namespace nimbasms::serialization
