#include "adapters/secondary/HttpNimbaSmsGateway.hpp"
#include "serialization/WireEncoder.hpp"
#include "utils/Base64.hpp"
#include "utils/UuidGenerator.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace nimbasms::adapters::secondary {

using domain::Error;
using domain::Result;
using ports::output::HttpRequest;
using serialization::Envelope;

HttpNimbaSmsGateway::HttpNimbaSmsGateway(
    std::shared_ptr<ports::output::IHttpTransport> transport,
    std::shared_ptr<settings::IApiClientSettings> settings,
    const domain::Credentials& credentials
) : transport_(std::move(transport))
  , settings_(std::move(settings))
{
    auto url = utils::Url::parse(settings_->getBaseUrl());
    if (!url) {
        throw std::invalid_argument("Invalid API base URL: " + settings_->getBaseUrl());
    }
    if (!credentials.isComplete()) {
        throw std::invalid_argument("Both service_id and secret_token are required");
    }

    baseUrl_ = *url;
    authorization_ = "Basic " + utils::base64Encode(*credentials.serviceId + ":" + *credentials.secretToken);
}

// ============================================
// АККАУНТ
// ============================================

Result<domain::Account> HttpNimbaSmsGateway::getAccount() {
    return fetch(makeRequest("GET", "/accounts"), serialization::decodeAccount);
}

// ============================================
// РАСШИРЕНИЯ
// ============================================

Result<std::vector<domain::Extension>> HttpNimbaSmsGateway::listExtensions(const domain::Page& page) {
    return fetchList(makeRequest("GET", "/extensions", pageParams(page)),
                     Envelope::RESULTS, serialization::decodeExtension);
}

Result<domain::Extension> HttpNimbaSmsGateway::createExtension(const domain::CreateExtension& request) {
    return fetch(makeJsonRequest("POST", "/extensions", serialization::encode(request)),
                 serialization::decodeExtension);
}

Result<domain::Extension> HttpNimbaSmsGateway::getExtension(const domain::Uuid& extensionId) {
    return fetch(makeRequest("GET", "/extensions/" + extensionId.toString()),
                 serialization::decodeExtension);
}

Result<domain::Extension> HttpNimbaSmsGateway::updateExtension(
    const domain::Uuid& extensionId,
    const domain::ExtensionUpdate& update
) {
    return fetch(makeJsonRequest("PATCH", "/extensions/" + extensionId.toString(), serialization::encode(update)),
                 serialization::decodeExtension);
}

Result<domain::Extension> HttpNimbaSmsGateway::uploadLogo(
    const domain::Uuid& extensionId,
    const std::string& logoPath
) {
    // Проверка локальная и выполняется до построения запроса
    std::error_code ec;
    if (!std::filesystem::is_regular_file(logoPath, ec)) {
        return Error::fileNotFound(logoPath);
    }

    std::ifstream file(logoPath, std::ios::binary);
    if (!file) {
        return Error::fileNotFound(logoPath);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::string boundary = utils::UuidGenerator::multipartBoundary();
    std::ostringstream body;
    body << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"logo\"; filename=\"logo.png\"\r\n"
         << "Content-Type: image/png\r\n"
         << "\r\n"
         << content << "\r\n"
         << "--" << boundary << "--\r\n";

    auto request = makeRequest("PATCH", "/extensions/" + extensionId.toString() + "/logo");
    request.headers.emplace_back("Content-Type", "multipart/form-data; boundary=" + boundary);
    request.body = body.str();

    return fetch(request, serialization::decodeExtension);
}

// ============================================
// ДЕЙСТВИЯ РАСШИРЕНИЙ
// ============================================

Result<std::vector<domain::ExtensionAction>> HttpNimbaSmsGateway::listActions(
    const domain::Uuid& extensionId,
    const domain::Page& page
) {
    return fetchList(makeRequest("GET", "/extensions/" + extensionId.toString() + "/actions", pageParams(page)),
                     Envelope::RESULTS, serialization::decodeExtensionAction);
}

Result<domain::ExtensionAction> HttpNimbaSmsGateway::createAction(
    const domain::Uuid& extensionId,
    const domain::ActionRequest& request
) {
    return fetch(makeJsonRequest("POST", "/extensions/" + extensionId.toString() + "/actions",
                                 serialization::encode(request)),
                 serialization::decodeExtensionAction);
}

Result<domain::ExtensionAction> HttpNimbaSmsGateway::updateAction(
    const domain::Uuid& extensionId,
    const domain::Uuid& actionId,
    const domain::ActionUpdate& update
) {
    std::string resource = "/extensions/" + extensionId.toString() + "/actions/" + actionId.toString();
    return fetch(makeJsonRequest("PATCH", resource, serialization::encode(update)),
                 serialization::decodeExtensionAction);
}

Result<void> HttpNimbaSmsGateway::deleteAction(
    const domain::Uuid& extensionId,
    const domain::Uuid& actionId
) {
    std::string resource = "/extensions/" + extensionId.toString() + "/actions/" + actionId.toString();
    auto body = execute(makeRequest("DELETE", resource));
    if (!body) {
        return body.error();
    }
    return Result<void>::success();
}

Result<domain::ExtensionPublish> HttpNimbaSmsGateway::publishAction(
    const domain::Uuid& extensionId,
    const domain::Uuid& actionId
) {
    std::string resource = "/extensions/" + extensionId.toString() + "/actions/"
                         + actionId.toString() + "/publish";
    return fetch(makeRequest("POST", resource), serialization::decodeExtensionPublish);
}

// ============================================
// СООБЩЕНИЯ
// ============================================

Result<std::vector<domain::Message>> HttpNimbaSmsGateway::listMessages(const domain::MessageFilter& filter) {
    auto params = pageParams(filter.page);
    if (filter.status) {
        params.emplace_back("status", domain::toString(*filter.status));
    }
    if (filter.sentAtGte && !filter.sentAtGte->empty()) {
        params.emplace_back("sent_at__gte", *filter.sentAtGte);
    }
    if (filter.sentAtLte && !filter.sentAtLte->empty()) {
        params.emplace_back("sent_at__lte", *filter.sentAtLte);
    }

    return fetchList(makeRequest("GET", "/messages", params),
                     Envelope::RESULTS, serialization::decodeMessage);
}

Result<domain::MessageReceipt> HttpNimbaSmsGateway::sendMessage(const domain::CreateMessage& request) {
    return fetch(makeJsonRequest("POST", "/messages", serialization::encode(request)),
                 serialization::decodeMessageReceipt);
}

Result<domain::Message> HttpNimbaSmsGateway::getMessage(const domain::Uuid& messageId) {
    return fetch(makeRequest("GET", "/messages/" + messageId.toString()), serialization::decodeMessage);
}

// ============================================
// КОНТАКТЫ, ГРУППЫ, ИМЕНА ОТПРАВИТЕЛЕЙ
// ============================================

Result<std::vector<domain::Contact>> HttpNimbaSmsGateway::listContacts(const domain::Page& page) {
    // contacts отдаются голым массивом, в отличие от остальных списков
    return fetchList(makeRequest("GET", "/contacts", pageParams(page)),
                     Envelope::BARE_ARRAY, serialization::decodeContact);
}

Result<domain::Contact> HttpNimbaSmsGateway::createContact(const domain::CreateContact& request) {
    return fetch(makeJsonRequest("POST", "/contacts", serialization::encode(request)),
                 serialization::decodeContact);
}

Result<std::vector<domain::Group>> HttpNimbaSmsGateway::listGroups(const domain::Page& page) {
    return fetchList(makeRequest("GET", "/groups", pageParams(page)),
                     Envelope::RESULTS, serialization::decodeGroup);
}

Result<std::vector<domain::SenderName>> HttpNimbaSmsGateway::listSenderNames(const domain::Page& page) {
    return fetchList(makeRequest("GET", "/sendernames", pageParams(page)),
                     Envelope::RESULTS, serialization::decodeSenderName);
}

// ============================================
// ВЕРИФИКАЦИЯ
// ============================================

Result<domain::Verification> HttpNimbaSmsGateway::createVerification(const domain::Verification& request) {
    return fetch(makeJsonRequest("POST", "/verifications", serialization::encode(request)),
                 serialization::decodeVerification);
}

Result<domain::CheckVerification> HttpNimbaSmsGateway::checkVerification(
    const domain::Uuid& verificationId,
    const domain::CheckVerification& check
) {
    return fetch(makeJsonRequest("PATCH", "/verifications/" + verificationId.toString(),
                                 serialization::encode(check)),
                 serialization::decodeCheckVerification);
}

// ============================================
// ВНУТРЕННЕЕ
// ============================================

HttpRequest HttpNimbaSmsGateway::makeRequest(
    const std::string& method,
    const std::string& resource,
    const QueryParams& query
) const {
    HttpRequest request;
    request.method = method;
    request.scheme = baseUrl_.scheme;
    request.host = baseUrl_.host;
    request.port = baseUrl_.port;
    request.target = baseUrl_.path + resource;
    if (!query.empty()) {
        request.target += "?" + utils::buildQuery(query);
    }
    request.headers = {
        {"Authorization", authorization_},
        {"Accept", "application/json"}
    };
    return request;
}

HttpRequest HttpNimbaSmsGateway::makeJsonRequest(
    const std::string& method,
    const std::string& resource,
    const nlohmann::json& body
) const {
    auto request = makeRequest(method, resource);
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = body.dump();
    return request;
}

HttpNimbaSmsGateway::QueryParams HttpNimbaSmsGateway::pageParams(const domain::Page& page) {
    return {
        {"limit", std::to_string(page.limit)},
        {"offset", std::to_string(page.offset)}
    };
}

Result<std::string> HttpNimbaSmsGateway::execute(const HttpRequest& request) {
    auto response = transport_->send(request);
    if (!response) {
        return response.error();
    }

    if (!response->isSuccess()) {
        std::string detail = "Request failed with status " + std::to_string(response->status);
        auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (!json.is_discarded() && json.is_object() && json.contains("detail")) {
            const auto& value = json.at("detail");
            detail = value.is_string() ? value.get<std::string>() : value.dump();
        }
        return Error::api(response->status, detail);
    }

    return response->body;
}

template <typename T>
Result<T> HttpNimbaSmsGateway::fetch(
    const HttpRequest& request,
    Result<T> (*decode)(const nlohmann::json&)
) {
    auto body = execute(request);
    if (!body) return body.error();

    auto json = serialization::parseBody(*body);
    if (!json) return json.error();

    return decode(*json);
}

template <typename T>
Result<std::vector<T>> HttpNimbaSmsGateway::fetchList(
    const HttpRequest& request,
    Envelope envelope,
    Result<T> (*decode)(const nlohmann::json&)
) {
    auto body = execute(request);
    if (!body) return body.error();

    auto json = serialization::parseBody(*body);
    if (!json) return json.error();

    return serialization::decodeList(*json, envelope, decode);
}

} // namespace nimbasms::adapters::secondary
