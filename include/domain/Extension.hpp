#pragma once

#include "Result.hpp"
#include "Timestamp.hpp"
#include "Uuid.hpp"
#include "Validation.hpp"
#include "enums/AuthType.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace nimbasms::domain {

/**
 * @brief Настройки OAuth2 для расширения с auth_type = oauth2
 */
struct OAuth2Config {
    std::string clientId;
    std::string clientSecret;
    std::string authorizationUrl;
    std::string tokenUrl;
    std::string scopeSeparator;
    std::string redirectUrl;
    std::map<std::string, std::string> availableScopes;    ///< scope -> описание
    std::vector<std::string> requiredScopes;

    static Result<OAuth2Config> create(
        const std::string& clientId,
        const std::string& clientSecret,
        const std::string& authorizationUrl,
        const std::string& tokenUrl,
        const std::string& scopeSeparator,
        const std::string& redirectUrl,
        const std::map<std::string, std::string>& availableScopes = {},
        const std::vector<std::string>& requiredScopes = {}
    ) {
        if (auto failure = validation::firstFailure({
                validation::notEmpty("oauth2_config.client_id", clientId),
                validation::notEmpty("oauth2_config.client_secret", clientSecret),
                validation::url("oauth2_config.authorization_url", authorizationUrl),
                validation::url("oauth2_config.token_url", tokenUrl),
                validation::url("oauth2_config.redirect_url", redirectUrl)})) {
            return *failure;
        }

        OAuth2Config config;
        config.clientId = clientId;
        config.clientSecret = clientSecret;
        config.authorizationUrl = authorizationUrl;
        config.tokenUrl = tokenUrl;
        config.scopeSeparator = scopeSeparator;
        config.redirectUrl = redirectUrl;
        config.availableScopes = availableScopes;
        config.requiredScopes = requiredScopes;
        return config;
    }
};

inline bool operator==(const OAuth2Config& lhs, const OAuth2Config& rhs) {
    return std::tie(lhs.clientId, lhs.clientSecret, lhs.authorizationUrl, lhs.tokenUrl,
                    lhs.scopeSeparator, lhs.redirectUrl, lhs.availableScopes, lhs.requiredScopes)
        == std::tie(rhs.clientId, rhs.clientSecret, rhs.authorizationUrl, rhs.tokenUrl,
                    rhs.scopeSeparator, rhs.redirectUrl, rhs.availableScopes, rhs.requiredScopes);
}

/**
 * @brief Расширение маркетплейса
 */
struct Extension {
    static constexpr size_t NAME_MAX_LENGTH = 30;
    static constexpr size_t DESCRIPTION_MAX = 400;

    Uuid extensionid;
    std::string name;
    std::string description;
    std::optional<std::string> logo;
    std::string baseApiUrl;
    AuthType authType = AuthType::NONE;
    bool isPaid = false;
    bool isApproved = false;
    bool isPublished = false;
    std::optional<std::string> documentationUrl;
    std::optional<std::string> websiteUrl;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<std::string> url;
};

inline bool operator==(const Extension& lhs, const Extension& rhs) {
    return std::tie(lhs.extensionid, lhs.name, lhs.description, lhs.logo, lhs.baseApiUrl,
                    lhs.authType, lhs.isPaid, lhs.isApproved, lhs.isPublished,
                    lhs.documentationUrl, lhs.websiteUrl, lhs.createdAt, lhs.updatedAt, lhs.url)
        == std::tie(rhs.extensionid, rhs.name, rhs.description, rhs.logo, rhs.baseApiUrl,
                    rhs.authType, rhs.isPaid, rhs.isApproved, rhs.isPublished,
                    rhs.documentationUrl, rhs.websiteUrl, rhs.createdAt, rhs.updatedAt, rhs.url);
}

/**
 * @brief Запрос на создание расширения
 */
struct CreateExtension {
    std::string name;
    std::string description;
    std::string baseApiUrl;
    AuthType authType = AuthType::NONE;
    bool isPaid = false;
    std::optional<std::string> documentationUrl;
    std::optional<std::string> websiteUrl;
    std::optional<OAuth2Config> oauth2Config;

    static Result<CreateExtension> create(
        const std::string& name,
        const std::string& description,
        const std::string& baseApiUrl,
        AuthType authType,
        bool isPaid,
        const std::optional<std::string>& documentationUrl = std::nullopt,
        const std::optional<std::string>& websiteUrl = std::nullopt,
        const std::optional<OAuth2Config>& oauth2Config = std::nullopt
    ) {
        if (auto failure = validation::firstFailure({
                validation::notEmpty("name", name),
                validation::maxLength("name", name, Extension::NAME_MAX_LENGTH),
                validation::maxLength("description", description, Extension::DESCRIPTION_MAX),
                validation::url("base_api_url", baseApiUrl),
                validation::url("documentation_url", documentationUrl),
                validation::url("website_url", websiteUrl)})) {
            return *failure;
        }

        CreateExtension request;
        request.name = name;
        request.description = description;
        request.baseApiUrl = baseApiUrl;
        request.authType = authType;
        request.isPaid = isPaid;
        request.documentationUrl = documentationUrl;
        request.websiteUrl = websiteUrl;
        request.oauth2Config = oauth2Config;
        return request;
    }
};

/**
 * @brief Частичное обновление расширения (PATCH)
 *
 * Отправляются только заданные поля, нужно хотя бы одно.
 */
struct ExtensionUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> baseApiUrl;
    std::optional<std::string> documentationUrl;
    std::optional<std::string> websiteUrl;

    static Result<ExtensionUpdate> create(
        const std::optional<std::string>& name,
        const std::optional<std::string>& description,
        const std::optional<std::string>& baseApiUrl,
        const std::optional<std::string>& documentationUrl,
        const std::optional<std::string>& websiteUrl
    ) {
        if (!name && !description && !baseApiUrl && !documentationUrl && !websiteUrl) {
            return Error::validation("extension", "at least one field must be updated");
        }
        if (auto failure = validation::firstFailure({
                name ? validation::notEmpty("name", *name) : std::nullopt,
                validation::maxLength("name", name, Extension::NAME_MAX_LENGTH),
                validation::maxLength("description", description, Extension::DESCRIPTION_MAX),
                validation::url("base_api_url", baseApiUrl),
                validation::url("documentation_url", documentationUrl),
                validation::url("website_url", websiteUrl)})) {
            return *failure;
        }

        ExtensionUpdate update;
        update.name = name;
        update.description = description;
        update.baseApiUrl = baseApiUrl;
        update.documentationUrl = documentationUrl;
        update.websiteUrl = websiteUrl;
        return update;
    }
};

/**
 * @brief Статус публикации
 */
struct ExtensionPublish {
    bool isPublished = false;
    std::string status = "OK";
};

} // namespace nimbasms::domain
