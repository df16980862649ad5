#pragma once

#include "Result.hpp"
#include "Uuid.hpp"
#include "Validation.hpp"
#include "enums/HttpMethod.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace nimbasms::domain {

/**
 * @brief Произвольный словарь параметров действия (значения - любой JSON)
 */
using ParamMap = std::map<std::string, nlohmann::json>;

/**
 * @brief Действие расширения (вызов внешнего API)
 */
struct ExtensionAction {
    static constexpr size_t NAME_MAX_LENGTH = 100;
    static constexpr size_t ENDPOINT_MAX = 255;
    static constexpr size_t DESCRIPTION_MAX = 200;

    Uuid actionid;
    std::string name;
    HttpMethod method = HttpMethod::GET;
    std::string endpoint;
    std::string description;
    ParamMap requiredParams;
    ParamMap optionalParams;
    ParamMap responseFormat;
};

inline bool operator==(const ExtensionAction& lhs, const ExtensionAction& rhs) {
    return std::tie(lhs.actionid, lhs.name, lhs.method, lhs.endpoint, lhs.description,
                    lhs.requiredParams, lhs.optionalParams, lhs.responseFormat)
        == std::tie(rhs.actionid, rhs.name, rhs.method, rhs.endpoint, rhs.description,
                    rhs.requiredParams, rhs.optionalParams, rhs.responseFormat);
}

/**
 * @brief Запрос на создание действия
 */
struct ActionRequest {
    std::string name;
    HttpMethod method = HttpMethod::GET;
    std::string endpoint;
    std::string description;
    ParamMap requiredParams;
    ParamMap optionalParams;
    ParamMap responseFormat;

    static Result<ActionRequest> create(
        const std::string& name,
        HttpMethod method,
        const std::string& endpoint,
        const std::string& description,
        const ParamMap& requiredParams = {},
        const ParamMap& optionalParams = {},
        const ParamMap& responseFormat = {}
    ) {
        if (auto failure = validation::firstFailure({
                validation::notEmpty("name", name),
                validation::maxLength("name", name, ExtensionAction::NAME_MAX_LENGTH),
                validation::notEmpty("endpoint", endpoint),
                validation::maxLength("endpoint", endpoint, ExtensionAction::ENDPOINT_MAX),
                validation::maxLength("description", description, ExtensionAction::DESCRIPTION_MAX)})) {
            return *failure;
        }

        ActionRequest request;
        request.name = name;
        request.method = method;
        request.endpoint = endpoint;
        request.description = description;
        request.requiredParams = requiredParams;
        request.optionalParams = optionalParams;
        request.responseFormat = responseFormat;
        return request;
    }
};

/**
 * @brief Частичное обновление действия
 */
struct ActionUpdate {
    std::optional<std::string> name;
    std::optional<HttpMethod> method;
    std::optional<std::string> endpoint;
    std::optional<std::string> description;
    std::optional<ParamMap> requiredParams;
    std::optional<ParamMap> optionalParams;
    std::optional<ParamMap> responseFormat;

    bool empty() const {
        return !name && !method && !endpoint && !description
            && !requiredParams && !optionalParams && !responseFormat;
    }

    /**
     * @brief Проверить заданные поля тем же набором ограничений, что и ActionRequest
     */
    static Result<ActionUpdate> create(const ActionUpdate& draft) {
        if (draft.empty()) {
            return Error::validation("action", "at least one field must be updated");
        }
        if (auto failure = validation::firstFailure({
                draft.name ? validation::notEmpty("name", *draft.name) : std::nullopt,
                validation::maxLength("name", draft.name, ExtensionAction::NAME_MAX_LENGTH),
                draft.endpoint ? validation::notEmpty("endpoint", *draft.endpoint) : std::nullopt,
                validation::maxLength("endpoint", draft.endpoint, ExtensionAction::ENDPOINT_MAX),
                validation::maxLength("description", draft.description, ExtensionAction::DESCRIPTION_MAX)})) {
            return *failure;
        }
        return draft;
    }
};

} // namespace nimbasms::domain
