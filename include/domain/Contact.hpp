#pragma once

#include "Result.hpp"
#include "Timestamp.hpp"
#include "Uuid.hpp"
#include "Validation.hpp"
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace nimbasms::domain {

/**
 * @brief Контакт адресной книги
 */
struct Contact {
    static constexpr size_t NAME_MAX_LENGTH = 400;
    static constexpr size_t NUMERO_MAX = 128;

    Uuid contactId;
    std::optional<std::string> name;
    std::string numero;                 ///< Обязателен, непустой
    std::vector<std::string> groups;    ///< Имена групп, порядок сохраняется
    Timestamp createdAt;
};

inline bool operator==(const Contact& lhs, const Contact& rhs) {
    return std::tie(lhs.contactId, lhs.name, lhs.numero, lhs.groups, lhs.createdAt)
        == std::tie(rhs.contactId, rhs.name, rhs.numero, rhs.groups, rhs.createdAt);
}

/**
 * @brief Запрос на создание контакта
 */
struct CreateContact {
    std::optional<std::string> name;
    std::string numero;
    std::vector<std::string> groups;

    static Result<CreateContact> create(
        const std::string& numero,
        const std::optional<std::string>& name = std::nullopt,
        const std::vector<std::string>& groups = {}
    ) {
        if (auto failure = validation::firstFailure({
                validation::maxLength("name", name, Contact::NAME_MAX_LENGTH),
                validation::notEmpty("numero", numero),
                validation::maxLength("numero", numero, Contact::NUMERO_MAX)})) {
            return *failure;
        }

        CreateContact request;
        request.name = name;
        request.numero = numero;
        request.groups = groups;
        return request;
    }
};

inline bool operator==(const CreateContact& lhs, const CreateContact& rhs) {
    return std::tie(lhs.name, lhs.numero, lhs.groups) == std::tie(rhs.name, rhs.numero, rhs.groups);
}

} // namespace nimbasms::domain
