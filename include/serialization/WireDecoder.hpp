#pragma once

#include "domain/Account.hpp"
#include "domain/Contact.hpp"
#include "domain/Extension.hpp"
#include "domain/ExtensionAction.hpp"
#include "domain/Group.hpp"
#include "domain/Message.hpp"
#include "domain/Result.hpp"
#include "domain/SenderName.hpp"
#include "domain/Verification.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace nimbasms::serialization {

/**
 * @brief Разобрать тело ответа как JSON
 * @return DECODE с полем "body" если это не JSON
 */
domain::Result<nlohmann::json> parseBody(const std::string& body);

/**
 * @brief Форма списка в ответе
 */
enum class Envelope {
    RESULTS,    ///< {"results": [...]}
    BARE_ARRAY  ///< [...] (только contacts)
};

// ============================================
// ДЕКОДЕРЫ СУЩНОСТЕЙ
// ============================================
// Каждый декодер сопоставляет поля по имени, приводит типы и
// возвращает DECODE с именем поля при отсутствии/ошибке формата.

domain::Result<domain::Account> decodeAccount(const nlohmann::json& j);
domain::Result<domain::Extension> decodeExtension(const nlohmann::json& j);
domain::Result<domain::ExtensionAction> decodeExtensionAction(const nlohmann::json& j);
domain::Result<domain::ExtensionPublish> decodeExtensionPublish(const nlohmann::json& j);
domain::Result<domain::Contact> decodeContact(const nlohmann::json& j);
domain::Result<domain::Group> decodeGroup(const nlohmann::json& j);
domain::Result<domain::SenderName> decodeSenderName(const nlohmann::json& j);
domain::Result<domain::DeliveryMessage> decodeDeliveryMessage(const nlohmann::json& j,
                                                               const std::string& path = "");
domain::Result<domain::Message> decodeMessage(const nlohmann::json& j);
domain::Result<domain::MessageReceipt> decodeMessageReceipt(const nlohmann::json& j);
domain::Result<domain::Verification> decodeVerification(const nlohmann::json& j);
domain::Result<domain::CheckVerification> decodeCheckVerification(const nlohmann::json& j);

/**
 * @brief Декодировать список сущностей
 *
 * Ошибка элемента сообщается с индексом: "results[2].status".
 */
template <typename T>
domain::Result<std::vector<T>> decodeList(
    const nlohmann::json& j,
    Envelope envelope,
    domain::Result<T> (*decodeItem)(const nlohmann::json&)
) {
    const nlohmann::json* items = &j;
    std::string prefix;

    if (envelope == Envelope::RESULTS) {
        if (!j.is_object()) {
            return domain::Error::decode("body", "expected an object with 'results'");
        }
        auto it = j.find("results");
        if (it == j.end()) {
            return domain::Error::decode("results", "missing required field");
        }
        items = &*it;
        prefix = "results";
    }

    if (!items->is_array()) {
        return domain::Error::decode(prefix.empty() ? "body" : prefix, "expected an array");
    }

    std::vector<T> result;
    result.reserve(items->size());
    for (size_t i = 0; i < items->size(); ++i) {
        auto item = decodeItem((*items)[i]);
        if (!item) {
            auto error = item.error();
            std::string position = prefix + "[" + std::to_string(i) + "]";
            error.field = error.field == "body" ? position : position + "." + error.field;
            return error;
        }
        result.push_back(std::move(item).value());
    }
    return result;
}

} // namespace nimbasms::serialization
