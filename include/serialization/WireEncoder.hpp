#pragma once

#include "domain/Account.hpp"
#include "domain/Contact.hpp"
#include "domain/Extension.hpp"
#include "domain/ExtensionAction.hpp"
#include "domain/Group.hpp"
#include "domain/Message.hpp"
#include "domain/SenderName.hpp"
#include "domain/Verification.hpp"
#include <nlohmann/json.hpp>

namespace nimbasms::serialization {

// ============================================
// ЗАПРОСЫ
// ============================================
// Поля без значения не отправляются (ни одно поле API не требует явного null).

nlohmann::json encode(const domain::CreateExtension& request);
nlohmann::json encode(const domain::ExtensionUpdate& update);
nlohmann::json encode(const domain::OAuth2Config& config);
nlohmann::json encode(const domain::ActionRequest& request);
nlohmann::json encode(const domain::ActionUpdate& update);
nlohmann::json encode(const domain::CreateContact& request);
nlohmann::json encode(const domain::CreateMessage& request);
nlohmann::json encode(const domain::Verification& verification);
nlohmann::json encode(const domain::CheckVerification& check);

// ============================================
// СУЩНОСТИ ОТВЕТОВ (вывод --output json)
// ============================================

nlohmann::json encode(const domain::Account& account);
nlohmann::json encode(const domain::Extension& extension);
nlohmann::json encode(const domain::ExtensionAction& action);
nlohmann::json encode(const domain::ExtensionPublish& publish);
nlohmann::json encode(const domain::Contact& contact);
nlohmann::json encode(const domain::Group& group);
nlohmann::json encode(const domain::SenderName& senderName);
nlohmann::json encode(const domain::DeliveryMessage& delivery);
nlohmann::json encode(const domain::Message& message);
nlohmann::json encode(const domain::MessageReceipt& receipt);

template <typename T>
nlohmann::json encodeList(const std::vector<T>& items) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(encode(item));
    }
    return array;
}

} // namespace nimbasms::serialization
