#pragma once

#include "domain/Account.hpp"
#include "domain/Contact.hpp"
#include "domain/Error.hpp"
#include "domain/Extension.hpp"
#include "domain/ExtensionAction.hpp"
#include "domain/Group.hpp"
#include "domain/Message.hpp"
#include "domain/SenderName.hpp"
#include "domain/Verification.hpp"
#include "serialization/WireEncoder.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace nimbasms::adapters::primary::cli {

enum class OutputFormat {
    TABLE,
    JSON
};

std::optional<OutputFormat> parseOutputFormat(const std::string& str);

/**
 * @brief Текст ошибки для пользователя (без префикса "Error: ")
 *
 * 401 -> "Invalid credentials", 429 -> "Rate limit exceeded",
 * остальные API ошибки -> detail сервера.
 */
std::string formatError(const domain::Error& error);

// ============================================
// ТАБЛИЧНЫЙ ВЫВОД
// ============================================

void printTable(std::ostream& out, const domain::Account& account);
void printTable(std::ostream& out, const domain::Extension& extension);
void printTable(std::ostream& out, const domain::ExtensionAction& action);
void printTable(std::ostream& out, const domain::ExtensionPublish& publish);
void printTable(std::ostream& out, const domain::Contact& contact);
void printTable(std::ostream& out, const domain::Message& message);
void printTable(std::ostream& out, const domain::MessageReceipt& receipt);
void printTable(std::ostream& out, const domain::Verification& verification);
void printTable(std::ostream& out, const domain::CheckVerification& check);

void printTable(std::ostream& out, const std::vector<domain::Extension>& extensions);
void printTable(std::ostream& out, const std::vector<domain::ExtensionAction>& actions);
void printTable(std::ostream& out, const std::vector<domain::Message>& messages);
void printTable(std::ostream& out, const std::vector<domain::Contact>& contacts);
void printTable(std::ostream& out, const std::vector<domain::Group>& groups);
void printTable(std::ostream& out, const std::vector<domain::SenderName>& senderNames);

/**
 * @brief Вывести значение в выбранном формате
 *
 * JSON - тот же кодировщик, что и для запросов к API.
 */
template <typename T>
void print(std::ostream& out, OutputFormat format, const T& value) {
    if (format == OutputFormat::JSON) {
        out << serialization::encode(value).dump(2) << "\n";
    } else {
        printTable(out, value);
    }
}

template <typename T>
void print(std::ostream& out, OutputFormat format, const std::vector<T>& values) {
    if (format == OutputFormat::JSON) {
        out << serialization::encodeList(values).dump(2) << "\n";
    } else {
        printTable(out, values);
    }
}

} // namespace nimbasms::adapters::primary::cli
