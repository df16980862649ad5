#include "adapters/primary/cli/OutputFormatter.hpp"
#include <iomanip>

namespace nimbasms::adapters::primary::cli {

namespace {

void row(std::ostream& out, const std::string& key, const std::string& value) {
    out << std::left << std::setw(20) << (key + ":") << value << "\n";
}

std::string orDash(const std::optional<std::string>& value) {
    return value && !value->empty() ? *value : "-";
}

std::string yesNo(bool value) {
    return value ? "yes" : "no";
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += separator;
        result += items[i];
    }
    return result;
}

template <typename Row>
void columns(std::ostream& out, const std::vector<int>& widths, const Row& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i + 1 < cells.size()) {
            out << std::left << std::setw(widths[i]) << cells[i] << " ";
        } else {
            out << cells[i];
        }
    }
    out << "\n";
}

} // namespace

std::optional<OutputFormat> parseOutputFormat(const std::string& str) {
    if (str == "table") return OutputFormat::TABLE;
    if (str == "json") return OutputFormat::JSON;
    return std::nullopt;
}

std::string formatError(const domain::Error& error) {
    if (error.isUnauthorized()) {
        return "Invalid credentials";
    }
    if (error.isRateLimited()) {
        return "Rate limit exceeded";
    }

    switch (error.kind) {
        case domain::ErrorKind::API:
            return error.message;
        case domain::ErrorKind::FILE_NOT_FOUND:
            return "Logo file not found: " + error.field;
        default:
            return error.describe();
    }
}

// ============================================
// ОДИНОЧНЫЕ СУЩНОСТИ
// ============================================

void printTable(std::ostream& out, const domain::Account& account) {
    row(out, "SID", account.sid);
    row(out, "Balance", std::to_string(account.balance));
    row(out, "Webhook URL", orDash(account.webhookUrl));
}

void printTable(std::ostream& out, const domain::Extension& extension) {
    row(out, "ID", extension.extensionid.toString());
    row(out, "Name", extension.name);
    row(out, "Description", extension.description);
    row(out, "Base API URL", extension.baseApiUrl);
    row(out, "Auth type", domain::toString(extension.authType));
    row(out, "Paid", yesNo(extension.isPaid));
    row(out, "Approved", yesNo(extension.isApproved));
    row(out, "Published", yesNo(extension.isPublished));
    row(out, "Logo", orDash(extension.logo));
    row(out, "Documentation", orDash(extension.documentationUrl));
    row(out, "Website", orDash(extension.websiteUrl));
    row(out, "Created", extension.createdAt.toDisplayString());
    row(out, "Updated", extension.updatedAt.toDisplayString());
}

void printTable(std::ostream& out, const domain::ExtensionAction& action) {
    row(out, "ID", action.actionid.toString());
    row(out, "Name", action.name);
    row(out, "Method", domain::toString(action.method));
    row(out, "Endpoint", action.endpoint);
    row(out, "Description", action.description);
    row(out, "Required params", nlohmann::json(action.requiredParams).dump());
    row(out, "Optional params", nlohmann::json(action.optionalParams).dump());
    row(out, "Response format", nlohmann::json(action.responseFormat).dump());
}

void printTable(std::ostream& out, const domain::ExtensionPublish& publish) {
    row(out, "Published", yesNo(publish.isPublished));
    row(out, "Status", publish.status);
}

void printTable(std::ostream& out, const domain::Contact& contact) {
    row(out, "ID", contact.contactId.toString());
    row(out, "Name", orDash(contact.name));
    row(out, "Number", contact.numero);
    row(out, "Groups", contact.groups.empty() ? "-" : join(contact.groups, ", "));
    row(out, "Created", contact.createdAt.toDisplayString());
}

void printTable(std::ostream& out, const domain::Message& message) {
    row(out, "ID", message.messageid.toString());
    row(out, "Sender", message.senderName);
    row(out, "Status", domain::toString(message.status));
    row(out, "Sent at", message.sentAt.toDisplayString());
    row(out, "Message", message.message);
    for (const auto& number : message.numbers) {
        row(out, "Recipient", number.contact + " (" + domain::toString(number.status) + ")");
    }
}

void printTable(std::ostream& out, const domain::MessageReceipt& receipt) {
    row(out, "Message ID", receipt.messageid.toString());
    row(out, "URL", receipt.url);
}

void printTable(std::ostream& out, const domain::Verification& verification) {
    row(out, "ID", verification.verificationid.toString());
    row(out, "To", verification.to);
    row(out, "Message", orDash(verification.message));
    row(out, "Sender", orDash(verification.senderName));
    row(out, "Expiry (min)", verification.expiryTime ? std::to_string(*verification.expiryTime) : "-");
    row(out, "Attempts", verification.attempts ? std::to_string(*verification.attempts) : "-");
    row(out, "Code length", verification.codeLength ? std::to_string(*verification.codeLength) : "-");
    row(out, "URL", orDash(verification.url));
}

void printTable(std::ostream& out, const domain::CheckVerification& check) {
    row(out, "Code", std::to_string(check.code));
    row(out, "Status", check.status ? domain::toString(*check.status) : "-");
}

// ============================================
// СПИСКИ
// ============================================

void printTable(std::ostream& out, const std::vector<domain::Extension>& extensions) {
    const std::vector<int> widths{36, 30, 10, 9};
    columns(out, widths, std::vector<std::string>{"ID", "NAME", "AUTH", "PUBLISHED"});
    for (const auto& e : extensions) {
        columns(out, widths, std::vector<std::string>{
            e.extensionid.toString(), e.name, domain::toString(e.authType), yesNo(e.isPublished)});
    }
}

void printTable(std::ostream& out, const std::vector<domain::ExtensionAction>& actions) {
    const std::vector<int> widths{36, 24, 7, 30};
    columns(out, widths, std::vector<std::string>{"ID", "NAME", "METHOD", "ENDPOINT"});
    for (const auto& a : actions) {
        columns(out, widths, std::vector<std::string>{
            a.actionid.toString(), a.name, domain::toString(a.method), a.endpoint});
    }
}

void printTable(std::ostream& out, const std::vector<domain::Message>& messages) {
    const std::vector<int> widths{36, 11, 13, 19, 30};
    columns(out, widths, std::vector<std::string>{"ID", "SENDER", "STATUS", "SENT AT", "MESSAGE"});
    for (const auto& m : messages) {
        columns(out, widths, std::vector<std::string>{
            m.messageid.toString(), m.senderName, domain::toString(m.status),
            m.sentAt.toDisplayString(), m.message});
    }
}

void printTable(std::ostream& out, const std::vector<domain::Contact>& contacts) {
    const std::vector<int> widths{36, 16, 24, 24};
    columns(out, widths, std::vector<std::string>{"ID", "NUMBER", "NAME", "GROUPS"});
    for (const auto& c : contacts) {
        columns(out, widths, std::vector<std::string>{
            c.contactId.toString(), c.numero, orDash(c.name), c.groups.empty() ? "-" : join(c.groups, ",")});
    }
}

void printTable(std::ostream& out, const std::vector<domain::Group>& groups) {
    const std::vector<int> widths{36, 24, 19, 8};
    columns(out, widths, std::vector<std::string>{"ID", "NAME", "ADDED AT", "CONTACTS"});
    for (const auto& g : groups) {
        columns(out, widths, std::vector<std::string>{
            g.groupeId.toString(), g.name, g.addedAt.toDisplayString(), std::to_string(g.totalContact)});
    }
}

void printTable(std::ostream& out, const std::vector<domain::SenderName>& senderNames) {
    const std::vector<int> widths{36, 11, 8, 19};
    columns(out, widths, std::vector<std::string>{"ID", "NAME", "STATUS", "ADDED AT"});
    for (const auto& s : senderNames) {
        columns(out, widths, std::vector<std::string>{
            s.sendernameId.toString(), s.name, domain::toString(s.status), s.addedAt.toDisplayString()});
    }
}

} // namespace nimbasms::adapters::primary::cli
