#include <gtest/gtest.h>
#include <limits>

#include "serialization/WireDecoder.hpp"

using namespace nimbasms;
using namespace nimbasms::serialization;
using nlohmann::json;

namespace {

const char* EXTENSION_ID = "3f1c2a9e-5b7d-4c1e-9a2f-0e8b6d4c2a10";
const char* MESSAGE_ID = "9b2d6f1a-8c3e-4d5b-a7f9-1e2c3d4b5a60";

json extensionJson() {
    return json{
        {"extensionid", EXTENSION_ID},
        {"name", "Weather"},
        {"description", "Weather alerts by SMS"},
        {"base_api_url", "https://weather.example.com/api"},
        {"auth_type", "api_key"},
        {"is_paid", false},
        {"is_approved", true},
        {"is_published", false},
        {"created_at", "2024-01-15T10:30:00Z"},
        {"updated_at", "2024-01-16T08:00:00.123456Z"}
    };
}

json messageJson() {
    return json{
        {"messageid", MESSAGE_ID},
        {"sender_name", "Nimba"},
        {"message", "Hello"},
        {"status", "sent"},
        {"sent_at", 1705314600},
        {"numbers", json::array({
            {{"id", "11111111-2222-3333-4444-555555555555"}, {"contact", "+224620000001"}, {"status", "received"}},
            {{"id", "66666666-7777-8888-9999-000000000000"}, {"contact", "+224620000002"}, {"status", "pending"}}
        })}
    };
}

} // namespace

// ============================================================================
// ТЕСТЫ: Account
// ============================================================================

TEST(WireDecoderTest, DecodeAccount_ValidPayload) {
    auto account = decodeAccount(json{{"sid", "ACC1"}, {"balance", 1500}, {"webhook_url", "https://hook.example.com"}});

    ASSERT_TRUE(account.ok());
    EXPECT_EQ(account->sid, "ACC1");
    EXPECT_EQ(account->balance, 1500);
    EXPECT_EQ(account->webhookUrl, std::optional<std::string>("https://hook.example.com"));
}

TEST(WireDecoderTest, DecodeAccount_NegativeBalance_DecodeError) {
    auto account = decodeAccount(json{{"sid", "ACC1"}, {"balance", -1}});

    ASSERT_FALSE(account.ok());
    EXPECT_EQ(account.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(account.error().field, "balance");
}

TEST(WireDecoderTest, DecodeAccount_MissingSid_DecodeError) {
    auto account = decodeAccount(json{{"balance", 10}});

    ASSERT_FALSE(account.ok());
    EXPECT_EQ(account.error().field, "sid");
    EXPECT_EQ(account.error().message, "missing required field");
}

TEST(WireDecoderTest, DecodeAccount_WrongType_DecodeError) {
    auto account = decodeAccount(json{{"sid", "ACC1"}, {"balance", "lots"}});

    ASSERT_FALSE(account.ok());
    EXPECT_EQ(account.error().field, "balance");
    EXPECT_EQ(account.error().message, "expected an integer");
}

TEST(WireDecoderTest, DecodeAccount_NotAnObject_DecodeError) {
    auto account = decodeAccount(json::array());

    ASSERT_FALSE(account.ok());
    EXPECT_EQ(account.error().field, "body");
}

// ============================================================================
// ТЕСТЫ: Extension / ExtensionAction
// ============================================================================

TEST(WireDecoderTest, DecodeExtension_IsoTimestampsAndDefaults) {
    auto extension = decodeExtension(extensionJson());

    ASSERT_TRUE(extension.ok());
    EXPECT_EQ(extension->extensionid.toString(), EXTENSION_ID);
    EXPECT_EQ(extension->authType, domain::AuthType::API_KEY);
    EXPECT_TRUE(extension->isApproved);
    EXPECT_EQ(extension->createdAt.toEpochSeconds(), 1705314600);
    EXPECT_FALSE(extension->logo.has_value());
    EXPECT_FALSE(extension->url.has_value());
}

TEST(WireDecoderTest, DecodeExtension_EpochTimestampAlsoAccepted) {
    auto payload = extensionJson();
    payload["created_at"] = 1705314600;
    payload["updated_at"] = "1705314600";

    auto extension = decodeExtension(payload);

    ASSERT_TRUE(extension.ok());
    EXPECT_EQ(extension->updatedAt.toEpochSeconds(), 1705314600);
}

TEST(WireDecoderTest, DecodeExtension_NameTooLong_DecodeError) {
    auto payload = extensionJson();
    payload["name"] = std::string(31, 'x');

    auto extension = decodeExtension(payload);

    ASSERT_FALSE(extension.ok());
    EXPECT_EQ(extension.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(extension.error().field, "name");
}

TEST(WireDecoderTest, DecodeExtension_UnknownAuthType_DecodeError) {
    auto payload = extensionJson();
    payload["auth_type"] = "basic";

    auto extension = decodeExtension(payload);

    ASSERT_FALSE(extension.ok());
    EXPECT_EQ(extension.error().field, "auth_type");
    EXPECT_EQ(extension.error().message, "unknown value 'basic'");
}

TEST(WireDecoderTest, DecodeExtension_MalformedBaseUrl_DecodeError) {
    auto payload = extensionJson();
    payload["base_api_url"] = "weather";

    auto extension = decodeExtension(payload);

    ASSERT_FALSE(extension.ok());
    EXPECT_EQ(extension.error().field, "base_api_url");
}

TEST(WireDecoderTest, DecodeExtensionAction_ParamMapsKeepArbitraryValues) {
    json payload{
        {"actionid", "0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d"},
        {"name", "Send alert"},
        {"method", "POST"},
        {"endpoint", "/alerts"},
        {"description", "Sends an alert"},
        {"required_params", {{"city", "string"}, {"days", 3}}},
        {"response_format", {{"ok", true}}}
    };

    auto action = decodeExtensionAction(payload);

    ASSERT_TRUE(action.ok());
    EXPECT_EQ(action->method, domain::HttpMethod::POST);
    EXPECT_EQ(action->requiredParams.at("days"), 3);
    EXPECT_TRUE(action->optionalParams.empty());
    EXPECT_EQ(action->responseFormat.at("ok"), true);
}

TEST(WireDecoderTest, DecodeExtensionPublish_StatusDefaultsToOk) {
    auto publish = decodeExtensionPublish(json{{"is_published", true}});

    ASSERT_TRUE(publish.ok());
    EXPECT_TRUE(publish->isPublished);
    EXPECT_EQ(publish->status, "OK");
}

// ============================================================================
// ТЕСТЫ: Message
// ============================================================================

TEST(WireDecoderTest, DecodeMessage_WithDeliveries) {
    auto message = decodeMessage(messageJson());

    ASSERT_TRUE(message.ok());
    EXPECT_EQ(message->status, domain::MessageStatus::SENT);
    EXPECT_EQ(message->sentAt.toEpochSeconds(), 1705314600);
    ASSERT_EQ(message->numbers.size(), 2u);
    EXPECT_EQ(message->numbers[0].contact, "+224620000001");
    EXPECT_EQ(message->numbers[1].status, domain::MessageStatus::PENDING);
}

TEST(WireDecoderTest, DecodeMessage_UnknownStatus_DecodeError) {
    auto payload = messageJson();
    payload["status"] = "bogus";

    auto message = decodeMessage(payload);

    ASSERT_FALSE(message.ok());
    EXPECT_EQ(message.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(message.error().field, "status");
}

TEST(WireDecoderTest, DecodeMessage_BadDeliveryStatus_ReportsNestedPath) {
    auto payload = messageJson();
    payload["numbers"][1]["status"] = "lost";

    auto message = decodeMessage(payload);

    ASSERT_FALSE(message.ok());
    EXPECT_EQ(message.error().field, "numbers[1].status");
}

TEST(WireDecoderTest, DecodeMessage_ExtraFieldsIgnored) {
    auto payload = messageJson();
    payload["campaign"] = "spring";
    payload["cost"] = 12.5;

    EXPECT_TRUE(decodeMessage(payload).ok());
}

TEST(WireDecoderTest, DecodeMessageReceipt_Valid) {
    auto receipt = decodeMessageReceipt(json{
        {"messageid", MESSAGE_ID}, {"url", "https://api.nimbasms.com/v1/messages/" + std::string(MESSAGE_ID)}});

    ASSERT_TRUE(receipt.ok());
    EXPECT_EQ(receipt->messageid.toString(), MESSAGE_ID);
}

// ============================================================================
// ТЕСТЫ: Contact / Group / SenderName
// ============================================================================

TEST(WireDecoderTest, DecodeContact_EmptyNumero_DecodeError) {
    auto contact = decodeContact(json{
        {"contact_id", "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee"}, {"numero", ""}, {"created_at", 1705314600}});

    ASSERT_FALSE(contact.ok());
    EXPECT_EQ(contact.error().field, "numero");
}

TEST(WireDecoderTest, DecodeContact_GroupsDefaultToEmpty) {
    auto contact = decodeContact(json{
        {"contact_id", "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee"}, {"numero", "+224620000000"},
        {"name", nullptr}, {"created_at", 1705314600}});

    ASSERT_TRUE(contact.ok());
    EXPECT_FALSE(contact->name.has_value());
    EXPECT_TRUE(contact->groups.empty());
}

TEST(WireDecoderTest, DecodeGroup_NegativeTotal_DecodeError) {
    auto group = decodeGroup(json{
        {"groupe_id", "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee"}, {"name", "clients"},
        {"added_at", 1705314600}, {"total_contact", -3}});

    ASSERT_FALSE(group.ok());
    EXPECT_EQ(group.error().field, "total_contact");
}

TEST(WireDecoderTest, DecodeSenderName_Valid) {
    auto senderName = decodeSenderName(json{
        {"sendername_id", "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee"}, {"name", "Nimba"},
        {"status", "accepted"}, {"added_at", 1705314600}});

    ASSERT_TRUE(senderName.ok());
    EXPECT_EQ(senderName->status, domain::SenderNameStatus::ACCEPTED);
}

// ============================================================================
// ТЕСТЫ: Verification
// ============================================================================

TEST(WireDecoderTest, DecodeVerification_MissingIdUsesPlaceholder) {
    auto verification = decodeVerification(json{{"to", "+224620000000"}, {"code_length", 6}});

    ASSERT_TRUE(verification.ok());
    EXPECT_EQ(verification->verificationid.toString(), domain::Verification::PLACEHOLDER_ID);
    EXPECT_EQ(verification->codeLength, 6);
}

TEST(WireDecoderTest, DecodeVerification_OutOfRangeAttempts_DecodeError) {
    auto verification = decodeVerification(json{{"to", "+224620000000"}, {"attempts", 20}});

    ASSERT_FALSE(verification.ok());
    EXPECT_EQ(verification.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(verification.error().field, "attempts");
}

TEST(WireDecoderTest, DecodeCheckVerification_StatusOptional) {
    auto withStatus = decodeCheckVerification(json{{"code", 123456}, {"status", "approved"}});
    auto withoutStatus = decodeCheckVerification(json{{"code", 123456}});

    ASSERT_TRUE(withStatus.ok());
    ASSERT_TRUE(withoutStatus.ok());
    EXPECT_EQ(withStatus->status, domain::VerificationStatus::APPROVED);
    EXPECT_FALSE(withoutStatus->status.has_value());
}

TEST(WireDecoderTest, DecodeCheckVerification_CodeOutOfRange_DecodeError) {
    auto check = decodeCheckVerification(json{{"code", 12}});

    ASSERT_FALSE(check.ok());
    EXPECT_EQ(check.error().field, "code");
}

TEST(WireDecoderTest, DecodeVerification_ValueBeyondIntRange_DecodeError) {
    // 4294967301 = 2^32 + 5: после сужения до int оказалось бы 5
    auto expiry = decodeVerification(json{{"to", "+224620000000"}, {"expiry_time", 4294967301LL}});
    auto codeLength = decodeVerification(json{{"to", "+224620000000"}, {"code_length", 4294967300LL}});

    ASSERT_FALSE(expiry.ok());
    EXPECT_EQ(expiry.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(expiry.error().field, "expiry_time");
    ASSERT_FALSE(codeLength.ok());
    EXPECT_EQ(codeLength.error().field, "code_length");
}

TEST(WireDecoderTest, DecodeCheckVerification_UnsignedAboveInt64_DecodeError) {
    auto check = decodeCheckVerification(json{{"code", 18446744073709551615ULL}});

    ASSERT_FALSE(check.ok());
    EXPECT_EQ(check.error().field, "code");
    EXPECT_EQ(check.error().message, "integer out of range");
}

// ============================================================================
// ТЕСТЫ: границы временных меток
// ============================================================================

namespace {

json groupWithAddedAt(const json& addedAt) {
    return json{
        {"groupe_id", "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee"}, {"name", "clients"},
        {"added_at", addedAt}, {"total_contact", 1}};
}

} // namespace

TEST(WireDecoderTest, DecodeGroup_TimestampOverflowingClock_DecodeError) {
    auto group = decodeGroup(groupWithAddedAt(std::numeric_limits<int64_t>::max()));

    ASSERT_FALSE(group.ok());
    EXPECT_EQ(group.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(group.error().field, "added_at");
    EXPECT_EQ(group.error().message, "timestamp out of range");
}

TEST(WireDecoderTest, DecodeGroup_HugeOrNonFiniteFloatTimestamp_DecodeError) {
    auto huge = decodeGroup(groupWithAddedAt(1e300));
    auto negative = decodeGroup(groupWithAddedAt(-1e300));

    ASSERT_FALSE(huge.ok());
    EXPECT_EQ(huge.error().field, "added_at");
    ASSERT_FALSE(negative.ok());
    EXPECT_EQ(negative.error().field, "added_at");
}

TEST(WireDecoderTest, DecodeGroup_LongNumericStringTimestamp_DecodeError) {
    auto eighteenDigits = decodeGroup(groupWithAddedAt("999999999999999999"));
    auto twentyDigits = decodeGroup(groupWithAddedAt("99999999999999999999"));

    ASSERT_FALSE(eighteenDigits.ok());
    EXPECT_EQ(eighteenDigits.error().message, "timestamp out of range");
    ASSERT_FALSE(twentyDigits.ok());
    EXPECT_EQ(twentyDigits.error().message, "timestamp out of range");
}

TEST(WireDecoderTest, DecodeGroup_UnsignedTimestampAboveInt64_DecodeError) {
    auto group = decodeGroup(groupWithAddedAt(18446744073709551615ULL));

    ASSERT_FALSE(group.ok());
    EXPECT_EQ(group.error().field, "added_at");
}

TEST(WireDecoderTest, DecodeGroup_NumericStringAndFloatTimestampsAccepted) {
    auto fromString = decodeGroup(groupWithAddedAt("1705314600"));
    auto fromFloat = decodeGroup(groupWithAddedAt(1705314600.0));

    ASSERT_TRUE(fromString.ok());
    ASSERT_TRUE(fromFloat.ok());
    EXPECT_EQ(fromString->addedAt.toEpochSeconds(), 1705314600);
    EXPECT_EQ(fromFloat->addedAt.toEpochSeconds(), 1705314600);
}

// ============================================================================
// ТЕСТЫ: списки и тело ответа
// ============================================================================

TEST(WireDecoderTest, DecodeList_ResultsEnvelope) {
    json payload{{"count", 2}, {"results", json::array({messageJson(), messageJson()})}};

    auto messages = decodeList(payload, Envelope::RESULTS, decodeMessage);

    ASSERT_TRUE(messages.ok());
    EXPECT_EQ(messages->size(), 2u);
}

TEST(WireDecoderTest, DecodeList_BareArray) {
    json item{{"contact_id", "aaaaaaaa-bbbb-4ccc-8ddd-eeeeeeeeeeee"}, {"numero", "+224"}, {"created_at", 1}};

    auto contacts = decodeList(json::array({item}), Envelope::BARE_ARRAY, decodeContact);

    ASSERT_TRUE(contacts.ok());
    EXPECT_EQ(contacts->size(), 1u);
}

TEST(WireDecoderTest, DecodeList_MissingResults_DecodeError) {
    auto messages = decodeList(json::array(), Envelope::RESULTS, decodeMessage);

    ASSERT_FALSE(messages.ok());
    EXPECT_EQ(messages.error().field, "body");
}

TEST(WireDecoderTest, DecodeList_ItemErrorCarriesIndex) {
    auto broken = messageJson();
    broken.erase("messageid");
    json payload{{"results", json::array({messageJson(), broken})}};

    auto messages = decodeList(payload, Envelope::RESULTS, decodeMessage);

    ASSERT_FALSE(messages.ok());
    EXPECT_EQ(messages.error().field, "results[1].messageid");
}

TEST(WireDecoderTest, ParseBody_InvalidJson_DecodeError) {
    auto body = parseBody("<html>oops</html>");

    ASSERT_FALSE(body.ok());
    EXPECT_EQ(body.error().kind, domain::ErrorKind::DECODE);
    EXPECT_EQ(body.error().field, "body");
}
