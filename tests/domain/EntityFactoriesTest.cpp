#include <gtest/gtest.h>

#include "domain/Contact.hpp"
#include "domain/Extension.hpp"
#include "domain/ExtensionAction.hpp"
#include "domain/Message.hpp"
#include "domain/Page.hpp"
#include "domain/Verification.hpp"

using namespace nimbasms::domain;

namespace {

void expectValidationError(const Error& error, const std::string& field) {
    EXPECT_EQ(error.kind, ErrorKind::VALIDATION);
    EXPECT_EQ(error.field, field);
}

} // namespace

// ============================================================================
// ТЕСТЫ: Verification
// ============================================================================

TEST(VerificationTest, Create_MinimalRequest_UsesPlaceholderId) {
    auto result = Verification::create("+224620000000");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->verificationid.toString(), "c195e2f8-bca2-4173-886d-4820fd578d21");
    EXPECT_FALSE(result->expiryTime.has_value());
    EXPECT_FALSE(result->codeLength.has_value());
}

TEST(VerificationTest, Create_CodeLengthBoundaries) {
    EXPECT_TRUE(Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, std::nullopt, 4).ok());
    EXPECT_TRUE(Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, std::nullopt, 8).ok());

    auto tooShort = Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, std::nullopt, 3);
    ASSERT_FALSE(tooShort.ok());
    expectValidationError(tooShort.error(), "code_length");
    EXPECT_EQ(tooShort.error().message, "must be between 4 and 8");

    auto tooLong = Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, std::nullopt, 9);
    ASSERT_FALSE(tooLong.ok());
    expectValidationError(tooLong.error(), "code_length");
}

TEST(VerificationTest, Create_ExpiryTimeBoundaries) {
    EXPECT_TRUE(Verification::create("+224", std::nullopt, std::nullopt, 5).ok());
    EXPECT_TRUE(Verification::create("+224", std::nullopt, std::nullopt, 30).ok());

    auto low = Verification::create("+224", std::nullopt, std::nullopt, 4);
    ASSERT_FALSE(low.ok());
    expectValidationError(low.error(), "expiry_time");

    auto high = Verification::create("+224", std::nullopt, std::nullopt, 31);
    ASSERT_FALSE(high.ok());
    expectValidationError(high.error(), "expiry_time");
}

TEST(VerificationTest, Create_AttemptsBoundaries) {
    EXPECT_TRUE(Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, 3).ok());
    EXPECT_TRUE(Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, 10).ok());
    EXPECT_FALSE(Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, 2).ok());
    EXPECT_FALSE(Verification::create("+224", std::nullopt, std::nullopt, std::nullopt, 11).ok());
}

TEST(VerificationTest, Create_MessageAndSenderLengths) {
    EXPECT_TRUE(Verification::create("+224", std::string(153, 'a')).ok());

    auto longMessage = Verification::create("+224", std::string(154, 'a'));
    ASSERT_FALSE(longMessage.ok());
    expectValidationError(longMessage.error(), "message");

    auto longSender = Verification::create("+224", std::nullopt, std::string(12, 's'));
    ASSERT_FALSE(longSender.ok());
    expectValidationError(longSender.error(), "sender_name");
}

TEST(VerificationTest, Create_EmptyRecipient_Fails) {
    auto result = Verification::create("");

    ASSERT_FALSE(result.ok());
    expectValidationError(result.error(), "to");
}

TEST(VerificationTest, HasCodePlaceholder) {
    auto withPlaceholder = Verification::create("+224", std::string("Your code is <1234>"));
    auto without = Verification::create("+224", std::string("Your code"));

    ASSERT_TRUE(withPlaceholder.ok());
    ASSERT_TRUE(without.ok());
    EXPECT_TRUE(withPlaceholder->hasCodePlaceholder());
    EXPECT_FALSE(without->hasCodePlaceholder());
}

TEST(CheckVerificationTest, Create_CodeRange) {
    EXPECT_TRUE(CheckVerification::create(1000).ok());
    EXPECT_TRUE(CheckVerification::create(999999).ok());

    auto low = CheckVerification::create(999);
    ASSERT_FALSE(low.ok());
    expectValidationError(low.error(), "code");

    EXPECT_FALSE(CheckVerification::create(1000000).ok());
}

// ============================================================================
// ТЕСТЫ: сообщения и контакты
// ============================================================================

TEST(CreateMessageTest, Create_ValidRequest) {
    auto result = CreateMessage::create("Nimba", {"+224620000001", "+224620000002"}, "Hello");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->to.size(), 2u);
}

TEST(CreateMessageTest, Create_SenderNameBoundaries) {
    EXPECT_TRUE(CreateMessage::create(std::string(11, 'N'), {"+224"}, "Hi").ok());

    auto tooLong = CreateMessage::create(std::string(12, 'N'), {"+224"}, "Hi");
    ASSERT_FALSE(tooLong.ok());
    expectValidationError(tooLong.error(), "sender_name");

    auto empty = CreateMessage::create("", {"+224"}, "Hi");
    ASSERT_FALSE(empty.ok());
    expectValidationError(empty.error(), "sender_name");
}

TEST(CreateMessageTest, Create_RecipientCount) {
    EXPECT_FALSE(CreateMessage::create("Nimba", {}, "Hi").ok());
    EXPECT_TRUE(CreateMessage::create("Nimba", std::vector<std::string>(10, "+224"), "Hi").ok());

    auto tooMany = CreateMessage::create("Nimba", std::vector<std::string>(11, "+224"), "Hi");
    ASSERT_FALSE(tooMany.ok());
    expectValidationError(tooMany.error(), "to");
}

TEST(CreateMessageTest, Create_EmptyRecipient_ReportsIndex) {
    auto result = CreateMessage::create("Nimba", {"+224", ""}, "Hi");

    ASSERT_FALSE(result.ok());
    expectValidationError(result.error(), "to[1]");
}

TEST(CreateMessageTest, Create_MessageLength) {
    EXPECT_TRUE(CreateMessage::create("Nimba", {"+224"}, std::string(665, 'm')).ok());
    EXPECT_FALSE(CreateMessage::create("Nimba", {"+224"}, std::string(666, 'm')).ok());
    EXPECT_FALSE(CreateMessage::create("Nimba", {"+224"}, "").ok());
}

TEST(CreateContactTest, Create_Validation) {
    EXPECT_TRUE(CreateContact::create("+224620000000", std::string("Mamadou"), {"clients"}).ok());
    EXPECT_TRUE(CreateContact::create(std::string(128, '1')).ok());

    auto emptyNumber = CreateContact::create("");
    ASSERT_FALSE(emptyNumber.ok());
    expectValidationError(emptyNumber.error(), "numero");

    auto longNumber = CreateContact::create(std::string(129, '1'));
    ASSERT_FALSE(longNumber.ok());
    expectValidationError(longNumber.error(), "numero");

    auto longName = CreateContact::create("+224", std::string(401, 'a'));
    ASSERT_FALSE(longName.ok());
    expectValidationError(longName.error(), "name");
}

// ============================================================================
// ТЕСТЫ: расширения и действия
// ============================================================================

TEST(CreateExtensionTest, Create_NameAndDescriptionLimits) {
    EXPECT_TRUE(CreateExtension::create(std::string(30, 'n'), std::string(400, 'd'),
                                        "https://api.example.com", AuthType::NONE, false).ok());

    auto longName = CreateExtension::create(std::string(31, 'n'), "d", "https://api.example.com",
                                            AuthType::NONE, false);
    ASSERT_FALSE(longName.ok());
    expectValidationError(longName.error(), "name");

    auto longDescription = CreateExtension::create("n", std::string(401, 'd'), "https://api.example.com",
                                                   AuthType::NONE, false);
    ASSERT_FALSE(longDescription.ok());
    expectValidationError(longDescription.error(), "description");
}

TEST(CreateExtensionTest, Create_InvalidUrls) {
    auto badBase = CreateExtension::create("n", "d", "not a url", AuthType::API_KEY, true);
    ASSERT_FALSE(badBase.ok());
    expectValidationError(badBase.error(), "base_api_url");

    auto badDocs = CreateExtension::create("n", "d", "https://api.example.com", AuthType::API_KEY, true,
                                           std::string("docs"));
    ASSERT_FALSE(badDocs.ok());
    expectValidationError(badDocs.error(), "documentation_url");
}

TEST(OAuth2ConfigTest, Create_RequiresCredentialsAndUrls) {
    EXPECT_TRUE(OAuth2Config::create("id", "secret", "https://auth.example.com/authorize",
                                     "https://auth.example.com/token", " ",
                                     "https://app.example.com/callback").ok());

    auto noSecret = OAuth2Config::create("id", "", "https://a.example.com", "https://t.example.com", " ",
                                         "https://r.example.com");
    ASSERT_FALSE(noSecret.ok());
    expectValidationError(noSecret.error(), "oauth2_config.client_secret");

    auto badToken = OAuth2Config::create("id", "secret", "https://a.example.com", "token", " ",
                                         "https://r.example.com");
    ASSERT_FALSE(badToken.ok());
    expectValidationError(badToken.error(), "oauth2_config.token_url");
}

TEST(ExtensionUpdateTest, Create_RequiresAtLeastOneField) {
    auto empty = ExtensionUpdate::create(std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt);
    ASSERT_FALSE(empty.ok());
    expectValidationError(empty.error(), "extension");

    EXPECT_TRUE(ExtensionUpdate::create(std::nullopt, std::string("new"), std::nullopt, std::nullopt,
                                        std::nullopt).ok());
}

TEST(ExtensionUpdateTest, Create_PresentFieldsAreValidated) {
    auto result = ExtensionUpdate::create(std::string(31, 'n'), std::nullopt, std::nullopt, std::nullopt,
                                          std::nullopt);
    ASSERT_FALSE(result.ok());
    expectValidationError(result.error(), "name");
}

TEST(ActionRequestTest, Create_Limits) {
    EXPECT_TRUE(ActionRequest::create(std::string(100, 'a'), HttpMethod::POST, std::string(255, 'e'),
                                      std::string(200, 'd')).ok());

    auto longName = ActionRequest::create(std::string(101, 'a'), HttpMethod::POST, "/send", "d");
    ASSERT_FALSE(longName.ok());
    expectValidationError(longName.error(), "name");

    auto longEndpoint = ActionRequest::create("a", HttpMethod::POST, std::string(256, 'e'), "d");
    ASSERT_FALSE(longEndpoint.ok());
    expectValidationError(longEndpoint.error(), "endpoint");

    auto longDescription = ActionRequest::create("a", HttpMethod::POST, "/send", std::string(201, 'd'));
    ASSERT_FALSE(longDescription.ok());
    expectValidationError(longDescription.error(), "description");
}

TEST(ActionUpdateTest, Create_EmptyDraft_Fails) {
    auto result = ActionUpdate::create(ActionUpdate{});

    ASSERT_FALSE(result.ok());
    expectValidationError(result.error(), "action");
}

TEST(ActionUpdateTest, Create_MethodOnly_Passes) {
    ActionUpdate draft;
    draft.method = HttpMethod::PUT;

    auto result = ActionUpdate::create(draft);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->method, HttpMethod::PUT);
    EXPECT_FALSE(result->name.has_value());
}

// ============================================================================
// ТЕСТЫ: Page
// ============================================================================

TEST(PageTest, Create_DefaultsAndBounds) {
    auto defaults = Page::create();
    ASSERT_TRUE(defaults.ok());
    EXPECT_EQ(defaults->limit, 10);
    EXPECT_EQ(defaults->offset, 0);

    auto zeroLimit = Page::create(0, 0);
    ASSERT_FALSE(zeroLimit.ok());
    expectValidationError(zeroLimit.error(), "limit");

    auto negativeOffset = Page::create(5, -1);
    ASSERT_FALSE(negativeOffset.ok());
    expectValidationError(negativeOffset.error(), "offset");
}

// ============================================================================
// ТЕСТЫ: Error
// ============================================================================

TEST(ErrorTest, FileNotFound_PathInFieldAndMessage) {
    auto error = Error::fileNotFound("/tmp/logo.png");

    EXPECT_EQ(error.kind, ErrorKind::FILE_NOT_FOUND);
    EXPECT_EQ(error.field, "/tmp/logo.png");
    EXPECT_EQ(error.message, "File not found: /tmp/logo.png");
    EXPECT_EQ(error.status, 0);
}
