#include <gtest/gtest.h>

#include "utils/Base64.hpp"
#include "utils/Url.hpp"
#include "utils/UuidGenerator.hpp"

using namespace nimbasms::utils;

// ============================================================================
// ТЕСТЫ: Url
// ============================================================================

TEST(UrlTest, Parse_HttpsWithPath) {
    auto url = Url::parse("https://api.nimbasms.com/v1/");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "api.nimbasms.com");
    EXPECT_EQ(url->port, 443);
    EXPECT_EQ(url->path, "/v1");
    EXPECT_TRUE(url->isTls());
}

TEST(UrlTest, Parse_HttpWithExplicitPort) {
    auto url = Url::parse("http://localhost:8080");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->path, "");
    EXPECT_FALSE(url->isTls());
}

TEST(UrlTest, Parse_RejectsUnsupported) {
    EXPECT_FALSE(Url::parse("ftp://example.com").has_value());
    EXPECT_FALSE(Url::parse("https://").has_value());
    EXPECT_FALSE(Url::parse("https://example.com:70000").has_value());
    EXPECT_FALSE(Url::parse("just text").has_value());
}

TEST(UrlTest, BuildQuery_KeepsOrderAndEncodes) {
    EXPECT_EQ(buildQuery({{"limit", "5"}, {"offset", "2"}}), "limit=5&offset=2");
    EXPECT_EQ(buildQuery({{"sent_at__gte", "2024-01-01 10:00"}}), "sent_at__gte=2024-01-01%2010%3A00");
    EXPECT_EQ(urlEncode("+224"), "%2B224");
}

// ============================================================================
// ТЕСТЫ: Base64 / UuidGenerator
// ============================================================================

TEST(Base64Test, Encode_Padding) {
    EXPECT_EQ(base64Encode("a"), "YQ==");
    EXPECT_EQ(base64Encode("ab"), "YWI=");
    EXPECT_EQ(base64Encode("abc"), "YWJj");
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("service-123:s3cr3t"), "c2VydmljZS0xMjM6czNjcjN0");
}

TEST(UuidGeneratorTest, MultipartBoundary_IsUniqueAndTokenSafe) {
    auto first = UuidGenerator::multipartBoundary();
    auto second = UuidGenerator::multipartBoundary();

    EXPECT_NE(first, second);
    EXPECT_EQ(first.rfind("----NimbaSmsBoundary", 0), 0u);
    EXPECT_EQ(first.size(), std::string("----NimbaSmsBoundary").size() + 32);
}
