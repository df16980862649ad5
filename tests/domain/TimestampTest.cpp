#include <gtest/gtest.h>
#include <limits>

#include "domain/Timestamp.hpp"
#include "domain/Uuid.hpp"

using namespace nimbasms::domain;

// ============================================================================
// ТЕСТЫ: Timestamp
// ============================================================================

TEST(TimestampTest, FromString_UtcZulu) {
    auto ts = Timestamp::fromString("2024-01-15T10:30:00Z");

    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toEpochSeconds(), 1705314600);
}

TEST(TimestampTest, FromString_OffsetIsApplied) {
    auto ts = Timestamp::fromString("2024-01-15T10:30:00+02:00");

    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toEpochSeconds(), 1705307400);
}

TEST(TimestampTest, FromString_FractionalSecondsPreserved) {
    auto ts = Timestamp::fromString("2024-01-15T10:30:00.250000Z");

    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->toEpochSeconds(), 1705314600);
    EXPECT_EQ(ts->toString(), "2024-01-15T10:30:00.25Z");
}

TEST(TimestampTest, FromString_RejectsGarbage) {
    EXPECT_FALSE(Timestamp::fromString("yesterday").has_value());
    EXPECT_FALSE(Timestamp::fromString("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(Timestamp::fromString("").has_value());
}

TEST(TimestampTest, IsRepresentable_ClockLimits) {
    EXPECT_TRUE(Timestamp::isRepresentable(Timestamp::MAX_EPOCH_SECONDS));
    EXPECT_TRUE(Timestamp::isRepresentable(-Timestamp::MAX_EPOCH_SECONDS));
    EXPECT_FALSE(Timestamp::isRepresentable(Timestamp::MAX_EPOCH_SECONDS + 1));
    EXPECT_FALSE(Timestamp::isRepresentable(std::numeric_limits<int64_t>::max()));
}

TEST(TimestampTest, FromString_YearBeyondClock_Rejected) {
    // 9999-12-31T23:59:59Z
    const int64_t seconds = 253402300799;
    auto ts = Timestamp::fromString("9999-12-31T23:59:59Z");

    EXPECT_EQ(ts.has_value(), Timestamp::isRepresentable(seconds));
    if (ts) {
        EXPECT_EQ(ts->toEpochSeconds(), seconds);
    }
}

TEST(TimestampTest, ToString_WholeSeconds) {
    EXPECT_EQ(Timestamp::fromEpochSeconds(1705314600).toString(), "2024-01-15T10:30:00Z");
}

// ============================================================================
// ТЕСТЫ: Uuid
// ============================================================================

TEST(UuidTest, Parse_CanonicalAndCompactForms) {
    auto canonical = Uuid::parse("C195E2F8-BCA2-4173-886D-4820FD578D21");
    auto compact = Uuid::parse("c195e2f8bca24173886d4820fd578d21");

    ASSERT_TRUE(canonical.has_value());
    ASSERT_TRUE(compact.has_value());
    EXPECT_EQ(canonical->toString(), "c195e2f8-bca2-4173-886d-4820fd578d21");
    EXPECT_EQ(*canonical, *compact);
}

TEST(UuidTest, Parse_RejectsMalformed) {
    EXPECT_FALSE(Uuid::parse("not-a-uuid").has_value());
    EXPECT_FALSE(Uuid::parse("c195e2f8-bca2-4173-886d-4820fd578d2z").has_value());
    EXPECT_FALSE(Uuid::parse("c195e2f8_bca2_4173_886d_4820fd578d21").has_value());
}

TEST(UuidTest, Default_IsNil) {
    EXPECT_TRUE(Uuid().isNil());
    EXPECT_FALSE(Uuid::parse("c195e2f8-bca2-4173-886d-4820fd578d21")->isNil());
}
