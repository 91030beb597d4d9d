/**
 * @file TimestampTest.cpp
 * @brief Unit tests for Timestamp
 */

#include <gtest/gtest.h>
#include "domain/Timestamp.hpp"

using namespace btctax::domain;

TEST(TimestampTest, FromString_AcceptsDateAndDateTimeForms) {
    EXPECT_EQ(Timestamp::fromString("2024-02-01").toString(), "2024-02-01T00:00:00Z");
    EXPECT_EQ(Timestamp::fromString("2024-02-01T10:30:05Z").toString(), "2024-02-01T10:30:05Z");
    EXPECT_EQ(Timestamp::fromString("2024-02-01 10:30:05").toString(), "2024-02-01T10:30:05Z");
}

TEST(TimestampTest, FromString_InvalidInput_Throws) {
    EXPECT_THROW(Timestamp::fromString("yesterday"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2024-02-30"), std::invalid_argument);
    EXPECT_THROW(Timestamp::fromString("2024-02-01T25:00:00"), std::invalid_argument);
}

TEST(TimestampTest, WholeDaysSince_RoundsDown) {
    auto acquired = Timestamp::fromString("2023-01-01");
    EXPECT_EQ(Timestamp::fromString("2024-01-01").wholeDaysSince(acquired), 365);
    EXPECT_EQ(Timestamp::fromString("2024-01-02").wholeDaysSince(acquired), 366);
    EXPECT_EQ(Timestamp::fromString("2023-01-01T23:59:59").wholeDaysSince(acquired), 0);
}

TEST(TimestampTest, Year_ReturnsUtcYear) {
    EXPECT_EQ(Timestamp::fromString("2024-12-31T23:59:59").year(), 2024);
    EXPECT_EQ(Timestamp::fromString("2025-01-01").year(), 2025);
}

TEST(TimestampTest, UnixSeconds_RoundTrip) {
    auto ts = Timestamp::fromString("2024-03-01T12:00:00");
    EXPECT_EQ(Timestamp::fromUnixSeconds(ts.toUnixSeconds()), ts);
}

TEST(TimestampTest, Now_HasWholeSeconds_SurvivesStringRoundTrip) {
    auto ts = Timestamp::now();
    EXPECT_EQ(Timestamp::fromString(ts.toString()), ts);
    EXPECT_EQ(Timestamp::fromUnixSeconds(ts.toUnixSeconds()), ts);
}
