/**
 * @file DecimalTest.cpp
 * @brief Unit tests for Decimal
 */

#include <gtest/gtest.h>
#include "domain/Decimal.hpp"

using namespace btctax::domain;

// ============================================================================
// PARSING
// ============================================================================

TEST(DecimalTest, FromString_ParsesSignedFraction) {
    EXPECT_EQ(Decimal::fromString("-123.45").toString(), "-123.45");
    EXPECT_EQ(Decimal::fromString("+0.00000001").toString(), "0.00000001");
    EXPECT_EQ(Decimal::fromString("40000").toString(), "40000");
    EXPECT_EQ(Decimal::fromString(".5").toString(), "0.5");
}

TEST(DecimalTest, FromString_TrailingZerosAreNotSignificant) {
    EXPECT_EQ(Decimal::fromString("1.500"), Decimal::fromString("1.5"));
    EXPECT_EQ(Decimal::fromString("1.500").toString(), "1.5");
}

TEST(DecimalTest, FromString_Garbage_Throws) {
    EXPECT_THROW(Decimal::fromString(""), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("-"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("1e5"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("abc"), std::invalid_argument);
}

// ============================================================================
// ARITHMETIC
// ============================================================================

TEST(DecimalTest, Arithmetic_IsExact) {
    Decimal tenth = Decimal::fromString("0.1");
    Decimal sum;
    for (int i = 0; i < 10; ++i) {
        sum += tenth;
    }
    EXPECT_EQ(sum, Decimal(1));

    Decimal third = Decimal(1) / Decimal(3);
    EXPECT_EQ(third * Decimal(3), Decimal(1));
}

TEST(DecimalTest, Division_ByZero_Throws) {
    EXPECT_THROW(Decimal(1) / Decimal(0), std::domain_error);
}

TEST(DecimalTest, Predicates_ReflectSign) {
    EXPECT_TRUE(Decimal(0).isZero());
    EXPECT_TRUE(Decimal(-2).isNegative());
    EXPECT_TRUE(Decimal(2).isPositive());
    EXPECT_EQ(Decimal(-2).abs(), Decimal(2));
    EXPECT_EQ(Decimal::min(Decimal(3), Decimal(2)), Decimal(2));
}

// ============================================================================
// ROUNDING
// ============================================================================

TEST(DecimalTest, RoundHalfDown_TiesGoTowardZero) {
    EXPECT_EQ(Decimal::fromString("0.125").roundUsd().toString(2), "0.12");
    EXPECT_EQ(Decimal::fromString("-0.125").roundUsd().toString(2), "-0.12");
    EXPECT_EQ(Decimal::fromString("0.1251").roundUsd().toString(2), "0.13");
    EXPECT_EQ(Decimal::fromString("0.124").roundUsd().toString(2), "0.12");
}

TEST(DecimalTest, Round_ArbitraryPlaces_UsesHalfDown) {
    EXPECT_EQ(Decimal::fromString("0.000000005").round(8).toString(8), "0.00000000");
    EXPECT_EQ(Decimal::fromString("0.0000000051").round(8).toString(8), "0.00000001");
}

TEST(DecimalTest, ToString_NegativeValues_KeepSignAndDigits) {
    EXPECT_EQ(Decimal::fromString("-0.126").toString(2), "-0.13");
    EXPECT_EQ(Decimal::fromString("-1234.5").toString(2), "-1234.50");
    EXPECT_EQ(Decimal::fromString("-7").toString(0), "-7");
    EXPECT_EQ(Decimal::fromString("-0.00000001").toString(8), "-0.00000001");
}

TEST(DecimalTest, ToString_FixedPlaces_PadsWithZeros) {
    EXPECT_EQ(Decimal(5).toString(2), "5.00");
    EXPECT_EQ(Decimal::fromString("0.5").toString(8), "0.50000000");
    EXPECT_EQ(Decimal::fromString("-0.004").toString(2), "0.00");
}

TEST(DecimalTest, ToString_RepeatingFraction_UsesEighteenPlaces) {
    EXPECT_EQ((Decimal(2) / Decimal(3)).toString(), "0.666666666666666667");
}
