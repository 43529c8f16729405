#include <gtest/gtest.h>
#include "decimal.hpp"
#include <limits>
#include <nlohmann/json.hpp>

TEST(DecimalTest, ParseWholeAndFraction) {
    EXPECT_EQ(Decimal::parse("100").raw(), 100000000);
    EXPECT_EQ(Decimal::parse("12.5").raw(), 12500000);
    EXPECT_EQ(Decimal::parse("-0.000001").raw(), -1);
    EXPECT_EQ(Decimal::parse(".25").raw(), 250000);
    EXPECT_EQ(Decimal::parse("+7.").raw(), 7000000);
}

TEST(DecimalTest, ParseRejectsMalformedText) {
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("."), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("12a"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse(" 1"), std::invalid_argument);
}

TEST(DecimalTest, ParseRejectsExcessPrecision) {
    EXPECT_THROW(Decimal::parse("0.0000001"), std::invalid_argument);
}

TEST(DecimalTest, ParseRejectsOutOfRange) {
    EXPECT_THROW(Decimal::parse("99999999999999999999"), std::invalid_argument);
}

TEST(DecimalTest, TenthsSumExactly) {
    // 0.1 + 0.2 == 0.3 does not hold for doubles
    EXPECT_EQ(Decimal::parse("0.1") + Decimal::parse("0.2"), Decimal::parse("0.3"));

    Decimal total;
    for (int i = 0; i < 3; ++i) {
        total += Decimal::parse("33.3");
    }
    total += Decimal::parse("0.1");
    EXPECT_EQ(total, Decimal::from_units(100));
}

TEST(DecimalTest, ToStringTrimsTrailingZeros) {
    EXPECT_EQ(Decimal::parse("100").to_string(), "100");
    EXPECT_EQ(Decimal::parse("12.50").to_string(), "12.5");
    EXPECT_EQ(Decimal::parse("-0.05").to_string(), "-0.05");
    EXPECT_EQ(Decimal::parse("0.000001").to_string(), "0.000001");
    EXPECT_EQ(Decimal().to_string(), "0");
}

TEST(DecimalTest, FromDoubleRoundsToMillionths) {
    EXPECT_EQ(Decimal::from_double(0.1), Decimal::parse("0.1"));
    EXPECT_EQ(Decimal::from_double(25.0), Decimal::from_units(25));
    EXPECT_THROW(Decimal::from_double(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST(DecimalTest, AdditionOverflowThrows) {
    const Decimal max = Decimal::from_raw(std::numeric_limits<int64_t>::max());
    EXPECT_THROW(max + Decimal::from_raw(1), std::overflow_error);
    EXPECT_THROW(Decimal::from_units(std::numeric_limits<int64_t>::max()), std::overflow_error);
}

TEST(DecimalTest, Comparison) {
    EXPECT_LT(Decimal::parse("-1"), Decimal());
    EXPECT_GT(Decimal::parse("0.000001"), Decimal());
    EXPECT_TRUE(Decimal().is_zero());
    EXPECT_TRUE(Decimal::parse("-3").is_negative());
    EXPECT_TRUE(Decimal::parse("3").is_positive());
}

TEST(DecimalTest, JsonAcceptsStringsAndNumbers) {
    EXPECT_EQ(nlohmann::json("40.25").get<Decimal>(), Decimal::parse("40.25"));
    EXPECT_EQ(nlohmann::json(40).get<Decimal>(), Decimal::from_units(40));
    EXPECT_EQ(nlohmann::json(0.3).get<Decimal>(), Decimal::parse("0.3"));
    EXPECT_THROW(nlohmann::json(true).get<Decimal>(), std::invalid_argument);

    nlohmann::json j = Decimal::parse("1.5");
    EXPECT_EQ(j, "1.5");
}

TEST(DecimalTest, JsonRejectsOutOfRangeNumbers) {
    EXPECT_THROW(nlohmann::json(std::numeric_limits<uint64_t>::max()).get<Decimal>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json::parse("18446744073709551615").get<Decimal>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json(int64_t{10000000000000}).get<Decimal>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json(int64_t{-10000000000000}).get<Decimal>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json(1e300).get<Decimal>(), std::invalid_argument);
    EXPECT_EQ(nlohmann::json(int64_t{9223372036854}).get<Decimal>(), Decimal::from_units(9223372036854));
}

TEST(DecimalSumTest, HoldsTotalsBeyondDecimalRange) {
    DecimalSum total;
    total += Decimal::parse("9000000000000");
    total += Decimal::parse("9000000000000.5");

    EXPECT_EQ(total.to_string(), "18000000000000.5");
    EXPECT_FALSE(total.is_zero());
    EXPECT_TRUE(DecimalSum().is_zero());
}

TEST(DecimalSumTest, UnitsForShareFloors) {
    DecimalSum total;
    total += Decimal::from_units(100);

    EXPECT_EQ(total.units_for_share(Decimal::from_units(50), Decimal::from_units(30)), 1);
    EXPECT_EQ(total.units_for_share(Decimal::from_units(100), Decimal::parse("0.3")), 333);
    EXPECT_EQ(total.units_for_share(Decimal::parse("33.3"), Decimal::parse("3.33")), 10);
    EXPECT_EQ(total.units_for_share(Decimal::from_units(100), Decimal()), 0);
}

TEST(DecimalSumTest, UnitsForShareSaturates) {
    DecimalSum total;
    total += Decimal::parse("9000000000000");
    total += Decimal::parse("9000000000000");

    EXPECT_EQ(total.units_for_share(Decimal::from_units(100), Decimal::parse("0.000001")),
              std::numeric_limits<int64_t>::max());
}

TEST(DecimalSumTest, UnitsForShareRejectsShareAboveHundred) {
    DecimalSum total;
    total += Decimal::from_units(100);

    EXPECT_THROW(total.units_for_share(Decimal::from_units(101), Decimal::from_units(1)), std::invalid_argument);
}
