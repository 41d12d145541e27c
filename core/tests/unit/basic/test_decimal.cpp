#include <gtest/gtest.h>

#include <cstdint>

#include "cfgcat/basic/decimal.hpp"

using cfgcat::Decimal;

TEST(Decimal, ParsesIntegersAndFractions)
{
  auto twelve = Decimal::parse("12");
  ASSERT_TRUE(twelve.has_value());
  EXPECT_TRUE(twelve->is_integer());
  EXPECT_EQ(twelve->to_int64(), 12);

  auto frac = Decimal::parse("12.5");
  ASSERT_TRUE(frac.has_value());
  EXPECT_FALSE(frac->is_integer());
  EXPECT_EQ(frac->to_string(), "12.5");
  EXPECT_FALSE(frac->to_int64().has_value());
}

TEST(Decimal, NormalizesEqualNumbers)
{
  EXPECT_EQ(*Decimal::parse("12.50"), *Decimal::parse("12.5"));
  EXPECT_EQ(*Decimal::parse("1e2"), Decimal::from_int64(100));
  EXPECT_EQ(*Decimal::parse("007"), Decimal::from_int64(7));
  EXPECT_TRUE(Decimal::parse("0.000")->is_zero());
  EXPECT_TRUE(Decimal::parse("1.0")->is_integer());
}

TEST(Decimal, RejectsMalformedText)
{
  for (const char * text : {"", "-", "1.", ".5", "1e", "abc", "1 2", "+1", "0x10"}) {
    EXPECT_FALSE(Decimal::parse(text).has_value()) << text;
  }
}

TEST(Decimal, RendersWithoutExponent)
{
  EXPECT_EQ(Decimal::parse("-0.25")->to_string(), "-0.25");
  EXPECT_EQ(Decimal::parse("2.5e3")->to_string(), "2500");
  EXPECT_EQ(Decimal::parse("5e-3")->to_string(), "0.005");
  EXPECT_EQ(Decimal().to_string(), "0");
}

TEST(Decimal, ComparesExactly)
{
  EXPECT_LT(*Decimal::parse("-3"), *Decimal::parse("2"));
  EXPECT_LT(*Decimal::parse("2.49"), *Decimal::parse("2.5"));
  EXPECT_GT(*Decimal::parse("100"), *Decimal::parse("99.999"));
  EXPECT_LE(Decimal::from_int64(0), Decimal());
}

TEST(Decimal, Int64Limits)
{
  EXPECT_EQ(Decimal::parse("9223372036854775807")->to_int64(), INT64_MAX);
  EXPECT_FALSE(Decimal::parse("9223372036854775808")->to_int64().has_value());
  EXPECT_EQ(Decimal::from_int64(INT64_MIN).to_int64(), INT64_MIN);
}
