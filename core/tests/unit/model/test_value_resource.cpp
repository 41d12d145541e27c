#include <gtest/gtest.h>

#include "cfgcat/model/resource.hpp"
#include "cfgcat/model/value.hpp"

using cfgcat::Resource;
using cfgcat::ResourceId;
using cfgcat::Value;

// ============================================================================
// Value
// ============================================================================

TEST(Value, DisplayAndInterpolation)
{
  const Value array = Value::make_array(
    {Value::make_string("a"), Value::make_number(1), Value::make_bool(true), Value::make_undef()});
  EXPECT_EQ(array.to_display(), "[\"a\", 1, true, undef]");
  EXPECT_EQ(array.to_interpolated(), "[a, 1, true, ]");
  EXPECT_EQ(Value::make_string("x").to_interpolated(), "x");
  EXPECT_EQ(Value().to_interpolated(), "");
}

TEST(Value, StrictEqualityDistinguishesKinds)
{
  EXPECT_NE(Value::make_string("1"), Value::make_number(1));
  EXPECT_EQ(Value::make_number(1), Value::make_number(*cfgcat::Decimal::parse("1.0")));
  EXPECT_EQ(Value(), Value::make_undef());
}

TEST(Value, LooseEquality)
{
  EXPECT_TRUE(cfgcat::loosely_equal(Value::make_string("Debian"), Value::make_string("debian")));
  EXPECT_TRUE(cfgcat::loosely_equal(Value::make_string("12"), Value::make_number(12)));
  EXPECT_TRUE(cfgcat::loosely_equal(Value::make_undef(), Value::make_string("")));
  EXPECT_FALSE(cfgcat::loosely_equal(Value::make_string("true"), Value::make_bool(true)));
  EXPECT_TRUE(cfgcat::loosely_equal(
    Value::make_array({Value::make_string("A")}), Value::make_array({Value::make_string("a")})));
}

TEST(Value, Truthiness)
{
  EXPECT_FALSE(cfgcat::is_truthy(Value()));
  EXPECT_FALSE(cfgcat::is_truthy(Value::make_bool(false)));
  EXPECT_FALSE(cfgcat::is_truthy(Value::make_string("")));
  EXPECT_TRUE(cfgcat::is_truthy(Value::make_string("false")));
  EXPECT_TRUE(cfgcat::is_truthy(Value::make_number(0)));
  EXPECT_TRUE(cfgcat::is_truthy(Value::make_array({})));
}

// ============================================================================
// ResourceId / Resource
// ============================================================================

TEST(ResourceId, ReferenceCapitalizesEverySegment)
{
  EXPECT_EQ(ResourceId("file", "/etc/motd").reference(), "File[/etc/motd]");
  EXPECT_EQ(ResourceId("apache::vhost", "site").reference(), "Apache::Vhost[site]");
}

TEST(ResourceId, ParseReference)
{
  auto id = ResourceId::parse_reference("Apache::Vhost[site one]");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->type, "apache::vhost");
  EXPECT_EQ(id->title, "site one");

  EXPECT_FALSE(ResourceId::parse_reference("File[]").has_value());
  EXPECT_FALSE(ResourceId::parse_reference("[x]").has_value());
  EXPECT_FALSE(ResourceId::parse_reference("File/etc").has_value());
  EXPECT_FALSE(ResourceId::parse_reference("Fi le[x]").has_value());
}

TEST(ResourceId, OrdersByTypeThenTitle)
{
  EXPECT_LT(ResourceId("file", "/b"), ResourceId("package", "/a"));
  EXPECT_LT(ResourceId("file", "/a"), ResourceId("file", "/b"));
}

TEST(Resource, DescribeIncludesPosition)
{
  Resource res;
  res.id = ResourceId("user", "deploy");
  EXPECT_EQ(res.describe(), "User[deploy]");

  res.position = cfgcat::SourcePosition{"site.pp", 3, 1};
  EXPECT_EQ(res.describe(), "User[deploy] (site.pp:3:1)");
}

TEST(Metaparameters, Classification)
{
  EXPECT_TRUE(cfgcat::is_metaparameter("require"));
  EXPECT_TRUE(cfgcat::is_metaparameter("tag"));
  EXPECT_FALSE(cfgcat::is_metaparameter("owner"));

  EXPECT_TRUE(cfgcat::is_dependency_metaparameter("subscribe"));
  EXPECT_FALSE(cfgcat::is_dependency_metaparameter("notify"));
  EXPECT_TRUE(cfgcat::is_dependent_metaparameter("notify"));
  EXPECT_TRUE(cfgcat::is_dependent_metaparameter("before"));
}
