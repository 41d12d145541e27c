#include <gtest/gtest.h>

#include <string>

#include "cfgcat/types/validators.hpp"

using cfgcat::DiagnosticKind;
using cfgcat::Resource;
using cfgcat::ResourceId;
using cfgcat::Value;

namespace v = cfgcat::validators;

namespace
{

Resource make_resource(std::string type, std::string title)
{
  Resource res;
  res.id = ResourceId(std::move(type), std::move(title));
  return res;
}

Resource with(Resource res, const std::string & name, Value value)
{
  res.attributes[name] = std::move(value);
  return res;
}

}  // namespace

// ============================================================================
// string / strings
// ============================================================================

TEST(Validators, StringCoercesBooleanAndIsStable)
{
  auto res = with(make_resource("file", "/tmp/x"), "x", Value::make_bool(true));

  auto once = v::string("x", res);
  ASSERT_TRUE(once);
  EXPECT_EQ(*once.value().find("x"), Value::make_string("true"));

  auto twice = v::string("x", once.value());
  ASSERT_TRUE(twice);
  EXPECT_EQ(twice.value().attributes, once.value().attributes);
}

TEST(Validators, StringCoercesNumberToCanonicalText)
{
  auto res = with(make_resource("file", "/tmp/x"), "mode", Value::make_number(644));
  auto out = v::string("mode", res);
  ASSERT_TRUE(out);
  EXPECT_EQ(out.value().find("mode")->as_string(), "644");
}

TEST(Validators, StringRejectsArray)
{
  auto res = with(
    make_resource("file", "/tmp/x"), "owner",
    Value::make_array({Value::make_string("a"), Value::make_string("b")}));
  auto out = v::string("owner", res);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::TypeMismatch);
  EXPECT_NE(out.error().message.find("owner"), std::string::npos);
}

TEST(Validators, StringIgnoresAbsentParameter)
{
  auto res = make_resource("file", "/tmp/x");
  auto out = v::string("owner", res);
  ASSERT_TRUE(out);
  EXPECT_TRUE(out.value().attributes.empty());
}

TEST(Validators, StringsCoercesEveryElement)
{
  auto res = with(
    make_resource("user", "deploy"), "groups",
    Value::make_array({Value::make_string("wheel"), Value::make_number(7)}));
  auto out = v::strings("groups", res);
  ASSERT_TRUE(out);
  const auto & elements = out.value().find("groups")->as_array();
  ASSERT_EQ(elements.size(), 2U);
  EXPECT_EQ(elements[1], Value::make_string("7"));
}

TEST(Validators, StringsRequiresArray)
{
  auto res = with(make_resource("user", "deploy"), "groups", Value::make_string("wheel"));
  auto out = v::strings("groups", res);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::TypeMismatch);
}

// ============================================================================
// integer / integers
// ============================================================================

TEST(Validators, IntegerParsesString)
{
  auto res = with(make_resource("user", "deploy"), "x", Value::make_string("12"));
  auto out = v::integer("x", res);
  ASSERT_TRUE(out);
  EXPECT_EQ(*out.value().find("x"), Value::make_number(12));
}

TEST(Validators, IntegerRejectsFraction)
{
  auto res = with(make_resource("user", "deploy"), "x", Value::make_string("12.5"));
  auto out = v::integer("x", res);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::TypeMismatch);
}

TEST(Validators, IntegerRejectsText)
{
  auto res = with(make_resource("user", "deploy"), "uid", Value::make_string("abc"));
  auto out = v::integer("uid", res);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::TypeMismatch);
  ASSERT_FALSE(out.error().notes.empty());
  EXPECT_EQ(out.error().notes.front(), "while validating User[deploy]");
}

TEST(Validators, IntegersConvertsEveryElement)
{
  auto res = with(
    make_resource("exec", "true"), "returns",
    Value::make_array({Value::make_string("0"), Value::make_number(2)}));
  auto out = v::integers("returns", res);
  ASSERT_TRUE(out);
  const auto & elements = out.value().find("returns")->as_array();
  EXPECT_EQ(elements[0], Value::make_number(0));
  EXPECT_EQ(elements[1], Value::make_number(2));
}

// ============================================================================
// values / default_value / mandatory
// ============================================================================

TEST(Validators, ValuesAcceptsListedAndRejectsOthers)
{
  auto check = v::values({"present", "absent"});

  auto ok = check("ensure", with(make_resource("host", "h"), "ensure", Value::make_string("absent")));
  EXPECT_TRUE(ok);

  auto bad = check("ensure", with(make_resource("host", "h"), "ensure", Value::make_string("gone")));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, DiagnosticKind::InvalidEnum);
  EXPECT_NE(bad.error().message.find("'present', 'absent'"), std::string::npos);
}

TEST(Validators, DefaultValueDoesNotOverwrite)
{
  auto set_default = v::default_value("present");

  auto filled = set_default("ensure", make_resource("file", "/a"));
  ASSERT_TRUE(filled);
  EXPECT_EQ(filled.value().find("ensure")->as_string(), "present");

  auto kept =
    set_default("ensure", with(make_resource("file", "/a"), "ensure", Value::make_string("absent")));
  ASSERT_TRUE(kept);
  EXPECT_EQ(kept.value().find("ensure")->as_string(), "absent");
}

TEST(Validators, MandatoryReportsMissingParameter)
{
  auto out = v::mandatory("command", make_resource("cron", "backup"));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::MissingRequired);
}

TEST(Validators, MandatoryIfNotAbsentSkipsAbsentResources)
{
  auto absent = with(make_resource("cron", "backup"), "ensure", Value::make_string("absent"));
  EXPECT_TRUE(v::mandatory_if_not_absent("command", absent));

  auto present = with(make_resource("cron", "backup"), "ensure", Value::make_string("present"));
  auto out = v::mandatory_if_not_absent("command", present);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::MissingRequired);
}

// ============================================================================
// Paths
// ============================================================================

TEST(Validators, FullyQualifiedPaths)
{
  auto empty = v::fully_qualified("path", with(make_resource("file", "x"), "path", Value::make_string("")));
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().kind, DiagnosticKind::EmptyValue);

  auto relative = v::fully_qualified(
    "path", with(make_resource("file", "x"), "path", Value::make_string("etc/passwd")));
  ASSERT_FALSE(relative);
  EXPECT_EQ(relative.error().kind, DiagnosticKind::NotAbsolute);

  auto absolute = v::fully_qualified(
    "path", with(make_resource("file", "x"), "path", Value::make_string("/etc/passwd")));
  EXPECT_TRUE(absolute);
}

TEST(Validators, FullyQualifiedsChecksEveryElement)
{
  auto res = with(
    make_resource("exec", "make"), "creates",
    Value::make_array({Value::make_string("/opt/a"), Value::make_string("b")}));
  auto out = v::fully_qualifieds("creates", res);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::NotAbsolute);
}

TEST(Validators, NoTrailingSlash)
{
  auto bad = v::no_trailing_slash(
    "path", with(make_resource("file", "x"), "path", Value::make_string("/etc/")));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, DiagnosticKind::InvalidFormat);

  EXPECT_TRUE(v::no_trailing_slash(
    "path", with(make_resource("file", "x"), "path", Value::make_string("/etc"))));
}

// ============================================================================
// ipaddr / inrange
// ============================================================================

TEST(Validators, IpaddrAcceptsDottedQuad)
{
  auto out =
    v::ipaddr("ip", with(make_resource("host", "db"), "ip", Value::make_string("192.168.0.1")));
  EXPECT_TRUE(out);
}

TEST(Validators, IpaddrRejectsMalformedAddresses)
{
  for (const char * text : {"192.168.0.256", "1.2.3", "1.2.3.4.5", "1..2.3", "a.b.c.d", ""}) {
    auto out = v::ipaddr("ip", with(make_resource("host", "db"), "ip", Value::make_string(text)));
    ASSERT_FALSE(out) << text;
    EXPECT_EQ(out.error().kind, DiagnosticKind::InvalidFormat) << text;
  }
}

TEST(Validators, InrangeBounds)
{
  auto check = v::inrange(0, 2);
  EXPECT_TRUE(check("dump", with(make_resource("mount", "/srv"), "dump", Value::make_number(2))));

  auto out = check("dump", with(make_resource("mount", "/srv"), "dump", Value::make_number(3)));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::OutOfRange);
}

// ============================================================================
// rarray / nameval / source-or-content
// ============================================================================

TEST(Validators, RarrayWrapsScalar)
{
  auto out = v::rarray("groups", with(make_resource("user", "u"), "groups", Value::make_string("adm")));
  ASSERT_TRUE(out);
  EXPECT_EQ(*out.value().find("groups"), Value::make_array({Value::make_string("adm")}));
}

TEST(Validators, NamevalFillsFromTitle)
{
  auto out = v::nameval("name", make_resource("package", "nginx"));
  ASSERT_TRUE(out);
  EXPECT_EQ(out.value().find("name")->as_string(), "nginx");
  EXPECT_EQ(out.value().id.title, "nginx");
}

TEST(Validators, NamevalRewritesTitle)
{
  auto out = v::nameval(
    "path", with(make_resource("file", "motd"), "path", Value::make_string("/etc/motd")));
  ASSERT_TRUE(out);
  EXPECT_EQ(out.value().id.title, "/etc/motd");
}

TEST(Validators, SourceOrContent)
{
  auto both = with(
    with(make_resource("file", "/a"), "source", Value::make_string("puppet:///modules/m/a")),
    "content", Value::make_string("x"));
  auto out = v::validate_source_or_content(both);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::ConflictingAttributes);

  EXPECT_TRUE(v::validate_source_or_content(
    with(make_resource("file", "/a"), "source", Value::make_string("puppet:///modules/m/a"))));
  EXPECT_TRUE(v::validate_source_or_content(
    with(make_resource("file", "/a"), "content", Value::make_string("x"))));
  EXPECT_TRUE(v::validate_source_or_content(make_resource("file", "/a")));
}

TEST(Validators, RejectCarriesResourcePosition)
{
  auto res = with(make_resource("user", "deploy"), "uid", Value::make_string("abc"));
  res.position = cfgcat::SourcePosition{"site.pp", 4, 3};
  auto out = v::integer("uid", res);
  ASSERT_FALSE(out);
  ASSERT_TRUE(out.error().location.has_value());
  EXPECT_EQ(out.error().location->line, 4U);
}
