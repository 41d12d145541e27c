#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cfgcat/types/native_types.hpp"
#include "cfgcat/types/type_registry.hpp"

using cfgcat::DiagnosticKind;
using cfgcat::Resource;
using cfgcat::ResourceId;
using cfgcat::TypeRegistry;
using cfgcat::Value;

namespace
{

Resource make_resource(std::string type, std::string title, cfgcat::Attributes attrs = {})
{
  Resource res;
  res.id = ResourceId(std::move(type), std::move(title));
  res.attributes = std::move(attrs);
  return res;
}

}  // namespace

// ============================================================================
// default_validate
// ============================================================================

TEST(DefaultValidate, EmptyLegalSetLeavesResourceUnchanged)
{
  const auto validate = cfgcat::default_validate({});
  const Resource res = make_resource(
    "whatever", "x",
    {{"anything", Value::make_string("goes")},
     {"count", Value::make_number(3)},
     {"list", Value::make_array({Value::make_bool(false)})}});

  auto out = validate(res);
  ASSERT_TRUE(out);
  EXPECT_EQ(out.value().id, res.id);
  EXPECT_EQ(out.value().attributes, res.attributes);
}

TEST(DefaultValidate, NamesExactlyTheUnknownParameters)
{
  const auto validate = cfgcat::default_validate({"owner", "mode"});
  const Resource res = make_resource(
    "file", "/etc/motd",
    {{"owner", Value::make_string("root")},
     {"zeta", Value::make_string("1")},
     {"alpha", Value::make_string("2")},
     {"require", Value::make_string("Package[x]")}});

  auto out = validate(res);
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::UnknownParameter);
  EXPECT_NE(out.error().message.find("alpha, zeta"), std::string::npos);
  EXPECT_EQ(out.error().message.find("require"), std::string::npos);
  EXPECT_EQ(out.error().message.find("owner"), std::string::npos);
}

TEST(DefaultValidate, DropsUndefinedAttributes)
{
  const auto validate = cfgcat::default_validate({});
  auto out = validate(make_resource("file", "/a", {{"owner", Value::make_undef()}}));
  ASSERT_TRUE(out);
  EXPECT_FALSE(out.value().has("owner"));
}

// ============================================================================
// Pipelines
// ============================================================================

TEST(TypeMethods, PipelineStopsAtFirstFailure)
{
  int calls = 0;
  cfgcat::ParamValidator count = [&calls](std::string_view, Resource res) {
    ++calls;
    return cfgcat::accept(std::move(res));
  };
  auto methods = cfgcat::make_type_methods(
    {{"a", {cfgcat::validators::mandatory, count}}, {"b", {count}}});

  auto out = methods.validate(make_resource("t", "x"));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::MissingRequired);
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(methods.parameters.size(), 2U);
}

TEST(TypeMethods, ExtraValidatorRunsLast)
{
  auto methods = cfgcat::make_type_methods(
    {{"source", {}}, {"content", {}}}, cfgcat::validators::validate_source_or_content);
  auto out = methods.validate(make_resource(
    "file", "/a", {{"source", Value::make_string("s")}, {"content", Value::make_string("c")}}));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::ConflictingAttributes);
}

// ============================================================================
// Native registry
// ============================================================================

TEST(NativeTypes, RegistersBuiltins)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  for (const char * name :
       {"file", "package", "service", "user", "group", "exec", "host", "cron", "mount", "notify",
        "sshkey", "anchor", "stage"}) {
    EXPECT_TRUE(registry.contains(name)) << name;
  }
  EXPECT_FALSE(registry.contains("apache::vhost"));
}

TEST(NativeTypes, UnregisteredTypeIsAcceptedUnchecked)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  const Resource res =
    make_resource("apache::vhost", "site", {{"docroot", Value::make_string("/srv/www")}});
  auto out = registry.validate(res);
  ASSERT_TRUE(out);
  EXPECT_EQ(out.value().attributes, res.attributes);
}

TEST(NativeTypes, FileDefaultsAndNormalizes)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  auto out = registry.validate(make_resource(
    "file", "motd", {{"path", Value::make_string("/etc/motd")}, {"mode", Value::make_number(644)}}));
  ASSERT_TRUE(out);
  const Resource & file = out.value();
  EXPECT_EQ(file.id.title, "/etc/motd");
  EXPECT_EQ(file.find("ensure")->as_string(), "present");
  EXPECT_EQ(file.find("mode")->as_string(), "644");
}

TEST(NativeTypes, UnknownFileParameterFails)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  auto out = registry.validate(
    make_resource("file", "/etc/motd", {{"colour", Value::make_string("blue")}}));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::UnknownParameter);
  EXPECT_NE(out.error().message.find("colour"), std::string::npos);
}

TEST(NativeTypes, FileRelativeTitleFails)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  auto out = registry.validate(make_resource("file", "etc/motd"));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::NotAbsolute);
}

TEST(NativeTypes, HostRequiresValidIp)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();

  auto missing = registry.validate(make_resource("host", "db"));
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().kind, DiagnosticKind::MissingRequired);

  auto bad = registry.validate(make_resource("host", "db", {{"ip", Value::make_string("10.0.0")}}));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, DiagnosticKind::InvalidFormat);

  auto absent = registry.validate(
    make_resource("host", "db", {{"ensure", Value::make_string("absent")}}));
  EXPECT_TRUE(absent);
}

TEST(NativeTypes, MountDumpRange)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  auto out = registry.validate(make_resource(
    "mount", "/srv",
    {{"device", Value::make_string("/dev/sdb1")},
     {"fstype", Value::make_string("ext4")},
     {"dump", Value::make_string("5")}}));
  ASSERT_FALSE(out);
  EXPECT_EQ(out.error().kind, DiagnosticKind::OutOfRange);
}

TEST(NativeTypes, PipelinesAreIdempotent)
{
  const TypeRegistry registry = cfgcat::make_native_type_registry();
  const std::vector<Resource> samples = {
    make_resource("file", "motd", {{"path", Value::make_string("/etc/motd")}, {"mode", Value::make_number(644)}}),
    make_resource("package", "nginx", {{"ensure", Value::make_string("latest")}}),
    make_resource("service", "nginx", {{"ensure", Value::make_bool(true)}}),
    make_resource(
      "user", "deploy",
      {{"uid", Value::make_string("1001")}, {"groups", Value::make_string("www-data")}}),
    make_resource(
      "exec", "make install",
      {{"creates", Value::make_string("/opt/app")}, {"returns", Value::make_number(0)}}),
    make_resource("host", "db", {{"ip", Value::make_string("10.0.0.2")}}),
    make_resource(
      "mount", "/srv",
      {{"device", Value::make_string("/dev/sdb1")},
       {"fstype", Value::make_string("ext4")},
       {"dump", Value::make_string("1")}}),
    make_resource("apache::vhost", "site", {{"port", Value::make_number(80)}}),
  };

  for (const auto & sample : samples) {
    auto first = registry.validate(sample);
    ASSERT_TRUE(first) << sample.id.reference() << ": " << first.error().message;
    auto second = registry.validate(first.value());
    ASSERT_TRUE(second) << sample.id.reference();
    EXPECT_EQ(second.value().id, first.value().id) << sample.id.reference();
    EXPECT_EQ(second.value().attributes, first.value().attributes) << sample.id.reference();
  }
}
