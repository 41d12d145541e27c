#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "cfgcat/catalog/catalog.hpp"
#include "cfgcat/catalog/catalog_checks.hpp"
#include "cfgcat/catalog/catalog_json.hpp"

using cfgcat::Catalog;
using cfgcat::DiagnosticKind;
using cfgcat::Resource;
using cfgcat::ResourceId;
using cfgcat::ResourceMap;
using cfgcat::Value;

namespace
{

Resource make(std::string type, std::string title, cfgcat::Attributes attrs = {})
{
  Resource res;
  res.id = ResourceId(std::move(type), std::move(title));
  res.attributes = std::move(attrs);
  return res;
}

ResourceMap map_of(std::vector<Resource> resources)
{
  ResourceMap out;
  for (auto & res : resources) {
    ResourceId id = res.id;
    out.emplace(std::move(id), std::move(res));
  }
  return out;
}

Value ref(const std::string & text) { return Value::make_string(text); }

}  // namespace

// ============================================================================
// build_edge_map
// ============================================================================

TEST(EdgeMap, DependencyAndDependentDirections)
{
  const auto resources = map_of({
    make("package", "nginx", {{"before", ref("File[/etc/nginx.conf]")}}),
    make("file", "/etc/nginx.conf", {{"notify", ref("Service[nginx]")}}),
    make("service", "nginx", {{"require", Value::make_array({ref("Package[nginx]")})}}),
  });

  auto edges = cfgcat::build_edge_map(resources);
  ASSERT_TRUE(edges) << edges.error().summary();

  const auto & map = edges.value();
  const ResourceId pkg("package", "nginx");
  const ResourceId conf("file", "/etc/nginx.conf");
  const ResourceId svc("service", "nginx");

  ASSERT_EQ(map.count(conf), 1U);
  EXPECT_EQ(map.at(conf).count(pkg), 1U);
  ASSERT_EQ(map.count(svc), 1U);
  EXPECT_EQ(map.at(svc).size(), 2U);
  EXPECT_EQ(map.count(pkg), 0U);
}

TEST(EdgeMap, UndefTargetsAreSkipped)
{
  const auto resources = map_of({make("exec", "x", {{"require", Value::make_undef()}})});
  auto edges = cfgcat::build_edge_map(resources);
  ASSERT_TRUE(edges);
  EXPECT_TRUE(edges.value().empty());
}

TEST(EdgeMap, CyclesAreKept)
{
  const auto resources = map_of({
    make("exec", "a", {{"require", ref("Exec[b]")}}),
    make("exec", "b", {{"require", ref("Exec[a]")}}),
  });
  auto edges = cfgcat::build_edge_map(resources);
  ASSERT_TRUE(edges);
  EXPECT_EQ(edges.value().size(), 2U);
}

TEST(EdgeMap, MissingTargetIsUnresolved)
{
  const auto resources = map_of({make("service", "nginx", {{"subscribe", ref("File[/etc/x]")}})});
  auto edges = cfgcat::build_edge_map(resources);
  ASSERT_FALSE(edges);
  EXPECT_EQ(edges.error().kind, DiagnosticKind::UnresolvedReference);
  EXPECT_EQ(
    edges.error().message,
    "Service[nginx] has a 'subscribe' relationship with File[/etc/x], which is not in the catalog");
}

TEST(EdgeMap, MalformedAndMistypedTargets)
{
  auto malformed = cfgcat::build_edge_map(map_of({make("exec", "a", {{"require", ref("nginx")}})}));
  ASSERT_FALSE(malformed);
  EXPECT_EQ(malformed.error().kind, DiagnosticKind::UnresolvedReference);

  auto mistyped =
    cfgcat::build_edge_map(map_of({make("exec", "a", {{"before", Value::make_bool(true)}})}));
  ASSERT_FALSE(mistyped);
  EXPECT_EQ(mistyped.error().kind, DiagnosticKind::TypeMismatch);
}

// ============================================================================
// assemble_catalog
// ============================================================================

TEST(AssembleCatalog, SplitsExportedResources)
{
  Resource key = make("sshkey", "web1", {{"key", ref("AAAA")}});
  key.exported = true;

  auto catalog = cfgcat::assemble_catalog(
    "web1", {make("user", "deploy"), key, make("group", "deploy")}, {});
  ASSERT_TRUE(catalog);
  EXPECT_EQ(catalog.value().node, "web1");
  EXPECT_EQ(catalog.value().resources.size(), 2U);
  EXPECT_EQ(catalog.value().exported.size(), 1U);
  EXPECT_NE(catalog.value().find(ResourceId("user", "deploy")), nullptr);
  EXPECT_EQ(catalog.value().find(ResourceId("sshkey", "web1")), nullptr);
}

TEST(AssembleCatalog, SameIdentityInBothPartitionsIsAllowed)
{
  Resource exported = make("host", "web1");
  exported.exported = true;
  auto catalog = cfgcat::assemble_catalog("web1", {make("host", "web1"), exported}, {});
  EXPECT_TRUE(catalog);
}

TEST(AssembleCatalog, DuplicateIdentityFails)
{
  Resource first = make("user", "deploy");
  first.position = cfgcat::SourcePosition{"site.pp", 2, 3};

  auto catalog = cfgcat::assemble_catalog("web1", {first, make("user", "deploy")}, {});
  ASSERT_FALSE(catalog);
  EXPECT_EQ(catalog.error().kind, DiagnosticKind::DuplicateResource);
  EXPECT_EQ(catalog.error().message, "duplicate resource User[deploy] in the catalog of 'web1'");
  ASSERT_EQ(catalog.error().notes.size(), 1U);
  EXPECT_EQ(catalog.error().notes[0], "first declared as User[deploy] (site.pp:2:3)");
}

TEST(AssembleCatalog, EdgeCountSumsTargets)
{
  auto catalog = cfgcat::assemble_catalog(
    "web1",
    {make("exec", "a"), make("exec", "b"),
     make("exec", "c", {{"require", Value::make_array({ref("Exec[a]"), ref("Exec[b]")})}})},
    {});
  ASSERT_TRUE(catalog);
  EXPECT_EQ(catalog.value().edge_count(), 2U);
}

// ============================================================================
// JSON
// ============================================================================

TEST(CatalogJson, ValueConversions)
{
  EXPECT_EQ(cfgcat::to_json(Value::make_number(42)), nlohmann::json(42));
  EXPECT_EQ(cfgcat::to_json(Value::make_number(*cfgcat::Decimal::parse("0.5"))), nlohmann::json(0.5));
  EXPECT_EQ(
    cfgcat::to_json(Value::make_number(*cfgcat::Decimal::parse("123456789012345678901234567890"))),
    nlohmann::json("123456789012345678901234567890"));
  EXPECT_TRUE(cfgcat::to_json(Value::make_undef()).is_null());
  EXPECT_EQ(
    cfgcat::to_json(Value::make_array({ref("a"), Value::make_bool(false)})),
    nlohmann::json::parse(R"(["a", false])"));
}

TEST(CatalogJson, CatalogShape)
{
  Resource pkg = make("package", "nginx", {{"ensure", ref("present")}});
  pkg.position = cfgcat::SourcePosition{"site.pp", 2, 3};
  Resource svc = make("service", "nginx", {{"require", ref("Package[nginx]")}});
  Resource collected = make("sshkey", "db1");
  collected.exported_by = "db1";

  cfgcat::Diagnostic warning;
  warning.severity = cfgcat::Severity::Warning;
  warning.message = "unknown variable $x";
  warning.location = cfgcat::SourcePosition{"site.pp", 4, 1};

  auto catalog = cfgcat::assemble_catalog("web1", {pkg, svc, collected}, {warning});
  ASSERT_TRUE(catalog);

  const auto j = cfgcat::to_json(catalog.value());
  EXPECT_EQ(j["name"], "web1");
  ASSERT_EQ(j["resources"].size(), 3U);

  const auto & first = j["resources"][0];
  EXPECT_EQ(first["type"], "Package");
  EXPECT_EQ(first["title"], "nginx");
  EXPECT_EQ(first["exported"], false);
  EXPECT_EQ(first["parameters"]["ensure"], "present");
  EXPECT_EQ(first["file"], "site.pp");
  EXPECT_EQ(first["line"], 2);
  EXPECT_FALSE(j["resources"][1].contains("file"));
  EXPECT_EQ(j["resources"][2]["exported_by"], "db1");

  ASSERT_EQ(j["edges"].size(), 1U);
  EXPECT_EQ(j["edges"][0]["source"], "Service[nginx]");
  EXPECT_EQ(j["edges"][0]["target"], "Package[nginx]");

  EXPECT_TRUE(j["exported"].empty());
  ASSERT_EQ(j["warnings"].size(), 1U);
  EXPECT_EQ(j["warnings"][0]["level"], "warning");
  EXPECT_EQ(j["warnings"][0]["location"], "site.pp:4:1");
}

// ============================================================================
// Catalog checks
// ============================================================================

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

Catalog catalog_of(std::vector<Resource> resources)
{
  Catalog catalog;
  catalog.node = "web1";
  catalog.resources = map_of(std::move(resources));
  return catalog;
}

}  // namespace

TEST(CatalogChecks, ModuleFileSourcesMustExist)
{
  const TempDir modules(std::filesystem::temp_directory_path() / "cfgcat_check_sources");
  std::filesystem::create_directories(modules.path / "ntp" / "files");
  std::ofstream(modules.path / "ntp" / "files" / "ntp.conf") << "server pool\n";

  const auto present = catalog_of({make(
    "file", "/etc/ntp.conf",
    {{"source", Value::make_array({ref("puppet:///modules/ntp/ntp.conf"), ref("/srv/local")})}})});
  EXPECT_FALSE(cfgcat::check_file_sources(present, modules.path).has_value());

  const auto missing =
    catalog_of({make("file", "/etc/motd", {{"source", ref("puppet:///modules/ntp/motd")}})});
  auto failure = cfgcat::check_file_sources(missing, modules.path);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, DiagnosticKind::CatalogTestFailure);
  EXPECT_EQ(failure->notes.back(), "while checking File[/etc/motd]");

  const auto malformed =
    catalog_of({make("file", "/etc/x", {{"source", ref("puppet:///modules/ntp")}})});
  failure = cfgcat::check_file_sources(malformed, modules.path);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->message, "malformed module file source 'puppet:///modules/ntp'");
}

TEST(CatalogChecks, UserGroupsMustBeDeclaredOrSystem)
{
  const auto ok = catalog_of({
    make("group", "deploy"),
    make("user", "deploy", {{"gid", ref("deploy")}, {"groups", Value::make_array({ref("sudo")})}}),
    make("user", "svc", {{"gid", ref("1001")}}),
  });
  EXPECT_FALSE(cfgcat::check_user_groups(ok).has_value());

  const auto bad = catalog_of({make("user", "deploy", {{"groups", Value::make_array({ref("ops")})}})});
  auto failure = cfgcat::check_user_groups(bad);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->message, "group 'ops' is not declared");

  const auto bad_gid = catalog_of({make("user", "deploy", {{"gid", ref("ops")}})});
  failure = cfgcat::check_catalog(bad_gid, "/nonexistent");
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->message, "primary group 'ops' is not declared");
}
