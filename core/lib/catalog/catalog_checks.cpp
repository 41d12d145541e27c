// cfgcat/catalog/catalog_checks.cpp - Optional consistency checks on a compiled catalog
#include "cfgcat/catalog/catalog_checks.hpp"

#include <fmt/core.h>

#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cfgcat
{
namespace
{

constexpr std::string_view k_module_source_prefix = "puppet:///modules/";

const std::set<std::string, std::less<>> & system_groups()
{
  static const std::set<std::string, std::less<>> k_groups = {
    "root", "wheel", "adm", "bin", "daemon", "sys", "users", "staff", "nogroup", "tty", "disk", "sudo",
  };
  return k_groups;
}

std::vector<std::string> string_values(const Value * v)
{
  std::vector<std::string> out;
  if (v == nullptr) {
    return out;
  }
  if (v->is_string()) {
    out.push_back(v->as_string());
  } else if (v->is_array()) {
    for (const auto & element : v->as_array()) {
      if (element.is_string()) {
        out.push_back(element.as_string());
      }
    }
  }
  return out;
}

Diagnostic check_failure(const Resource & res, std::string message)
{
  Diagnostic diag = Diagnostic::error(DiagnosticKind::CatalogTestFailure, std::move(message), res.position);
  diag.notes.push_back("while checking " + res.id.reference());
  return diag;
}

bool is_numeric(std::string_view text)
{
  if (text.empty()) {
    return false;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Diagnostic> check_file_sources(
  const Catalog & catalog, const std::filesystem::path & modules_dir)
{
  for (const auto & [id, res] : catalog.resources) {
    if (id.type != "file") {
      continue;
    }
    for (const auto & source : string_values(res.find("source"))) {
      if (source.compare(0, k_module_source_prefix.size(), k_module_source_prefix) != 0) {
        continue;
      }
      const std::string rest = source.substr(k_module_source_prefix.size());
      const size_t slash = rest.find('/');
      if (slash == std::string::npos || slash == 0 || slash + 1 == rest.size()) {
        return check_failure(res, fmt::format("malformed module file source '{}'", source));
      }

      const auto path = modules_dir / rest.substr(0, slash) / "files" / rest.substr(slash + 1);
      std::error_code ec;
      if (!std::filesystem::is_regular_file(path, ec)) {
        return check_failure(
          res, fmt::format("source '{}' does not exist (looked for {})", source, path.string()));
      }
    }
  }
  return std::nullopt;
}

std::optional<Diagnostic> check_user_groups(const Catalog & catalog)
{
  auto known = [&](const std::string & group) {
    return system_groups().count(group) != 0 ||
           catalog.resources.count(ResourceId("group", group)) != 0;
  };

  for (const auto & [id, res] : catalog.resources) {
    if (id.type != "user") {
      continue;
    }
    for (const auto & gid : string_values(res.find("gid"))) {
      if (!is_numeric(gid) && !known(gid)) {
        return check_failure(res, fmt::format("primary group '{}' is not declared", gid));
      }
    }
    for (const auto & group : string_values(res.find("groups"))) {
      if (!known(group)) {
        return check_failure(res, fmt::format("group '{}' is not declared", group));
      }
    }
  }
  return std::nullopt;
}

std::optional<Diagnostic> check_catalog(
  const Catalog & catalog, const std::filesystem::path & modules_dir)
{
  if (auto failure = check_file_sources(catalog, modules_dir)) {
    return failure;
  }
  return check_user_groups(catalog);
}

}  // namespace cfgcat
