// cfgcat/catalog/catalog.cpp - Catalog assembly and dependency edges
#include "cfgcat/catalog/catalog.hpp"

#include <fmt/core.h>

#include <utility>

namespace cfgcat
{
namespace
{

Result<std::vector<ResourceId>> relationship_targets(
  const Resource & res, const std::string & meta, const Value & value)
{
  using Targets = Result<std::vector<ResourceId>>;

  auto bad_kind = [&](const Value & v) {
    Diagnostic diag = Diagnostic::error(
      DiagnosticKind::TypeMismatch,
      fmt::format(
        "relationship '{}' of {} should be a resource reference, not {}", meta,
        res.id.reference(), v.to_display()),
      res.position);
    return Targets::fail(std::move(diag));
  };

  std::vector<const Value *> refs;
  if (value.is_array()) {
    for (const auto & element : value.as_array()) {
      refs.push_back(&element);
    }
  } else {
    refs.push_back(&value);
  }

  std::vector<ResourceId> targets;
  for (const Value * ref : refs) {
    if (ref->is_undef()) {
      continue;
    }
    if (!ref->is_string()) {
      return bad_kind(*ref);
    }
    auto id = ResourceId::parse_reference(ref->as_string());
    if (!id) {
      Diagnostic diag = Diagnostic::error(
        DiagnosticKind::UnresolvedReference,
        fmt::format(
          "relationship '{}' of {} has malformed reference '{}'", meta, res.id.reference(),
          ref->as_string()),
        res.position);
      return Targets::fail(std::move(diag));
    }
    targets.push_back(std::move(*id));
  }
  return Targets::ok(std::move(targets));
}

}  // namespace

std::size_t Catalog::edge_count() const
{
  std::size_t count = 0;
  for (const auto & [source, targets] : edges) {
    count += targets.size();
  }
  return count;
}

Result<EdgeMap> build_edge_map(const ResourceMap & resources)
{
  EdgeMap edges;

  for (const auto & [id, res] : resources) {
    for (const auto & [name, value] : res.attributes) {
      const bool depends = is_dependency_metaparameter(name);
      if (!depends && !is_dependent_metaparameter(name)) {
        continue;
      }

      auto targets = relationship_targets(res, name, value);
      if (!targets) {
        return Result<EdgeMap>::fail(std::move(targets).error());
      }
      for (const auto & target : targets.value()) {
        if (resources.count(target) == 0) {
          Diagnostic diag = Diagnostic::error(
            DiagnosticKind::UnresolvedReference,
            fmt::format(
              "{} has a '{}' relationship with {}, which is not in the catalog",
              id.reference(), name, target.reference()),
            res.position);
          return Result<EdgeMap>::fail(std::move(diag));
        }
        if (depends) {
          edges[id].insert(target);
        } else {
          edges[target].insert(id);
        }
      }
    }
  }
  return Result<EdgeMap>::ok(std::move(edges));
}

Result<Catalog> assemble_catalog(
  std::string node, std::vector<Resource> resources, std::vector<Diagnostic> warnings)
{
  Catalog catalog;
  catalog.node = std::move(node);
  catalog.warnings = std::move(warnings);

  for (auto & res : resources) {
    ResourceMap & target = res.exported ? catalog.exported : catalog.resources;
    auto existing = target.find(res.id);
    if (existing != target.end()) {
      Diagnostic diag = Diagnostic::error(
        DiagnosticKind::DuplicateResource,
        fmt::format("duplicate resource {} in the catalog of '{}'", res.id.reference(), catalog.node),
        res.position);
      diag.notes.push_back("first declared as " + existing->second.describe());
      return Result<Catalog>::fail(std::move(diag));
    }
    ResourceId id = res.id;
    target.emplace(std::move(id), std::move(res));
  }

  auto edges = build_edge_map(catalog.resources);
  if (!edges) {
    return Result<Catalog>::fail(std::move(edges).error());
  }
  catalog.edges = std::move(edges).value();
  return Result<Catalog>::ok(std::move(catalog));
}

}  // namespace cfgcat
