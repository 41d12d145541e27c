// cfgcat/catalog/catalog.hpp - Compiled catalog of a node
#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/result.hpp"
#include "cfgcat/model/resource.hpp"

namespace cfgcat
{

using ResourceMap = std::map<ResourceId, Resource>;

/// Resource -> resources it depends on; only non-empty entries
using EdgeMap = std::map<ResourceId, std::set<ResourceId>>;

/**
 * Result of one successful compilation. Immutable once assembled.
 */
struct Catalog
{
  std::string node;
  ResourceMap resources;  ///< Local resources, collected ones included
  EdgeMap edges;
  ResourceMap exported;
  std::vector<Diagnostic> warnings;

  [[nodiscard]] const Resource * find(const ResourceId & id) const
  {
    auto it = resources.find(id);
    return it == resources.end() ? nullptr : &it->second;
  }

  [[nodiscard]] std::size_t edge_count() const;
};

/**
 * Dependency edges from the relationship metaparameters of resources.
 *
 * require/after/subscribe on R targeting T add R -> T; before/notify on R
 * targeting T add T -> R. Targets are canonical reference strings (or
 * Arrays of them) that must name a resource of the map; otherwise
 * UnresolvedReference. Other value kinds are TypeMismatch. Cycles are kept.
 */
[[nodiscard]] Result<EdgeMap> build_edge_map(const ResourceMap & resources);

/**
 * Insert validated resources into a catalog.
 *
 * Two resources with the same identity in the same partition are a
 * DuplicateResource. Exported resources go to the exported map; the edge
 * map is built over the local ones.
 */
[[nodiscard]] Result<Catalog> assemble_catalog(
  std::string node, std::vector<Resource> resources, std::vector<Diagnostic> warnings);

}  // namespace cfgcat
