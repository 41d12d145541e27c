// cfgcat/model/resource.hpp - Resource identity and declared resources
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "cfgcat/basic/source_manager.hpp"
#include "cfgcat/model/value.hpp"

namespace cfgcat
{

// ============================================================================
// ResourceId
// ============================================================================

/**
 * (type name, title). Type names are lower-case ("file", "foo::bar").
 *
 * The canonical reference text capitalizes each "::" segment of the type:
 * File[/etc/motd], Foo::Bar[x]. Values refer to resources through it.
 */
struct ResourceId
{
  std::string type;
  std::string title;

  ResourceId() = default;
  ResourceId(std::string type_name, std::string resource_title)
  : type(std::move(type_name)), title(std::move(resource_title))
  {
  }

  [[nodiscard]] std::string reference() const;

  /// Inverse of reference(); nullopt unless the text is Type[title] with a non-empty title
  [[nodiscard]] static std::optional<ResourceId> parse_reference(std::string_view text);

  [[nodiscard]] bool operator==(const ResourceId & other) const noexcept
  {
    return type == other.type && title == other.title;
  }
  [[nodiscard]] bool operator!=(const ResourceId & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] bool operator<(const ResourceId & other) const noexcept
  {
    return type != other.type ? type < other.type : title < other.title;
  }
};

/// "foo::bar" -> "Foo::Bar"
[[nodiscard]] std::string capitalize_type_name(std::string_view type_name);

// ============================================================================
// Resource
// ============================================================================

/// Attribute name -> value; ordered for deterministic output
using Attributes = std::map<std::string, Value, std::less<>>;

struct Resource
{
  ResourceId id;
  Attributes attributes;
  std::optional<SourcePosition> position;

  /// Declared with @@ (only goes to the exported part of a catalog)
  bool exported = false;

  /// Node that exported it, for resources collected from the store
  std::string exported_by;

  [[nodiscard]] const Value * find(std::string_view name) const
  {
    auto it = attributes.find(name);
    return it == attributes.end() ? nullptr : &it->second;
  }

  [[nodiscard]] bool has(std::string_view name) const { return attributes.count(name) != 0; }

  /// "File[/etc/motd]" or "File[/etc/motd] (site.pp:3:1)"
  [[nodiscard]] std::string describe() const;
};

// ============================================================================
// Metaparameters
// ============================================================================

/// alias, audit, before, after, loglevel, noop, notify, require, schedule, stage, subscribe, tag
[[nodiscard]] const std::set<std::string, std::less<>> & metaparameters();

[[nodiscard]] bool is_metaparameter(std::string_view name);

/// Metaparameters creating "this resource depends on target" edges
[[nodiscard]] bool is_dependency_metaparameter(std::string_view name);

/// Metaparameters creating "target depends on this resource" edges
[[nodiscard]] bool is_dependent_metaparameter(std::string_view name);

}  // namespace cfgcat
