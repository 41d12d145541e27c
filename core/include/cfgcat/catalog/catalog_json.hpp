// cfgcat/catalog/catalog_json.hpp - JSON form of a compiled catalog
//
//   {"name": ..., "resources": [...], "edges": [{"source", "target"}],
//    "exported": [...], "warnings": [...]}
//
#pragma once

#include <nlohmann/json.hpp>

#include "cfgcat/catalog/catalog.hpp"
#include "cfgcat/model/value.hpp"

namespace cfgcat
{

/**
 * Numbers that an int64 or a double holds exactly become JSON numbers,
 * others stay strings. undef becomes null.
 */
[[nodiscard]] nlohmann::json to_json(const Value & value);

/// {"type", "title", "exported", "parameters", "file"?, "line"?, "exported_by"?}
[[nodiscard]] nlohmann::json to_json(const Resource & resource);

[[nodiscard]] nlohmann::json to_json(const Catalog & catalog);

}  // namespace cfgcat
