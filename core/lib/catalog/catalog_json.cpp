// cfgcat/catalog/catalog_json.cpp - JSON form of a compiled catalog
#include "cfgcat/catalog/catalog_json.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <string>

namespace cfgcat
{

using nlohmann::json;

namespace
{

json number_to_json(const Decimal & number)
{
  if (auto exact = number.to_int64()) {
    return json(*exact);
  }

  const std::string text = number.to_string();
  const double approx = std::strtod(text.c_str(), nullptr);
  auto round_trip = Decimal::parse(fmt::format("{}", approx));
  if (round_trip && *round_trip == number) {
    return json(approx);
  }
  return json(text);
}

json resources_to_json(const ResourceMap & resources)
{
  json out = json::array();
  for (const auto & [id, res] : resources) {
    out.push_back(to_json(res));
  }
  return out;
}

}  // namespace

json to_json(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::String:
      return json(value.as_string());
    case ValueKind::Boolean:
      return json(value.as_bool());
    case ValueKind::Number:
      return number_to_json(value.as_number());
    case ValueKind::Array: {
      json out = json::array();
      for (const auto & element : value.as_array()) {
        out.push_back(to_json(element));
      }
      return out;
    }
    case ValueKind::Undefined:
      break;
  }
  return json(nullptr);
}

json to_json(const Resource & resource)
{
  json params = json::object();
  for (const auto & [name, value] : resource.attributes) {
    params[name] = to_json(value);
  }

  json out{
    {"type", capitalize_type_name(resource.id.type)},
    {"title", resource.id.title},
    {"exported", resource.exported},
    {"parameters", std::move(params)},
  };
  if (resource.position) {
    out["file"] = resource.position->file;
    out["line"] = resource.position->line;
  }
  if (!resource.exported_by.empty()) {
    out["exported_by"] = resource.exported_by;
  }
  return out;
}

json to_json(const Catalog & catalog)
{
  json edges = json::array();
  for (const auto & [source, targets] : catalog.edges) {
    for (const auto & target : targets) {
      edges.push_back(json{{"source", source.reference()}, {"target", target.reference()}});
    }
  }

  json warnings = json::array();
  for (const auto & w : catalog.warnings) {
    json entry{{"level", std::string(to_string(w.severity))}, {"message", w.message}};
    if (w.location) {
      entry["location"] = w.location->to_string();
    }
    warnings.push_back(std::move(entry));
  }

  return json{
    {"name", catalog.node},
    {"resources", resources_to_json(catalog.resources)},
    {"edges", std::move(edges)},
    {"exported", resources_to_json(catalog.exported)},
    {"warnings", std::move(warnings)},
  };
}

}  // namespace cfgcat
