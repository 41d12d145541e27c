// cfgcat/types/type_registry.cpp - Resource type pipelines
#include "cfgcat/types/type_registry.hpp"

#include <fmt/core.h>

namespace cfgcat
{
namespace
{

/// Type-level default attributes; none are defined yet
const Attributes & type_defaults()
{
  static const Attributes k_defaults;
  return k_defaults;
}

Result<Resource> check_parameter_list(const ParameterSet & legal, Resource res)
{
  if (legal.empty()) {
    return accept(std::move(res));
  }

  std::vector<std::string> unknown;
  for (const auto & [name, value] : res.attributes) {
    if (legal.count(name) == 0 && !is_metaparameter(name)) {
      unknown.push_back(name);
    }
  }
  if (unknown.empty()) {
    return accept(std::move(res));
  }

  // Attributes are an ordered map, so the list is already sorted
  std::string names;
  for (size_t i = 0; i < unknown.size(); ++i) {
    if (i > 0) {
      names += ", ";
    }
    names += unknown[i];
  }
  return reject(
    res, DiagnosticKind::UnknownParameter,
    fmt::format("unknown parameters for {}: {}", res.id.reference(), names));
}

Resource add_defaults(Resource res)
{
  for (const auto & [name, value] : type_defaults()) {
    res.attributes.emplace(name, value);
  }
  for (auto it = res.attributes.begin(); it != res.attributes.end();) {
    if (it->second.is_undef()) {
      it = res.attributes.erase(it);
    } else {
      ++it;
    }
  }
  return res;
}

}  // namespace

Validator default_validate(ParameterSet legal)
{
  return [legal = std::move(legal)](Resource res) {
    return check_parameter_list(legal, std::move(res)).and_then([](Resource checked) {
      return Result<Resource>::ok(add_defaults(std::move(checked)));
    });
  };
}

TypeMethods make_type_methods(ParameterRules rules, Validator extra)
{
  ParameterSet parameters;
  for (const auto & rule : rules) {
    parameters.insert(rule.first);
  }

  Validator prologue = default_validate(parameters);
  Validator pipeline = [prologue = std::move(prologue), rules = std::move(rules),
                        extra = std::move(extra)](Resource res) {
    Result<Resource> current = prologue(std::move(res));
    for (const auto & [param, combinators] : rules) {
      for (const auto & combinator : combinators) {
        if (!current) {
          return current;
        }
        current = combinator(param, std::move(current).value());
      }
    }
    if (!current) {
      return current;
    }
    return extra(std::move(current).value());
  };

  return TypeMethods{std::move(pipeline), std::move(parameters)};
}

TypeMethods fake_type() { return TypeMethods{accept, {}}; }

TypeMethods default_type() { return TypeMethods{default_validate({}), {}}; }

const TypeMethods * TypeRegistry::find(std::string_view type_name) const
{
  auto it = types_.find(type_name);
  return it == types_.end() ? nullptr : &it->second;
}

std::vector<std::string> TypeRegistry::type_names() const
{
  std::vector<std::string> names;
  names.reserve(types_.size());
  for (const auto & [name, methods] : types_) {
    names.push_back(name);
  }
  return names;
}

Result<Resource> TypeRegistry::validate(Resource res) const
{
  if (const TypeMethods * methods = find(res.id.type)) {
    return methods->validate(std::move(res));
  }
  static const Validator k_unregistered = default_validate({});
  return k_unregistered(std::move(res));
}

}  // namespace cfgcat
