// cfgcat/types/type_registry.hpp - Resource type name -> validation pipeline
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cfgcat/basic/result.hpp"
#include "cfgcat/model/resource.hpp"
#include "cfgcat/types/validators.hpp"

namespace cfgcat
{

using ParameterSet = std::set<std::string, std::less<>>;

/// Ordered per-parameter rules: parameter name and its combinators, applied in order
using ParameterRules = std::vector<std::pair<std::string, std::vector<ParamValidator>>>;

/// Validation pipeline of one resource type
struct TypeMethods
{
  Validator validate;
  ParameterSet parameters;  ///< Legal parameters; empty accepts anything
};

/**
 * Prologue of every pipeline.
 *
 * 1. With a non-empty legal set, attributes outside legal parameters and
 *    metaparameters fail with UnknownParameter naming them (sorted).
 * 2. Type-level defaults are merged in without overwriting, then Undefined
 *    attributes are dropped.
 */
[[nodiscard]] Validator default_validate(ParameterSet legal);

/// default_validate(keys of rules), then the rules in order, then extra
[[nodiscard]] TypeMethods make_type_methods(ParameterRules rules, Validator extra = accept);

/// Accepts every resource without any check
[[nodiscard]] TypeMethods fake_type();

/// default_validate over an empty legal set
[[nodiscard]] TypeMethods default_type();

/**
 * Immutable after construction; safe to share between concurrent
 * compilations without locking.
 */
class TypeRegistry
{
public:
  using TypeMap = std::map<std::string, TypeMethods, std::less<>>;

  TypeRegistry() = default;
  explicit TypeRegistry(TypeMap types) : types_(std::move(types)) {}

  [[nodiscard]] const TypeMethods * find(std::string_view type_name) const;
  [[nodiscard]] bool contains(std::string_view type_name) const { return find(type_name) != nullptr; }
  [[nodiscard]] size_t size() const noexcept { return types_.size(); }
  [[nodiscard]] std::vector<std::string> type_names() const;

  /// Runs the type's pipeline; unregistered types go through default_validate({})
  [[nodiscard]] Result<Resource> validate(Resource res) const;

private:
  TypeMap types_;
};

}  // namespace cfgcat
