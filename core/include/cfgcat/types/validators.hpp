// cfgcat/types/validators.hpp - Resource validator combinators
//
// Each combinator checks or normalizes one parameter of a resource. They are
// pure: the only effect is the returned (possibly rewritten) resource.
//
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "cfgcat/basic/result.hpp"
#include "cfgcat/model/resource.hpp"

namespace cfgcat
{

/// Whole-resource validation step
using Validator = std::function<Result<Resource>(Resource)>;

/// Combinator bound to a parameter name when a type's pipeline is assembled
using ParamValidator = std::function<Result<Resource>(std::string_view param, Resource)>;

/// Validator that accepts every resource unchanged
[[nodiscard]] Result<Resource> accept(Resource res);

/// Failure for res, located at its declaration and naming it in a note
[[nodiscard]] Result<Resource> reject(const Resource & res, DiagnosticKind kind, std::string message);

namespace validators
{

/// Boolean/Number become their canonical String; other non-String values fail
[[nodiscard]] Result<Resource> string(std::string_view param, Resource res);

/// `string` applied to every element of an Array value
[[nodiscard]] Result<Resource> strings(std::string_view param, Resource res);

/// `string`, then the text must be an exact integer; rewritten to Number
[[nodiscard]] Result<Resource> integer(std::string_view param, Resource res);

/// `integer` applied to every element of an Array value
[[nodiscard]] Result<Resource> integers(std::string_view param, Resource res);

/// Present String value must be one of allowed
[[nodiscard]] ParamValidator values(std::vector<std::string> allowed);

/// Sets String(value) when the parameter is absent
[[nodiscard]] ParamValidator default_value(std::string value);

[[nodiscard]] Result<Resource> mandatory(std::string_view param, Resource res);

/// `mandatory`, except when ensure is "absent"
[[nodiscard]] Result<Resource> mandatory_if_not_absent(std::string_view param, Resource res);

/// Non-empty String starting with '/'
[[nodiscard]] Result<Resource> fully_qualified(std::string_view param, Resource res);

[[nodiscard]] Result<Resource> fully_qualifieds(std::string_view param, Resource res);

[[nodiscard]] Result<Resource> no_trailing_slash(std::string_view param, Resource res);

/// Dotted-quad IPv4 address
[[nodiscard]] Result<Resource> ipaddr(std::string_view param, Resource res);

/// Present Number must satisfy lo <= v <= hi
[[nodiscard]] ParamValidator inrange(int64_t lo, int64_t hi);

/// Wraps a present non-Array value into a one-element Array
[[nodiscard]] Result<Resource> rarray(std::string_view param, Resource res);

/**
 * Implies `string`. An absent parameter receives the resource title; a
 * present one replaces the title (and so the resource identity).
 */
[[nodiscard]] Result<Resource> nameval(std::string_view param, Resource res);

/// "source" and "content" are mutually exclusive
[[nodiscard]] Result<Resource> validate_source_or_content(Resource res);

/// Exactly four dot-separated decimal groups, each in [0, 255]
[[nodiscard]] bool is_ipv4(std::string_view text);

}  // namespace validators
}  // namespace cfgcat
