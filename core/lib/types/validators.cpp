// cfgcat/types/validators.cpp - Resource validator combinators
#include "cfgcat/types/validators.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace cfgcat
{

Result<Resource> accept(Resource res) { return Result<Resource>::ok(std::move(res)); }

Result<Resource> reject(const Resource & res, DiagnosticKind kind, std::string message)
{
  Diagnostic diag = Diagnostic::error(kind, std::move(message), res.position);
  diag.notes.push_back("while validating " + res.id.reference());
  return Result<Resource>::fail(std::move(diag));
}

namespace validators
{
namespace
{

/// Canonical String for a scalar, or nullopt for kinds without one
std::optional<Value> coerce_to_string(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::String:
      return v;
    case ValueKind::Boolean:
      return Value::make_string(v.as_bool() ? "true" : "false");
    case ValueKind::Number:
      return Value::make_string(v.as_number().to_string());
    case ValueKind::Array:
    case ValueKind::Undefined:
      break;
  }
  return std::nullopt;
}

/// String-coerced value as a canonical integer Number, or nullopt
std::optional<Value> coerce_to_integer(const Value & v)
{
  const auto text = coerce_to_string(v);
  if (!text) {
    return std::nullopt;
  }
  auto number = Decimal::parse(text->as_string());
  if (!number || !number->is_integer()) {
    return std::nullopt;
  }
  return Value::make_number(std::move(*number));
}

/// Applies convert to every element of an Array parameter
template <typename Convert>
Result<Resource> each_element(
  std::string_view param, Resource res, Convert convert, std::string_view expected)
{
  auto it = res.attributes.find(param);
  if (it == res.attributes.end()) {
    return accept(std::move(res));
  }
  if (!it->second.is_array()) {
    return reject(
      res, DiagnosticKind::TypeMismatch,
      fmt::format(
        "parameter '{}' should be an array, not {}", param, it->second.to_display()));
  }

  std::vector<Value> elements = it->second.as_array();
  for (auto & element : elements) {
    auto converted = convert(element);
    if (!converted) {
      return reject(
        res, DiagnosticKind::TypeMismatch,
        fmt::format(
          "elements of parameter '{}' should be {}, not {}", param, expected,
          element.to_display()));
    }
    element = std::move(*converted);
  }
  it->second = Value::make_array(std::move(elements));
  return accept(std::move(res));
}

Result<Resource> check_path(std::string_view param, const Value & path, const Resource & res)
{
  if (!path.is_string()) {
    return reject(
      res, DiagnosticKind::TypeMismatch,
      fmt::format("path for parameter '{}' should be a string, not {}", param, path.to_display()));
  }
  const std::string & p = path.as_string();
  if (p.empty()) {
    return reject(res, DiagnosticKind::EmptyValue, fmt::format("empty path for parameter '{}'", param));
  }
  if (p.front() != '/') {
    return reject(
      res, DiagnosticKind::NotAbsolute,
      fmt::format("path must be absolute, not '{}' for parameter '{}'", p, param));
  }
  return accept(res);
}

std::string join_quoted(const std::vector<std::string> & items)
{
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "'" + items[i] + "'";
  }
  return out;
}

}  // namespace

Result<Resource> string(std::string_view param, Resource res)
{
  auto it = res.attributes.find(param);
  if (it == res.attributes.end()) {
    return accept(std::move(res));
  }
  auto coerced = coerce_to_string(it->second);
  if (!coerced) {
    return reject(
      res, DiagnosticKind::TypeMismatch,
      fmt::format("parameter '{}' should be a string, not {}", param, it->second.to_display()));
  }
  it->second = std::move(*coerced);
  return accept(std::move(res));
}

Result<Resource> strings(std::string_view param, Resource res)
{
  return each_element(param, std::move(res), coerce_to_string, "strings");
}

Result<Resource> integer(std::string_view param, Resource res)
{
  auto it = res.attributes.find(param);
  if (it == res.attributes.end()) {
    return accept(std::move(res));
  }
  auto number = coerce_to_integer(it->second);
  if (!number) {
    return reject(
      res, DiagnosticKind::TypeMismatch,
      fmt::format("parameter '{}' must be an integer, not {}", param, it->second.to_display()));
  }
  it->second = std::move(*number);
  return accept(std::move(res));
}

Result<Resource> integers(std::string_view param, Resource res)
{
  return each_element(param, std::move(res), coerce_to_integer, "integers");
}

ParamValidator values(std::vector<std::string> allowed)
{
  return [allowed = std::move(allowed)](std::string_view param, Resource res) {
    const Value * v = res.find(param);
    if (v == nullptr) {
      return accept(std::move(res));
    }
    if (v->is_string() && std::find(allowed.begin(), allowed.end(), v->as_string()) != allowed.end()) {
      return accept(std::move(res));
    }
    return reject(
      res, DiagnosticKind::InvalidEnum,
      fmt::format(
        "parameter '{}' value should be one of {} and not {}", param, join_quoted(allowed),
        v->to_display()));
  };
}

ParamValidator default_value(std::string value)
{
  return [value = std::move(value)](std::string_view param, Resource res) {
    if (!res.has(param)) {
      res.attributes.emplace(std::string(param), Value::make_string(value));
    }
    return accept(std::move(res));
  };
}

Result<Resource> mandatory(std::string_view param, Resource res)
{
  if (res.has(param)) {
    return accept(std::move(res));
  }
  return reject(
    res, DiagnosticKind::MissingRequired, fmt::format("parameter '{}' should be set", param));
}

Result<Resource> mandatory_if_not_absent(std::string_view param, Resource res)
{
  if (res.has(param)) {
    return accept(std::move(res));
  }
  const Value * ensure = res.find("ensure");
  if (ensure != nullptr && ensure->is_string() && ensure->as_string() == "absent") {
    return accept(std::move(res));
  }
  return reject(
    res, DiagnosticKind::MissingRequired,
    fmt::format("parameter '{}' should be set unless ensure is 'absent'", param));
}

Result<Resource> fully_qualified(std::string_view param, Resource res)
{
  const Value * v = res.find(param);
  if (v == nullptr) {
    return accept(std::move(res));
  }
  auto checked = check_path(param, *v, res);
  if (!checked) {
    return checked;
  }
  return accept(std::move(res));
}

Result<Resource> fully_qualifieds(std::string_view param, Resource res)
{
  const Value * v = res.find(param);
  if (v == nullptr) {
    return accept(std::move(res));
  }
  if (!v->is_array()) {
    return reject(
      res, DiagnosticKind::TypeMismatch,
      fmt::format("parameter '{}' should be an array, not {}", param, v->to_display()));
  }
  for (const auto & element : v->as_array()) {
    auto checked = check_path(param, element, res);
    if (!checked) {
      return checked;
    }
  }
  return accept(std::move(res));
}

Result<Resource> no_trailing_slash(std::string_view param, Resource res)
{
  const Value * v = res.find(param);
  if (v != nullptr && v->is_string() && !v->as_string().empty() && v->as_string().back() == '/') {
    return reject(
      res, DiagnosticKind::InvalidFormat,
      fmt::format("parameter '{}' should not have a trailing slash", param));
  }
  return accept(std::move(res));
}

bool is_ipv4(std::string_view text)
{
  int groups = 0;
  size_t pos = 0;
  while (true) {
    const size_t dot = text.find('.', pos);
    const std::string_view group =
      text.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);

    if (group.empty() || group.size() > 3) {
      return false;
    }
    int value = 0;
    for (const char c : group) {
      if (c < '0' || c > '9') {
        return false;
      }
      value = value * 10 + (c - '0');
    }
    if (value > 255) {
      return false;
    }

    ++groups;
    if (dot == std::string_view::npos) {
      return groups == 4;
    }
    if (groups == 4) {
      return false;
    }
    pos = dot + 1;
  }
}

Result<Resource> ipaddr(std::string_view param, Resource res)
{
  const Value * v = res.find(param);
  if (v == nullptr) {
    return accept(std::move(res));
  }
  if (!v->is_string()) {
    return reject(
      res, DiagnosticKind::TypeMismatch,
      fmt::format("parameter '{}' should be an IP address string, not {}", param, v->to_display()));
  }
  if (!is_ipv4(v->as_string())) {
    return reject(
      res, DiagnosticKind::InvalidFormat,
      fmt::format("invalid IP address '{}' for parameter '{}'", v->as_string(), param));
  }
  return accept(std::move(res));
}

ParamValidator inrange(int64_t lo, int64_t hi)
{
  return [lo, hi](std::string_view param, Resource res) {
    const Value * v = res.find(param);
    if (v == nullptr) {
      return accept(std::move(res));
    }
    if (!v->is_number()) {
      return reject(
        res, DiagnosticKind::TypeMismatch,
        fmt::format("parameter '{}' should be a number, not {}", param, v->to_display()));
    }
    const Decimal & n = v->as_number();
    if (n < Decimal::from_int64(lo) || n > Decimal::from_int64(hi)) {
      return reject(
        res, DiagnosticKind::OutOfRange,
        fmt::format(
          "parameter '{}' value {} should be between {} and {}", param, n.to_string(), lo, hi));
    }
    return accept(std::move(res));
  };
}

Result<Resource> rarray(std::string_view param, Resource res)
{
  auto it = res.attributes.find(param);
  if (it != res.attributes.end() && !it->second.is_array()) {
    it->second = Value::make_array({it->second});
  }
  return accept(std::move(res));
}

Result<Resource> nameval(std::string_view param, Resource res)
{
  auto coerced = string(param, std::move(res));
  if (!coerced) {
    return coerced;
  }
  Resource r = std::move(coerced).value();

  const Value * v = r.find(param);
  if (v == nullptr) {
    r.attributes.emplace(std::string(param), Value::make_string(r.id.title));
  } else {
    r.id.title = v->as_string();
  }
  return accept(std::move(r));
}

Result<Resource> validate_source_or_content(Resource res)
{
  if (res.has("source") && res.has("content")) {
    return reject(
      res, DiagnosticKind::ConflictingAttributes,
      "'source' and 'content' cannot be specified at the same time");
  }
  return accept(std::move(res));
}

}  // namespace validators
}  // namespace cfgcat
