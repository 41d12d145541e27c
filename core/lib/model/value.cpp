// cfgcat/model/value.cpp - Value implementation
#include "cfgcat/model/value.hpp"

#include <cctype>

namespace cfgcat
{

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::String:
      return "string";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Number:
      return "number";
    case ValueKind::Array:
      return "array";
    case ValueKind::Undefined:
      return "undef";
  }
  return "undef";
}

std::string Value::to_display() const
{
  switch (kind_) {
    case ValueKind::String:
      return "\"" + string_ + "\"";
    case ValueKind::Boolean:
      return bool_ ? "true" : "false";
    case ValueKind::Number:
      return number_.to_string();
    case ValueKind::Array: {
      std::string out = "[";
      for (size_t i = 0; i < array_.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += array_[i].to_display();
      }
      out += "]";
      return out;
    }
    case ValueKind::Undefined:
      return "undef";
  }
  return "undef";
}

std::string Value::to_interpolated() const
{
  switch (kind_) {
    case ValueKind::String:
      return string_;
    case ValueKind::Undefined:
      return "";
    case ValueKind::Array: {
      std::string out = "[";
      for (size_t i = 0; i < array_.size(); ++i) {
        if (i > 0) {
          out += ", ";
        }
        out += array_[i].to_interpolated();
      }
      out += "]";
      return out;
    }
    case ValueKind::Boolean:
    case ValueKind::Number:
      return to_display();
  }
  return "";
}

bool Value::operator==(const Value & other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ValueKind::String:
      return string_ == other.string_;
    case ValueKind::Boolean:
      return bool_ == other.bool_;
    case ValueKind::Number:
      return number_ == other.number_;
    case ValueKind::Array:
      return array_ == other.array_;
    case ValueKind::Undefined:
      return true;
  }
  return false;
}

namespace
{

bool iequals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool string_equals_number(const std::string & text, const Decimal & number)
{
  auto parsed = Decimal::parse(text);
  return parsed && *parsed == number;
}

}  // namespace

bool loosely_equal(const Value & lhs, const Value & rhs)
{
  if (lhs.is_undef() || rhs.is_undef()) {
    const Value & other = lhs.is_undef() ? rhs : lhs;
    return other.is_undef() || (other.is_string() && other.as_string().empty());
  }
  if (lhs.is_string() && rhs.is_string()) {
    return iequals(lhs.as_string(), rhs.as_string());
  }
  if (lhs.is_string() && rhs.is_number()) {
    return string_equals_number(lhs.as_string(), rhs.as_number());
  }
  if (lhs.is_number() && rhs.is_string()) {
    return string_equals_number(rhs.as_string(), lhs.as_number());
  }
  if (lhs.is_array() && rhs.is_array()) {
    const auto & a = lhs.as_array();
    const auto & b = rhs.as_array();
    if (a.size() != b.size()) {
      return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
      if (!loosely_equal(a[i], b[i])) {
        return false;
      }
    }
    return true;
  }
  return lhs == rhs;
}

bool is_truthy(const Value & v) noexcept
{
  switch (v.kind()) {
    case ValueKind::Undefined:
      return false;
    case ValueKind::Boolean:
      return v.as_bool();
    case ValueKind::String:
      return !v.as_string().empty();
    case ValueKind::Number:
    case ValueKind::Array:
      return true;
  }
  return false;
}

}  // namespace cfgcat
