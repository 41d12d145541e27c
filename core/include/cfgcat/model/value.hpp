// cfgcat/model/value.hpp - Configuration value representation
//
// A Value is one of String, Boolean, Number, Array or Undefined. Every
// attribute of a declared resource holds one.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cfgcat/basic/decimal.hpp"

namespace cfgcat
{

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  String,
  Boolean,
  Number,
  Array,
  Undefined,
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  /// Undefined
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_string(std::string value)
  {
    Value v;
    v.kind_ = ValueKind::String;
    v.string_ = std::move(value);
    return v;
  }

  static Value make_bool(bool value)
  {
    Value v;
    v.kind_ = ValueKind::Boolean;
    v.bool_ = value;
    return v;
  }

  static Value make_number(Decimal value)
  {
    Value v;
    v.kind_ = ValueKind::Number;
    v.number_ = std::move(value);
    return v;
  }

  static Value make_number(int64_t value) { return make_number(Decimal::from_int64(value)); }

  static Value make_array(std::vector<Value> elements)
  {
    Value v;
    v.kind_ = ValueKind::Array;
    v.array_ = std::move(elements);
    return v;
  }

  static Value make_undef() { return Value{}; }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Boolean; }
  [[nodiscard]] bool is_number() const noexcept { return kind_ == ValueKind::Number; }
  [[nodiscard]] bool is_array() const noexcept { return kind_ == ValueKind::Array; }
  [[nodiscard]] bool is_undef() const noexcept { return kind_ == ValueKind::Undefined; }

  // ===========================================================================
  // Value Accessors (only valid for the matching kind)
  // ===========================================================================

  [[nodiscard]] const std::string & as_string() const noexcept { return string_; }
  [[nodiscard]] bool as_bool() const noexcept { return bool_; }
  [[nodiscard]] const Decimal & as_number() const noexcept { return number_; }
  [[nodiscard]] const std::vector<Value> & as_array() const noexcept { return array_; }

  // ===========================================================================
  // Rendering
  // ===========================================================================

  /// Source-like rendering for messages: "x" quoted, [1, true], undef
  [[nodiscard]] std::string to_display() const;

  /// Text substituted into an interpolated string: strings unquoted, undef empty
  [[nodiscard]] std::string to_interpolated() const;

  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

private:
  ValueKind kind_ = ValueKind::Undefined;
  std::string string_;
  bool bool_ = false;
  Decimal number_;
  std::vector<Value> array_;
};

/**
 * Comparison used by the manifest language (==, case, selectors, collectors).
 *
 * Strings compare case-insensitively, a String holding a number equals
 * that Number, undef equals "" and Arrays compare elementwise.
 */
[[nodiscard]] bool loosely_equal(const Value & lhs, const Value & rhs);

/// undef, false and "" are false; everything else is true
[[nodiscard]] bool is_truthy(const Value & v) noexcept;

}  // namespace cfgcat
