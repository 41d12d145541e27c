// cfgcat/basic/decimal.hpp - Arbitrary-precision decimal numbers
//
// A number is kept as sign, significant digits and a base-10 exponent:
//   value = (-1)^negative * digits * 10^exponent
// Representation is normalized, so equal numbers have equal fields.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cfgcat
{

class Decimal
{
public:
  /// Largest accepted |exponent| after normalization
  static constexpr int32_t k_max_exponent = 4096;

  /// Zero
  Decimal() = default;

  /**
   * Parse "[-]digits[.digits][(e|E)[+-]digits]".
   *
   * @return nullopt on malformed input or an exponent beyond k_max_exponent
   */
  [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

  [[nodiscard]] static Decimal from_int64(int64_t value);

  [[nodiscard]] bool is_zero() const noexcept { return digits_ == "0"; }
  [[nodiscard]] bool is_negative() const noexcept { return negative_; }
  [[nodiscard]] bool is_integer() const noexcept { return exponent_ >= 0; }

  /// Exact conversion; nullopt when fractional or out of int64 range
  [[nodiscard]] std::optional<int64_t> to_int64() const;

  /// Plain decimal text: no exponent, no trailing fractional zeros ("12", "-0.25")
  [[nodiscard]] std::string to_string() const;

  /// Three-way exact comparison (-1, 0, 1)
  [[nodiscard]] int compare(const Decimal & other) const noexcept;

  [[nodiscard]] bool operator==(const Decimal & other) const noexcept
  {
    return negative_ == other.negative_ && exponent_ == other.exponent_ &&
           digits_ == other.digits_;
  }
  [[nodiscard]] bool operator!=(const Decimal & other) const noexcept { return !(*this == other); }
  [[nodiscard]] bool operator<(const Decimal & other) const noexcept { return compare(other) < 0; }
  [[nodiscard]] bool operator<=(const Decimal & other) const noexcept
  {
    return compare(other) <= 0;
  }
  [[nodiscard]] bool operator>(const Decimal & other) const noexcept { return compare(other) > 0; }
  [[nodiscard]] bool operator>=(const Decimal & other) const noexcept
  {
    return compare(other) >= 0;
  }

private:
  [[nodiscard]] int compare_magnitude(const Decimal & other) const noexcept;

  bool negative_ = false;
  std::string digits_ = "0";
  int32_t exponent_ = 0;
};

}  // namespace cfgcat
