// cfgcat/basic/decimal.cpp - Arbitrary-precision decimal implementation
#include "cfgcat/basic/decimal.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>

namespace cfgcat
{
namespace
{

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

std::optional<Decimal> Decimal::parse(std::string_view text)
{
  size_t i = 0;
  const size_t n = text.size();

  bool negative = false;
  if (i < n && text[i] == '-') {
    negative = true;
    ++i;
  }

  std::string digits;
  int64_t exponent = 0;

  const size_t int_start = i;
  while (i < n && is_digit(text[i])) {
    digits.push_back(text[i]);
    ++i;
  }
  if (i == int_start) {
    return std::nullopt;
  }

  if (i < n && text[i] == '.') {
    ++i;
    const size_t frac_start = i;
    while (i < n && is_digit(text[i])) {
      digits.push_back(text[i]);
      --exponent;
      ++i;
    }
    if (i == frac_start) {
      return std::nullopt;
    }
  }

  if (i < n && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    bool exp_negative = false;
    if (i < n && (text[i] == '+' || text[i] == '-')) {
      exp_negative = text[i] == '-';
      ++i;
    }
    const size_t exp_start = i;
    int64_t exp_value = 0;
    while (i < n && is_digit(text[i])) {
      exp_value = exp_value * 10 + (text[i] - '0');
      if (exp_value > 1000000) {
        return std::nullopt;
      }
      ++i;
    }
    if (i == exp_start) {
      return std::nullopt;
    }
    exponent += exp_negative ? -exp_value : exp_value;
  }

  if (i != n) {
    return std::nullopt;
  }

  // Leading zeros
  const size_t first_nonzero = digits.find_first_not_of('0');
  if (first_nonzero == std::string::npos) {
    return Decimal{};
  }
  digits.erase(0, first_nonzero);

  // Trailing zeros move into the exponent
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
    ++exponent;
  }

  if (exponent > k_max_exponent || exponent < -k_max_exponent) {
    return std::nullopt;
  }

  Decimal d;
  d.negative_ = negative;
  d.digits_ = std::move(digits);
  d.exponent_ = static_cast<int32_t>(exponent);
  return d;
}

Decimal Decimal::from_int64(int64_t value)
{
  // Always well-formed
  return *parse(std::to_string(value));
}

std::optional<int64_t> Decimal::to_int64() const
{
  if (!is_integer()) {
    return std::nullopt;
  }
  if (digits_.size() + static_cast<size_t>(exponent_) > 19) {
    return std::nullopt;
  }

  const std::string text = to_string();
  int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string Decimal::to_string() const
{
  std::string out;
  if (negative_) {
    out.push_back('-');
  }

  if (exponent_ >= 0) {
    out += digits_;
    if (!is_zero()) {
      out.append(static_cast<size_t>(exponent_), '0');
    }
    return out;
  }

  const auto frac = static_cast<size_t>(-exponent_);
  if (digits_.size() > frac) {
    out.append(digits_, 0, digits_.size() - frac);
    out.push_back('.');
    out.append(digits_, digits_.size() - frac, std::string::npos);
  } else {
    out += "0.";
    out.append(frac - digits_.size(), '0');
    out += digits_;
  }
  return out;
}

int Decimal::compare_magnitude(const Decimal & other) const noexcept
{
  if (is_zero() || other.is_zero()) {
    if (is_zero() && other.is_zero()) return 0;
    return is_zero() ? -1 : 1;
  }

  // Position of the most significant digit
  const int64_t lhs_adjusted = static_cast<int64_t>(digits_.size()) + exponent_;
  const int64_t rhs_adjusted = static_cast<int64_t>(other.digits_.size()) + other.exponent_;
  if (lhs_adjusted != rhs_adjusted) {
    return lhs_adjusted < rhs_adjusted ? -1 : 1;
  }

  const size_t len = std::max(digits_.size(), other.digits_.size());
  for (size_t k = 0; k < len; ++k) {
    const char a = k < digits_.size() ? digits_[k] : '0';
    const char b = k < other.digits_.size() ? other.digits_[k] : '0';
    if (a != b) {
      return a < b ? -1 : 1;
    }
  }
  return 0;
}

int Decimal::compare(const Decimal & other) const noexcept
{
  if (negative_ != other.negative_) {
    return negative_ ? -1 : 1;
  }
  const int mag = compare_magnitude(other);
  return negative_ ? -mag : mag;
}

}  // namespace cfgcat
