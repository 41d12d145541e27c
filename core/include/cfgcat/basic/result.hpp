// cfgcat/basic/result.hpp - Value-or-diagnostic result type
//
// Every fallible operation of the compilation pipeline returns a Result:
// either the produced value or exactly one error Diagnostic.
//
#pragma once

#include <cstddef>
#include <utility>
#include <variant>

#include "cfgcat/basic/diagnostic.hpp"

namespace cfgcat
{

template <typename T>
class Result
{
public:
  /// Create a successful result
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  /// Create a failed result
  static Result fail(Diagnostic diag) { return Result(std::in_place_index<1>, std::move(diag)); }

  [[nodiscard]] bool success() const noexcept { return state_.index() == 0; }
  explicit operator bool() const noexcept { return success(); }

  /// Only valid if success()
  [[nodiscard]] T & value() & { return std::get<0>(state_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(state_); }
  [[nodiscard]] T && value() && { return std::get<0>(std::move(state_)); }

  /// Only valid if !success()
  [[nodiscard]] const Diagnostic & error() const & { return std::get<1>(state_); }
  [[nodiscard]] Diagnostic && error() && { return std::get<1>(std::move(state_)); }

  /**
   * Chain a step that consumes the value and returns another Result<T>.
   * A failure short-circuits and is propagated unchanged.
   */
  template <typename F>
  [[nodiscard]] Result and_then(F && step) &&
  {
    if (!success()) {
      return std::move(*this);
    }
    return std::forward<F>(step)(std::move(*this).value());
  }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U && payload) : state_(tag, std::forward<U>(payload))
  {
  }

  std::variant<T, Diagnostic> state_;
};

}  // namespace cfgcat
