// cfgcat/basic/casting.hpp - classof-based checked casts for the manifest AST
//
//   if (isa<ResourceStmt>(stmt)) { ... }
//   auto * res = cast<ResourceStmt>(stmt);            // asserts on mismatch
//   if (auto * call = dyn_cast<CallStmt>(stmt)) { ... }  // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace cfgcat
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when node is non-null and of dynamic kind T
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::HasClassof<T, From>::value, "isa<T> requires T::classof()");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(static_cast<const From *>(node)) && "cast<T>() on a node of another kind");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace cfgcat
