// minilang/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Type-safe casting over any class hierarchy that implements the `classof`
// static method pattern.
//
// Usage:
//   if (isa<IfStmt>(node)) { ... }
//   auto* decl = cast<Declaration>(node);      // asserts on failure
//   if (auto* id = dyn_cast<Identifier>(node)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace minilang
{

class AstNode;

namespace detail
{

/// Check if T has a classof static method
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T> - Type checking
// ============================================================================

/**
 * Check if a node is of type T.
 *
 * @return true if node is of type T, false otherwise (including if node is null)
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

// ============================================================================
// cast<T> - Unchecked cast (asserts on failure)
// ============================================================================

/**
 * Cast a node to type T. The node must be non-null and of type T;
 * use dyn_cast when that is not known.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T> - Safe dynamic cast (returns nullptr on failure)
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace minilang
