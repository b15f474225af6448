// thingtalk/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements the `classof` static
// method pattern. AST nodes are owned through std::shared_ptr, so every
// helper also has an overload that takes and returns shared pointers.
//
// Usage:
//   if (isa<FilteredTable>(table)) { ... }
//   auto filter = cast<FilteredTable>(table);              // asserts on failure
//   if (auto atom = dyn_cast<AtomBooleanExpression>(expr)) { ... }  // null on failure
//
#pragma once

#include <cassert>
#include <memory>
#include <type_traits>

namespace thingtalk
{

// ============================================================================
// Type Traits for RTTI Support
// ============================================================================

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
// isa<T>
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

template <typename T, typename From>
[[nodiscard]] inline bool isa(const std::shared_ptr<From> & node) noexcept
{
  return isa<T>(static_cast<const From *>(node.get()));
}

// ============================================================================
// cast<T> - Unchecked cast (asserts on failure)
// ============================================================================

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

/// Shared-pointer cast; the result shares ownership with `node`.
template <typename T, typename From>
[[nodiscard]] inline std::shared_ptr<T> cast(const std::shared_ptr<From> & node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return std::static_pointer_cast<T>(node);
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

template <typename T, typename From>
[[nodiscard]] inline std::shared_ptr<T> dyn_cast(const std::shared_ptr<From> & node) noexcept
{
  return isa<T>(node) ? std::static_pointer_cast<T>(node) : nullptr;
}

// ============================================================================
// cast_or_null<T> / dyn_cast_or_null<T>
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * cast_or_null(From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast_or_null(const From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline std::shared_ptr<T> cast_or_null(const std::shared_ptr<From> & node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast_or_null(From * node) noexcept
{
  return dyn_cast<T>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast_or_null(const From * node) noexcept
{
  return dyn_cast<T>(node);
}

}  // namespace thingtalk
