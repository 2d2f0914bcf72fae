// argconv/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy that implements the `classof` static
// method pattern. The converter hierarchy uses it to inspect nested
// converters without dynamic_cast.
//
// Usage:
//   if (isa<UnknownConverter>(conv)) { ... }
//   auto* e = cast<EnumConverter>(conv);            // asserts on failure
//   if (auto* t = dyn_cast<TupleConverter>(conv)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace argconv
{

namespace detail
{

/// Check if T has a classof static method accepting `const From *`
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
 * Check if an object is of type T.
 *
 * @return true if obj is non-null and of type T
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * obj) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return obj != nullptr && T::classof(obj);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * obj) noexcept
{
  return isa<T>(static_cast<const From *>(obj));
}

// ============================================================================
// cast<T> - asserts on failure
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * obj) noexcept
{
  assert(obj != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(obj) && "Invalid cast");
  return static_cast<T *>(obj);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * obj) noexcept
{
  assert(obj != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(obj) && "Invalid cast");
  return static_cast<const T *>(obj);
}

// ============================================================================
// dyn_cast<T> - nullptr on failure
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * obj) noexcept
{
  return isa<T>(obj) ? static_cast<T *>(obj) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * obj) noexcept
{
  return isa<T>(obj) ? static_cast<const T *>(obj) : nullptr;
}

}  // namespace argconv
