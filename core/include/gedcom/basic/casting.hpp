// gedcom/basic/casting.hpp - LLVM-style RTTI casting for records
//
// Works with any hierarchy whose classes provide a static `classof`.
// Records carry a RecordKind tag instead of a vtable, so these helpers are
// the only way to go from `Record *` to a concrete record type.
//
// Usage:
//   if (isa<Individual>(rec)) { ... }
//   auto * fam = cast<Family>(rec);              // asserts on mismatch
//   if (auto * ev = dyn_cast<Event>(rec)) { ... } // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace gedcom
{

namespace detail
{

/// True when T provides `static bool classof(const From *)`
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
 * Check whether a record is of kind T. A null record is never of any kind.
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * rec) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return rec != nullptr && T::classof(rec);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * rec) noexcept
{
  return isa<T>(static_cast<const From *>(rec));
}

// ============================================================================
// cast<T>
// ============================================================================

/**
 * Downcast a record that is known to be of kind T.
 *
 * @note Passing nullptr or a record of another kind is a programming error.
 *       Use dyn_cast when the kind is not known in advance.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * rec) noexcept
{
  assert(rec != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(rec) && "Invalid cast");
  return static_cast<T *>(rec);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * rec) noexcept
{
  assert(rec != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(rec) && "Invalid cast");
  return static_cast<const T *>(rec);
}

// ============================================================================
// dyn_cast<T>
// ============================================================================

/// Downcast when the record is of kind T, nullptr otherwise (null input allowed).
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * rec) noexcept
{
  return isa<T>(rec) ? static_cast<T *>(rec) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * rec) noexcept
{
  return isa<T>(rec) ? static_cast<const T *>(rec) : nullptr;
}

}  // namespace gedcom
