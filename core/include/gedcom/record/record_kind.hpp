// gedcom/record/record_kind.hpp - RecordKind enumeration
#pragma once

#include <cstdint>
#include <string_view>

namespace gedcom
{

// ============================================================================
// RecordKind - Identifies every typed record
// ============================================================================

/**
 * Record kind enumeration for LLVM-style RTTI.
 * Kinds are grouped by category for range-based classof checks.
 * Generated from record_kinds.def; Generic is the fallback for every
 * tag without a dedicated class.
 */
enum class RecordKind : uint8_t {
// === Plain records ===
#define RECORD_PLAIN(Class, Tag) Class,
#include "gedcom/record/record_kinds.def"

// === Events ===
#define RECORD_EVENT(Class, Tag) Class,
#include "gedcom/record/record_kinds.def"

// === Spouse roles ===
#define RECORD_SPOUSE(Class, Tag) Class,
#include "gedcom/record/record_kinds.def"

  Generic,
};

// ============================================================================
// Category Ranges
// ============================================================================

inline constexpr RecordKind k_first_event_kind = RecordKind::Birth;
inline constexpr RecordKind k_last_event_kind = RecordKind::Residence;

inline constexpr RecordKind k_first_spouse_kind = RecordKind::Husband;
inline constexpr RecordKind k_last_spouse_kind = RecordKind::Wife;

[[nodiscard]] constexpr bool is_event_kind(RecordKind kind) noexcept
{
  return kind >= k_first_event_kind && kind <= k_last_event_kind;
}

[[nodiscard]] constexpr bool is_spouse_kind(RecordKind kind) noexcept
{
  return kind >= k_first_spouse_kind && kind <= k_last_spouse_kind;
}

// ============================================================================
// to_string
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(RecordKind kind) noexcept
{
  switch (kind) {
#define RECORD_PLAIN(Class, Tag) \
  case RecordKind::Class:        \
    return #Class;
#define RECORD_EVENT(Class, Tag) \
  case RecordKind::Class:        \
    return #Class;
#define RECORD_SPOUSE(Class, Tag) \
  case RecordKind::Class:         \
    return #Class;
#include "gedcom/record/record_kinds.def"
    case RecordKind::Generic:
      return "Generic";
  }
  return "Unknown";
}

}  // namespace gedcom
