// gedcom/record/xref_index.hpp - Pointer-id to declaring record
#pragma once

#include <functional>
#include <string_view>
#include <unordered_map>

#include "gedcom/record/record.hpp"

namespace gedcom
{

/// Transparent hash functor for string_view heterogeneous lookup
struct XrefHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct XrefEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Maps "@ID@" to the top-level record declaring it.
 *
 * Keys and records live in the file's RecordContext; the index never owns
 * either.
 */
class XrefIndex
{
public:
  XrefIndex() = default;

  /**
   * Register the record under its pointer-id.
   *
   * @return false if the id is already taken (the existing entry is kept)
   */
  bool define(Record * rec)
  {
    auto [it, inserted] = records_.emplace(rec->id(), rec);
    return inserted;
  }

  /// Record declaring `id`, or nullptr
  [[nodiscard]] Record * lookup(std::string_view id) const
  {
    auto it = records_.find(id);
    return it != records_.end() ? it->second : nullptr;
  }

  /// Typed lookup: nullptr when the id is unknown or names another kind
  template <typename T>
  [[nodiscard]] const T * lookup_as(std::string_view id) const
  {
    return dyn_cast<T>(static_cast<const Record *>(lookup(id)));
  }

  [[nodiscard]] bool contains(std::string_view id) const { return lookup(id) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return records_.size(); }

private:
  std::unordered_map<std::string_view, Record *, XrefHash, XrefEqual> records_;
};

}  // namespace gedcom
