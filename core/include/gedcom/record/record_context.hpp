// gedcom/record/record_context.hpp - Record arena allocator and string pool
//
// RecordContext owns every record of one GedcomFile and every string those
// records refer to. It uses std::pmr::monotonic_buffer_resource, so nothing
// is freed until the context itself is destroyed.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gedcom
{

class Record;

// ============================================================================
// RecordContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Arena owning records and interned strings.
 *
 * Records are allocated with create<T>() and must be trivially
 * destructible: they hold string_views into the pool and spans into the
 * arena, never owning containers.
 *
 * Example:
 * @code
 *   RecordContext ctx;
 *   std::string_view tag = ctx.intern("INDI");
 *   auto * indi = ctx.create<Individual>(fields);
 * @endcode
 */
class RecordContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit RecordContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~RecordContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  RecordContext(const RecordContext &) = delete;
  RecordContext & operator=(const RecordContext &) = delete;
  RecordContext(RecordContext &&) = delete;
  RecordContext & operator=(RecordContext &&) = delete;

  // ===========================================================================
  // Record Creation
  // ===========================================================================

  /**
   * Create a record of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Record, T>, "T must derive from Record");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Records must be trivially destructible to live in the arena. "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    // C++17 compatible
    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a view that stays valid for the lifetime of
   * the context. Equal strings share storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (s.empty()) {
      return {};
    }

    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array of T from the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a vector into an arena-allocated array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  /**
   * Return a new array holding `items` followed by `extra`.
   *
   * The old array stays in the arena (monotonic: never reused).
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> append(gsl::span<T> items, T extra)
  {
    auto grown = allocate_array<T>(items.size() + 1);
    std::copy(items.begin(), items.end(), grown.begin());
    grown[items.size()] = extra;
    return grown;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace gedcom
