// gedcom/basic/source_manager.hpp - Source locations, ranges and the text owner
//
// Records and diagnostics refer to the input by byte offset; SourceManager
// turns offsets back into 1-based line/column pairs for printing.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gedcom
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into the source text. Line and column are computed on
 * demand through SourceManager.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Half-open [start, end) byte range
// ============================================================================

class SourceRange
{
public:
  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  /// Size in bytes (0 for an invalid range)
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * A source range with its line/column endpoints already resolved.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager - Owner of one input text
// ============================================================================

/**
 * Owns the text of one GEDCOM input (and optionally the path it was read
 * from) and converts byte offsets to line/column positions.
 *
 * Records produced from this text do not reference it: every string they
 * hold is interned into the record arena, so a GedcomFile outlives the
 * SourceManager it was parsed from.
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  // ===========================================================================
  // File Path Accessors
  // ===========================================================================

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }
  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  /// Name used in diagnostics ("<input>" when the text did not come from a file)
  [[nodiscard]] std::string get_display_name() const;

  // ===========================================================================
  // Source Content Accessors
  // ===========================================================================

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  // ===========================================================================
  // Location Conversion
  // ===========================================================================

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a physical line (0-indexed), without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

/**
 * Read a file into a SourceManager.
 *
 * @return false (with `error` filled in) if the file cannot be read
 */
[[nodiscard]] bool load_source_file(
  const std::filesystem::path & path, SourceManager & out, std::string & error);

}  // namespace gedcom
