// gedcom/syntax/line_scanner.hpp - Splits GEDCOM text into level-numbered lines
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/basic/source_manager.hpp"

namespace gedcom::syntax
{

/// Highest level number accepted on a line (two decimal digits)
inline constexpr uint32_t k_max_level = 99;

/**
 * One logical line: `LEVEL [POINTER] TAG [VALUE]`.
 *
 * All views point into the scanned text. An absent value is the empty view.
 */
struct Line
{
  uint32_t level = 0;
  std::string_view pointer;  ///< "@I1@" including the delimiters, or empty
  std::string_view tag;
  std::string_view value;
  SourceRange range;  ///< the line without its terminator
};

/**
 * Scanner over the whole input.
 *
 * Lines are split on '\n' with any trailing run of '\r' dropped, so LF and
 * CRLF files scan the same way and a value never ends in '\r'. A UTF-8 byte order mark at the very start is
 * skipped, as is leading indentation. Blank lines produce nothing.
 *
 * Scanning stops at the first malformed line; the diagnostic is added to
 * the bag and scan_all() returns std::nullopt.
 */
class LineScanner
{
public:
  LineScanner(std::string_view src, DiagnosticBag & diags) : src_(src), diags_(diags) {}

  [[nodiscard]] std::optional<std::vector<Line>> scan_all();

private:
  /// Scan the physical line [begin, end). Returns false on a malformed line.
  bool scan_line(uint32_t begin, uint32_t end, std::vector<Line> & out);

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= line_end_; }
  [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : src_[pos_]; }
  void advance(uint32_t n = 1) noexcept { pos_ += n; }
  uint32_t skip_spaces() noexcept;

  bool scan_level(uint32_t & level);
  bool scan_pointer(std::string_view & pointer);
  bool scan_tag(std::string_view & tag);

  void report_malformed(const char * code, std::string message, std::string label);

  [[nodiscard]] SourceRange line_range() const noexcept { return {line_begin_, line_end_}; }

  std::string_view src_;
  DiagnosticBag & diags_;
  uint32_t pos_ = 0;
  uint32_t line_begin_ = 0;
  uint32_t line_end_ = 0;
};

}  // namespace gedcom::syntax
