// gedcom/writer/serializer.hpp - Record forest back to GEDCOM text
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gedcom
{

class Record;
class GedcomFile;

enum class LineEnding : uint8_t {
  Lf,
  CrLf,
};

[[nodiscard]] constexpr std::string_view to_string(LineEnding ending) noexcept
{
  return ending == LineEnding::CrLf ? "\r\n" : "\n";
}

/// Longest value a line may carry before the rest moves to CONC lines
inline constexpr size_t k_default_max_value_length = 248;
/// Wrapping narrower than this cannot keep a 4-byte UTF-8 sequence whole
inline constexpr size_t k_min_value_length = 8;

/// Thrown when a record cannot be written as lines the scanner accepts
class SerializeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct WriterOptions
{
  size_t max_value_length = k_default_max_value_length;  ///< bytes
  LineEnding line_ending = LineEnding::Lf;
};

/**
 * Split one value segment into chunks of at most `max_bytes` bytes without
 * cutting a UTF-8 sequence. A chunk other than the last never ends in '\r'
 * unless it is nothing but '\r'. An empty segment yields one empty chunk.
 */
[[nodiscard]] std::vector<std::string_view> split_utf8_chunks(
  std::string_view segment, size_t max_bytes);

/**
 * Append the lines of `rec` and its subtree to `out`, `rec` at `level`.
 *
 * Embedded newlines become CONT lines and over-long segments continue on
 * CONC lines, all at `level + 1` and ahead of the record's own children.
 * A record at syntax::k_max_level keeps its value on one line; throws
 * SerializeError if that value has a newline or the record has children.
 */
void serialize_record(
  const Record & rec, uint32_t level, const WriterOptions & options, std::string & out);

/// The whole file, every line followed by the configured terminator.
/// Throws SerializeError as serialize_record() does.
[[nodiscard]] std::string serialize(const GedcomFile & file, const WriterOptions & options = {});

}  // namespace gedcom
