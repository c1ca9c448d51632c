// gedcom/writer/serializer.cpp - GEDCOM text output with CONT/CONC wrapping
#include "gedcom/writer/serializer.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/record/record.hpp"
#include "gedcom/syntax/line_scanner.hpp"

namespace gedcom
{
namespace
{

bool is_utf8_continuation_byte(char c) { return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U; }

void append_line(
  std::string & out, uint32_t level, std::string_view pointer, std::string_view tag,
  std::string_view value, const WriterOptions & options)
{
  out += std::to_string(level);
  if (!pointer.empty()) {
    out += ' ';
    out += pointer;
  }
  out += ' ';
  out += tag;
  if (!value.empty()) {
    out += ' ';
    out += value;
  }
  out += to_string(options.line_ending);
}

}  // namespace

std::vector<std::string_view> split_utf8_chunks(std::string_view segment, size_t max_bytes)
{
  max_bytes = std::max(max_bytes, k_min_value_length);

  std::vector<std::string_view> chunks;
  if (segment.empty()) {
    chunks.emplace_back();
    return chunks;
  }

  while (!segment.empty()) {
    size_t cut = std::min(max_bytes, segment.size());
    if (cut < segment.size()) {
      // back up to the lead byte of the sequence straddling the limit
      while (cut > 0 && is_utf8_continuation_byte(segment[cut])) {
        --cut;
      }
      if (cut == 0) {
        cut = std::min(max_bytes, segment.size());  // not UTF-8, cut anywhere
      }
      // a '\r' at the end of a line is read back as part of the terminator
      size_t kept = cut;
      while (kept > 0 && segment[kept - 1] == '\r') {
        --kept;
      }
      if (kept > 0) {
        cut = kept;
      }
    }
    chunks.push_back(segment.substr(0, cut));
    segment.remove_prefix(cut);
  }
  return chunks;
}

void serialize_record(
  const Record & rec, uint32_t level, const WriterOptions & options, std::string & out)
{
  if (level >= syntax::k_max_level) {
    if (level > syntax::k_max_level || rec.value.find('\n') != std::string_view::npos) {
      throw SerializeError(fmt::format(
        "cannot write {} at level {}: continuation lines would exceed level {}", rec.tag, level,
        syntax::k_max_level));
    }
    if (!rec.children().empty()) {
      throw SerializeError(fmt::format(
        "cannot write children of {} at level {}", rec.tag, syntax::k_max_level));
    }
    append_line(out, level, rec.pointer, rec.tag, rec.value, options);
    return;
  }

  std::string_view rest = rec.value;
  bool first_segment = true;

  // One segment per '\n': the first stays on the record line, the others
  // become CONT lines. Each segment may spill onto CONC lines.
  while (true) {
    const size_t nl = rest.find('\n');
    const std::string_view segment = rest.substr(0, nl);

    const auto chunks = split_utf8_chunks(segment, options.max_value_length);
    if (first_segment) {
      append_line(out, level, rec.pointer, rec.tag, chunks.front(), options);
    } else {
      append_line(out, level + 1, {}, "CONT", chunks.front(), options);
    }
    for (size_t i = 1; i < chunks.size(); ++i) {
      append_line(out, level + 1, {}, "CONC", chunks[i], options);
    }

    first_segment = false;
    if (nl == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(nl + 1);
  }

  for (const Record * child : rec.children()) {
    serialize_record(*child, level + 1, options, out);
  }
}

std::string serialize(const GedcomFile & file, const WriterOptions & options)
{
  std::string out;
  for (const Record * root : file.roots()) {
    serialize_record(*root, 0, options, out);
  }
  return out;
}

}  // namespace gedcom
