// gedcom/syntax/line_scanner.cpp - Line scanner implementation
#include "gedcom/syntax/line_scanner.hpp"

#include <string>
#include <utility>

namespace gedcom::syntax
{
namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_space(char c) { return c == ' ' || c == '\t'; }

bool is_tag_char(char c) { return (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_'; }

bool is_pointer_char(char c)
{
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || is_digit(c) || c == '_' || c == '-';
}

}  // namespace

std::optional<std::vector<Line>> LineScanner::scan_all()
{
  std::vector<Line> lines;

  uint32_t begin = 0;
  if (src_.substr(0, k_utf8_bom.size()) == k_utf8_bom) {
    begin = static_cast<uint32_t>(k_utf8_bom.size());
  }

  const auto size = static_cast<uint32_t>(src_.size());
  while (begin < size) {
    const size_t nl = src_.find('\n', begin);
    const uint32_t next = nl == std::string_view::npos ? size : static_cast<uint32_t>(nl);

    uint32_t end = next;
    while (end > begin && src_[end - 1] == '\r') {
      --end;
    }

    if (!scan_line(begin, end, lines)) {
      return std::nullopt;
    }
    begin = next + 1;
  }

  return lines;
}

bool LineScanner::scan_line(uint32_t begin, uint32_t end, std::vector<Line> & out)
{
  line_begin_ = begin;
  line_end_ = end;
  pos_ = begin;

  skip_spaces();
  if (at_end()) {
    return true;  // blank line
  }
  line_begin_ = pos_;

  Line line;

  if (!scan_level(line.level)) {
    return false;
  }

  if (peek() == '@' && !scan_pointer(line.pointer)) {
    return false;
  }

  if (!scan_tag(line.tag)) {
    return false;
  }

  if (!at_end()) {
    // scan_tag guarantees a single space here
    advance();
    line.value = src_.substr(pos_, line_end_ - pos_);
  }

  line.range = line_range();
  out.push_back(line);
  return true;
}

uint32_t LineScanner::skip_spaces() noexcept
{
  uint32_t n = 0;
  while (!at_end() && is_space(peek())) {
    advance();
    ++n;
  }
  return n;
}

bool LineScanner::scan_level(uint32_t & level)
{
  const uint32_t start = pos_;
  while (!at_end() && is_digit(peek())) {
    advance();
  }
  const uint32_t digits = pos_ - start;

  if (digits == 0) {
    report_malformed(
      diag_code::k_bad_level, "line does not start with a level number", "expected a level here");
    return false;
  }
  if (digits > 2) {
    report_malformed(
      diag_code::k_bad_level,
      "level number '" + std::string(src_.substr(start, digits)) + "' is out of range",
      "levels are 0 to 99");
    return false;
  }

  level = 0;
  for (uint32_t i = start; i < pos_; ++i) {
    level = level * 10 + static_cast<uint32_t>(src_[i] - '0');
  }

  if (at_end()) {
    report_malformed(diag_code::k_bad_tag, "line has a level but no tag", "expected a tag");
    return false;
  }
  if (skip_spaces() == 0) {
    report_malformed(
      diag_code::k_bad_level, "level number must be followed by a space",
      "expected a space after the level");
    return false;
  }
  return true;
}

bool LineScanner::scan_pointer(std::string_view & pointer)
{
  const uint32_t start = pos_;
  advance();  // '@'
  while (!at_end() && is_pointer_char(peek())) {
    advance();
  }

  const bool closed = peek() == '@' && pos_ > start + 1;
  if (closed) {
    advance();
  }
  if (!closed || (!at_end() && !is_space(peek()))) {
    while (!at_end() && !is_space(peek())) {
      advance();
    }
    report_malformed(
      diag_code::k_bad_pointer,
      "invalid pointer-id '" + std::string(src_.substr(start, pos_ - start)) + "'",
      "expected '@' followed by letters, digits, '_' or '-' and a closing '@'");
    return false;
  }

  pointer = src_.substr(start, pos_ - start);

  if (skip_spaces() == 0 || at_end()) {
    report_malformed(diag_code::k_bad_tag, "pointer-id is not followed by a tag", "expected a tag");
    return false;
  }
  return true;
}

bool LineScanner::scan_tag(std::string_view & tag)
{
  const uint32_t start = pos_;
  while (!at_end() && is_tag_char(peek())) {
    advance();
  }

  if (pos_ == start || (!at_end() && peek() != ' ')) {
    while (!at_end() && !is_space(peek())) {
      advance();
    }
    report_malformed(
      diag_code::k_bad_tag, "invalid tag '" + std::string(src_.substr(start, pos_ - start)) + "'",
      "tags are made of uppercase letters, digits and '_'");
    return false;
  }

  tag = src_.substr(start, pos_ - start);
  return true;
}

void LineScanner::report_malformed(const char * code, std::string message, std::string label)
{
  diags_.report_error(line_range(), std::move(message), std::move(label)).with_code(code);
}

}  // namespace gedcom::syntax
