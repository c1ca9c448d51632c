// gedcom/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-call parse that keeps the source, diagnostics and file together
// so tests can inspect whichever they need.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/basic/source_manager.hpp"
#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/syntax/frontend.hpp"

namespace gedcom::test_support
{

struct TestParseUnit
{
  SourceManager source;
  DiagnosticBag diags;
  std::unique_ptr<GedcomFile> file;

  [[nodiscard]] bool ok() const noexcept { return file != nullptr; }

  /// Code of the first error, or empty
  [[nodiscard]] std::string first_error_code() const
  {
    const auto errors = diags.errors();
    return errors.empty() ? std::string() : errors.front().code;
  }

  [[nodiscard]] LineColumn error_position() const
  {
    const auto errors = diags.errors();
    if (errors.empty()) return {};
    return source.get_line_column(errors.front().primary_range().get_begin().get_offset());
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_source_slice(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const TagRegistry & registry = TagRegistry::default_registry())
{
  TestParseUnit out;
  out.source = SourceManager(std::move(src));
  out.file = parse_source(out.source, out.diags, registry);
  return out;
}

/// Parse, serialize and parse again
[[nodiscard]] inline std::unique_ptr<GedcomFile> reparse(
  const GedcomFile & file, const WriterOptions & options = {})
{
  return parse_text(file.serialize(options));
}

}  // namespace gedcom::test_support
