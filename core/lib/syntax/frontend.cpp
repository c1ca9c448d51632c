// gedcom/syntax/frontend.cpp - High-level parse pipeline
#include "gedcom/syntax/frontend.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>

#include "gedcom/record/record_classifier.hpp"
#include "gedcom/syntax/continuation.hpp"
#include "gedcom/syntax/line_scanner.hpp"
#include "gedcom/syntax/tree_builder.hpp"

namespace gedcom
{
namespace
{

/// Character sets whose bytes are already valid UTF-8 text
constexpr std::array<std::string_view, 4> k_utf8_compatible_charsets = {
  "UTF-8", "UTF8", "UNICODE", "ASCII"};

std::string upper(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

bool build_index(const std::vector<Record *> & roots, XrefIndex & index, DiagnosticBag & diags)
{
  bool ok = true;
  for (Record * rec : roots) {
    if (rec->id().empty() || index.define(rec)) {
      continue;
    }
    const Record * first = index.lookup(rec->id());
    diags
      .report_error(
        rec->get_range(), fmt::format("pointer-id {} is declared more than once", rec->id()),
        "declared again here")
      .with_code(diag_code::k_duplicate_pointer)
      .with_secondary_label(first->get_range(), "first declared here");
    ok = false;
  }
  return ok;
}

void check_charset(const std::vector<Record *> & roots, DiagnosticBag & diags)
{
  if (roots.empty() || roots.front()->tag != "HEAD") {
    return;
  }
  const Record * charset = roots.front()->child("CHAR");
  if (charset == nullptr || charset->value.empty()) {
    return;
  }
  const std::string name = upper(charset->value);
  if (std::find(k_utf8_compatible_charsets.begin(), k_utf8_compatible_charsets.end(), name) !=
      k_utf8_compatible_charsets.end()) {
    return;
  }
  diags
    .report_warning(
      charset->get_range(), fmt::format("character set '{}' is not decoded", charset->value),
      "declared here")
    .with_code(diag_code::k_unsupported_charset)
    .with_help("text is read as UTF-8; convert the file to UTF-8 first");
}

}  // namespace

std::unique_ptr<GedcomFile> parse_source(
  const SourceManager & source, DiagnosticBag & diags, const TagRegistry & registry)
{
  syntax::LineScanner scanner(source.get_source(), diags);
  auto lines = scanner.scan_all();
  if (!lines) {
    return nullptr;
  }

  syntax::TreeBuilder builder(diags);
  auto forest = builder.build(*lines);
  if (!forest) {
    return nullptr;
  }

  if (!syntax::merge_continuations(*forest, diags)) {
    return nullptr;
  }

  auto ctx = std::make_unique<RecordContext>();
  RecordClassifier classifier(*ctx, registry);
  std::vector<Record *> roots = classifier.classify_forest(*forest);

  XrefIndex index;
  if (!build_index(roots, index, diags)) {
    return nullptr;
  }

  check_charset(roots, diags);

  return std::make_unique<GedcomFile>(std::move(ctx), std::move(roots), std::move(index), registry);
}

std::unique_ptr<GedcomFile> parse_text(std::string_view text, const TagRegistry & registry)
{
  const SourceManager source{std::string(text)};
  DiagnosticBag diags;
  auto file = parse_source(source, diags, registry);
  if (file) {
    return file;
  }

  std::string what = "failed to parse GEDCOM text";
  const auto errors = diags.errors();
  if (!errors.empty()) {
    const Diagnostic & first = errors.front();
    const LineColumn lc = source.get_line_column(first.primary_range().get_begin().get_offset());
    what = fmt::format("{}:{}: error[{}]: {}", lc.line, lc.column, first.code, first.message);
  }
  throw ParseError(what, std::move(diags));
}

}  // namespace gedcom
