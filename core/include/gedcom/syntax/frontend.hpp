// gedcom/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "gedcom/basic/diagnostic.hpp"
#include "gedcom/basic/source_manager.hpp"
#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/record/tag_registry.hpp"

namespace gedcom
{

/**
 * Thrown by parse_text() when the input cannot be parsed. Carries every
 * diagnostic produced on the way.
 */
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string & what, DiagnosticBag diagnostics)
  : std::runtime_error(what), diagnostics_(std::move(diagnostics))
  {
  }

  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return diagnostics_; }

private:
  DiagnosticBag diagnostics_;
};

// Parse pipeline:
// source -> line scanner -> tree builder -> continuation merger
//        -> record classifier -> cross-reference index -> GedcomFile
//
// Returns nullptr when any stage reports an error; `diags` explains why.
// Warnings (e.g. an undecoded HEAD.CHAR) do not stop the parse.
[[nodiscard]] std::unique_ptr<GedcomFile> parse_source(
  const SourceManager & source, DiagnosticBag & diags,
  const TagRegistry & registry = TagRegistry::default_registry());

/// Parse in-memory text, throwing ParseError on failure.
[[nodiscard]] std::unique_ptr<GedcomFile> parse_text(
  std::string_view text, const TagRegistry & registry = TagRegistry::default_registry());

}  // namespace gedcom
