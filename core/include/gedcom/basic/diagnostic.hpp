// gedcom/basic/diagnostic.hpp - Diagnostic types for scanning and tree building
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gedcom/basic/source_manager.hpp"

namespace gedcom
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_code
{
// Malformed lines
inline constexpr const char * k_bad_level = "E001";
inline constexpr const char * k_bad_tag = "E002";
inline constexpr const char * k_bad_pointer = "E003";
// Structural errors
inline constexpr const char * k_level_skip = "E010";
inline constexpr const char * k_orphan_continuation = "E011";
inline constexpr const char * k_continuation_children = "E012";
// Cross references
inline constexpr const char * k_duplicate_pointer = "E020";
// Warnings
inline constexpr const char * k_unsupported_charset = "W101";
}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle {
  Primary,    // the offending line
  Secondary,  // related location, e.g. an earlier declaration
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "E010"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds the finished diagnostic to its bag when it goes
 * out of scope.
 *
 * @code
 *   diags.report_error(line.range, "level skips from 1 to 3", "this line")
 *     .with_code(diag_code::k_level_skip)
 *     .with_help("a record may only be one level deeper than its parent");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;

  /// First diagnostic carrying the given code, or nullptr
  [[nodiscard]] const Diagnostic * find_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace gedcom
