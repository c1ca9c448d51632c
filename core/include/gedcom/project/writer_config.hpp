// gedcom/project/writer_config.hpp - Writer configuration (gedcom.yaml)
//
// Parses and validates gedcom.yaml, which controls how files are written
// back out by the serializer and the `gedc fmt` command.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/writer/serializer.hpp"

namespace gedcom
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete writer configuration (gedcom.yaml).
 *
 * @code{.yaml}
 * writer:
 *   max_value_length: 248
 *   line_ending: lf        # lf | crlf
 *   ensure_header: false
 * header:
 *   source: gedcom-core
 *   charset: UTF-8
 * @endcode
 */
struct WriterConfig
{
  WriterOptions writer;
  bool ensure_header = false;
  HeaderOptions header;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  WriterConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(WriterConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a writer configuration from a gedcom.yaml file. Never throws.
 */
[[nodiscard]] ConfigLoadResult load_writer_config(const std::filesystem::path & config_path);

/**
 * Parse a writer configuration from YAML text. Never throws.
 */
[[nodiscard]] ConfigLoadResult parse_writer_config(std::string_view yaml_text);

/**
 * Find gedcom.yaml by searching upward from start_dir to the filesystem
 * root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_writer_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_writer_config_file_name = "gedcom.yaml";

}  // namespace gedcom
