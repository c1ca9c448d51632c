// gedcom/project/writer_config.cpp - Writer configuration implementation
//
#include "gedcom/project/writer_config.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <utility>

namespace gedcom
{

namespace
{

/// Fill `config` from a parsed document. yaml-cpp conversion errors
/// propagate as YAML::Exception.
ConfigLoadResult read_config(const YAML::Node & root, WriterConfig config)
{
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  // 'writer' section
  if (const auto writer = root["writer"]) {
    if (!writer.IsMap()) {
      return ConfigLoadResult::fail("writer must be a map");
    }

    if (writer["max_value_length"]) {
      const auto length = writer["max_value_length"].as<long long>();
      if (length < static_cast<long long>(k_min_value_length)) {
        return ConfigLoadResult::fail(
          "invalid writer.max_value_length: " + std::to_string(length) + " (must be at least " +
          std::to_string(k_min_value_length) + ")");
      }
      config.writer.max_value_length = static_cast<size_t>(length);
    }

    if (writer["line_ending"]) {
      const auto ending = writer["line_ending"].as<std::string>();
      if (ending == "lf") {
        config.writer.line_ending = LineEnding::Lf;
      } else if (ending == "crlf") {
        config.writer.line_ending = LineEnding::CrLf;
      } else {
        return ConfigLoadResult::fail(
          "invalid writer.line_ending: '" + ending + "' (must be 'lf' or 'crlf')");
      }
    }

    if (writer["ensure_header"]) {
      config.ensure_header = writer["ensure_header"].as<bool>();
    }
  }

  // 'header' section
  if (const auto header = root["header"]) {
    if (!header.IsMap()) {
      return ConfigLoadResult::fail("header must be a map");
    }
    if (header["source"]) {
      config.header.source = header["source"].as<std::string>();
    }
    if (header["charset"]) {
      config.header.charset = header["charset"].as<std::string>();
    }
    if (config.header.source.empty() || config.header.charset.empty()) {
      return ConfigLoadResult::fail("header.source and header.charset must not be empty");
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_writer_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return read_config(root, WriterConfig{});
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(
      "failed to load " + config_path.string() + ": " + std::string(e.what()));
  }
}

ConfigLoadResult parse_writer_config(std::string_view yaml_text)
{
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_text));
    return read_config(root, WriterConfig{});
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_writer_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_writer_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace gedcom
