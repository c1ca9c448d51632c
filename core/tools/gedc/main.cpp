// gedc - GEDCOM command line tool
//
// Usage:
//   gedc check <file.ged>
//   gedc fmt <file.ged> [-o output] [--config gedcom.yaml]
//   gedc dump <file.ged>
//   gedc people <file.ged>
//
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>

#include "gedcom/basic/diagnostic_printer.hpp"
#include "gedcom/project/writer_config.hpp"
#include "gedcom/record/gedcom_file.hpp"
#include "gedcom/syntax/frontend.hpp"
#include "gedcom/writer/json_writer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "GEDCOM tool v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <file.ged> [options]\n\n"
            << "Commands:\n"
            << "  check <file.ged>         Parse and report problems\n"
            << "  fmt <file.ged>           Re-serialize the file\n"
            << "  dump <file.ged>          Print the record tree as JSON\n"
            << "  people <file.ged>        List individuals with birth and death dates\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (default: stdout)\n"
            << "  --config <path>          Writer configuration (default: nearest gedcom.yaml)\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Loading
// ============================================================================

/// Read and parse the input file, printing diagnostics to stderr.
std::unique_ptr<gedcom::GedcomFile> load_file(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: gedc " << args.command << " <file.ged>\n";
    return nullptr;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return nullptr;
  }

  if (args.verbose) {
    std::cerr << "Reading: " << input_path.string() << "\n";
  }

  gedcom::SourceManager source;
  std::string read_error;
  if (!gedcom::load_source_file(input_path, source, read_error)) {
    std::cerr << "error: " << read_error << "\n";
    return nullptr;
  }

  gedcom::DiagnosticBag diags;
  auto file = gedcom::parse_source(source, diags);

  if (!diags.empty()) {
    const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
    gedcom::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(diags, source);
  }

  if (file && args.verbose) {
    std::cerr << "Parsed " << file->roots().size() << " top-level records\n";
  }
  return file;
}

/// Write `text` to -o or stdout.
int emit(const CommandArgs & args, const std::string & text)
{
  if (args.output_path.empty()) {
    std::cout << text;
    return 0;
  }

  std::ofstream out(args.output_path, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return 1;
  }
  out << text;
  if (args.verbose) {
    std::cerr << "Wrote " << args.output_path << "\n";
  }
  return 0;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const auto file = load_file(args);
  if (!file) {
    return 1;
  }
  std::cout << args.input_file << ": OK\n";
  return 0;
}

int cmd_fmt(const CommandArgs & args)
{
  gedcom::WriterConfig config;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else if (!args.input_file.empty()) {
    config_path = gedcom::find_writer_config(fs::absolute(args.input_file).parent_path());
  }

  if (config_path) {
    const auto config_result = gedcom::load_writer_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }
    config = config_result.config;
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  const auto file = load_file(args);
  if (!file) {
    return 1;
  }

  if (config.ensure_header) {
    file->ensure_header_trailer(config.header);
  }
  return emit(args, file->serialize(config.writer));
}

int cmd_dump(const CommandArgs & args)
{
  const auto file = load_file(args);
  if (!file) {
    return 1;
  }
  return emit(args, gedcom::to_json(*file).dump(2) + "\n");
}

int cmd_people(const CommandArgs & args)
{
  const auto file = load_file(args);
  if (!file) {
    return 1;
  }

  std::string out;
  for (const gedcom::Individual * person : file->individuals()) {
    std::string name = "?";
    if (const auto n = person->name()) {
      const std::string_view given = n->given.value_or("");
      const std::string_view surname = n->surname.value_or("");
      name = fmt::format("{}{}{}", given, given.empty() || surname.empty() ? "" : " ", surname);
      if (name.empty()) {
        name = "?";
      }
    }

    std::string born = "?";
    if (const auto birth = person->birth()) {
      born = std::string((*birth)->date().value_or("?"));
    }
    std::string died = "?";
    if (const auto death = person->death()) {
      died = std::string((*death)->date().value_or("?"));
    }

    out += fmt::format("{}\t{}\t{}\t{}\n", person->id(), name, born, died);
  }
  return emit(args, out);
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }
    if (args.command == "fmt") {
      return cmd_fmt(args);
    }
    if (args.command == "dump") {
      return cmd_dump(args);
    }
    if (args.command == "people") {
      return cmd_people(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
