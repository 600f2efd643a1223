// wbcalc - Workbook calculation analyzer command line interface
//
// Usage:
//   wbcalc deps   <workbook.twb|workbook.json> [--json] [--include-source-fields] [--max-trees N]
//   wbcalc scopes <workbook.twb|workbook.json> [--json] [--no-usage]
//   wbcalc tree   <workbook.twb|workbook.json> [--max-trees N] [--collapse-shared]
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <nlohmann/json.hpp>

#include "wbcalc/basic/diagnostic_printer.hpp"
#include "wbcalc/driver/analyzer.hpp"
#include "wbcalc/loader/workbook_loader.hpp"
#include "wbcalc/project/analysis_config.hpp"
#include "wbcalc/report/json_report.hpp"
#include "wbcalc/report/text_report.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Workbook calculation analyzer v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <workbook> [options]\n\n"
            << "Commands:\n"
            << "  deps <workbook>           Dependency graph, depths and cycles\n"
            << "  scopes <workbook>         Scoped aggregations ({FIXED|INCLUDE|EXCLUDE ...})\n"
            << "  tree <workbook>           Dependency tree only\n\n"
            << "Workbook: .twb (XML) or .json\n\n"
            << "Options:\n"
            << "  --json                    Print the report as JSON\n"
            << "  --include-source-fields   List every source-field dependency\n"
            << "  --max-trees <n>           Number of leaf trees to draw (0 = all)\n"
            << "  --collapse-shared         Draw each shared subtree once\n"
            << "  --no-usage                Omit usage context of scoped aggregations\n"
            << "  --config <path>           Configuration file (default: search for "
            << wbcalc::k_config_file_name << ")\n"
            << "  -v, --verbose             Verbose output\n"
            << "  -h, --help                Show this help message\n";
}

void print_diagnostics(const wbcalc::DiagnosticBag & diagnostics, const std::string & document)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  wbcalc::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, document);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_path;
  std::optional<size_t> max_trees;
  bool json = false;
  bool include_source_fields = false;
  bool collapse_shared = false;
  bool no_usage = false;
  bool verbose = false;
  bool show_help = false;

  /// Set when the command line is malformed.
  std::string error;
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
    const std::string arg = argv[i];

    if (arg == "--json") {
      args.json = true;
    } else if (arg == "--include-source-fields") {
      args.include_source_fields = true;
    } else if (arg == "--collapse-shared") {
      args.collapse_shared = true;
    } else if (arg == "--no-usage") {
      args.no_usage = true;
    } else if (arg == "--max-trees") {
      if (i + 1 >= argc) {
        args.error = "--max-trees requires a value";
        return args;
      }
      const std::string value = argv[++i];
      try {
        size_t consumed = 0;
        const unsigned long n = std::stoul(value, &consumed);
        if (consumed != value.size() || value[0] == '-') {
          throw std::invalid_argument(value);
        }
        args.max_trees = static_cast<size_t>(n);
      } catch (const std::logic_error &) {
        args.error = "invalid value for --max-trees: '" + value + "'";
        return args;
      }
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "--config requires a path";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unknown option: " + arg;
      return args;
    }
  }

  return args;
}

// ============================================================================
// Shared steps
// ============================================================================

/// Config file (explicit or found upward) overridden by command line flags.
std::optional<wbcalc::AnalysisOptions> resolve_options(const CommandArgs & args)
{
  wbcalc::AnalysisOptions options;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    config_path = wbcalc::find_analysis_config(fs::current_path());
  }

  if (config_path) {
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
    const auto config_result = wbcalc::load_analysis_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error[" << wbcalc::diag_code::k_config_failure << "]: " << config_result.error
                << "\n";
      return std::nullopt;
    }
    options = config_result.options;
  }

  if (args.include_source_fields) options.include_source_fields = true;
  if (args.collapse_shared) options.tree.collapse_shared_subtrees = true;
  if (args.no_usage) options.include_usage_context = false;
  if (args.max_trees) options.tree.max_leaf_trees = *args.max_trees;

  return options;
}

std::optional<wbcalc::Workbook> load_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: workbook file required\n";
    std::cerr << "usage: wbcalc " << args.command << " <workbook.twb|workbook.json>\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Loading: " << fs::absolute(args.input_file).string() << "\n";
  }

  auto result = wbcalc::load_workbook_file(args.input_file);
  if (!result.success) {
    std::cerr << "error[" << wbcalc::diag_code::k_load_failure << "]: " << result.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Loaded " << result.workbook.datasources.size() << " datasource(s)\n";
  }
  return std::move(result.workbook);
}

void emit_json(nlohmann::json out, const wbcalc::DiagnosticBag & diagnostics)
{
  if (!diagnostics.empty()) {
    out["diagnostics"] = wbcalc::to_json(diagnostics);
  }
  std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int cmd_deps(const CommandArgs & args, bool tree_only)
{
  const auto options = resolve_options(args);
  if (!options) return 1;

  const auto workbook = load_input(args);
  if (!workbook) return 1;

  const auto result = wbcalc::Analyzer::analyze_dependencies(*workbook, *options);

  if (args.verbose) {
    std::cerr << "Analyzed " << result.report.summary.total_calculations
              << " calculation(s), max depth " << result.report.summary.max_dependency_depth
              << "\n";
  }

  if (args.json && !tree_only) {
    emit_json(wbcalc::to_json(result.report), result.diagnostics);
    return 0;
  }

  print_diagnostics(result.diagnostics, args.input_file);

  if (tree_only) {
    std::cout << (result.report.message ? *result.report.message : result.report.dependency_tree)
              << "\n";
  } else {
    wbcalc::write_text(std::cout, result.report);
  }
  return 0;
}

int cmd_scopes(const CommandArgs & args)
{
  const auto options = resolve_options(args);
  if (!options) return 1;

  const auto workbook = load_input(args);
  if (!workbook) return 1;

  const auto result = wbcalc::Analyzer::analyze_scopes(*workbook, *options);

  if (args.verbose) {
    std::cerr << "Found " << result.report.summary.total_expressions
              << " scoped aggregation(s)\n";
  }

  if (args.json) {
    emit_json(wbcalc::to_json(result.report), result.diagnostics);
    return 0;
  }

  print_diagnostics(result.diagnostics, args.input_file);
  wbcalc::write_text(std::cout, result.report);
  return 0;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "deps") {
    return cmd_deps(args, false);
  }
  if (args.command == "tree") {
    return cmd_deps(args, true);
  }
  if (args.command == "scopes") {
    return cmd_scopes(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
