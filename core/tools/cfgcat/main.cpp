// cfgcat - Catalog compiler command line interface
//
// Usage:
//   cfgcat compile <node>... [--config cfgcat.yaml] [--fact k=v]... [-o out.json]
//                            [--stats] [-v]
//
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "cfgcat/basic/diagnostic_printer.hpp"
#include "cfgcat/catalog/catalog_json.hpp"
#include "cfgcat/driver/catalog_compiler.hpp"
#include "cfgcat/facts/facts.hpp"
#include "cfgcat/project/preferences.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "cfgcat v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  compile <node>...        Compile the catalog of one or more nodes\n\n"
            << "Options:\n"
            << "  --config <path>          Preferences file (default: nearest cfgcat.yaml)\n"
            << "  --fact <name=value>      Set a fact for every node (repeatable)\n"
            << "  -o, --output <path>      Write the catalog JSON to a file\n"
            << "  --stats                  Print timing summaries to stderr\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostic(const cfgcat::Diagnostic & diag)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  cfgcat::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print(diag);
}

void print_stats(std::string_view title, const cfgcat::MeasurementStore & store)
{
  const auto summary = store.summary();
  if (summary.empty()) {
    return;
  }
  fmt::print(std::cerr, "{}:\n", title);
  for (const auto & [key, s] : summary) {
    fmt::print(
      std::cerr, "  {:<40} {:>5}x  total {:.6f}s  min {:.6f}s  max {:.6f}s\n", key, s.count,
      s.total, s.min, s.max);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> nodes;
  std::vector<std::string> facts;
  std::string config_path;
  std::string output_path;
  std::vector<std::string> errors;
  bool stats = false;
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
      } else {
        args.errors.push_back(arg + " requires a path");
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      } else {
        args.errors.push_back("--config requires a path");
      }
    } else if (arg == "--fact") {
      if (i + 1 < argc) {
        args.facts.emplace_back(argv[++i]);
      } else {
        args.errors.push_back("--fact requires name=value");
      }
    } else if (arg == "--stats") {
      args.stats = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.nodes.push_back(arg);
    } else {
      args.errors.push_back("unknown option '" + arg + "'");
    }
  }

  return args;
}

/// "name=value" pairs; an entry without '=' is a configuration error
cfgcat::Result<cfgcat::Facts> parse_fact_overrides(const std::vector<std::string> & entries)
{
  cfgcat::Facts facts;
  for (const auto & entry : entries) {
    const size_t eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) {
      return cfgcat::Result<cfgcat::Facts>::fail(cfgcat::Diagnostic::error(
        cfgcat::DiagnosticKind::ConfigError,
        fmt::format("invalid fact '{}': expected name=value", entry)));
    }
    facts[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  return cfgcat::Result<cfgcat::Facts>::ok(std::move(facts));
}

cfgcat::Result<cfgcat::Preferences> load_config(const CommandArgs & args)
{
  using Loaded = cfgcat::Result<cfgcat::Preferences>;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = cfgcat::find_preferences(fs::current_path());
  }

  if (!config_path) {
    // No cfgcat.yaml anywhere: conventional layout under the current directory
    return Loaded::ok(cfgcat::default_preferences(fs::current_path()));
  }

  auto loaded = cfgcat::load_preferences(*config_path);
  if (!loaded.success) {
    cfgcat::Diagnostic diag =
      cfgcat::Diagnostic::error(cfgcat::DiagnosticKind::ConfigError, loaded.error);
    diag.notes.push_back("while loading " + config_path->string());
    return Loaded::fail(std::move(diag));
  }
  return Loaded::ok(std::move(loaded.config));
}

// ============================================================================
// Commands
// ============================================================================

int cmd_compile(const CommandArgs & args)
{
  if (args.nodes.empty()) {
    std::cerr << "error: at least one node name required\n";
    std::cerr << "usage: cfgcat compile <node>... [options]\n";
    return 1;
  }

  auto prefs = load_config(args);
  if (!prefs) {
    print_diagnostic(prefs.error());
    return 1;
  }
  cfgcat::Preferences preferences = std::move(prefs).value();
  if (args.verbose && preferences.log_level > cfgcat::LogLevel::Info) {
    preferences.log_level = cfgcat::LogLevel::Info;
  }

  auto overrides = parse_fact_overrides(args.facts);
  if (!overrides) {
    print_diagnostic(overrides.error());
    return 1;
  }

  auto store = std::make_shared<cfgcat::MemoryResourceStore>();
  cfgcat::CompilerServices services;
  services.store = store;
  cfgcat::CatalogCompiler compiler(std::move(preferences), services);
  cfgcat::StoreFactProvider fact_provider(store);

  if (args.verbose) {
    std::cerr << "Manifests: " << compiler.preferences().paths.manifests.string() << "\n";
    std::cerr << "Modules:   " << compiler.preferences().paths.modules.string() << "\n";
  }

  // Every node compiles concurrently on the same compiler
  std::vector<std::future<cfgcat::Result<cfgcat::Catalog>>> pending;
  pending.reserve(args.nodes.size());
  for (const auto & node : args.nodes) {
    cfgcat::Facts facts = cfgcat::merge_facts(fact_provider.facts_for(node), overrides.value());
    pending.push_back(std::async(
      std::launch::async,
      [&compiler, node, facts = std::move(facts)]() { return compiler.compile(node, facts); }));
  }

  int exit_code = 0;
  nlohmann::json catalogs = nlohmann::json::array();
  for (size_t i = 0; i < pending.size(); ++i) {
    auto result = pending[i].get();
    if (!result) {
      cfgcat::Diagnostic diag = std::move(result).error();
      diag.notes.push_back("while compiling " + args.nodes[i]);
      print_diagnostic(diag);
      exit_code = 1;
      continue;
    }
    catalogs.push_back(cfgcat::to_json(result.value()));
  }

  const nlohmann::json output = catalogs.size() == 1 ? catalogs.front() : catalogs;
  if (!catalogs.empty()) {
    if (args.output_path.empty()) {
      std::cout << output.dump(2) << "\n";
    } else {
      std::ofstream out(args.output_path);
      if (!out.is_open()) {
        std::cerr << "error: failed to open output file: " << args.output_path << "\n";
        return 1;
      }
      out << output.dump(2) << "\n";
      if (args.verbose) {
        std::cerr << "Wrote: " << args.output_path << "\n";
      }
    }
  }

  if (args.stats) {
    print_stats("parsing", compiler.parser_stats());
    print_stats("catalogs", compiler.catalog_stats());
    print_stats("templates", compiler.template_stats());
  }

  return exit_code;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.errors.empty()) {
    for (const auto & error : args.errors) {
      std::cerr << "error: " << error << "\n";
    }
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "compile") {
    return cmd_compile(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
