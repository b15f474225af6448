// ttc - ThingTalk class and manifest tool
//
// Usage:
//   ttc manifest <file.json> [--kind K]
//   ttc to-manifest <file.json> [--kind K]
//   ttc check [file.json ...] [--project]
//
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>

#include "thingtalk/ast/manifest.hpp"
#include "thingtalk/ast/prettyprint.hpp"
#include "thingtalk/basic/diagnostic_printer.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/project/project_config.hpp"
#include "thingtalk/sema/schema_retriever.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "ThingTalk class tool v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  manifest <file.json>     Print the class declared by a manifest\n"
            << "  to-manifest <file.json>  Regenerate a manifest through its class\n"
            << "  check [file.json ...]    Load manifests and report invalid classes\n\n"
            << "Options:\n"
            << "  --kind <kind>            Class kind (default: manifest \"kind\" or file name)\n"
            << "  --project                Check the manifests listed in thingtalk.yaml\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool use_color_for(thingtalk::ColorMode mode)
{
  switch (mode) {
    case thingtalk::ColorMode::Always:
      return true;
    case thingtalk::ColorMode::Never:
      return false;
    case thingtalk::ColorMode::Auto:
    default:
      return isatty(fileno(stderr)) != 0;
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> input_files;
  std::string kind;
  bool use_project = false;
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

    if (arg == "--kind") {
      if (i + 1 < argc) {
        args.kind = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-') {
      args.input_files.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_manifest(const CommandArgs & args, bool regenerate)
{
  if (args.input_files.size() != 1) {
    std::cerr << "error: exactly one manifest file required\n";
    std::cerr << "usage: ttc " << args.command << " <file.json> [--kind K]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_files.front());
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  try {
    auto klass = thingtalk::load_manifest_file(input_path, args.kind);
    if (args.verbose) {
      std::cerr << fmt::format(
        "Loaded @{}: {} queries, {} actions\n", klass->kind, klass->queries.size(),
        klass->actions.size());
    }

    if (regenerate) {
      std::cout << thingtalk::to_manifest(*klass).dump(2) << "\n";
    } else {
      std::cout << thingtalk::to_source(*klass) << "\n";
    }
    return 0;
  } catch (const thingtalk::ManifestError & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_check(const CommandArgs & args)
{
  std::vector<fs::path> manifests;
  thingtalk::ColorMode color = thingtalk::ColorMode::Auto;

  if (args.use_project || args.input_files.empty()) {
    auto config_path = thingtalk::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << thingtalk::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = thingtalk::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }
    manifests = config_result.config.manifest_files();
    color = config_result.config.checker.color;
  }
  for (const auto & file : args.input_files) {
    manifests.push_back(fs::absolute(file));
  }

  thingtalk::DiagnosticBag diags;
  thingtalk::MemorySchemaRetriever schemas;
  std::map<std::string, fs::path> seen;

  for (const auto & path : manifests) {
    if (args.verbose) {
      std::cerr << "Loading: " << path.string() << "\n";
    }
    try {
      auto klass = thingtalk::load_manifest_file(path);
      auto [it, inserted] = seen.emplace(klass->kind, path);
      if (!inserted) {
        diags.report_error({}, fmt::format("class @{} is declared twice", klass->kind))
          .with_code(thingtalk::diag_code::k_duplicate_class)
          .with_help(fmt::format("first declared in {}", it->second.string()));
        continue;
      }
      schemas.add_class(klass);
    } catch (const thingtalk::ManifestError & e) {
      diags.report_error({}, e.what())
        .with_code(thingtalk::diag_code::k_invalid_manifest)
        .with_help("in " + path.string());
    }
  }

  const bool use_color = use_color_for(color);
  thingtalk::DiagnosticPrinter printer(std::cerr, use_color);
  if (!diags.empty()) {
    printer.print_all(diags, nullptr, "project");
    printer.print_summary(diags);
  }

  if (diags.has_errors()) {
    return 1;
  }
  std::cout << fmt::format("{} classes: OK\n", schemas.kinds().size());
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "manifest") {
    return cmd_manifest(args, false);
  }

  if (args.command == "to-manifest") {
    return cmd_manifest(args, true);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
