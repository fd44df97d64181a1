// codetrace - Execution tracer Command Line Interface
//
// Usage:
//   codetrace instrument <file> [-o output]
//   codetrace run <file> [-o result.json] [--seed N] [--regen-seed]
//   codetrace normalize [file|-] [-o result.json]
//   codetrace batch <dir> <file>... [-o outdir]
//   codetrace seed <result.json>
//   codetrace languages
//
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "codetrace/basic/diagnostic_printer.hpp"
#include "codetrace/driver/pipeline.hpp"
#include "codetrace/instrument/language_registry.hpp"
#include "codetrace/project/project_config.hpp"
#include "codetrace/seed/seed_generator.hpp"
#include "codetrace/trace/decoder.hpp"
#include "codetrace/trace/record_json.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "codetrace v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  instrument <file>          Write the instrumented source\n"
            << "  run <file>                 Instrument, run and normalize a file\n"
            << "  normalize [file|-]         Decode raw trace output into JSON\n"
            << "  batch <dir> <file>...      Run several files of one directory\n"
            << "  seed <result.json>         Print the seed derived from a result's metadata\n"
            << "  languages                  List supported file extensions\n\n"
            << "Options:\n"
            << "  -o, --output <path>        Output file (or directory for batch)\n"
            << "  --seed <digits>            Use a 19-20 digit seed instead of deriving one\n"
            << "  --regen-seed               Derive a fresh seed even if a previous result exists\n"
            << "  --config <path>            Use this codetrace.yaml\n"
            << "  -v, --verbose              Verbose output\n"
            << "  -h, --help                 Show this help message\n";
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

void print_diagnostics(
  const codetrace::DiagnosticBag & diagnostics, const codetrace::SourceFile * source)
{
  if (diagnostics.empty()) {
    return;
  }
  codetrace::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print_all(diagnostics, source);
}

void print_stage_error(const codetrace::StageError & error)
{
  codetrace::Diagnostic diag;
  diag.severity = codetrace::Severity::Error;
  diag.code = std::string(codetrace::to_string(error.stage));
  diag.message = error.message;

  codetrace::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print(diag);
}

bool emit_json(const std::string & text, const std::string & output_path)
{
  if (output_path.empty()) {
    std::cout << text << "\n";
    return true;
  }
  if (!codetrace::write_file(output_path, text + "\n")) {
    std::cerr << "error: failed to open output file: " << output_path << "\n";
    return false;
  }
  return true;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string output_path;
  std::string config_path;
  std::optional<std::string> seed;
  bool regen_seed = false;
  bool verbose = false;
  bool show_help = false;
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

  auto take_value = [&](int & i, const std::string & flag) -> std::string {
    if (i + 1 < argc) {
      return argv[++i];
    }
    args.error = "missing value for " + flag;
    return {};
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      args.output_path = take_value(i, arg);
    } else if (arg == "--config") {
      args.config_path = take_value(i, arg);
    } else if (arg == "--seed") {
      args.seed = take_value(i, arg);
    } else if (arg == "--regen-seed") {
      args.regen_seed = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-" || arg[0] != '-') {
      args.positional.push_back(arg);
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

void setup_logging(bool verbose)
{
  auto logger = spdlog::stderr_color_mt("codetrace");
  logger->set_pattern("[%l] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

/// Explicit --config, else codetrace.yaml above the working directory, else defaults
std::optional<codetrace::ProjectConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = codetrace::find_project_config(fs::current_path());
  }

  if (!config_path) {
    return codetrace::ProjectConfig::defaults();
  }

  const auto config_result = codetrace::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return std::nullopt;
  }
  spdlog::debug("using configuration {}", config_path->string());
  return config_result.config;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_instrument(const CommandArgs & args, const codetrace::Pipeline & pipeline)
{
  if (args.positional.size() != 1) {
    std::cerr << "usage: codetrace instrument <file> [-o output]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.positional.front());
  const codetrace::InstrumentResult result = pipeline.instrument_file(input_path);
  print_diagnostics(result.diagnostics, &result.source);

  if (!result.success) {
    print_stage_error(*result.error);
    return 1;
  }

  const fs::path output_path = args.output_path.empty()
                                 ? input_path.parent_path() /
                                     ("instrumented_" + input_path.filename().string())
                                 : fs::path(args.output_path);
  if (!codetrace::write_file(output_path, result.text)) {
    std::cerr << "error: failed to open output file: " << output_path.string() << "\n";
    return 1;
  }

  std::cerr << "Instrumented: " << output_path.string() << "\n";
  return 0;
}

int cmd_run(const CommandArgs & args, const codetrace::Pipeline & pipeline)
{
  if (args.positional.size() != 1) {
    std::cerr << "usage: codetrace run <file> [-o result.json] [--seed N] [--regen-seed]\n";
    return 1;
  }

  codetrace::SeedOptions seed;
  if (args.seed && *args.seed != "-1") {
    seed.mode = codetrace::SeedMode::Explicit;
    seed.value = *args.seed;
  } else if (args.seed || args.regen_seed || !pipeline.config().seed.reuse_previous) {
    seed.mode = codetrace::SeedMode::Derive;
  } else {
    seed.mode = codetrace::SeedMode::ReusePrevious;
    seed.previous_result = args.output_path;
  }

  const codetrace::TraceResult result =
    pipeline.process_file(fs::absolute(args.positional.front()), seed);
  print_diagnostics(result.diagnostics, &result.source);
  if (result.error) {
    print_stage_error(*result.error);
  }

  const int indent = pipeline.config().output.indent;
  const std::string text = result.to_json().dump(
    indent > 0 ? indent : -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  if (!emit_json(text, args.output_path)) {
    return 1;
  }
  return result.success ? 0 : 1;
}

int cmd_normalize(const CommandArgs & args, const codetrace::ProjectConfig & config)
{
  std::string raw;
  if (args.positional.empty() || args.positional.front() == "-") {
    raw.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else if (!codetrace::read_file(args.positional.front(), raw)) {
    std::cerr << "error: file not found: " << args.positional.front() << "\n";
    return 1;
  }

  const codetrace::DecodeResult decoded = codetrace::decode_trace(raw);
  print_diagnostics(decoded.diagnostics, nullptr);

  const int indent = config.output.indent;
  const std::string text = codetrace::to_json(decoded).dump(
    indent > 0 ? indent : -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  return emit_json(text, args.output_path) ? 0 : 1;
}

int cmd_batch(const CommandArgs & args, const codetrace::Pipeline & pipeline)
{
  if (args.positional.size() < 2) {
    std::cerr << "usage: codetrace batch <dir> <file>... [-o outdir]\n";
    return 1;
  }

  const fs::path directory = args.positional.front();
  const std::vector<std::string> files(args.positional.begin() + 1, args.positional.end());

  fs::path output_dir = args.output_path;
  if (output_dir.empty()) {
    output_dir = pipeline.config().output.directory.empty() ? fs::path("traces")
                                                            : pipeline.config().output.directory;
  }

  const codetrace::BatchResult batch = pipeline.process_batch(directory, files, output_dir);

  for (const auto & entry : batch.succeeded) {
    std::cout << "ok      " << entry.file_name << " -> " << entry.output_path.string() << "\n";
  }
  for (const auto & entry : batch.failed) {
    std::cout << "failed  " << entry.file_name << " ["
              << codetrace::to_string(entry.result.error->stage) << "] "
              << entry.result.error->message << "\n";
  }

  switch (batch.status) {
    case codetrace::BatchStatus::AllSucceeded:
      std::cerr << "All " << batch.succeeded.size() << " file(s) traced\n";
      return 0;
    case codetrace::BatchStatus::PartialSuccess:
      std::cerr << batch.succeeded.size() << " succeeded, " << batch.failed.size()
                << " failed\n";
      return 0;
    case codetrace::BatchStatus::Failed:
      break;
  }
  std::cerr << "error: no file was traced\n";
  return 1;
}

int cmd_seed(const CommandArgs & args)
{
  if (args.positional.size() != 1) {
    std::cerr << "usage: codetrace seed <result.json>\n";
    return 1;
  }

  const auto metadata = codetrace::read_result_metadata(args.positional.front());
  if (!metadata) {
    std::cerr << "error: no metadata in " << args.positional.front() << "\n";
    return 1;
  }

  std::cout << codetrace::derive_seed(*metadata) << "\n";
  return 0;
}

int cmd_languages(const codetrace::LanguageRegistry & registry)
{
  for (const auto * backend : registry.backends()) {
    std::cout << backend->name() << " (" << backend->display_name() << "):";
    for (const auto & ext : backend->extensions()) {
      std::cout << " " << ext;
    }
    std::cout << "\n";
  }
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

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  setup_logging(args.verbose);

  const auto config = load_config(args);
  if (!config) {
    return 1;
  }

  const codetrace::LanguageRegistry registry = codetrace::LanguageRegistry::with_builtin_backends();
  const codetrace::Pipeline pipeline(registry, *config);

  if (args.command == "instrument") {
    return cmd_instrument(args, pipeline);
  }

  if (args.command == "run") {
    return cmd_run(args, pipeline);
  }

  if (args.command == "normalize") {
    return cmd_normalize(args, *config);
  }

  if (args.command == "batch") {
    return cmd_batch(args, pipeline);
  }

  if (args.command == "seed") {
    return cmd_seed(args);
  }

  if (args.command == "languages") {
    return cmd_languages(registry);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
