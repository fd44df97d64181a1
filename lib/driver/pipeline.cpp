// codetrace/driver/pipeline.cpp - Pipeline driver implementation
//
#include "codetrace/driver/pipeline.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>

#include "codetrace/driver/process_runner.hpp"
#include "codetrace/seed/seed_generator.hpp"
#include "codetrace/syntax/frontend.hpp"
#include "codetrace/trace/decoder.hpp"
#include "codetrace/trace/record_json.hpp"

namespace codetrace
{

namespace
{

namespace fs = std::filesystem;

struct ArtifactPaths
{
  fs::path instrumented;
  fs::path trace;
  fs::path executable;
};

/// `prog_c` for prog.c, so sources sharing a stem keep apart
std::string output_stem(const fs::path & file)
{
  const std::string stem = file.stem().string();
  const std::string ext = file.extension().string();
  return ext.size() > 1 ? stem + "_" + ext.substr(1) : stem;
}

ArtifactPaths artifact_paths(const fs::path & file)
{
  const fs::path dir = file.parent_path();
  const std::string stem = output_stem(file);
  return {
    dir / ("instrumented_" + file.filename().string()),
    dir / (stem + "_trace.txt"),
    dir / (stem + ".out"),
  };
}

void remove_artifacts(const ArtifactPaths & paths)
{
  for (const auto & path : {paths.instrumented, paths.trace, paths.executable}) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      spdlog::debug("cannot remove {}: {}", path.string(), ec.message());
    }
  }
}

std::string trim(std::string_view text)
{
  const size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const size_t end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

/// A plain file name: no directory part, not "." or ".."
bool is_plain_file_name(std::string_view name)
{
  return !name.empty() && name != "." && name != ".." &&
         name.find_first_of("/\\") == std::string_view::npos;
}

}  // namespace

// ============================================================================
// Stage / TraceResult
// ============================================================================

std::string_view to_string(Stage stage) noexcept
{
  switch (stage) {
    case Stage::Input:
      return "input";
    case Stage::Instrument:
      return "instrument";
    case Stage::Compile:
      return "compile";
    case Stage::Runtime:
      return "runtime";
    case Stage::Normalize:
      return "normalize";
    case Stage::Validation:
      return "validation";
  }
  return "unknown";
}

TraceResult TraceResult::failed(Stage stage, std::string message)
{
  TraceResult r;
  r.success = false;
  r.error = StageError{stage, std::move(message)};
  return r;
}

nlohmann::ordered_json TraceResult::to_json() const
{
  nlohmann::ordered_json doc;
  doc["success"] = success;
  doc["metadata"] = codetrace::to_json(metadata);

  auto traces_json = nlohmann::ordered_json::array();
  for (const auto & record : traces) {
    traces_json.push_back(codetrace::to_json(record));
  }
  doc["traces"] = std::move(traces_json);

  if (seed) {
    uint64_t value = 0;
    const char * end = seed->data() + seed->size();
    const auto [ptr, ec] = std::from_chars(seed->data(), end, value);
    if (ec == std::errc() && ptr == end) {
      doc["seed"] = value;
    } else {
      doc["seed"] = *seed;
    }
  }

  if (error) {
    doc["error"] = {{"stage", std::string(codetrace::to_string(error->stage))},
                    {"message", error->message}};
  }
  return doc;
}

bool write_result(const std::filesystem::path & path, const TraceResult & result, int indent)
{
  const std::string text = result.to_json().dump(
    indent > 0 ? indent : -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  return write_file(path, text + "\n");
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(const LanguageRegistry & registry, ProjectConfig config)
: registry_(registry), config_(std::move(config))
{
}

InstrumentResult Pipeline::instrument_file(const std::filesystem::path & file) const
{
  InstrumentResult result;

  std::string text;
  std::error_code ec;
  if (!fs::is_regular_file(file, ec) || !read_file(file, text)) {
    result.error = StageError{Stage::Input, "File not found: " + file.string()};
    return result;
  }

  const LanguageBackend * backend = registry_.find_for_path(file);
  if (!backend) {
    result.error = StageError{
      Stage::Instrument, fmt::format("Unsupported extension '{}'", file.extension().string())};
    result.source = SourceFile(file, std::move(text));
    return result;
  }

  spdlog::debug("instrumenting {} as {}", file.string(), backend->display_name());

  try {
    ParsedSource parsed = parse_source(backend->language(), text, file);
    result.diagnostics.merge(std::move(parsed.diags));
    result.source = std::move(parsed.source);

    result.symbols = backend->analyze_types(text);
    result.metadata = backend->collect_metadata(text, file);
    result.text = backend->instrument(text, result.symbols, result.metadata);
  } catch (const std::exception & e) {
    spdlog::warn("instrumentation of {} failed: {}", file.string(), e.what());
    result.error = StageError{Stage::Instrument, e.what()};
    return result;
  }

  result.success = true;
  return result;
}

std::optional<std::string> Pipeline::resolve_seed(
  const SeedOptions & options, const Metadata & metadata, std::string & error) const
{
  switch (options.mode) {
    case SeedMode::Explicit:
      if (!is_valid_seed_override(options.value)) {
        error = fmt::format("Invalid seed '{}': expected 19 or 20 digits", options.value);
        return std::nullopt;
      }
      return options.value;
    case SeedMode::ReusePrevious:
      if (!options.previous_result.empty()) {
        if (auto previous = read_previous_seed(options.previous_result)) {
          spdlog::debug("reusing seed from {}", options.previous_result.string());
          return previous;
        }
      }
      break;
    case SeedMode::Derive:
      break;
  }
  return derive_seed(metadata);
}

TraceResult Pipeline::process_file(
  const std::filesystem::path & file, const SeedOptions & seed) const
{
  if (seed.mode == SeedMode::Explicit && !is_valid_seed_override(seed.value)) {
    return TraceResult::failed(
      Stage::Validation, fmt::format("Invalid seed '{}': expected 19 or 20 digits", seed.value));
  }

  InstrumentResult instrumented = instrument_file(file);
  if (!instrumented.success) {
    TraceResult result =
      TraceResult::failed(instrumented.error->stage, instrumented.error->message);
    result.diagnostics = std::move(instrumented.diagnostics);
    result.source = std::move(instrumented.source);
    return result;
  }

  TraceResult result;
  result.diagnostics = std::move(instrumented.diagnostics);
  result.source = std::move(instrumented.source);
  result.metadata = instrumented.metadata;

  std::string seed_error;
  result.seed = resolve_seed(seed, instrumented.metadata, seed_error);
  if (!result.seed) {
    result.error = StageError{Stage::Validation, seed_error};
    return result;
  }

  execute(file, instrumented, result);

  if (result.error) {
    spdlog::warn(
      "{}: {} stage failed: {}", file.string(), to_string(result.error->stage),
      result.error->message);
  } else {
    result.success = true;
    spdlog::debug("{}: {} trace records", file.string(), result.traces.size());
  }
  return result;
}

void Pipeline::execute(
  const std::filesystem::path & file, const InstrumentResult & instrumented,
  TraceResult & result) const
{
  const fs::path absolute = fs::absolute(file);
  const ArtifactPaths paths = artifact_paths(absolute);
  const LanguageBackend * backend = registry_.find_for_path(absolute);

  struct Cleanup
  {
    const ArtifactPaths & paths;
    bool keep;
    ~Cleanup()
    {
      if (!keep) {
        remove_artifacts(paths);
      }
    }
  } cleanup{paths, config_.output.keep_artifacts};

  auto fail = [&result](Stage stage, std::string message) {
    result.error = StageError{stage, std::move(message)};
  };

  if (!write_file(paths.instrumented, instrumented.text)) {
    fail(Stage::Instrument, "cannot write " + paths.instrumented.string());
    return;
  }

  const auto toolchain = config_.toolchains.find(std::string(backend->name()));
  if (toolchain == config_.toolchains.end()) {
    fail(Stage::Compile, fmt::format("no toolchain configured for '{}'", backend->name()));
    return;
  }

  const std::map<std::string, std::string> placeholders{
    {"source", paths.instrumented.string()},
    {"executable", paths.executable.string()},
  };
  const std::chrono::seconds timeout(config_.runner.timeout_seconds);

  // Compile
  if (!toolchain->second.compile.empty()) {
    spdlog::debug("compiling {}", paths.instrumented.string());
    const ProcessResult compiled =
      run_process(expand_command(toolchain->second.compile, placeholders), timeout);
    if (compiled.launch_failed) {
      fail(Stage::Compile, compiled.error);
      return;
    }
    if (compiled.timed_out) {
      fail(Stage::Compile, "Compilation timed out");
      return;
    }
    if (!compiled.exited_cleanly()) {
      std::string message = trim(compiled.stderr_text);
      if (message.empty()) {
        message = fmt::format("compiler exited with status {}", compiled.exit_code);
      }
      fail(Stage::Compile, std::move(message));
      return;
    }
  }

  // Run
  spdlog::debug("running {}", file.string());
  const ProcessResult ran =
    run_process(expand_command(toolchain->second.run, placeholders), timeout);
  if (ran.launch_failed) {
    fail(Stage::Runtime, ran.error);
    return;
  }
  if (ran.timed_out) {
    fail(
      Stage::Runtime,
      fmt::format("Program timed out ({}s limit)", config_.runner.timeout_seconds));
    return;
  }

  if (!write_file(paths.trace, ran.stdout_text)) {
    spdlog::warn("cannot write {}", paths.trace.string());
  }

  // Normalize
  DecodeResult decoded = decode_trace(ran.stdout_text);
  spdlog::debug(
    "normalized {} records, {} malformed lines", decoded.traces.size(),
    decoded.diagnostics.size());

  for (const auto & [key, value] : decoded.metadata) {
    result.metadata.set(key, value);
  }
  result.traces = std::move(decoded.traces);
  result.diagnostics.merge(std::move(decoded.diagnostics));

  const std::string stderr_text = trim(ran.stderr_text);
  if (!stderr_text.empty()) {
    fail(Stage::Runtime, stderr_text);
  } else if (ran.signal != 0) {
    fail(Stage::Runtime, fmt::format("terminated by signal {}", ran.signal));
  }
}

BatchResult Pipeline::process_batch(
  const std::filesystem::path & directory, const std::vector<std::string> & file_names,
  const std::filesystem::path & output_dir) const
{
  BatchResult batch;

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    spdlog::warn("cannot create {}: {}", output_dir.string(), ec.message());
  }

  for (const auto & name : file_names) {
    BatchEntry entry;
    entry.file_name = name;

    const fs::path file = directory / name;
    if (!is_plain_file_name(name) || !fs::is_regular_file(file, ec)) {
      entry.result = TraceResult::failed(Stage::Validation, "Invalid or missing file: " + name);
      spdlog::warn("batch: skipping '{}'", name);
      batch.failed.push_back(std::move(entry));
      continue;
    }

    const fs::path output = output_dir / (output_stem(file) + ".json");

    SeedOptions seed;
    seed.mode = config_.seed.reuse_previous ? SeedMode::ReusePrevious : SeedMode::Derive;
    seed.previous_result = output;

    entry.result = process_file(file, seed);
    if (write_result(output, entry.result, config_.output.indent)) {
      entry.output_path = output;
    } else {
      spdlog::warn("cannot write {}", output.string());
    }

    if (entry.result.success) {
      batch.succeeded.push_back(std::move(entry));
    } else {
      batch.failed.push_back(std::move(entry));
    }
  }

  if (batch.succeeded.empty()) {
    batch.status = BatchStatus::Failed;
  } else if (batch.failed.empty()) {
    batch.status = BatchStatus::AllSucceeded;
  } else {
    batch.status = BatchStatus::PartialSuccess;
  }
  return batch;
}

}  // namespace codetrace
