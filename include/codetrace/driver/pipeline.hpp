// codetrace/driver/pipeline.hpp - instrument -> compile -> run -> normalize
//
// Single entry point for tracing a file. Used by the CLI and by tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "codetrace/basic/diagnostic.hpp"
#include "codetrace/basic/source_file.hpp"
#include "codetrace/instrument/language_registry.hpp"
#include "codetrace/instrument/metadata.hpp"
#include "codetrace/project/project_config.hpp"
#include "codetrace/trace/record.hpp"

namespace codetrace
{

// ============================================================================
// Stages and Errors
// ============================================================================

enum class Stage {
  Input,       ///< source missing or unreadable
  Instrument,  ///< unsupported extension, or the backend failed
  Compile,     ///< toolchain rejected the instrumented source
  Runtime,     ///< timeout, signal, or output on stderr
  Normalize,   ///< raw output could not be decoded
  Validation,  ///< bad request (seed override, batch file name)
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

struct StageError
{
  Stage stage = Stage::Input;
  std::string message;
};

// ============================================================================
// Trace Result
// ============================================================================

/**
 * Outcome of tracing one file.
 *
 * On runtime failures the metadata and traces decoded so far are kept.
 */
struct TraceResult
{
  bool success = false;

  Metadata metadata;
  std::vector<TraceRecord> traces;

  /// Decimal seed; absent if the pipeline failed before metadata was known
  std::optional<std::string> seed;

  std::optional<StageError> error;

  /// Syntax warnings and malformed trace lines
  DiagnosticBag diagnostics;

  /// Source of the traced file, for printing diagnostics
  SourceFile source;

  [[nodiscard]] static TraceResult failed(Stage stage, std::string message);

  /**
   * Result document: `{success, metadata, traces, seed?, error?}`.
   *
   * The seed is a number when it fits 64 bits, otherwise a string.
   */
  [[nodiscard]] nlohmann::ordered_json to_json() const;
};

// ============================================================================
// Options
// ============================================================================

enum class SeedMode {
  Derive,         ///< always derive from metadata
  Explicit,       ///< use SeedOptions::value
  ReusePrevious,  ///< reuse the seed of SeedOptions::previous_result if present
};

struct SeedOptions
{
  SeedMode mode = SeedMode::ReusePrevious;

  /// 19-20 digit override (Explicit)
  std::string value;

  /// Existing result document (ReusePrevious)
  std::filesystem::path previous_result;
};

struct InstrumentResult
{
  bool success = false;
  std::string text;
  SymbolTable symbols;
  Metadata metadata;
  std::optional<StageError> error;
  DiagnosticBag diagnostics;
  SourceFile source;
};

// ============================================================================
// Batch Result
// ============================================================================

enum class BatchStatus {
  AllSucceeded,
  PartialSuccess,
  Failed,  ///< no file succeeded
};

struct BatchEntry
{
  std::string file_name;

  /// Where the result document was written; empty if nothing was written
  std::filesystem::path output_path;

  TraceResult result;
};

struct BatchResult
{
  BatchStatus status = BatchStatus::Failed;
  std::vector<BatchEntry> succeeded;
  std::vector<BatchEntry> failed;
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * Runs files through instrument, compile, run and normalize.
 *
 * Artifacts are written beside the input file: `instrumented_<name>`,
 * `<stem>_<ext>_trace.txt` and `<stem>_<ext>.out` (`prog_c.out` for
 * prog.c). They are removed afterwards unless the configuration keeps them.
 */
class Pipeline
{
public:
  Pipeline(const LanguageRegistry & registry, ProjectConfig config);

  /**
   * Analyze and instrument a file without running it.
   */
  [[nodiscard]] InstrumentResult instrument_file(const std::filesystem::path & file) const;

  /**
   * Trace one file. Stage failures are returned, never thrown.
   */
  [[nodiscard]] TraceResult process_file(
    const std::filesystem::path & file, const SeedOptions & seed = {}) const;

  /**
   * Trace files of one directory, one after another.
   *
   * A name that is empty, not a plain file name, or missing is a
   * `validation` failure. Every result is written to
   * `<output_dir>/<stem>_<ext>.json`; a previous document there supplies the
   * seed when the configuration reuses seeds.
   *
   * @param directory Directory holding the inputs
   * @param file_names Plain file names inside `directory`
   * @param output_dir Directory for the result documents (created if needed)
   */
  [[nodiscard]] BatchResult process_batch(
    const std::filesystem::path & directory, const std::vector<std::string> & file_names,
    const std::filesystem::path & output_dir) const;

  [[nodiscard]] const ProjectConfig & config() const noexcept { return config_; }

private:
  /// Resolve the seed policy; nullopt (with `error` set) for a bad override
  std::optional<std::string> resolve_seed(
    const SeedOptions & options, const Metadata & metadata, std::string & error) const;

  void execute(
    const std::filesystem::path & file, const InstrumentResult & instrumented,
    TraceResult & result) const;

  const LanguageRegistry & registry_;
  ProjectConfig config_;
};

/**
 * Write a result document.
 *
 * @param indent Spaces per level; 0 writes compact JSON
 * @return false if the file could not be written
 */
[[nodiscard]] bool write_result(
  const std::filesystem::path & path, const TraceResult & result, int indent);

}  // namespace codetrace
