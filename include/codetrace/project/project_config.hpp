// codetrace/project/project_config.hpp - Project configuration (codetrace.yaml)
//
// Toolchain commands, run timeout, output and seed defaults. Missing keys
// keep their built-in defaults.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codetrace
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Commands used to build and run one language.
 *
 * Entries may contain the placeholders `{source}` (instrumented file) and
 * `{executable}` (build output).
 */
struct ToolchainConfig
{
  /// Build step; empty for interpreted languages
  std::vector<std::string> compile;

  /// Run step
  std::vector<std::string> run;
};

struct RunnerConfig
{
  /// Wall-clock limit of each compile or run step
  int timeout_seconds = 30;
};

struct OutputConfig
{
  /// Batch output directory; empty means "traces" under the working directory
  std::filesystem::path directory;

  /// Keep instrumented sources, raw traces and executables after a run
  bool keep_artifacts = true;

  /// JSON indentation; 0 writes compact documents
  int indent = 2;
};

struct SeedConfig
{
  /// Reuse the seed of an existing result document instead of deriving one
  bool reuse_previous = true;
};

/**
 * Complete project configuration (codetrace.yaml).
 */
struct ProjectConfig
{
  RunnerConfig runner;

  /// Keyed by backend name ("c", "python")
  std::map<std::string, ToolchainConfig> toolchains;

  OutputConfig output;
  SeedConfig seed;

  /// Directory containing codetrace.yaml; empty for built-in defaults
  std::filesystem::path project_root;

  /// gcc for C, python3 for Python
  [[nodiscard]] static ProjectConfig defaults();
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
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
 * Load a project configuration from a codetrace.yaml file.
 *
 * Values present in the file override ProjectConfig::defaults(); a relative
 * output directory is resolved against the file's directory.
 *
 * @param config_path Path to codetrace.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to codetrace.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "codetrace.yaml";

}  // namespace codetrace
