// codetrace/project/project_config.cpp - Project configuration implementation
//
#include "codetrace/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace codetrace
{

namespace
{

/// Parse a command list; every entry must be a scalar
std::optional<std::vector<std::string>> parse_command(
  const YAML::Node & node, const std::string & where, std::string & error)
{
  if (!node.IsSequence()) {
    error = where + " must be a list of strings";
    return std::nullopt;
  }
  std::vector<std::string> argv;
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = where + " entries must be strings";
      return std::nullopt;
    }
    argv.push_back(item.as<std::string>());
  }
  return argv;
}

/// Merge one toolchain entry over its current value
bool parse_toolchain(
  const std::string & name, const YAML::Node & node, ToolchainConfig & toolchain,
  std::string & error)
{
  if (!node.IsMap()) {
    error = "toolchains." + name + " must be a map";
    return false;
  }
  if (node["compile"]) {
    auto argv = parse_command(node["compile"], "toolchains." + name + ".compile", error);
    if (!argv) {
      return false;
    }
    toolchain.compile = std::move(*argv);
  }
  if (node["run"]) {
    auto argv = parse_command(node["run"], "toolchains." + name + ".run", error);
    if (!argv) {
      return false;
    }
    toolchain.run = std::move(*argv);
  }
  if (toolchain.run.empty()) {
    error = "toolchains." + name + ".run must not be empty";
    return false;
  }
  return true;
}

ConfigLoadResult parse_config(const YAML::Node & root, ProjectConfig config)
{
  namespace fs = std::filesystem;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'runner' section
  if (const auto runner = root["runner"]) {
    if (runner["timeout_seconds"]) {
      config.runner.timeout_seconds = runner["timeout_seconds"].as<int>();
      if (config.runner.timeout_seconds <= 0) {
        return ConfigLoadResult::fail("runner.timeout_seconds must be positive");
      }
    }
  }

  // Parse 'toolchains' section
  if (const auto toolchains = root["toolchains"]) {
    if (!toolchains.IsMap()) {
      return ConfigLoadResult::fail("toolchains must be a map");
    }
    for (const auto & entry : toolchains) {
      const std::string name = entry.first.as<std::string>();
      std::string error;
      if (!parse_toolchain(name, entry.second, config.toolchains[name], error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  }

  // Parse 'output' section
  if (const auto output = root["output"]) {
    if (output["directory"]) {
      fs::path dir = output["directory"].as<std::string>();
      config.output.directory = dir.is_relative() ? config.project_root / dir : dir;
    }
    if (output["keep_artifacts"]) {
      config.output.keep_artifacts = output["keep_artifacts"].as<bool>();
    }
    if (output["indent"]) {
      config.output.indent = output["indent"].as<int>();
      if (config.output.indent < 0) {
        return ConfigLoadResult::fail("output.indent must not be negative");
      }
    }
  }

  // Parse 'seed' section
  if (const auto seed = root["seed"]) {
    if (seed["reuse_previous"]) {
      config.seed.reuse_previous = seed["reuse_previous"].as<bool>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ProjectConfig ProjectConfig::defaults()
{
  ProjectConfig config;
  config.toolchains["c"] = {{"gcc", "{source}", "-o", "{executable}"}, {"{executable}"}};
  config.toolchains["python"] = {{}, {"python3", "{source}"}};
  return config;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config = ProjectConfig::defaults();
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_config(root, std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(
      config_path.string() + ": invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_project_config_file_name;
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

}  // namespace codetrace
