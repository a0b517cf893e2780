// cwcheck/project/engine_config.hpp - Engine configuration (cwcheck.yaml)
//
// Parses and validates cwcheck.yaml. Shared by the workspace facade and any
// command-line host.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cwcheck/basic/log.hpp"
#include "cwcheck/sema/validator.hpp"

namespace cwcheck
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Where the CWT schema comes from.
 */
struct SchemaConfig
{
  /// Directory holding the .cwt files (relative to cwcheck.yaml)
  std::filesystem::path root = "config";

  /// Explicit file list, relative to `root`. Empty = every *.cwt under `root`.
  std::vector<std::filesystem::path> files;
};

struct WorkspaceConfig
{
  /// Game / mod roots (relative to cwcheck.yaml)
  std::vector<std::filesystem::path> roots;
};

struct ValidationConfig
{
  sema::UnexpectedKeyPolicy unexpected_keys = sema::UnexpectedKeyPolicy::Error;
  bool check_localisation = true;
  size_t max_diagnostics_per_file = 0;
};

struct AnalysisConfig
{
  /// Worker threads; 0 = hardware concurrency
  size_t workers = 0;
};

struct LoggingConfig
{
  log::Level level = log::Level::Warn;
};

/**
 * Complete engine configuration (cwcheck.yaml).
 */
struct EngineConfig
{
  SchemaConfig schema;
  WorkspaceConfig workspace;
  ValidationConfig validation;
  AnalysisConfig analysis;
  LoggingConfig logging;

  /// Directory containing cwcheck.yaml (for resolving relative paths)
  std::filesystem::path config_root;

  [[nodiscard]] sema::ValidationOptions validation_options() const;

  /// Absolute schema file paths, sorted.
  [[nodiscard]] std::vector<std::filesystem::path> schema_paths() const;

  /// Absolute workspace roots in declaration order.
  [[nodiscard]] std::vector<std::filesystem::path> workspace_roots() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct EngineConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  EngineConfig config;

  bool success = false;
  std::string error;

  static EngineConfigLoadResult ok(EngineConfig cfg)
  {
    EngineConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static EngineConfigLoadResult fail(std::string msg)
  {
    EngineConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load an engine configuration from a cwcheck.yaml file.
 *
 * Unknown keys are ignored; malformed known keys fail the load.
 */
[[nodiscard]] EngineConfigLoadResult load_engine_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text directly. Relative paths resolve against
 * `config_root`.
 */
[[nodiscard]] EngineConfigLoadResult parse_engine_config(
  const std::string & yaml_text, const std::filesystem::path & config_root);

/**
 * Find cwcheck.yaml by searching upward from `start_dir` to the filesystem
 * root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_engine_config(
  const std::filesystem::path & start_dir);

/// Apply `logging.level` to the process-wide logger.
void apply_logging(const EngineConfig & config);

inline constexpr const char * k_engine_config_file_name = "cwcheck.yaml";

}  // namespace cwcheck
