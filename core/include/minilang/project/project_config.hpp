// minilang/project/project_config.hpp - Project configuration (mlc.yaml)
//
// Parses and validates mlc.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace minilang
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * `check` section: what to analyze and where summaries go.
 */
struct CheckConfig
{
  /// AST interchange documents to analyze, relative to mlc.yaml
  std::vector<std::filesystem::path> entry_points;

  /// File receiving the summary lines (relative to mlc.yaml); stdout if unset
  std::optional<std::filesystem::path> metrics_file;
};

struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (mlc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CheckConfig check;

  /// Directory containing mlc.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

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
 * Load a project configuration from an mlc.yaml file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find mlc.yaml by searching upward from start_dir to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Default name of the project configuration file.
inline constexpr const char * k_project_config_file_name = "mlc.yaml";

}  // namespace minilang
