// minilang/driver/checker.hpp - Checker driver
//
// Single entry point for the check pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "minilang/basic/diagnostic.hpp"
#include "minilang/basic/source_manager.hpp"
#include "minilang/project/project_config.hpp"
#include "minilang/sema/analysis/usage_metrics.hpp"

namespace minilang
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Append summary lines to this file (overrides project config)
  std::optional<std::filesystem::path> metrics_file;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Check Result
// ============================================================================

/**
 * Outcome of analyzing one interchange document.
 */
struct CheckedUnit
{
  /// Path of the interchange document
  std::filesystem::path path;

  /// Embedded source text, if the document carried one
  std::optional<SourceFile> source;

  DiagnosticBag diagnostics;

  /// Set only when analysis succeeded
  std::optional<UsageMetrics> metrics;

  /// Summary line written by the analyzer (with trailing newline)
  std::string summary;

  /// Path shown in diagnostics: the embedded source path, else the document
  [[nodiscard]] std::string display_path() const;
};

struct CheckResult
{
  /// Whether every unit passed (no errors)
  bool success = false;

  /// One entry per analyzed document, in entry point order
  std::vector<CheckedUnit> units;

  /// Diagnostics not tied to a unit (configuration, metrics file)
  DiagnosticBag diagnostics;

  /// Whether summaries went to a metrics file instead of the caller
  bool summaries_written = false;
};

// ============================================================================
// Checker
// ============================================================================

/**
 * Driver that runs the check pipeline over interchange documents.
 *
 * The pipeline for each document is:
 * 1. Read the file
 * 2. Load and validate the AST into a fresh AstContext
 * 3. Run a fresh SemanticAnalyzer
 * 4. Convert a SemanticError into a diagnostic
 */
class Checker
{
public:
  /**
   * Check a single interchange document.
   *
   * @param file Path to the .json document
   * @param options Check options
   * @return CheckResult with one unit
   */
  [[nodiscard]] static CheckResult check_file(
    const std::filesystem::path & file, const CheckOptions & options);

  /**
   * Check every entry point of a project.
   *
   * @param config Project configuration (from mlc.yaml)
   * @param options Check options (may override config settings)
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

private:
  static CheckedUnit check_unit(const std::filesystem::path & file, const CheckOptions & options);

  /**
   * Append the summaries of successful units to `path`.
   *
   * @return true if the file was written
   */
  static bool write_metrics(
    const std::filesystem::path & path, const std::vector<CheckedUnit> & units,
    DiagnosticBag & diags);

  static void finish(CheckResult & result, const std::optional<std::filesystem::path> & metrics);
};

}  // namespace minilang
