// minilang/basic/diagnostic.hpp - Diagnostic types for loading and sema
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "minilang/basic/source_manager.hpp"

namespace minilang
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
};

enum class LabelStyle : uint8_t {
  Primary,    // Direct cause
  Secondary,  // Related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "E003"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder for one diagnostic. The diagnostic is added to its bag
 * when the builder is destroyed (RAII).
 *
 * @code
 *   bag.report_error(range, "Invalid type in condition").with_code("E002");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace minilang
