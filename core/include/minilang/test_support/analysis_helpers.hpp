// minilang/test_support/analysis_helpers.hpp - helpers for unit/integration tests
//
// These helpers keep tree ownership explicit (AstContext) while offering a
// convenient wrapper around loading and analyzing a program.
//
#pragma once

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "minilang/ast/ast_builder.hpp"
#include "minilang/ast/ast_context.hpp"
#include "minilang/ast/json_reader.hpp"
#include "minilang/basic/diagnostic.hpp"
#include "minilang/sema/semantic_analyzer.hpp"

namespace minilang::test_support
{

/// Result of one analyzer run: either metrics and output, or the error.
struct AnalysisOutcome
{
  std::optional<UsageMetrics> metrics;
  std::string output;
  std::optional<SemanticError> error;

  [[nodiscard]] bool ok() const noexcept { return metrics.has_value(); }

  /// what() of the error, empty on success
  [[nodiscard]] std::string message() const { return error ? error->what() : std::string{}; }
};

[[nodiscard]] inline AnalysisOutcome analyze(const Program & program)
{
  AnalysisOutcome out;
  std::ostringstream sink;
  SemanticAnalyzer analyzer(sink);
  try {
    out.metrics = analyzer.run(program);
  } catch (const SemanticError & e) {
    out.error = e;
  }
  out.output = sink.str();
  return out;
}

/**
 * Arena plus builder for constructing trees in tests.
 */
struct TestTree
{
  std::unique_ptr<AstContext> ast = std::make_unique<AstContext>();
  AstBuilder b{*ast};
};

/// Loaded interchange document with its owning arena.
struct TestLoadUnit
{
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  AstDocument doc;

  [[nodiscard]] Program * program() const noexcept { return doc.program; }
};

[[nodiscard]] inline TestLoadUnit load(std::string_view json_text)
{
  TestLoadUnit out;
  out.ast = std::make_unique<AstContext>();
  out.doc = load_ast_json(json_text, *out.ast, out.diags);
  return out;
}

}  // namespace minilang::test_support
