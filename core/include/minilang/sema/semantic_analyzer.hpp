// minilang/sema/semantic_analyzer.hpp - Single-pass type checker and metrics collector
//
// Walks a Program once, depth first. Declarations and checks happen in
// pre-order; expression types are synthesized bottom-up and returned to the
// caller. The first violation aborts the walk with a SemanticError.
//
#pragma once

#include <iosfwd>
#include <optional>

#include "minilang/ast/ast.hpp"
#include "minilang/sema/analysis/usage_metrics.hpp"
#include "minilang/sema/resolution/symbol_table.hpp"
#include "minilang/sema/semantic_error.hpp"

namespace minilang
{

/**
 * Context threaded by value through statement checks.
 *
 * return_type is the declared type of the innermost enclosing function,
 * empty outside of any function.
 */
struct AnalysisContext
{
  std::optional<ValueType> return_type;
};

/**
 * Semantic analyzer for one program at a time.
 *
 * ## Usage
 * ```cpp
 * std::ostringstream out;
 * SemanticAnalyzer analyzer(out);
 * try {
 *   analyzer.run(*program);       // out: "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n"
 * } catch (const SemanticError & e) {
 *   // e.what(): "Invalid type in condition", e.code(): "E002"
 * }
 * ```
 */
class SemanticAnalyzer
{
public:
  /// @param out Sink receiving the summary line of each successful run
  explicit SemanticAnalyzer(std::ostream & out);

  /**
   * Analyze a whole program.
   *
   * Resets the symbol table and counters, walks the program and on success
   * writes the summary line followed by a newline to the sink.
   *
   * @throws SemanticError on the first violation; nothing is written then
   */
  UsageMetrics run(const Program & program);

  /**
   * Synthesize the type of one expression against the current symbol
   * table. Counts operators like a full run does.
   *
   * @throws SemanticError if the expression is ill-typed or malformed
   */
  ValueType synthesize(const AstNode & node);

  [[nodiscard]] const UsageMetrics & metrics() const noexcept { return metrics_; }
  [[nodiscard]] const SymbolTable & symbols() const noexcept { return symbols_; }

private:
  // Statements
  void check_node(const AstNode & node, const AnalysisContext & ctx);
  void check_children(const AstNode & node, size_t from, const AnalysisContext & ctx);
  void check_declaration(const Declaration & decl);
  void check_condition_stmt(const AstNode & node, const AnalysisContext & ctx);
  void check_function_stmt(const FunctionStmt & fn);
  void check_return_stmt(const ReturnStmt & ret, const AnalysisContext & ctx);
  void check_assign_stmt(const AssignStmt & assign);

  // Expressions
  template <typename Layer>
  ValueType synthesize_binary(const Layer & node);
  template <typename Prefix>
  ValueType synthesize_prefix(const Prefix & node, ValueType required);
  ValueType synthesize_identifier(const Identifier & id);

  std::ostream & out_;
  SymbolTable symbols_;
  UsageMetrics metrics_;
};

}  // namespace minilang
