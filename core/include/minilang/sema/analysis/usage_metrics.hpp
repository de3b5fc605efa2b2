// minilang/sema/analysis/usage_metrics.hpp - Structural usage counters
#pragma once

#include <cstdint>
#include <string>

namespace minilang
{

/**
 * Counters collected over one analysis run.
 *
 * - variables:    successful declarations (VAR)
 * - loops:        while statements (WHILE)
 * - conditionals: if statements (IF)
 * - functions:    function definitions (FUNC)
 * - operators:    binary layers with 2+ operands, prefix layers with 1+ token (OP)
 */
struct UsageMetrics
{
  uint32_t variables = 0;
  uint32_t loops = 0;
  uint32_t conditionals = 0;
  uint32_t functions = 0;
  uint32_t operators = 0;

  /// `{VAR:n, WHILE:n, IF:n, FUNC:n, OP:n}`
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const UsageMetrics & other) const noexcept
  {
    return variables == other.variables && loops == other.loops &&
           conditionals == other.conditionals && functions == other.functions &&
           operators == other.operators;
  }
  [[nodiscard]] bool operator!=(const UsageMetrics & other) const noexcept
  {
    return !(*this == other);
  }
};

}  // namespace minilang
