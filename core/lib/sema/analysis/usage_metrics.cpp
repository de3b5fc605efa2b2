// minilang/sema/analysis/usage_metrics.cpp
#include "minilang/sema/analysis/usage_metrics.hpp"

#include <fmt/core.h>

namespace minilang
{

std::string UsageMetrics::to_string() const
{
  return fmt::format(
    "{{VAR:{}, WHILE:{}, IF:{}, FUNC:{}, OP:{}}}", variables, loops, conditionals, functions,
    operators);
}

}  // namespace minilang
