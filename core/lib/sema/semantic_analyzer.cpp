// minilang/sema/semantic_analyzer.cpp - Semantic analysis implementation
//
#include "minilang/sema/semantic_analyzer.hpp"

#include <fmt/core.h>

#include <ostream>

#include "minilang/ast/ast_enums.hpp"
#include "minilang/basic/casting.hpp"

namespace minilang
{

namespace
{

/// Result type of `lhs op rhs`, or nullopt if the operand types are invalid
std::optional<ValueType> binary_result(BinaryOp op, ValueType lhs, ValueType rhs)
{
  switch (op) {
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      if (lhs == ValueType::Number && rhs == ValueType::Number) return ValueType::Bool;
      return std::nullopt;

    case BinaryOp::Eq:
    case BinaryOp::Ne:
      if (lhs == rhs) return ValueType::Bool;
      return std::nullopt;

    case BinaryOp::Add:
    case BinaryOp::Sub:
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
      if (lhs == ValueType::Number && rhs == ValueType::Number) return ValueType::Number;
      return std::nullopt;

    case BinaryOp::And:
    case BinaryOp::Or:
      if (lhs == ValueType::Bool && rhs == ValueType::Bool) return ValueType::Bool;
      return std::nullopt;
  }
  return std::nullopt;
}

/// Single child of a wrapper node
const AstNode & only_child(const AstNode & node)
{
  if (node.child_count() != 1 || node.children[0] == nullptr) {
    throw SemanticError::malformed_tree(
      fmt::format("{} expects 1 child, found {}", to_string(node.get_kind()), node.child_count()),
      node.get_range());
  }
  return *node.children[0];
}

const AstNode & child_at(const AstNode & node, size_t index)
{
  const AstNode * child = node.child(index);
  if (child == nullptr) {
    throw SemanticError::malformed_tree(
      fmt::format("{} is missing child {}", to_string(node.get_kind()), index), node.get_range());
  }
  return *child;
}

/// Range of `node`, falling back to `fallback` when the parser gave none
SourceRange range_or(const AstNode & node, SourceRange fallback)
{
  return node.get_range().is_valid() ? node.get_range() : fallback;
}

}  // namespace

SemanticAnalyzer::SemanticAnalyzer(std::ostream & out) : out_(out) {}

UsageMetrics SemanticAnalyzer::run(const Program & program)
{
  symbols_.clear();
  metrics_ = UsageMetrics{};

  check_children(program, 0, AnalysisContext{});

  out_ << metrics_.to_string() << '\n';
  return metrics_;
}

// ============================================================================
// Statements
// ============================================================================

void SemanticAnalyzer::check_children(
  const AstNode & node, size_t from, const AnalysisContext & ctx)
{
  for (size_t i = from; i < node.child_count(); ++i) {
    check_node(child_at(node, i), ctx);
  }
}

void SemanticAnalyzer::check_node(const AstNode & node, const AnalysisContext & ctx)
{
  switch (node.get_kind()) {
    case NodeKind::Block:
    case NodeKind::Stmt:
    case NodeKind::FunctionBlock:
      check_children(node, 0, ctx);
      return;

    case NodeKind::Declaration:
      check_declaration(*cast<Declaration>(&node));
      return;

    case NodeKind::IfStmt:
    case NodeKind::WhileStmt:
      check_condition_stmt(node, ctx);
      return;

    case NodeKind::FunctionStmt:
      check_function_stmt(*cast<FunctionStmt>(&node));
      return;

    case NodeKind::ReturnStmt:
      check_return_stmt(*cast<ReturnStmt>(&node), ctx);
      return;

    case NodeKind::AssignStmt:
      check_assign_stmt(*cast<AssignStmt>(&node));
      return;

    case NodeKind::Program:
      throw SemanticError::malformed_tree("Program nested inside a program", node.get_range());

    default:
      break;
  }

  // Expression statement: checked for its type, which is then discarded
  synthesize(node);
}

void SemanticAnalyzer::check_declaration(const Declaration & decl)
{
  const Identifier * id = decl.identifier();
  if (decl.child_count() != 1 || id == nullptr) {
    throw SemanticError::malformed_tree(
      "Declaration expects one Identifier child", decl.get_range());
  }

  const SourceRange range = range_or(*id, decl.get_range());
  if (!symbols_.declare(id->name, decl.declaredType, range)) {
    const Symbol * first = symbols_.lookup(id->name);
    throw SemanticError::multiple_declaration(
      id->name, range, first != nullptr ? first->definitionRange : SourceRange{});
  }
  ++metrics_.variables;
}

void SemanticAnalyzer::check_condition_stmt(const AstNode & node, const AnalysisContext & ctx)
{
  const AstNode & condition = child_at(node, 0);
  if (synthesize(condition) != ValueType::Bool) {
    throw SemanticError::invalid_condition_type(range_or(condition, node.get_range()));
  }

  // Each branch statement is checked on its own
  check_children(node, 1, ctx);

  if (node.get_kind() == NodeKind::IfStmt) {
    ++metrics_.conditionals;
  } else {
    ++metrics_.loops;
  }
}

void SemanticAnalyzer::check_function_stmt(const FunctionStmt & fn)
{
  const AnalysisContext inner{fn.returnType};

  // The leading Identifier only names the function
  const size_t body_start = fn.name() != nullptr ? 1 : 0;
  check_children(fn, body_start, inner);

  ++metrics_.functions;
}

void SemanticAnalyzer::check_return_stmt(const ReturnStmt & ret, const AnalysisContext & ctx)
{
  const ValueType returned = synthesize(only_child(ret));

  if (!ctx.return_type) {
    throw SemanticError::return_outside_function(ret.get_range());
  }
  if (returned != *ctx.return_type) {
    throw SemanticError::return_type_mismatch(ret.get_range());
  }
}

void SemanticAnalyzer::check_assign_stmt(const AssignStmt & assign)
{
  const Identifier * target = assign.target();
  if (assign.child_count() != 2 || target == nullptr) {
    throw SemanticError::malformed_tree(
      "AssignStmt expects an Identifier target and a value", assign.get_range());
  }

  const ValueType value_type = synthesize(child_at(assign, 1));

  const Symbol * sym = symbols_.lookup(target->name);
  if (sym == nullptr) {
    throw SemanticError::undefined_identifier(
      target->name, range_or(*target, assign.get_range()));
  }
  if (sym->type != value_type) {
    throw SemanticError::invalid_assignment_type(target->name, assign.get_range());
  }
}

// ============================================================================
// Expressions
// ============================================================================

ValueType SemanticAnalyzer::synthesize(const AstNode & node)
{
  switch (node.get_kind()) {
    case NodeKind::Expr:
    case NodeKind::GenValue:
      return synthesize(only_child(node));

    case NodeKind::CompExpr:
      return synthesize_binary(*cast<CompExpr>(&node));
    case NodeKind::AddExpr:
      return synthesize_binary(*cast<AddExpr>(&node));
    case NodeKind::MulExpr:
      return synthesize_binary(*cast<MulExpr>(&node));
    case NodeKind::BoolExpr:
      return synthesize_binary(*cast<BoolExpr>(&node));

    case NodeKind::NotExpr:
      return synthesize_prefix(*cast<NotExpr>(&node), ValueType::Bool);
    case NodeKind::UnaExpr:
      return synthesize_prefix(*cast<UnaExpr>(&node), ValueType::Number);

    case NodeKind::BoolValue:
      return ValueType::Bool;
    case NodeKind::IntValue:
      return ValueType::Number;
    case NodeKind::Identifier:
      return synthesize_identifier(*cast<Identifier>(&node));

    default:
      break;
  }

  throw SemanticError::malformed_tree(
    fmt::format("{} is not an expression", to_string(node.get_kind())), node.get_range());
}

template <typename Layer>
ValueType SemanticAnalyzer::synthesize_binary(const Layer & node)
{
  const size_t operands = node.child_count();
  if (operands == 0 || node.ops.size() != operands - 1) {
    throw SemanticError::malformed_tree(
      fmt::format(
        "{} has {} operands and {} operators", to_string(node.get_kind()), operands,
        node.ops.size()),
      node.get_range());
  }
  for (const BinaryOp op : node.ops) {
    if (!is_operator_of_layer(Layer::kind, op)) {
      throw SemanticError::malformed_tree(
        fmt::format("operator '{}' does not belong to {}", to_string(op), to_string(Layer::kind)),
        node.get_range());
    }
  }

  ValueType acc = synthesize(child_at(node, 0));
  if (node.is_pass_through()) {
    return acc;
  }

  // Left-associative fold: ((c0 op0 c1) op1 c2) ...
  for (size_t i = 1; i < operands; ++i) {
    const ValueType rhs = synthesize(child_at(node, i));
    const auto result = binary_result(node.ops[i - 1], acc, rhs);
    if (!result) {
      throw SemanticError::invalid_expression_type(node.get_range());
    }
    acc = *result;
  }

  ++metrics_.operators;
  return acc;
}

template <typename Prefix>
ValueType SemanticAnalyzer::synthesize_prefix(const Prefix & node, ValueType required)
{
  const ValueType operand = synthesize(only_child(node));
  if (node.ops.empty()) {
    return operand;
  }

  if (operand != required) {
    throw SemanticError::invalid_expression_type(node.get_range());
  }
  ++metrics_.operators;
  return operand;
}

ValueType SemanticAnalyzer::synthesize_identifier(const Identifier & id)
{
  const Symbol * sym = symbols_.lookup(id.name);
  if (sym == nullptr) {
    throw SemanticError::undefined_identifier(id.name, id.get_range());
  }
  return sym->type;
}

}  // namespace minilang
