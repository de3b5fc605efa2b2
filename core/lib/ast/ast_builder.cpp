// minilang/ast/ast_builder.cpp - AstBuilder implementation
#include "minilang/ast/ast_builder.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace minilang
{

gsl::span<AstNode *> AstBuilder::children_of(
  std::string_view what, const std::vector<AstNode *> & children)
{
  for (size_t i = 0; i < children.size(); ++i) {
    if (children[i] == nullptr) {
      throw std::invalid_argument(fmt::format("{}: child {} is null", what, i));
    }
  }
  return ast_.copy_to_arena(children);
}

gsl::span<BinaryOp> AstBuilder::ops_of(
  NodeKind layer, const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops)
{
  if (operands.empty()) {
    throw std::invalid_argument(fmt::format("{}: at least one operand is required", to_string(layer)));
  }
  if (ops.size() != operands.size() - 1) {
    throw std::invalid_argument(fmt::format(
      "{}: {} operands need {} operators, got {}", to_string(layer), operands.size(),
      operands.size() - 1, ops.size()));
  }
  for (const BinaryOp op : ops) {
    if (!is_operator_of_layer(layer, op)) {
      throw std::invalid_argument(
        fmt::format("{}: operator '{}' does not belong to this layer", to_string(layer), to_string(op)));
    }
  }
  return ast_.copy_to_arena(ops);
}

gsl::span<UnaryOp> AstBuilder::repeat_of(UnaryOp op, size_t count)
{
  return ast_.copy_to_arena(std::vector<UnaryOp>(count, op));
}

// ============================================================================
// Statements
// ============================================================================

Program * AstBuilder::program(const std::vector<AstNode *> & children, SourceRange r)
{
  return ast_.create<Program>(children_of("Program", children), r);
}

Declaration * AstBuilder::declaration(ValueType type, std::string_view name, SourceRange r)
{
  return ast_.create<Declaration>(type, children_of("Declaration", {identifier(name, r)}), r);
}

Block * AstBuilder::block(const std::vector<AstNode *> & children, SourceRange r)
{
  return ast_.create<Block>(children_of("Block", children), r);
}

Stmt * AstBuilder::stmt(AstNode * inner, SourceRange r)
{
  return ast_.create<Stmt>(children_of("Stmt", {inner}), r);
}

IfStmt * AstBuilder::if_stmt(AstNode * condition, const std::vector<AstNode *> & body, SourceRange r)
{
  std::vector<AstNode *> children{condition};
  children.insert(children.end(), body.begin(), body.end());
  return ast_.create<IfStmt>(children_of("IfStmt", children), r);
}

WhileStmt * AstBuilder::while_stmt(
  AstNode * condition, const std::vector<AstNode *> & body, SourceRange r)
{
  std::vector<AstNode *> children{condition};
  children.insert(children.end(), body.begin(), body.end());
  return ast_.create<WhileStmt>(children_of("WhileStmt", children), r);
}

FunctionStmt * AstBuilder::function(
  ValueType return_type, std::string_view name, const std::vector<AstNode *> & body,
  SourceRange r)
{
  std::vector<AstNode *> children;
  if (!name.empty()) {
    children.push_back(identifier(name));
  }
  children.insert(children.end(), body.begin(), body.end());
  return ast_.create<FunctionStmt>(return_type, children_of("FunctionStmt", children), r);
}

FunctionBlock * AstBuilder::function_block(const std::vector<AstNode *> & children, SourceRange r)
{
  return ast_.create<FunctionBlock>(children_of("FunctionBlock", children), r);
}

ReturnStmt * AstBuilder::return_stmt(AstNode * value, SourceRange r)
{
  return ast_.create<ReturnStmt>(children_of("ReturnStmt", {value}), r);
}

AssignStmt * AstBuilder::assign(std::string_view target, AstNode * value, SourceRange r)
{
  return ast_.create<AssignStmt>(children_of("AssignStmt", {identifier(target), value}), r);
}

// ============================================================================
// Expressions
// ============================================================================

Expr * AstBuilder::expr(AstNode * inner, SourceRange r)
{
  return ast_.create<Expr>(children_of("Expr", {inner}), r);
}

CompExpr * AstBuilder::comp(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r)
{
  return comp(std::vector<AstNode *>{lhs, rhs}, std::vector<BinaryOp>{op}, r);
}

CompExpr * AstBuilder::comp(
  const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r)
{
  auto children = children_of("CompExpr", operands);
  return ast_.create<CompExpr>(children, ops_of(NodeKind::CompExpr, operands, ops), r);
}

AddExpr * AstBuilder::add(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r)
{
  return add(std::vector<AstNode *>{lhs, rhs}, std::vector<BinaryOp>{op}, r);
}

AddExpr * AstBuilder::add(
  const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r)
{
  auto children = children_of("AddExpr", operands);
  return ast_.create<AddExpr>(children, ops_of(NodeKind::AddExpr, operands, ops), r);
}

MulExpr * AstBuilder::mul(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r)
{
  return mul(std::vector<AstNode *>{lhs, rhs}, std::vector<BinaryOp>{op}, r);
}

MulExpr * AstBuilder::mul(
  const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r)
{
  auto children = children_of("MulExpr", operands);
  return ast_.create<MulExpr>(children, ops_of(NodeKind::MulExpr, operands, ops), r);
}

BoolExpr * AstBuilder::logic(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r)
{
  return logic(std::vector<AstNode *>{lhs, rhs}, std::vector<BinaryOp>{op}, r);
}

BoolExpr * AstBuilder::logic(
  const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r)
{
  auto children = children_of("BoolExpr", operands);
  return ast_.create<BoolExpr>(children, ops_of(NodeKind::BoolExpr, operands, ops), r);
}

NotExpr * AstBuilder::not_expr(AstNode * operand, size_t count, SourceRange r)
{
  return ast_.create<NotExpr>(children_of("NotExpr", {operand}), repeat_of(UnaryOp::Not, count), r);
}

UnaExpr * AstBuilder::neg(AstNode * operand, size_t count, SourceRange r)
{
  return ast_.create<UnaExpr>(children_of("UnaExpr", {operand}), repeat_of(UnaryOp::Neg, count), r);
}

// ============================================================================
// Values
// ============================================================================

GenValue * AstBuilder::gen_value(AstNode * inner, SourceRange r)
{
  return ast_.create<GenValue>(children_of("GenValue", {inner}), r);
}

GenValue * AstBuilder::var(std::string_view name, SourceRange r)
{
  return gen_value(identifier(name, r), r);
}

BoolValue * AstBuilder::bool_value(bool value, SourceRange r)
{
  return ast_.create<BoolValue>(value, r);
}

IntValue * AstBuilder::int_value(int64_t value, SourceRange r)
{
  return ast_.create<IntValue>(value, r);
}

Identifier * AstBuilder::identifier(std::string_view name, SourceRange r)
{
  if (name.empty()) {
    throw std::invalid_argument("Identifier: name must not be empty");
  }
  return ast_.create<Identifier>(ast_.intern(name), r);
}

}  // namespace minilang
