// minilang/ast/ast_builder.hpp - In-process construction of well-formed trees
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "minilang/ast/ast.hpp"
#include "minilang/ast/ast_context.hpp"
#include "minilang/basic/source_manager.hpp"

namespace minilang
{

/**
 * Factory for AST nodes in an AstContext.
 *
 * Owns no memory. Every factory copies its child list into the arena and
 * checks the structural preconditions the analyzer relies on (non-null
 * children, operator counts and operator layers), throwing
 * std::invalid_argument when one does not hold.
 *
 * @code
 *   AstBuilder b(ctx);
 *   auto * program = b.program({
 *     b.declaration(ValueType::Number, "a"),
 *     b.assign("a", b.int_value(1)),
 *   });
 * @endcode
 */
class AstBuilder
{
public:
  explicit AstBuilder(AstContext & ast) : ast_(ast) {}

  // Top-level / statements
  [[nodiscard]] Program * program(const std::vector<AstNode *> & children, SourceRange r = {});
  [[nodiscard]] Declaration * declaration(ValueType type, std::string_view name, SourceRange r = {});
  [[nodiscard]] Block * block(const std::vector<AstNode *> & children, SourceRange r = {});
  [[nodiscard]] Stmt * stmt(AstNode * inner, SourceRange r = {});
  [[nodiscard]] IfStmt * if_stmt(
    AstNode * condition, const std::vector<AstNode *> & body, SourceRange r = {});
  [[nodiscard]] WhileStmt * while_stmt(
    AstNode * condition, const std::vector<AstNode *> & body, SourceRange r = {});

  /// Function definition. An empty name produces an anonymous function.
  [[nodiscard]] FunctionStmt * function(
    ValueType return_type, std::string_view name, const std::vector<AstNode *> & body,
    SourceRange r = {});
  [[nodiscard]] FunctionBlock * function_block(
    const std::vector<AstNode *> & children, SourceRange r = {});
  [[nodiscard]] ReturnStmt * return_stmt(AstNode * value, SourceRange r = {});
  [[nodiscard]] AssignStmt * assign(std::string_view target, AstNode * value, SourceRange r = {});

  // Expression layers
  [[nodiscard]] Expr * expr(AstNode * inner, SourceRange r = {});

  [[nodiscard]] CompExpr * comp(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r = {});
  [[nodiscard]] CompExpr * comp(
    const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r = {});
  [[nodiscard]] AddExpr * add(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r = {});
  [[nodiscard]] AddExpr * add(
    const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r = {});
  [[nodiscard]] MulExpr * mul(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r = {});
  [[nodiscard]] MulExpr * mul(
    const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r = {});
  [[nodiscard]] BoolExpr * logic(AstNode * lhs, BinaryOp op, AstNode * rhs, SourceRange r = {});
  [[nodiscard]] BoolExpr * logic(
    const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops, SourceRange r = {});

  /// `!` repeated `count` times; count 0 builds a pass-through layer
  [[nodiscard]] NotExpr * not_expr(AstNode * operand, size_t count = 1, SourceRange r = {});
  /// `-` repeated `count` times; count 0 builds a pass-through layer
  [[nodiscard]] UnaExpr * neg(AstNode * operand, size_t count = 1, SourceRange r = {});

  // Values
  [[nodiscard]] GenValue * gen_value(AstNode * inner, SourceRange r = {});
  /// Identifier read: GenValue[Identifier(name)]
  [[nodiscard]] GenValue * var(std::string_view name, SourceRange r = {});
  [[nodiscard]] BoolValue * bool_value(bool value, SourceRange r = {});
  [[nodiscard]] IntValue * int_value(int64_t value, SourceRange r = {});
  [[nodiscard]] Identifier * identifier(std::string_view name, SourceRange r = {});

private:
  [[nodiscard]] gsl::span<AstNode *> children_of(
    std::string_view what, const std::vector<AstNode *> & children);
  [[nodiscard]] gsl::span<BinaryOp> ops_of(
    NodeKind layer, const std::vector<AstNode *> & operands, const std::vector<BinaryOp> & ops);
  [[nodiscard]] gsl::span<UnaryOp> repeat_of(UnaryOp op, size_t count);

  AstContext & ast_;
};

}  // namespace minilang
