// minilang/ast/ast.hpp - AST node class definitions
//
// Node classes follow the LLVM/Clang style with classof() for RTTI support.
// Every node keeps its children in one ordered span, matching the shape the
// external parser produces; kind-specific payload lives in the subclasses.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "minilang/ast/ast_enums.hpp"
#include "minilang/basic/casting.hpp"
#include "minilang/basic/source_manager.hpp"

namespace minilang
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source (may be invalid)
 * - An ordered, possibly empty, list of children
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceFile.
  gsl::span<AstNode *> children;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

  [[nodiscard]] size_t child_count() const noexcept { return children.size(); }

  /// Child at `index`, or nullptr when out of range
  [[nodiscard]] AstNode * child(size_t index) const noexcept
  {
    return index < children.size() ? children[index] : nullptr;
  }

protected:
  AstNode(NodeKind k, gsl::span<AstNode *> c, SourceRange r) : kind(k), range_(r), children(c) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(gsl::span<AstNode *> c = {}, SourceRange r = {}) : Base(K, c, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/// Base class for expression nodes.
class ExprNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  ExprNode(NodeKind k, gsl::span<AstNode *> c, SourceRange r) : AstNode(k, c, r) {}
};

/// Base class for statement nodes.
class StmtNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  StmtNode(NodeKind k, gsl::span<AstNode *> c, SourceRange r) : AstNode(k, c, r) {}
};

/// Base class for declaration nodes.
class DeclNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  DeclNode(NodeKind k, gsl::span<AstNode *> c, SourceRange r) : AstNode(k, c, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Top of the expression grammar; wraps exactly one expression.
class Expr : public NodeBase<Expr, ExprNode, NodeKind::Expr>
{
public:
  explicit Expr(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}
};

/**
 * Common shape of the four binary precedence layers: N operands and
 * N-1 operators, folded left to right.
 */
template <typename Derived, NodeKind K>
class BinaryLayer : public NodeBase<Derived, ExprNode, K>
{
public:
  gsl::span<BinaryOp> ops;

  /// Single-operand layers are transparent pass-throughs
  [[nodiscard]] bool is_pass_through() const noexcept { return this->children.size() == 1; }

protected:
  BinaryLayer(gsl::span<AstNode *> c, gsl::span<BinaryOp> o, SourceRange r)
  : NodeBase<Derived, ExprNode, K>(c, r), ops(o)
  {
  }
};

/// Comparison layer: == != < <= > >=
class CompExpr : public BinaryLayer<CompExpr, NodeKind::CompExpr>
{
public:
  CompExpr(gsl::span<AstNode *> c, gsl::span<BinaryOp> o, SourceRange r = {})
  : BinaryLayer(c, o, r)
  {
  }
};

/// Additive layer: + -
class AddExpr : public BinaryLayer<AddExpr, NodeKind::AddExpr>
{
public:
  AddExpr(gsl::span<AstNode *> c, gsl::span<BinaryOp> o, SourceRange r = {}) : BinaryLayer(c, o, r)
  {
  }
};

/// Multiplicative layer: * / %
class MulExpr : public BinaryLayer<MulExpr, NodeKind::MulExpr>
{
public:
  MulExpr(gsl::span<AstNode *> c, gsl::span<BinaryOp> o, SourceRange r = {}) : BinaryLayer(c, o, r)
  {
  }
};

/// Logical layer: && ||
class BoolExpr : public BinaryLayer<BoolExpr, NodeKind::BoolExpr>
{
public:
  BoolExpr(gsl::span<AstNode *> c, gsl::span<BinaryOp> o, SourceRange r = {})
  : BinaryLayer(c, o, r)
  {
  }
};

/// Prefix `!` layer. An empty operator list is a pass-through.
class NotExpr : public NodeBase<NotExpr, ExprNode, NodeKind::NotExpr>
{
public:
  gsl::span<UnaryOp> ops;

  NotExpr(gsl::span<AstNode *> c, gsl::span<UnaryOp> o, SourceRange r = {}) : NodeBase(c, r), ops(o)
  {
  }
};

/// Prefix `-` layer. An empty operator list is a pass-through.
class UnaExpr : public NodeBase<UnaExpr, ExprNode, NodeKind::UnaExpr>
{
public:
  gsl::span<UnaryOp> ops;

  UnaExpr(gsl::span<AstNode *> c, gsl::span<UnaryOp> o, SourceRange r = {}) : NodeBase(c, r), ops(o)
  {
  }
};

/// Generic value position: wraps a literal, an identifier read or a nested Expr.
class GenValue : public NodeBase<GenValue, ExprNode, NodeKind::GenValue>
{
public:
  explicit GenValue(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}
};

/// Boolean literal.
class BoolValue : public NodeBase<BoolValue, ExprNode, NodeKind::BoolValue>
{
public:
  bool value;

  explicit BoolValue(bool v, SourceRange r = {}) : NodeBase({}, r), value(v) {}
};

/// Integer literal.
class IntValue : public NodeBase<IntValue, ExprNode, NodeKind::IntValue>
{
public:
  int64_t value;

  explicit IntValue(int64_t v, SourceRange r = {}) : NodeBase({}, r), value(v) {}
};

/// Identifier. Read as a value only under GenValue; elsewhere it only names.
class Identifier : public NodeBase<Identifier, ExprNode, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit Identifier(std::string_view n, SourceRange r = {}) : NodeBase({}, r), name(n) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// Braced statement list.
class Block : public NodeBase<Block, StmtNode, NodeKind::Block>
{
public:
  explicit Block(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}
};

/// Statement wrapper produced by the grammar's `stmt` rule.
class Stmt : public NodeBase<Stmt, StmtNode, NodeKind::Stmt>
{
public:
  explicit Stmt(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}
};

/// if (cond) body...
class IfStmt : public NodeBase<IfStmt, StmtNode, NodeKind::IfStmt>
{
public:
  explicit IfStmt(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}

  [[nodiscard]] AstNode * condition() const noexcept { return child(0); }
};

/// while (cond) body...
class WhileStmt : public NodeBase<WhileStmt, StmtNode, NodeKind::WhileStmt>
{
public:
  explicit WhileStmt(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}

  [[nodiscard]] AstNode * condition() const noexcept { return child(0); }
};

/**
 * Function definition. Carries its declared return type; an optional
 * leading Identifier child holds the function name.
 */
class FunctionStmt : public NodeBase<FunctionStmt, StmtNode, NodeKind::FunctionStmt>
{
public:
  ValueType returnType;

  FunctionStmt(ValueType t, gsl::span<AstNode *> c, SourceRange r = {})
  : NodeBase(c, r), returnType(t)
  {
  }

  /// Function name, or nullptr for an anonymous function
  [[nodiscard]] const Identifier * name() const noexcept
  {
    return children.empty() ? nullptr : dyn_cast<Identifier>(children[0]);
  }
};

/// Body of a function.
class FunctionBlock : public NodeBase<FunctionBlock, StmtNode, NodeKind::FunctionBlock>
{
public:
  explicit FunctionBlock(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}
};

/// return expr
class ReturnStmt : public NodeBase<ReturnStmt, StmtNode, NodeKind::ReturnStmt>
{
public:
  explicit ReturnStmt(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}

  [[nodiscard]] AstNode * value() const noexcept { return child(0); }
};

/// target = value
class AssignStmt : public NodeBase<AssignStmt, StmtNode, NodeKind::AssignStmt>
{
public:
  explicit AssignStmt(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}

  [[nodiscard]] const Identifier * target() const noexcept { return dyn_cast<Identifier>(child(0)); }
  [[nodiscard]] AstNode * value() const noexcept { return child(1); }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// `num x;` / `bool x;`
class Declaration : public NodeBase<Declaration, DeclNode, NodeKind::Declaration>
{
public:
  ValueType declaredType;

  Declaration(ValueType t, gsl::span<AstNode *> c, SourceRange r = {})
  : NodeBase(c, r), declaredType(t)
  {
  }

  [[nodiscard]] const Identifier * identifier() const noexcept
  {
    return dyn_cast<Identifier>(child(0));
  }
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  explicit Program(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(c, r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Get the SourceRange from any AST node.
[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace minilang
