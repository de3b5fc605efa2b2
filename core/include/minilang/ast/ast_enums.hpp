// minilang/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, value types and operator enumerations shared by the AST,
// the JSON interchange layer and semantic analysis.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace minilang
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "minilang/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "minilang/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "minilang/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "minilang/ast/ast_nodes.def"
};

// ============================================================================
// ValueType - The two primitive types of the language
// ============================================================================

enum class ValueType : uint8_t {
  Number,  ///< num
  Bool,    ///< bool
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators carried by the CompExpr/AddExpr/MulExpr/BoolExpr layers.
 */
enum class BinaryOp : uint8_t {
  // Comparison (CompExpr)
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Additive (AddExpr)
  Add,  ///< +
  Sub,  ///< -
  // Multiplicative (MulExpr)
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Logical (BoolExpr)
  And,  ///< &&
  Or,   ///< ||
};

/**
 * Prefix operators carried by NotExpr (!) and UnaExpr (-).
 */
enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Kind;
#include "minilang/ast/ast_nodes.def"
  }
  return "";
}

/// Source keyword of a value type ("num" / "bool")
[[nodiscard]] constexpr std::string_view to_keyword(ValueType type) noexcept
{
  switch (type) {
    case ValueType::Number:
      return "num";
    case ValueType::Bool:
      return "bool";
  }
  return "";
}

/// Display name of a value type ("Number" / "Bool")
[[nodiscard]] constexpr std::string_view to_string(ValueType type) noexcept
{
  switch (type) {
    case ValueType::Number:
      return "Number";
    case ValueType::Bool:
      return "Bool";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

// ============================================================================
// Parsing Helpers (used by the JSON interchange reader)
// ============================================================================

[[nodiscard]] constexpr std::optional<NodeKind> parse_node_kind(std::string_view name) noexcept
{
#define AST_NODE_EXPR(Class, Kind, Snake) \
  if (name == #Kind) return NodeKind::Kind;
#define AST_NODE_STMT(Class, Kind, Snake) \
  if (name == #Kind) return NodeKind::Kind;
#define AST_NODE_DECL(Class, Kind, Snake) \
  if (name == #Kind) return NodeKind::Kind;
#define AST_NODE_TOP(Class, Kind, Snake) \
  if (name == #Kind) return NodeKind::Kind;
#include "minilang/ast/ast_nodes.def"
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<ValueType> parse_value_type(std::string_view keyword) noexcept
{
  if (keyword == "num") return ValueType::Number;
  if (keyword == "bool") return ValueType::Bool;
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<BinaryOp> parse_binary_op(std::string_view text) noexcept
{
  if (text == "==") return BinaryOp::Eq;
  if (text == "!=") return BinaryOp::Ne;
  if (text == "<") return BinaryOp::Lt;
  if (text == "<=") return BinaryOp::Le;
  if (text == ">") return BinaryOp::Gt;
  if (text == ">=") return BinaryOp::Ge;
  if (text == "+") return BinaryOp::Add;
  if (text == "-") return BinaryOp::Sub;
  if (text == "*") return BinaryOp::Mul;
  if (text == "/") return BinaryOp::Div;
  if (text == "%") return BinaryOp::Mod;
  if (text == "&&") return BinaryOp::And;
  if (text == "||") return BinaryOp::Or;
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<UnaryOp> parse_unary_op(std::string_view text) noexcept
{
  if (text == "!") return UnaryOp::Not;
  if (text == "-") return UnaryOp::Neg;
  return std::nullopt;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Expr;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Identifier;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Block;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::AssignStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::Declaration;
inline constexpr NodeKind k_last_decl_kind = NodeKind::Declaration;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

/// Binary precedence layer (CompExpr, AddExpr, MulExpr, BoolExpr)
[[nodiscard]] constexpr bool is_binary_layer_kind(NodeKind kind) noexcept
{
  return kind == NodeKind::CompExpr || kind == NodeKind::AddExpr || kind == NodeKind::MulExpr ||
         kind == NodeKind::BoolExpr;
}

/// Check whether `op` belongs to the precedence layer `kind`
[[nodiscard]] constexpr bool is_operator_of_layer(NodeKind kind, BinaryOp op) noexcept
{
  switch (kind) {
    case NodeKind::CompExpr:
      return op == BinaryOp::Eq || op == BinaryOp::Ne || op == BinaryOp::Lt ||
             op == BinaryOp::Le || op == BinaryOp::Gt || op == BinaryOp::Ge;
    case NodeKind::AddExpr:
      return op == BinaryOp::Add || op == BinaryOp::Sub;
    case NodeKind::MulExpr:
      return op == BinaryOp::Mul || op == BinaryOp::Div || op == BinaryOp::Mod;
    case NodeKind::BoolExpr:
      return op == BinaryOp::And || op == BinaryOp::Or;
    default:
      return false;
  }
}

}  // namespace minilang
