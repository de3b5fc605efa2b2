// minilang/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// Dispatch on NodeKind without virtual calls. Generated from ast_nodes.def.
//
#pragma once

#include <type_traits>

#include "minilang/ast/ast.hpp"
#include "minilang/ast/ast_enums.hpp"
#include "minilang/basic/casting.hpp"

namespace minilang
{

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements visit_<snake_name> for the node kinds it
 * cares about. Unhandled kinds fall back to visit_expr / visit_stmt /
 * visit_decl, and finally to visit_node.
 *
 * Usage:
 * @code
 *   class Printer : public ConstAstVisitor<Printer, void> {
 *   public:
 *     void visit_int_value(const IntValue* node) {
 *       std::cout << node->value << "\n";
 *     }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT The node pointer type (AstNode* or const AstNode*)
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "minilang/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (auto-generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "minilang/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, ExprNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, StmtNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, DeclNode> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

}  // namespace minilang
