// thingtalk/ast/visitor.hpp - CRTP visitors for AST traversal
//
// AstVisitor dispatches on NodeKind to visit_<snake_name>() and falls back
// to one method per node family. RecursiveAstVisitor walks a whole tree:
// enter(node), then visit(node), then the children if visit returned true,
// then exit(node).
//
#pragma once

#include <functional>
#include <memory>
#include <type_traits>

#include "thingtalk/ast/ast_enums.hpp"
#include "thingtalk/ast/program.hpp"
#include "thingtalk/basic/casting.hpp"

namespace thingtalk
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

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
 * CRTP-based visitor.
 *
 * The derived class implements the visit methods it cares about:
 * @code
 *   class AtomCounter : public ConstAstVisitor<AtomCounter, int> {
 *   public:
 *     int visit_atom_boolean_expression(const AtomBooleanExpression *) { return 1; }
 *     int visit_node(const AstNode *) { return 0; }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  /// Dispatch to the visit method of the concrete node
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->get_kind()) {
#define AST_NODE(Class, Kind, Snake) \
  case NodeKind::Kind:               \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "thingtalk/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods: forward to the family
  // ===========================================================================

#define THINGTALK_VISIT_FAMILY(Class, Snake, Family, FamilyClass)           \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_##Family(                                    \
      static_cast<detail::propagate_const_t<NodePtrT, FamilyClass>>(node)); \
  }

#define AST_NODE_VALUE(Class, Kind, Snake) THINGTALK_VISIT_FAMILY(Class, Snake, value, Value)
#define AST_NODE_SELECTOR(Class, Kind, Snake) \
  THINGTALK_VISIT_FAMILY(Class, Snake, selector, Selector)
#define AST_NODE_BOOLEAN(Class, Kind, Snake) \
  THINGTALK_VISIT_FAMILY(Class, Snake, boolean_expression, BooleanExpression)
#define AST_NODE_SCALAR(Class, Kind, Snake) \
  THINGTALK_VISIT_FAMILY(Class, Snake, scalar_expression, ScalarExpression)
#define AST_NODE_TABLE(Class, Kind, Snake) THINGTALK_VISIT_FAMILY(Class, Snake, table, Table)
#define AST_NODE_STREAM(Class, Kind, Snake) THINGTALK_VISIT_FAMILY(Class, Snake, stream, Stream)
#define AST_NODE_ACTION(Class, Kind, Snake) THINGTALK_VISIT_FAMILY(Class, Snake, action, Action)
#define AST_NODE_PERMISSION(Class, Kind, Snake) \
  THINGTALK_VISIT_FAMILY(Class, Snake, permission_function, PermissionFunction)
#define AST_NODE_STMT(Class, Kind, Snake) \
  THINGTALK_VISIT_FAMILY(Class, Snake, statement, Statement)
#define AST_NODE_SUPPORT(Class, Kind, Snake) THINGTALK_VISIT_FAMILY(Class, Snake, node, AstNode)
#define AST_NODE_TOP(Class, Kind, Snake) THINGTALK_VISIT_FAMILY(Class, Snake, node, AstNode)
#include "thingtalk/ast/ast_nodes.def"

#undef THINGTALK_VISIT_FAMILY

  // ===========================================================================
  // Family-level visit methods
  // ===========================================================================

  ReturnType visit_value(detail::propagate_const_t<NodePtrT, Value> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_selector(detail::propagate_const_t<NodePtrT, Selector> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_boolean_expression(detail::propagate_const_t<NodePtrT, BooleanExpression> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_scalar_expression(detail::propagate_const_t<NodePtrT, ScalarExpression> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_table(detail::propagate_const_t<NodePtrT, Table> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stream(detail::propagate_const_t<NodePtrT, Stream> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_action(detail::propagate_const_t<NodePtrT, Action> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_permission_function(
    detail::propagate_const_t<NodePtrT, PermissionFunction> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_statement(detail::propagate_const_t<NodePtrT, Statement> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// Child enumeration
// ============================================================================

/**
 * Call `fn` on each direct child of `node`, in evaluation order.
 *
 * Signatures and function definitions are not AST nodes and are not
 * visited; neither are the functions of a ClassDef. Children are reached
 * through shared_ptr, so they are handed out non-const.
 */
void for_each_child(const AstNode * node, const std::function<void(AstNode *)> & fn);

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that walks a whole tree.
 *
 * For every node it calls enter(node), then visit(node); when that returns
 * true it recurses into the children, then calls exit(node). Override the
 * visit_<snake_name>() methods and return false to prune a subtree. Every
 * visit method returns true by default.
 *
 * @tparam Derived The derived visitor class
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  void traverse(NodePtrT node)
  {
    if (!node) {
      return;
    }
    get_derived().enter(node);
    if (get_derived().visit(node)) {
      for_each_child(node, [this](AstNode * child) { traverse(child); });
    }
    get_derived().exit(node);
  }

  template <typename T>
  void traverse(const std::shared_ptr<T> & node)
  {
    traverse(static_cast<NodePtrT>(node.get()));
  }

  void enter(NodePtrT /*node*/) {}
  void exit(NodePtrT /*node*/) {}

  bool visit_node(NodePtrT /*node*/) { return true; }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace thingtalk
