// thingtalk/ast/node.hpp - Base AST node, CRTP helper and forward declarations
//
// Trees are owned through std::shared_ptr: a parent owns its children, and
// the interned singletons (true/false filters, the builtin selector, the
// builtin and star permission functions) are shared by every tree that
// uses them. Nodes never point back to their parents.
//
#pragma once

#include <memory>
#include <vector>

#include "thingtalk/ast/ast_enums.hpp"
#include "thingtalk/basic/casting.hpp"
#include "thingtalk/basic/source_manager.hpp"

namespace thingtalk
{

// ============================================================================
// Forward declarations
// ============================================================================

#define AST_NODE(Class, Kind, Snake) class Class;
#include "thingtalk/ast/ast_nodes.def"

class Value;
class Selector;
class BooleanExpression;
class ScalarExpression;
class Table;
class Stream;
class Action;
class PermissionFunction;
class Statement;

class ArgumentDef;
class ExpressionSignature;
class FunctionDef;

using ValuePtr = std::shared_ptr<Value>;
using SelectorPtr = std::shared_ptr<Selector>;
using BooleanExpressionPtr = std::shared_ptr<BooleanExpression>;
using ScalarExpressionPtr = std::shared_ptr<ScalarExpression>;
using TablePtr = std::shared_ptr<Table>;
using StreamPtr = std::shared_ptr<Stream>;
using ActionPtr = std::shared_ptr<Action>;
using PermissionFunctionPtr = std::shared_ptr<PermissionFunction>;
using StatementPtr = std::shared_ptr<Statement>;
using InputParamPtr = std::shared_ptr<InputParam>;
using InvocationPtr = std::shared_ptr<Invocation>;
using ClassDefPtr = std::shared_ptr<ClassDef>;
using ProgramPtr = std::shared_ptr<Program>;

using ArgumentDefPtr = std::shared_ptr<ArgumentDef>;
using ExpressionSignaturePtr = std::shared_ptr<ExpressionSignature>;
using FunctionDefPtr = std::shared_ptr<FunctionDef>;

// ============================================================================
// AstNode
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind for RTTI (classof pattern) and a SourceRange,
 * which is invalid for nodes that were synthesized rather than parsed.
 * Nodes are non-copyable; use the clone() of the node family instead.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  virtual ~AstNode() = default;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

  [[nodiscard]] bool has_location() const noexcept { return range_.is_valid(); }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that implements classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The node family it belongs to
 * @tparam K The NodeKind of the concrete node
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Clone helpers
// ============================================================================

namespace detail
{

/// Deep copy of a possibly-null child
template <typename T>
[[nodiscard]] inline std::shared_ptr<T> clone_or_null(const std::shared_ptr<T> & node)
{
  return node ? std::static_pointer_cast<T>(node->clone()) : nullptr;
}

/// Deep copy of a list of children
template <typename T>
[[nodiscard]] inline std::vector<std::shared_ptr<T>> clone_all(
  const std::vector<std::shared_ptr<T>> & nodes)
{
  std::vector<std::shared_ptr<T>> out;
  out.reserve(nodes.size());
  for (const auto & n : nodes) {
    out.push_back(clone_or_null(n));
  }
  return out;
}

}  // namespace detail

}  // namespace thingtalk
