// thingtalk/ast/expression.hpp - Selectors, invocations, filters and scalar expressions
//
// These are the pieces shared by every operator: the call site (a device
// selector plus a function name and bound input parameters), boolean
// filter predicates, and the scalar expressions that filters may compute.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "thingtalk/ast/function_def.hpp"
#include "thingtalk/ast/node.hpp"
#include "thingtalk/ast/values.hpp"

namespace thingtalk
{

// ============================================================================
// InputParam
// ============================================================================

/// A bound input parameter: `name = value`
class InputParam : public NodeBase<InputParam, AstNode, NodeKind::InputParam>
{
public:
  std::string name;
  ValuePtr value;

  InputParam(std::string n, ValuePtr v, SourceRange r = {});

  [[nodiscard]] InputParamPtr clone() const;
  [[nodiscard]] bool equals(const InputParam & other) const;
};

[[nodiscard]] std::vector<InputParamPtr> clone_in_params(const std::vector<InputParamPtr> & params);
[[nodiscard]] bool in_params_equal(
  const std::vector<InputParamPtr> & a, const std::vector<InputParamPtr> & b);

// ============================================================================
// Selectors
// ============================================================================

class Selector : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_selector_kind(node->kind); }

  [[nodiscard]] virtual SelectorPtr clone() const = 0;
  [[nodiscard]] virtual bool equals(const Selector & other) const = 0;

  /// The shared builtin selector (notify, return, save)
  [[nodiscard]] static SelectorPtr builtin();

protected:
  Selector(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/**
 * `@kind(id=..., attr=...)`.
 *
 * Without an id the selector matches any device of the kind, narrowed by
 * `attributes` when present; `all` asks to act on every matching device
 * instead of choosing one.
 */
class DeviceSelector : public NodeBase<DeviceSelector, Selector, NodeKind::DeviceSelector>
{
public:
  std::string kind;
  std::optional<std::string> id;
  std::vector<InputParamPtr> attributes;
  bool all;

  explicit DeviceSelector(
    std::string k, std::optional<std::string> i = std::nullopt,
    std::vector<InputParamPtr> attrs = {}, bool a = false, SourceRange r = {});

  [[nodiscard]] InputParamPtr get_attribute(const std::string & name) const;

  [[nodiscard]] SelectorPtr clone() const override;
  [[nodiscard]] bool equals(const Selector & other) const override;
};

/// Singleton; compare by identity
class BuiltinDevice : public NodeBase<BuiltinDevice, Selector, NodeKind::BuiltinDevice>
{
public:
  [[nodiscard]] static std::shared_ptr<BuiltinDevice> instance();

  [[nodiscard]] SelectorPtr clone() const override { return instance(); }
  [[nodiscard]] bool equals(const Selector & other) const override
  {
    return other.kind == NodeKind::BuiltinDevice;
  }

private:
  BuiltinDevice() = default;
};

// ============================================================================
// Invocation
// ============================================================================

/// A call to a function of a device: `@kind.channel(in_params)`
class Invocation : public NodeBase<Invocation, AstNode, NodeKind::Invocation>
{
public:
  SelectorPtr selector;
  std::string channel;
  std::vector<InputParamPtr> in_params;
  /// Null until type checking resolves it
  FunctionDefPtr schema;

  Invocation(
    SelectorPtr sel, std::string ch, std::vector<InputParamPtr> params = {},
    FunctionDefPtr s = nullptr, SourceRange r = {});

  [[nodiscard]] InvocationPtr clone() const;
  [[nodiscard]] bool equals(const Invocation & other) const;
};

// ============================================================================
// Scalar expressions
// ============================================================================

class ScalarExpression : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_scalar_kind(node->kind); }

  [[nodiscard]] virtual ScalarExpressionPtr clone() const = 0;
  [[nodiscard]] virtual bool equals(const ScalarExpression & other) const = 0;

protected:
  ScalarExpression(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

class PrimaryScalarExpression
: public NodeBase<PrimaryScalarExpression, ScalarExpression, NodeKind::PrimaryScalarExpression>
{
public:
  ValuePtr value;

  explicit PrimaryScalarExpression(ValuePtr v, SourceRange r = {});

  [[nodiscard]] ScalarExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const ScalarExpression & other) const override;
};

/// `op(operands...)`, e.g. distance(geo, $location.home)
class DerivedScalarExpression
: public NodeBase<DerivedScalarExpression, ScalarExpression, NodeKind::DerivedScalarExpression>
{
public:
  std::string op;
  std::vector<ScalarExpressionPtr> operands;

  DerivedScalarExpression(std::string o, std::vector<ScalarExpressionPtr> ops, SourceRange r = {});

  [[nodiscard]] ScalarExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const ScalarExpression & other) const override;
};

/// `op(field of list)`; without a field the whole list is aggregated (count)
class AggregationScalarExpression
: public NodeBase<
    AggregationScalarExpression, ScalarExpression, NodeKind::AggregationScalarExpression>
{
public:
  std::string op;
  std::optional<std::string> field;
  ValuePtr list;

  AggregationScalarExpression(
    std::string o, std::optional<std::string> f, ValuePtr l, SourceRange r = {});

  [[nodiscard]] ScalarExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const ScalarExpression & other) const override;
};

/// Call of a declared computation: `selector.name(args)`
class VarRefScalarExpression
: public NodeBase<VarRefScalarExpression, ScalarExpression, NodeKind::VarRefScalarExpression>
{
public:
  SelectorPtr selector;
  std::string name;
  std::vector<InputParamPtr> args;

  VarRefScalarExpression(
    SelectorPtr sel, std::string n, std::vector<InputParamPtr> a, SourceRange r = {});

  [[nodiscard]] ScalarExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const ScalarExpression & other) const override;
};

// ============================================================================
// Boolean expressions
// ============================================================================

class BooleanExpression : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_boolean_kind(node->kind); }

  [[nodiscard]] virtual BooleanExpressionPtr clone() const = 0;
  [[nodiscard]] virtual bool equals(const BooleanExpression & other) const = 0;

  /// The shared `true` filter
  [[nodiscard]] static BooleanExpressionPtr true_expr();
  /// The shared `false` filter
  [[nodiscard]] static BooleanExpressionPtr false_expr();

  [[nodiscard]] bool is_true() const noexcept { return kind == NodeKind::TrueBooleanExpression; }
  [[nodiscard]] bool is_false() const noexcept { return kind == NodeKind::FalseBooleanExpression; }

protected:
  BooleanExpression(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

[[nodiscard]] std::vector<BooleanExpressionPtr> clone_operands(
  const std::vector<BooleanExpressionPtr> & operands);

class AndBooleanExpression
: public NodeBase<AndBooleanExpression, BooleanExpression, NodeKind::AndBooleanExpression>
{
public:
  std::vector<BooleanExpressionPtr> operands;

  explicit AndBooleanExpression(std::vector<BooleanExpressionPtr> ops, SourceRange r = {});

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

class OrBooleanExpression
: public NodeBase<OrBooleanExpression, BooleanExpression, NodeKind::OrBooleanExpression>
{
public:
  std::vector<BooleanExpressionPtr> operands;

  explicit OrBooleanExpression(std::vector<BooleanExpressionPtr> ops, SourceRange r = {});

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

class NotBooleanExpression
: public NodeBase<NotBooleanExpression, BooleanExpression, NodeKind::NotBooleanExpression>
{
public:
  BooleanExpressionPtr expr;

  explicit NotBooleanExpression(BooleanExpressionPtr e, SourceRange r = {});

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

/// `name op value`, e.g. `title =~ "foo"`
class AtomBooleanExpression
: public NodeBase<AtomBooleanExpression, BooleanExpression, NodeKind::AtomBooleanExpression>
{
public:
  std::string name;
  std::string op;
  ValuePtr value;
  /// Operand and result types chosen by type checking
  std::vector<TypePtr> overload;

  AtomBooleanExpression(
    std::string n, std::string o, ValuePtr v, std::vector<TypePtr> ov = {}, SourceRange r = {});

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

/// A filter on the result of another query: `@kind.channel(in_params) { filter }`
class ExternalBooleanExpression
: public NodeBase<ExternalBooleanExpression, BooleanExpression, NodeKind::ExternalBooleanExpression>
{
public:
  SelectorPtr selector;
  std::string channel;
  std::vector<InputParamPtr> in_params;
  BooleanExpressionPtr filter;
  FunctionDefPtr schema;

  ExternalBooleanExpression(
    SelectorPtr sel, std::string ch, std::vector<InputParamPtr> params, BooleanExpressionPtr f,
    FunctionDefPtr s = nullptr, SourceRange r = {});

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

/// The user does not care about the value of `name`
class DontCareBooleanExpression
: public NodeBase<DontCareBooleanExpression, BooleanExpression, NodeKind::DontCareBooleanExpression>
{
public:
  std::string name;

  explicit DontCareBooleanExpression(std::string n, SourceRange r = {})
  : NodeBase(r), name(std::move(n))
  {
  }

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

/// Compares a computed scalar against a value: `lhs op rhs`
class ComputeBooleanExpression
: public NodeBase<ComputeBooleanExpression, BooleanExpression, NodeKind::ComputeBooleanExpression>
{
public:
  ScalarExpressionPtr lhs;
  std::string op;
  ValuePtr rhs;
  std::vector<TypePtr> overload;

  ComputeBooleanExpression(
    ScalarExpressionPtr l, std::string o, ValuePtr rv, std::vector<TypePtr> ov = {},
    SourceRange r = {});

  [[nodiscard]] BooleanExpressionPtr clone() const override;
  [[nodiscard]] bool equals(const BooleanExpression & other) const override;
};

/// Singleton; clone() returns the same instance
class TrueBooleanExpression
: public NodeBase<TrueBooleanExpression, BooleanExpression, NodeKind::TrueBooleanExpression>
{
public:
  [[nodiscard]] static std::shared_ptr<TrueBooleanExpression> instance();

  [[nodiscard]] BooleanExpressionPtr clone() const override { return instance(); }
  [[nodiscard]] bool equals(const BooleanExpression & other) const override
  {
    return other.is_true();
  }

private:
  TrueBooleanExpression() = default;
};

/// Singleton; clone() returns the same instance
class FalseBooleanExpression
: public NodeBase<FalseBooleanExpression, BooleanExpression, NodeKind::FalseBooleanExpression>
{
public:
  [[nodiscard]] static std::shared_ptr<FalseBooleanExpression> instance();

  [[nodiscard]] BooleanExpressionPtr clone() const override { return instance(); }
  [[nodiscard]] bool equals(const BooleanExpression & other) const override
  {
    return other.is_false();
  }

private:
  FalseBooleanExpression() = default;
};

}  // namespace thingtalk
