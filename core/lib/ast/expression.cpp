// thingtalk/ast/expression.cpp - Selectors, invocations, filters and scalar expressions
#include "thingtalk/ast/expression.hpp"

#include "thingtalk/basic/errors.hpp"

namespace thingtalk
{

namespace
{

template <typename T, typename Base>
const T * same_kind(const T & self, const Base & other)
{
  if (other.kind != self.get_kind()) {
    return nullptr;
  }
  return static_cast<const T *>(&other);
}

bool boolean_operands_equal(
  const std::vector<BooleanExpressionPtr> & a, const std::vector<BooleanExpressionPtr> & b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!a[i]->equals(*b[i])) {
      return false;
    }
  }
  return true;
}

bool types_equal(const std::vector<TypePtr> & a, const std::vector<TypePtr> & b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!type_equals(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

bool selectors_equal(const SelectorPtr & a, const SelectorPtr & b)
{
  if (a == b) {
    return true;
  }
  return a && b && a->equals(*b);
}

FunctionDefPtr clone_schema(const FunctionDefPtr & schema)
{
  return schema ? schema->clone_function() : nullptr;
}

}  // namespace

// ============================================================================
// InputParam
// ============================================================================

InputParam::InputParam(std::string n, ValuePtr v, SourceRange r)
: NodeBase(r), name(std::move(n)), value(detail::require_node(std::move(v), "InputParam value"))
{
}

InputParamPtr InputParam::clone() const
{
  return std::make_shared<InputParam>(name, value->clone(), range_);
}

bool InputParam::equals(const InputParam & other) const
{
  return name == other.name && value->equals(*other.value);
}

std::vector<InputParamPtr> clone_in_params(const std::vector<InputParamPtr> & params)
{
  std::vector<InputParamPtr> out;
  out.reserve(params.size());
  for (const auto & p : params) {
    out.push_back(p->clone());
  }
  return out;
}

bool in_params_equal(const std::vector<InputParamPtr> & a, const std::vector<InputParamPtr> & b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!a[i]->equals(*b[i])) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// Selectors
// ============================================================================

SelectorPtr Selector::builtin() { return BuiltinDevice::instance(); }

DeviceSelector::DeviceSelector(
  std::string k, std::optional<std::string> i, std::vector<InputParamPtr> attrs, bool a,
  SourceRange r)
: NodeBase(r), kind(std::move(k)), id(std::move(i)), attributes(std::move(attrs)), all(a)
{
  for (const auto & attr : attributes) {
    detail::require_node(attr, "DeviceSelector attribute");
  }
}

InputParamPtr DeviceSelector::get_attribute(const std::string & name) const
{
  for (const auto & attr : attributes) {
    if (attr->name == name) {
      return attr;
    }
  }
  return nullptr;
}

SelectorPtr DeviceSelector::clone() const
{
  return std::make_shared<DeviceSelector>(kind, id, clone_in_params(attributes), all, range_);
}

bool DeviceSelector::equals(const Selector & other) const
{
  const auto * o = dyn_cast<DeviceSelector>(&other);
  return o && o->kind == kind && o->id == id && o->all == all &&
         in_params_equal(attributes, o->attributes);
}

std::shared_ptr<BuiltinDevice> BuiltinDevice::instance()
{
  static const std::shared_ptr<BuiltinDevice> builtin(new BuiltinDevice());
  return builtin;
}

// ============================================================================
// Invocation
// ============================================================================

Invocation::Invocation(
  SelectorPtr sel, std::string ch, std::vector<InputParamPtr> params, FunctionDefPtr s,
  SourceRange r)
: NodeBase(r),
  selector(detail::require_node(std::move(sel), "Invocation selector")),
  channel(std::move(ch)),
  in_params(std::move(params)),
  schema(std::move(s))
{
  for (const auto & p : in_params) {
    detail::require_node(p, "Invocation input parameter");
  }
}

InvocationPtr Invocation::clone() const
{
  return std::make_shared<Invocation>(
    selector->clone(), channel, clone_in_params(in_params), clone_schema(schema), range_);
}

bool Invocation::equals(const Invocation & other) const
{
  return channel == other.channel && selectors_equal(selector, other.selector) &&
         in_params_equal(in_params, other.in_params);
}

// ============================================================================
// Scalar expressions
// ============================================================================

PrimaryScalarExpression::PrimaryScalarExpression(ValuePtr v, SourceRange r)
: NodeBase(r), value(detail::require_node(std::move(v), "PrimaryScalarExpression value"))
{
}

ScalarExpressionPtr PrimaryScalarExpression::clone() const
{
  return std::make_shared<PrimaryScalarExpression>(value->clone(), range_);
}

bool PrimaryScalarExpression::equals(const ScalarExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && value->equals(*o->value);
}

DerivedScalarExpression::DerivedScalarExpression(
  std::string o, std::vector<ScalarExpressionPtr> ops, SourceRange r)
: NodeBase(r), op(std::move(o)), operands(std::move(ops))
{
  for (const auto & operand : operands) {
    detail::require_node(operand, "DerivedScalarExpression operand");
  }
}

ScalarExpressionPtr DerivedScalarExpression::clone() const
{
  return std::make_shared<DerivedScalarExpression>(op, detail::clone_all(operands), range_);
}

bool DerivedScalarExpression::equals(const ScalarExpression & other) const
{
  const auto * o = same_kind(*this, other);
  if (!o || o->op != op || o->operands.size() != operands.size()) {
    return false;
  }
  for (size_t i = 0; i < operands.size(); ++i) {
    if (!operands[i]->equals(*o->operands[i])) {
      return false;
    }
  }
  return true;
}

AggregationScalarExpression::AggregationScalarExpression(
  std::string o, std::optional<std::string> f, ValuePtr l, SourceRange r)
: NodeBase(r),
  op(std::move(o)),
  field(std::move(f)),
  list(detail::require_node(std::move(l), "AggregationScalarExpression list"))
{
}

ScalarExpressionPtr AggregationScalarExpression::clone() const
{
  return std::make_shared<AggregationScalarExpression>(op, field, list->clone(), range_);
}

bool AggregationScalarExpression::equals(const ScalarExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && o->op == op && o->field == field && list->equals(*o->list);
}

VarRefScalarExpression::VarRefScalarExpression(
  SelectorPtr sel, std::string n, std::vector<InputParamPtr> a, SourceRange r)
: NodeBase(r),
  selector(detail::require_node(std::move(sel), "VarRefScalarExpression selector")),
  name(std::move(n)),
  args(std::move(a))
{
}

ScalarExpressionPtr VarRefScalarExpression::clone() const
{
  return std::make_shared<VarRefScalarExpression>(
    selector->clone(), name, clone_in_params(args), range_);
}

bool VarRefScalarExpression::equals(const ScalarExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && o->name == name && selectors_equal(selector, o->selector) &&
         in_params_equal(args, o->args);
}

// ============================================================================
// Boolean expressions
// ============================================================================

BooleanExpressionPtr BooleanExpression::true_expr() { return TrueBooleanExpression::instance(); }

BooleanExpressionPtr BooleanExpression::false_expr() { return FalseBooleanExpression::instance(); }

std::shared_ptr<TrueBooleanExpression> TrueBooleanExpression::instance()
{
  static const std::shared_ptr<TrueBooleanExpression> instance(new TrueBooleanExpression());
  return instance;
}

std::shared_ptr<FalseBooleanExpression> FalseBooleanExpression::instance()
{
  static const std::shared_ptr<FalseBooleanExpression> instance(new FalseBooleanExpression());
  return instance;
}

std::vector<BooleanExpressionPtr> clone_operands(const std::vector<BooleanExpressionPtr> & operands)
{
  return detail::clone_all(operands);
}

AndBooleanExpression::AndBooleanExpression(std::vector<BooleanExpressionPtr> ops, SourceRange r)
: NodeBase(r), operands(std::move(ops))
{
  for (const auto & operand : operands) {
    detail::require_node(operand, "AndBooleanExpression operand");
  }
}

BooleanExpressionPtr AndBooleanExpression::clone() const
{
  return std::make_shared<AndBooleanExpression>(clone_operands(operands), range_);
}

bool AndBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && boolean_operands_equal(operands, o->operands);
}

OrBooleanExpression::OrBooleanExpression(std::vector<BooleanExpressionPtr> ops, SourceRange r)
: NodeBase(r), operands(std::move(ops))
{
  for (const auto & operand : operands) {
    detail::require_node(operand, "OrBooleanExpression operand");
  }
}

BooleanExpressionPtr OrBooleanExpression::clone() const
{
  return std::make_shared<OrBooleanExpression>(clone_operands(operands), range_);
}

bool OrBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && boolean_operands_equal(operands, o->operands);
}

NotBooleanExpression::NotBooleanExpression(BooleanExpressionPtr e, SourceRange r)
: NodeBase(r), expr(detail::require_node(std::move(e), "NotBooleanExpression operand"))
{
}

BooleanExpressionPtr NotBooleanExpression::clone() const
{
  return std::make_shared<NotBooleanExpression>(expr->clone(), range_);
}

bool NotBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && expr->equals(*o->expr);
}

AtomBooleanExpression::AtomBooleanExpression(
  std::string n, std::string o, ValuePtr v, std::vector<TypePtr> ov, SourceRange r)
: NodeBase(r),
  name(std::move(n)),
  op(std::move(o)),
  value(detail::require_node(std::move(v), "AtomBooleanExpression value")),
  overload(std::move(ov))
{
}

BooleanExpressionPtr AtomBooleanExpression::clone() const
{
  return std::make_shared<AtomBooleanExpression>(name, op, value->clone(), overload, range_);
}

bool AtomBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && o->name == name && o->op == op && value->equals(*o->value);
}

ExternalBooleanExpression::ExternalBooleanExpression(
  SelectorPtr sel, std::string ch, std::vector<InputParamPtr> params, BooleanExpressionPtr f,
  FunctionDefPtr s, SourceRange r)
: NodeBase(r),
  selector(detail::require_node(std::move(sel), "ExternalBooleanExpression selector")),
  channel(std::move(ch)),
  in_params(std::move(params)),
  filter(detail::require_node(std::move(f), "ExternalBooleanExpression filter")),
  schema(std::move(s))
{
}

BooleanExpressionPtr ExternalBooleanExpression::clone() const
{
  return std::make_shared<ExternalBooleanExpression>(
    selector->clone(), channel, clone_in_params(in_params), filter->clone(), clone_schema(schema),
    range_);
}

bool ExternalBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && o->channel == channel && selectors_equal(selector, o->selector) &&
         in_params_equal(in_params, o->in_params) && filter->equals(*o->filter);
}

BooleanExpressionPtr DontCareBooleanExpression::clone() const
{
  return std::make_shared<DontCareBooleanExpression>(name, range_);
}

bool DontCareBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && o->name == name;
}

ComputeBooleanExpression::ComputeBooleanExpression(
  ScalarExpressionPtr l, std::string o, ValuePtr rv, std::vector<TypePtr> ov, SourceRange r)
: NodeBase(r),
  lhs(detail::require_node(std::move(l), "ComputeBooleanExpression lhs")),
  op(std::move(o)),
  rhs(detail::require_node(std::move(rv), "ComputeBooleanExpression rhs")),
  overload(std::move(ov))
{
}

BooleanExpressionPtr ComputeBooleanExpression::clone() const
{
  return std::make_shared<ComputeBooleanExpression>(
    lhs->clone(), op, rhs->clone(), overload, range_);
}

bool ComputeBooleanExpression::equals(const BooleanExpression & other) const
{
  const auto * o = same_kind(*this, other);
  return o && o->op == op && lhs->equals(*o->lhs) && rhs->equals(*o->rhs) &&
         types_equal(overload, o->overload);
}

}  // namespace thingtalk
