// thingtalk/ast/slots.hpp - Slot iteration
//
// A slot is a value position in a tree that a dialogue agent may need to
// fill: an input parameter, the value of a filter, an element of an array
// value, a field of an operator. Slot iteration walks a tree in evaluation
// order and yields every slot together with the names that are in scope
// for parameter passing at that point.
//
// Order is a contract: for an invocation, the attributes of its device
// selector come first, then the selector itself, then the input parameters,
// then the slots of any filter applied to its result.
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "thingtalk/ast/program.hpp"

namespace thingtalk
{

// ============================================================================
// Scope
// ============================================================================

/// A name available for parameter passing
struct ScopeItem
{
  ValuePtr value;
  TypePtr type;
  std::optional<std::string> canonical;
  /// The invocation (or var ref, or external filter) producing the name
  const AstNode * primitive = nullptr;
  std::optional<std::string> kind;
  std::optional<std::string> kind_canonical;
};

using ScopeMap = std::map<std::string, ScopeItem>;

/**
 * The output arguments of a primitive, plus `$event`.
 * Empty when the primitive has no schema yet.
 */
[[nodiscard]] ScopeMap make_scope(const AstNode * primitive);

// ============================================================================
// Slots
// ============================================================================

class AbstractSlot;
using SlotPtr = std::shared_ptr<AbstractSlot>;

class AbstractSlot
{
public:
  virtual ~AbstractSlot() = default;

  /// The primitive the slot belongs to, if any
  [[nodiscard]] const AstNode * primitive() const noexcept { return primitive_; }
  [[nodiscard]] const ScopeMap & scope() const noexcept { return scope_; }

  /// The argument the slot fills, when known
  [[nodiscard]] virtual ArgumentDefPtr arg() const { return nullptr; }

  [[nodiscard]] virtual TypePtr type() const = 0;
  /// Stable identifier of the slot position, e.g. "in_param.title"
  [[nodiscard]] virtual std::string tag() const = 0;

  [[nodiscard]] virtual ValuePtr get() const = 0;
  virtual void set(ValuePtr value) = 0;

  /// Label of the filled argument, used to phrase questions
  [[nodiscard]] virtual std::string arg_canonical() const { return {}; }

  /// Names in scope whose type fits the slot
  [[nodiscard]] virtual std::vector<ScopeItem> options() const;

  [[nodiscard]] bool is_undefined() const;
  [[nodiscard]] bool is_concrete() const;
  /// Concrete and not a username where a different entity is expected
  [[nodiscard]] bool is_compilable() const;

protected:
  AbstractSlot(const AstNode * prim, ScopeMap scope) : primitive_(prim), scope_(std::move(scope))
  {
  }

private:
  const AstNode * primitive_;
  ScopeMap scope_;
};

class InputParamSlot : public AbstractSlot
{
public:
  InputParamSlot(const AstNode * prim, ScopeMap scope, ArgumentDefPtr arg, InputParam * param)
  : AbstractSlot(prim, std::move(scope)), arg_(std::move(arg)), param_(param)
  {
  }

  [[nodiscard]] ArgumentDefPtr arg() const override { return arg_; }
  [[nodiscard]] TypePtr type() const override;
  [[nodiscard]] std::string tag() const override { return "in_param." + param_->name; }
  [[nodiscard]] ValuePtr get() const override { return param_->value; }
  void set(ValuePtr value) override { param_->value = std::move(value); }
  [[nodiscard]] std::string arg_canonical() const override;

private:
  ArgumentDefPtr arg_;
  InputParam * param_;
};

/// An attribute of a device selector; always a String
class DeviceAttributeSlot : public AbstractSlot
{
public:
  DeviceAttributeSlot(const AstNode * prim, InputParam * attr)
  : AbstractSlot(prim, {}), attr_(attr)
  {
  }

  [[nodiscard]] TypePtr type() const override { return Type::string(); }
  [[nodiscard]] std::string tag() const override { return "attribute." + attr_->name; }
  [[nodiscard]] ValuePtr get() const override { return attr_->value; }
  void set(ValuePtr value) override { attr_->value = std::move(value); }

private:
  InputParam * attr_;
};

/**
 * The value of an atom filter. Its type follows the operator: `contains`
 * expects the element type of the argument, `in_array` an array of it.
 */
class FilterSlot : public AbstractSlot
{
public:
  FilterSlot(
    const AstNode * prim, ScopeMap scope, ArgumentDefPtr arg, AtomBooleanExpression * filter)
  : AbstractSlot(prim, std::move(scope)), arg_(std::move(arg)), filter_(filter)
  {
  }

  [[nodiscard]] ArgumentDefPtr arg() const override { return arg_; }
  [[nodiscard]] TypePtr type() const override;
  [[nodiscard]] std::string tag() const override
  {
    return "filter." + filter_->op + "." + filter_->name;
  }
  [[nodiscard]] ValuePtr get() const override { return filter_->value; }
  void set(ValuePtr value) override { filter_->value = std::move(value); }
  [[nodiscard]] std::string arg_canonical() const override;

  /// Excludes `$event` and the filtered argument itself
  [[nodiscard]] std::vector<ScopeItem> options() const override;

private:
  ArgumentDefPtr arg_;
  AtomBooleanExpression * filter_;
};

/// An element of an array value, or of a list of values held by an operator
class ArrayIndexSlot : public AbstractSlot
{
public:
  ArrayIndexSlot(
    const AstNode * prim, ScopeMap scope, TypePtr type, std::vector<ValuePtr> * array,
    std::string base_tag, size_t index, SlotPtr parent = nullptr)
  : AbstractSlot(prim, std::move(scope)),
    type_(std::move(type)),
    array_(array),
    base_tag_(std::move(base_tag)),
    index_(index),
    parent_(std::move(parent))
  {
  }

  [[nodiscard]] ArgumentDefPtr arg() const override { return parent_ ? parent_->arg() : nullptr; }
  [[nodiscard]] TypePtr type() const override { return type_; }
  [[nodiscard]] std::string tag() const override
  {
    return base_tag_ + "." + std::to_string(index_);
  }
  [[nodiscard]] ValuePtr get() const override { return (*array_)[index_]; }
  void set(ValuePtr value) override { (*array_)[index_] = std::move(value); }
  [[nodiscard]] std::string arg_canonical() const override
  {
    return parent_ ? parent_->arg_canonical() : std::string();
  }

private:
  TypePtr type_;
  std::vector<ValuePtr> * array_;
  std::string base_tag_;
  size_t index_;
  SlotPtr parent_;
};

/// An operand of a computation value
class ComputationOperandSlot : public AbstractSlot
{
public:
  ComputationOperandSlot(
    const AstNode * prim, ScopeMap scope, TypePtr type, std::string op,
    std::vector<ValuePtr> * operands, std::string base_tag, size_t index,
    SlotPtr parent = nullptr)
  : AbstractSlot(prim, std::move(scope)),
    type_(std::move(type)),
    op_(std::move(op)),
    operands_(operands),
    base_tag_(std::move(base_tag)),
    index_(index),
    parent_(std::move(parent))
  {
  }

  [[nodiscard]] ArgumentDefPtr arg() const override { return parent_ ? parent_->arg() : nullptr; }
  [[nodiscard]] TypePtr type() const override { return type_; }
  [[nodiscard]] std::string tag() const override
  {
    return base_tag_ + "." + op_ + "." + std::to_string(index_);
  }
  [[nodiscard]] ValuePtr get() const override { return (*operands_)[index_]; }
  void set(ValuePtr value) override { (*operands_)[index_] = std::move(value); }
  [[nodiscard]] std::string arg_canonical() const override
  {
    return parent_ ? parent_->arg_canonical() : std::string();
  }

private:
  TypePtr type_;
  std::string op_;
  std::vector<ValuePtr> * operands_;
  std::string base_tag_;
  size_t index_;
  SlotPtr parent_;
};

/// A named value field of a node, e.g. the interval of a timer
class FieldSlot : public AbstractSlot
{
public:
  FieldSlot(
    const AstNode * prim, ScopeMap scope, TypePtr type, ValuePtr * field, std::string base_tag,
    const std::string & field_name)
  : AbstractSlot(prim, std::move(scope)),
    type_(std::move(type)),
    field_(field),
    tag_(std::move(base_tag) + "." + field_name)
  {
  }

  [[nodiscard]] TypePtr type() const override { return type_; }
  [[nodiscard]] std::string tag() const override { return tag_; }
  [[nodiscard]] ValuePtr get() const override { return *field_; }
  void set(ValuePtr value) override { *field_ = std::move(value); }

private:
  TypePtr type_;
  ValuePtr * field_;
  std::string tag_;
};

// ============================================================================
// Iteration
// ============================================================================

/// Either a device selector to resolve, or a value slot
using SlotEntry = std::variant<DeviceSelector *, SlotPtr>;

/**
 * Slots of a tree, in evaluation order.
 *
 * The slots point into the tree: they stay valid while the tree is alive
 * and its structure is not changed, and set() writes into the tree.
 */
[[nodiscard]] std::vector<SlotEntry> iterate_slots(Program & program);
[[nodiscard]] std::vector<SlotEntry> iterate_slots(Statement & statement);
[[nodiscard]] std::vector<SlotEntry> iterate_slots(Table & table, const ScopeMap & scope = {});
[[nodiscard]] std::vector<SlotEntry> iterate_slots(Stream & stream, const ScopeMap & scope = {});
[[nodiscard]] std::vector<SlotEntry> iterate_slots(Action & action, const ScopeMap & scope = {});
[[nodiscard]] std::vector<SlotEntry> iterate_slots(
  Invocation & invocation, const ScopeMap & scope = {});
[[nodiscard]] std::vector<SlotEntry> iterate_slots(PermissionRule & rule);

/// Only the value slots, dropping device selectors
[[nodiscard]] std::vector<SlotPtr> value_slots(const std::vector<SlotEntry> & entries);

}  // namespace thingtalk
