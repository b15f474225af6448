// thingtalk/ast/slots.cpp - Slot iteration
#include "thingtalk/ast/slots.hpp"

#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"

namespace thingtalk
{

// ============================================================================
// Scope
// ============================================================================

namespace
{

ScopeMap scope_from_schema(
  const AstNode * prim, const ExpressionSignature * schema, std::optional<std::string> kind)
{
  if (!schema) {
    return {};
  }

  std::optional<std::string> kind_canonical;
  if (auto klass = schema->get_class()) {
    kind_canonical = klass->canonical();
  }

  ScopeMap scope;
  for (const auto & [name, type] : schema->out()) {
    ScopeItem item;
    item.value = std::make_shared<VarRefValue>(name);
    item.type = type;
    item.canonical = schema->get_arg_canonical(name);
    item.primitive = prim;
    item.kind = kind;
    item.kind_canonical = kind_canonical;
    scope.emplace(name, std::move(item));
  }

  ScopeItem event;
  event.value = std::make_shared<EventValue>();
  event.type = Type::string();
  scope.emplace("$event", std::move(event));
  return scope;
}

std::optional<std::string> selector_kind(const Selector * selector)
{
  if (const auto * dev = dyn_cast_or_null<DeviceSelector>(selector)) {
    return dev->kind;
  }
  return std::nullopt;
}

}  // namespace

ScopeMap make_scope(const AstNode * primitive)
{
  if (!primitive) {
    return {};
  }
  if (const auto * inv = dyn_cast<Invocation>(primitive)) {
    return scope_from_schema(inv, inv->schema.get(), selector_kind(inv->selector.get()));
  }
  if (const auto * ext = dyn_cast<ExternalBooleanExpression>(primitive)) {
    return scope_from_schema(ext, ext->schema.get(), selector_kind(ext->selector.get()));
  }
  if (const auto * fn = dyn_cast<SpecifiedPermissionFunction>(primitive)) {
    return scope_from_schema(fn, fn->schema.get(), fn->kind);
  }
  if (const auto * table = dyn_cast<Table>(primitive)) {
    return scope_from_schema(table, table->schema.get(), std::nullopt);
  }
  if (const auto * stream = dyn_cast<Stream>(primitive)) {
    return scope_from_schema(stream, stream->schema.get(), std::nullopt);
  }
  if (const auto * action = dyn_cast<Action>(primitive)) {
    return scope_from_schema(action, action->schema.get(), std::nullopt);
  }
  return {};
}

// ============================================================================
// Slots
// ============================================================================

std::vector<ScopeItem> AbstractSlot::options() const
{
  std::vector<ScopeItem> out;
  const TypePtr slot_type = type();
  for (const auto & [name, item] : scope_) {
    if (item.type && is_assignable(*item.type, *slot_type)) {
      out.push_back(item);
    }
  }
  return out;
}

bool AbstractSlot::is_undefined() const
{
  const ValuePtr value = get();
  return value && value->is_undefined();
}

bool AbstractSlot::is_concrete() const
{
  const ValuePtr value = get();
  return value && value->is_concrete();
}

bool AbstractSlot::is_compilable() const
{
  const ValuePtr value = get();
  if (!value || value->is_undefined() || !value->is_concrete()) {
    return false;
  }

  // a username must be resolved to the entity the slot expects
  const TypePtr value_type = value->get_type();
  const TypePtr slot_type = type();
  if (
    value_type->is_entity() && slot_type->is_entity() && value_type->name == "tt:username" &&
    slot_type->name != "tt:username") {
    return false;
  }
  return true;
}

TypePtr InputParamSlot::type() const { return arg_ ? arg_->type : Type::any(); }

std::string InputParamSlot::arg_canonical() const
{
  return arg_ ? arg_->canonical() : clean(param_->name);
}

TypePtr FilterSlot::type() const
{
  const TypePtr arg_type = arg_ ? arg_->type : Type::any();
  const std::string & op = filter_->op;

  if (op == "contains") {
    return arg_type->is_array() && arg_type->elem ? arg_type->elem : Type::any();
  }
  if (op == "contains~" || op == "~contains" || op == "~in_array") {
    return Type::string();
  }
  if (op == "in_array") {
    return Type::array(arg_type);
  }
  if (op == "in_array~") {
    return Type::array(Type::string());
  }
  return arg_type;
}

std::string FilterSlot::arg_canonical() const
{
  return arg_ ? arg_->canonical() : clean(filter_->name);
}

std::vector<ScopeItem> FilterSlot::options() const
{
  std::vector<ScopeItem> out;
  const TypePtr slot_type = type();
  for (const auto & [name, item] : scope()) {
    if (!item.type || !is_assignable(*item.type, *slot_type)) {
      continue;
    }
    // `x == x` is never a useful filter
    if (const auto * ref = dyn_cast_or_null<VarRefValue>(item.value.get())) {
      if (ref->name == filter_->name && item.primitive == primitive()) {
        continue;
      }
    }
    if (item.value && isa<EventValue>(item.value.get())) {
      continue;
    }
    out.push_back(item);
  }
  return out;
}

// ============================================================================
// Iteration
// ============================================================================

namespace
{

/// Result of walking an expression: the primitive whose outputs are visible
/// downstream, and the names they bring into scope
struct Walked
{
  const AstNode * primitive = nullptr;
  ScopeMap scope;
};

class SlotCollector
{
public:
  std::vector<SlotEntry> entries;

  void yield_recursive(const SlotPtr & slot)
  {
    entries.emplace_back(slot);

    ValuePtr value = slot->get();
    if (!value) {
      return;
    }
    if (auto * array = dyn_cast<ArrayValue>(value.get())) {
      const TypePtr type = slot->type();
      const TypePtr elem = type->is_array() && type->elem ? type->elem : Type::any();
      for (size_t i = 0; i < array->value.size(); ++i) {
        yield_recursive(std::make_shared<ArrayIndexSlot>(
          slot->primitive(), slot->scope(), elem, &array->value, slot->tag(), i, slot));
      }
    } else if (auto * comp = dyn_cast<ComputationValue>(value.get())) {
      for (size_t i = 0; i < comp->operands.size(); ++i) {
        const TypePtr type =
          i < comp->overload.size() && comp->overload[i] ? comp->overload[i] : Type::any();
        yield_recursive(std::make_shared<ComputationOperandSlot>(
          slot->primitive(), slot->scope(), type, comp->op, &comp->operands, slot->tag(), i,
          slot));
      }
    }
  }

  void field(
    const AstNode * prim, const ScopeMap & scope, TypePtr type, ValuePtr & slot,
    const std::string & base, const std::string & name)
  {
    if (!slot) {
      return;
    }
    yield_recursive(std::make_shared<FieldSlot>(prim, scope, std::move(type), &slot, base, name));
  }

  void in_params(
    const AstNode * prim, const ExpressionSignature * schema, std::vector<InputParamPtr> & params,
    const ScopeMap & scope)
  {
    for (auto & param : params) {
      ArgumentDefPtr arg = schema ? schema->get_argument(param->name) : nullptr;
      yield_recursive(std::make_shared<InputParamSlot>(prim, scope, std::move(arg), param.get()));
    }
  }

  Walked invocation(Invocation & inv, const ScopeMap & scope)
  {
    if (auto * dev = dyn_cast<DeviceSelector>(inv.selector.get())) {
      for (auto & attr : dev->attributes) {
        entries.emplace_back(std::make_shared<DeviceAttributeSlot>(&inv, attr.get()));
      }
      // the selector comes after its attributes, which narrow the choice of device
      entries.emplace_back(dev);
    }
    in_params(&inv, inv.schema.get(), inv.in_params, scope);
    return {&inv, make_scope(&inv)};
  }

  Walked var_ref(AstNode * prim, ExpressionSignature * schema, std::vector<InputParamPtr> & params,
                 const ScopeMap & scope)
  {
    in_params(prim, schema, params, scope);
    return {prim, make_scope(prim)};
  }

  static ScopeMap restrict_scope(const ScopeMap & scope, const std::vector<std::string> & names)
  {
    ScopeMap out;
    for (const auto & name : names) {
      auto it = scope.find(name);
      if (it != scope.end()) {
        out.emplace(name, it->second);
      }
    }
    return out;
  }

  static ScopeMap merge_scope(ScopeMap left, const ScopeMap & right)
  {
    for (const auto & [name, item] : right) {
      left[name] = item;
    }
    return left;
  }

  // --------------------------------------------------------------------------
  // Filters
  // --------------------------------------------------------------------------

  void scalar(
    ScalarExpression & expr, const AstNode * prim, const ScopeMap & scope, const TypePtr & hint,
    const std::string & base, const std::string & name)
  {
    switch (expr.get_kind()) {
      case NodeKind::PrimaryScalarExpression: {
        auto & primary = *cast<PrimaryScalarExpression>(&expr);
        TypePtr type = hint ? hint : (primary.value ? primary.value->get_type() : Type::any());
        field(prim, scope, std::move(type), primary.value, base, name);
        break;
      }
      case NodeKind::DerivedScalarExpression: {
        auto & derived = *cast<DerivedScalarExpression>(&expr);
        const std::string nested = base + "." + name + "." + derived.op;
        for (size_t i = 0; i < derived.operands.size(); ++i) {
          scalar(*derived.operands[i], prim, scope, nullptr, nested, std::to_string(i));
        }
        break;
      }
      case NodeKind::AggregationScalarExpression: {
        auto & agg = *cast<AggregationScalarExpression>(&expr);
        TypePtr type = agg.list ? agg.list->get_type() : Type::any();
        field(prim, scope, std::move(type), agg.list, base + "." + name, agg.op);
        break;
      }
      case NodeKind::VarRefScalarExpression: {
        auto & ref = *cast<VarRefScalarExpression>(&expr);
        in_params(prim, nullptr, ref.args, scope);
        break;
      }
      default:
        break;
    }
  }

  void filter(
    BooleanExpression & expr, const ExpressionSignature * schema, const AstNode * prim,
    const ScopeMap & scope)
  {
    switch (expr.get_kind()) {
      case NodeKind::AndBooleanExpression:
        for (auto & op : cast<AndBooleanExpression>(&expr)->operands) {
          filter(*op, schema, prim, scope);
        }
        break;
      case NodeKind::OrBooleanExpression:
        for (auto & op : cast<OrBooleanExpression>(&expr)->operands) {
          filter(*op, schema, prim, scope);
        }
        break;
      case NodeKind::NotBooleanExpression:
        filter(*cast<NotBooleanExpression>(&expr)->expr, schema, prim, scope);
        break;
      case NodeKind::AtomBooleanExpression: {
        auto * atom = cast<AtomBooleanExpression>(&expr);
        ArgumentDefPtr arg = schema ? schema->get_argument(atom->name) : nullptr;
        yield_recursive(std::make_shared<FilterSlot>(prim, scope, std::move(arg), atom));
        break;
      }
      case NodeKind::ExternalBooleanExpression: {
        auto * ext = cast<ExternalBooleanExpression>(&expr);
        // only the selector itself; its attributes are not slots here, unlike
        // the attributes of an invocation
        if (auto * dev = dyn_cast<DeviceSelector>(ext->selector.get())) {
          entries.emplace_back(dev);
        }
        in_params(ext, ext->schema.get(), ext->in_params, scope);
        filter(*ext->filter, ext->schema.get(), ext, make_scope(ext));
        break;
      }
      case NodeKind::ComputeBooleanExpression: {
        auto * compute = cast<ComputeBooleanExpression>(&expr);
        const TypePtr lhs_type = !compute->overload.empty() ? compute->overload[0] : nullptr;
        scalar(*compute->lhs, prim, scope, lhs_type, "compute_filter", "lhs");
        TypePtr rhs_type = compute->overload.size() > 1 && compute->overload[1]
                             ? compute->overload[1]
                             : compute->rhs->get_type();
        field(prim, scope, std::move(rhs_type), compute->rhs, "compute_filter", "rhs");
        break;
      }
      default:
        // true, false and don't-care filters have no slots
        break;
    }
  }

  // --------------------------------------------------------------------------
  // Tables, streams, actions
  // --------------------------------------------------------------------------

  Walked table(Table & node, const ScopeMap & scope)
  {
    switch (node.get_kind()) {
      case NodeKind::VarRefTable: {
        auto & t = *cast<VarRefTable>(&node);
        return var_ref(&t, t.schema.get(), t.in_params, scope);
      }
      case NodeKind::ResultRefTable: {
        auto & t = *cast<ResultRefTable>(&node);
        ScopeMap inner = make_scope(&t);
        field(&t, inner, Type::number(), t.index, "result_ref", "index");
        return {&t, std::move(inner)};
      }
      case NodeKind::InvocationTable:
        return invocation(*cast<InvocationTable>(&node)->invocation, scope);
      case NodeKind::FilteredTable: {
        auto & t = *cast<FilteredTable>(&node);
        Walked inner = table(*t.table, scope);
        filter(*t.filter, t.table->schema.get(), inner.primitive, inner.scope);
        return inner;
      }
      case NodeKind::ProjectionTable: {
        auto & t = *cast<ProjectionTable>(&node);
        Walked inner = table(*t.table, scope);
        return {inner.primitive, restrict_scope(inner.scope, t.args)};
      }
      case NodeKind::IndexTable: {
        auto & t = *cast<IndexTable>(&node);
        Walked inner = table(*t.table, scope);
        for (size_t i = 0; i < t.indices.size(); ++i) {
          yield_recursive(std::make_shared<ArrayIndexSlot>(
            inner.primitive, inner.scope, Type::number(), &t.indices, "table.index", i));
        }
        return inner;
      }
      case NodeKind::SlicedTable: {
        auto & t = *cast<SlicedTable>(&node);
        Walked inner = table(*t.table, scope);
        field(inner.primitive, inner.scope, Type::number(), t.base, "slice", "base");
        field(inner.primitive, inner.scope, Type::number(), t.limit, "slice", "limit");
        return inner;
      }
      case NodeKind::ComputeTable:
        return table(*cast<ComputeTable>(&node)->table, scope);
      case NodeKind::AliasTable:
        return table(*cast<AliasTable>(&node)->table, scope);
      case NodeKind::AggregationTable:
        return table(*cast<AggregationTable>(&node)->table, scope);
      case NodeKind::SortedTable:
        return table(*cast<SortedTable>(&node)->table, scope);
      case NodeKind::JoinTable: {
        auto & t = *cast<JoinTable>(&node);
        Walked left = table(*t.lhs, scope);
        Walked right = table(*t.rhs, scope);
        return {nullptr, merge_scope(std::move(left.scope), right.scope)};
      }
      case NodeKind::WindowTable: {
        auto & t = *cast<WindowTable>(&node);
        return history(stream(*t.stream, scope), Type::number(), Type::number(), t.base, t.delta);
      }
      case NodeKind::TimeSeriesTable: {
        auto & t = *cast<TimeSeriesTable>(&node);
        return history(
          stream(*t.stream, scope), Type::date(), Type::measure("ms"), t.base, t.delta);
      }
      case NodeKind::SequenceTable: {
        auto & t = *cast<SequenceTable>(&node);
        return history(table(*t.table, scope), Type::number(), Type::number(), t.base, t.delta);
      }
      case NodeKind::HistoryTable: {
        auto & t = *cast<HistoryTable>(&node);
        return history(
          table(*t.table, scope), Type::date(), Type::measure("ms"), t.base, t.delta);
      }
      default:
        throw InvariantError("Cannot iterate slots of " + std::string(to_string(node.get_kind())));
    }
  }

  Walked history(Walked inner, TypePtr base_type, TypePtr delta_type, ValuePtr & base,
                 ValuePtr & delta)
  {
    field(inner.primitive, inner.scope, std::move(base_type), base, "history", "base");
    field(inner.primitive, inner.scope, std::move(delta_type), delta, "history", "delta");
    return inner;
  }

  Walked stream(Stream & node, const ScopeMap & scope)
  {
    switch (node.get_kind()) {
      case NodeKind::VarRefStream: {
        auto & s = *cast<VarRefStream>(&node);
        return var_ref(&s, s.schema.get(), s.in_params, scope);
      }
      case NodeKind::TimerStream: {
        auto & s = *cast<TimerStream>(&node);
        field(nullptr, scope, Type::date(), s.base, "timer", "base");
        field(nullptr, scope, Type::measure("ms"), s.interval, "timer", "interval");
        field(nullptr, scope, Type::number(), s.frequency, "timer", "frequency");
        return {};
      }
      case NodeKind::AtTimerStream: {
        auto & s = *cast<AtTimerStream>(&node);
        for (size_t i = 0; i < s.time.size(); ++i) {
          yield_recursive(std::make_shared<ArrayIndexSlot>(
            nullptr, scope, Type::time(), &s.time, "attimer.time", i));
        }
        field(nullptr, scope, Type::date(), s.expiration_date, "attimer", "expiration_date");
        return {};
      }
      case NodeKind::MonitorStream:
        return table(*cast<MonitorStream>(&node)->table, scope);
      case NodeKind::EdgeNewStream:
        return stream(*cast<EdgeNewStream>(&node)->stream, scope);
      case NodeKind::EdgeFilterStream: {
        auto & s = *cast<EdgeFilterStream>(&node);
        Walked inner = stream(*s.stream, scope);
        filter(*s.filter, s.stream->schema.get(), inner.primitive, inner.scope);
        return inner;
      }
      case NodeKind::FilteredStream: {
        auto & s = *cast<FilteredStream>(&node);
        Walked inner = stream(*s.stream, scope);
        filter(*s.filter, s.stream->schema.get(), inner.primitive, inner.scope);
        return inner;
      }
      case NodeKind::ProjectionStream: {
        auto & s = *cast<ProjectionStream>(&node);
        Walked inner = stream(*s.stream, scope);
        return {inner.primitive, restrict_scope(inner.scope, s.args)};
      }
      case NodeKind::ComputeStream:
        return stream(*cast<ComputeStream>(&node)->stream, scope);
      case NodeKind::AliasStream:
        return stream(*cast<AliasStream>(&node)->stream, scope);
      case NodeKind::JoinStream: {
        auto & s = *cast<JoinStream>(&node);
        Walked left = stream(*s.stream, scope);
        Walked right = table(*s.table, scope);
        return {nullptr, merge_scope(std::move(left.scope), right.scope)};
      }
      default:
        throw InvariantError("Cannot iterate slots of " + std::string(to_string(node.get_kind())));
    }
  }

  void action(Action & node, const ScopeMap & scope)
  {
    if (auto * ref = dyn_cast<VarRefAction>(&node)) {
      in_params(ref, ref->schema.get(), ref->in_params, scope);
    } else if (auto * inv = dyn_cast<InvocationAction>(&node)) {
      invocation(*inv->invocation, scope);
    }
  }

  void statement(Statement & node)
  {
    switch (node.get_kind()) {
      case NodeKind::Rule: {
        auto & rule = *cast<Rule>(&node);
        Walked walked = stream(*rule.stream, {});
        for (auto & a : rule.actions) {
          action(*a, walked.scope);
        }
        break;
      }
      case NodeKind::Command: {
        auto & command = *cast<Command>(&node);
        ScopeMap scope;
        if (command.table) {
          scope = table(*command.table, {}).scope;
        }
        for (auto & a : command.actions) {
          action(*a, scope);
        }
        break;
      }
      case NodeKind::Assignment:
        table(*cast<Assignment>(&node)->value, {});
        break;
      default:
        break;
    }
  }

  void permission_function(PermissionFunction & node, const ScopeMap & scope)
  {
    if (auto * specified = dyn_cast<SpecifiedPermissionFunction>(&node)) {
      filter(*specified->filter, specified->schema.get(), specified, scope);
    }
  }
};

}  // namespace

std::vector<SlotEntry> iterate_slots(Program & program)
{
  SlotCollector collector;
  collector.field(
    nullptr, {}, Type::entity("tt:contact"), program.principal, "program", "principal");
  for (auto & stmt : program.statements) {
    collector.statement(*stmt);
  }
  return std::move(collector.entries);
}

std::vector<SlotEntry> iterate_slots(Statement & statement)
{
  SlotCollector collector;
  collector.statement(statement);
  return std::move(collector.entries);
}

std::vector<SlotEntry> iterate_slots(Table & table, const ScopeMap & scope)
{
  SlotCollector collector;
  (void)collector.table(table, scope);
  return std::move(collector.entries);
}

std::vector<SlotEntry> iterate_slots(Stream & stream, const ScopeMap & scope)
{
  SlotCollector collector;
  (void)collector.stream(stream, scope);
  return std::move(collector.entries);
}

std::vector<SlotEntry> iterate_slots(Action & action, const ScopeMap & scope)
{
  SlotCollector collector;
  collector.action(action, scope);
  return std::move(collector.entries);
}

std::vector<SlotEntry> iterate_slots(Invocation & invocation, const ScopeMap & scope)
{
  SlotCollector collector;
  (void)collector.invocation(invocation, scope);
  return std::move(collector.entries);
}

std::vector<SlotEntry> iterate_slots(PermissionRule & rule)
{
  SlotCollector collector;
  collector.filter(*rule.principal, nullptr, nullptr, {});
  collector.permission_function(*rule.query, {});

  ScopeMap scope;
  if (auto * query = dyn_cast<SpecifiedPermissionFunction>(rule.query.get())) {
    scope = make_scope(query);
  }
  collector.permission_function(*rule.action, scope);
  return std::move(collector.entries);
}

std::vector<SlotPtr> value_slots(const std::vector<SlotEntry> & entries)
{
  std::vector<SlotPtr> out;
  for (const auto & entry : entries) {
    if (const auto * slot = std::get_if<SlotPtr>(&entry)) {
      out.push_back(*slot);
    }
  }
  return out;
}

}  // namespace thingtalk
