// thingtalk/ast/json_visitor.cpp - JSON serialization implementation
//
#include "thingtalk/ast/json_visitor.hpp"

#include <cstdint>
#include <string>

#include "thingtalk/ast/prettyprint.hpp"
#include "thingtalk/basic/casting.hpp"

namespace thingtalk
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_node(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
}

template <typename T>
json j_list(const std::vector<std::shared_ptr<T>> & nodes)
{
  json out = json::array();
  for (const auto & n : nodes) {
    out.push_back(to_json(n.get()));
  }
  return out;
}

json j_optional(const std::optional<std::string> & s)
{
  return s ? json(*s) : json(nullptr);
}

json j_schema(const ExpressionSignaturePtr & schema)
{
  return schema ? to_json(*schema) : json(nullptr);
}

json j_overload(const std::vector<TypePtr> & overload)
{
  json out = json::array();
  for (const auto & t : overload) {
    out.push_back(t ? json(t->to_string()) : json(nullptr));
  }
  return out;
}

// ============================================================================
// Values
// ============================================================================

json j_value(const Value * v)
{
  json j = j_node(v);
  j["valueType"] = v->get_type()->to_string();
  j["concrete"] = v->is_concrete();

  switch (v->get_kind()) {
    case NodeKind::ArrayValue:
      j["value"] = j_list(cast<ArrayValue>(v)->value);
      break;
    case NodeKind::ObjectValue: {
      json fields = json::object();
      for (const auto & [name, field] : cast<ObjectValue>(v)->value) {
        fields[name] = to_json(field.get());
      }
      j["value"] = fields;
      break;
    }
    case NodeKind::FilterValue: {
      const auto * f = cast<FilterValue>(v);
      j["value"] = to_json(f->value.get());
      j["filter"] = to_json(f->filter.get());
      break;
    }
    case NodeKind::ArrayFieldValue: {
      const auto * f = cast<ArrayFieldValue>(v);
      j["value"] = to_json(f->value.get());
      j["field"] = f->field;
      break;
    }
    case NodeKind::ComputationValue: {
      const auto * c = cast<ComputationValue>(v);
      j["op"] = c->op;
      j["operands"] = j_list(c->operands);
      j["overload"] = j_overload(c->overload);
      break;
    }
    default:
      // leaves print their literal form
      j["source"] = to_source(*v);
      break;
  }
  return j;
}

// ============================================================================
// Selectors, invocations, filters
// ============================================================================

json j_selector(const Selector * s)
{
  json j = j_node(s);
  if (const auto * dev = dyn_cast<DeviceSelector>(s)) {
    j["kind"] = dev->kind;
    j["id"] = j_optional(dev->id);
    j["attributes"] = j_list(dev->attributes);
    j["all"] = dev->all;
  }
  return j;
}

json j_invocation(const Invocation * inv)
{
  json j = j_node(inv);
  j["selector"] = to_json(inv->selector.get());
  j["channel"] = inv->channel;
  j["in_params"] = j_list(inv->in_params);
  j["schema"] = inv->schema ? to_json(*inv->schema) : json(nullptr);
  return j;
}

json j_boolean(const BooleanExpression * b)
{
  json j = j_node(b);
  switch (b->get_kind()) {
    case NodeKind::AndBooleanExpression:
      j["operands"] = j_list(cast<AndBooleanExpression>(b)->operands);
      break;
    case NodeKind::OrBooleanExpression:
      j["operands"] = j_list(cast<OrBooleanExpression>(b)->operands);
      break;
    case NodeKind::NotBooleanExpression:
      j["expr"] = to_json(cast<NotBooleanExpression>(b)->expr.get());
      break;
    case NodeKind::AtomBooleanExpression: {
      const auto * a = cast<AtomBooleanExpression>(b);
      j["name"] = a->name;
      j["op"] = a->op;
      j["value"] = to_json(a->value.get());
      j["overload"] = j_overload(a->overload);
      break;
    }
    case NodeKind::ExternalBooleanExpression: {
      const auto * e = cast<ExternalBooleanExpression>(b);
      j["selector"] = to_json(e->selector.get());
      j["channel"] = e->channel;
      j["in_params"] = j_list(e->in_params);
      j["filter"] = to_json(e->filter.get());
      j["schema"] = e->schema ? to_json(*e->schema) : json(nullptr);
      break;
    }
    case NodeKind::DontCareBooleanExpression:
      j["name"] = cast<DontCareBooleanExpression>(b)->name;
      break;
    case NodeKind::ComputeBooleanExpression: {
      const auto * c = cast<ComputeBooleanExpression>(b);
      j["lhs"] = to_json(c->lhs.get());
      j["op"] = c->op;
      j["rhs"] = to_json(c->rhs.get());
      j["overload"] = j_overload(c->overload);
      break;
    }
    default:
      break;
  }
  return j;
}

json j_scalar(const ScalarExpression * s)
{
  json j = j_node(s);
  switch (s->get_kind()) {
    case NodeKind::PrimaryScalarExpression:
      j["value"] = to_json(cast<PrimaryScalarExpression>(s)->value.get());
      break;
    case NodeKind::DerivedScalarExpression: {
      const auto * d = cast<DerivedScalarExpression>(s);
      j["op"] = d->op;
      j["operands"] = j_list(d->operands);
      break;
    }
    case NodeKind::AggregationScalarExpression: {
      const auto * a = cast<AggregationScalarExpression>(s);
      j["op"] = a->op;
      j["field"] = j_optional(a->field);
      j["list"] = to_json(a->list.get());
      break;
    }
    case NodeKind::VarRefScalarExpression: {
      const auto * v = cast<VarRefScalarExpression>(s);
      j["selector"] = to_json(v->selector.get());
      j["name"] = v->name;
      j["args"] = j_list(v->args);
      break;
    }
    default:
      break;
  }
  return j;
}

// ============================================================================
// Tables and streams
// ============================================================================

json j_table(const Table * t)
{
  json j = j_node(t);
  switch (t->get_kind()) {
    case NodeKind::VarRefTable: {
      const auto * n = cast<VarRefTable>(t);
      j["name"] = n->name;
      j["in_params"] = j_list(n->in_params);
      break;
    }
    case NodeKind::ResultRefTable: {
      const auto * n = cast<ResultRefTable>(t);
      j["kind"] = n->kind;
      j["channel"] = n->channel;
      j["index"] = to_json(n->index.get());
      break;
    }
    case NodeKind::InvocationTable:
      j["invocation"] = to_json(cast<InvocationTable>(t)->invocation.get());
      break;
    case NodeKind::FilteredTable: {
      const auto * n = cast<FilteredTable>(t);
      j["table"] = to_json(n->table.get());
      j["filter"] = to_json(n->filter.get());
      break;
    }
    case NodeKind::ProjectionTable: {
      const auto * n = cast<ProjectionTable>(t);
      j["table"] = to_json(n->table.get());
      j["args"] = n->args;
      break;
    }
    case NodeKind::ComputeTable: {
      const auto * n = cast<ComputeTable>(t);
      j["table"] = to_json(n->table.get());
      j["expression"] = to_json(n->expression.get());
      j["alias"] = j_optional(n->alias);
      break;
    }
    case NodeKind::AliasTable: {
      const auto * n = cast<AliasTable>(t);
      j["table"] = to_json(n->table.get());
      j["name"] = n->name;
      break;
    }
    case NodeKind::AggregationTable: {
      const auto * n = cast<AggregationTable>(t);
      j["table"] = to_json(n->table.get());
      j["field"] = n->field;
      j["op"] = n->op;
      j["alias"] = j_optional(n->alias);
      break;
    }
    case NodeKind::SortedTable: {
      const auto * n = cast<SortedTable>(t);
      j["table"] = to_json(n->table.get());
      j["field"] = n->field;
      j["direction"] = std::string(to_string(n->direction));
      break;
    }
    case NodeKind::IndexTable: {
      const auto * n = cast<IndexTable>(t);
      j["table"] = to_json(n->table.get());
      j["indices"] = j_list(n->indices);
      break;
    }
    case NodeKind::SlicedTable: {
      const auto * n = cast<SlicedTable>(t);
      j["table"] = to_json(n->table.get());
      j["base"] = to_json(n->base.get());
      j["limit"] = to_json(n->limit.get());
      break;
    }
    case NodeKind::JoinTable: {
      const auto * n = cast<JoinTable>(t);
      j["lhs"] = to_json(n->lhs.get());
      j["rhs"] = to_json(n->rhs.get());
      j["in_params"] = j_list(n->in_params);
      break;
    }
    case NodeKind::WindowTable: {
      const auto * n = cast<WindowTable>(t);
      j["base"] = to_json(n->base.get());
      j["delta"] = to_json(n->delta.get());
      j["stream"] = to_json(n->stream.get());
      break;
    }
    case NodeKind::TimeSeriesTable: {
      const auto * n = cast<TimeSeriesTable>(t);
      j["base"] = to_json(n->base.get());
      j["delta"] = to_json(n->delta.get());
      j["stream"] = to_json(n->stream.get());
      break;
    }
    case NodeKind::SequenceTable: {
      const auto * n = cast<SequenceTable>(t);
      j["base"] = to_json(n->base.get());
      j["delta"] = to_json(n->delta.get());
      j["table"] = to_json(n->table.get());
      break;
    }
    case NodeKind::HistoryTable: {
      const auto * n = cast<HistoryTable>(t);
      j["base"] = to_json(n->base.get());
      j["delta"] = to_json(n->delta.get());
      j["table"] = to_json(n->table.get());
      break;
    }
    default:
      break;
  }
  j["schema"] = j_schema(t->schema);
  return j;
}

json j_stream(const Stream * s)
{
  json j = j_node(s);
  switch (s->get_kind()) {
    case NodeKind::VarRefStream: {
      const auto * n = cast<VarRefStream>(s);
      j["name"] = n->name;
      j["in_params"] = j_list(n->in_params);
      break;
    }
    case NodeKind::TimerStream: {
      const auto * n = cast<TimerStream>(s);
      j["base"] = to_json(n->base.get());
      j["interval"] = to_json(n->interval.get());
      j["frequency"] = to_json(n->frequency.get());
      break;
    }
    case NodeKind::AtTimerStream: {
      const auto * n = cast<AtTimerStream>(s);
      j["time"] = j_list(n->time);
      j["expiration_date"] = to_json(n->expiration_date.get());
      break;
    }
    case NodeKind::MonitorStream: {
      const auto * n = cast<MonitorStream>(s);
      j["table"] = to_json(n->table.get());
      j["args"] = n->args ? json(*n->args) : json(nullptr);
      break;
    }
    case NodeKind::EdgeNewStream:
      j["stream"] = to_json(cast<EdgeNewStream>(s)->stream.get());
      break;
    case NodeKind::EdgeFilterStream: {
      const auto * n = cast<EdgeFilterStream>(s);
      j["stream"] = to_json(n->stream.get());
      j["filter"] = to_json(n->filter.get());
      break;
    }
    case NodeKind::FilteredStream: {
      const auto * n = cast<FilteredStream>(s);
      j["stream"] = to_json(n->stream.get());
      j["filter"] = to_json(n->filter.get());
      break;
    }
    case NodeKind::ProjectionStream: {
      const auto * n = cast<ProjectionStream>(s);
      j["stream"] = to_json(n->stream.get());
      j["args"] = n->args;
      break;
    }
    case NodeKind::ComputeStream: {
      const auto * n = cast<ComputeStream>(s);
      j["stream"] = to_json(n->stream.get());
      j["expression"] = to_json(n->expression.get());
      j["alias"] = j_optional(n->alias);
      break;
    }
    case NodeKind::AliasStream: {
      const auto * n = cast<AliasStream>(s);
      j["stream"] = to_json(n->stream.get());
      j["name"] = n->name;
      break;
    }
    case NodeKind::JoinStream: {
      const auto * n = cast<JoinStream>(s);
      j["stream"] = to_json(n->stream.get());
      j["table"] = to_json(n->table.get());
      j["in_params"] = j_list(n->in_params);
      break;
    }
    default:
      break;
  }
  j["schema"] = j_schema(s->schema);
  return j;
}

// ============================================================================
// Actions, permissions, statements
// ============================================================================

json j_action(const Action * a)
{
  json j = j_node(a);
  if (const auto * ref = dyn_cast<VarRefAction>(a)) {
    j["name"] = ref->name;
    j["in_params"] = j_list(ref->in_params);
  } else if (const auto * inv = dyn_cast<InvocationAction>(a)) {
    j["invocation"] = to_json(inv->invocation.get());
  }
  j["schema"] = j_schema(a->schema);
  return j;
}

json j_permission(const PermissionFunction * p)
{
  json j = j_node(p);
  if (const auto * s = dyn_cast<SpecifiedPermissionFunction>(p)) {
    j["kind"] = s->kind;
    j["channel"] = s->channel;
    j["filter"] = to_json(s->filter.get());
    j["schema"] = j_schema(s->schema);
  } else if (const auto * c = dyn_cast<ClassStarPermissionFunction>(p)) {
    j["kind"] = c->kind;
  }
  return j;
}

json j_statement(const Statement * s)
{
  json j = j_node(s);
  switch (s->get_kind()) {
    case NodeKind::Rule: {
      const auto * r = cast<Rule>(s);
      j["stream"] = to_json(r->stream.get());
      j["actions"] = j_list(r->actions);
      break;
    }
    case NodeKind::Command: {
      const auto * c = cast<Command>(s);
      j["table"] = to_json(c->table.get());
      j["actions"] = j_list(c->actions);
      break;
    }
    case NodeKind::Assignment: {
      const auto * a = cast<Assignment>(s);
      j["name"] = a->name;
      j["value"] = to_json(a->value.get());
      j["schema"] = j_schema(a->schema);
      break;
    }
    default:
      break;
  }
  return j;
}

json j_class(const ClassDef * c)
{
  json j = j_node(c);
  j["kind"] = c->kind;
  j["extends"] = c->extends;
  j["imports"] = j_list(c->imports);
  json queries = json::object();
  for (const auto & [name, fn] : c->queries) {
    queries[name] = to_json(*fn);
  }
  json actions = json::object();
  for (const auto & [name, fn] : c->actions) {
    actions[name] = to_json(*fn);
  }
  j["queries"] = queries;
  j["actions"] = actions;
  j["is_abstract"] = c->is_abstract;
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const ExpressionSignature & signature)
{
  json args = json::array();
  for (const auto & arg : signature.iterate_arguments()) {
    args.push_back(json{
      {"name", arg->name},
      {"type", arg->type->to_string()},
      {"direction", std::string(to_string(arg->direction))}});
  }

  json j{
    {"function_type", std::string(to_string(signature.function_type()))},
    {"args", args},
    {"extends", signature.extends()},
    {"is_list", signature.is_list},
    {"is_monitorable", signature.is_monitorable},
    {"require_filter", signature.require_filter},
    {"default_projection", signature.default_projection}};
  j["minimal_projection"] =
    signature.minimal_projection ? json(*signature.minimal_projection) : json(nullptr);
  if (const auto * fn = dynamic_cast<const FunctionDef *>(&signature)) {
    j["name"] = fn->qualified_name();
  }
  return j;
}

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nullptr;

  // Dispatch based on node family
  if (const auto * v = dyn_cast<Value>(node)) return j_value(v);
  if (const auto * s = dyn_cast<Selector>(node)) return j_selector(s);
  if (const auto * b = dyn_cast<BooleanExpression>(node)) return j_boolean(b);
  if (const auto * s = dyn_cast<ScalarExpression>(node)) return j_scalar(s);
  if (const auto * t = dyn_cast<Table>(node)) return j_table(t);
  if (const auto * s = dyn_cast<Stream>(node)) return j_stream(s);
  if (const auto * a = dyn_cast<Action>(node)) return j_action(a);
  if (const auto * p = dyn_cast<PermissionFunction>(node)) return j_permission(p);
  if (const auto * s = dyn_cast<Statement>(node)) return j_statement(s);

  // Supporting nodes
  switch (node->get_kind()) {
    case NodeKind::InputParam: {
      const auto * p = cast<InputParam>(node);
      json j = j_node(p);
      j["name"] = p->name;
      j["value"] = to_json(p->value.get());
      return j;
    }
    case NodeKind::Invocation:
      return j_invocation(cast<Invocation>(node));
    case NodeKind::MixinImportStmt: {
      const auto * m = cast<MixinImportStmt>(node);
      json j = j_node(m);
      j["facets"] = m->facets;
      j["module"] = m->module;
      j["in_params"] = j_list(m->in_params);
      return j;
    }
    case NodeKind::ClassDef:
      return j_class(cast<ClassDef>(node));
    case NodeKind::Program: {
      const auto * p = cast<Program>(node);
      json j = j_node(p);
      j["principal"] = to_json(p->principal.get());
      j["classes"] = j_list(p->classes);
      j["statements"] = j_list(p->statements);
      return j;
    }
    case NodeKind::PermissionRule: {
      const auto * r = cast<PermissionRule>(node);
      json j = j_node(r);
      j["principal"] = to_json(r->principal.get());
      j["query"] = to_json(r->query.get());
      j["action"] = to_json(r->action.get());
      return j;
    }
    default:
      break;
  }

  return j_node(node);
}

}  // namespace thingtalk
