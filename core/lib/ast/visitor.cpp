// thingtalk/ast/visitor.cpp - Child enumeration for the recursive visitor
#include "thingtalk/ast/visitor.hpp"

namespace thingtalk
{

namespace
{

using ChildFn = std::function<void(AstNode *)>;

template <typename T>
void each(const std::vector<std::shared_ptr<T>> & nodes, const ChildFn & fn)
{
  for (const auto & n : nodes) {
    fn(n.get());
  }
}

template <typename T>
void maybe(const std::shared_ptr<T> & node, const ChildFn & fn)
{
  if (node) {
    fn(node.get());
  }
}

void value_children(const Value * node, const ChildFn & fn)
{
  switch (node->get_kind()) {
    case NodeKind::ArrayValue:
      each(cast<ArrayValue>(node)->value, fn);
      break;
    case NodeKind::ObjectValue:
      for (const auto & [name, v] : cast<ObjectValue>(node)->value) {
        fn(v.get());
      }
      break;
    case NodeKind::FilterValue: {
      const auto * f = cast<FilterValue>(node);
      fn(f->value.get());
      fn(f->filter.get());
      break;
    }
    case NodeKind::ArrayFieldValue:
      fn(cast<ArrayFieldValue>(node)->value.get());
      break;
    case NodeKind::ComputationValue:
      each(cast<ComputationValue>(node)->operands, fn);
      break;
    default:
      break;
  }
}

void boolean_children(const BooleanExpression * node, const ChildFn & fn)
{
  switch (node->get_kind()) {
    case NodeKind::AndBooleanExpression:
      each(cast<AndBooleanExpression>(node)->operands, fn);
      break;
    case NodeKind::OrBooleanExpression:
      each(cast<OrBooleanExpression>(node)->operands, fn);
      break;
    case NodeKind::NotBooleanExpression:
      fn(cast<NotBooleanExpression>(node)->expr.get());
      break;
    case NodeKind::AtomBooleanExpression:
      fn(cast<AtomBooleanExpression>(node)->value.get());
      break;
    case NodeKind::ExternalBooleanExpression: {
      const auto * e = cast<ExternalBooleanExpression>(node);
      fn(e->selector.get());
      each(e->in_params, fn);
      fn(e->filter.get());
      break;
    }
    case NodeKind::ComputeBooleanExpression: {
      const auto * c = cast<ComputeBooleanExpression>(node);
      fn(c->lhs.get());
      fn(c->rhs.get());
      break;
    }
    default:
      break;
  }
}

void scalar_children(const ScalarExpression * node, const ChildFn & fn)
{
  switch (node->get_kind()) {
    case NodeKind::PrimaryScalarExpression:
      fn(cast<PrimaryScalarExpression>(node)->value.get());
      break;
    case NodeKind::DerivedScalarExpression:
      each(cast<DerivedScalarExpression>(node)->operands, fn);
      break;
    case NodeKind::AggregationScalarExpression:
      fn(cast<AggregationScalarExpression>(node)->list.get());
      break;
    case NodeKind::VarRefScalarExpression: {
      const auto * v = cast<VarRefScalarExpression>(node);
      fn(v->selector.get());
      each(v->args, fn);
      break;
    }
    default:
      break;
  }
}

void table_children(const Table * node, const ChildFn & fn)
{
  switch (node->get_kind()) {
    case NodeKind::VarRefTable:
      each(cast<VarRefTable>(node)->in_params, fn);
      break;
    case NodeKind::ResultRefTable:
      fn(cast<ResultRefTable>(node)->index.get());
      break;
    case NodeKind::InvocationTable:
      fn(cast<InvocationTable>(node)->invocation.get());
      break;
    case NodeKind::FilteredTable: {
      const auto * t = cast<FilteredTable>(node);
      fn(t->table.get());
      fn(t->filter.get());
      break;
    }
    case NodeKind::ProjectionTable:
      fn(cast<ProjectionTable>(node)->table.get());
      break;
    case NodeKind::ComputeTable: {
      const auto * t = cast<ComputeTable>(node);
      fn(t->table.get());
      fn(t->expression.get());
      break;
    }
    case NodeKind::AliasTable:
      fn(cast<AliasTable>(node)->table.get());
      break;
    case NodeKind::AggregationTable:
      fn(cast<AggregationTable>(node)->table.get());
      break;
    case NodeKind::SortedTable:
      fn(cast<SortedTable>(node)->table.get());
      break;
    case NodeKind::IndexTable: {
      const auto * t = cast<IndexTable>(node);
      fn(t->table.get());
      each(t->indices, fn);
      break;
    }
    case NodeKind::SlicedTable: {
      const auto * t = cast<SlicedTable>(node);
      fn(t->table.get());
      fn(t->base.get());
      fn(t->limit.get());
      break;
    }
    case NodeKind::JoinTable: {
      const auto * t = cast<JoinTable>(node);
      fn(t->lhs.get());
      fn(t->rhs.get());
      each(t->in_params, fn);
      break;
    }
    case NodeKind::WindowTable: {
      const auto * t = cast<WindowTable>(node);
      fn(t->base.get());
      fn(t->delta.get());
      fn(t->stream.get());
      break;
    }
    case NodeKind::TimeSeriesTable: {
      const auto * t = cast<TimeSeriesTable>(node);
      fn(t->base.get());
      fn(t->delta.get());
      fn(t->stream.get());
      break;
    }
    case NodeKind::SequenceTable: {
      const auto * t = cast<SequenceTable>(node);
      fn(t->base.get());
      fn(t->delta.get());
      fn(t->table.get());
      break;
    }
    case NodeKind::HistoryTable: {
      const auto * t = cast<HistoryTable>(node);
      fn(t->base.get());
      fn(t->delta.get());
      fn(t->table.get());
      break;
    }
    default:
      break;
  }
}

void stream_children(const Stream * node, const ChildFn & fn)
{
  switch (node->get_kind()) {
    case NodeKind::VarRefStream:
      each(cast<VarRefStream>(node)->in_params, fn);
      break;
    case NodeKind::TimerStream: {
      const auto * s = cast<TimerStream>(node);
      fn(s->base.get());
      fn(s->interval.get());
      maybe(s->frequency, fn);
      break;
    }
    case NodeKind::AtTimerStream: {
      const auto * s = cast<AtTimerStream>(node);
      each(s->time, fn);
      maybe(s->expiration_date, fn);
      break;
    }
    case NodeKind::MonitorStream:
      fn(cast<MonitorStream>(node)->table.get());
      break;
    case NodeKind::EdgeNewStream:
      fn(cast<EdgeNewStream>(node)->stream.get());
      break;
    case NodeKind::EdgeFilterStream: {
      const auto * s = cast<EdgeFilterStream>(node);
      fn(s->stream.get());
      fn(s->filter.get());
      break;
    }
    case NodeKind::FilteredStream: {
      const auto * s = cast<FilteredStream>(node);
      fn(s->stream.get());
      fn(s->filter.get());
      break;
    }
    case NodeKind::ProjectionStream:
      fn(cast<ProjectionStream>(node)->stream.get());
      break;
    case NodeKind::ComputeStream: {
      const auto * s = cast<ComputeStream>(node);
      fn(s->stream.get());
      fn(s->expression.get());
      break;
    }
    case NodeKind::AliasStream:
      fn(cast<AliasStream>(node)->stream.get());
      break;
    case NodeKind::JoinStream: {
      const auto * s = cast<JoinStream>(node);
      fn(s->stream.get());
      fn(s->table.get());
      each(s->in_params, fn);
      break;
    }
    default:
      break;
  }
}

}  // namespace

void for_each_child(const AstNode * node, const std::function<void(AstNode *)> & fn)
{
  if (!node) {
    return;
  }

  if (const auto * v = dyn_cast<Value>(node)) {
    value_children(v, fn);
    return;
  }
  if (const auto * b = dyn_cast<BooleanExpression>(node)) {
    boolean_children(b, fn);
    return;
  }
  if (const auto * s = dyn_cast<ScalarExpression>(node)) {
    scalar_children(s, fn);
    return;
  }
  if (const auto * t = dyn_cast<Table>(node)) {
    table_children(t, fn);
    return;
  }
  if (const auto * s = dyn_cast<Stream>(node)) {
    stream_children(s, fn);
    return;
  }

  switch (node->get_kind()) {
    case NodeKind::DeviceSelector:
      each(cast<DeviceSelector>(node)->attributes, fn);
      break;
    case NodeKind::InputParam:
      fn(cast<InputParam>(node)->value.get());
      break;
    case NodeKind::Invocation: {
      const auto * inv = cast<Invocation>(node);
      fn(inv->selector.get());
      each(inv->in_params, fn);
      break;
    }
    case NodeKind::VarRefAction:
      each(cast<VarRefAction>(node)->in_params, fn);
      break;
    case NodeKind::InvocationAction:
      fn(cast<InvocationAction>(node)->invocation.get());
      break;
    case NodeKind::SpecifiedPermissionFunction:
      fn(cast<SpecifiedPermissionFunction>(node)->filter.get());
      break;
    case NodeKind::MixinImportStmt:
      each(cast<MixinImportStmt>(node)->in_params, fn);
      break;
    case NodeKind::ClassDef:
      each(cast<ClassDef>(node)->imports, fn);
      break;
    case NodeKind::Rule: {
      const auto * r = cast<Rule>(node);
      fn(r->stream.get());
      each(r->actions, fn);
      break;
    }
    case NodeKind::Command: {
      const auto * c = cast<Command>(node);
      maybe(c->table, fn);
      each(c->actions, fn);
      break;
    }
    case NodeKind::Assignment:
      fn(cast<Assignment>(node)->value.get());
      break;
    case NodeKind::Program: {
      const auto * p = cast<Program>(node);
      maybe(p->principal, fn);
      each(p->classes, fn);
      each(p->statements, fn);
      break;
    }
    case NodeKind::PermissionRule: {
      const auto * p = cast<PermissionRule>(node);
      fn(p->principal.get());
      fn(p->query.get());
      fn(p->action.get());
      break;
    }
    default:
      break;
  }
}

}  // namespace thingtalk
