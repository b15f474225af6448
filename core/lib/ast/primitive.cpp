// thingtalk/ast/primitive.cpp - Tables, streams, actions and permission functions
#include "thingtalk/ast/primitive.hpp"

#include "thingtalk/ast/builtin.hpp"
#include "thingtalk/basic/errors.hpp"

namespace thingtalk
{

namespace
{

void require_params(const std::vector<InputParamPtr> & params, const char * what)
{
  for (const auto & p : params) {
    detail::require_node(p, what);
  }
}

}  // namespace

// ============================================================================
// Table
// ============================================================================

VarRefTable::VarRefTable(
  std::string n, std::vector<InputParamPtr> params, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), name(std::move(n)), in_params(std::move(params))
{
  require_params(in_params, "VarRefTable input parameter");
  schema = std::move(s);
}

TablePtr VarRefTable::clone() const
{
  return std::make_shared<VarRefTable>(
    name, clone_in_params(in_params), detail::clone_schema(schema), range_);
}

ResultRefTable::ResultRefTable(
  std::string k, std::string ch, ValuePtr idx, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  kind(std::move(k)),
  channel(std::move(ch)),
  index(detail::require_node(std::move(idx), "ResultRefTable index"))
{
  schema = std::move(s);
}

TablePtr ResultRefTable::clone() const
{
  return std::make_shared<ResultRefTable>(
    kind, channel, index->clone(), detail::clone_schema(schema), range_);
}

InvocationTable::InvocationTable(InvocationPtr inv, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), invocation(detail::require_node(std::move(inv), "InvocationTable invocation"))
{
  schema = std::move(s);
}

TablePtr InvocationTable::clone() const
{
  return std::make_shared<InvocationTable>(
    invocation->clone(), detail::clone_schema(schema), range_);
}

FilteredTable::FilteredTable(
  TablePtr t, BooleanExpressionPtr f, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  table(detail::require_node(std::move(t), "FilteredTable table")),
  filter(detail::require_node(std::move(f), "FilteredTable filter"))
{
  schema = std::move(s);
}

TablePtr FilteredTable::clone() const
{
  return std::make_shared<FilteredTable>(
    table->clone(), filter->clone(), detail::clone_schema(schema), range_);
}

ProjectionTable::ProjectionTable(
  TablePtr t, std::vector<std::string> a, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), table(detail::require_node(std::move(t), "ProjectionTable table")), args(std::move(a))
{
  schema = std::move(s);
}

TablePtr ProjectionTable::clone() const
{
  return std::make_shared<ProjectionTable>(
    table->clone(), args, detail::clone_schema(schema), range_);
}

ComputeTable::ComputeTable(
  TablePtr t, ScalarExpressionPtr e, std::optional<std::string> a, ExpressionSignaturePtr s,
  SourceRange r)
: NodeBase(r),
  table(detail::require_node(std::move(t), "ComputeTable table")),
  expression(detail::require_node(std::move(e), "ComputeTable expression")),
  alias(std::move(a))
{
  schema = std::move(s);
}

TablePtr ComputeTable::clone() const
{
  return std::make_shared<ComputeTable>(
    table->clone(), expression->clone(), alias, detail::clone_schema(schema), range_);
}

AliasTable::AliasTable(TablePtr t, std::string n, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), table(detail::require_node(std::move(t), "AliasTable table")), name(std::move(n))
{
  schema = std::move(s);
}

TablePtr AliasTable::clone() const
{
  return std::make_shared<AliasTable>(table->clone(), name, detail::clone_schema(schema), range_);
}

AggregationTable::AggregationTable(
  TablePtr t, std::string f, std::string o, std::optional<std::string> a,
  ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  table(detail::require_node(std::move(t), "AggregationTable table")),
  field(std::move(f)),
  op(std::move(o)),
  alias(std::move(a))
{
  schema = std::move(s);
}

TablePtr AggregationTable::clone() const
{
  return std::make_shared<AggregationTable>(
    table->clone(), field, op, alias, detail::clone_schema(schema), range_);
}

SortedTable::SortedTable(
  TablePtr t, std::string f, SortDirection d, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  table(detail::require_node(std::move(t), "SortedTable table")),
  field(std::move(f)),
  direction(d)
{
  schema = std::move(s);
}

TablePtr SortedTable::clone() const
{
  return std::make_shared<SortedTable>(
    table->clone(), field, direction, detail::clone_schema(schema), range_);
}

IndexTable::IndexTable(
  TablePtr t, std::vector<ValuePtr> idx, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), table(detail::require_node(std::move(t), "IndexTable table")), indices(std::move(idx))
{
  for (const auto & index : indices) {
    detail::require_node(index, "IndexTable index");
  }
  schema = std::move(s);
}

TablePtr IndexTable::clone() const
{
  return std::make_shared<IndexTable>(
    table->clone(), detail::clone_all(indices), detail::clone_schema(schema), range_);
}

SlicedTable::SlicedTable(
  TablePtr t, ValuePtr b, ValuePtr l, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  table(detail::require_node(std::move(t), "SlicedTable table")),
  base(detail::require_node(std::move(b), "SlicedTable base")),
  limit(detail::require_node(std::move(l), "SlicedTable limit"))
{
  schema = std::move(s);
}

TablePtr SlicedTable::clone() const
{
  return std::make_shared<SlicedTable>(
    table->clone(), base->clone(), limit->clone(), detail::clone_schema(schema), range_);
}

JoinTable::JoinTable(
  TablePtr l, TablePtr rt, std::vector<InputParamPtr> params, ExpressionSignaturePtr s,
  SourceRange r)
: NodeBase(r),
  lhs(detail::require_node(std::move(l), "JoinTable lhs")),
  rhs(detail::require_node(std::move(rt), "JoinTable rhs")),
  in_params(std::move(params))
{
  require_params(in_params, "JoinTable input parameter");
  schema = std::move(s);
}

TablePtr JoinTable::clone() const
{
  return std::make_shared<JoinTable>(
    lhs->clone(), rhs->clone(), clone_in_params(in_params), detail::clone_schema(schema), range_);
}

WindowTable::WindowTable(
  ValuePtr b, ValuePtr d, StreamPtr st, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  base(detail::require_node(std::move(b), "WindowTable base")),
  delta(detail::require_node(std::move(d), "WindowTable delta")),
  stream(detail::require_node(std::move(st), "WindowTable stream"))
{
  schema = std::move(s);
}

TablePtr WindowTable::clone() const
{
  return std::make_shared<WindowTable>(
    base->clone(), delta->clone(), stream->clone(), detail::clone_schema(schema), range_);
}

TimeSeriesTable::TimeSeriesTable(
  ValuePtr b, ValuePtr d, StreamPtr st, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  base(detail::require_node(std::move(b), "TimeSeriesTable base")),
  delta(detail::require_node(std::move(d), "TimeSeriesTable delta")),
  stream(detail::require_node(std::move(st), "TimeSeriesTable stream"))
{
  schema = std::move(s);
}

TablePtr TimeSeriesTable::clone() const
{
  return std::make_shared<TimeSeriesTable>(
    base->clone(), delta->clone(), stream->clone(), detail::clone_schema(schema), range_);
}

SequenceTable::SequenceTable(
  ValuePtr b, ValuePtr d, TablePtr t, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  base(detail::require_node(std::move(b), "SequenceTable base")),
  delta(detail::require_node(std::move(d), "SequenceTable delta")),
  table(detail::require_node(std::move(t), "SequenceTable table"))
{
  schema = std::move(s);
}

TablePtr SequenceTable::clone() const
{
  return std::make_shared<SequenceTable>(
    base->clone(), delta->clone(), table->clone(), detail::clone_schema(schema), range_);
}

HistoryTable::HistoryTable(
  ValuePtr b, ValuePtr d, TablePtr t, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  base(detail::require_node(std::move(b), "HistoryTable base")),
  delta(detail::require_node(std::move(d), "HistoryTable delta")),
  table(detail::require_node(std::move(t), "HistoryTable table"))
{
  schema = std::move(s);
}

TablePtr HistoryTable::clone() const
{
  return std::make_shared<HistoryTable>(
    base->clone(), delta->clone(), table->clone(), detail::clone_schema(schema), range_);
}

// ============================================================================
// Stream
// ============================================================================

VarRefStream::VarRefStream(
  std::string n, std::vector<InputParamPtr> params, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), name(std::move(n)), in_params(std::move(params))
{
  require_params(in_params, "VarRefStream input parameter");
  schema = std::move(s);
}

StreamPtr VarRefStream::clone() const
{
  return std::make_shared<VarRefStream>(
    name, clone_in_params(in_params), detail::clone_schema(schema), range_);
}

TimerStream::TimerStream(
  ValuePtr b, ValuePtr i, ValuePtr f, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  base(detail::require_node(std::move(b), "TimerStream base")),
  interval(detail::require_node(std::move(i), "TimerStream interval")),
  frequency(std::move(f))
{
  schema = std::move(s);
}

StreamPtr TimerStream::clone() const
{
  return std::make_shared<TimerStream>(
    base->clone(), interval->clone(), detail::clone_or_null(frequency),
    detail::clone_schema(schema), range_);
}

AtTimerStream::AtTimerStream(
  std::vector<ValuePtr> t, ValuePtr exp, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), time(std::move(t)), expiration_date(std::move(exp))
{
  for (const auto & v : time) {
    detail::require_node(v, "AtTimerStream time");
  }
  schema = std::move(s);
}

StreamPtr AtTimerStream::clone() const
{
  return std::make_shared<AtTimerStream>(
    detail::clone_all(time), detail::clone_or_null(expiration_date),
    detail::clone_schema(schema), range_);
}

MonitorStream::MonitorStream(
  TablePtr t, std::optional<std::vector<std::string>> a, ExpressionSignaturePtr s,
  SourceRange r)
: NodeBase(r), table(detail::require_node(std::move(t), "MonitorStream table")), args(std::move(a))
{
  schema = std::move(s);
}

StreamPtr MonitorStream::clone() const
{
  return std::make_shared<MonitorStream>(
    table->clone(), args, detail::clone_schema(schema), range_);
}

EdgeNewStream::EdgeNewStream(StreamPtr st, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), stream(detail::require_node(std::move(st), "EdgeNewStream stream"))
{
  schema = std::move(s);
}

StreamPtr EdgeNewStream::clone() const
{
  return std::make_shared<EdgeNewStream>(stream->clone(), detail::clone_schema(schema), range_);
}

EdgeFilterStream::EdgeFilterStream(
  StreamPtr st, BooleanExpressionPtr f, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  stream(detail::require_node(std::move(st), "EdgeFilterStream stream")),
  filter(detail::require_node(std::move(f), "EdgeFilterStream filter"))
{
  schema = std::move(s);
}

StreamPtr EdgeFilterStream::clone() const
{
  return std::make_shared<EdgeFilterStream>(
    stream->clone(), filter->clone(), detail::clone_schema(schema), range_);
}

FilteredStream::FilteredStream(
  StreamPtr st, BooleanExpressionPtr f, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  stream(detail::require_node(std::move(st), "FilteredStream stream")),
  filter(detail::require_node(std::move(f), "FilteredStream filter"))
{
  schema = std::move(s);
}

StreamPtr FilteredStream::clone() const
{
  return std::make_shared<FilteredStream>(
    stream->clone(), filter->clone(), detail::clone_schema(schema), range_);
}

ProjectionStream::ProjectionStream(
  StreamPtr st, std::vector<std::string> a, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  stream(detail::require_node(std::move(st), "ProjectionStream stream")),
  args(std::move(a))
{
  schema = std::move(s);
}

StreamPtr ProjectionStream::clone() const
{
  return std::make_shared<ProjectionStream>(
    stream->clone(), args, detail::clone_schema(schema), range_);
}

ComputeStream::ComputeStream(
  StreamPtr st, ScalarExpressionPtr e, std::optional<std::string> a, ExpressionSignaturePtr s,
  SourceRange r)
: NodeBase(r),
  stream(detail::require_node(std::move(st), "ComputeStream stream")),
  expression(detail::require_node(std::move(e), "ComputeStream expression")),
  alias(std::move(a))
{
  schema = std::move(s);
}

StreamPtr ComputeStream::clone() const
{
  return std::make_shared<ComputeStream>(
    stream->clone(), expression->clone(), alias, detail::clone_schema(schema), range_);
}

AliasStream::AliasStream(StreamPtr st, std::string n, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), stream(detail::require_node(std::move(st), "AliasStream stream")), name(std::move(n))
{
  schema = std::move(s);
}

StreamPtr AliasStream::clone() const
{
  return std::make_shared<AliasStream>(
    stream->clone(), name, detail::clone_schema(schema), range_);
}

JoinStream::JoinStream(
  StreamPtr st, TablePtr t, std::vector<InputParamPtr> params, ExpressionSignaturePtr s,
  SourceRange r)
: NodeBase(r),
  stream(detail::require_node(std::move(st), "JoinStream stream")),
  table(detail::require_node(std::move(t), "JoinStream table")),
  in_params(std::move(params))
{
  require_params(in_params, "JoinStream input parameter");
  schema = std::move(s);
}

StreamPtr JoinStream::clone() const
{
  return std::make_shared<JoinStream>(
    stream->clone(), table->clone(), clone_in_params(in_params), detail::clone_schema(schema),
    range_);
}

// ============================================================================
// Action
// ============================================================================

ActionPtr Action::notify_action(const std::string & what)
{
  auto schema = builtin::make_action(what);
  if (!schema) {
    throw InvariantError("Invalid builtin action " + what);
  }
  auto invocation =
    std::make_shared<Invocation>(Selector::builtin(), what, std::vector<InputParamPtr>{}, schema);
  return std::make_shared<InvocationAction>(std::move(invocation), schema->clone());
}

VarRefAction::VarRefAction(
  std::string n, std::vector<InputParamPtr> params, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), name(std::move(n)), in_params(std::move(params))
{
  require_params(in_params, "VarRefAction input parameter");
  schema = std::move(s);
}

ActionPtr VarRefAction::clone() const
{
  return std::make_shared<VarRefAction>(
    name, clone_in_params(in_params), detail::clone_schema(schema), range_);
}

InvocationAction::InvocationAction(InvocationPtr inv, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r), invocation(detail::require_node(std::move(inv), "InvocationAction invocation"))
{
  schema = std::move(s);
}

ActionPtr InvocationAction::clone() const
{
  return std::make_shared<InvocationAction>(
    invocation->clone(), detail::clone_schema(schema), range_);
}

bool InvocationAction::is_notify() const
{
  return isa<BuiltinDevice>(invocation->selector.get()) &&
         builtin::is_builtin_action(invocation->channel);
}

// ============================================================================
// Permission functions
// ============================================================================

PermissionFunctionPtr PermissionFunction::builtin()
{
  return BuiltinPermissionFunction::instance();
}

PermissionFunctionPtr PermissionFunction::star() { return StarPermissionFunction::instance(); }

std::shared_ptr<BuiltinPermissionFunction> BuiltinPermissionFunction::instance()
{
  static const std::shared_ptr<BuiltinPermissionFunction> instance(
    new BuiltinPermissionFunction());
  return instance;
}

std::shared_ptr<StarPermissionFunction> StarPermissionFunction::instance()
{
  static const std::shared_ptr<StarPermissionFunction> instance(new StarPermissionFunction());
  return instance;
}

SpecifiedPermissionFunction::SpecifiedPermissionFunction(
  std::string k, std::string ch, BooleanExpressionPtr f, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  kind(std::move(k)),
  channel(std::move(ch)),
  filter(detail::require_node(std::move(f), "SpecifiedPermissionFunction filter")),
  schema(std::move(s))
{
}

PermissionFunctionPtr SpecifiedPermissionFunction::clone() const
{
  return std::make_shared<SpecifiedPermissionFunction>(
    kind, channel, filter->clone(), detail::clone_schema(schema), range_);
}

}  // namespace thingtalk
