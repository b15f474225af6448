// thingtalk/ast/primitive.hpp - Tables, streams, actions and permission functions
//
// The operator algebra. A Table is a query expression, a Stream a query
// expression that produces results over time, and an Action a side effect.
// Every operator carries the signature of its result, which is null until
// type checking fills it in.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "thingtalk/ast/expression.hpp"
#include "thingtalk/ast/function_def.hpp"
#include "thingtalk/ast/node.hpp"
#include "thingtalk/ast/values.hpp"

namespace thingtalk
{

namespace detail
{

[[nodiscard]] inline ExpressionSignaturePtr clone_schema(const ExpressionSignaturePtr & schema)
{
  return schema ? schema->clone() : nullptr;
}

}  // namespace detail

// ============================================================================
// Table
// ============================================================================

class Table : public AstNode
{
public:
  ExpressionSignaturePtr schema;

  static bool classof(const AstNode * node) { return is_table_kind(node->kind); }

  [[nodiscard]] virtual TablePtr clone() const = 0;

protected:
  Table(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/// Reference to a table declared with `let`
class VarRefTable : public NodeBase<VarRefTable, Table, NodeKind::VarRefTable>
{
public:
  std::string name;
  std::vector<InputParamPtr> in_params;

  VarRefTable(
    std::string n, std::vector<InputParamPtr> params, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// A previous result of a function: `@kind.channel[index]`
class ResultRefTable : public NodeBase<ResultRefTable, Table, NodeKind::ResultRefTable>
{
public:
  std::string kind;
  std::string channel;
  ValuePtr index;

  ResultRefTable(
    std::string k, std::string ch, ValuePtr idx, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

class InvocationTable : public NodeBase<InvocationTable, Table, NodeKind::InvocationTable>
{
public:
  InvocationPtr invocation;

  explicit InvocationTable(
    InvocationPtr inv, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

class FilteredTable : public NodeBase<FilteredTable, Table, NodeKind::FilteredTable>
{
public:
  TablePtr table;
  BooleanExpressionPtr filter;

  FilteredTable(
    TablePtr t, BooleanExpressionPtr f, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

class ProjectionTable : public NodeBase<ProjectionTable, Table, NodeKind::ProjectionTable>
{
public:
  TablePtr table;
  std::vector<std::string> args;

  ProjectionTable(
    TablePtr t, std::vector<std::string> a, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// Adds a computed column, named `alias` or after the expression
class ComputeTable : public NodeBase<ComputeTable, Table, NodeKind::ComputeTable>
{
public:
  TablePtr table;
  ScalarExpressionPtr expression;
  std::optional<std::string> alias;

  ComputeTable(
    TablePtr t, ScalarExpressionPtr e, std::optional<std::string> a = std::nullopt,
    ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

class AliasTable : public NodeBase<AliasTable, Table, NodeKind::AliasTable>
{
public:
  TablePtr table;
  std::string name;

  AliasTable(TablePtr t, std::string n, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// `aggregate op field of table`; field `*` with op `count` counts rows
class AggregationTable : public NodeBase<AggregationTable, Table, NodeKind::AggregationTable>
{
public:
  TablePtr table;
  std::string field;
  std::string op;
  std::optional<std::string> alias;

  AggregationTable(
    TablePtr t, std::string f, std::string o, std::optional<std::string> a = std::nullopt,
    ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

class SortedTable : public NodeBase<SortedTable, Table, NodeKind::SortedTable>
{
public:
  TablePtr table;
  std::string field;
  SortDirection direction;

  SortedTable(
    TablePtr t, std::string f, SortDirection d, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// `table[i, j, ...]`; indices are 1-based, negative from the end
class IndexTable : public NodeBase<IndexTable, Table, NodeKind::IndexTable>
{
public:
  TablePtr table;
  std::vector<ValuePtr> indices;

  IndexTable(
    TablePtr t, std::vector<ValuePtr> idx, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// `table[base : limit]`
class SlicedTable : public NodeBase<SlicedTable, Table, NodeKind::SlicedTable>
{
public:
  TablePtr table;
  ValuePtr base;
  ValuePtr limit;

  SlicedTable(
    TablePtr t, ValuePtr b, ValuePtr l, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// `lhs join rhs on (in_params)`; the parameters bind inputs of rhs to outputs of lhs
class JoinTable : public NodeBase<JoinTable, Table, NodeKind::JoinTable>
{
public:
  TablePtr lhs;
  TablePtr rhs;
  std::vector<InputParamPtr> in_params;

  JoinTable(
    TablePtr l, TablePtr rt, std::vector<InputParamPtr> params,
    ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// The last `delta` events of `stream` starting at `base` (both Numbers)
class WindowTable : public NodeBase<WindowTable, Table, NodeKind::WindowTable>
{
public:
  ValuePtr base;
  ValuePtr delta;
  StreamPtr stream;

  WindowTable(
    ValuePtr b, ValuePtr d, StreamPtr st, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// The events of `stream` in the `delta` (Measure(ms)) before `base` (Date)
class TimeSeriesTable : public NodeBase<TimeSeriesTable, Table, NodeKind::TimeSeriesTable>
{
public:
  ValuePtr base;
  ValuePtr delta;
  StreamPtr stream;

  TimeSeriesTable(
    ValuePtr b, ValuePtr d, StreamPtr st, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// Like WindowTable, over the past results of a table
class SequenceTable : public NodeBase<SequenceTable, Table, NodeKind::SequenceTable>
{
public:
  ValuePtr base;
  ValuePtr delta;
  TablePtr table;

  SequenceTable(
    ValuePtr b, ValuePtr d, TablePtr t, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

/// Like TimeSeriesTable, over the past results of a table
class HistoryTable : public NodeBase<HistoryTable, Table, NodeKind::HistoryTable>
{
public:
  ValuePtr base;
  ValuePtr delta;
  TablePtr table;

  HistoryTable(
    ValuePtr b, ValuePtr d, TablePtr t, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] TablePtr clone() const override;
};

// ============================================================================
// Stream
// ============================================================================

class Stream : public AstNode
{
public:
  ExpressionSignaturePtr schema;

  static bool classof(const AstNode * node) { return is_stream_kind(node->kind); }

  [[nodiscard]] virtual StreamPtr clone() const = 0;

protected:
  Stream(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

class VarRefStream : public NodeBase<VarRefStream, Stream, NodeKind::VarRefStream>
{
public:
  std::string name;
  std::vector<InputParamPtr> in_params;

  VarRefStream(
    std::string n, std::vector<InputParamPtr> params, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

/// `timer(base, interval, frequency)`
class TimerStream : public NodeBase<TimerStream, Stream, NodeKind::TimerStream>
{
public:
  ValuePtr base;
  ValuePtr interval;
  ValuePtr frequency;  ///< optional

  TimerStream(
    ValuePtr b, ValuePtr i, ValuePtr f = nullptr, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

/// `attimer(time=[...], expiration_date=...)`
class AtTimerStream : public NodeBase<AtTimerStream, Stream, NodeKind::AtTimerStream>
{
public:
  std::vector<ValuePtr> time;
  ValuePtr expiration_date;  ///< optional

  AtTimerStream(
    std::vector<ValuePtr> t, ValuePtr exp = nullptr, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

/// `monitor table`, optionally only on changes of `args`
class MonitorStream : public NodeBase<MonitorStream, Stream, NodeKind::MonitorStream>
{
public:
  TablePtr table;
  std::optional<std::vector<std::string>> args;

  MonitorStream(
    TablePtr t, std::optional<std::vector<std::string>> a = std::nullopt,
    ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

/// `edge stream on new`
class EdgeNewStream : public NodeBase<EdgeNewStream, Stream, NodeKind::EdgeNewStream>
{
public:
  StreamPtr stream;

  explicit EdgeNewStream(StreamPtr st, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

/// `edge stream on filter`: fires when the filter becomes true
class EdgeFilterStream : public NodeBase<EdgeFilterStream, Stream, NodeKind::EdgeFilterStream>
{
public:
  StreamPtr stream;
  BooleanExpressionPtr filter;

  EdgeFilterStream(
    StreamPtr st, BooleanExpressionPtr f, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

class FilteredStream : public NodeBase<FilteredStream, Stream, NodeKind::FilteredStream>
{
public:
  StreamPtr stream;
  BooleanExpressionPtr filter;

  FilteredStream(
    StreamPtr st, BooleanExpressionPtr f, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

class ProjectionStream : public NodeBase<ProjectionStream, Stream, NodeKind::ProjectionStream>
{
public:
  StreamPtr stream;
  std::vector<std::string> args;

  ProjectionStream(
    StreamPtr st, std::vector<std::string> a, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

class ComputeStream : public NodeBase<ComputeStream, Stream, NodeKind::ComputeStream>
{
public:
  StreamPtr stream;
  ScalarExpressionPtr expression;
  std::optional<std::string> alias;

  ComputeStream(
    StreamPtr st, ScalarExpressionPtr e, std::optional<std::string> a = std::nullopt,
    ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

class AliasStream : public NodeBase<AliasStream, Stream, NodeKind::AliasStream>
{
public:
  StreamPtr stream;
  std::string name;

  AliasStream(StreamPtr st, std::string n, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

/// `stream join table on (in_params)`
class JoinStream : public NodeBase<JoinStream, Stream, NodeKind::JoinStream>
{
public:
  StreamPtr stream;
  TablePtr table;
  std::vector<InputParamPtr> in_params;

  JoinStream(
    StreamPtr st, TablePtr t, std::vector<InputParamPtr> params,
    ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StreamPtr clone() const override;
};

// ============================================================================
// Action
// ============================================================================

class Action : public AstNode
{
public:
  /**
   * Signature of the action. Input arguments that received a value are
   * removed from it, so it differs from the signature of the function.
   */
  ExpressionSignaturePtr schema;

  static bool classof(const AstNode * node) { return is_action_kind(node->kind); }

  [[nodiscard]] virtual ActionPtr clone() const = 0;

  /**
   * A `notify`, `return` or `save` action on the builtin selector.
   * @throws InvariantError for any other name
   */
  [[nodiscard]] static ActionPtr notify_action(const std::string & what = "notify");

protected:
  Action(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/// Invocation of an action declared with `let`
class VarRefAction : public NodeBase<VarRefAction, Action, NodeKind::VarRefAction>
{
public:
  std::string name;
  std::vector<InputParamPtr> in_params;

  VarRefAction(
    std::string n, std::vector<InputParamPtr> params, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] ActionPtr clone() const override;
};

class InvocationAction : public NodeBase<InvocationAction, Action, NodeKind::InvocationAction>
{
public:
  InvocationPtr invocation;

  explicit InvocationAction(
    InvocationPtr inv, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] ActionPtr clone() const override;

  /// notify, return or save on the builtin selector
  [[nodiscard]] bool is_notify() const;
};

// ============================================================================
// Permission functions
// ============================================================================

class PermissionFunction : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_permission_kind(node->kind); }

  [[nodiscard]] virtual PermissionFunctionPtr clone() const = 0;

  /// Matches the builtin functions (notify, return)
  [[nodiscard]] static PermissionFunctionPtr builtin();
  /// Matches every function
  [[nodiscard]] static PermissionFunctionPtr star();

protected:
  PermissionFunction(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/// `@kind.channel, filter`
class SpecifiedPermissionFunction
: public NodeBase<
    SpecifiedPermissionFunction, PermissionFunction, NodeKind::SpecifiedPermissionFunction>
{
public:
  std::string kind;
  std::string channel;
  BooleanExpressionPtr filter;
  ExpressionSignaturePtr schema;

  SpecifiedPermissionFunction(
    std::string k, std::string ch, BooleanExpressionPtr f, ExpressionSignaturePtr s = nullptr,
    SourceRange r = {});

  [[nodiscard]] PermissionFunctionPtr clone() const override;
};

/// `@kind.*`
class ClassStarPermissionFunction
: public NodeBase<
    ClassStarPermissionFunction, PermissionFunction, NodeKind::ClassStarPermissionFunction>
{
public:
  std::string kind;

  explicit ClassStarPermissionFunction(std::string k, SourceRange r = {})
  : NodeBase(r), kind(std::move(k))
  {
  }

  [[nodiscard]] PermissionFunctionPtr clone() const override
  {
    return std::make_shared<ClassStarPermissionFunction>(kind, range_);
  }
};

/// Singleton; clone() returns the same instance
class BuiltinPermissionFunction
: public NodeBase<BuiltinPermissionFunction, PermissionFunction, NodeKind::BuiltinPermissionFunction>
{
public:
  [[nodiscard]] static std::shared_ptr<BuiltinPermissionFunction> instance();

  [[nodiscard]] PermissionFunctionPtr clone() const override { return instance(); }

private:
  BuiltinPermissionFunction() = default;
};

/// Singleton; clone() returns the same instance
class StarPermissionFunction
: public NodeBase<StarPermissionFunction, PermissionFunction, NodeKind::StarPermissionFunction>
{
public:
  [[nodiscard]] static std::shared_ptr<StarPermissionFunction> instance();

  [[nodiscard]] PermissionFunctionPtr clone() const override { return instance(); }

private:
  StarPermissionFunction() = default;
};

}  // namespace thingtalk
