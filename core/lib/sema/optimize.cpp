// thingtalk/sema/optimize.cpp - Structural simplification of programs
#include "thingtalk/sema/optimize.hpp"

#include <algorithm>

#include "thingtalk/basic/casting.hpp"

namespace thingtalk
{

namespace
{

// ============================================================================
// Filters
// ============================================================================

template <typename Connective>
void flatten_into(const BooleanExpressionPtr & expr, std::vector<BooleanExpressionPtr> & out)
{
  if (const auto * conn = dyn_cast<Connective>(expr.get())) {
    for (const auto & op : conn->operands) {
      flatten_into<Connective>(op, out);
    }
    return;
  }
  out.push_back(expr);
}

/**
 * Shared shape of And and Or: `neutral` operands are dropped, one
 * `absorbing` operand decides the result.
 */
template <typename Connective>
BooleanExpressionPtr optimize_connective(
  const Connective & expr, const BooleanExpressionPtr & self, NodeKind neutral,
  NodeKind absorbing)
{
  std::vector<BooleanExpressionPtr> flattened;
  flatten_into<Connective>(self, flattened);

  std::vector<BooleanExpressionPtr> operands;
  for (const auto & op : flattened) {
    auto optimized = optimize_filter(op);
    if (optimized->kind == absorbing) {
      return optimized;
    }
    if (optimized->kind == neutral) {
      continue;
    }
    // an operand may itself have collapsed into the same connective
    flatten_into<Connective>(optimized, operands);
  }

  if (operands.empty()) {
    return neutral == NodeKind::TrueBooleanExpression ? BooleanExpression::true_expr()
                                                      : BooleanExpression::false_expr();
  }
  if (operands.size() == 1) {
    return operands.front();
  }
  return std::make_shared<Connective>(std::move(operands), expr.get_range());
}

// ============================================================================
// Tables and streams
// ============================================================================

/// The child table of a table-to-table operator, or null
TablePtr * inner_table(Table & table)
{
  switch (table.get_kind()) {
    case NodeKind::FilteredTable:
      return &cast<FilteredTable>(&table)->table;
    case NodeKind::ProjectionTable:
      return &cast<ProjectionTable>(&table)->table;
    case NodeKind::ComputeTable:
      return &cast<ComputeTable>(&table)->table;
    case NodeKind::AliasTable:
      return &cast<AliasTable>(&table)->table;
    case NodeKind::AggregationTable:
      return &cast<AggregationTable>(&table)->table;
    case NodeKind::SortedTable:
      return &cast<SortedTable>(&table)->table;
    case NodeKind::IndexTable:
      return &cast<IndexTable>(&table)->table;
    case NodeKind::SlicedTable:
      return &cast<SlicedTable>(&table)->table;
    case NodeKind::SequenceTable:
      return &cast<SequenceTable>(&table)->table;
    case NodeKind::HistoryTable:
      return &cast<HistoryTable>(&table)->table;
    default:
      return nullptr;
  }
}

/// The child stream of a stream-to-table operator, or null
StreamPtr * inner_stream(Table & table)
{
  switch (table.get_kind()) {
    case NodeKind::WindowTable:
      return &cast<WindowTable>(&table)->stream;
    case NodeKind::TimeSeriesTable:
      return &cast<TimeSeriesTable>(&table)->stream;
    default:
      return nullptr;
  }
}

/// The child stream of a stream-to-stream operator, or null
StreamPtr * inner_stream(Stream & stream)
{
  switch (stream.get_kind()) {
    case NodeKind::EdgeNewStream:
      return &cast<EdgeNewStream>(&stream)->stream;
    case NodeKind::EdgeFilterStream:
      return &cast<EdgeFilterStream>(&stream)->stream;
    case NodeKind::FilteredStream:
      return &cast<FilteredStream>(&stream)->stream;
    case NodeKind::ProjectionStream:
      return &cast<ProjectionStream>(&stream)->stream;
    case NodeKind::ComputeStream:
      return &cast<ComputeStream>(&stream)->stream;
    case NodeKind::AliasStream:
      return &cast<AliasStream>(&stream)->stream;
    default:
      return nullptr;
  }
}

TablePtr optimize_projection(const std::shared_ptr<ProjectionTable> & proj, bool allow_projection)
{
  if (!allow_projection || isa<AggregationTable>(proj->table.get())) {
    return optimize_table(proj->table, allow_projection);
  }
  auto optimized = optimize_table(proj->table, allow_projection);
  if (!optimized) {
    return nullptr;
  }
  if (auto * inner = dyn_cast<ProjectionTable>(optimized.get())) {
    return std::make_shared<ProjectionTable>(
      inner->table, proj->args, proj->schema, proj->get_range());
  }
  return std::make_shared<ProjectionTable>(
    std::move(optimized), proj->args, proj->schema, proj->get_range());
}

/// Same contract as optimize_filtered_stream()
TablePtr optimize_filtered(
  const std::shared_ptr<FilteredTable> & table, bool allow_projection, bool & done)
{
  done = true;
  table->filter = optimize_filter(table->filter);
  if (table->filter->is_true()) {
    return optimize_table(table->table, allow_projection);
  }
  if (table->filter->is_false()) {
    return nullptr;
  }

  if (auto * inner = dyn_cast<FilteredTable>(table->table.get())) {
    table->filter = optimize_filter(std::make_shared<AndBooleanExpression>(
      std::vector<BooleanExpressionPtr>{table->filter, inner->filter}));
    table->table = inner->table;
    return optimize_table(table, allow_projection);
  }

  // filter of projection becomes projection of filter
  if (auto * proj = dyn_cast<ProjectionTable>(table->table.get())) {
    auto swapped = optimize_table(
      std::make_shared<FilteredTable>(proj->table, table->filter, proj->table->schema),
      allow_projection);
    if (!swapped || !allow_projection) {
      return swapped;
    }
    return std::make_shared<ProjectionTable>(
      std::move(swapped), proj->args, proj->schema, proj->get_range());
  }

  done = false;
  return table;
}

StreamPtr optimize_stream_projection(
  const std::shared_ptr<ProjectionStream> & proj, bool allow_projection)
{
  if (!allow_projection) {
    return optimize_stream(proj->stream, allow_projection);
  }
  auto optimized = optimize_stream(proj->stream, allow_projection);
  if (!optimized) {
    return nullptr;
  }
  if (auto * inner = dyn_cast<ProjectionStream>(optimized.get())) {
    return std::make_shared<ProjectionStream>(
      inner->stream, proj->args, proj->schema, proj->get_range());
  }
  return std::make_shared<ProjectionStream>(
    std::move(optimized), proj->args, proj->schema, proj->get_range());
}

StreamPtr optimize_monitor(const std::shared_ptr<MonitorStream> & monitor, bool allow_projection)
{
  // projections inside a monitor decide which fields are monitored, keep them
  auto table = optimize_table(monitor->table, true);
  if (!table) {
    return nullptr;
  }

  if (auto * proj = dyn_cast<ProjectionTable>(table.get())) {
    auto args = monitor->args ? monitor->args : std::optional<std::vector<std::string>>(proj->args);
    auto new_monitor = std::make_shared<MonitorStream>(
      proj->table, std::move(args), monitor->schema, monitor->get_range());
    if (!allow_projection) {
      return new_monitor;
    }
    return std::make_shared<ProjectionStream>(new_monitor, proj->args, monitor->schema);
  }

  monitor->table = std::move(table);
  return monitor;
}

/**
 * Rewrites specific to a filtered stream. Returns the stream unchanged when
 * none applies, so that the generic child recursion runs.
 */
StreamPtr optimize_filtered_stream(
  const std::shared_ptr<FilteredStream> & stream, bool allow_projection, bool & done)
{
  done = true;
  stream->filter = optimize_filter(stream->filter);
  if (stream->filter->is_true()) {
    return optimize_stream(stream->stream, allow_projection);
  }
  if (stream->filter->is_false()) {
    return nullptr;
  }

  if (auto * inner = dyn_cast<FilteredStream>(stream->stream.get())) {
    stream->filter = optimize_filter(std::make_shared<AndBooleanExpression>(
      std::vector<BooleanExpressionPtr>{stream->filter, inner->filter}));
    stream->stream = inner->stream;
    return optimize_stream(stream, allow_projection);
  }

  // filter of monitor becomes monitor of filter
  if (auto * monitor = dyn_cast<MonitorStream>(stream->stream.get())) {
    auto filtered =
      std::make_shared<FilteredTable>(monitor->table, stream->filter, monitor->table->schema);
    return optimize_stream(
      std::make_shared<MonitorStream>(filtered, monitor->args, monitor->schema, monitor->get_range()),
      allow_projection);
  }

  if (auto * proj = dyn_cast<ProjectionStream>(stream->stream.get())) {
    auto filtered =
      std::make_shared<FilteredStream>(proj->stream, stream->filter, proj->stream->schema);
    if (!allow_projection) {
      return optimize_stream(filtered, allow_projection);
    }
    return optimize_stream(
      std::make_shared<ProjectionStream>(filtered, proj->args, proj->schema, proj->get_range()),
      allow_projection);
  }

  done = false;
  return stream;
}

bool has_builtin_action(const std::vector<ActionPtr> & actions)
{
  return std::any_of(actions.begin(), actions.end(), [](const ActionPtr & action) {
    const auto * invocation = dyn_cast<InvocationAction>(action.get());
    return invocation && isa<BuiltinDevice>(invocation->invocation->selector.get());
  });
}

/// Returns false when the statement can be dropped
bool optimize_statement(Statement & statement)
{
  if (auto * rule = dyn_cast<Rule>(&statement)) {
    // projections only matter when the results are shown to the user
    rule->stream = optimize_stream(rule->stream, has_builtin_action(rule->actions));
    return rule->stream && !rule->actions.empty();
  }
  if (auto * command = dyn_cast<Command>(&statement)) {
    if (command->table) {
      command->table = optimize_table(command->table, has_builtin_action(command->actions));
      if (!command->table) {
        return false;
      }
    }
    return !command->actions.empty();
  }
  return true;
}

}  // namespace

// ============================================================================
// Entry points
// ============================================================================

BooleanExpressionPtr optimize_filter(const BooleanExpressionPtr & expr)
{
  switch (expr->get_kind()) {
    case NodeKind::AndBooleanExpression:
      return optimize_connective(
        *cast<AndBooleanExpression>(expr.get()), expr, NodeKind::TrueBooleanExpression,
        NodeKind::FalseBooleanExpression);
    case NodeKind::OrBooleanExpression:
      return optimize_connective(
        *cast<OrBooleanExpression>(expr.get()), expr, NodeKind::FalseBooleanExpression,
        NodeKind::TrueBooleanExpression);
    case NodeKind::NotBooleanExpression: {
      const auto * not_expr = cast<NotBooleanExpression>(expr.get());
      auto inner = optimize_filter(not_expr->expr);
      if (inner == not_expr->expr) {
        return expr;
      }
      return std::make_shared<NotBooleanExpression>(std::move(inner), expr->get_range());
    }
    case NodeKind::ExternalBooleanExpression: {
      const auto * external = cast<ExternalBooleanExpression>(expr.get());
      auto inner = optimize_filter(external->filter);
      if (inner == external->filter) {
        return expr;
      }
      return std::make_shared<ExternalBooleanExpression>(
        external->selector, external->channel, external->in_params, std::move(inner),
        external->schema, expr->get_range());
    }
    default:
      return expr;
  }
}

TablePtr optimize_table(TablePtr table, bool allow_projection)
{
  if (isa<VarRefTable>(table.get()) || isa<InvocationTable>(table.get())) {
    return table;
  }

  if (auto proj = dyn_cast<ProjectionTable>(table)) {
    return optimize_projection(proj, allow_projection);
  }

  if (auto filtered = dyn_cast<FilteredTable>(table)) {
    bool done = false;
    auto result = optimize_filtered(filtered, allow_projection, done);
    if (done) {
      return result;
    }
  }

  if (auto * index = dyn_cast<IndexTable>(table.get())) {
    if (index->indices.size() == 1) {
      if (auto * array = dyn_cast<ArrayValue>(index->indices.front().get())) {
        auto elements = array->value;
        index->indices = std::move(elements);
      }
    }
  }

  if (auto * slice = dyn_cast<SlicedTable>(table.get())) {
    const auto * limit = dyn_cast<NumberValue>(slice->limit.get());
    if (limit && limit->value == 1) {
      return optimize_table(
        std::make_shared<IndexTable>(
          slice->table, std::vector<ValuePtr>{slice->base}, slice->table->schema,
          slice->get_range()),
        allow_projection);
    }
  }

  if (TablePtr * child = inner_table(*table)) {
    auto inner = optimize_table(*child, allow_projection);
    if (!inner) {
      return nullptr;
    }
    *child = std::move(inner);
    return table;
  }
  if (StreamPtr * child = inner_stream(*table)) {
    auto inner = optimize_stream(*child, allow_projection);
    if (!inner) {
      return nullptr;
    }
    *child = std::move(inner);
    return table;
  }

  if (auto * join = dyn_cast<JoinTable>(table.get())) {
    auto lhs = optimize_table(join->lhs, allow_projection);
    if (!lhs) {
      return nullptr;
    }
    auto rhs = optimize_table(join->rhs, allow_projection);
    if (!rhs) {
      return nullptr;
    }
    join->lhs = std::move(lhs);
    join->rhs = std::move(rhs);
  }
  return table;
}

StreamPtr optimize_stream(StreamPtr stream, bool allow_projection)
{
  switch (stream->get_kind()) {
    case NodeKind::VarRefStream:
    case NodeKind::TimerStream:
    case NodeKind::AtTimerStream:
      return stream;
    case NodeKind::ProjectionStream:
      return optimize_stream_projection(
        std::static_pointer_cast<ProjectionStream>(stream), allow_projection);
    case NodeKind::MonitorStream:
      return optimize_monitor(std::static_pointer_cast<MonitorStream>(stream), allow_projection);
    case NodeKind::FilteredStream: {
      bool done = false;
      auto result = optimize_filtered_stream(
        std::static_pointer_cast<FilteredStream>(stream), allow_projection, done);
      if (done) {
        return result;
      }
      break;
    }
    case NodeKind::EdgeNewStream: {
      const auto & inner = cast<EdgeNewStream>(stream.get())->stream;
      // a monitor only fires on new results already
      if (isa<MonitorStream>(inner.get()) || isa<EdgeNewStream>(inner.get())) {
        return optimize_stream(inner, allow_projection);
      }
      break;
    }
    case NodeKind::EdgeFilterStream: {
      auto * edge = cast<EdgeFilterStream>(stream.get());
      // `edge on true` fires once, so only the false case folds
      edge->filter = optimize_filter(edge->filter);
      if (edge->filter->is_false()) {
        return nullptr;
      }
      break;
    }
    default:
      break;
  }

  if (StreamPtr * child = inner_stream(*stream)) {
    auto inner = optimize_stream(*child, allow_projection);
    if (!inner) {
      return nullptr;
    }
    *child = std::move(inner);
    return stream;
  }

  if (auto * join = dyn_cast<JoinStream>(stream.get())) {
    auto lhs = optimize_stream(join->stream, allow_projection);
    if (!lhs) {
      return nullptr;
    }
    auto rhs = optimize_table(join->table, allow_projection);
    if (!rhs) {
      return nullptr;
    }
    join->stream = std::move(lhs);
    join->table = std::move(rhs);
  }
  return stream;
}

ProgramPtr optimize_program(ProgramPtr program)
{
  std::vector<StatementPtr> statements;
  for (auto & statement : program->statements) {
    if (optimize_statement(*statement)) {
      statements.push_back(statement);
    }
  }
  program->statements = std::move(statements);
  if (program->statements.empty() && program->classes.empty()) {
    return nullptr;
  }
  return program;
}

}  // namespace thingtalk
