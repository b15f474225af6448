// thingtalk/ast/prettyprint.cpp - Surface syntax emission
#include "thingtalk/ast/prettyprint.hpp"

#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"

namespace thingtalk
{

namespace
{

// ============================================================================
// Helpers
// ============================================================================

const std::set<std::string, std::less<>> k_infix_filter_ops = {"==", ">=", "<=", ">",
                                                                "<",  "=~", "~="};
const std::set<std::string, std::less<>> k_infix_scalar_ops = {"+", "-", "*", "/", "%", "**"};

[[nodiscard]] std::string render_number(double v) { return fmt::format("{}", v); }

/// Double-quoted, with JSON escapes
[[nodiscard]] std::string quote(std::string_view s) { return nlohmann::json(s).dump(); }

[[nodiscard]] std::string render_time(const AbsoluteTime & t)
{
  if (t.second != 0) {
    return fmt::format("new Time({}, {}, {})", t.hour, t.minute, t.second);
  }
  return fmt::format("new Time({}, {})", t.hour, t.minute);
}

[[nodiscard]] std::string render_bare_time(const AbsoluteTime & t)
{
  return fmt::format("{}:{:02}:{:02}", t.hour, t.minute, t.second);
}

[[nodiscard]] std::string render_date(const DateLike & date)
{
  struct Visitor
  {
    std::string operator()(const DateNow &) const { return "$now"; }
    std::string operator()(const AbsoluteDate & d) const
    {
      return fmt::format("new Date({})", d.ms_since_epoch);
    }
    std::string operator()(const DateEdge & d) const
    {
      return fmt::format("${}({})", to_string(d.edge), d.unit);
    }
    std::string operator()(const DatePiece & d) const
    {
      auto opt = [](const std::optional<int> & v) { return v ? std::to_string(*v) : ""; };
      std::string out = fmt::format("new Date({}, {}, {}", opt(d.year), opt(d.month), opt(d.day));
      if (d.time) {
        out += ", " + render_bare_time(*d.time);
      }
      return out + ")";
    }
    std::string operator()(const WeekDayDate & d) const
    {
      if (d.time) {
        return fmt::format("new Date(enum {}, {})", d.weekday, render_bare_time(*d.time));
      }
      return fmt::format("new Date(enum {})", d.weekday);
    }
  };
  return std::visit(Visitor{}, date);
}

[[nodiscard]] std::string render_location(const LocationLike & loc)
{
  struct Visitor
  {
    std::string operator()(const AbsoluteLocation & l) const
    {
      if (l.display) {
        return fmt::format(
          "new Location({}, {}, {})", render_number(l.lat), render_number(l.lon),
          quote(*l.display));
      }
      return fmt::format("new Location({}, {})", render_number(l.lat), render_number(l.lon));
    }
    std::string operator()(const RelativeLocation & l) const
    {
      return "$location." + l.relative_tag;
    }
    std::string operator()(const UnresolvedLocation & l) const
    {
      return fmt::format("new Location({})", quote(l.name));
    }
  };
  return std::visit(Visitor{}, loc);
}

[[nodiscard]] std::string render_rule(const RecurrentTimeRule & r)
{
  std::vector<std::string> fields;
  fields.push_back("beginTime=" + render_time(r.begin_time));
  fields.push_back("endTime=" + render_time(r.end_time));
  if (r.interval_value != 1 || r.interval_unit != "day") {
    fields.push_back("interval=" + render_number(r.interval_value) + r.interval_unit);
  }
  if (r.frequency != 1) {
    fields.push_back("frequency=" + render_number(r.frequency));
  }
  if (r.day_of_week) {
    fields.push_back("dayOfWeek=enum " + *r.day_of_week);
  }
  if (r.begin_date) {
    fields.push_back("beginDate=" + render_date(*r.begin_date));
  }
  if (r.end_date) {
    fields.push_back("endDate=" + render_date(*r.end_date));
  }
  if (r.subtract) {
    fields.push_back("subtract=true");
  }
  return "{" + join(fields, ", ") + "}";
}

template <typename T>
[[nodiscard]] std::string render_list(const std::vector<std::shared_ptr<T>> & items)
{
  std::vector<std::string> parts;
  parts.reserve(items.size());
  for (const auto & item : items) {
    parts.push_back(to_source(*item));
  }
  return join(parts, ", ");
}

[[nodiscard]] std::string render_annotations(
  const NLAnnotationMap & nl, const AnnotationMap & impl, const std::string & sep)
{
  std::string out;
  for (const auto & [key, value] : nl) {
    out += sep + "#_[" + key + "=" + value.dump() + "]";
  }
  for (const auto & [key, value] : impl) {
    out += sep + "#[" + key + "=" + to_source(*value) + "]";
  }
  return out;
}

/// Wrap compound filters so that they bind tighter than a surrounding operator
[[nodiscard]] std::string render_operand(const BooleanExpression & expr)
{
  if (isa<AndBooleanExpression>(&expr) || isa<OrBooleanExpression>(&expr)) {
    return "(" + to_source(expr) + ")";
  }
  return to_source(expr);
}

[[nodiscard]] std::string render_scalar_operand(const ScalarExpression & expr)
{
  if (const auto * derived = dyn_cast<DerivedScalarExpression>(&expr)) {
    if (k_infix_scalar_ops.count(derived->op) != 0) {
      return "(" + to_source(expr) + ")";
    }
  }
  return to_source(expr);
}

[[nodiscard]] std::string render_history(
  std::string_view op, const ValuePtr & base, const ValuePtr & delta, const std::string & inner)
{
  return fmt::format("{}({}, {}, {})", op, to_source(*base), to_source(*delta), inner);
}

[[nodiscard]] std::string render_permission_filter(const BooleanExpressionPtr & filter)
{
  if (!filter || filter->is_true()) {
    return "";
  }
  return ", " + to_source(*filter);
}

}  // namespace

// ============================================================================
// Values
// ============================================================================

std::string to_source(const Value & value)
{
  switch (value.get_kind()) {
    case NodeKind::BooleanValue:
      return cast<BooleanValue>(&value)->value ? "true" : "false";
    case NodeKind::StringValue:
      return quote(cast<StringValue>(&value)->value);
    case NodeKind::NumberValue:
      return render_number(cast<NumberValue>(&value)->value);
    case NodeKind::CurrencyValue: {
      const auto * v = cast<CurrencyValue>(&value);
      return render_number(v->value) + "$" + v->code;
    }
    case NodeKind::EntityValue: {
      const auto * v = cast<EntityValue>(&value);
      std::string out = v->value ? quote(*v->value) : "null";
      out += "^^" + v->type;
      if (v->display) {
        out += "(" + quote(*v->display) + ")";
      }
      return out;
    }
    case NodeKind::MeasureValue: {
      const auto * v = cast<MeasureValue>(&value);
      return render_number(v->value) + v->unit;
    }
    case NodeKind::EnumValue:
      return "enum " + cast<EnumValue>(&value)->value;
    case NodeKind::TimeValue: {
      const auto & t = cast<TimeValue>(&value)->value;
      if (const auto * abs = std::get_if<AbsoluteTime>(&t)) {
        return render_time(*abs);
      }
      return "$time." + std::get<RelativeTime>(t).relative_tag;
    }
    case NodeKind::DateValue:
      return render_date(cast<DateValue>(&value)->value);
    case NodeKind::LocationValue:
      return render_location(cast<LocationValue>(&value)->value);
    case NodeKind::RecurrentTimeSpecificationValue: {
      std::vector<std::string> rules;
      for (const auto & r : cast<RecurrentTimeSpecificationValue>(&value)->rules) {
        rules.push_back(render_rule(r));
      }
      return "new RecurrentTimeSpecification(" + join(rules, ", ") + ")";
    }
    case NodeKind::ArgMapValue: {
      std::vector<std::string> entries;
      for (const auto & [name, type] : cast<ArgMapValue>(&value)->value) {
        entries.push_back(name + ":" + type->to_string());
      }
      return "new ArgMap(" + join(entries, ",") + ")";
    }
    case NodeKind::ArrayValue:
      return "[" + render_list(cast<ArrayValue>(&value)->value) + "]";
    case NodeKind::ObjectValue: {
      std::vector<std::string> fields;
      for (const auto & [name, v] : cast<ObjectValue>(&value)->value) {
        fields.push_back(name + "=" + to_source(*v));
      }
      return "{ " + join(fields, ", ") + " }";
    }
    case NodeKind::VarRefValue:
      return cast<VarRefValue>(&value)->name;
    case NodeKind::EventValue: {
      const auto * v = cast<EventValue>(&value);
      return v->name ? "$event." + *v->name : "$event";
    }
    case NodeKind::ContextRefValue: {
      const auto * v = cast<ContextRefValue>(&value);
      return "$context." + v->name + " : " + v->get_type()->to_string();
    }
    case NodeKind::UndefinedValue:
      return "$?";
    case NodeKind::FilterValue: {
      const auto * v = cast<FilterValue>(&value);
      return "(" + to_source(*v->value) + " filter " + to_source(*v->filter) + ")";
    }
    case NodeKind::ArrayFieldValue: {
      const auto * v = cast<ArrayFieldValue>(&value);
      return v->field + " of " + to_source(*v->value);
    }
    case NodeKind::ComputationValue: {
      const auto * v = cast<ComputationValue>(&value);
      if (k_infix_scalar_ops.count(v->op) != 0 && v->operands.size() == 2) {
        return "(" + to_source(*v->operands[0]) + " " + v->op + " " + to_source(*v->operands[1]) +
               ")";
      }
      return v->op + "(" + render_list(v->operands) + ")";
    }
    case NodeKind::NullValue:
      return "null";
    default:
      break;
  }
  throw InvariantError("Unexpected value kind " + std::string(to_string(value.get_kind())));
}

// ============================================================================
// Selectors and invocations
// ============================================================================

std::string to_source(const InputParam & param)
{
  return param.name + "=" + to_source(*param.value);
}

std::string to_source(const Selector & selector)
{
  const auto * dev = dyn_cast<DeviceSelector>(&selector);
  if (!dev) {
    return "";
  }

  std::vector<std::string> params;
  if (dev->id) {
    params.push_back("id=" + quote(*dev->id));
  }
  for (const auto & attr : dev->attributes) {
    params.push_back(to_source(*attr));
  }
  if (dev->all) {
    params.push_back("all=true");
  }

  std::string out = "@" + dev->kind;
  if (!params.empty()) {
    out += "(" + join(params, ", ") + ")";
  }
  return out;
}

std::string to_source(const Invocation & invocation)
{
  const std::string params = "(" + render_list(invocation.in_params) + ")";
  if (isa<BuiltinDevice>(invocation.selector.get())) {
    return invocation.channel + params;
  }
  return to_source(*invocation.selector) + "." + invocation.channel + params;
}

// ============================================================================
// Filters and scalars
// ============================================================================

std::string to_source(const BooleanExpression & expr)
{
  switch (expr.get_kind()) {
    case NodeKind::TrueBooleanExpression:
      return "true";
    case NodeKind::FalseBooleanExpression:
      return "false";
    case NodeKind::AndBooleanExpression: {
      std::vector<std::string> parts;
      for (const auto & op : cast<AndBooleanExpression>(&expr)->operands) {
        parts.push_back(render_operand(*op));
      }
      return parts.empty() ? "true" : join(parts, " && ");
    }
    case NodeKind::OrBooleanExpression: {
      std::vector<std::string> parts;
      for (const auto & op : cast<OrBooleanExpression>(&expr)->operands) {
        parts.push_back(render_operand(*op));
      }
      return parts.empty() ? "false" : join(parts, " || ");
    }
    case NodeKind::NotBooleanExpression:
      return "!(" + to_source(*cast<NotBooleanExpression>(&expr)->expr) + ")";
    case NodeKind::AtomBooleanExpression: {
      const auto * atom = cast<AtomBooleanExpression>(&expr);
      if (k_infix_filter_ops.count(atom->op) != 0) {
        return atom->name + " " + atom->op + " " + to_source(*atom->value);
      }
      return atom->op + "(" + atom->name + ", " + to_source(*atom->value) + ")";
    }
    case NodeKind::ExternalBooleanExpression: {
      const auto * ext = cast<ExternalBooleanExpression>(&expr);
      std::string call = ext->channel + "(" + render_list(ext->in_params) + ")";
      if (!isa<BuiltinDevice>(ext->selector.get())) {
        call = to_source(*ext->selector) + "." + call;
      }
      return "any(" + call + " filter " + to_source(*ext->filter) + ")";
    }
    case NodeKind::DontCareBooleanExpression:
      return "true(" + cast<DontCareBooleanExpression>(&expr)->name + ")";
    case NodeKind::ComputeBooleanExpression: {
      const auto * c = cast<ComputeBooleanExpression>(&expr);
      if (k_infix_filter_ops.count(c->op) != 0) {
        return to_source(*c->lhs) + " " + c->op + " " + to_source(*c->rhs);
      }
      return c->op + "(" + to_source(*c->lhs) + ", " + to_source(*c->rhs) + ")";
    }
    default:
      break;
  }
  throw InvariantError("Unexpected filter kind " + std::string(to_string(expr.get_kind())));
}

std::string to_source(const ScalarExpression & expr)
{
  switch (expr.get_kind()) {
    case NodeKind::PrimaryScalarExpression:
      return to_source(*cast<PrimaryScalarExpression>(&expr)->value);
    case NodeKind::DerivedScalarExpression: {
      const auto * d = cast<DerivedScalarExpression>(&expr);
      if (k_infix_scalar_ops.count(d->op) != 0 && d->operands.size() == 2) {
        return render_scalar_operand(*d->operands[0]) + " " + d->op + " " +
               render_scalar_operand(*d->operands[1]);
      }
      std::vector<std::string> parts;
      for (const auto & op : d->operands) {
        parts.push_back(to_source(*op));
      }
      return d->op + "(" + join(parts, ", ") + ")";
    }
    case NodeKind::AggregationScalarExpression: {
      const auto * a = cast<AggregationScalarExpression>(&expr);
      if (a->field) {
        return a->op + "(" + *a->field + " of " + to_source(*a->list) + ")";
      }
      return a->op + "(" + to_source(*a->list) + ")";
    }
    case NodeKind::VarRefScalarExpression: {
      const auto * v = cast<VarRefScalarExpression>(&expr);
      std::string prefix;
      if (v->selector && !isa<BuiltinDevice>(v->selector.get())) {
        prefix = to_source(*v->selector) + ".";
      }
      return prefix + v->name + "(" + render_list(v->args) + ")";
    }
    default:
      break;
  }
  throw InvariantError("Unexpected scalar kind " + std::string(to_string(expr.get_kind())));
}

// ============================================================================
// Tables, streams, actions
// ============================================================================

std::string to_source(const Table & table)
{
  switch (table.get_kind()) {
    case NodeKind::VarRefTable: {
      const auto * t = cast<VarRefTable>(&table);
      return t->name + "(" + render_list(t->in_params) + ")";
    }
    case NodeKind::ResultRefTable: {
      const auto * t = cast<ResultRefTable>(&table);
      return fmt::format("result(@{}.{}[{}])", t->kind, t->channel, to_source(*t->index));
    }
    case NodeKind::InvocationTable:
      return to_source(*cast<InvocationTable>(&table)->invocation);
    case NodeKind::FilteredTable: {
      const auto * t = cast<FilteredTable>(&table);
      return "(" + to_source(*t->table) + ") filter " + to_source(*t->filter);
    }
    case NodeKind::ProjectionTable: {
      const auto * t = cast<ProjectionTable>(&table);
      return "[" + join(t->args, ", ") + "] of (" + to_source(*t->table) + ")";
    }
    case NodeKind::ComputeTable: {
      const auto * t = cast<ComputeTable>(&table);
      std::string out = "compute " + to_source(*t->expression);
      if (t->alias) {
        out += " as " + *t->alias;
      }
      return out + " of (" + to_source(*t->table) + ")";
    }
    case NodeKind::AliasTable: {
      const auto * t = cast<AliasTable>(&table);
      return "(" + to_source(*t->table) + ") as " + t->name;
    }
    case NodeKind::AggregationTable: {
      const auto * t = cast<AggregationTable>(&table);
      std::string out = "aggregate " + t->op;
      if (t->field != "*") {
        out += " " + t->field;
      }
      if (t->alias) {
        out += " as " + *t->alias;
      }
      return out + " of (" + to_source(*t->table) + ")";
    }
    case NodeKind::SortedTable: {
      const auto * t = cast<SortedTable>(&table);
      return fmt::format(
        "sort({} {} of ({}))", t->field, to_string(t->direction), to_source(*t->table));
    }
    case NodeKind::IndexTable: {
      const auto * t = cast<IndexTable>(&table);
      return "(" + to_source(*t->table) + ")[" + render_list(t->indices) + "]";
    }
    case NodeKind::SlicedTable: {
      const auto * t = cast<SlicedTable>(&table);
      return "(" + to_source(*t->table) + ")[" + to_source(*t->base) + " : " +
             to_source(*t->limit) + "]";
    }
    case NodeKind::JoinTable: {
      const auto * t = cast<JoinTable>(&table);
      std::string out = "(" + to_source(*t->lhs) + ") join (" + to_source(*t->rhs) + ")";
      if (!t->in_params.empty()) {
        out += " on (" + render_list(t->in_params) + ")";
      }
      return out;
    }
    case NodeKind::WindowTable: {
      const auto * t = cast<WindowTable>(&table);
      return render_history("window", t->base, t->delta, to_source(*t->stream));
    }
    case NodeKind::TimeSeriesTable: {
      const auto * t = cast<TimeSeriesTable>(&table);
      return render_history("timeseries", t->base, t->delta, to_source(*t->stream));
    }
    case NodeKind::SequenceTable: {
      const auto * t = cast<SequenceTable>(&table);
      return render_history("sequence", t->base, t->delta, to_source(*t->table));
    }
    case NodeKind::HistoryTable: {
      const auto * t = cast<HistoryTable>(&table);
      return render_history("history", t->base, t->delta, to_source(*t->table));
    }
    default:
      break;
  }
  throw InvariantError("Unexpected table kind " + std::string(to_string(table.get_kind())));
}

std::string to_source(const Stream & stream)
{
  switch (stream.get_kind()) {
    case NodeKind::VarRefStream: {
      const auto * s = cast<VarRefStream>(&stream);
      return s->name + "(" + render_list(s->in_params) + ")";
    }
    case NodeKind::TimerStream: {
      const auto * s = cast<TimerStream>(&stream);
      std::string out =
        "timer(base=" + to_source(*s->base) + ", interval=" + to_source(*s->interval);
      if (s->frequency) {
        out += ", frequency=" + to_source(*s->frequency);
      }
      return out + ")";
    }
    case NodeKind::AtTimerStream: {
      const auto * s = cast<AtTimerStream>(&stream);
      std::string out = "attimer(time=[" + render_list(s->time) + "]";
      if (s->expiration_date) {
        out += ", expiration_date=" + to_source(*s->expiration_date);
      }
      return out + ")";
    }
    case NodeKind::MonitorStream: {
      const auto * s = cast<MonitorStream>(&stream);
      std::string out = "monitor(" + to_source(*s->table) + ")";
      if (s->args) {
        out += " on new [" + join(*s->args, ", ") + "]";
      }
      return out;
    }
    case NodeKind::EdgeNewStream:
      return "edge (" + to_source(*cast<EdgeNewStream>(&stream)->stream) + ") on new";
    case NodeKind::EdgeFilterStream: {
      const auto * s = cast<EdgeFilterStream>(&stream);
      return "edge (" + to_source(*s->stream) + ") on " + to_source(*s->filter);
    }
    case NodeKind::FilteredStream: {
      const auto * s = cast<FilteredStream>(&stream);
      return "(" + to_source(*s->stream) + ") filter " + to_source(*s->filter);
    }
    case NodeKind::ProjectionStream: {
      const auto * s = cast<ProjectionStream>(&stream);
      return "[" + join(s->args, ", ") + "] of (" + to_source(*s->stream) + ")";
    }
    case NodeKind::ComputeStream: {
      const auto * s = cast<ComputeStream>(&stream);
      std::string out = "compute " + to_source(*s->expression);
      if (s->alias) {
        out += " as " + *s->alias;
      }
      return out + " of (" + to_source(*s->stream) + ")";
    }
    case NodeKind::AliasStream: {
      const auto * s = cast<AliasStream>(&stream);
      return "(" + to_source(*s->stream) + ") as " + s->name;
    }
    case NodeKind::JoinStream: {
      const auto * s = cast<JoinStream>(&stream);
      std::string out = "(" + to_source(*s->stream) + ") join (" + to_source(*s->table) + ")";
      if (!s->in_params.empty()) {
        out += " on (" + render_list(s->in_params) + ")";
      }
      return out;
    }
    default:
      break;
  }
  throw InvariantError("Unexpected stream kind " + std::string(to_string(stream.get_kind())));
}

std::string to_source(const Action & action)
{
  if (const auto * ref = dyn_cast<VarRefAction>(&action)) {
    return ref->name + "(" + render_list(ref->in_params) + ")";
  }
  const auto * inv = cast<InvocationAction>(&action);
  if (inv->is_notify() && inv->invocation->in_params.empty()) {
    return inv->invocation->channel;
  }
  return to_source(*inv->invocation);
}

std::string to_source(const PermissionFunction & fn)
{
  switch (fn.get_kind()) {
    case NodeKind::SpecifiedPermissionFunction: {
      const auto * s = cast<SpecifiedPermissionFunction>(&fn);
      return "@" + s->kind + "." + s->channel + render_permission_filter(s->filter);
    }
    case NodeKind::ClassStarPermissionFunction:
      return "@" + cast<ClassStarPermissionFunction>(&fn)->kind + ".*";
    case NodeKind::BuiltinPermissionFunction:
      return "now";
    case NodeKind::StarPermissionFunction:
      return "*";
    default:
      break;
  }
  throw InvariantError("Unexpected permission kind " + std::string(to_string(fn.get_kind())));
}

// ============================================================================
// Statements and programs
// ============================================================================

std::string to_source(const Statement & statement)
{
  auto render_actions = [](const std::vector<ActionPtr> & actions) {
    if (actions.size() == 1) {
      return to_source(*actions[0]);
    }
    return "{ " + render_list(actions) + "; }";
  };

  switch (statement.get_kind()) {
    case NodeKind::Rule: {
      const auto * r = cast<Rule>(&statement);
      return to_source(*r->stream) + " => " + render_actions(r->actions) + ";";
    }
    case NodeKind::Command: {
      const auto * c = cast<Command>(&statement);
      if (c->table) {
        return "now => " + to_source(*c->table) + " => " + render_actions(c->actions) + ";";
      }
      return "now => " + render_actions(c->actions) + ";";
    }
    case NodeKind::Assignment: {
      const auto * a = cast<Assignment>(&statement);
      return "let result " + a->name + " := " + to_source(*a->value) + ";";
    }
    default:
      break;
  }
  throw InvariantError(
    "Unexpected statement kind " + std::string(to_string(statement.get_kind())));
}

std::string to_source(const PermissionRule & rule)
{
  return to_source(*rule.principal) + " : " + to_source(*rule.query) + " => " +
         to_source(*rule.action) + ";";
}

std::string to_source(const Program & program)
{
  std::ostringstream out;
  if (program.principal) {
    out << "executor = " << to_source(*program.principal) << " : ";
  }
  bool first = true;
  for (const auto & klass : program.classes) {
    out << (first ? "" : "\n") << to_source(*klass);
    first = false;
  }
  for (const auto & stmt : program.statements) {
    out << (first ? "" : "\n") << to_source(*stmt);
    first = false;
  }
  return out.str();
}

// ============================================================================
// Class declarations
// ============================================================================

std::string to_source(const ArgumentDef & arg)
{
  std::string out;
  if (arg.direction != ArgDirection::None) {
    out = std::string(to_string(arg.direction)) + " ";
  }
  out += arg.name + " : " + arg.type->to_string();
  return out + render_annotations(arg.nl_annotations, arg.impl_annotations, " ");
}

std::string to_source(const FunctionDef & fn)
{
  std::string out;
  if (fn.is_monitorable) {
    out += "monitorable ";
  }
  if (fn.is_list) {
    out += "list ";
  }
  out += fn.function_type() == FunctionType::Action ? "action " : "query ";
  out += fn.name();
  if (!fn.extends().empty()) {
    out += " extends " + join(fn.extends(), ", ");
  }

  std::vector<std::string> args;
  for (const auto & arg : fn.local_arguments()) {
    // compound fields are printed as part of their compound type
    if (arg->name.find('.') != std::string::npos) {
      continue;
    }
    args.push_back(to_source(*arg));
  }
  if (args.empty()) {
    out += "()";
  } else {
    out += "(" + join(args, ",\n    ") + ")";
  }
  return out + render_annotations(fn.nl_annotations(), fn.impl_annotations(), "\n  ") + ";";
}

std::string to_source(const ClassDef & klass)
{
  std::ostringstream out;
  if (klass.is_abstract) {
    out << "abstract ";
  }
  out << "class @" << klass.kind;
  if (!klass.extends.empty()) {
    std::vector<std::string> parents;
    for (const auto & parent : klass.extends) {
      parents.push_back("@" + parent);
    }
    out << " extends " << join(parents, ", ");
  }
  out << render_annotations(klass.nl_annotations, klass.impl_annotations, "\n") << " {\n";

  for (const auto & import : klass.imports) {
    out << "  import " << join(import->facets, ", ") << " from @" << import->module << "("
        << render_list(import->in_params) << ");\n";
  }
  for (const auto & [name, fn] : klass.queries) {
    out << "\n  " << to_source(*fn) << "\n";
  }
  for (const auto & [name, fn] : klass.actions) {
    out << "\n  " << to_source(*fn) << "\n";
  }
  out << "}";
  return out.str();
}

// ============================================================================
// Generic dispatch
// ============================================================================

std::string to_source(const AstNode & node)
{
  if (const auto * v = dyn_cast<Value>(&node)) return to_source(*v);
  if (const auto * s = dyn_cast<Selector>(&node)) return to_source(*s);
  if (const auto * b = dyn_cast<BooleanExpression>(&node)) return to_source(*b);
  if (const auto * s = dyn_cast<ScalarExpression>(&node)) return to_source(*s);
  if (const auto * t = dyn_cast<Table>(&node)) return to_source(*t);
  if (const auto * s = dyn_cast<Stream>(&node)) return to_source(*s);
  if (const auto * a = dyn_cast<Action>(&node)) return to_source(*a);
  if (const auto * p = dyn_cast<PermissionFunction>(&node)) return to_source(*p);
  if (const auto * s = dyn_cast<Statement>(&node)) return to_source(*s);

  switch (node.get_kind()) {
    case NodeKind::InputParam:
      return to_source(*cast<InputParam>(&node));
    case NodeKind::Invocation:
      return to_source(*cast<Invocation>(&node));
    case NodeKind::ClassDef:
      return to_source(*cast<ClassDef>(&node));
    case NodeKind::MixinImportStmt: {
      const auto * m = cast<MixinImportStmt>(&node);
      return "import " + join(m->facets, ", ") + " from @" + m->module + "(" +
             render_list(m->in_params) + ");";
    }
    case NodeKind::Program:
      return to_source(*cast<Program>(&node));
    case NodeKind::PermissionRule:
      return to_source(*cast<PermissionRule>(&node));
    default:
      break;
  }
  throw InvariantError("Unexpected node kind " + std::string(to_string(node.get_kind())));
}

}  // namespace thingtalk
