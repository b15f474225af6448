// thingtalk/sema/type_checker.cpp - Schema resolution and type checking
#include "thingtalk/sema/type_checker.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <set>

#include "thingtalk/ast/builtin.hpp"
#include "thingtalk/basic/casting.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"

namespace thingtalk
{

namespace
{

[[nodiscard]] bool is_text(const Type & t) noexcept
{
  return t.is_string() || t.is_entity() || t.is_any();
}

[[nodiscard]] bool assignable(const TypePtr & from, const TypePtr & to, bool lenient)
{
  TypeScope scope;
  return is_assignable(*from, *to, &scope, lenient);
}

[[nodiscard]] std::vector<TypePtr> boolean_overload(TypePtr lhs, TypePtr rhs)
{
  return {std::move(lhs), std::move(rhs), Type::boolean()};
}

/// Column name given to a computed value without an alias
[[nodiscard]] std::string default_compute_name(const ScalarExpression & expr)
{
  switch (expr.get_kind()) {
    case NodeKind::PrimaryScalarExpression: {
      const auto & value = cast<PrimaryScalarExpression>(&expr)->value;
      if (const auto * ref = dyn_cast<VarRefValue>(value.get())) {
        return ref->name;
      }
      return "result";
    }
    case NodeKind::DerivedScalarExpression:
      return cast<DerivedScalarExpression>(&expr)->op;
    case NodeKind::AggregationScalarExpression:
      return cast<AggregationScalarExpression>(&expr)->op;
    case NodeKind::VarRefScalarExpression:
      return cast<VarRefScalarExpression>(&expr)->name;
    default:
      return "result";
  }
}

[[nodiscard]] bool is_aggregate_op(std::string_view op) noexcept
{
  return op == "sum" || op == "avg" || op == "max" || op == "min";
}

}  // namespace

// ============================================================================
// Filter operators
// ============================================================================

std::vector<TypePtr> resolve_filter_overload(
  std::string_view op, const TypePtr & lhs, const TypePtr & rhs, bool lenient)
{
  const auto string = Type::string();

  if (op == "==") {
    if (assignable(rhs, lhs, lenient)) {
      return boolean_overload(lhs, lhs);
    }
    return {};
  }
  if (op == ">=" || op == "<=" || op == ">" || op == "<") {
    if (lhs->is_comparable() && assignable(rhs, lhs, lenient)) {
      return boolean_overload(lhs, lhs);
    }
    return {};
  }
  if (op == "=~") {
    if ((lhs->is_string() || lhs->is_entity()) && assignable(rhs, string, lenient)) {
      return boolean_overload(lhs, string);
    }
    return {};
  }
  if (op == "~=") {
    if (lhs->is_string() && is_text(*rhs)) {
      return boolean_overload(string, rhs);
    }
    return {};
  }
  if (op == "starts_with" || op == "ends_with" || op == "prefix_of" || op == "suffix_of") {
    if (assignable(lhs, string, lenient) && assignable(rhs, string, lenient)) {
      return boolean_overload(string, string);
    }
    return {};
  }
  if (op == "contains") {
    if (lhs->is_array() && assignable(rhs, lhs->elem, lenient)) {
      return boolean_overload(lhs, lhs->elem);
    }
    if (lhs->is_recurrent_time_specification() && (rhs->is_date() || rhs->is_time())) {
      return boolean_overload(lhs, rhs);
    }
    return {};
  }
  if (op == "in_array") {
    if (rhs->is_array() && (rhs->elem->is_any() || assignable(lhs, rhs->elem, lenient))) {
      return boolean_overload(lhs, Type::array(lhs));
    }
    if (rhs->is_any()) {
      return boolean_overload(lhs, Type::array(lhs));
    }
    return {};
  }
  if (op == "contains~") {
    if (lhs->is_array() && is_text(*lhs->elem) && assignable(rhs, string, lenient)) {
      return boolean_overload(lhs, string);
    }
    return {};
  }
  if (op == "in_array~") {
    if (is_text(*lhs) && assignable(rhs, Type::array(string), lenient)) {
      return boolean_overload(lhs, Type::array(string));
    }
    return {};
  }
  if (op == "~contains") {
    if (lhs->is_array() && lhs->elem->is_string() && is_text(*rhs)) {
      return boolean_overload(lhs, rhs);
    }
    return {};
  }
  if (op == "~in_array") {
    if (lhs->is_string() && rhs->is_array() && is_text(*rhs->elem)) {
      return boolean_overload(lhs, rhs);
    }
    return {};
  }
  if (op == "has_member") {
    if (
      assignable(lhs, Type::entity("tt:contact_group"), false) &&
      assignable(rhs, Type::entity("tt:contact"), false)) {
      return boolean_overload(lhs, rhs);
    }
    return {};
  }
  if (op == "group_member") {
    if (
      assignable(lhs, Type::entity("tt:contact"), false) &&
      assignable(rhs, Type::entity("tt:contact_group"), false)) {
      return boolean_overload(lhs, rhs);
    }
    return {};
  }
  return {};
}

// ============================================================================
// Construction and entry points
// ============================================================================

TypeChecker::TypeChecker(SchemaRetriever & schemas, DiagnosticBag * diags, TypeCheckOptions options)
: schemas_(schemas), diags_(diags), options_(options)
{
}

bool TypeChecker::check(Program & program)
{
  const size_t before = error_count_;
  local_classes_.clear();
  declarations_.clear();
  for (const auto & klass : program.classes) {
    local_classes_[klass->kind] = klass;
  }

  if (program.principal) {
    auto type = type_for_value(*program.principal, nullptr, {});
    if (
      type && !assignable(type, Type::entity("tt:contact"), options_.lenient_entities) &&
      !assignable(type, Type::entity("tt:username"), options_.lenient_entities)) {
      report_error(
        program.principal->get_range(), diag_code::k_invalid_principal,
        fmt::format("Invalid principal type {}", type->to_string()));
    }
  }

  for (const auto & statement : program.statements) {
    visit_statement(*statement);
  }
  return error_count_ == before;
}

bool TypeChecker::check(PermissionRule & rule)
{
  const size_t before = error_count_;
  const Scope scope{{"source", Type::entity("tt:contact")}};

  const ExpressionSignature principal_schema(
    FunctionType::Query, std::vector<std::string>{}, std::vector<ArgumentDefPtr>{});
  visit_filter(*rule.principal, principal_schema, scope);

  visit_permission(*rule.query, FunctionType::Query, scope);
  auto action_scope = scope;
  if (const auto * query = dyn_cast<SpecifiedPermissionFunction>(rule.query.get())) {
    action_scope = extend_scope(scope, query->schema.get());
  }
  visit_permission(*rule.action, FunctionType::Action, action_scope);
  return error_count_ == before;
}

bool TypeChecker::check_table(Table & table, const Scope & scope)
{
  const size_t before = error_count_;
  visit_table(table, scope, false);
  return error_count_ == before;
}

bool TypeChecker::check_stream(Stream & stream, const Scope & scope)
{
  const size_t before = error_count_;
  visit_stream(stream, scope, false);
  return error_count_ == before;
}

bool TypeChecker::check_action(Action & action, const Scope & scope)
{
  const size_t before = error_count_;
  visit_action(action, scope);
  return error_count_ == before;
}

bool TypeChecker::check_filter(
  BooleanExpression & filter, const ExpressionSignature & schema, const Scope & scope)
{
  const size_t before = error_count_;
  visit_filter(filter, schema, scope);
  return error_count_ == before;
}

// ============================================================================
// Schema resolution
// ============================================================================

FunctionDefPtr TypeChecker::resolve_function(
  const std::string & kind, FunctionType type, const std::string & name, SourceRange range)
{
  ClassDefPtr klass;
  if (auto it = local_classes_.find(kind); it != local_classes_.end()) {
    klass = it->second;
  } else {
    klass = schemas_.get_class(kind);
  }
  if (!klass) {
    report_error(range, diag_code::k_unknown_function, fmt::format("Unknown class @{}", kind));
    return nullptr;
  }

  auto fn = klass->get_function(type, name);
  if (!fn) {
    report_error(
      range, diag_code::k_unknown_function,
      fmt::format("Class @{} has no {} {}", kind, to_string(type), name));
    return nullptr;
  }
  return fn->clone_function();
}

FunctionDefPtr TypeChecker::resolve_invocation(Invocation & invocation, FunctionType type)
{
  if (invocation.schema) {
    return invocation.schema;
  }

  if (isa<BuiltinDevice>(invocation.selector.get())) {
    FunctionDefPtr fn;
    if (type == FunctionType::Action) {
      fn = builtin::make_action(invocation.channel);
    }
    if (!fn) {
      report_error(
        invocation.get_range(), diag_code::k_unknown_function,
        fmt::format("Invalid builtin {} {}", to_string(type), invocation.channel));
      return nullptr;
    }
    invocation.schema = fn;
    return fn;
  }

  const auto * device = cast<DeviceSelector>(invocation.selector.get());
  auto fn = resolve_function(device->kind, type, invocation.channel, invocation.get_range());
  invocation.schema = fn;
  return fn;
}

// ============================================================================
// Helpers
// ============================================================================

void TypeChecker::report_error(SourceRange range, std::string_view code, std::string message)
{
  ++error_count_;

  if (diags_) {
    diags_->report_error(range, std::move(message)).with_code(code);
  }
}

TypeChecker::Scope TypeChecker::extend_scope(
  const Scope & scope, const ExpressionSignature * schema)
{
  Scope out = scope;
  if (!schema) {
    return out;
  }
  for (const auto & arg : schema->iterate_arguments()) {
    if (!arg->is_input) {
      out[arg->name] = arg->type;
    }
  }
  return out;
}

TypePtr TypeChecker::type_for_value(
  const Value & value, const ExpressionSignature * schema, const Scope & scope)
{
  if (const auto * ref = dyn_cast<VarRefValue>(&value)) {
    if (ref->is_constant()) {
      return ref->get_type();
    }
    if (schema && schema->has_argument(ref->name)) {
      return schema->get_arg_type(ref->name);
    }
    if (auto it = scope.find(ref->name); it != scope.end()) {
      return it->second;
    }
    report_error(
      value.get_range(), diag_code::k_unknown_variable,
      fmt::format("Variable {} is not in scope", ref->name));
    return nullptr;
  }

  if (const auto * array = dyn_cast<ArrayValue>(&value)) {
    if (array->type) {
      return array->type;
    }
    TypePtr elem;
    for (const auto & v : array->value) {
      auto t = type_for_value(*v, schema, scope);
      if (!t) {
        return nullptr;
      }
      if (!elem || elem->is_any()) {
        elem = t;
      }
    }
    return Type::array(elem ? elem : Type::any());
  }

  return value.get_type();
}

void TypeChecker::expect_value(
  const ValuePtr & value, const TypePtr & expected, std::string_view what, const Scope & scope,
  std::string_view code)
{
  if (!value) {
    return;
  }
  auto actual = type_for_value(*value, nullptr, scope);
  if (!actual) {
    return;
  }
  if (!assignable(actual, expected, options_.lenient_entities)) {
    report_error(
      value->get_range(), code,
      fmt::format(
        "Invalid type for {}: expected {}, got {}", what, expected->to_string(),
        actual->to_string()));
  }
}

void TypeChecker::check_field(
  const ExpressionSignature & schema, const std::string & field, SourceRange range,
  std::string_view context)
{
  if (!schema.has_argument(field)) {
    report_error(
      range, diag_code::k_unknown_projection_field,
      fmt::format("Unknown field {} in {}", field, context));
  }
}

void TypeChecker::check_input_params(
  std::vector<InputParamPtr> & in_params, const ExpressionSignature & schema, const Scope & scope,
  bool fill_required)
{
  std::set<std::string> present;
  for (const auto & param : in_params) {
    auto arg = schema.get_argument(param->name);
    if (!arg) {
      report_error(
        param->get_range(), diag_code::k_unknown_parameter,
        fmt::format("Unknown parameter {}", param->name));
      continue;
    }
    if (!arg->is_input) {
      report_error(
        param->get_range(), diag_code::k_not_an_input,
        fmt::format("Parameter {} is not an input", param->name));
      continue;
    }
    if (!present.insert(param->name).second) {
      report_error(
        param->get_range(), diag_code::k_duplicate_parameter,
        fmt::format("Duplicate parameter {}", param->name));
      continue;
    }
    expect_value(
      param->value, arg->type, "parameter " + param->name, scope, diag_code::k_parameter_type);
  }

  if (!fill_required) {
    return;
  }
  for (const auto & arg : schema.iterate_arguments()) {
    // fields of a compound are filled through their parent
    if (arg->name.find('.') != std::string::npos) {
      continue;
    }
    if (arg->is_input && arg->required && present.count(arg->name) == 0) {
      in_params.push_back(
        std::make_shared<InputParam>(arg->name, std::make_shared<UndefinedValue>()));
    }
  }
}

// ============================================================================
// Derived signatures
// ============================================================================

ExpressionSignaturePtr TypeChecker::projection_schema(
  const ExpressionSignaturePtr & inner, const std::vector<std::string> & args, SourceRange range)
{
  for (const auto & arg : args) {
    check_field(*inner, arg, range, "projection");
  }
  auto schema = inner->filter_arguments([&args](const ArgumentDef & arg) {
    if (arg.is_input) {
      return true;
    }
    return std::any_of(args.begin(), args.end(), [&arg](const std::string & name) {
      return arg.name == name || starts_with(arg.name, name + ".");
    });
  });
  schema->remove_default_projection();
  return schema;
}

ExpressionSignaturePtr TypeChecker::compute_schema(
  const ExpressionSignaturePtr & inner, ScalarExpression & expr,
  const std::optional<std::string> & alias, const Scope & scope)
{
  auto type = visit_scalar(expr, *inner, scope);
  if (!type) {
    return nullptr;
  }
  const auto name = alias.value_or(default_compute_name(expr));
  auto base = inner->has_argument(name) ? inner->remove_argument(name) : inner;
  const std::vector<ArgumentDefPtr> extra{
    std::make_shared<ArgumentDef>(ArgDirection::Out, name, type)};
  return base->add_arguments(extra);
}

/// Signature of a join: the outputs of `rhs` not bound by the join follow those of `lhs`
ExpressionSignaturePtr TypeChecker::join_schema(
  const ExpressionSignaturePtr & lhs, const ExpressionSignaturePtr & rhs,
  std::vector<InputParamPtr> & in_params, const Scope & scope)
{
  const auto join_scope = extend_scope(scope, lhs.get());
  std::set<std::string> bound;
  for (const auto & param : in_params) {
    auto arg = rhs->get_argument(param->name);
    if (!arg) {
      report_error(
        param->get_range(), diag_code::k_unknown_parameter,
        fmt::format("Unknown join parameter {}", param->name));
      continue;
    }
    if (!arg->is_input) {
      report_error(
        param->get_range(), diag_code::k_not_an_input,
        fmt::format("Parameter {} is not an input", param->name));
      continue;
    }
    expect_value(
      param->value, arg->type, "parameter " + param->name, join_scope, diag_code::k_parameter_type);
    bound.insert(param->name);
  }

  std::vector<ArgumentDefPtr> extra;
  for (const auto & arg : rhs->iterate_arguments()) {
    if (bound.count(arg->name) == 0 && !lhs->has_argument(arg->name)) {
      extra.push_back(arg);
    }
  }
  auto schema = lhs->add_arguments(extra);
  schema->is_list = lhs->is_list || rhs->is_list;
  schema->is_monitorable = lhs->is_monitorable && rhs->is_monitorable;
  return schema;
}

// ============================================================================
// Tables
// ============================================================================

void TypeChecker::visit_table(Table & table, const Scope & scope, bool filtered)
{
  const auto number = Type::number();
  const auto ms = Type::measure("ms");

  switch (table.get_kind()) {
    case NodeKind::InvocationTable: {
      auto & node = *cast<InvocationTable>(&table);
      auto fn = resolve_invocation(*node.invocation, FunctionType::Query);
      if (!fn) {
        return;
      }
      check_input_params(node.invocation->in_params, *fn, scope, true);
      if (fn->require_filter && !filtered) {
        report_error(
          node.get_range(), diag_code::k_missing_filter,
          fmt::format("Query {} requires a filter", fn->qualified_name()));
      }
      node.schema = fn->clone();
      return;
    }
    case NodeKind::VarRefTable: {
      auto & node = *cast<VarRefTable>(&table);
      auto it = declarations_.find(node.name);
      if (it == declarations_.end()) {
        report_error(
          node.get_range(), diag_code::k_unknown_variable,
          fmt::format("Unknown table {}", node.name));
        return;
      }
      check_input_params(node.in_params, *it->second, scope, false);
      node.schema = it->second->clone();
      return;
    }
    case NodeKind::ResultRefTable: {
      auto & node = *cast<ResultRefTable>(&table);
      expect_value(node.index, number, "result index", scope, diag_code::k_operand_type);
      if (auto fn =
            resolve_function(node.kind, FunctionType::Query, node.channel, node.get_range())) {
        node.schema = fn->clone();
      }
      return;
    }
    case NodeKind::FilteredTable: {
      auto & node = *cast<FilteredTable>(&table);
      visit_table(*node.table, scope, true);
      if (node.table->schema) {
        visit_filter(*node.filter, *node.table->schema, scope);
        node.schema = node.table->schema;
      }
      return;
    }
    case NodeKind::ProjectionTable: {
      auto & node = *cast<ProjectionTable>(&table);
      visit_table(*node.table, scope, filtered);
      if (node.table->schema) {
        node.schema = projection_schema(node.table->schema, node.args, node.get_range());
      }
      return;
    }
    case NodeKind::ComputeTable: {
      auto & node = *cast<ComputeTable>(&table);
      visit_table(*node.table, scope, filtered);
      if (node.table->schema) {
        node.schema = compute_schema(node.table->schema, *node.expression, node.alias, scope);
      }
      return;
    }
    case NodeKind::AliasTable: {
      auto & node = *cast<AliasTable>(&table);
      visit_table(*node.table, scope, filtered);
      node.schema = node.table->schema;
      return;
    }
    case NodeKind::AggregationTable: {
      auto & node = *cast<AggregationTable>(&table);
      visit_table(*node.table, scope, filtered);
      const auto & inner = node.table->schema;
      if (!inner) {
        return;
      }
      TypePtr type;
      std::string name;
      if (node.field == "*") {
        if (node.op != "count") {
          report_error(
            node.get_range(), diag_code::k_invalid_aggregation,
            fmt::format("Cannot compute {} of whole results", node.op));
          return;
        }
        type = number;
        name = node.alias.value_or("count");
      } else {
        if (!inner->has_argument(node.field)) {
          check_field(*inner, node.field, node.get_range(), "aggregation");
          return;
        }
        auto field_type = inner->get_arg_type(node.field);
        if (node.op == "count") {
          type = number;
        } else if (is_aggregate_op(node.op) && field_type->is_numeric()) {
          type = field_type;
        } else {
          report_error(
            node.get_range(), diag_code::k_invalid_aggregation,
            fmt::format(
              "Cannot compute {} of {} ({})", node.op, node.field, field_type->to_string()));
          return;
        }
        name = node.alias.value_or(node.field);
      }
      node.schema = std::make_shared<ExpressionSignature>(
        FunctionType::Query, std::vector<std::string>{},
        std::vector<ArgumentDefPtr>{std::make_shared<ArgumentDef>(ArgDirection::Out, name, type)},
        FunctionQualifiers{false, inner->is_monitorable});
      return;
    }
    case NodeKind::SortedTable: {
      auto & node = *cast<SortedTable>(&table);
      visit_table(*node.table, scope, filtered);
      const auto & inner = node.table->schema;
      if (!inner) {
        return;
      }
      if (!inner->has_argument(node.field)) {
        check_field(*inner, node.field, node.get_range(), "sort");
        return;
      }
      if (!inner->get_arg_type(node.field)->is_comparable()) {
        report_error(
          node.get_range(), diag_code::k_invalid_aggregation,
          fmt::format("Cannot sort by field {}", node.field));
      }
      node.schema = inner;
      return;
    }
    case NodeKind::IndexTable: {
      auto & node = *cast<IndexTable>(&table);
      visit_table(*node.table, scope, filtered);
      for (const auto & index : node.indices) {
        auto type = type_for_value(*index, nullptr, scope);
        if (!type) {
          continue;
        }
        if (
          !assignable(type, number, false) && !assignable(type, Type::array(number), false)) {
          report_error(
            index->get_range(), diag_code::k_operand_type,
            fmt::format("Invalid index of type {}", type->to_string()));
        }
      }
      if (node.table->schema) {
        node.schema = node.table->schema->clone();
        if (node.indices.size() == 1 && isa<NumberValue>(node.indices.front().get())) {
          node.schema->is_list = false;
        }
      }
      return;
    }
    case NodeKind::SlicedTable: {
      auto & node = *cast<SlicedTable>(&table);
      visit_table(*node.table, scope, filtered);
      expect_value(node.base, number, "slice base", scope, diag_code::k_operand_type);
      expect_value(node.limit, number, "slice limit", scope, diag_code::k_operand_type);
      node.schema = node.table->schema;
      return;
    }
    case NodeKind::JoinTable: {
      auto & node = *cast<JoinTable>(&table);
      visit_table(*node.lhs, scope, false);
      visit_table(*node.rhs, extend_scope(scope, node.lhs->schema.get()), false);
      if (node.lhs->schema && node.rhs->schema) {
        node.schema = join_schema(node.lhs->schema, node.rhs->schema, node.in_params, scope);
      }
      return;
    }
    case NodeKind::WindowTable:
    case NodeKind::TimeSeriesTable: {
      const bool window = isa<WindowTable>(&table);
      auto & base = window ? cast<WindowTable>(&table)->base : cast<TimeSeriesTable>(&table)->base;
      auto & delta =
        window ? cast<WindowTable>(&table)->delta : cast<TimeSeriesTable>(&table)->delta;
      auto & stream =
        window ? cast<WindowTable>(&table)->stream : cast<TimeSeriesTable>(&table)->stream;
      expect_value(
        base, window ? number : Type::date(), "history base", scope, diag_code::k_operand_type);
      expect_value(delta, window ? number : ms, "history delta", scope, diag_code::k_operand_type);
      visit_stream(*stream, scope, false);
      if (stream->schema) {
        table.schema = stream->schema->as_type(FunctionType::Query);
        table.schema->is_list = true;
      }
      return;
    }
    case NodeKind::SequenceTable:
    case NodeKind::HistoryTable: {
      const bool sequence = isa<SequenceTable>(&table);
      auto & base = sequence ? cast<SequenceTable>(&table)->base : cast<HistoryTable>(&table)->base;
      auto & delta =
        sequence ? cast<SequenceTable>(&table)->delta : cast<HistoryTable>(&table)->delta;
      auto & inner =
        sequence ? cast<SequenceTable>(&table)->table : cast<HistoryTable>(&table)->table;
      expect_value(
        base, sequence ? number : Type::date(), "history base", scope, diag_code::k_operand_type);
      expect_value(
        delta, sequence ? number : ms, "history delta", scope, diag_code::k_operand_type);
      visit_table(*inner, scope, false);
      if (inner->schema) {
        table.schema = inner->schema->clone();
        table.schema->is_list = true;
      }
      return;
    }
    default:
      throw InvariantError("unexpected table kind " + std::string(to_string(table.get_kind())));
  }
}

// ============================================================================
// Streams
// ============================================================================

void TypeChecker::visit_stream(Stream & stream, const Scope & scope, bool filtered)
{
  switch (stream.get_kind()) {
    case NodeKind::VarRefStream: {
      const auto & node = *cast<VarRefStream>(&stream);
      report_error(
        node.get_range(), diag_code::k_unknown_variable,
        fmt::format("Unknown stream {}", node.name));
      return;
    }
    case NodeKind::TimerStream: {
      auto & node = *cast<TimerStream>(&stream);
      expect_value(node.base, Type::date(), "timer base", scope, diag_code::k_operand_type);
      expect_value(
        node.interval, Type::measure("ms"), "timer interval", scope, diag_code::k_operand_type);
      expect_value(
        node.frequency, Type::number(), "timer frequency", scope, diag_code::k_operand_type);
      node.schema = std::make_shared<ExpressionSignature>(
        FunctionType::Stream, std::vector<std::string>{}, std::vector<ArgumentDefPtr>{},
        FunctionQualifiers{false, true});
      return;
    }
    case NodeKind::AtTimerStream: {
      auto & node = *cast<AtTimerStream>(&stream);
      for (const auto & time : node.time) {
        expect_value(time, Type::time(), "timer time", scope, diag_code::k_operand_type);
      }
      expect_value(
        node.expiration_date, Type::date(), "timer expiration date", scope,
        diag_code::k_operand_type);
      node.schema = std::make_shared<ExpressionSignature>(
        FunctionType::Stream, std::vector<std::string>{}, std::vector<ArgumentDefPtr>{},
        FunctionQualifiers{false, true});
      return;
    }
    case NodeKind::MonitorStream: {
      auto & node = *cast<MonitorStream>(&stream);
      visit_table(*node.table, scope, filtered);
      const auto & inner = node.table->schema;
      if (!inner) {
        return;
      }
      if (!inner->is_monitorable) {
        report_error(
          node.get_range(), diag_code::k_not_monitorable,
          "Cannot monitor a query that is not monitorable");
      }
      if (node.args) {
        for (const auto & arg : *node.args) {
          check_field(*inner, arg, node.get_range(), "monitor");
        }
      }
      node.schema = inner->as_type(FunctionType::Stream);
      return;
    }
    case NodeKind::EdgeNewStream: {
      auto & node = *cast<EdgeNewStream>(&stream);
      visit_stream(*node.stream, scope, filtered);
      node.schema = node.stream->schema;
      return;
    }
    case NodeKind::EdgeFilterStream: {
      auto & node = *cast<EdgeFilterStream>(&stream);
      visit_stream(*node.stream, scope, true);
      if (node.stream->schema) {
        visit_filter(*node.filter, *node.stream->schema, scope);
        node.schema = node.stream->schema;
      }
      return;
    }
    case NodeKind::FilteredStream: {
      auto & node = *cast<FilteredStream>(&stream);
      visit_stream(*node.stream, scope, true);
      if (node.stream->schema) {
        visit_filter(*node.filter, *node.stream->schema, scope);
        node.schema = node.stream->schema;
      }
      return;
    }
    case NodeKind::ProjectionStream: {
      auto & node = *cast<ProjectionStream>(&stream);
      visit_stream(*node.stream, scope, filtered);
      if (node.stream->schema) {
        node.schema = projection_schema(node.stream->schema, node.args, node.get_range());
      }
      return;
    }
    case NodeKind::ComputeStream: {
      auto & node = *cast<ComputeStream>(&stream);
      visit_stream(*node.stream, scope, filtered);
      if (node.stream->schema) {
        node.schema = compute_schema(node.stream->schema, *node.expression, node.alias, scope);
      }
      return;
    }
    case NodeKind::AliasStream: {
      auto & node = *cast<AliasStream>(&stream);
      visit_stream(*node.stream, scope, filtered);
      node.schema = node.stream->schema;
      return;
    }
    case NodeKind::JoinStream: {
      auto & node = *cast<JoinStream>(&stream);
      visit_stream(*node.stream, scope, false);
      visit_table(*node.table, extend_scope(scope, node.stream->schema.get()), false);
      if (node.stream->schema && node.table->schema) {
        node.schema = join_schema(node.stream->schema, node.table->schema, node.in_params, scope);
      }
      return;
    }
    default:
      throw InvariantError("unexpected stream kind " + std::string(to_string(stream.get_kind())));
  }
}

// ============================================================================
// Actions and permissions
// ============================================================================

void TypeChecker::visit_action(Action & action, const Scope & scope)
{
  if (const auto * var_ref = dyn_cast<VarRefAction>(&action)) {
    report_error(
      var_ref->get_range(), diag_code::k_unknown_variable,
      fmt::format("Unknown action {}", var_ref->name));
    return;
  }

  auto & node = *cast<InvocationAction>(&action);
  auto fn = resolve_invocation(*node.invocation, FunctionType::Action);
  if (!fn) {
    return;
  }
  check_input_params(node.invocation->in_params, *fn, scope, true);

  ExpressionSignaturePtr schema = fn->clone();
  for (const auto & param : node.invocation->in_params) {
    if (!param->value->is_undefined() && schema->has_argument(param->name)) {
      schema = schema->remove_argument(param->name);
    }
  }
  node.schema = std::move(schema);
}

void TypeChecker::visit_permission(
  PermissionFunction & fn, FunctionType type, const Scope & scope)
{
  if (auto * specified = dyn_cast<SpecifiedPermissionFunction>(&fn)) {
    auto schema = resolve_function(specified->kind, type, specified->channel, fn.get_range());
    if (!schema) {
      return;
    }
    specified->schema = schema->clone();
    visit_filter(*specified->filter, *specified->schema, scope);
    return;
  }
  if (const auto * class_star = dyn_cast<ClassStarPermissionFunction>(&fn)) {
    if (local_classes_.count(class_star->kind) == 0 && !schemas_.get_class(class_star->kind)) {
      report_error(
        fn.get_range(), diag_code::k_unknown_function,
        fmt::format("Unknown class @{}", class_star->kind));
    }
  }
}

// ============================================================================
// Filters and scalar expressions
// ============================================================================

void TypeChecker::visit_filter(
  BooleanExpression & filter, const ExpressionSignature & schema, const Scope & scope)
{
  switch (filter.get_kind()) {
    case NodeKind::TrueBooleanExpression:
    case NodeKind::FalseBooleanExpression:
      return;
    case NodeKind::AndBooleanExpression:
      for (const auto & op : cast<AndBooleanExpression>(&filter)->operands) {
        visit_filter(*op, schema, scope);
      }
      return;
    case NodeKind::OrBooleanExpression:
      for (const auto & op : cast<OrBooleanExpression>(&filter)->operands) {
        visit_filter(*op, schema, scope);
      }
      return;
    case NodeKind::NotBooleanExpression:
      visit_filter(*cast<NotBooleanExpression>(&filter)->expr, schema, scope);
      return;
    case NodeKind::DontCareBooleanExpression: {
      const auto & node = *cast<DontCareBooleanExpression>(&filter);
      if (!schema.has_argument(node.name)) {
        report_error(
          node.get_range(), diag_code::k_unknown_filter_field,
          fmt::format("Unknown field {} in filter", node.name));
      }
      return;
    }
    case NodeKind::AtomBooleanExpression: {
      auto & node = *cast<AtomBooleanExpression>(&filter);
      TypePtr field_type;
      if (schema.has_argument(node.name)) {
        field_type = schema.get_arg_type(node.name);
      } else if (auto it = scope.find(node.name); it != scope.end()) {
        field_type = it->second;
      }
      if (!field_type) {
        report_error(
          node.get_range(), diag_code::k_unknown_filter_field,
          fmt::format("Unknown field {} in filter", node.name));
        return;
      }
      auto value_type = type_for_value(*node.value, &schema, scope);
      if (!value_type) {
        return;
      }
      auto overload =
        resolve_filter_overload(node.op, field_type, value_type, options_.lenient_entities);
      if (overload.empty()) {
        report_error(
          node.get_range(), diag_code::k_filter_type,
          fmt::format(
            "Invalid operand types {} and {} for operator {}", field_type->to_string(),
            value_type->to_string(), node.op));
        return;
      }
      node.overload = std::move(overload);
      return;
    }
    case NodeKind::ExternalBooleanExpression: {
      auto & node = *cast<ExternalBooleanExpression>(&filter);
      if (!node.schema) {
        if (isa<BuiltinDevice>(node.selector.get())) {
          report_error(
            node.get_range(), diag_code::k_unknown_function, "The builtin device has no queries");
          return;
        }
        const auto * device = cast<DeviceSelector>(node.selector.get());
        node.schema =
          resolve_function(device->kind, FunctionType::Query, node.channel, node.get_range());
        if (!node.schema) {
          return;
        }
      }
      check_input_params(node.in_params, *node.schema, scope, true);
      visit_filter(*node.filter, *node.schema, scope);
      return;
    }
    case NodeKind::ComputeBooleanExpression: {
      auto & node = *cast<ComputeBooleanExpression>(&filter);
      auto lhs_type = visit_scalar(*node.lhs, schema, scope);
      if (!lhs_type) {
        return;
      }
      auto rhs_type = type_for_value(*node.rhs, &schema, scope);
      if (!rhs_type) {
        return;
      }
      auto overload =
        resolve_filter_overload(node.op, lhs_type, rhs_type, options_.lenient_entities);
      if (overload.empty()) {
        report_error(
          node.get_range(), diag_code::k_filter_type,
          fmt::format(
            "Invalid operand types {} and {} for operator {}", lhs_type->to_string(),
            rhs_type->to_string(), node.op));
        return;
      }
      node.overload = std::move(overload);
      return;
    }
    default:
      throw InvariantError("unexpected filter kind " + std::string(to_string(filter.get_kind())));
  }
}

TypePtr TypeChecker::visit_scalar(
  ScalarExpression & expr, const ExpressionSignature & schema, const Scope & scope)
{
  switch (expr.get_kind()) {
    case NodeKind::PrimaryScalarExpression:
      return type_for_value(*cast<PrimaryScalarExpression>(&expr)->value, &schema, scope);

    case NodeKind::DerivedScalarExpression: {
      auto & node = *cast<DerivedScalarExpression>(&expr);
      std::vector<TypePtr> types;
      for (const auto & operand : node.operands) {
        auto t = visit_scalar(*operand, schema, scope);
        if (!t) {
          return nullptr;
        }
        types.push_back(std::move(t));
      }

      const auto & op = node.op;
      const auto fail = [&]() -> TypePtr {
        std::vector<std::string> names;
        for (const auto & t : types) {
          names.push_back(t->to_string());
        }
        report_error(
          node.get_range(), diag_code::k_invalid_scalar,
          fmt::format("Invalid operand types ({}) for {}", join(names, ", "), op));
        return nullptr;
      };

      if (op == "+" || op == "-") {
        if (types.size() != 2) {
          return fail();
        }
        const auto & a = types[0];
        const auto & b = types[1];
        if ((a->is_date() || a->is_time()) && assignable(b, Type::measure("ms"), false)) {
          return a;
        }
        const bool addable = a->is_numeric() || (op == "+" && a->is_string());
        if (addable && assignable(b, a, false)) {
          return a;
        }
        return fail();
      }
      if (op == "*" || op == "/") {
        if (types.size() == 2 && types[0]->is_numeric() && types[1]->is_number()) {
          return types[0];
        }
        return fail();
      }
      if (op == "%" || op == "**") {
        if (types.size() == 2 && types[0]->is_number() && types[1]->is_number()) {
          return types[0];
        }
        return fail();
      }
      if (op == "distance") {
        if (types.size() == 2 && types[0]->is_location() && types[1]->is_location()) {
          return Type::measure("m");
        }
        return fail();
      }
      if (is_aggregate_op(op) || op == "count") {
        if (types.size() != 1 || !types[0]->is_array()) {
          return fail();
        }
        if (op == "count") {
          return Type::number();
        }
        if (!types[0]->elem->is_numeric()) {
          return fail();
        }
        return types[0]->elem;
      }
      report_error(
        node.get_range(), diag_code::k_invalid_scalar,
        fmt::format("Unknown scalar operator {}", op));
      return nullptr;
    }

    case NodeKind::AggregationScalarExpression: {
      auto & node = *cast<AggregationScalarExpression>(&expr);
      auto list_type = type_for_value(*node.list, &schema, scope);
      if (!list_type) {
        return nullptr;
      }
      if (node.op == "count") {
        return Type::number();
      }
      if (!list_type->is_array()) {
        report_error(
          node.get_range(), diag_code::k_invalid_scalar,
          fmt::format("Cannot compute {} of {}", node.op, list_type->to_string()));
        return nullptr;
      }
      auto elem = list_type->elem;
      if (node.field && elem->is_compound()) {
        auto field = elem->get_field(*node.field);
        if (!field) {
          report_error(
            node.get_range(), diag_code::k_invalid_scalar,
            fmt::format("Unknown field {} in aggregation", *node.field));
          return nullptr;
        }
        return field->type;
      }
      return elem;
    }

    case NodeKind::VarRefScalarExpression:
      // declared computations are resolved at runtime
      return Type::any();

    default:
      throw InvariantError("unexpected scalar kind " + std::string(to_string(expr.get_kind())));
  }
}

// ============================================================================
// Statements
// ============================================================================

void TypeChecker::visit_statement(Statement & statement)
{
  if (auto * rule = dyn_cast<Rule>(&statement)) {
    visit_stream(*rule->stream, {}, false);
    const auto scope = extend_scope({}, rule->stream->schema.get());
    for (const auto & action : rule->actions) {
      visit_action(*action, scope);
    }
    return;
  }
  if (auto * command = dyn_cast<Command>(&statement)) {
    Scope scope;
    if (command->table) {
      visit_table(*command->table, {}, false);
      scope = extend_scope({}, command->table->schema.get());
    }
    for (const auto & action : command->actions) {
      visit_action(*action, scope);
    }
    return;
  }

  auto & assignment = *cast<Assignment>(&statement);
  visit_table(*assignment.value, {}, false);
  assignment.schema = assignment.value->schema;
  if (assignment.schema) {
    declarations_[assignment.name] = assignment.schema;
  }
}

}  // namespace thingtalk
