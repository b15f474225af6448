// thingtalk/ast/values.cpp - Value equality, typing, cloning and JSON conversion
#include "thingtalk/ast/values.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "thingtalk/ast/expression.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"
#include "thingtalk/basic/units.hpp"

namespace thingtalk
{

namespace
{

constexpr std::array<std::string_view, 7> k_weekdays = {
  "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};

/// Same variant and same payload
template <typename T>
const T * same_kind(const Value & self, const Value & other)
{
  if (other.kind != self.kind) {
    return nullptr;
  }
  return static_cast<const T *>(&other);
}

nlohmann::json time_to_js(const AbsoluteTime & t)
{
  return nlohmann::json{{"hour", t.hour}, {"minute", t.minute}, {"second", t.second}};
}

AbsoluteTime time_from_js(const nlohmann::json & v)
{
  if (v.is_string()) {
    return AbsoluteTime::from_string(v.get<std::string>());
  }
  if (!v.is_object()) {
    throw std::invalid_argument("Invalid time value " + v.dump());
  }
  AbsoluteTime t;
  t.hour = v.value("hour", 0);
  t.minute = v.value("minute", 0);
  t.second = v.value("second", 0);
  return t;
}

nlohmann::json date_to_js(const DateLike & d)
{
  if (const auto * abs = std::get_if<AbsoluteDate>(&d)) {
    return abs->ms_since_epoch;
  }
  throw NotConstantError("Date is not absolute, normalize it first");
}

std::optional<DateLike> optional_date_from_js(const nlohmann::json & v)
{
  if (v.is_null()) {
    return std::nullopt;
  }
  if (!v.is_number()) {
    throw std::invalid_argument("Invalid date value " + v.dump());
  }
  return DateLike{AbsoluteDate{v.get<int64_t>()}};
}

nlohmann::json rule_to_js(const RecurrentTimeRule & rule)
{
  nlohmann::json out;
  out["beginTime"] = time_to_js(rule.begin_time);
  out["endTime"] = time_to_js(rule.end_time);
  out["interval"] = transform_to_base_unit(rule.interval_value, rule.interval_unit);
  out["frequency"] = rule.frequency;
  if (rule.day_of_week) {
    auto it = std::find(k_weekdays.begin(), k_weekdays.end(), *rule.day_of_week);
    if (it == k_weekdays.end()) {
      throw std::invalid_argument("Invalid day of week " + *rule.day_of_week);
    }
    out["dayOfWeek"] = std::distance(k_weekdays.begin(), it);
  } else {
    out["dayOfWeek"] = nullptr;
  }
  out["beginDate"] = rule.begin_date ? date_to_js(*rule.begin_date) : nlohmann::json(nullptr);
  out["endDate"] = rule.end_date ? date_to_js(*rule.end_date) : nlohmann::json(nullptr);
  out["subtract"] = rule.subtract;
  return out;
}

RecurrentTimeRule rule_from_js(const nlohmann::json & v)
{
  RecurrentTimeRule rule;
  rule.begin_time = time_from_js(v.at("beginTime"));
  rule.end_time = time_from_js(v.at("endTime"));
  if (v.contains("interval")) {
    rule.interval_value = v.at("interval").get<double>();
    rule.interval_unit = "ms";
  }
  rule.frequency = v.value("frequency", 1.0);
  if (v.contains("dayOfWeek") && !v.at("dayOfWeek").is_null()) {
    const auto index = v.at("dayOfWeek").get<size_t>();
    if (index >= k_weekdays.size()) {
      throw std::invalid_argument("Invalid day of week index " + std::to_string(index));
    }
    rule.day_of_week = std::string(k_weekdays[index]);
  }
  if (v.contains("beginDate")) {
    rule.begin_date = optional_date_from_js(v.at("beginDate"));
  }
  if (v.contains("endDate")) {
    rule.end_date = optional_date_from_js(v.at("endDate"));
  }
  rule.subtract = v.value("subtract", false);
  return rule;
}

TypePtr entity_token_type(std::string_view token)
{
  if (starts_with(token, "GENERIC_ENTITY_")) {
    return Type::entity(std::string(token.substr(15)));
  }
  if (starts_with(token, "MEASURE_")) {
    return Type::measure(token.substr(8));
  }
  if (token == "QUOTED_STRING") return Type::string();
  if (token == "NUMBER") return Type::number();
  if (token == "CURRENCY") return Type::currency();
  if (token == "DURATION") return Type::measure("ms");
  if (token == "LOCATION") return Type::location();
  if (token == "DATE") return Type::date();
  if (token == "TIME") return Type::time();
  if (token == "EMAIL_ADDRESS") return Type::entity("tt:email_address");
  if (token == "PHONE_NUMBER") return Type::entity("tt:phone_number");
  if (token == "HASHTAG") return Type::entity("tt:hashtag");
  if (token == "USERNAME") return Type::entity("tt:username");
  if (token == "URL") return Type::entity("tt:url");
  if (token == "PATH_NAME") return Type::entity("tt:path_name");
  return nullptr;
}

/// Type of a `__const_<TOKEN>_<n>` placeholder
TypePtr type_for_constant(std::string_view name)
{
  constexpr std::string_view prefix = "__const_";
  std::string_view rest = name.substr(prefix.size());

  // __const_NUMBER_<n>__<unit>
  if (starts_with(rest, "NUMBER_")) {
    const auto sep = rest.find("__");
    if (sep != std::string_view::npos && sep + 2 < rest.size()) {
      return Type::measure(rest.substr(sep + 2));
    }
  }
  // __const_MEASURE__<unit>_<n>
  if (starts_with(rest, "MEASURE__")) {
    std::string_view unit = rest.substr(9);
    const auto sep = unit.rfind('_');
    return Type::measure(sep == std::string_view::npos ? unit : unit.substr(0, sep));
  }

  const auto underscore = rest.rfind('_');
  TypePtr type =
    underscore == std::string_view::npos ? nullptr : entity_token_type(rest.substr(0, underscore));
  if (!type) {
    throw std::invalid_argument("Invalid __const variable " + std::string(name));
  }
  return type;
}

}  // namespace

// ============================================================================
// Value base
// ============================================================================

nlohmann::json Value::to_js() const { throw NotConstantError(); }

ValuePtr Value::from_js(const Type & type, const nlohmann::json & v)
{
  switch (type.kind) {
    case TypeKind::Boolean:
      return std::make_shared<BooleanValue>(v.get<bool>());
    case TypeKind::String:
      return std::make_shared<StringValue>(v.is_string() ? v.get<std::string>() : v.dump());
    case TypeKind::Number:
      return std::make_shared<NumberValue>(v.get<double>());
    case TypeKind::Currency:
      if (v.is_number()) {
        return std::make_shared<CurrencyValue>(v.get<double>(), "usd");
      }
      return std::make_shared<CurrencyValue>(
        v.at("value").get<double>(), v.at("code").get<std::string>());
    case TypeKind::Entity: {
      if (v.is_string()) {
        return std::make_shared<EntityValue>(v.get<std::string>(), type.name);
      }
      std::optional<std::string> display;
      if (v.contains("display") && v.at("display").is_string()) {
        display = v.at("display").get<std::string>();
      }
      return std::make_shared<EntityValue>(
        v.at("value").get<std::string>(), type.name, std::move(display));
    }
    case TypeKind::Measure:
      return std::make_shared<MeasureValue>(v.get<double>(), type.name);
    case TypeKind::Enum:
      return std::make_shared<EnumValue>(v.get<std::string>());
    case TypeKind::Time:
      return std::make_shared<TimeValue>(time_from_js(v));
    case TypeKind::Date:
      if (v.is_null()) {
        return DateValue::now();
      }
      return std::make_shared<DateValue>(AbsoluteDate{v.get<int64_t>()});
    case TypeKind::Location: {
      AbsoluteLocation loc;
      loc.lat = v.at("y").get<double>();
      loc.lon = v.at("x").get<double>();
      if (v.contains("display") && v.at("display").is_string()) {
        loc.display = v.at("display").get<std::string>();
      }
      return std::make_shared<LocationValue>(std::move(loc));
    }
    case TypeKind::RecurrentTimeSpecification: {
      std::vector<RecurrentTimeRule> rules;
      for (const auto & r : v) {
        rules.push_back(rule_from_js(r));
      }
      return std::make_shared<RecurrentTimeSpecificationValue>(std::move(rules));
    }
    case TypeKind::ArgMap: {
      std::map<std::string, TypePtr> map;
      for (const auto & item : v.items()) {
        map.emplace(item.key(), Type::from_string(item.value().get<std::string>()));
      }
      return std::make_shared<ArgMapValue>(std::move(map));
    }
    case TypeKind::Array: {
      std::vector<ValuePtr> elems;
      for (const auto & e : v) {
        elems.push_back(from_js(*type.elem, e));
      }
      return std::make_shared<ArrayValue>(std::move(elems));
    }
    default:
      throw std::invalid_argument("Invalid type " + type.to_string());
  }
}

bool value_equals(const ValuePtr & a, const ValuePtr & b)
{
  if (a == b) {
    return true;
  }
  if (!a || !b) {
    return false;
  }
  return a->equals(*b);
}

bool values_equal(const std::vector<ValuePtr> & a, const std::vector<ValuePtr> & b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (!value_equals(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// Payload structs
// ============================================================================

AbsoluteTime AbsoluteTime::from_string(std::string_view str)
{
  const auto parts = split(str, ':');
  if (parts.size() < 2 || parts.size() > 3) {
    throw std::invalid_argument("Invalid time " + std::string(str));
  }
  AbsoluteTime t;
  t.hour = std::stoi(parts[0]);
  t.minute = std::stoi(parts[1]);
  t.second = parts.size() == 3 ? std::stoi(parts[2]) : 0;
  return t;
}

bool RecurrentTimeRule::operator==(const RecurrentTimeRule & o) const
{
  return begin_time == o.begin_time && end_time == o.end_time &&
         interval_value == o.interval_value && interval_unit == o.interval_unit &&
         frequency == o.frequency && day_of_week == o.day_of_week &&
         begin_date == o.begin_date && end_date == o.end_date && subtract == o.subtract;
}

// ============================================================================
// Constant values
// ============================================================================

ValuePtr BooleanValue::clone() const { return std::make_shared<BooleanValue>(value, range_); }

bool BooleanValue::equals(const Value & other) const
{
  const auto * o = same_kind<BooleanValue>(*this, other);
  return o && o->value == value;
}

ValuePtr StringValue::clone() const { return std::make_shared<StringValue>(value, range_); }

bool StringValue::equals(const Value & other) const
{
  const auto * o = same_kind<StringValue>(*this, other);
  return o && o->value == value;
}

ValuePtr NumberValue::clone() const { return std::make_shared<NumberValue>(value, range_); }

bool NumberValue::equals(const Value & other) const
{
  const auto * o = same_kind<NumberValue>(*this, other);
  return o && o->value == value;
}

ValuePtr CurrencyValue::clone() const
{
  return std::make_shared<CurrencyValue>(value, code, range_);
}

bool CurrencyValue::equals(const Value & other) const
{
  const auto * o = same_kind<CurrencyValue>(*this, other);
  return o && o->value == value && o->code == code;
}

nlohmann::json CurrencyValue::to_js() const
{
  return nlohmann::json{{"value", value}, {"code", code}};
}

ValuePtr EntityValue::clone() const
{
  return std::make_shared<EntityValue>(value, type, display, range_);
}

bool EntityValue::equals(const Value & other) const
{
  const auto * o = same_kind<EntityValue>(*this, other);
  // display is presentation only
  return o && o->value == value && o->type == type;
}

nlohmann::json EntityValue::to_js() const
{
  if (!value) {
    throw NotConstantError("Entity " + type + " is not resolved");
  }
  return nlohmann::json{
    {"value", *value}, {"display", display ? nlohmann::json(*display) : nlohmann::json(nullptr)}};
}

ValuePtr MeasureValue::clone() const
{
  return std::make_shared<MeasureValue>(value, unit, range_);
}

bool MeasureValue::equals(const Value & other) const
{
  const auto * o = same_kind<MeasureValue>(*this, other);
  return o && o->value == value && o->unit == unit;
}

bool MeasureValue::is_concrete() const { return !starts_with(unit, "default"); }

nlohmann::json MeasureValue::to_js() const
{
  if (!is_concrete()) {
    throw NotConstantError("Measure unit " + unit + " is not resolved");
  }
  return transform_to_base_unit(value, unit);
}

ValuePtr EnumValue::clone() const { return std::make_shared<EnumValue>(value, range_); }

bool EnumValue::equals(const Value & other) const
{
  const auto * o = same_kind<EnumValue>(*this, other);
  return o && o->value == value;
}

TypePtr EnumValue::get_type() const
{
  return Type::enumeration(std::vector<std::string>{value, "*"});
}

ValuePtr TimeValue::clone() const { return std::make_shared<TimeValue>(value, range_); }

bool TimeValue::equals(const Value & other) const
{
  const auto * o = same_kind<TimeValue>(*this, other);
  return o && o->value == value;
}

nlohmann::json TimeValue::to_js() const
{
  if (const auto * abs = std::get_if<AbsoluteTime>(&value)) {
    return time_to_js(*abs);
  }
  throw NotConstantError();
}

ValuePtr DateValue::clone() const { return std::make_shared<DateValue>(value, range_); }

bool DateValue::equals(const Value & other) const
{
  const auto * o = same_kind<DateValue>(*this, other);
  return o && o->value == value;
}

nlohmann::json DateValue::to_js() const { return date_to_js(value); }

ValuePtr LocationValue::clone() const { return std::make_shared<LocationValue>(value, range_); }

bool LocationValue::equals(const Value & other) const
{
  const auto * o = same_kind<LocationValue>(*this, other);
  return o && o->value == value;
}

nlohmann::json LocationValue::to_js() const
{
  const auto * abs = std::get_if<AbsoluteLocation>(&value);
  if (!abs) {
    throw NotConstantError();
  }
  return nlohmann::json{
    {"x", abs->lon},
    {"y", abs->lat},
    {"display", abs->display ? nlohmann::json(*abs->display) : nlohmann::json(nullptr)}};
}

ValuePtr RecurrentTimeSpecificationValue::clone() const
{
  return std::make_shared<RecurrentTimeSpecificationValue>(rules, range_);
}

bool RecurrentTimeSpecificationValue::equals(const Value & other) const
{
  const auto * o = same_kind<RecurrentTimeSpecificationValue>(*this, other);
  return o && o->rules == rules;
}

nlohmann::json RecurrentTimeSpecificationValue::to_js() const
{
  auto out = nlohmann::json::array();
  for (const auto & rule : rules) {
    out.push_back(rule_to_js(rule));
  }
  return out;
}

ValuePtr ArgMapValue::clone() const { return std::make_shared<ArgMapValue>(value, range_); }

bool ArgMapValue::equals(const Value & other) const
{
  const auto * o = same_kind<ArgMapValue>(*this, other);
  if (!o || o->value.size() != value.size()) {
    return false;
  }
  for (const auto & [name, type] : value) {
    auto it = o->value.find(name);
    if (it == o->value.end() || !type_equals(type, it->second)) {
      return false;
    }
  }
  return true;
}

nlohmann::json ArgMapValue::to_js() const
{
  auto out = nlohmann::json::object();
  for (const auto & [name, type] : value) {
    out[name] = type->to_string();
  }
  return out;
}

// ============================================================================
// Compound values
// ============================================================================

ValuePtr ArrayValue::clone() const
{
  return std::make_shared<ArrayValue>(detail::clone_all(value), type, range_);
}

bool ArrayValue::equals(const Value & other) const
{
  const auto * o = same_kind<ArrayValue>(*this, other);
  return o && values_equal(value, o->value);
}

TypePtr ArrayValue::get_type() const
{
  if (type) {
    return type;
  }
  return Type::array(value.empty() ? Type::any() : value.front()->get_type());
}

bool ArrayValue::is_concrete() const
{
  return std::all_of(value.begin(), value.end(), [](const ValuePtr & v) {
    return v->is_concrete();
  });
}

bool ArrayValue::is_constant() const
{
  return std::all_of(value.begin(), value.end(), [](const ValuePtr & v) {
    return v->is_constant();
  });
}

nlohmann::json ArrayValue::to_js() const
{
  auto out = nlohmann::json::array();
  for (const auto & v : value) {
    out.push_back(v->to_js());
  }
  return out;
}

ValuePtr ObjectValue::clone() const
{
  std::map<std::string, ValuePtr> copy;
  for (const auto & [name, v] : value) {
    copy.emplace(name, detail::clone_or_null(v));
  }
  return std::make_shared<ObjectValue>(std::move(copy), type, range_);
}

bool ObjectValue::equals(const Value & other) const
{
  const auto * o = same_kind<ObjectValue>(*this, other);
  if (!o || o->value.size() != value.size()) {
    return false;
  }
  for (const auto & [name, v] : value) {
    auto it = o->value.find(name);
    if (it == o->value.end() || !value_equals(v, it->second)) {
      return false;
    }
  }
  return true;
}

bool ObjectValue::is_concrete() const
{
  return std::all_of(value.begin(), value.end(), [](const auto & entry) {
    return entry.second->is_concrete();
  });
}

bool ObjectValue::is_constant() const
{
  return std::all_of(value.begin(), value.end(), [](const auto & entry) {
    return entry.second->is_constant();
  });
}

nlohmann::json ObjectValue::to_js() const
{
  auto out = nlohmann::json::object();
  for (const auto & [name, v] : value) {
    out[name] = v->to_js();
  }
  return out;
}

// ============================================================================
// References and placeholders
// ============================================================================

ValuePtr VarRefValue::clone() const { return std::make_shared<VarRefValue>(name, type, range_); }

bool VarRefValue::equals(const Value & other) const
{
  const auto * o = same_kind<VarRefValue>(*this, other);
  return o && o->name == name;
}

TypePtr VarRefValue::get_type() const
{
  if (type) {
    return type;
  }
  if (is_constant()) {
    return type_for_constant(name);
  }
  return Type::any();
}

bool VarRefValue::is_constant() const { return starts_with(name, "__const_"); }

ValuePtr EventValue::clone() const { return std::make_shared<EventValue>(name, range_); }

bool EventValue::equals(const Value & other) const
{
  const auto * o = same_kind<EventValue>(*this, other);
  return o && o->name == name;
}

TypePtr EventValue::get_type() const
{
  if (name == "type") {
    return Type::entity("tt:function");
  }
  if (name == "program_id") {
    return Type::entity("tt:program_id");
  }
  if (name == "source") {
    return Type::entity("tt:contact");
  }
  return Type::string();
}

ValuePtr ContextRefValue::clone() const
{
  return std::make_shared<ContextRefValue>(name, type, range_);
}

bool ContextRefValue::equals(const Value & other) const
{
  const auto * o = same_kind<ContextRefValue>(*this, other);
  return o && o->name == name && type_equals(o->type, type);
}

ValuePtr UndefinedValue::clone() const { return std::make_shared<UndefinedValue>(local, range_); }

bool UndefinedValue::equals(const Value & other) const
{
  const auto * o = same_kind<UndefinedValue>(*this, other);
  return o && o->local == local;
}

FilterValue::FilterValue(ValuePtr v, BooleanExpressionPtr f, TypePtr t, SourceRange r)
: NodeBase(r),
  value(detail::require_node(std::move(v), "FilterValue value")),
  filter(detail::require_node(std::move(f), "FilterValue filter")),
  type(std::move(t))
{
}

ValuePtr FilterValue::clone() const
{
  return std::make_shared<FilterValue>(value->clone(), filter->clone(), type, range_);
}

bool FilterValue::equals(const Value & other) const
{
  const auto * o = same_kind<FilterValue>(*this, other);
  return o && value->equals(*o->value) && filter->equals(*o->filter);
}

TypePtr FilterValue::get_type() const { return type ? type : Type::any(); }

ArrayFieldValue::ArrayFieldValue(ValuePtr v, std::string f, TypePtr t, SourceRange r)
: NodeBase(r),
  value(detail::require_node(std::move(v), "ArrayFieldValue value")),
  field(std::move(f)),
  type(std::move(t))
{
}

ValuePtr ArrayFieldValue::clone() const
{
  return std::make_shared<ArrayFieldValue>(value->clone(), field, type, range_);
}

bool ArrayFieldValue::equals(const Value & other) const
{
  const auto * o = same_kind<ArrayFieldValue>(*this, other);
  return o && o->field == field && value->equals(*o->value);
}

TypePtr ArrayFieldValue::get_type() const { return type ? type : Type::any(); }

ValuePtr ComputationValue::clone() const
{
  return std::make_shared<ComputationValue>(
    op, detail::clone_all(operands), overload, type, range_);
}

bool ComputationValue::equals(const Value & other) const
{
  const auto * o = same_kind<ComputationValue>(*this, other);
  return o && o->op == op && values_equal(operands, o->operands);
}

TypePtr ComputationValue::get_type() const { return type ? type : Type::any(); }

ValuePtr NullValue::clone() const { return std::make_shared<NullValue>(range_); }

bool NullValue::equals(const Value & other) const { return other.kind == NodeKind::NullValue; }

}  // namespace thingtalk
