// thingtalk/ast/values.hpp - Leaf values of the tree
//
// Values are constants (numbers, strings, entities, dates, ...) and
// placeholders that a dialogue agent resolves later (undefined slots,
// relative times and locations, context references). Every value knows its
// type, compares structurally and deep-copies with clone().
//
#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "thingtalk/ast/node.hpp"
#include "thingtalk/type/type.hpp"

namespace thingtalk
{

// ============================================================================
// Value base
// ============================================================================

class Value : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_value_kind(node->kind); }

  [[nodiscard]] virtual ValuePtr clone() const = 0;

  /// Structural, variant-aware equality
  [[nodiscard]] virtual bool equals(const Value & other) const = 0;

  [[nodiscard]] virtual TypePtr get_type() const = 0;

  /**
   * Concrete values can be compiled without external resolution: they
   * carry no placeholder (undefined slot, unresolved entity or location,
   * relative time, default unit).
   */
  [[nodiscard]] virtual bool is_concrete() const { return true; }

  /// Compile-time constant. Defaults to is_concrete().
  [[nodiscard]] virtual bool is_constant() const { return is_concrete(); }

  /**
   * Convert to the JSON runtime representation.
   * @throws NotConstantError if the value must be resolved first
   */
  [[nodiscard]] virtual nlohmann::json to_js() const;

  /**
   * Inverse of to_js() for the given type.
   * @throws std::invalid_argument for types that have no JSON form
   */
  [[nodiscard]] static ValuePtr from_js(const Type & type, const nlohmann::json & v);

  [[nodiscard]] bool is_undefined() const noexcept { return kind == NodeKind::UndefinedValue; }

protected:
  Value(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

[[nodiscard]] bool value_equals(const ValuePtr & a, const ValuePtr & b);
[[nodiscard]] bool values_equal(const std::vector<ValuePtr> & a, const std::vector<ValuePtr> & b);

// ============================================================================
// Payload structs
// ============================================================================

struct AbsoluteTime
{
  int hour = 0;
  int minute = 0;
  int second = 0;

  /// Parse "HH:MM" or "HH:MM:SS"
  static AbsoluteTime from_string(std::string_view str);

  [[nodiscard]] bool operator==(const AbsoluteTime & o) const
  {
    return hour == o.hour && minute == o.minute && second == o.second;
  }
  [[nodiscard]] bool operator!=(const AbsoluteTime & o) const { return !(*this == o); }
};

/// $time.morning, $time.evening, ...
struct RelativeTime
{
  std::string relative_tag;

  [[nodiscard]] bool operator==(const RelativeTime & o) const
  {
    return relative_tag == o.relative_tag;
  }
};

using TimeLike = std::variant<AbsoluteTime, RelativeTime>;

struct AbsoluteLocation
{
  double lat = 0;
  double lon = 0;
  std::optional<std::string> display;

  [[nodiscard]] bool operator==(const AbsoluteLocation & o) const
  {
    return lat == o.lat && lon == o.lon && display == o.display;
  }
};

/// $location.home, $location.work, $location.current_location
struct RelativeLocation
{
  std::string relative_tag;

  [[nodiscard]] bool operator==(const RelativeLocation & o) const
  {
    return relative_tag == o.relative_tag;
  }
};

/// A place name not yet resolved to coordinates
struct UnresolvedLocation
{
  std::string name;

  [[nodiscard]] bool operator==(const UnresolvedLocation & o) const { return name == o.name; }
};

using LocationLike = std::variant<AbsoluteLocation, RelativeLocation, UnresolvedLocation>;

/// The current instant ($now)
struct DateNow
{
  [[nodiscard]] bool operator==(const DateNow &) const { return true; }
};

/// Milliseconds since the Unix epoch
struct AbsoluteDate
{
  int64_t ms_since_epoch = 0;

  [[nodiscard]] bool operator==(const AbsoluteDate & o) const
  {
    return ms_since_epoch == o.ms_since_epoch;
  }
};

/// start_of(unit) / end_of(unit)
struct DateEdge
{
  DateEdgeKind edge = DateEdgeKind::StartOf;
  std::string unit;

  [[nodiscard]] bool operator==(const DateEdge & o) const
  {
    return edge == o.edge && unit == o.unit;
  }
};

/// A date with some components left to the current date
struct DatePiece
{
  std::optional<int> year;
  std::optional<int> month;
  std::optional<int> day;
  std::optional<AbsoluteTime> time;

  [[nodiscard]] bool operator==(const DatePiece & o) const
  {
    return year == o.year && month == o.month && day == o.day && time == o.time;
  }
};

/// The next given weekday, optionally at a given time
struct WeekDayDate
{
  std::string weekday;
  std::optional<AbsoluteTime> time;

  [[nodiscard]] bool operator==(const WeekDayDate & o) const
  {
    return weekday == o.weekday && time == o.time;
  }
};

using DateLike = std::variant<DateNow, AbsoluteDate, DateEdge, DatePiece, WeekDayDate>;

/// One rule of a recurrent time specification
struct RecurrentTimeRule
{
  AbsoluteTime begin_time;
  AbsoluteTime end_time;
  double interval_value = 1;
  std::string interval_unit = "day";
  double frequency = 1;
  std::optional<std::string> day_of_week;
  std::optional<DateLike> begin_date;
  std::optional<DateLike> end_date;
  bool subtract = false;

  [[nodiscard]] bool operator==(const RecurrentTimeRule & o) const;
};

// ============================================================================
// Constant values
// ============================================================================

class BooleanValue : public NodeBase<BooleanValue, Value, NodeKind::BooleanValue>
{
public:
  bool value;

  explicit BooleanValue(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::boolean(); }
  [[nodiscard]] nlohmann::json to_js() const override { return value; }
};

class StringValue : public NodeBase<StringValue, Value, NodeKind::StringValue>
{
public:
  std::string value;

  explicit StringValue(std::string v, SourceRange r = {}) : NodeBase(r), value(std::move(v)) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::string(); }
  [[nodiscard]] nlohmann::json to_js() const override { return value; }
};

class NumberValue : public NodeBase<NumberValue, Value, NodeKind::NumberValue>
{
public:
  double value;

  explicit NumberValue(double v, SourceRange r = {}) : NodeBase(r), value(v) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::number(); }
  [[nodiscard]] nlohmann::json to_js() const override { return value; }
};

class CurrencyValue : public NodeBase<CurrencyValue, Value, NodeKind::CurrencyValue>
{
public:
  double value;
  std::string code;  ///< lower case ISO code, e.g. "usd"

  CurrencyValue(double v, std::string c, SourceRange r = {})
  : NodeBase(r), value(v), code(std::move(c))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::currency(); }
  [[nodiscard]] nlohmann::json to_js() const override;
};

/**
 * An entity: a typed identifier with an optional display name.
 * A missing `value` means the entity still has to be looked up by its
 * display name, so the value is not concrete.
 */
class EntityValue : public NodeBase<EntityValue, Value, NodeKind::EntityValue>
{
public:
  std::optional<std::string> value;
  std::string type;  ///< prefix:name, e.g. "tt:url"
  std::optional<std::string> display;

  EntityValue(
    std::optional<std::string> v, std::string t, std::optional<std::string> d = std::nullopt,
    SourceRange r = {})
  : NodeBase(r), value(std::move(v)), type(std::move(t)), display(std::move(d))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::entity(type); }
  [[nodiscard]] bool is_concrete() const override { return value.has_value(); }
  [[nodiscard]] nlohmann::json to_js() const override;
};

/**
 * A quantity in a unit. Units named "default..." are placeholders chosen
 * by the locale and make the value non-concrete.
 */
class MeasureValue : public NodeBase<MeasureValue, Value, NodeKind::MeasureValue>
{
public:
  double value;
  std::string unit;

  MeasureValue(double v, std::string u, SourceRange r = {})
  : NodeBase(r), value(v), unit(std::move(u))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::measure(unit); }
  [[nodiscard]] bool is_concrete() const override;
  /// The quantity in the base unit
  [[nodiscard]] nlohmann::json to_js() const override;
};

class EnumValue : public NodeBase<EnumValue, Value, NodeKind::EnumValue>
{
public:
  std::string value;

  explicit EnumValue(std::string v, SourceRange r = {}) : NodeBase(r), value(std::move(v)) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override;
  [[nodiscard]] nlohmann::json to_js() const override { return value; }
};

class TimeValue : public NodeBase<TimeValue, Value, NodeKind::TimeValue>
{
public:
  TimeLike value;

  explicit TimeValue(TimeLike v, SourceRange r = {}) : NodeBase(r), value(std::move(v)) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::time(); }
  [[nodiscard]] bool is_concrete() const override
  {
    return std::holds_alternative<AbsoluteTime>(value);
  }
  /// Relative times are constants even though they are not concrete
  [[nodiscard]] bool is_constant() const override { return true; }
  [[nodiscard]] nlohmann::json to_js() const override;
};

class DateValue : public NodeBase<DateValue, Value, NodeKind::DateValue>
{
public:
  DateLike value;

  explicit DateValue(DateLike v = DateNow{}, SourceRange r = {})
  : NodeBase(r), value(std::move(v))
  {
  }

  [[nodiscard]] static std::shared_ptr<DateValue> now()
  {
    return std::make_shared<DateValue>(DateNow{});
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::date(); }
  /// Only absolute dates convert; others must be normalized first
  [[nodiscard]] nlohmann::json to_js() const override;
};

class LocationValue : public NodeBase<LocationValue, Value, NodeKind::LocationValue>
{
public:
  LocationLike value;

  explicit LocationValue(LocationLike v, SourceRange r = {}) : NodeBase(r), value(std::move(v))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::location(); }
  [[nodiscard]] bool is_concrete() const override
  {
    return std::holds_alternative<AbsoluteLocation>(value);
  }
  /// Relative locations are constants even though they are not concrete
  [[nodiscard]] bool is_constant() const override { return true; }
  [[nodiscard]] nlohmann::json to_js() const override;
};

class RecurrentTimeSpecificationValue
: public NodeBase<
    RecurrentTimeSpecificationValue, Value, NodeKind::RecurrentTimeSpecificationValue>
{
public:
  std::vector<RecurrentTimeRule> rules;

  explicit RecurrentTimeSpecificationValue(std::vector<RecurrentTimeRule> rs, SourceRange r = {})
  : NodeBase(r), rules(std::move(rs))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override
  {
    return Type::recurrent_time_specification();
  }
  [[nodiscard]] nlohmann::json to_js() const override;
};

/// A map from argument names to types, used by configuration mixins
class ArgMapValue : public NodeBase<ArgMapValue, Value, NodeKind::ArgMapValue>
{
public:
  std::map<std::string, TypePtr> value;

  explicit ArgMapValue(std::map<std::string, TypePtr> v, SourceRange r = {})
  : NodeBase(r), value(std::move(v))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::arg_map(); }
  [[nodiscard]] nlohmann::json to_js() const override;
};

// ============================================================================
// Compound values
// ============================================================================

class ArrayValue : public NodeBase<ArrayValue, Value, NodeKind::ArrayValue>
{
public:
  std::vector<ValuePtr> value;
  TypePtr type;  ///< declared Array type, may be null

  explicit ArrayValue(std::vector<ValuePtr> v, TypePtr t = nullptr, SourceRange r = {})
  : NodeBase(r), value(std::move(v)), type(std::move(t))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override;
  [[nodiscard]] bool is_concrete() const override;
  [[nodiscard]] bool is_constant() const override;
  [[nodiscard]] nlohmann::json to_js() const override;
};

class ObjectValue : public NodeBase<ObjectValue, Value, NodeKind::ObjectValue>
{
public:
  std::map<std::string, ValuePtr> value;
  TypePtr type;

  explicit ObjectValue(std::map<std::string, ValuePtr> v, TypePtr t = nullptr, SourceRange r = {})
  : NodeBase(r), value(std::move(v)), type(std::move(t))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return type ? type : Type::object(); }
  [[nodiscard]] bool is_concrete() const override;
  [[nodiscard]] bool is_constant() const override;
  [[nodiscard]] nlohmann::json to_js() const override;
};

// ============================================================================
// References and placeholders
// ============================================================================

/// A reference to a parameter or variable in scope
class VarRefValue : public NodeBase<VarRefValue, Value, NodeKind::VarRefValue>
{
public:
  std::string name;
  TypePtr type;

  explicit VarRefValue(std::string n, TypePtr t = nullptr, SourceRange r = {})
  : NodeBase(r), name(std::move(n)), type(std::move(t))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  /// Placeholders named `__const_<TOKEN>_<n>` derive their type from the token
  [[nodiscard]] TypePtr get_type() const override;
  /// Names starting with `__const_` are constant placeholders
  [[nodiscard]] bool is_constant() const override;
};

/// $event, $event.type, $event.program_id
class EventValue : public NodeBase<EventValue, Value, NodeKind::EventValue>
{
public:
  std::optional<std::string> name;

  explicit EventValue(std::optional<std::string> n = std::nullopt, SourceRange r = {})
  : NodeBase(r), name(std::move(n))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override;
  [[nodiscard]] bool is_constant() const override { return false; }
};

/// A reference to dialogue context ($context.selection, ...)
class ContextRefValue : public NodeBase<ContextRefValue, Value, NodeKind::ContextRefValue>
{
public:
  std::string name;
  TypePtr type;

  ContextRefValue(std::string n, TypePtr t, SourceRange r = {})
  : NodeBase(r), name(std::move(n)), type(std::move(t))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return type ? type : Type::any(); }
  [[nodiscard]] bool is_concrete() const override { return false; }
  [[nodiscard]] bool is_constant() const override { return false; }
};

/**
 * A slot to fill: `$?`. `local` slots are filled by the user issuing the
 * program, remote ones by the receiver of a shared program.
 */
class UndefinedValue : public NodeBase<UndefinedValue, Value, NodeKind::UndefinedValue>
{
public:
  bool local;

  explicit UndefinedValue(bool l = true, SourceRange r = {}) : NodeBase(r), local(l) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::any(); }
  [[nodiscard]] bool is_concrete() const override { return false; }
  [[nodiscard]] bool is_constant() const override { return false; }
};

/// The elements of an array value that satisfy a filter
class FilterValue : public NodeBase<FilterValue, Value, NodeKind::FilterValue>
{
public:
  ValuePtr value;
  BooleanExpressionPtr filter;
  TypePtr type;

  FilterValue(ValuePtr v, BooleanExpressionPtr f, TypePtr t = nullptr, SourceRange r = {});

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override;
  [[nodiscard]] bool is_constant() const override { return false; }
};

/// One field of every element of an array of compounds: `field of value`
class ArrayFieldValue : public NodeBase<ArrayFieldValue, Value, NodeKind::ArrayFieldValue>
{
public:
  ValuePtr value;
  std::string field;
  TypePtr type;

  ArrayFieldValue(ValuePtr v, std::string f, TypePtr t = nullptr, SourceRange r = {});

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override;
  [[nodiscard]] bool is_constant() const override { return false; }
};

/**
 * A scalar computation: `op(operands...)`. `overload` holds the operand
 * types followed by the result type once type checking picked one.
 */
class ComputationValue : public NodeBase<ComputationValue, Value, NodeKind::ComputationValue>
{
public:
  std::string op;
  std::vector<ValuePtr> operands;
  std::vector<TypePtr> overload;
  TypePtr type;

  ComputationValue(
    std::string o, std::vector<ValuePtr> ops, std::vector<TypePtr> ov = {}, TypePtr t = nullptr,
    SourceRange r = {})
  : NodeBase(r), op(std::move(o)), operands(std::move(ops)), overload(std::move(ov)),
    type(std::move(t))
  {
  }

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override;
  [[nodiscard]] bool is_constant() const override { return false; }
};

class NullValue : public NodeBase<NullValue, Value, NodeKind::NullValue>
{
public:
  explicit NullValue(SourceRange r = {}) : NodeBase(r) {}

  [[nodiscard]] ValuePtr clone() const override;
  [[nodiscard]] bool equals(const Value & other) const override;
  [[nodiscard]] TypePtr get_type() const override { return Type::any(); }
  [[nodiscard]] nlohmann::json to_js() const override { return nullptr; }
};

}  // namespace thingtalk
