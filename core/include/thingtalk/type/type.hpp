// thingtalk/type/type.hpp - ThingTalk type representation
//
// Types are immutable and shared through TypePtr. The primitive kinds are
// singletons, so two primitive types are equal exactly when they are the
// same object; parametric kinds compare structurally.
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thingtalk
{

class ArgumentDef;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind {
  // Primitive types
  Any,
  Boolean,
  String,
  Number,
  Currency,
  Time,
  Date,
  RecurrentTimeSpecification,
  Location,
  ArgMap,
  Object,

  // Parametric types
  Entity,    ///< Entity(prefix:name)
  Measure,   ///< Measure(base unit), '' is any unit
  Enum,      ///< Enum(a,b,c) or Enum(*)
  Array,     ///< Array(T)
  Compound,  ///< { field : T, ... }

  // Forward compatibility: a type introduced by a later version
  Unknown,
};

struct Type;
using TypePtr = std::shared_ptr<const Type>;

/// Bindings of polymorphic type parameters (`_unit`, `_entity`) made by
/// is_assignable while checking one call.
using TypeScope = std::map<std::string, std::string, std::less<>>;

// ============================================================================
// Type
// ============================================================================

struct Type
{
  TypeKind kind = TypeKind::Any;

  /// Entity: the entity type; Measure: the base unit; Compound: the
  /// (possibly empty) name; Unknown: the type name
  std::string name;

  /// Enum entries; std::nullopt is the wildcard Enum(*)
  std::optional<std::vector<std::string>> entries;

  /// Array element type
  TypePtr elem;

  /// Compound fields, in declaration order
  std::vector<std::shared_ptr<const ArgumentDef>> fields;

  // ===========================================================================
  // Singletons and constructors
  // ===========================================================================

  static TypePtr any();
  static TypePtr boolean();
  static TypePtr string();
  static TypePtr number();
  static TypePtr currency();
  static TypePtr time();
  static TypePtr date();
  static TypePtr recurrent_time_specification();
  static TypePtr location();
  static TypePtr arg_map();
  static TypePtr object();

  static TypePtr entity(std::string entity_type);
  /// The unit is normalized to its base unit.
  static TypePtr measure(std::string_view unit);
  static TypePtr enumeration(std::optional<std::vector<std::string>> entries);
  static TypePtr array(TypePtr elem);
  static TypePtr compound(
    std::string name, std::vector<std::shared_ptr<const ArgumentDef>> fields);
  static TypePtr unknown(std::string name);

  /// Parse the surface syntax produced by to_string(). Throws TypeParseError.
  static TypePtr from_string(std::string_view str);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] bool is_any() const noexcept { return kind == TypeKind::Any; }
  [[nodiscard]] bool is_boolean() const noexcept { return kind == TypeKind::Boolean; }
  [[nodiscard]] bool is_string() const noexcept { return kind == TypeKind::String; }
  [[nodiscard]] bool is_number() const noexcept { return kind == TypeKind::Number; }
  [[nodiscard]] bool is_currency() const noexcept { return kind == TypeKind::Currency; }
  [[nodiscard]] bool is_time() const noexcept { return kind == TypeKind::Time; }
  [[nodiscard]] bool is_date() const noexcept { return kind == TypeKind::Date; }
  [[nodiscard]] bool is_recurrent_time_specification() const noexcept
  {
    return kind == TypeKind::RecurrentTimeSpecification;
  }
  [[nodiscard]] bool is_location() const noexcept { return kind == TypeKind::Location; }
  [[nodiscard]] bool is_arg_map() const noexcept { return kind == TypeKind::ArgMap; }
  [[nodiscard]] bool is_object() const noexcept { return kind == TypeKind::Object; }
  [[nodiscard]] bool is_entity() const noexcept { return kind == TypeKind::Entity; }
  [[nodiscard]] bool is_measure() const noexcept { return kind == TypeKind::Measure; }
  [[nodiscard]] bool is_enum() const noexcept { return kind == TypeKind::Enum; }
  [[nodiscard]] bool is_array() const noexcept { return kind == TypeKind::Array; }
  [[nodiscard]] bool is_compound() const noexcept { return kind == TypeKind::Compound; }
  [[nodiscard]] bool is_unknown() const noexcept { return kind == TypeKind::Unknown; }

  [[nodiscard]] bool is_numeric() const noexcept
  {
    return is_number() || is_measure() || is_currency();
  }
  [[nodiscard]] bool is_comparable() const noexcept
  {
    return is_numeric() || is_date() || is_time() || is_string();
  }

  /// Compound field lookup by (undotted) name
  [[nodiscard]] std::shared_ptr<const ArgumentDef> get_field(std::string_view field) const;

  [[nodiscard]] bool equals(const Type & other) const;

  /// Surface syntax, e.g. "Array(Entity(tt:url))" or "Measure(ms)"
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] inline bool operator==(const Type & a, const Type & b) { return a.equals(b); }
[[nodiscard]] inline bool operator!=(const Type & a, const Type & b) { return !a.equals(b); }

/// Null-tolerant equality on shared types
[[nodiscard]] bool type_equals(const TypePtr & a, const TypePtr & b);

/**
 * Check whether a value of type `type` can be used where `assignable_to`
 * is expected.
 *
 * Any matches everything, Date converts to Time, Number to Currency,
 * Array(Entity(tt:contact)) to Entity(tt:contact_group). Measure('') and
 * Entity('') are polymorphic and bind `_unit` / `_entity` in `scope`.
 * With `lenient`, Entity and String are interchangeable.
 */
[[nodiscard]] bool is_assignable(
  const Type & type, const Type & assignable_to, TypeScope * scope = nullptr,
  bool lenient = false);

}  // namespace thingtalk
