// thingtalk/type/type.cpp - Type singletons, printing, parsing and assignability
#include "thingtalk/type/type.hpp"

#include <algorithm>
#include <cctype>

#include "thingtalk/ast/function_def.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/units.hpp"

namespace thingtalk
{

namespace
{

TypePtr make_primitive(TypeKind kind)
{
  auto type = std::make_shared<Type>();
  type->kind = kind;
  return type;
}

bool entity_sub_type(std::string_view type, std::string_view assignable_to)
{
  if (type == "tt:username" || type == "tt:contact_name") {
    return assignable_to == "tt:phone_number" || assignable_to == "tt:email_address" ||
           assignable_to == "tt:contact";
  }
  if (type == "tt:contact_group_name") {
    return assignable_to == "tt:contact_group";
  }
  if (type == "tt:picture_url") {
    return assignable_to == "tt:url";
  }
  return false;
}

/// Binds a polymorphic parameter the first time it is seen, then requires
/// later uses to agree.
bool bind_scope(TypeScope * scope, const std::string & key, const std::string & value)
{
  if (scope == nullptr) {
    return true;
  }
  auto it = scope->find(key);
  if (it == scope->end()) {
    scope->emplace(key, value);
    return true;
  }
  return it->second == value;
}

// ============================================================================
// Type string parser
// ============================================================================

class TypeParser
{
public:
  explicit TypeParser(std::string_view input) : input_(input) {}

  TypePtr parse()
  {
    TypePtr type = parse_type();
    skip_space();
    if (pos_ != input_.size()) {
      fail("unexpected trailing input");
    }
    return type;
  }

private:
  [[noreturn]] void fail(const std::string & why) const
  {
    throw TypeParseError(
      "Invalid type '" + std::string(input_) + "' at offset " + std::to_string(pos_) + ": " +
      why);
  }

  void skip_space()
  {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
  }

  bool accept(char c)
  {
    skip_space();
    if (pos_ < input_.size() && input_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  void expect(char c)
  {
    if (!accept(c)) {
      fail(std::string("expected '") + c + "'");
    }
  }

  std::string word()
  {
    skip_space();
    const size_t start = pos_;
    while (pos_ < input_.size()) {
      const char c = input_[pos_];
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '.' ||
          c == '-' || c == '*') {
        ++pos_;
      } else {
        break;
      }
    }
    if (start == pos_) {
      fail("expected a name");
    }
    return std::string(input_.substr(start, pos_ - start));
  }

  TypePtr parse_type()
  {
    const std::string head = word();

    if (head == "Any") return Type::any();
    if (head == "Boolean") return Type::boolean();
    if (head == "String") return Type::string();
    if (head == "Number") return Type::number();
    if (head == "Currency") return Type::currency();
    if (head == "Time") return Type::time();
    if (head == "Date") return Type::date();
    if (head == "RecurrentTimeSpecification") return Type::recurrent_time_specification();
    if (head == "Location") return Type::location();
    if (head == "ArgMap") return Type::arg_map();
    if (head == "Object") return Type::object();

    if (head == "Entity") {
      expect('(');
      std::string entity_type = word();
      expect(')');
      return Type::entity(std::move(entity_type));
    }
    if (head == "Measure") {
      expect('(');
      std::string unit;
      skip_space();
      if (pos_ < input_.size() && input_[pos_] != ')') {
        unit = word();
      }
      expect(')');
      return Type::measure(unit);
    }
    if (head == "Enum") {
      expect('(');
      std::vector<std::string> entries;
      do {
        entries.push_back(word());
      } while (accept(','));
      expect(')');
      if (entries.size() == 1 && entries[0] == "*") {
        return Type::enumeration(std::nullopt);
      }
      return Type::enumeration(std::move(entries));
    }
    if (head == "Array") {
      expect('(');
      TypePtr elem = parse_type();
      expect(')');
      return Type::array(std::move(elem));
    }
    if (head == "Compound") {
      std::string name;
      if (accept('(')) {
        name = word();
        expect(')');
      }
      return Type::compound(std::move(name), {});
    }

    return Type::unknown(head);
  }

  std::string_view input_;
  size_t pos_ = 0;
};

}  // namespace

// ============================================================================
// Singletons and constructors
// ============================================================================

#define THINGTALK_PRIMITIVE_TYPE(method, Kind)             \
  TypePtr Type::method()                                   \
  {                                                        \
    static const TypePtr instance = make_primitive(TypeKind::Kind); \
    return instance;                                       \
  }

THINGTALK_PRIMITIVE_TYPE(any, Any)
THINGTALK_PRIMITIVE_TYPE(boolean, Boolean)
THINGTALK_PRIMITIVE_TYPE(string, String)
THINGTALK_PRIMITIVE_TYPE(number, Number)
THINGTALK_PRIMITIVE_TYPE(currency, Currency)
THINGTALK_PRIMITIVE_TYPE(time, Time)
THINGTALK_PRIMITIVE_TYPE(date, Date)
THINGTALK_PRIMITIVE_TYPE(recurrent_time_specification, RecurrentTimeSpecification)
THINGTALK_PRIMITIVE_TYPE(location, Location)
THINGTALK_PRIMITIVE_TYPE(arg_map, ArgMap)
THINGTALK_PRIMITIVE_TYPE(object, Object)

#undef THINGTALK_PRIMITIVE_TYPE

TypePtr Type::entity(std::string entity_type)
{
  auto type = std::make_shared<Type>();
  type->kind = TypeKind::Entity;
  type->name = std::move(entity_type);
  return type;
}

TypePtr Type::measure(std::string_view unit)
{
  auto type = std::make_shared<Type>();
  type->kind = TypeKind::Measure;
  type->name = std::string(base_unit(unit).value_or(unit));
  return type;
}

TypePtr Type::enumeration(std::optional<std::vector<std::string>> entries)
{
  auto type = std::make_shared<Type>();
  type->kind = TypeKind::Enum;
  type->entries = std::move(entries);
  return type;
}

TypePtr Type::array(TypePtr elem)
{
  auto type = std::make_shared<Type>();
  type->kind = TypeKind::Array;
  type->elem = elem ? std::move(elem) : Type::any();
  return type;
}

TypePtr Type::compound(std::string name, std::vector<std::shared_ptr<const ArgumentDef>> fields)
{
  auto type = std::make_shared<Type>();
  type->kind = TypeKind::Compound;
  type->name = std::move(name);
  type->fields = std::move(fields);
  return type;
}

TypePtr Type::unknown(std::string name)
{
  auto type = std::make_shared<Type>();
  type->kind = TypeKind::Unknown;
  type->name = std::move(name);
  return type;
}

TypePtr Type::from_string(std::string_view str) { return TypeParser(str).parse(); }

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<const ArgumentDef> Type::get_field(std::string_view field) const
{
  for (const auto & f : fields) {
    if (f->name == field) {
      return f;
    }
  }
  return nullptr;
}

bool Type::equals(const Type & other) const
{
  if (this == &other) {
    return true;
  }
  if (kind != other.kind) {
    return false;
  }

  switch (kind) {
    case TypeKind::Entity:
    case TypeKind::Measure:
    case TypeKind::Unknown:
      return name == other.name;
    case TypeKind::Enum:
      return entries == other.entries;
    case TypeKind::Array:
      return type_equals(elem, other.elem);
    case TypeKind::Compound: {
      if (name != other.name || fields.size() != other.fields.size()) {
        return false;
      }
      for (const auto & f : fields) {
        auto of = other.get_field(f->name);
        if (!of || !type_equals(f->type, of->type)) {
          return false;
        }
      }
      return true;
    }
    default:
      // primitive kinds carry no payload
      return true;
  }
}

std::string Type::to_string() const
{
  switch (kind) {
    case TypeKind::Any:
      return "Any";
    case TypeKind::Boolean:
      return "Boolean";
    case TypeKind::String:
      return "String";
    case TypeKind::Number:
      return "Number";
    case TypeKind::Currency:
      return "Currency";
    case TypeKind::Time:
      return "Time";
    case TypeKind::Date:
      return "Date";
    case TypeKind::RecurrentTimeSpecification:
      return "RecurrentTimeSpecification";
    case TypeKind::Location:
      return "Location";
    case TypeKind::ArgMap:
      return "ArgMap";
    case TypeKind::Object:
      return "Object";
    case TypeKind::Entity:
      return "Entity(" + name + ")";
    case TypeKind::Measure:
      return "Measure(" + name + ")";
    case TypeKind::Enum: {
      if (!entries) {
        return "Enum(*)";
      }
      std::string out = "Enum(";
      for (size_t i = 0; i < entries->size(); ++i) {
        if (i > 0) out += ',';
        out += (*entries)[i];
      }
      return out + ")";
    }
    case TypeKind::Array:
      return "Array(" + (elem ? elem->to_string() : std::string("Any")) + ")";
    case TypeKind::Compound:
      return name.empty() ? "Compound" : "Compound(" + name + ")";
    case TypeKind::Unknown:
      return name;
  }
  return "";
}

bool type_equals(const TypePtr & a, const TypePtr & b)
{
  if (a == b) {
    return true;
  }
  if (!a || !b) {
    return false;
  }
  return a->equals(*b);
}

// ============================================================================
// Assignability
// ============================================================================

bool is_assignable(const Type & type, const Type & assignable_to, TypeScope * scope, bool lenient)
{
  if (type.equals(assignable_to)) {
    return true;
  }

  // different types where one is unknown: we do not know the rules
  if (type.is_unknown() || assignable_to.is_unknown()) {
    return false;
  }

  if (type.is_any() || assignable_to.is_any()) {
    return true;
  }

  if (type.is_date() && assignable_to.is_time()) {
    return true;
  }
  if (type.is_number() && assignable_to.is_currency()) {
    return true;
  }

  if (type.is_measure() && assignable_to.is_measure()) {
    if (assignable_to.name.empty()) {
      return bind_scope(scope, "_unit", type.name);
    }
    return type.name == assignable_to.name;
  }

  if (type.is_array() && assignable_to.is_array()) {
    if (type.elem->is_any()) {
      return true;
    }
    if (is_assignable(*type.elem, *assignable_to.elem, scope, lenient)) {
      return true;
    }
  }
  if (type.is_array() && assignable_to.is_entity() && assignable_to.name == "tt:contact_group") {
    return is_assignable(*type.elem, *Type::entity("tt:contact"), scope, lenient);
  }

  if (lenient && type.is_entity() && assignable_to.is_string()) {
    return true;
  }
  if (lenient && type.is_string() && assignable_to.is_entity()) {
    return true;
  }

  if (type.is_enum() && assignable_to.is_enum()) {
    if (!type.entries) {
      return true;
    }
    if (!assignable_to.entries) {
      return false;
    }
    const auto & from = *type.entries;
    const auto & to = *assignable_to.entries;
    if (!from.empty() && from.back() == "*") {
      return std::all_of(from.begin(), from.end() - 1, [&to](const std::string & entry) {
        return std::find(to.begin(), to.end(), entry) != to.end();
      });
    }
  }

  if (type.is_entity() && assignable_to.is_entity()) {
    if (assignable_to.name.empty()) {
      return bind_scope(scope, "_entity", type.name);
    }
    return entity_sub_type(type.name, assignable_to.name);
  }

  return false;
}

}  // namespace thingtalk
