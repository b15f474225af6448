// thingtalk/ast/function_def.cpp - Argument flattening and inheritance resolution
#include "thingtalk/ast/function_def.hpp"

#include <algorithm>

#include "thingtalk/ast/class_def.hpp"
#include "thingtalk/ast/values.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"

namespace thingtalk
{

namespace
{

/// The compound whose fields are hoisted for an argument of this type
const Type * flattenable_compound(const TypePtr & type)
{
  if (type->is_compound()) {
    return type.get();
  }
  if (type->is_array() && type->elem && type->elem->is_compound()) {
    return type->elem.get();
  }
  return nullptr;
}

/// Rebuild a compound (or array of compound) so that every field carries `dir`
TypePtr propagate_direction(const TypePtr & type, ArgDirection dir)
{
  if (type->is_array() && type->elem && type->elem->is_compound()) {
    return Type::array(propagate_direction(type->elem, dir));
  }
  if (!type->is_compound()) {
    return type;
  }
  std::vector<std::shared_ptr<const ArgumentDef>> fields;
  fields.reserve(type->fields.size());
  for (const auto & field : type->fields) {
    fields.push_back(field->as_field(field->name, dir));
  }
  return Type::compound(type->name, std::move(fields));
}

void flatten_fields(
  const ArgumentDefPtr & arg, std::set<std::string> & seen, std::vector<ArgumentDefPtr> & out)
{
  const Type * compound = flattenable_compound(arg->type);
  if (compound == nullptr) {
    return;
  }
  for (const auto & field : compound->fields) {
    auto hoisted = field->as_field(arg->name + "." + field->name, arg->direction);
    if (seen.insert(hoisted->name).second) {
      out.push_back(hoisted);
    }
    flatten_fields(hoisted, seen, out);
  }
}

std::vector<ArgumentDefPtr> flatten_compound_arguments(std::vector<ArgumentDefPtr> args)
{
  std::set<std::string> seen;
  for (const auto & arg : args) {
    seen.insert(arg->name);
  }
  std::vector<ArgumentDefPtr> flattened = args;
  for (const auto & arg : args) {
    flatten_fields(arg, seen, flattened);
  }
  return flattened;
}

std::vector<std::string> string_list_annotation(const ValuePtr & value)
{
  std::vector<std::string> out;
  const auto array = dyn_cast<ArrayValue>(value);
  if (!array) {
    return out;
  }
  for (const auto & elem : array->value) {
    if (const auto str = dyn_cast<StringValue>(elem)) {
      out.push_back(str->value);
    }
  }
  return out;
}

std::optional<std::string> string_nl_annotation(const NLAnnotationMap & map, const char * key)
{
  auto it = map.find(key);
  if (it == map.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return it->second.get<std::string>();
}

}  // namespace

AnnotationMap clone_annotations(const AnnotationMap & annotations)
{
  AnnotationMap out;
  for (const auto & [key, value] : annotations) {
    out.emplace(key, detail::clone_or_null(value));
  }
  return out;
}

bool annotations_equal(const AnnotationMap & a, const AnnotationMap & b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto & [key, value] : a) {
    auto it = b.find(key);
    if (it == b.end() || !value_equals(value, it->second)) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// ArgumentDef
// ============================================================================

ArgumentDef::ArgumentDef(
  ArgDirection dir, std::string n, TypePtr t, NLAnnotationMap nl, AnnotationMap impl,
  SourceRange r)
: range_(r),
  direction(dir),
  name(std::move(n)),
  type(detail::require_node(std::move(t), "ArgumentDef type")),
  nl_annotations(std::move(nl)),
  impl_annotations(std::move(impl)),
  is_input(dir != ArgDirection::Out),
  required(dir == ArgDirection::InReq || dir == ArgDirection::None),
  unique(false)
{
  auto it = impl_annotations.find("unique");
  if (it != impl_annotations.end()) {
    const auto flag = dyn_cast_or_null<BooleanValue>(it->second.get());
    unique = flag != nullptr && flag->value;
  }
  if (direction != ArgDirection::None) {
    type = propagate_direction(type, direction);
  }
}

std::string ArgumentDef::canonical() const
{
  auto it = nl_annotations.find("canonical");
  if (it != nl_annotations.end()) {
    const auto & canonical = it->second;
    if (canonical.is_string()) {
      return canonical.get<std::string>();
    }
    if (canonical.is_object()) {
      for (const char * key : {"base", "property", "npp"}) {
        if (canonical.contains(key) && canonical[key].is_array() && !canonical[key].empty()) {
          return canonical[key][0].get<std::string>();
        }
      }
    }
  }
  return clean(name);
}

std::optional<nlohmann::json> ArgumentDef::get_implementation_annotation(
  const std::string & key) const
{
  auto it = impl_annotations.find(key);
  if (it == impl_annotations.end()) {
    return std::nullopt;
  }
  return it->second->to_js();
}

const nlohmann::json * ArgumentDef::get_natural_language_annotation(const std::string & key) const
{
  auto it = nl_annotations.find(key);
  return it == nl_annotations.end() ? nullptr : &it->second;
}

ArgumentDefPtr ArgumentDef::clone() const
{
  auto copy = std::make_shared<ArgumentDef>(
    direction, name, type, nl_annotations, clone_annotations(impl_annotations), range_);
  // a compound field keeps the flags its parent gave it
  copy->is_input = is_input;
  copy->required = required;
  return copy;
}

ArgumentDefPtr ArgumentDef::as_field(std::string new_name, ArgDirection dir) const
{
  auto copy = std::make_shared<ArgumentDef>(
    dir, std::move(new_name), type, nl_annotations, clone_annotations(impl_annotations), range_);
  if (dir == ArgDirection::None) {
    copy->is_input = is_input;
    copy->required = required;
  }
  return copy;
}

bool ArgumentDef::equals(const ArgumentDef & other) const
{
  return direction == other.direction && name == other.name && type_equals(type, other.type) &&
         nl_annotations == other.nl_annotations &&
         annotations_equal(impl_annotations, other.impl_annotations);
}

// ============================================================================
// ExpressionSignature
// ============================================================================

ExpressionSignature::ExpressionSignature(
  FunctionType function_type, std::vector<std::string> extends, std::vector<ArgumentDefPtr> args,
  FunctionQualifiers qualifiers, SourceRange r)
: is_list(qualifiers.is_list),
  is_monitorable(qualifiers.is_monitorable),
  function_type_(function_type),
  extends_(std::move(extends)),
  range_(r)
{
  for (const auto & arg : args) {
    detail::require_node(arg, "signature argument");
  }
  args_ = flatten_compound_arguments(std::move(args));
  for (const auto & arg : args_) {
    argmap_[arg->name] = arg;
  }
}

std::vector<std::string> ExpressionSignature::args() const
{
  std::vector<std::string> names;
  names.reserve(args_.size());
  for (const auto & arg : args_) {
    names.push_back(arg->name);
  }
  return names;
}

std::shared_ptr<const FunctionDef> ExpressionSignature::resolve_parent(
  const std::string & name) const
{
  auto klass = class_.lock();
  if (!klass) {
    throw ResolutionError("Class information missing from the function definition");
  }
  const FunctionType parent_type =
    function_type_ == FunctionType::Stream ? FunctionType::Query : function_type_;
  auto parent = klass->get_function(parent_type, name);
  if (!parent) {
    throw ResolutionError("Parent function " + name + " not found");
  }
  return parent;
}

std::vector<std::shared_ptr<const FunctionDef>> ExpressionSignature::parents() const
{
  std::vector<std::shared_ptr<const FunctionDef>> out;
  if (!inherits_arguments()) {
    return out;
  }
  for (const auto & name : extends_) {
    out.push_back(resolve_parent(name));
  }
  return out;
}

bool ExpressionSignature::has_argument(const std::string & name) const
{
  return get_argument(name) != nullptr;
}

ArgumentDefPtr ExpressionSignature::get_argument(const std::string & name) const
{
  auto it = argmap_.find(name);
  if (it != argmap_.end()) {
    return it->second;
  }
  if (extends_.empty() || !inherits_arguments()) {
    return nullptr;
  }
  for (const auto & parent_name : extends_) {
    if (auto arg = resolve_parent(parent_name)->get_argument(name)) {
      return arg;
    }
  }
  return nullptr;
}

TypePtr ExpressionSignature::get_arg_type(const std::string & name) const
{
  auto arg = get_argument(name);
  return arg ? arg->type : nullptr;
}

std::optional<std::string> ExpressionSignature::get_arg_canonical(const std::string & name) const
{
  auto arg = get_argument(name);
  if (!arg) {
    return std::nullopt;
  }
  return arg->canonical();
}

const NLAnnotationMap * ExpressionSignature::get_arg_metadata(const std::string & name) const
{
  auto arg = get_argument(name);
  return arg ? &arg->nl_annotations : nullptr;
}

std::optional<bool> ExpressionSignature::is_arg_input(const std::string & name) const
{
  auto arg = get_argument(name);
  if (!arg) {
    return std::nullopt;
  }
  return arg->is_input;
}

std::optional<bool> ExpressionSignature::is_arg_required(const std::string & name) const
{
  auto arg = get_argument(name);
  if (!arg) {
    return std::nullopt;
  }
  return arg->required;
}

void ExpressionSignature::iterate_arguments_into(
  std::vector<ArgumentDefPtr> & out, std::set<std::string> & seen) const
{
  for (const auto & arg : args_) {
    if (seen.insert(arg->name).second) {
      out.push_back(arg);
    }
  }
  for (const auto & parent : parents()) {
    parent->iterate_arguments_into(out, seen);
  }
}

std::vector<ArgumentDefPtr> ExpressionSignature::iterate_arguments() const
{
  std::vector<ArgumentDefPtr> out;
  std::set<std::string> seen;
  iterate_arguments_into(out, seen);
  return out;
}

std::map<std::string, TypePtr> ExpressionSignature::in_req() const
{
  std::map<std::string, TypePtr> out;
  for (const auto & arg : iterate_arguments()) {
    if (arg->is_input && arg->required) {
      out.emplace(arg->name, arg->type);
    }
  }
  return out;
}

std::map<std::string, TypePtr> ExpressionSignature::in_opt() const
{
  std::map<std::string, TypePtr> out;
  for (const auto & arg : iterate_arguments()) {
    if (arg->is_input && !arg->required) {
      out.emplace(arg->name, arg->type);
    }
  }
  return out;
}

std::map<std::string, TypePtr> ExpressionSignature::out() const
{
  std::map<std::string, TypePtr> result;
  for (const auto & arg : iterate_arguments()) {
    if (!arg->is_input) {
      result.emplace(arg->name, arg->type);
    }
  }
  return result;
}

bool ExpressionSignature::has_any_input_arg() const
{
  const auto all = iterate_arguments();
  return std::any_of(all.begin(), all.end(), [](const ArgumentDefPtr & a) { return a->is_input; });
}

bool ExpressionSignature::has_any_output_arg() const
{
  const auto all = iterate_arguments();
  return std::any_of(
    all.begin(), all.end(), [](const ArgumentDefPtr & a) { return !a->is_input; });
}

void ExpressionSignature::copy_qualifiers_to(ExpressionSignature & clone) const
{
  clone.is_list = is_list;
  clone.is_monitorable = is_monitorable;
  clone.require_filter = require_filter;
  clone.default_projection = default_projection;
  clone.minimal_projection = minimal_projection;
  clone.no_filter = no_filter;
}

ExpressionSignaturePtr ExpressionSignature::clone_internal(
  std::vector<ArgumentDefPtr> args, bool flattened) const
{
  std::vector<ArgumentDefPtr> copies;
  copies.reserve(args.size());
  for (const auto & arg : args) {
    copies.push_back(arg->clone());
  }
  auto clone = std::make_shared<ExpressionSignature>(
    function_type_, flattened ? std::vector<std::string>{} : extends_, std::move(copies),
    FunctionQualifiers{is_list, is_monitorable}, range_);
  copy_qualifiers_to(*clone);
  clone->class_ = class_;
  clone->pinned_class_ = class_.lock();
  return clone;
}

ExpressionSignaturePtr ExpressionSignature::clone() const { return clone_internal(args_, false); }

ExpressionSignaturePtr ExpressionSignature::add_arguments(
  gsl::span<const ArgumentDefPtr> to_add) const
{
  std::vector<ArgumentDefPtr> args = args_;
  args.insert(args.end(), to_add.begin(), to_add.end());
  return clone_internal(std::move(args), false);
}

ExpressionSignaturePtr ExpressionSignature::remove_argument(const std::string & name) const
{
  if (argmap_.count(name) != 0) {
    std::vector<ArgumentDefPtr> args;
    for (const auto & arg : args_) {
      if (arg->name != name) {
        args.push_back(arg);
      }
    }
    return clone_internal(std::move(args), false);
  }
  if (has_argument(name)) {
    std::vector<ArgumentDefPtr> args;
    for (const auto & arg : iterate_arguments()) {
      if (arg->name != name) {
        args.push_back(arg);
      }
    }
    return clone_internal(std::move(args), true);
  }
  return clone();
}

ExpressionSignaturePtr ExpressionSignature::filter_arguments(
  const std::function<bool(const ArgumentDef &)> & filter) const
{
  std::vector<ArgumentDefPtr> args;
  for (const auto & arg : iterate_arguments()) {
    if (filter(*arg)) {
      args.push_back(arg);
    }
  }
  return clone_internal(std::move(args), true);
}

ExpressionSignaturePtr ExpressionSignature::as_type(FunctionType type) const
{
  auto clone = this->clone();
  clone->function_type_ = type;
  return clone;
}

void ExpressionSignature::remove_default_projection() { default_projection.clear(); }

void ExpressionSignature::remove_minimal_projection()
{
  minimal_projection = std::vector<std::string>{};
}

void ExpressionSignature::set_class(const std::shared_ptr<const ClassDef> & klass)
{
  class_ = klass;
  pinned_class_.reset();
}

// ============================================================================
// FunctionDef
// ============================================================================

FunctionDef::FunctionDef(
  FunctionType function_type, std::string name, std::vector<std::string> extends,
  FunctionQualifiers qualifiers, std::vector<ArgumentDefPtr> args, NLAnnotationMap nl_annotations,
  AnnotationMap impl_annotations, SourceRange r)
: ExpressionSignature(function_type, std::move(extends), std::move(args), qualifiers, r),
  name_(std::move(name)),
  qualified_name_("." + name_),
  nl_annotations_(std::move(nl_annotations)),
  impl_annotations_(std::move(impl_annotations))
{
  if (function_type == FunctionType::Action && (qualifiers.is_list || qualifiers.is_monitorable)) {
    throw InvariantError("Action " + name_ + " cannot be list or monitorable");
  }

  if (auto it = impl_annotations_.find("require_filter"); it != impl_annotations_.end()) {
    const auto flag = dyn_cast_or_null<BooleanValue>(it->second.get());
    require_filter = flag != nullptr && flag->value;
  }
  if (auto it = impl_annotations_.find("default_projection"); it != impl_annotations_.end()) {
    default_projection = string_list_annotation(it->second);
  }
  if (auto it = impl_annotations_.find("minimal_projection"); it != impl_annotations_.end()) {
    if (isa<ArrayValue>(it->second)) {
      minimal_projection = string_list_annotation(it->second);
    }
  }
}

std::optional<nlohmann::json> FunctionDef::get_implementation_annotation(
  const std::string & key) const
{
  auto it = impl_annotations_.find(key);
  if (it == impl_annotations_.end()) {
    return std::nullopt;
  }
  return it->second->to_js();
}

const nlohmann::json * FunctionDef::get_natural_language_annotation(const std::string & key) const
{
  auto it = nl_annotations_.find(key);
  return it == nl_annotations_.end() ? nullptr : &it->second;
}

std::optional<std::string> FunctionDef::canonical() const
{
  return string_nl_annotation(nl_annotations_, "canonical");
}

std::optional<std::string> FunctionDef::confirmation() const
{
  return string_nl_annotation(nl_annotations_, "confirmation");
}

std::optional<double> FunctionDef::poll_interval() const
{
  auto it = impl_annotations_.find("poll_interval");
  if (it == impl_annotations_.end()) {
    return std::nullopt;
  }
  const auto measure = dyn_cast<MeasureValue>(it->second);
  if (!measure || !measure->is_concrete()) {
    return std::nullopt;
  }
  return measure->to_js().get<double>();
}

bool FunctionDef::inherits_arguments() const
{
  auto it = impl_annotations_.find("inherit_arguments");
  if (it == impl_annotations_.end()) {
    return true;
  }
  const auto flag = dyn_cast_or_null<BooleanValue>(it->second.get());
  return flag == nullptr || flag->value;
}

std::vector<std::string> FunctionDef::iterate_base_functions() const
{
  std::vector<std::string> out{name_};
  for (const auto & parent_name : extends_) {
    auto parent = resolve_parent(parent_name);
    for (auto & base : parent->iterate_base_functions()) {
      out.push_back(std::move(base));
    }
  }
  return out;
}

ExpressionSignaturePtr FunctionDef::clone_internal(
  std::vector<ArgumentDefPtr> args, bool flattened) const
{
  std::vector<ArgumentDefPtr> copies;
  copies.reserve(args.size());
  for (const auto & arg : args) {
    copies.push_back(arg->clone());
  }
  auto clone = std::make_shared<FunctionDef>(
    function_type_, name_, flattened ? std::vector<std::string>{} : extends_,
    FunctionQualifiers{is_list, is_monitorable}, std::move(copies), nl_annotations_,
    clone_annotations(impl_annotations_), range_);
  copy_qualifiers_to(*clone);
  clone->class_ = class_;
  clone->pinned_class_ = class_.lock();
  clone->qualified_name_ = qualified_name_;
  if (clone->extends_.empty() || !clone->class_.expired()) {
    clone->set_minimal_projection();
  }
  return clone;
}

ExpressionSignaturePtr FunctionDef::clone() const { return clone_internal(args_, false); }

FunctionDefPtr FunctionDef::clone_function() const
{
  return std::static_pointer_cast<FunctionDef>(clone());
}

void FunctionDef::set_class(const std::shared_ptr<const ClassDef> & klass)
{
  ExpressionSignature::set_class(klass);
  qualified_name_ = (klass ? klass->kind : std::string()) + "." + name_;
  set_minimal_projection();
}

void FunctionDef::remove_default_projection()
{
  ExpressionSignature::remove_default_projection();
  impl_annotations_.erase("default_projection");
}

void FunctionDef::remove_minimal_projection()
{
  ExpressionSignature::remove_minimal_projection();
  impl_annotations_.erase("minimal_projection");
}

void FunctionDef::set_minimal_projection()
{
  if (!minimal_projection) {
    auto id = get_argument("id");
    std::vector<ValuePtr> names;
    if (id && !id->is_input) {
      minimal_projection = std::vector<std::string>{"id"};
      names.push_back(std::make_shared<StringValue>("id"));
    } else {
      minimal_projection = std::vector<std::string>{};
    }
    impl_annotations_["minimal_projection"] = std::make_shared<ArrayValue>(std::move(names));
  }

  if (!default_projection.empty()) {
    for (const auto & arg : *minimal_projection) {
      if (std::find(default_projection.begin(), default_projection.end(), arg) ==
          default_projection.end()) {
        throw InvariantError(
          "Function " + name_ + ": minimal projection argument " + arg +
          " is not in the default projection");
      }
    }
  }
}

bool FunctionDef::equals(const FunctionDef & other) const
{
  if (name_ != other.name_ || function_type_ != other.function_type_ ||
      is_list != other.is_list || is_monitorable != other.is_monitorable ||
      extends_ != other.extends_ || args_.size() != other.args_.size()) {
    return false;
  }
  for (size_t i = 0; i < args_.size(); ++i) {
    if (!args_[i]->equals(*other.args_[i])) {
      return false;
    }
  }
  return nl_annotations_ == other.nl_annotations_ &&
         annotations_equal(impl_annotations_, other.impl_annotations_);
}

}  // namespace thingtalk
