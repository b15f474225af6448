// thingtalk/ast/manifest.cpp - Legacy Thingpedia manifest interchange
#include "thingtalk/ast/manifest.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <fstream>

#include "thingtalk/ast/expression.hpp"
#include "thingtalk/ast/values.hpp"
#include "thingtalk/basic/casting.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"

namespace thingtalk
{

namespace
{

constexpr const char * k_config_prefix = "org.thingpedia.config.";

std::string to_lower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string replace_all(std::string s, char from, char to)
{
  std::replace(s.begin(), s.end(), from, to);
  return s;
}

/// Annotation values in manifests are plain JSON scalars or arrays of them
ValuePtr legacy_annotation_to_value(const nlohmann::json & v)
{
  if (v.is_string()) {
    return std::make_shared<StringValue>(v.get<std::string>());
  }
  if (v.is_boolean()) {
    return std::make_shared<BooleanValue>(v.get<bool>());
  }
  if (v.is_number()) {
    return std::make_shared<NumberValue>(v.get<double>());
  }
  if (v.is_array()) {
    std::vector<ValuePtr> elems;
    for (const auto & e : v) {
      auto elem = legacy_annotation_to_value(e);
      if (!elem) {
        return nullptr;
      }
      elems.push_back(std::move(elem));
    }
    return std::make_shared<ArrayValue>(std::move(elems));
  }
  return nullptr;
}

void annotations_to_json(const AnnotationMap & annotations, nlohmann::json & out)
{
  for (const auto & [key, value] : annotations) {
    out[key] = value->to_js();
  }
}

std::string nl_string(const NLAnnotationMap & nl, const std::string & key)
{
  auto it = nl.find(key);
  if (it == nl.end() || !it->second.is_string()) {
    return {};
  }
  return it->second.get<std::string>();
}

// ============================================================================
// Class -> manifest
// ============================================================================

nlohmann::json argument_to_manifest(const ArgumentDef & arg)
{
  nlohmann::json obj;
  obj["name"] = arg.name;
  obj["type"] = arg.type->to_string();
  obj["question"] = nl_string(arg.nl_annotations, "prompt");
  obj["is_input"] = arg.is_input;
  obj["required"] = arg.required;
  annotations_to_json(arg.impl_annotations, obj);
  return obj;
}

nlohmann::json function_to_manifest(const FunctionDef & fn)
{
  nlohmann::json args = nlohmann::json::array();
  for (const auto & arg : fn.iterate_arguments()) {
    // compound fields travel inside the type of their parent argument
    if (arg->name.find('.') != std::string::npos) {
      continue;
    }
    args.push_back(argument_to_manifest(*arg));
  }

  nlohmann::json obj;
  obj["args"] = std::move(args);
  obj["canonical"] = fn.canonical().value_or("");
  obj["is_list"] = fn.is_list;
  obj["poll_interval"] = fn.is_monitorable ? fn.poll_interval().value_or(0.0) : -1.0;
  obj["confirmation"] = fn.confirmation().value_or("");

  const auto & nl = fn.nl_annotations();
  if (auto it = nl.find("confirmation_remote"); it != nl.end()) {
    obj["confirmation_remote"] = it->second;
  }
  auto formatted = nl.find("formatted");
  obj["formatted"] = formatted != nl.end() ? formatted->second : nlohmann::json::array();

  for (const auto & [key, value] : fn.impl_annotations()) {
    if (key == "poll_interval") {
      continue;
    }
    obj[key] = value->to_js();
  }
  return obj;
}

/// The configuration parameters as `{name: [label, html type]}`
nlohmann::json class_params(const ClassDef & klass)
{
  nlohmann::json params = nlohmann::json::object();
  const auto config = klass.config();
  if (!config) {
    return params;
  }
  if (
    config->module != "org.thingpedia.config.form" &&
    config->module != "org.thingpedia.config.basic_auth") {
    return params;
  }
  for (const auto & param : config->in_params) {
    const auto * argmap = dyn_cast<ArgMapValue>(param->value.get());
    if (!argmap) {
      continue;
    }
    for (const auto & [name, type] : argmap->value) {
      params[name] = nlohmann::json::array({clean(name), type_to_html(*type)});
    }
  }
  return params;
}

struct AuthInfo
{
  nlohmann::json auth = nlohmann::json::object();
  /// Discovery tags appended to `types`
  std::vector<std::string> extra_kinds;
};

AuthInfo class_auth(const ClassDef & klass)
{
  AuthInfo info;
  const auto config = klass.config();
  if (!config) {
    info.auth["type"] = "none";
    return info;
  }

  for (const auto & param : config->in_params) {
    if (isa<ArgMapValue>(param->value.get())) {
      continue;
    }
    const auto js = param->value->to_js();
    if (param->name == "device_class") {
      info.extra_kinds.push_back("bluetooth-class-" + js.get<std::string>());
    } else if (param->name == "uuids") {
      for (const auto & uuid : js) {
        info.extra_kinds.push_back("bluetooth-uuid-" + to_lower(uuid.get<std::string>()));
      }
    } else if (param->name == "search_target") {
      for (const auto & st : js) {
        auto target = to_lower(st.get<std::string>());
        if (starts_with(target, "urn:")) {
          target = target.substr(4);
        }
        info.extra_kinds.push_back("upnp-" + replace_all(target, ':', '-'));
      }
    } else {
      info.auth[param->name] = js;
    }
  }

  const auto & module = config->module;
  if (module == "org.thingpedia.config.oauth2") {
    info.auth["type"] = "oauth2";
  } else if (module == "org.thingpedia.config.custom_oauth") {
    info.auth["type"] = "custom_oauth";
  } else if (module == "org.thingpedia.config.basic_auth") {
    info.auth["type"] = "basic";
  } else if (module == "org.thingpedia.config.discovery.bluetooth") {
    info.auth["type"] = "discovery";
    info.auth["discoveryType"] = "bluetooth";
  } else if (module == "org.thingpedia.config.discovery.upnp") {
    info.auth["type"] = "discovery";
    info.auth["discoveryType"] = "upnp";
  } else if (module == "org.thingpedia.config.interactive") {
    info.auth["type"] = "interactive";
  } else if (module == "org.thingpedia.config.builtin") {
    info.auth["type"] = "builtin";
  } else {
    info.auth["type"] = "none";
  }
  return info;
}

std::string class_category(const ClassDef & klass)
{
  auto system = klass.get_implementation_annotation("system");
  if (system && system->is_boolean() && system->get<bool>()) {
    return "system";
  }
  const auto config = klass.config();
  if (!config) {
    return "data";
  }
  const auto & module = config->module;
  if (module == "org.thingpedia.config.builtin" || module == "org.thingpedia.config.none") {
    return "data";
  }
  if (starts_with(module, "org.thingpedia.config.discovery.")) {
    return "physical";
  }
  return "online";
}

// ============================================================================
// Manifest -> class
// ============================================================================

ArgumentDefPtr argument_from_manifest(const nlohmann::json & manifest)
{
  const bool is_input = manifest.value("is_input", false);
  const bool required = manifest.value("required", false);
  const auto direction =
    is_input ? (required ? ArgDirection::InReq : ArgDirection::InOpt) : ArgDirection::Out;
  const auto name = manifest.at("name").get<std::string>();

  TypePtr type;
  try {
    type = Type::from_string(manifest.at("type").get<std::string>());
  } catch (const TypeParseError & e) {
    throw ManifestError(fmt::format("Invalid type for argument {}: {}", name, e.what()));
  }

  NLAnnotationMap nl;
  const auto question = manifest.value("question", std::string());
  if (!question.empty()) {
    nl["prompt"] = question;
  }

  AnnotationMap impl;
  for (const auto & item : manifest.items()) {
    const auto & key = item.key();
    if (
      key == "is_input" || key == "required" || key == "type" || key == "name" ||
      key == "question") {
      continue;
    }
    if (auto v = legacy_annotation_to_value(item.value())) {
      impl[key] = std::move(v);
    }
  }

  return std::make_shared<ArgumentDef>(direction, name, type, std::move(nl), std::move(impl));
}

const std::vector<std::string> k_function_reserved_keys = {
  "args",      "is_list",      "is_monitorable",      "poll_interval",
  "canonical", "confirmation", "confirmation_remote", "formatted",
};

FunctionDefPtr function_from_manifest(
  FunctionType type, const std::string & name, const nlohmann::json & manifest)
{
  std::vector<ArgumentDefPtr> args;
  if (manifest.contains("args")) {
    for (const auto & arg : manifest.at("args")) {
      args.push_back(argument_from_manifest(arg));
    }
  }

  const bool is_query = type == FunctionType::Query;
  const bool is_list = is_query && manifest.value("is_list", false);
  // a missing poll_interval means a push-based monitorable query
  const auto poll = manifest.find("poll_interval");
  const bool has_poll = poll != manifest.end() && poll->is_number();
  const bool is_monitorable = is_query && !(has_poll && poll->get<double>() == -1);

  NLAnnotationMap nl;
  nl["canonical"] = manifest.value("canonical", std::string());
  nl["confirmation"] = manifest.value("confirmation", std::string());
  nl["confirmation_remote"] = manifest.value("confirmation_remote", std::string());
  if (is_query) {
    nl["formatted"] = manifest.value("formatted", nlohmann::json::array());
  }

  AnnotationMap impl;
  if (is_monitorable && has_poll) {
    impl["poll_interval"] = std::make_shared<MeasureValue>(poll->get<double>(), "ms");
  }
  for (const auto & item : manifest.items()) {
    const auto & key = item.key();
    if (
      std::find(k_function_reserved_keys.begin(), k_function_reserved_keys.end(), key) !=
      k_function_reserved_keys.end()) {
      continue;
    }
    if (auto v = legacy_annotation_to_value(item.value())) {
      impl[key] = std::move(v);
    }
  }

  return std::make_shared<FunctionDef>(
    type, name, std::vector<std::string>{}, FunctionQualifiers{is_list, is_monitorable},
    std::move(args), std::move(nl), std::move(impl));
}

ClassDef::FunctionMap functions_from_manifest(
  FunctionType type, const nlohmann::json & manifest, const char * key)
{
  ClassDef::FunctionMap functions;
  auto it = manifest.find(key);
  if (it == manifest.end()) {
    return functions;
  }
  if (!it->is_object()) {
    throw ManifestError(fmt::format("Manifest field {} must be an object", key));
  }
  for (const auto & item : it->items()) {
    functions.emplace(item.key(), function_from_manifest(type, item.key(), item.value()));
  }
  return functions;
}

std::vector<MixinImportStmtPtr> extract_imports(const nlohmann::json & manifest)
{
  std::vector<MixinImportStmtPtr> imports;
  if (manifest.contains("module_type")) {
    imports.push_back(std::make_shared<MixinImportStmt>(
      std::vector<std::string>{"loader"}, manifest.at("module_type").get<std::string>()));
  }

  std::map<std::string, TypePtr> argmap;
  if (manifest.contains("params")) {
    for (const auto & item : manifest.at("params").items()) {
      const auto & param = item.value();
      if (!param.is_array() || param.size() < 2) {
        throw ManifestError(fmt::format("Invalid definition of parameter {}", item.key()));
      }
      argmap.emplace(item.key(), html_type_to_type(param.at(1).get<std::string>()));
    }
  }

  auto auth_it = manifest.find("auth");
  if (auth_it == manifest.end()) {
    return imports;
  }
  const auto & auth = *auth_it;

  std::vector<InputParamPtr> params;
  for (const auto & item : auth.items()) {
    if (item.key() == "type" || item.key() == "discoveryType" || item.value().is_null()) {
      continue;
    }
    auto value = legacy_annotation_to_value(item.value());
    if (!value) {
      throw ManifestError(fmt::format("Unsupported value for auth parameter {}", item.key()));
    }
    params.push_back(std::make_shared<InputParam>(item.key(), std::move(value)));
  }

  const auto type = auth.value("type", std::string("none"));
  std::string module;
  if (type == "oauth2" || type == "custom_oauth" || type == "interactive" || type == "builtin") {
    module = k_config_prefix + type;
  } else if (type == "discovery") {
    module = k_config_prefix + std::string("discovery.") + auth.value("discoveryType", std::string());
  } else if (type == "basic") {
    if (!argmap.empty()) {
      params.push_back(
        std::make_shared<InputParam>("extra_params", std::make_shared<ArgMapValue>(argmap)));
    }
    module = "org.thingpedia.config.basic_auth";
  } else if (type == "none" && !argmap.empty()) {
    const bool has_params = std::any_of(
      params.begin(), params.end(), [](const InputParamPtr & p) { return p->name == "params"; });
    if (!has_params) {
      params.push_back(
        std::make_shared<InputParam>("params", std::make_shared<ArgMapValue>(argmap)));
    }
    module = "org.thingpedia.config.form";
  } else {
    module = "org.thingpedia.config.none";
  }

  imports.push_back(
    std::make_shared<MixinImportStmt>(std::vector<std::string>{"config"}, module, params));
  return imports;
}

/// Move discovery tags from `types` back into the config mixin
void add_discovery_params(const nlohmann::json & types, MixinImportStmt & config)
{
  std::vector<ValuePtr> uuids;
  std::vector<ValuePtr> search_targets;
  std::optional<std::string> device_class;
  for (const auto & t : types) {
    const auto type = t.get<std::string>();
    if (starts_with(type, "bluetooth-uuid-")) {
      uuids.push_back(std::make_shared<StringValue>(type.substr(15)));
    } else if (starts_with(type, "bluetooth-class-")) {
      device_class = type.substr(16);
    } else if (starts_with(type, "upnp-")) {
      search_targets.push_back(std::make_shared<StringValue>("urn:" + type.substr(5)));
    }
  }

  const auto string_array = Type::array(Type::string());
  if (config.module == "org.thingpedia.config.discovery.bluetooth") {
    config.in_params.push_back(std::make_shared<InputParam>(
      "uuids", std::make_shared<ArrayValue>(std::move(uuids), string_array)));
    if (device_class) {
      config.in_params.push_back(
        std::make_shared<InputParam>("device_class", std::make_shared<EnumValue>(*device_class)));
    }
  } else if (config.module == "org.thingpedia.config.discovery.upnp") {
    config.in_params.push_back(std::make_shared<InputParam>(
      "search_target", std::make_shared<ArrayValue>(std::move(search_targets), string_array)));
  }
}

}  // namespace

// ============================================================================
// HTML input types
// ============================================================================

TypePtr html_type_to_type(const std::string & html_type)
{
  if (html_type == "text") {
    return Type::string();
  }
  if (html_type == "password") {
    return Type::entity("tt:password");
  }
  if (html_type == "number") {
    return Type::number();
  }
  if (html_type == "url") {
    return Type::entity("tt:url");
  }
  if (html_type == "email") {
    return Type::entity("tt:email_address");
  }
  if (html_type == "tel") {
    return Type::entity("tt:phone_number");
  }
  throw ManifestError("Unhandled html type " + html_type);
}

std::string type_to_html(const Type & type)
{
  if (type.is_string()) {
    return "text";
  }
  if (type.is_number()) {
    return "number";
  }
  if (type.is_entity()) {
    if (type.name == "tt:password") {
      return "password";
    }
    if (type.name == "tt:url") {
      return "url";
    }
    if (type.name == "tt:email_address") {
      return "email";
    }
    if (type.name == "tt:phone_number") {
      return "tel";
    }
    return "text";
  }
  throw ManifestError("Unhandled type " + type.to_string());
}

// ============================================================================
// Conversion
// ============================================================================

nlohmann::json to_manifest(const ClassDef & klass)
{
  nlohmann::json queries = nlohmann::json::object();
  for (const auto & [name, query] : klass.queries) {
    queries[name] = function_to_manifest(*query);
  }
  nlohmann::json actions = nlohmann::json::object();
  for (const auto & [name, action] : klass.actions) {
    actions[name] = function_to_manifest(*action);
  }

  auto auth = class_auth(klass);
  nlohmann::json types = klass.extends;
  for (auto & extra : auth.extra_kinds) {
    types.push_back(std::move(extra));
  }

  const auto loader = klass.loader();

  nlohmann::json manifest;
  manifest["module_type"] = loader ? loader->module : std::string("org.thingpedia.v2");
  manifest["kind"] = klass.kind;
  manifest["params"] = class_params(klass);
  manifest["auth"] = std::move(auth.auth);
  manifest["queries"] = std::move(queries);
  manifest["actions"] = std::move(actions);
  if (auto version = klass.get_implementation_annotation("version")) {
    manifest["version"] = *version;
  }
  manifest["types"] = std::move(types);
  manifest["child_types"] =
    klass.get_implementation_annotation("child_types").value_or(nlohmann::json::array());
  manifest["category"] = class_category(klass);

  for (const char * key : {"name", "description"}) {
    if (const auto * v = klass.get_natural_language_annotation(key)) {
      manifest[key] = *v;
    }
  }
  return manifest;
}

ClassDefPtr from_manifest(const std::string & kind, const nlohmann::json & manifest)
{
  if (!manifest.is_object()) {
    throw ManifestError(fmt::format("Manifest for {} must be an object", kind));
  }

  const auto types = manifest.value("types", nlohmann::json::array());
  std::vector<std::string> extends;
  for (const auto & t : types) {
    const auto type = t.get<std::string>();
    if (!starts_with(type, "bluetooth-") && !starts_with(type, "upnp-")) {
      extends.push_back(type);
    }
  }

  auto imports = extract_imports(manifest);

  NLAnnotationMap nl;
  for (const char * key : {"name", "description"}) {
    if (manifest.contains(key)) {
      nl[key] = manifest.at(key);
    }
  }

  AnnotationMap impl;
  const auto child_types = manifest.value("child_types", nlohmann::json::array());
  if (!child_types.empty()) {
    std::vector<ValuePtr> values;
    for (const auto & t : child_types) {
      values.push_back(std::make_shared<StringValue>(t.get<std::string>()));
    }
    impl["child_types"] =
      std::make_shared<ArrayValue>(std::move(values), Type::array(Type::string()));
  }
  if (manifest.contains("version")) {
    impl["version"] = std::make_shared<NumberValue>(manifest.at("version").get<double>());
  }
  if (manifest.value("category", std::string()) == "system") {
    impl["system"] = std::make_shared<BooleanValue>(true);
  }

  auto queries = functions_from_manifest(FunctionType::Query, manifest, "queries");
  auto actions = functions_from_manifest(FunctionType::Action, manifest, "actions");

  for (auto & import : imports) {
    if (import->has_facet("config")) {
      add_discovery_params(types, *import);
      break;
    }
  }

  try {
    return ClassDef::create(
      kind, std::move(extends), std::move(imports), std::move(queries), std::move(actions),
      std::move(nl), std::move(impl));
  } catch (const InvalidClassError & e) {
    throw ManifestError(fmt::format("Invalid manifest for {}: {}", kind, e.what()));
  }
}

ClassDefPtr load_manifest_file(const std::filesystem::path & path, const std::string & kind)
{
  std::ifstream in(path);
  if (!in) {
    throw ManifestError(fmt::format("Cannot open manifest {}", path.string()));
  }

  nlohmann::json manifest;
  try {
    manifest = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error & e) {
    throw ManifestError(fmt::format("Invalid JSON in {}: {}", path.string(), e.what()));
  }

  std::string class_kind = kind;
  if (class_kind.empty()) {
    class_kind = path.stem().string();
    if (manifest.is_object() && manifest.contains("kind") && manifest.at("kind").is_string()) {
      class_kind = manifest.at("kind").get<std::string>();
    }
  }

  try {
    return from_manifest(class_kind, manifest);
  } catch (const nlohmann::json::exception & e) {
    throw ManifestError(fmt::format("Malformed manifest {}: {}", path.string(), e.what()));
  }
}

}  // namespace thingtalk
