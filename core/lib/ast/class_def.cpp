// thingtalk/ast/class_def.cpp - Device classes and mixin imports
#include "thingtalk/ast/class_def.hpp"

#include <algorithm>

#include "thingtalk/basic/errors.hpp"
#include "thingtalk/basic/string_utils.hpp"

namespace thingtalk
{

namespace
{

enum class VisitState : uint8_t { InProgress, Done };

/**
 * Depth-first walk over the `extends` graph of one function map. Appends
 * functions to `order` after their parents.
 */
class ExtendsOrder
{
public:
  ExtendsOrder(const std::string & kind, const ClassDef::FunctionMap & functions)
  : kind_(kind), functions_(functions)
  {
  }

  std::vector<FunctionDefPtr> run()
  {
    for (const auto & [name, fn] : functions_) {
      visit(name, fn);
    }
    return std::move(order_);
  }

private:
  void visit(const std::string & name, const FunctionDefPtr & fn)
  {
    auto it = state_.find(name);
    if (it != state_.end()) {
      if (it->second == VisitState::InProgress) {
        std::string chain;
        for (const auto & step : path_) {
          chain += step + " -> ";
        }
        throw InvalidClassError(
          "Class " + kind_ + " has a cyclic extends chain: " + chain + name);
      }
      return;
    }

    state_[name] = VisitState::InProgress;
    path_.push_back(name);
    for (const auto & parent_name : fn->extends()) {
      auto parent = functions_.find(parent_name);
      if (parent == functions_.end()) {
        throw InvalidClassError(
          "Function " + name + " of class " + kind_ + " extends unknown function " +
          parent_name);
      }
      visit(parent_name, parent->second);
    }
    path_.pop_back();
    state_[name] = VisitState::Done;
    order_.push_back(fn);
  }

  const std::string & kind_;
  const ClassDef::FunctionMap & functions_;
  std::map<std::string, VisitState> state_;
  std::vector<std::string> path_;
  std::vector<FunctionDefPtr> order_;
};

}  // namespace

// ============================================================================
// MixinImportStmt
// ============================================================================

MixinImportStmt::MixinImportStmt(
  std::vector<std::string> f, std::string m, std::vector<InputParamPtr> params, SourceRange r)
: NodeBase(r), facets(std::move(f)), module(std::move(m)), in_params(std::move(params))
{
  for (const auto & p : in_params) {
    detail::require_node(p, "MixinImportStmt input parameter");
  }
}

bool MixinImportStmt::has_facet(const std::string & facet) const
{
  return std::find(facets.begin(), facets.end(), facet) != facets.end();
}

MixinImportStmtPtr MixinImportStmt::clone() const
{
  return std::make_shared<MixinImportStmt>(facets, module, clone_in_params(in_params), range_);
}

bool MixinImportStmt::equals(const MixinImportStmt & other) const
{
  return facets == other.facets && module == other.module &&
         in_params_equal(in_params, other.in_params);
}

// ============================================================================
// ClassDef
// ============================================================================

ClassDef::ClassDef(
  Private, std::string k, std::vector<std::string> ext, std::vector<MixinImportStmtPtr> imps,
  FunctionMap qs, FunctionMap as, NLAnnotationMap nl, AnnotationMap impl, bool abstract,
  SourceRange r)
: NodeBase(r),
  kind(std::move(k)),
  extends(std::move(ext)),
  imports(std::move(imps)),
  queries(std::move(qs)),
  actions(std::move(as)),
  nl_annotations(std::move(nl)),
  impl_annotations(std::move(impl)),
  is_abstract(abstract)
{
}

ClassDefPtr ClassDef::create(
  std::string kind, std::vector<std::string> extends, std::vector<MixinImportStmtPtr> imports,
  FunctionMap queries, FunctionMap actions, NLAnnotationMap nl_annotations,
  AnnotationMap impl_annotations, bool is_abstract, SourceRange r)
{
  for (const auto & imp : imports) {
    detail::require_node(imp, "ClassDef import");
  }
  for (const auto * functions : {&queries, &actions}) {
    for (const auto & [name, fn] : *functions) {
      detail::require_node(fn, "ClassDef function");
      if (fn->name() != name) {
        throw InvalidClassError(
          "Function " + fn->name() + " of class " + kind + " is registered as " + name);
      }
    }
  }

  auto query_order = ExtendsOrder(kind, queries).run();
  auto action_order = ExtendsOrder(kind, actions).run();

  auto klass = std::make_shared<ClassDef>(
    Private{}, std::move(kind), std::move(extends), std::move(imports), std::move(queries),
    std::move(actions), std::move(nl_annotations), std::move(impl_annotations), is_abstract, r);

  for (const auto & fn : query_order) {
    fn->set_class(klass);
  }
  for (const auto & fn : action_order) {
    fn->set_class(klass);
  }
  return klass;
}

FunctionDefPtr ClassDef::get_function(FunctionType type, const std::string & name) const
{
  const FunctionMap & functions = type == FunctionType::Action ? actions : queries;
  auto it = functions.find(name);
  return it == functions.end() ? nullptr : it->second;
}

MixinImportStmtPtr ClassDef::loader() const
{
  for (const auto & imp : imports) {
    if (imp->has_facet("loader")) {
      return imp;
    }
  }
  return nullptr;
}

MixinImportStmtPtr ClassDef::config() const
{
  for (const auto & imp : imports) {
    if (imp->has_facet("config")) {
      return imp;
    }
  }
  return nullptr;
}

std::string ClassDef::canonical() const
{
  const auto * canonical = get_natural_language_annotation("canonical");
  if (canonical && canonical->is_string()) {
    return canonical->get<std::string>();
  }
  return clean_kind(kind);
}

int ClassDef::version() const
{
  auto version = get_implementation_annotation("version");
  if (!version || !version->is_number()) {
    return 0;
  }
  return version->get<int>();
}

std::optional<nlohmann::json> ClassDef::get_implementation_annotation(
  const std::string & key) const
{
  auto it = impl_annotations.find(key);
  if (it == impl_annotations.end()) {
    return std::nullopt;
  }
  return it->second->to_js();
}

const nlohmann::json * ClassDef::get_natural_language_annotation(const std::string & key) const
{
  auto it = nl_annotations.find(key);
  return it == nl_annotations.end() ? nullptr : &it->second;
}

ClassDefPtr ClassDef::clone() const
{
  std::vector<MixinImportStmtPtr> imps;
  imps.reserve(imports.size());
  for (const auto & imp : imports) {
    imps.push_back(imp->clone());
  }

  FunctionMap qs;
  for (const auto & [name, fn] : queries) {
    qs.emplace(name, fn->clone_function());
  }
  FunctionMap as;
  for (const auto & [name, fn] : actions) {
    as.emplace(name, fn->clone_function());
  }

  return create(
    kind, extends, std::move(imps), std::move(qs), std::move(as), nl_annotations,
    clone_annotations(impl_annotations), is_abstract, range_);
}

}  // namespace thingtalk
