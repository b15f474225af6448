// thingtalk/ast/class_def.hpp - Device classes and mixin imports
//
// A ClassDef is the declaration of a device kind: its queries and actions,
// the mixins it imports (loader, config) and its annotations. It owns its
// functions and is the only way they resolve `extends`.
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "thingtalk/ast/expression.hpp"
#include "thingtalk/ast/function_def.hpp"
#include "thingtalk/ast/node.hpp"

namespace thingtalk
{

using MixinImportStmtPtr = std::shared_ptr<MixinImportStmt>;

/// `import loader from @org.thingpedia.v2(...);`
class MixinImportStmt : public NodeBase<MixinImportStmt, AstNode, NodeKind::MixinImportStmt>
{
public:
  std::vector<std::string> facets;
  std::string module;
  std::vector<InputParamPtr> in_params;

  MixinImportStmt(
    std::vector<std::string> f, std::string m, std::vector<InputParamPtr> params = {},
    SourceRange r = {});

  [[nodiscard]] bool has_facet(const std::string & facet) const;

  [[nodiscard]] MixinImportStmtPtr clone() const;
  [[nodiscard]] bool equals(const MixinImportStmt & other) const;
};

/**
 * A device class.
 *
 * Built through create(), which validates the `extends` chains of the
 * functions (every parent exists, no cycles) and attaches each function to
 * the new class, parents before children. Functions keep a weak reference
 * to their class, so a class must stay owned by a shared_ptr while its
 * functions resolve inherited arguments.
 */
class ClassDef : public NodeBase<ClassDef, AstNode, NodeKind::ClassDef>
{
  struct Private
  {
    explicit Private() = default;
  };

public:
  using FunctionMap = std::map<std::string, FunctionDefPtr>;

  std::string kind;
  /// Parent class kinds
  std::vector<std::string> extends;
  std::vector<MixinImportStmtPtr> imports;
  FunctionMap queries;
  FunctionMap actions;
  NLAnnotationMap nl_annotations;
  AnnotationMap impl_annotations;
  bool is_abstract = false;

  /**
   * Build a class and adopt its functions.
   * @throws InvalidClassError when a function extends a missing function
   *         or when `extends` chains form a cycle
   */
  [[nodiscard]] static ClassDefPtr create(
    std::string kind, std::vector<std::string> extends, std::vector<MixinImportStmtPtr> imports,
    FunctionMap queries, FunctionMap actions, NLAnnotationMap nl_annotations = {},
    AnnotationMap impl_annotations = {}, bool is_abstract = false, SourceRange r = {});

  ClassDef(
    Private, std::string k, std::vector<std::string> ext, std::vector<MixinImportStmtPtr> imps,
    FunctionMap qs, FunctionMap as, NLAnnotationMap nl, AnnotationMap impl, bool abstract,
    SourceRange r);

  /// Streams are monitored queries, so FunctionType::Stream looks up queries
  [[nodiscard]] FunctionDefPtr get_function(FunctionType type, const std::string & name) const;

  /// The import carrying the `loader` facet, if any
  [[nodiscard]] MixinImportStmtPtr loader() const;
  /// The import carrying the `config` facet, if any
  [[nodiscard]] MixinImportStmtPtr config() const;

  /// #_[canonical], else the cleaned kind
  [[nodiscard]] std::string canonical() const;
  /// #[version], 0 when absent
  [[nodiscard]] int version() const;

  [[nodiscard]] std::optional<nlohmann::json> get_implementation_annotation(
    const std::string & key) const;
  [[nodiscard]] const nlohmann::json * get_natural_language_annotation(
    const std::string & key) const;

  /// Deep copy; the functions of the copy resolve `extends` against the copy
  [[nodiscard]] ClassDefPtr clone() const;
};

}  // namespace thingtalk
