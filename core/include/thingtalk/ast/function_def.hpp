// thingtalk/ast/function_def.hpp - Arguments, signatures and function definitions
//
// An ExpressionSignature is the functional type of a table, stream or
// action: an ordered list of flattened arguments plus the qualifiers that
// drive type checking. FunctionDef adds a name and annotations, and is owned
// by a ClassDef through which inherited (`extends`) arguments are resolved.
//
#pragma once

#include <functional>
#include <gsl/span>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "thingtalk/ast/node.hpp"
#include "thingtalk/type/type.hpp"

namespace thingtalk
{

/// Translatable annotations (#_[canonical], #_[confirmation], ...)
using NLAnnotationMap = std::map<std::string, nlohmann::json>;

/// Implementation annotations (#[poll_interval], #[url], ...)
using AnnotationMap = std::map<std::string, ValuePtr>;

/// Deep copy of implementation annotations
[[nodiscard]] AnnotationMap clone_annotations(const AnnotationMap & annotations);

[[nodiscard]] bool annotations_equal(const AnnotationMap & a, const AnnotationMap & b);

// ============================================================================
// ArgumentDef
// ============================================================================

/**
 * A function argument, or a field of a compound type.
 *
 * When the argument has a direction and a Compound type, the fields of the
 * compound (and of nested compounds) take over its direction.
 */
class ArgumentDef
{
public:
  SourceRange range_;
  ArgDirection direction;
  std::string name;
  TypePtr type;
  NLAnnotationMap nl_annotations;
  AnnotationMap impl_annotations;

  bool is_input;
  bool required;
  /// #[unique=true]: the argument identifies a single result
  bool unique;

  ArgumentDef(
    ArgDirection dir, std::string n, TypePtr t, NLAnnotationMap nl = {}, AnnotationMap impl = {},
    SourceRange r = {});

  /**
   * Display label: the #_[canonical] annotation (a string, or the first
   * `base`, `property` or `npp` form), else derived from the name.
   */
  [[nodiscard]] std::string canonical() const;

  /// JSON form of an implementation annotation, if present
  [[nodiscard]] std::optional<nlohmann::json> get_implementation_annotation(
    const std::string & key) const;

  [[nodiscard]] const nlohmann::json * get_natural_language_annotation(
    const std::string & key) const;

  [[nodiscard]] ArgumentDefPtr clone() const;

  /// A copy renamed and re-directed, used when hoisting compound fields
  [[nodiscard]] ArgumentDefPtr as_field(std::string new_name, ArgDirection dir) const;

  [[nodiscard]] bool equals(const ArgumentDef & other) const;
};

// ============================================================================
// ExpressionSignature
// ============================================================================

/// `list` / `monitorable` qualifiers of a function
struct FunctionQualifiers
{
  bool is_list = false;
  bool is_monitorable = false;
};

/**
 * The signature (functional type) of a table, stream or action.
 *
 * Lookups resolve local arguments first, then each function named in
 * `extends`, in declaration order, through the owning class. The first
 * parent that has the argument wins. A signature with `extends` that is
 * not attached to a class throws ResolutionError on such lookups.
 */
class ExpressionSignature
{
public:
  bool is_list = false;
  bool is_monitorable = false;
  bool require_filter = false;
  std::vector<std::string> default_projection;
  /// std::nullopt until set explicitly or defaulted on class attachment
  std::optional<std::vector<std::string>> minimal_projection;
  bool no_filter = false;

  ExpressionSignature(
    FunctionType function_type, std::vector<std::string> extends,
    std::vector<ArgumentDefPtr> args, FunctionQualifiers qualifiers = {}, SourceRange r = {});

  virtual ~ExpressionSignature() = default;

  ExpressionSignature(const ExpressionSignature &) = delete;
  ExpressionSignature & operator=(const ExpressionSignature &) = delete;

  [[nodiscard]] FunctionType function_type() const noexcept { return function_type_; }
  [[nodiscard]] const std::vector<std::string> & extends() const noexcept { return extends_; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

  /// Names of the local (flattened) arguments, in declaration order
  [[nodiscard]] std::vector<std::string> args() const;
  [[nodiscard]] const std::vector<ArgumentDefPtr> & local_arguments() const noexcept
  {
    return args_;
  }

  /// The owning class, or null when detached
  [[nodiscard]] std::shared_ptr<const ClassDef> get_class() const { return class_.lock(); }

  // ===========================================================================
  // Argument lookup (inheritance aware)
  // ===========================================================================

  [[nodiscard]] bool has_argument(const std::string & name) const;
  [[nodiscard]] ArgumentDefPtr get_argument(const std::string & name) const;
  [[nodiscard]] TypePtr get_arg_type(const std::string & name) const;
  [[nodiscard]] std::optional<std::string> get_arg_canonical(const std::string & name) const;
  [[nodiscard]] const NLAnnotationMap * get_arg_metadata(const std::string & name) const;
  [[nodiscard]] std::optional<bool> is_arg_input(const std::string & name) const;
  [[nodiscard]] std::optional<bool> is_arg_required(const std::string & name) const;

  /// All arguments, local first then inherited, each name once
  [[nodiscard]] std::vector<ArgumentDefPtr> iterate_arguments() const;

  [[nodiscard]] std::map<std::string, TypePtr> in_req() const;
  [[nodiscard]] std::map<std::string, TypePtr> in_opt() const;
  [[nodiscard]] std::map<std::string, TypePtr> out() const;

  [[nodiscard]] bool has_any_input_arg() const;
  [[nodiscard]] bool has_any_output_arg() const;

  // ===========================================================================
  // Derived signatures
  // ===========================================================================

  [[nodiscard]] virtual ExpressionSignaturePtr clone() const;

  [[nodiscard]] ExpressionSignaturePtr add_arguments(gsl::span<const ArgumentDefPtr> to_add) const;

  /// Returns a copy without `name`; inherited arguments are flattened in
  [[nodiscard]] ExpressionSignaturePtr remove_argument(const std::string & name) const;

  [[nodiscard]] ExpressionSignaturePtr filter_arguments(
    const std::function<bool(const ArgumentDef &)> & filter) const;

  /// Same signature with a different function type
  [[nodiscard]] ExpressionSignaturePtr as_type(FunctionType type) const;

  virtual void remove_default_projection();
  virtual void remove_minimal_projection();

  /**
   * Attach to (or detach from) the class that owns this signature.
   * The class is held weakly; clones made afterwards hold it strongly.
   */
  virtual void set_class(const std::shared_ptr<const ClassDef> & klass);

protected:
  /// Build a signature of the same dynamic type over `args`
  [[nodiscard]] virtual ExpressionSignaturePtr clone_internal(
    std::vector<ArgumentDefPtr> args, bool flattened) const;

  /// Copy qualifiers and projections onto a freshly built signature
  void copy_qualifiers_to(ExpressionSignature & clone) const;

  /// Whether `extends` parents contribute arguments
  [[nodiscard]] virtual bool inherits_arguments() const { return true; }

  /// Parent function named `name`, through the owning class
  [[nodiscard]] std::shared_ptr<const FunctionDef> resolve_parent(const std::string & name) const;

  [[nodiscard]] std::vector<std::shared_ptr<const FunctionDef>> parents() const;

  FunctionType function_type_;
  std::vector<std::string> extends_;
  std::vector<ArgumentDefPtr> args_;
  std::map<std::string, ArgumentDefPtr> argmap_;
  std::weak_ptr<const ClassDef> class_;
  /// Keeps the class alive for copies that the class does not own
  std::shared_ptr<const ClassDef> pinned_class_;
  SourceRange range_;

private:
  void iterate_arguments_into(
    std::vector<ArgumentDefPtr> & out, std::set<std::string> & seen) const;
};

// ============================================================================
// FunctionDef
// ============================================================================

/**
 * A named function of a class.
 *
 * Reads `require_filter`, `default_projection` and `minimal_projection`
 * from its implementation annotations. When no `minimal_projection` is
 * annotated, it defaults to `["id"]` if the function has an output `id`
 * argument, and `[]` otherwise; the default is computed when the function
 * is attached to its class, because `id` may be inherited.
 */
class FunctionDef : public ExpressionSignature
{
public:
  FunctionDef(
    FunctionType function_type, std::string name, std::vector<std::string> extends,
    FunctionQualifiers qualifiers, std::vector<ArgumentDefPtr> args,
    NLAnnotationMap nl_annotations = {}, AnnotationMap impl_annotations = {},
    SourceRange r = {});

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  /// `<class kind>.<name>`, or `.<name>` when detached
  [[nodiscard]] const std::string & qualified_name() const noexcept { return qualified_name_; }

  [[nodiscard]] const NLAnnotationMap & nl_annotations() const noexcept { return nl_annotations_; }
  [[nodiscard]] const AnnotationMap & impl_annotations() const noexcept
  {
    return impl_annotations_;
  }

  [[nodiscard]] std::optional<nlohmann::json> get_implementation_annotation(
    const std::string & key) const;
  [[nodiscard]] const nlohmann::json * get_natural_language_annotation(
    const std::string & key) const;

  [[nodiscard]] std::optional<std::string> canonical() const;
  [[nodiscard]] std::optional<std::string> confirmation() const;

  /// Polling interval in milliseconds, for monitorable queries
  [[nodiscard]] std::optional<double> poll_interval() const;

  /// This function followed by its ancestors, depth first
  [[nodiscard]] std::vector<std::string> iterate_base_functions() const;

  [[nodiscard]] ExpressionSignaturePtr clone() const override;
  [[nodiscard]] FunctionDefPtr clone_function() const;

  void set_class(const std::shared_ptr<const ClassDef> & klass) override;

  void remove_default_projection() override;
  void remove_minimal_projection() override;

  [[nodiscard]] bool equals(const FunctionDef & other) const;

protected:
  [[nodiscard]] ExpressionSignaturePtr clone_internal(
    std::vector<ArgumentDefPtr> args, bool flattened) const override;

  [[nodiscard]] bool inherits_arguments() const override;

private:
  void set_minimal_projection();

  std::string name_;
  std::string qualified_name_;
  NLAnnotationMap nl_annotations_;
  AnnotationMap impl_annotations_;
};

}  // namespace thingtalk
