// thingtalk/sema/type_checker.hpp - Schema resolution and type checking
//
// Resolves the signature of every primitive of a program through a
// SchemaRetriever, computes the signature of every operator, and checks
// parameters and filters against them. Errors go to a DiagnosticBag; the
// checker keeps going after an error so that all problems are reported,
// and leaves the schema of a node it could not resolve null.
//
// Diagnostic codes:
//   T001 unknown class or function
//   T002 unknown parameter
//   T003 parameter is not an input
//   T004 value not assignable to parameter
//   T005 duplicate parameter
//   T006 unknown filter field
//   T007 invalid operator or operand types
//   T008 missing required filter
//   T009 unknown field in projection, sort, aggregation or monitor
//   T010 invalid sort or aggregation field type
//   T011 unknown variable
//   T012 invalid index, slice, timer or history argument
//   T013 query is not monitorable
//   T014 invalid principal
//   T015 invalid scalar expression
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "thingtalk/ast/program.hpp"
#include "thingtalk/basic/diagnostic.hpp"
#include "thingtalk/sema/schema_retriever.hpp"

namespace thingtalk
{

struct TypeCheckOptions
{
  /// Accept a String where an Entity is expected and vice versa
  bool lenient_entities = true;
};

/**
 * Type checker for programs and permission rules.
 *
 * ## Usage
 * ```cpp
 * MemorySchemaRetriever schemas;
 * schemas.add_class(klass);
 * DiagnosticBag diags;
 * TypeChecker checker(schemas, &diags);
 * bool ok = checker.check(*program);
 * ```
 *
 * A checker holds the names declared by the statements it has seen, so use
 * one checker per program.
 */
class TypeChecker
{
public:
  /// Names available for parameter passing, with their types
  using Scope = std::map<std::string, TypePtr>;

  TypeChecker(
    SchemaRetriever & schemas, DiagnosticBag * diags = nullptr, TypeCheckOptions options = {});

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /// Check a whole program; classes declared inline take precedence
  bool check(Program & program);

  bool check(PermissionRule & rule);

  /// Check a table; its outputs are added to nothing
  bool check_table(Table & table, const Scope & scope = {});
  bool check_stream(Stream & stream, const Scope & scope = {});
  bool check_action(Action & action, const Scope & scope = {});

  /// Check a filter against the signature it applies to
  bool check_filter(BooleanExpression & filter, const ExpressionSignature & schema,
    const Scope & scope = {});

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  // ===========================================================================
  // Schema resolution
  // ===========================================================================

  FunctionDefPtr resolve_function(
    const std::string & kind, FunctionType type, const std::string & name, SourceRange range);

  FunctionDefPtr resolve_invocation(Invocation & invocation, FunctionType type);

  // ===========================================================================
  // Operators
  // ===========================================================================

  void visit_table(Table & table, const Scope & scope, bool filtered);
  void visit_stream(Stream & stream, const Scope & scope, bool filtered);
  void visit_action(Action & action, const Scope & scope);
  void visit_filter(
    BooleanExpression & filter, const ExpressionSignature & schema, const Scope & scope);
  void visit_statement(Statement & statement);
  void visit_permission(PermissionFunction & fn, FunctionType type, const Scope & scope);

  /// Type of a scalar expression, or null after reporting an error
  TypePtr visit_scalar(
    ScalarExpression & expr, const ExpressionSignature & schema, const Scope & scope);

  /// The signature produced by a compute operator
  ExpressionSignaturePtr compute_schema(
    const ExpressionSignaturePtr & inner, ScalarExpression & expr,
    const std::optional<std::string> & alias, const Scope & scope);

  ExpressionSignaturePtr projection_schema(
    const ExpressionSignaturePtr & inner, const std::vector<std::string> & args,
    SourceRange range);

  ExpressionSignaturePtr join_schema(
    const ExpressionSignaturePtr & lhs, const ExpressionSignaturePtr & rhs,
    std::vector<InputParamPtr> & in_params, const Scope & scope);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  /**
   * Check input parameters against a function signature. With
   * `fill_required`, append Undefined values for the missing required ones.
   */
  void check_input_params(
    std::vector<InputParamPtr> & in_params, const ExpressionSignature & schema,
    const Scope & scope, bool fill_required);

  /// Type of a value in a signature and scope, or null for unknown references
  TypePtr type_for_value(
    const Value & value, const ExpressionSignature * schema, const Scope & scope);

  /// Report `code` unless `value` (when present) is assignable to `expected`
  void expect_value(const ValuePtr & value, const TypePtr & expected, std::string_view what,
    const Scope & scope, std::string_view code);

  void check_field(const ExpressionSignature & schema, const std::string & field, SourceRange range,
    std::string_view context);

  /// Output arguments of a signature, added on top of `scope`
  [[nodiscard]] static Scope extend_scope(const Scope & scope, const ExpressionSignature * schema);

  void report_error(SourceRange range, std::string_view code, std::string message);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  SchemaRetriever & schemas_;
  DiagnosticBag * diags_;
  TypeCheckOptions options_;

  /// Classes declared by the program being checked
  std::map<std::string, ClassDefPtr> local_classes_;
  /// Result signatures of `let` statements
  std::map<std::string, ExpressionSignaturePtr> declarations_;

  size_t error_count_ = 0;
};

/**
 * Operand types of a filter operator applied to a field of type `lhs` and a
 * value of type `rhs`, followed by the result type (Boolean). Empty when no
 * overload applies.
 */
[[nodiscard]] std::vector<TypePtr> resolve_filter_overload(
  std::string_view op, const TypePtr & lhs, const TypePtr & rhs, bool lenient = true);

}  // namespace thingtalk
