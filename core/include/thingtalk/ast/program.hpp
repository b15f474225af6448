// thingtalk/ast/program.hpp - Statements, programs and permission rules
#pragma once

#include <string>
#include <vector>

#include "thingtalk/ast/class_def.hpp"
#include "thingtalk/ast/primitive.hpp"

namespace thingtalk
{

// ============================================================================
// Statements
// ============================================================================

class Statement : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

  [[nodiscard]] virtual StatementPtr clone() const = 0;

protected:
  Statement(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/// `stream => action, action;`
class Rule : public NodeBase<Rule, Statement, NodeKind::Rule>
{
public:
  StreamPtr stream;
  std::vector<ActionPtr> actions;

  Rule(StreamPtr s, std::vector<ActionPtr> a, SourceRange r = {});

  [[nodiscard]] StatementPtr clone() const override;
};

/// `now => table => action;` or `now => action;` when `table` is null
class Command : public NodeBase<Command, Statement, NodeKind::Command>
{
public:
  TablePtr table;
  std::vector<ActionPtr> actions;

  Command(TablePtr t, std::vector<ActionPtr> a, SourceRange r = {});

  [[nodiscard]] StatementPtr clone() const override;
};

/// `let result name := table;`
class Assignment : public NodeBase<Assignment, Statement, NodeKind::Assignment>
{
public:
  std::string name;
  TablePtr value;
  /// Output signature of `value`, null until type checking
  ExpressionSignaturePtr schema;

  Assignment(std::string n, TablePtr v, ExpressionSignaturePtr s = nullptr, SourceRange r = {});

  [[nodiscard]] StatementPtr clone() const override;
};

// ============================================================================
// Program
// ============================================================================

/**
 * A complete program: inline class declarations followed by statements.
 * `principal` names the user a program is sent to, when it runs remotely.
 */
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  std::vector<ClassDefPtr> classes;
  std::vector<StatementPtr> statements;
  ValuePtr principal;  ///< optional

  Program(
    std::vector<ClassDefPtr> c, std::vector<StatementPtr> s, ValuePtr p = nullptr,
    SourceRange r = {});

  [[nodiscard]] ProgramPtr clone() const;
};

using PermissionRulePtr = std::shared_ptr<PermissionRule>;

/// `principal_filter : query => action;`
class PermissionRule : public NodeBase<PermissionRule, AstNode, NodeKind::PermissionRule>
{
public:
  BooleanExpressionPtr principal;
  PermissionFunctionPtr query;
  PermissionFunctionPtr action;

  PermissionRule(
    BooleanExpressionPtr p, PermissionFunctionPtr q, PermissionFunctionPtr a, SourceRange r = {});

  [[nodiscard]] PermissionRulePtr clone() const;
};

}  // namespace thingtalk
