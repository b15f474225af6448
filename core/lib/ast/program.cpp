// thingtalk/ast/program.cpp - Statements, programs and permission rules
#include "thingtalk/ast/program.hpp"

#include "thingtalk/basic/errors.hpp"

namespace thingtalk
{

namespace
{

void require_actions(const std::vector<ActionPtr> & actions, const char * what)
{
  for (const auto & a : actions) {
    detail::require_node(a, what);
  }
}

}  // namespace

Rule::Rule(StreamPtr s, std::vector<ActionPtr> a, SourceRange r)
: NodeBase(r), stream(detail::require_node(std::move(s), "Rule stream")), actions(std::move(a))
{
  require_actions(actions, "Rule action");
}

StatementPtr Rule::clone() const
{
  return std::make_shared<Rule>(stream->clone(), detail::clone_all(actions), range_);
}

Command::Command(TablePtr t, std::vector<ActionPtr> a, SourceRange r)
: NodeBase(r), table(std::move(t)), actions(std::move(a))
{
  require_actions(actions, "Command action");
}

StatementPtr Command::clone() const
{
  return std::make_shared<Command>(
    detail::clone_or_null(table), detail::clone_all(actions), range_);
}

Assignment::Assignment(std::string n, TablePtr v, ExpressionSignaturePtr s, SourceRange r)
: NodeBase(r),
  name(std::move(n)),
  value(detail::require_node(std::move(v), "Assignment value")),
  schema(std::move(s))
{
}

StatementPtr Assignment::clone() const
{
  return std::make_shared<Assignment>(name, value->clone(), detail::clone_schema(schema), range_);
}

Program::Program(
  std::vector<ClassDefPtr> c, std::vector<StatementPtr> s, ValuePtr p, SourceRange r)
: NodeBase(r), classes(std::move(c)), statements(std::move(s)), principal(std::move(p))
{
  for (const auto & klass : classes) {
    detail::require_node(klass, "Program class");
  }
  for (const auto & stmt : statements) {
    detail::require_node(stmt, "Program statement");
  }
}

ProgramPtr Program::clone() const
{
  return std::make_shared<Program>(
    detail::clone_all(classes), detail::clone_all(statements), detail::clone_or_null(principal),
    range_);
}

PermissionRule::PermissionRule(
  BooleanExpressionPtr p, PermissionFunctionPtr q, PermissionFunctionPtr a, SourceRange r)
: NodeBase(r),
  principal(detail::require_node(std::move(p), "PermissionRule principal")),
  query(detail::require_node(std::move(q), "PermissionRule query")),
  action(detail::require_node(std::move(a), "PermissionRule action"))
{
}

PermissionRulePtr PermissionRule::clone() const
{
  return std::make_shared<PermissionRule>(
    principal->clone(), query->clone(), action->clone(), range_);
}

}  // namespace thingtalk
