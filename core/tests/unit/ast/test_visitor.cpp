// tests/unit/ast/test_visitor.cpp - Visitor dispatch and tree traversal
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "thingtalk/ast/visitor.hpp"

namespace thingtalk
{

namespace
{

InputParamPtr param(const std::string & name, ValuePtr value)
{
  return std::make_shared<InputParam>(name, std::move(value));
}

/// now => (@com.twitter.search(query="cats")) filter count >= 5 && author == author
///     => @com.twitter.post(status=text);
StatementPtr sample_command()
{
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<InvocationTable>(std::make_shared<Invocation>(
      std::make_shared<DeviceSelector>("com.twitter"), "search",
      std::vector<InputParamPtr>{param("query", std::make_shared<StringValue>("cats"))})),
    std::make_shared<AndBooleanExpression>(std::vector<BooleanExpressionPtr>{
      std::make_shared<AtomBooleanExpression>("count", ">=", std::make_shared<NumberValue>(5)),
      std::make_shared<AtomBooleanExpression>(
        "author", "==", std::make_shared<VarRefValue>("author"))}));
  auto action = std::make_shared<InvocationAction>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "post",
    std::vector<InputParamPtr>{param("status", std::make_shared<VarRefValue>("text"))}));
  return std::make_shared<Command>(table, std::vector<ActionPtr>{action});
}

class AtomCounter : public ConstRecursiveAstVisitor<AtomCounter>
{
public:
  int count = 0;

  bool visit_atom_boolean_expression(const AtomBooleanExpression *)
  {
    ++count;
    return true;
  }
};

class KindRecorder : public ConstRecursiveAstVisitor<KindRecorder>
{
public:
  std::vector<std::string> entered;
  int depth = 0;
  int max_depth = 0;

  void enter(const AstNode * node)
  {
    entered.emplace_back(to_string(node->get_kind()));
    max_depth = std::max(max_depth, ++depth);
  }
  void exit(const AstNode *) { --depth; }
};

/// Skips the query side of a command
class ParamCollector : public ConstRecursiveAstVisitor<ParamCollector>
{
public:
  std::vector<std::string> names;

  bool visit_input_param(const InputParam * node)
  {
    names.push_back(node->name);
    return true;
  }
  bool visit_table(const Table *) { return false; }
};

class Renamer : public RecursiveAstVisitor<Renamer>
{
public:
  bool visit_var_ref_value(VarRefValue * node)
  {
    node->name = "$" + node->name;
    return true;
  }
};

class FamilyName : public ConstAstVisitor<FamilyName, std::string>
{
public:
  std::string visit_value(const Value *) { return "value"; }
  std::string visit_table(const Table *) { return "table"; }
  std::string visit_command(const Command *) { return "command"; }
  std::string visit_node(const AstNode *) { return "other"; }
};

}  // namespace

TEST(VisitorTest, DispatchFallsBackToFamily)
{
  FamilyName visitor;
  const NumberValue number(1);
  const StringValue text("a");
  const auto command = sample_command();

  EXPECT_EQ(visitor.visit(&number), "value");
  EXPECT_EQ(visitor.visit(&text), "value");
  EXPECT_EQ(visitor.visit(cast<Command>(command.get())->table.get()), "table");
  EXPECT_EQ(visitor.visit(command.get()), "command");
  EXPECT_EQ(visitor.visit(BooleanExpression::true_expr().get()), "other");
  EXPECT_EQ(visitor.visit(nullptr), "");
}

TEST(VisitorTest, CountsNestedNodes)
{
  AtomCounter counter;
  counter.traverse(sample_command());
  EXPECT_EQ(counter.count, 2);
}

TEST(VisitorTest, EvaluationOrder)
{
  KindRecorder recorder;
  auto command = std::make_shared<Command>(
    std::make_shared<InvocationTable>(std::make_shared<Invocation>(
      std::make_shared<DeviceSelector>("com.twitter"), "search",
      std::vector<InputParamPtr>{param("query", std::make_shared<StringValue>("cats"))})),
    std::vector<ActionPtr>{Action::notify_action()});
  recorder.traverse(command);

  const std::vector<std::string> expected{
    "Command",    "InvocationTable",  "Invocation", "DeviceSelector", "InputParam",
    "StringValue", "InvocationAction", "Invocation", "BuiltinDevice"};
  EXPECT_EQ(recorder.entered, expected);
  EXPECT_EQ(recorder.depth, 0);
  EXPECT_EQ(recorder.max_depth, 5);
}

TEST(VisitorTest, ReturningFalsePrunesChildren)
{
  ParamCollector collector;
  collector.traverse(sample_command());
  EXPECT_EQ(collector.names, std::vector<std::string>{"status"});
}

TEST(VisitorTest, MutatingTraversal)
{
  auto command = sample_command();
  Renamer renamer;
  renamer.traverse(command);

  const auto * cmd = cast<Command>(command.get());
  const auto * action = cast<InvocationAction>(cmd->actions[0].get());
  EXPECT_EQ(cast<VarRefValue>(action->invocation->in_params[0]->value.get())->name, "$text");

  const auto * filter = cast<AndBooleanExpression>(cast<FilteredTable>(cmd->table.get())->filter.get());
  const auto * atom = cast<AtomBooleanExpression>(filter->operands[1].get());
  EXPECT_EQ(cast<VarRefValue>(atom->value.get())->name, "$author");
  // field names are not values
  EXPECT_EQ(atom->name, "author");
}

TEST(VisitorTest, ForEachChildSkipsMissingTable)
{
  const Command command(nullptr, {Action::notify_action()});
  std::vector<std::string> kinds;
  for_each_child(&command, [&kinds](AstNode * child) {
    kinds.emplace_back(to_string(child->get_kind()));
  });
  EXPECT_EQ(kinds, std::vector<std::string>{"InvocationAction"});
}

}  // namespace thingtalk
