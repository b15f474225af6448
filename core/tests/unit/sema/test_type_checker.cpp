// tests/unit/sema/test_type_checker.cpp - Unit tests for type checker
//
// Tests schema resolution through a MemorySchemaRetriever, the signatures
// computed for operators, and the diagnostics reported for invalid programs.
//

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "thingtalk/ast/slots.hpp"
#include "thingtalk/basic/diagnostic.hpp"
#include "thingtalk/sema/type_checker.hpp"
#include "thingtalk/test_support/sample_classes.hpp"

using namespace thingtalk;

namespace
{

InputParamPtr param(const std::string & name, ValuePtr value)
{
  return std::make_shared<InputParam>(name, std::move(value));
}

InvocationPtr twitter_call(const std::string & channel, std::vector<InputParamPtr> params = {})
{
  return std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), channel, std::move(params));
}

TablePtr twitter_table(const std::string & channel, std::vector<InputParamPtr> params = {})
{
  return std::make_shared<InvocationTable>(twitter_call(channel, std::move(params)));
}

ActionPtr post(ValuePtr status)
{
  return std::make_shared<InvocationAction>(
    twitter_call("post", {param("status", std::move(status))}));
}

ProgramPtr command_program(TablePtr table, ActionPtr action = Action::notify_action())
{
  std::vector<StatementPtr> statements{
    std::make_shared<Command>(std::move(table), std::vector<ActionPtr>{std::move(action)})};
  return std::make_shared<Program>(std::vector<ClassDefPtr>{}, std::move(statements));
}

}  // namespace

// Helper holding the schemas, diagnostics and checker of one test
struct TestContext
{
  MemorySchemaRetriever schemas;
  DiagnosticBag diags;
  TypeChecker checker{schemas, &diags};

  TestContext()
  {
    schemas.add_class(test_support::twitter_class());
    schemas.add_class(test_support::media_class());
    schemas.add_class(test_support::ledger_class());
  }

  [[nodiscard]] bool has_code(std::string_view code) const { return diags.has_code(code); }
};

// ============================================================================
// Schema resolution
// ============================================================================

TEST(TypeCheckerTest, ResolvesInvocationSchema)
{
  TestContext ctx;
  auto table = twitter_table("search", {param("query", std::make_shared<StringValue>("cats"))});
  auto program = command_program(table);

  EXPECT_TRUE(ctx.checker.check(*program));
  EXPECT_TRUE(ctx.diags.empty());

  auto * invocation = cast<InvocationTable>(table.get())->invocation.get();
  ASSERT_NE(invocation->schema, nullptr);
  EXPECT_EQ(invocation->schema->qualified_name(), "com.twitter.search");
  ASSERT_NE(table->schema, nullptr);
  EXPECT_TRUE(table->schema->has_argument("text"));
}

TEST(TypeCheckerTest, UnknownClass)
{
  TestContext ctx;
  auto table = std::make_shared<InvocationTable>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.nope"), "search", std::vector<InputParamPtr>{}));

  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T001"));
  EXPECT_EQ(table->schema, nullptr);
}

TEST(TypeCheckerTest, UnknownFunction)
{
  TestContext ctx;
  auto table = twitter_table("lookup");

  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T001"));
  EXPECT_EQ(ctx.checker.error_count(), 1u);
}

TEST(TypeCheckerTest, InlineClassTakesPrecedence)
{
  TestContext ctx;
  ClassDef::FunctionMap queries;
  queries["lookup"] = test_support::make_query(
    "lookup", {test_support::out("text", Type::string())});
  auto local = ClassDef::create("com.twitter", {}, {}, std::move(queries), {});

  auto program = command_program(twitter_table("lookup"));
  program->classes.push_back(local);
  EXPECT_TRUE(ctx.checker.check(*program));
}

// ============================================================================
// Input parameters
// ============================================================================

TEST(TypeCheckerTest, UnknownParameter)
{
  TestContext ctx;
  auto table = twitter_table(
    "search", {param("query", std::make_shared<StringValue>("cats")),
               param("language", std::make_shared<StringValue>("en"))});
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T002"));
}

TEST(TypeCheckerTest, OutputUsedAsParameter)
{
  TestContext ctx;
  auto table = twitter_table(
    "search", {param("query", std::make_shared<StringValue>("cats")),
               param("text", std::make_shared<StringValue>("dogs"))});
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T003"));
}

TEST(TypeCheckerTest, ParameterOfWrongType)
{
  TestContext ctx;
  auto table = twitter_table("search", {param("query", std::make_shared<NumberValue>(3))});
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T004"));
}

TEST(TypeCheckerTest, DuplicateParameter)
{
  TestContext ctx;
  auto table = twitter_table(
    "search", {param("query", std::make_shared<StringValue>("cats")),
               param("query", std::make_shared<StringValue>("dogs"))});
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T005"));
}

TEST(TypeCheckerTest, MissingRequiredInputIsFilledWithUndefined)
{
  TestContext ctx;
  auto table = twitter_table("search");

  EXPECT_TRUE(ctx.checker.check_table(*table));
  const auto & params = cast<InvocationTable>(table.get())->invocation->in_params;
  ASSERT_EQ(params.size(), 1u);
  EXPECT_EQ(params[0]->name, "query");
  EXPECT_TRUE(params[0]->value->is_undefined());
}

TEST(TypeCheckerTest, OptionalInputIsNotFilled)
{
  TestContext ctx;
  auto table = std::make_shared<InvocationTable>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("org.example.media"), "movie", std::vector<InputParamPtr>{}));

  EXPECT_TRUE(ctx.checker.check_table(*table));
  EXPECT_TRUE(cast<InvocationTable>(table.get())->invocation->in_params.empty());
  // inherited outputs are visible
  EXPECT_TRUE(table->schema->has_argument("title"));
  EXPECT_TRUE(table->schema->has_argument("duration"));
}

TEST(TypeCheckerTest, CheckedProgramOutlivesItsClasses)
{
  TestContext ctx;
  auto movie = std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("org.example.media"), "movie", std::vector<InputParamPtr>{});
  auto program = command_program(
    std::make_shared<InvocationTable>(movie), post(std::make_shared<VarRefValue>("title")));
  ASSERT_TRUE(ctx.checker.check(*program));

  // the registry drops the only other reference to the media class
  ctx.schemas.add_class(ClassDef::create("org.example.media", {}, {}, {}, {}));

  ASSERT_NE(movie->schema, nullptr);
  EXPECT_EQ(movie->schema->out().count("duration"), 1u);

  const auto slots = value_slots(iterate_slots(*program));
  ASSERT_EQ(slots.size(), 1u);
  EXPECT_EQ(slots[0]->tag(), "in_param.status");
  EXPECT_EQ(slots[0]->scope().count("duration"), 1u);
  EXPECT_EQ(slots[0]->scope().count("title"), 1u);
}

// ============================================================================
// Filters
// ============================================================================

TEST(TypeCheckerTest, FilterRecordsOverload)
{
  TestContext ctx;
  auto atom =
    std::make_shared<AtomBooleanExpression>("count", ">=", std::make_shared<NumberValue>(5));
  auto table = std::make_shared<FilteredTable>(twitter_table("search"), atom);

  EXPECT_TRUE(ctx.checker.check_table(*table));
  ASSERT_EQ(atom->overload.size(), 3u);
  EXPECT_TRUE(atom->overload[2]->equals(*Type::boolean()));
}

TEST(TypeCheckerTest, FilterOnUnknownField)
{
  TestContext ctx;
  auto table = std::make_shared<FilteredTable>(
    twitter_table("search"),
    std::make_shared<AtomBooleanExpression>("likes", ">=", std::make_shared<NumberValue>(5)));
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T006"));
}

TEST(TypeCheckerTest, FilterWithInvalidOperands)
{
  TestContext ctx;
  auto table = std::make_shared<FilteredTable>(
    twitter_table("search"),
    std::make_shared<AtomBooleanExpression>("count", "=~", std::make_shared<StringValue>("5")));
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T007"));
}

TEST(TypeCheckerTest, RequiredFilter)
{
  TestContext ctx;
  auto entries = [] {
    return std::make_shared<InvocationTable>(std::make_shared<Invocation>(
      std::make_shared<DeviceSelector>("org.example.ledger"), "entries",
      std::vector<InputParamPtr>{}));
  };

  auto bare = entries();
  EXPECT_FALSE(ctx.checker.check_table(*bare));
  EXPECT_TRUE(ctx.has_code("T008"));

  TestContext filtered_ctx;
  auto filtered = std::make_shared<FilteredTable>(
    entries(),
    std::make_shared<AtomBooleanExpression>("id", "==", std::make_shared<StringValue>("tx1")));
  EXPECT_TRUE(filtered_ctx.checker.check_table(*filtered));
}

TEST(TypeCheckerTest, OverloadResolution)
{
  const auto hashtags = Type::array(Type::entity("tt:hashtag"));
  EXPECT_EQ(resolve_filter_overload("contains", hashtags, Type::entity("tt:hashtag")).size(), 3u);
  EXPECT_TRUE(resolve_filter_overload("contains", hashtags, Type::number()).empty());
  EXPECT_TRUE(resolve_filter_overload("=~", Type::number(), Type::string()).empty());
  EXPECT_EQ(resolve_filter_overload("=~", Type::string(), Type::string()).size(), 3u);
  EXPECT_TRUE(resolve_filter_overload("no_such_op", Type::string(), Type::string()).empty());
}

// ============================================================================
// Operators
// ============================================================================

TEST(TypeCheckerTest, ProjectionKeepsSelectedOutputs)
{
  TestContext ctx;
  auto table =
    std::make_shared<ProjectionTable>(twitter_table("search"), std::vector<std::string>{"text"});

  EXPECT_TRUE(ctx.checker.check_table(*table));
  ASSERT_NE(table->schema, nullptr);
  EXPECT_TRUE(table->schema->has_argument("text"));
  EXPECT_TRUE(table->schema->has_argument("query"));
  EXPECT_FALSE(table->schema->has_argument("author"));
}

TEST(TypeCheckerTest, ProjectionOfUnknownField)
{
  TestContext ctx;
  auto table =
    std::make_shared<ProjectionTable>(twitter_table("search"), std::vector<std::string>{"likes"});
  EXPECT_FALSE(ctx.checker.check_table(*table));
  EXPECT_TRUE(ctx.has_code("T009"));
}

TEST(TypeCheckerTest, Aggregation)
{
  TestContext ctx;
  auto count = std::make_shared<AggregationTable>(twitter_table("search"), "*", "count");
  EXPECT_TRUE(ctx.checker.check_table(*count));
  ASSERT_NE(count->schema, nullptr);
  EXPECT_TRUE(count->schema->get_arg_type("count")->equals(*Type::number()));
  EXPECT_FALSE(count->schema->is_list);

  auto average = std::make_shared<AggregationTable>(twitter_table("search"), "text", "avg");
  EXPECT_FALSE(ctx.checker.check_table(*average));
  EXPECT_TRUE(ctx.has_code("T010"));
}

TEST(TypeCheckerTest, IndexOfOneElementIsNotAList)
{
  TestContext ctx;
  auto table = std::make_shared<IndexTable>(
    twitter_table("search"), std::vector<ValuePtr>{std::make_shared<NumberValue>(1)});
  EXPECT_TRUE(ctx.checker.check_table(*table));
  ASSERT_NE(table->schema, nullptr);
  EXPECT_FALSE(table->schema->is_list);

  auto bad = std::make_shared<IndexTable>(
    twitter_table("search"), std::vector<ValuePtr>{std::make_shared<StringValue>("first")});
  EXPECT_FALSE(ctx.checker.check_table(*bad));
  EXPECT_TRUE(ctx.has_code("T012"));
}

TEST(TypeCheckerTest, JoinAddsUnboundOutputsOfTheRightSide)
{
  TestContext ctx;
  auto join = std::make_shared<JoinTable>(
    twitter_table("home_timeline"), twitter_table("search"),
    std::vector<InputParamPtr>{param("query", std::make_shared<VarRefValue>("text"))});

  EXPECT_TRUE(ctx.checker.check_table(*join));
  ASSERT_NE(join->schema, nullptr);
  EXPECT_TRUE(join->schema->has_argument("hashtags"));
  EXPECT_TRUE(join->schema->has_argument("count"));
  EXPECT_FALSE(join->schema->has_argument("query"));
}

TEST(TypeCheckerTest, Declarations)
{
  TestContext ctx;
  std::vector<StatementPtr> statements{
    std::make_shared<Assignment>("timeline", twitter_table("home_timeline")),
    std::make_shared<Command>(
      std::make_shared<VarRefTable>("timeline", std::vector<InputParamPtr>{}),
      std::vector<ActionPtr>{Action::notify_action()})};
  Program program({}, std::move(statements));

  EXPECT_TRUE(ctx.checker.check(program));

  auto unknown = command_program(std::make_shared<VarRefTable>("mentions", std::vector<InputParamPtr>{}));
  EXPECT_FALSE(ctx.checker.check(*unknown));
  EXPECT_TRUE(ctx.has_code("T011"));
}

// ============================================================================
// Streams and actions
// ============================================================================

TEST(TypeCheckerTest, MonitorProducesStream)
{
  TestContext ctx;
  auto stream = std::make_shared<MonitorStream>(twitter_table("home_timeline"));
  EXPECT_TRUE(ctx.checker.check_stream(*stream));
  ASSERT_NE(stream->schema, nullptr);
  EXPECT_EQ(stream->schema->function_type(), FunctionType::Stream);
}

TEST(TypeCheckerTest, MonitorOfNonMonitorableQuery)
{
  TestContext ctx;
  auto stream = std::make_shared<MonitorStream>(twitter_table("profile"));
  EXPECT_FALSE(ctx.checker.check_stream(*stream));
  EXPECT_TRUE(ctx.has_code("T013"));
}

TEST(TypeCheckerTest, TimerArguments)
{
  TestContext ctx;
  auto ok = std::make_shared<TimerStream>(
    std::make_shared<DateValue>(), std::make_shared<MeasureValue>(1, "h"));
  EXPECT_TRUE(ctx.checker.check_stream(*ok));

  auto bad = std::make_shared<TimerStream>(
    std::make_shared<DateValue>(), std::make_shared<NumberValue>(60));
  EXPECT_FALSE(ctx.checker.check_stream(*bad));
  EXPECT_TRUE(ctx.has_code("T012"));
}

TEST(TypeCheckerTest, ActionUsesOutputsOfTheRule)
{
  TestContext ctx;
  auto action = post(std::make_shared<VarRefValue>("text"));
  std::vector<StatementPtr> statements{std::make_shared<Rule>(
    std::make_shared<MonitorStream>(twitter_table("home_timeline")),
    std::vector<ActionPtr>{action})};
  Program program({}, std::move(statements));

  EXPECT_TRUE(ctx.checker.check(program));
  ASSERT_NE(action->schema, nullptr);
  // bound inputs are no longer part of the action signature
  EXPECT_FALSE(action->schema->has_argument("status"));
}

TEST(TypeCheckerTest, ActionWithVariableOutOfScope)
{
  TestContext ctx;
  auto program = command_program(nullptr, post(std::make_shared<VarRefValue>("text")));
  EXPECT_FALSE(ctx.checker.check(*program));
  EXPECT_TRUE(ctx.has_code("T011"));
}

TEST(TypeCheckerTest, UnknownBuiltinAction)
{
  TestContext ctx;
  auto action = std::make_shared<InvocationAction>(std::make_shared<Invocation>(
    BuiltinDevice::instance(), "explode", std::vector<InputParamPtr>{}));
  EXPECT_FALSE(ctx.checker.check_action(*action));
  EXPECT_TRUE(ctx.has_code("T001"));
}

// ============================================================================
// Principals and permissions
// ============================================================================

TEST(TypeCheckerTest, ProgramPrincipal)
{
  TestContext ctx;
  auto program = command_program(nullptr);
  program->principal = std::make_shared<EntityValue>("bob", "tt:username");
  EXPECT_TRUE(ctx.checker.check(*program));

  program->principal = std::make_shared<NumberValue>(42);
  EXPECT_FALSE(ctx.checker.check(*program));
  EXPECT_TRUE(ctx.has_code("T014"));
}

TEST(TypeCheckerTest, PermissionRule)
{
  TestContext ctx;
  PermissionRule rule(
    std::make_shared<AtomBooleanExpression>(
      "source", "==", std::make_shared<EntityValue>("bob", "tt:contact")),
    std::make_shared<SpecifiedPermissionFunction>(
      "com.twitter", "search",
      std::make_shared<AtomBooleanExpression>(
        "text", "=~", std::make_shared<StringValue>("cat"))),
    std::make_shared<SpecifiedPermissionFunction>(
      "com.twitter", "post",
      std::make_shared<AtomBooleanExpression>(
        "status", "==", std::make_shared<VarRefValue>("text"))));

  EXPECT_TRUE(ctx.checker.check(rule));
  EXPECT_TRUE(ctx.diags.empty());
}

TEST(TypeCheckerTest, PermissionOnUnknownClass)
{
  TestContext ctx;
  PermissionRule rule(
    BooleanExpression::true_expr(), PermissionFunction::builtin(),
    std::make_shared<ClassStarPermissionFunction>("com.nope"));
  EXPECT_FALSE(ctx.checker.check(rule));
  EXPECT_TRUE(ctx.has_code("T001"));
}
