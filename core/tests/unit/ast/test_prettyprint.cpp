// tests/unit/ast/test_prettyprint.cpp - Surface syntax emission
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "thingtalk/ast/prettyprint.hpp"
#include "thingtalk/test_support/sample_classes.hpp"

namespace thingtalk
{

namespace
{

InputParamPtr param(const std::string & name, ValuePtr value)
{
  return std::make_shared<InputParam>(name, std::move(value));
}

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ============================================================================
// Values
// ============================================================================

TEST(PrettyprintTest, ScalarValues)
{
  EXPECT_EQ(to_source(BooleanValue(true)), "true");
  EXPECT_EQ(to_source(StringValue("say \"hi\"")), R"("say \"hi\"")");
  EXPECT_EQ(to_source(MeasureValue(2.5, "km")), "2.5km");
  EXPECT_EQ(to_source(CurrencyValue(2.5, "usd")), "2.5$usd");
  EXPECT_EQ(to_source(EnumValue("on")), "enum on");
  EXPECT_EQ(to_source(UndefinedValue()), "$?");
  EXPECT_EQ(to_source(NullValue()), "null");
}

TEST(PrettyprintTest, EntityWithDisplay)
{
  EXPECT_EQ(to_source(EntityValue("bob", "tt:username")), R"("bob"^^tt:username)");
  EXPECT_EQ(
    to_source(EntityValue("Q60", "org.wikidata:city", "New York")),
    R"("Q60"^^org.wikidata:city("New York"))");
  EXPECT_EQ(to_source(EntityValue(std::nullopt, "tt:device")), "null^^tt:device");
}

TEST(PrettyprintTest, References)
{
  EXPECT_EQ(to_source(EventValue()), "$event");
  EXPECT_EQ(to_source(EventValue("program_id")), "$event.program_id");
  EXPECT_EQ(to_source(VarRefValue("text")), "text");
  EXPECT_EQ(to_source(LocationValue(RelativeLocation{"home"})), "$location.home");
  EXPECT_EQ(to_source(DateValue()), "$now");
}

TEST(PrettyprintTest, ArrayOfStrings)
{
  const ArrayValue value(std::vector<ValuePtr>{
    std::make_shared<StringValue>("a"), std::make_shared<StringValue>("b")});
  EXPECT_EQ(to_source(value), R"(["a", "b"])");
}

// ============================================================================
// Filters
// ============================================================================

TEST(PrettyprintTest, InfixAndCallAtoms)
{
  EXPECT_EQ(
    to_source(AtomBooleanExpression("count", ">=", std::make_shared<NumberValue>(2.5))),
    "count >= 2.5");
  EXPECT_EQ(
    to_source(AtomBooleanExpression(
      "hashtags", "contains", std::make_shared<EntityValue>("cats", "tt:hashtag"))),
    R"(contains(hashtags, "cats"^^tt:hashtag))");
}

TEST(PrettyprintTest, NestedConnectivesAreParenthesized)
{
  auto text = std::make_shared<AtomBooleanExpression>(
    "text", "=~", std::make_shared<StringValue>("cat"));
  auto author = std::make_shared<AtomBooleanExpression>(
    "author", "==", std::make_shared<EntityValue>("bob", "tt:username"));
  auto count =
    std::make_shared<AtomBooleanExpression>("count", ">=", std::make_shared<NumberValue>(2.5));

  auto either = std::make_shared<OrBooleanExpression>(std::vector<BooleanExpressionPtr>{text, author});
  const AndBooleanExpression both(std::vector<BooleanExpressionPtr>{count, either});

  EXPECT_EQ(
    to_source(both), R"(count >= 2.5 && (text =~ "cat" || author == "bob"^^tt:username))");
  EXPECT_EQ(to_source(NotBooleanExpression(text)), R"(!(text =~ "cat"))");
}

TEST(PrettyprintTest, Constants)
{
  EXPECT_EQ(to_source(*BooleanExpression::true_expr()), "true");
  EXPECT_EQ(to_source(*BooleanExpression::false_expr()), "false");
}

// ============================================================================
// Statements and programs
// ============================================================================

TEST(PrettyprintTest, CommandWithFilterAndAction)
{
  auto twitter = test_support::twitter_class();
  auto search = twitter->get_function(FunctionType::Query, "search");
  auto post = twitter->get_function(FunctionType::Action, "post");

  auto selector = std::make_shared<DeviceSelector>(
    "com.twitter", std::nullopt,
    std::vector<InputParamPtr>{param("name", std::make_shared<StringValue>("bob"))});
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<InvocationTable>(std::make_shared<Invocation>(
      selector, "search",
      std::vector<InputParamPtr>{param("query", std::make_shared<StringValue>("cats"))}, search)),
    std::make_shared<AtomBooleanExpression>("count", ">=", std::make_shared<NumberValue>(2.5)));
  auto action = std::make_shared<InvocationAction>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "post",
    std::vector<InputParamPtr>{param("status", std::make_shared<VarRefValue>("text"))}, post));

  const Command command(table, {action});
  EXPECT_EQ(
    to_source(command),
    R"(now => (@com.twitter(name="bob").search(query="cats")) filter count >= 2.5 => @com.twitter.post(status=text);)");
}

TEST(PrettyprintTest, MonitorRuleWithNotify)
{
  auto twitter = test_support::twitter_class();
  auto table = std::make_shared<InvocationTable>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "home_timeline",
    std::vector<InputParamPtr>{}, twitter->get_function(FunctionType::Query, "home_timeline")));

  const Rule rule(
    std::make_shared<MonitorStream>(table, std::vector<std::string>{"text"}),
    {InvocationAction::notify_action()});
  EXPECT_EQ(to_source(rule), "monitor(@com.twitter.home_timeline()) on new [text] => notify;");
}

TEST(PrettyprintTest, TimerRule)
{
  const TimerStream timer(
    std::make_shared<DateValue>(), std::make_shared<MeasureValue>(1.5, "h"));
  EXPECT_EQ(to_source(timer), "timer(base=$now, interval=1.5h)");
}

TEST(PrettyprintTest, ProgramWithExecutor)
{
  const Program program(
    {}, {std::make_shared<Command>(nullptr, std::vector<ActionPtr>{InvocationAction::notify_action()})},
    std::make_shared<EntityValue>("bob", "tt:username"));
  EXPECT_EQ(to_source(program), R"(executor = "bob"^^tt:username : now => notify;)");
}

TEST(PrettyprintTest, PermissionRule)
{
  const PermissionRule rule(
    BooleanExpression::true_expr(),
    std::make_shared<SpecifiedPermissionFunction>(
      "com.twitter", "search",
      std::make_shared<AtomBooleanExpression>(
        "query", "==", std::make_shared<StringValue>("cats"))),
    PermissionFunction::builtin());
  EXPECT_EQ(to_source(rule), R"(true : @com.twitter.search, query == "cats" => now;)");

  const PermissionRule anything(
    BooleanExpression::true_expr(), PermissionFunction::star(),
    std::make_shared<ClassStarPermissionFunction>("com.twitter"));
  EXPECT_EQ(to_source(anything), "true : * => @com.twitter.*;");
}

// ============================================================================
// Class declarations
// ============================================================================

TEST(PrettyprintTest, ClassDeclaration)
{
  const std::string text = to_source(*test_support::twitter_class());

  EXPECT_TRUE(contains(text, "class @com.twitter {")) << text;
  EXPECT_TRUE(contains(text, "monitorable list query search(in req query : String")) << text;
  EXPECT_TRUE(contains(text, "out author : Entity(tt:username)")) << text;
  EXPECT_TRUE(contains(text, "query profile(")) << text;
  EXPECT_FALSE(contains(text, "monitorable list query profile")) << text;
  EXPECT_TRUE(contains(text, "action post(in req status : String);")) << text;
}

TEST(PrettyprintTest, InheritedArgumentsAreNotRepeated)
{
  auto media = test_support::media_class();
  const std::string movie = to_source(*media->get_function(FunctionType::Query, "movie"));

  EXPECT_TRUE(contains(movie, "list query movie extends video(")) << movie;
  EXPECT_TRUE(contains(movie, "in opt genre : String")) << movie;
  EXPECT_FALSE(contains(movie, "duration")) << movie;
}

}  // namespace thingtalk
