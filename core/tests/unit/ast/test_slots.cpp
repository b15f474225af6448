// tests/unit/ast/test_slots.cpp - Slot iteration order, tags and scopes
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "thingtalk/ast/slots.hpp"
#include "thingtalk/test_support/sample_classes.hpp"

namespace thingtalk
{

namespace
{

InputParamPtr param(const std::string & name, ValuePtr value)
{
  return std::make_shared<InputParam>(name, std::move(value));
}

std::vector<std::string> tags_of(const std::vector<SlotEntry> & entries)
{
  std::vector<std::string> tags;
  for (const auto & entry : entries) {
    if (const auto * slot = std::get_if<SlotPtr>(&entry)) {
      tags.push_back((*slot)->tag());
    } else {
      tags.push_back("selector:" + std::get<DeviceSelector *>(entry)->kind);
    }
  }
  return tags;
}

/// now => @com.twitter(name="bob").search(query="cats"), count >= 5
///     => @com.twitter.post(status=text);
StatementPtr search_and_post(const ClassDefPtr & twitter)
{
  auto search = twitter->get_function(FunctionType::Query, "search");
  auto post = twitter->get_function(FunctionType::Action, "post");

  auto selector = std::make_shared<DeviceSelector>(
    "com.twitter", std::nullopt,
    std::vector<InputParamPtr>{param("name", std::make_shared<StringValue>("bob"))});
  auto invocation = std::make_shared<Invocation>(
    selector, "search",
    std::vector<InputParamPtr>{param("query", std::make_shared<StringValue>("cats"))}, search);
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<InvocationTable>(invocation, search),
    std::make_shared<AtomBooleanExpression>("count", ">=", std::make_shared<NumberValue>(5)));

  auto action = std::make_shared<InvocationAction>(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "post",
    std::vector<InputParamPtr>{param("status", std::make_shared<VarRefValue>("text"))}, post));

  return std::make_shared<Command>(table, std::vector<ActionPtr>{action});
}

}  // namespace

TEST(SlotsTest, EvaluationOrder)
{
  auto twitter = test_support::twitter_class();
  auto command = search_and_post(twitter);

  const std::vector<std::string> expected{
    "attribute.name", "selector:com.twitter", "in_param.query", "filter.>=.count",
    "selector:com.twitter", "in_param.status"};
  EXPECT_EQ(tags_of(iterate_slots(*command)), expected);
}

TEST(SlotsTest, OrderIsStableAcrossCalls)
{
  ClassDef::FunctionMap queries;
  queries["forecast"] = test_support::make_query(
    "forecast", {test_support::in_req("city", Type::string()),
                 test_support::in_opt("days", Type::number()),
                 test_support::out("summary", Type::string())});
  auto weather = ClassDef::create("org.example.weather", {}, {}, std::move(queries), {});
  auto forecast = weather->get_function(FunctionType::Query, "forecast");

  auto selector = std::make_shared<DeviceSelector>(
    "org.example.weather", std::nullopt,
    std::vector<InputParamPtr>{param("name", std::make_shared<StringValue>("home"))});
  auto invocation = std::make_shared<Invocation>(
    selector, "forecast",
    std::vector<InputParamPtr>{
      param("city", std::make_shared<StringValue>("paris")),
      param("days", std::make_shared<NumberValue>(3))},
    forecast);
  const auto command = std::make_shared<Command>(
    std::make_shared<InvocationTable>(invocation, forecast),
    std::vector<ActionPtr>{Action::notify_action()});

  const std::vector<std::string> expected{
    "attribute.name", "selector:org.example.weather", "in_param.city", "in_param.days"};
  const auto first = tags_of(iterate_slots(*command));
  const auto second = tags_of(iterate_slots(*command));
  EXPECT_EQ(first, expected);
  EXPECT_EQ(second, first);
}

TEST(SlotsTest, ExternalFilterSelectorAttributesAreNotSlots)
{
  auto twitter = test_support::twitter_class();
  auto search = twitter->get_function(FunctionType::Query, "search");
  auto external = std::make_shared<ExternalBooleanExpression>(
    std::make_shared<DeviceSelector>(
      "com.twitter", std::nullopt,
      std::vector<InputParamPtr>{param("name", std::make_shared<StringValue>("bob"))}),
    "search", std::vector<InputParamPtr>{param("query", std::make_shared<StringValue>("cats"))},
    BooleanExpression::true_expr(), search);
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<InvocationTable>(
      std::make_shared<Invocation>(
        std::make_shared<DeviceSelector>("com.twitter"), "home_timeline",
        std::vector<InputParamPtr>{},
        twitter->get_function(FunctionType::Query, "home_timeline")),
      twitter->get_function(FunctionType::Query, "home_timeline")),
    external);

  const std::vector<std::string> expected{
    "selector:com.twitter", "selector:com.twitter", "in_param.query"};
  EXPECT_EQ(tags_of(iterate_slots(*table)), expected);
}

TEST(SlotsTest, ValueSlotsDropSelectors)
{
  auto command = search_and_post(test_support::twitter_class());
  auto slots = value_slots(iterate_slots(*command));
  ASSERT_EQ(slots.size(), 4u);
  EXPECT_EQ(slots[0]->tag(), "attribute.name");
  EXPECT_TRUE(slots[0]->type()->equals(*Type::string()));
}

TEST(SlotsTest, TypesFollowTheSignature)
{
  auto command = search_and_post(test_support::twitter_class());
  auto slots = value_slots(iterate_slots(*command));

  EXPECT_TRUE(slots[1]->type()->equals(*Type::string()));
  ASSERT_NE(slots[1]->arg(), nullptr);
  EXPECT_EQ(slots[1]->arg()->name, "query");
  EXPECT_TRUE(slots[2]->type()->equals(*Type::number()));
  EXPECT_EQ(slots[2]->arg_canonical(), "count");
}

TEST(SlotsTest, ActionSeesOutputsOfTheQuery)
{
  auto command = search_and_post(test_support::twitter_class());
  auto slots = value_slots(iterate_slots(*command));
  const auto & status = slots[3];

  EXPECT_EQ(status->scope().count("text"), 1u);
  EXPECT_EQ(status->scope().count("$event"), 1u);

  const auto options = status->options();
  const bool offers_text = std::any_of(options.begin(), options.end(), [](const ScopeItem & item) {
    const auto * ref = dyn_cast_or_null<VarRefValue>(item.value.get());
    return ref && ref->name == "text";
  });
  EXPECT_TRUE(offers_text);
  // Number is not assignable to String
  const bool offers_count = std::any_of(options.begin(), options.end(), [](const ScopeItem & item) {
    const auto * ref = dyn_cast_or_null<VarRefValue>(item.value.get());
    return ref && ref->name == "count";
  });
  EXPECT_FALSE(offers_count);
}

TEST(SlotsTest, SetWritesIntoTheTree)
{
  auto command = search_and_post(test_support::twitter_class());
  auto slots = value_slots(iterate_slots(*command));
  slots[1]->set(std::make_shared<StringValue>("dogs"));

  const auto & table = cast<Command>(command.get())->table;
  const auto & inner = cast<FilteredTable>(table.get())->table;
  const auto & invocation = cast<InvocationTable>(inner.get())->invocation;
  EXPECT_TRUE(invocation->in_params.front()->value->equals(StringValue("dogs")));
}

TEST(SlotsTest, UndefinedAndCompilable)
{
  auto command = search_and_post(test_support::twitter_class());
  auto slots = value_slots(iterate_slots(*command));

  slots[1]->set(std::make_shared<UndefinedValue>());
  EXPECT_TRUE(slots[1]->is_undefined());
  EXPECT_FALSE(slots[1]->is_concrete());
  EXPECT_FALSE(slots[1]->is_compilable());

  slots[1]->set(std::make_shared<StringValue>("cats"));
  EXPECT_TRUE(slots[1]->is_compilable());
}

TEST(SlotsTest, UsernameIsNotCompilableForOtherEntities)
{
  auto fn = std::make_shared<FunctionDef>(
    FunctionType::Action, "send", std::vector<std::string>{}, FunctionQualifiers{},
    std::vector<ArgumentDefPtr>{test_support::in_req("to", Type::entity("tt:email_address"))});
  Invocation invocation(
    std::make_shared<DeviceSelector>("com.gmail"), "send",
    {param("to", std::make_shared<EntityValue>(std::string("bob"), "tt:username"))}, fn);

  auto slots = value_slots(iterate_slots(invocation));
  ASSERT_EQ(slots.size(), 1u);
  EXPECT_TRUE(slots[0]->is_concrete());
  EXPECT_FALSE(slots[0]->is_compilable());
}

TEST(SlotsTest, ArrayElementsAreSlots)
{
  Invocation invocation(
    std::make_shared<DeviceSelector>("com.example"), "tag",
    {param(
      "tags", std::make_shared<ArrayValue>(std::vector<ValuePtr>{
                std::make_shared<EntityValue>(std::string("cats"), "tt:hashtag"),
                std::make_shared<UndefinedValue>()}))});

  const std::vector<std::string> expected{
    "selector:com.example", "in_param.tags", "in_param.tags.0", "in_param.tags.1"};
  auto entries = iterate_slots(invocation);
  EXPECT_EQ(tags_of(entries), expected);
  EXPECT_TRUE(value_slots(entries)[2]->is_undefined());
}

TEST(SlotsTest, TimerFieldsAndPrincipal)
{
  auto timer = std::make_shared<TimerStream>(
    DateValue::now(), std::make_shared<MeasureValue>(1, "h"));
  auto rule =
    std::make_shared<Rule>(timer, std::vector<ActionPtr>{Action::notify_action()});
  Program program(
    {}, {rule}, std::make_shared<EntityValue>(std::string("bob@example.com"), "tt:email_address"));

  const std::vector<std::string> expected{
    "program.principal", "timer.base", "timer.interval"};
  EXPECT_EQ(tags_of(iterate_slots(program)), expected);

  auto slots = value_slots(iterate_slots(program));
  EXPECT_TRUE(slots[2]->type()->equals(*Type::measure("ms")));
}

TEST(SlotsTest, ExternalFilterUsesItsOwnScope)
{
  auto weather = std::make_shared<FunctionDef>(
    FunctionType::Query, "current", std::vector<std::string>{}, FunctionQualifiers{false, true},
    std::vector<ArgumentDefPtr>{test_support::out("temperature", Type::measure("C"))});
  auto external = std::make_shared<ExternalBooleanExpression>(
    std::make_shared<DeviceSelector>("org.weather"), "current", std::vector<InputParamPtr>{},
    std::make_shared<AtomBooleanExpression>(
      "temperature", ">=", std::make_shared<MeasureValue>(20, "C")),
    weather);
  auto table = std::make_shared<FilteredTable>(
    std::make_shared<InvocationTable>(std::make_shared<Invocation>(
      std::make_shared<DeviceSelector>("com.twitter"), "home_timeline")),
    external);

  auto entries = iterate_slots(*table);
  const std::vector<std::string> expected{
    "selector:com.twitter", "selector:org.weather", "filter.>=.temperature"};
  EXPECT_EQ(tags_of(entries), expected);

  auto slots = value_slots(entries);
  ASSERT_EQ(slots.size(), 1u);
  EXPECT_EQ(slots[0]->primitive(), external.get());
  EXPECT_TRUE(slots[0]->type()->equals(*Type::measure("C")));
}

}  // namespace thingtalk
