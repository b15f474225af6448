// tests/unit/ast/test_boolean_expression.cpp - Filters, selectors and node construction
//
#include <gtest/gtest.h>

#include "thingtalk/ast/program.hpp"
#include "thingtalk/basic/errors.hpp"

namespace thingtalk
{

namespace
{

BooleanExpressionPtr atom(const std::string & name, const std::string & op, ValuePtr value)
{
  return std::make_shared<AtomBooleanExpression>(name, op, std::move(value));
}

}  // namespace

// ============================================================================
// Singletons
// ============================================================================

TEST(BooleanExpressionTest, TrueAndFalseAreShared)
{
  EXPECT_EQ(BooleanExpression::true_expr().get(), BooleanExpression::true_expr().get());
  EXPECT_EQ(BooleanExpression::false_expr()->clone().get(), BooleanExpression::false_expr().get());
  EXPECT_TRUE(BooleanExpression::true_expr()->is_true());
  EXPECT_FALSE(BooleanExpression::true_expr()->equals(*BooleanExpression::false_expr()));
}

TEST(SelectorTest, BuiltinIsShared)
{
  EXPECT_EQ(Selector::builtin().get(), BuiltinDevice::instance().get());
  EXPECT_EQ(Selector::builtin()->clone().get(), Selector::builtin().get());
  EXPECT_EQ(PermissionFunction::star()->clone().get(), PermissionFunction::star().get());
}

// ============================================================================
// Equality and cloning
// ============================================================================

TEST(BooleanExpressionTest, AtomEquality)
{
  auto a = atom("title", "=~", std::make_shared<StringValue>("news"));
  auto b = atom("title", "=~", std::make_shared<StringValue>("news"));
  auto c = atom("title", "==", std::make_shared<StringValue>("news"));
  EXPECT_TRUE(a->equals(*b));
  EXPECT_FALSE(a->equals(*c));
}

TEST(BooleanExpressionTest, ConnectivesCompareOperandsInOrder)
{
  auto x = atom("x", ">=", std::make_shared<NumberValue>(1));
  auto y = atom("y", "<=", std::make_shared<NumberValue>(2));
  AndBooleanExpression xy(std::vector<BooleanExpressionPtr>{x, y});
  AndBooleanExpression yx(std::vector<BooleanExpressionPtr>{y, x});
  OrBooleanExpression or_xy(std::vector<BooleanExpressionPtr>{x, y});

  EXPECT_TRUE(xy.equals(*xy.clone()));
  EXPECT_FALSE(xy.equals(yx));
  EXPECT_FALSE(xy.equals(or_xy));
}

TEST(BooleanExpressionTest, CloneIsDeep)
{
  auto inner = atom("count", ">=", std::make_shared<NumberValue>(5));
  auto expr = std::make_shared<NotBooleanExpression>(inner);
  auto copy = expr->clone();

  auto & copied_atom = static_cast<AtomBooleanExpression &>(
    *static_cast<NotBooleanExpression &>(*copy).expr);
  copied_atom.value = std::make_shared<NumberValue>(10);

  EXPECT_FALSE(copy->equals(*expr));
  EXPECT_TRUE(static_cast<AtomBooleanExpression &>(*inner).value->equals(NumberValue(5)));
}

TEST(BooleanExpressionTest, ExternalFilter)
{
  auto make = [](double threshold) {
    return std::make_shared<ExternalBooleanExpression>(
      std::make_shared<DeviceSelector>("org.weather"), "current", std::vector<InputParamPtr>{},
      atom("temperature", ">=", std::make_shared<MeasureValue>(threshold, "C")));
  };
  EXPECT_TRUE(make(20)->equals(*make(20)));
  EXPECT_FALSE(make(20)->equals(*make(25)));
  EXPECT_TRUE(make(20)->clone()->equals(*make(20)));
}

TEST(BooleanExpressionTest, MissingChildrenAreRejected)
{
  EXPECT_THROW(AtomBooleanExpression("x", "==", nullptr), InvariantError);
  EXPECT_THROW(NotBooleanExpression(nullptr), InvariantError);
  const std::vector<BooleanExpressionPtr> with_null{BooleanExpression::true_expr(), nullptr};
  EXPECT_THROW(AndBooleanExpression{with_null}, InvariantError);
}

// ============================================================================
// Selectors and invocations
// ============================================================================

TEST(SelectorTest, DeviceSelectorEquality)
{
  DeviceSelector any_light("org.thingpedia.light");
  DeviceSelector kitchen(
    "org.thingpedia.light", std::nullopt,
    {std::make_shared<InputParam>("name", std::make_shared<StringValue>("kitchen"))});
  DeviceSelector by_id("org.thingpedia.light", std::string("light-1"));

  EXPECT_TRUE(any_light.equals(*any_light.clone()));
  EXPECT_FALSE(any_light.equals(kitchen));
  EXPECT_FALSE(any_light.equals(by_id));
  EXPECT_FALSE(any_light.equals(*Selector::builtin()));

  ASSERT_NE(kitchen.get_attribute("name"), nullptr);
  EXPECT_EQ(kitchen.get_attribute("location"), nullptr);
}

TEST(InvocationTest, EqualityIgnoresSchema)
{
  auto make = [](const std::string & query) {
    return std::make_shared<Invocation>(
      std::make_shared<DeviceSelector>("com.twitter"), "search",
      std::vector<InputParamPtr>{
        std::make_shared<InputParam>("query", std::make_shared<StringValue>(query))});
  };
  auto a = make("cats");
  auto b = make("cats");
  b->schema = std::make_shared<FunctionDef>(
    FunctionType::Query, "search", std::vector<std::string>{}, FunctionQualifiers{true, true},
    std::vector<ArgumentDefPtr>{});
  EXPECT_TRUE(a->equals(*b));
  EXPECT_FALSE(a->equals(*make("dogs")));
}

TEST(InvocationTest, NullSelectorIsRejected)
{
  EXPECT_THROW(Invocation(nullptr, "search"), InvariantError);
}

// ============================================================================
// Actions
// ============================================================================

TEST(ActionTest, NotifyAction)
{
  auto action = Action::notify_action();
  auto * invocation = dyn_cast<InvocationAction>(action.get());
  ASSERT_NE(invocation, nullptr);
  EXPECT_TRUE(invocation->is_notify());
  EXPECT_EQ(invocation->invocation->channel, "notify");
  ASSERT_NE(action->schema, nullptr);

  EXPECT_TRUE(cast<InvocationAction>(Action::notify_action("return").get())->is_notify());
  EXPECT_THROW((void)Action::notify_action("post"), InvariantError);
}

TEST(ActionTest, DeviceActionIsNotNotify)
{
  InvocationAction post(std::make_shared<Invocation>(
    std::make_shared<DeviceSelector>("com.twitter"), "post"));
  EXPECT_FALSE(post.is_notify());
}

}  // namespace thingtalk
