// tests/unit/ast/test_values.cpp - Value types, equality and JSON conversion
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "thingtalk/ast/values.hpp"
#include "thingtalk/basic/casting.hpp"
#include "thingtalk/basic/errors.hpp"

namespace thingtalk
{

// ============================================================================
// Equality and cloning
// ============================================================================

TEST(ValueTest, EqualityIsStructural)
{
  EXPECT_TRUE(value_equals(
    std::make_shared<StringValue>("hello"), std::make_shared<StringValue>("hello")));
  EXPECT_FALSE(value_equals(
    std::make_shared<StringValue>("hello"), std::make_shared<StringValue>("world")));
  EXPECT_FALSE(value_equals(std::make_shared<NumberValue>(1), std::make_shared<BooleanValue>(true)));
  EXPECT_TRUE(value_equals(nullptr, nullptr));
  EXPECT_FALSE(value_equals(std::make_shared<NullValue>(), nullptr));
}

TEST(ValueTest, EntityDisplayIsIgnoredByEquality)
{
  EntityValue a("https://example.com", "tt:url", "Example");
  EntityValue b("https://example.com", "tt:url");
  EXPECT_TRUE(a.equals(b));

  EntityValue other_type("https://example.com", "tt:picture_url");
  EXPECT_FALSE(a.equals(other_type));
}

TEST(ValueTest, CloneIsDeep)
{
  auto array = std::make_shared<ArrayValue>(std::vector<ValuePtr>{
    std::make_shared<NumberValue>(1), std::make_shared<NumberValue>(2)});
  auto copy = array->clone();
  ASSERT_NE(copy.get(), array.get());
  EXPECT_TRUE(copy->equals(*array));

  cast<NumberValue>(cast<ArrayValue>(copy)->value[0])->value = 42;
  EXPECT_EQ(cast<NumberValue>(array->value[0])->value, 1);
  EXPECT_FALSE(copy->equals(*array));
}

TEST(ValueTest, DateVariants)
{
  DateValue now;
  EXPECT_TRUE(now.equals(*DateValue::now()));

  DateValue start_of_week(DateEdge{DateEdgeKind::StartOf, "week"});
  DateValue end_of_week(DateEdge{DateEdgeKind::EndOf, "week"});
  EXPECT_FALSE(start_of_week.equals(end_of_week));
}

// ============================================================================
// Types
// ============================================================================

TEST(ValueTest, TypesOfConstants)
{
  EXPECT_TRUE(MeasureValue(3, "km").get_type()->equals(*Type::measure("m")));
  EXPECT_TRUE(EntityValue("x", "tt:hashtag").get_type()->equals(*Type::entity("tt:hashtag")));
  EXPECT_TRUE(CurrencyValue(5, "usd").get_type()->equals(*Type::currency()));
}

TEST(ValueTest, EnumValueTypeIsOpen)
{
  auto type = EnumValue("on").get_type();
  ASSERT_TRUE(type->is_enum());
  ASSERT_TRUE(type->entries.has_value());
  EXPECT_EQ(type->entries->front(), "on");
}

TEST(ValueTest, ArrayTypeFollowsFirstElement)
{
  ArrayValue empty(std::vector<ValuePtr>{});
  EXPECT_TRUE(empty.get_type()->equals(*Type::array(Type::any())));

  ArrayValue strings(std::vector<ValuePtr>{std::make_shared<StringValue>("a")});
  EXPECT_TRUE(strings.get_type()->equals(*Type::array(Type::string())));
}

TEST(ValueTest, ConstantPlaceholderTypes)
{
  EXPECT_TRUE(VarRefValue("__const_QUOTED_STRING_0").get_type()->equals(*Type::string()));
  EXPECT_TRUE(VarRefValue("__const_NUMBER_1").get_type()->equals(*Type::number()));
  EXPECT_TRUE(VarRefValue("__const_USERNAME_0").get_type()->equals(*Type::entity("tt:username")));
  EXPECT_TRUE(
    VarRefValue("__const_GENERIC_ENTITY_tt:device_0").get_type()->equals(
      *Type::entity("tt:device")));
  EXPECT_TRUE(VarRefValue("__const_MEASURE__C_0").get_type()->equals(*Type::measure("C")));
  EXPECT_EQ(VarRefValue("title").get_type().get(), Type::any().get());
  EXPECT_THROW((void)VarRefValue("__const_BOGUS_0").get_type(), std::invalid_argument);
}

// ============================================================================
// Concreteness
// ============================================================================

TEST(ValueTest, ConcreteAndConstant)
{
  EXPECT_TRUE(NumberValue(1).is_concrete());
  EXPECT_FALSE(UndefinedValue().is_concrete());
  EXPECT_FALSE(UndefinedValue().is_constant());

  EXPECT_FALSE(EntityValue(std::nullopt, "tt:username", "bob").is_concrete());
  EXPECT_FALSE(MeasureValue(20, "defaultTemperature").is_concrete());

  TimeValue morning(RelativeTime{"morning"});
  EXPECT_FALSE(morning.is_concrete());
  EXPECT_TRUE(morning.is_constant());

  LocationValue home(RelativeLocation{"home"});
  EXPECT_FALSE(home.is_concrete());
  EXPECT_TRUE(home.is_constant());

  EXPECT_TRUE(VarRefValue("__const_NUMBER_0").is_constant());
  EXPECT_FALSE(VarRefValue("count").is_constant());

  ArrayValue mixed(
    std::vector<ValuePtr>{std::make_shared<NumberValue>(1), std::make_shared<UndefinedValue>()});
  EXPECT_FALSE(mixed.is_concrete());
}

// ============================================================================
// JSON conversion
// ============================================================================

TEST(ValueJsTest, ScalarsConvert)
{
  EXPECT_TRUE(BooleanValue(true).to_js().get<bool>());
  EXPECT_EQ(StringValue("x").to_js().get<std::string>(), "x");
  EXPECT_DOUBLE_EQ(NumberValue(2.5).to_js().get<double>(), 2.5);
  EXPECT_TRUE(NullValue().to_js().is_null());
}

TEST(ValueJsTest, MeasureConvertsToBaseUnit)
{
  EXPECT_DOUBLE_EQ(MeasureValue(2, "km").to_js().get<double>(), 2000.0);
  EXPECT_DOUBLE_EQ(MeasureValue(1, "h").to_js().get<double>(), 3600000.0);
  EXPECT_THROW((void)MeasureValue(1, "defaultTemperature").to_js(), NotConstantError);
}

TEST(ValueJsTest, StructuredValues)
{
  const auto currency = CurrencyValue(5, "usd").to_js();
  EXPECT_EQ(currency.at("code").get<std::string>(), "usd");
  EXPECT_DOUBLE_EQ(currency.at("value").get<double>(), 5.0);

  const auto location =
    LocationValue(AbsoluteLocation{37.4, -122.1, std::string("Palo Alto")}).to_js();
  EXPECT_DOUBLE_EQ(location.at("y").get<double>(), 37.4);
  EXPECT_DOUBLE_EQ(location.at("x").get<double>(), -122.1);
  EXPECT_EQ(location.at("display").get<std::string>(), "Palo Alto");

  const auto time = TimeValue(AbsoluteTime{7, 30, 0}).to_js();
  EXPECT_EQ(time.at("hour").get<int>(), 7);
  EXPECT_EQ(time.at("minute").get<int>(), 30);
}

TEST(ValueJsTest, PlaceholdersDoNotConvert)
{
  EXPECT_THROW((void)UndefinedValue().to_js(), NotConstantError);
  EXPECT_THROW((void)EntityValue(std::nullopt, "tt:username", "bob").to_js(), NotConstantError);
  EXPECT_THROW((void)DateValue().to_js(), NotConstantError);
  EXPECT_THROW((void)LocationValue(RelativeLocation{"home"}).to_js(), NotConstantError);
  EXPECT_THROW((void)TimeValue(RelativeTime{"evening"}).to_js(), NotConstantError);
}

TEST(ValueJsTest, FromJs)
{
  auto entity = Value::from_js(*Type::entity("tt:url"), nlohmann::json("https://example.com"));
  auto as_entity = dyn_cast<EntityValue>(entity);
  ASSERT_NE(as_entity, nullptr);
  ASSERT_TRUE(as_entity->value.has_value());
  EXPECT_EQ(*as_entity->value, "https://example.com");
  EXPECT_EQ(as_entity->type, "tt:url");

  auto measure = Value::from_js(*Type::measure("m"), nlohmann::json(12));
  EXPECT_TRUE(measure->equals(MeasureValue(12, "m")));

  auto array = Value::from_js(*Type::array(Type::number()), nlohmann::json::array({1, 2, 3}));
  ASSERT_TRUE(isa<ArrayValue>(array));
  EXPECT_EQ(cast<ArrayValue>(array)->value.size(), 3u);

  auto time = Value::from_js(*Type::time(), nlohmann::json("08:15"));
  EXPECT_TRUE(time->equals(TimeValue(AbsoluteTime{8, 15, 0})));

  auto date = Value::from_js(*Type::date(), nlohmann::json(nullptr));
  EXPECT_TRUE(date->equals(*DateValue::now()));

  EXPECT_THROW((void)Value::from_js(*Type::any(), nlohmann::json(1)), std::invalid_argument);
}

}  // namespace thingtalk
