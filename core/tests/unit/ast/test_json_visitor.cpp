// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "thingtalk/ast/json_visitor.hpp"
#include "thingtalk/test_support/sample_classes.hpp"

using nlohmann::json;

namespace thingtalk
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  void SetUp() override { twitter_ = test_support::twitter_class(); }

  [[nodiscard]] TablePtr search_table() const
  {
    auto search = twitter_->get_function(FunctionType::Query, "search");
    return std::make_shared<InvocationTable>(std::make_shared<Invocation>(
      std::make_shared<DeviceSelector>("com.twitter"), "search",
      std::vector<InputParamPtr>{
        std::make_shared<InputParam>("query", std::make_shared<StringValue>("cats"))},
      search));
  }

  ClassDefPtr twitter_;
};

TEST_F(JsonVisitorTest, NullNode)
{
  EXPECT_TRUE(to_json(nullptr).is_null());
}

TEST_F(JsonVisitorTest, LeafValue)
{
  const MeasureValue value(2.5, "km");
  auto j = to_json(&value);

  EXPECT_EQ(j["type"].get<std::string>(), "MeasureValue");
  EXPECT_EQ(j["valueType"].get<std::string>(), "Measure(m)");
  EXPECT_TRUE(j["concrete"].get<bool>());
  EXPECT_EQ(j["source"].get<std::string>(), "2.5km");
  EXPECT_TRUE(j["range"]["start"].is_null());
}

TEST_F(JsonVisitorTest, Command)
{
  const Command command(search_table(), {Action::notify_action()});
  auto j = to_json(&command);

  EXPECT_EQ(j["type"].get<std::string>(), "Command");
  ASSERT_EQ(j["actions"].size(), 1u);
  EXPECT_EQ(j["actions"][0]["type"].get<std::string>(), "InvocationAction");

  const auto & invocation = j["table"]["invocation"];
  EXPECT_EQ(invocation["channel"].get<std::string>(), "search");
  EXPECT_EQ(invocation["selector"]["kind"].get<std::string>(), "com.twitter");
  ASSERT_EQ(invocation["in_params"].size(), 1u);
  EXPECT_EQ(invocation["in_params"][0]["name"].get<std::string>(), "query");
  EXPECT_EQ(invocation["schema"]["name"].get<std::string>(), "com.twitter.search");
}

TEST_F(JsonVisitorTest, FilterOperands)
{
  const FilteredTable table(
    search_table(),
    std::make_shared<AndBooleanExpression>(std::vector<BooleanExpressionPtr>{
      std::make_shared<AtomBooleanExpression>("count", ">=", std::make_shared<NumberValue>(3)),
      std::make_shared<NotBooleanExpression>(std::make_shared<AtomBooleanExpression>(
        "text", "=~", std::make_shared<StringValue>("dog")))}));
  auto j = to_json(&table);

  const auto & filter = j["filter"];
  EXPECT_EQ(filter["type"].get<std::string>(), "AndBooleanExpression");
  ASSERT_EQ(filter["operands"].size(), 2u);
  EXPECT_EQ(filter["operands"][0]["op"].get<std::string>(), ">=");
  EXPECT_EQ(filter["operands"][1]["expr"]["name"].get<std::string>(), "text");
}

TEST_F(JsonVisitorTest, Signature)
{
  auto j = to_json(*twitter_->get_function(FunctionType::Query, "search"));

  EXPECT_EQ(j["function_type"].get<std::string>(), "query");
  EXPECT_TRUE(j["is_list"].get<bool>());
  EXPECT_TRUE(j["is_monitorable"].get<bool>());
  ASSERT_EQ(j["args"].size(), 5u);
  EXPECT_EQ(j["args"][0]["name"].get<std::string>(), "query");
  EXPECT_EQ(j["args"][0]["direction"].get<std::string>(), "in req");
  EXPECT_EQ(j["args"][0]["type"].get<std::string>(), "String");
}

TEST_F(JsonVisitorTest, ClassFunctionsAreKeyedByName)
{
  auto j = to_json(twitter_.get());

  EXPECT_EQ(j["type"].get<std::string>(), "ClassDef");
  EXPECT_EQ(j["kind"].get<std::string>(), "com.twitter");
  EXPECT_TRUE(j["queries"].contains("home_timeline"));
  EXPECT_TRUE(j["actions"].contains("retweet"));
  EXPECT_FALSE(j["is_abstract"].get<bool>());
}

}  // namespace thingtalk
