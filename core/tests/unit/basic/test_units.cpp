// tests/unit/basic/test_units.cpp - Unit table and display-name helpers
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "thingtalk/basic/string_utils.hpp"
#include "thingtalk/basic/units.hpp"

namespace thingtalk
{

TEST(UnitsTest, BaseUnits)
{
  EXPECT_EQ(base_unit("h").value_or(""), "ms");
  EXPECT_EQ(base_unit("mi").value_or(""), "m");
  EXPECT_EQ(base_unit("F").value_or(""), "C");
  EXPECT_EQ(base_unit("GiB").value_or(""), "byte");
  EXPECT_FALSE(base_unit("parsec").has_value());
  EXPECT_TRUE(is_known_unit("kmph"));
  EXPECT_FALSE(is_known_unit("default"));
}

TEST(UnitsTest, ScaleConversions)
{
  EXPECT_DOUBLE_EQ(transform_to_base_unit(2, "km"), 2000);
  EXPECT_DOUBLE_EQ(transform_to_base_unit(1, "day"), 86400000);
  EXPECT_DOUBLE_EQ(transform_from_base_unit(2500, "km"), 2.5);
  EXPECT_DOUBLE_EQ(transform_to_base_unit(1, "KiB"), 1024);
}

TEST(UnitsTest, TemperatureIsAffine)
{
  EXPECT_DOUBLE_EQ(transform_to_base_unit(212, "F"), 100);
  EXPECT_DOUBLE_EQ(transform_to_base_unit(273.15, "K"), 0);
  EXPECT_DOUBLE_EQ(transform_from_base_unit(100, "F"), 212);
}

TEST(UnitsTest, UnknownUnitsPassThrough)
{
  EXPECT_DOUBLE_EQ(transform_to_base_unit(7, "parsec"), 7);
  EXPECT_DOUBLE_EQ(transform_from_base_unit(7, "parsec"), 7);
}

TEST(UnitsTest, UnitsSharingABase)
{
  const auto speeds = units_with_base("mps");
  EXPECT_EQ(speeds, (std::vector<std::string>{"mps", "kmph", "mph"}));
  EXPECT_TRUE(units_with_base("parsec").empty());
  EXPECT_EQ(time_units().front(), "ms");
  EXPECT_EQ(time_units().back(), "year");
}

// ============================================================================
// String helpers
// ============================================================================

TEST(StringUtilsTest, Clean)
{
  EXPECT_EQ(clean("userName"), "user name");
  EXPECT_EQ(clean("p_phone_number"), "phone number");
  EXPECT_EQ(clean("v_sender"), "sender");
  EXPECT_EQ(clean("URL"), "url");
}

TEST(StringUtilsTest, CleanKind)
{
  EXPECT_EQ(clean_kind("org.thingpedia.weather"), "weather");
  EXPECT_EQ(clean_kind("com.xkcd"), "xkcd");
  EXPECT_EQ(clean_kind("org.thingpedia.builtin.thingengine.builtin"), "builtin");
  EXPECT_EQ(clean_kind("io.home-assistant.light-bulb"), "light bulb");
}

TEST(StringUtilsTest, SplitAndJoin)
{
  EXPECT_EQ(split("a.b..c", '.'), (std::vector<std::string>{"a", "b", "", "c"}));
  EXPECT_EQ(split("", '.'), std::vector<std::string>{""});
  EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
  EXPECT_EQ(join({}, ", "), "");
  EXPECT_TRUE(starts_with("tt:username", "tt:"));
  EXPECT_TRUE(ends_with("light-bulb", "bulb"));
  EXPECT_FALSE(ends_with("b", "bulb"));
}

}  // namespace thingtalk
