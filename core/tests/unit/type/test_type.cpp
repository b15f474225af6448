// tests/unit/type/test_type.cpp - Unit tests for the type model
//
#include <gtest/gtest.h>

#include <string>

#include "thingtalk/basic/errors.hpp"
#include "thingtalk/type/type.hpp"

namespace thingtalk
{

TEST(TypeTest, PrimitiveTypesAreSingletons)
{
  EXPECT_EQ(Type::string().get(), Type::string().get());
  EXPECT_EQ(Type::number().get(), Type::number().get());
  EXPECT_NE(Type::string().get(), Type::number().get());
}

TEST(TypeTest, ParametricTypesCompareStructurally)
{
  EXPECT_TRUE(Type::entity("tt:url")->equals(*Type::entity("tt:url")));
  EXPECT_FALSE(Type::entity("tt:url")->equals(*Type::entity("tt:email_address")));
  EXPECT_TRUE(Type::array(Type::string())->equals(*Type::array(Type::string())));
  EXPECT_FALSE(Type::array(Type::string())->equals(*Type::array(Type::number())));
}

TEST(TypeTest, MeasureNormalizesToBaseUnit)
{
  EXPECT_EQ(Type::measure("km")->name, "m");
  EXPECT_EQ(Type::measure("min")->name, "ms");
  EXPECT_TRUE(Type::measure("h")->equals(*Type::measure("ms")));
}

TEST(TypeTest, ToString)
{
  EXPECT_EQ(Type::string()->to_string(), "String");
  EXPECT_EQ(Type::entity("tt:url")->to_string(), "Entity(tt:url)");
  EXPECT_EQ(Type::measure("C")->to_string(), "Measure(C)");
  EXPECT_EQ(Type::array(Type::number())->to_string(), "Array(Number)");
  EXPECT_EQ(Type::enumeration(std::vector<std::string>{"on", "off"})->to_string(), "Enum(on,off)");
  EXPECT_EQ(Type::enumeration(std::nullopt)->to_string(), "Enum(*)");
}

TEST(TypeTest, FromStringParsesNestedTypes)
{
  auto type = Type::from_string("Array(Entity(tt:hashtag))");
  ASSERT_TRUE(type->is_array());
  ASSERT_TRUE(type->elem->is_entity());
  EXPECT_EQ(type->elem->name, "tt:hashtag");

  auto enum_type = Type::from_string("Enum(on, off)");
  ASSERT_TRUE(enum_type->is_enum());
  ASSERT_TRUE(enum_type->entries.has_value());
  EXPECT_EQ(enum_type->entries->size(), 2u);

  EXPECT_TRUE(Type::from_string("Measure(km)")->equals(*Type::measure("m")));
}

TEST(TypeTest, FromStringUnknownName)
{
  auto type = Type::from_string("FooBar");
  EXPECT_TRUE(type->is_unknown());
  EXPECT_EQ(type->to_string(), "FooBar");
}

TEST(TypeTest, FromStringRejectsMalformedInput)
{
  EXPECT_THROW((void)Type::from_string("Entity(tt:url"), TypeParseError);
  EXPECT_THROW((void)Type::from_string("Array()"), TypeParseError);
  EXPECT_THROW((void)Type::from_string("String String"), TypeParseError);
}

TEST(TypeTest, NumericAndComparable)
{
  EXPECT_TRUE(Type::number()->is_numeric());
  EXPECT_TRUE(Type::currency()->is_numeric());
  EXPECT_TRUE(Type::measure("m")->is_numeric());
  EXPECT_FALSE(Type::string()->is_numeric());

  EXPECT_TRUE(Type::date()->is_comparable());
  EXPECT_TRUE(Type::string()->is_comparable());
  EXPECT_FALSE(Type::boolean()->is_comparable());
}

// ============================================================================
// Assignability
// ============================================================================

TEST(TypeAssignableTest, AnyMatchesEverything)
{
  EXPECT_TRUE(is_assignable(*Type::any(), *Type::location()));
  EXPECT_TRUE(is_assignable(*Type::number(), *Type::any()));
}

TEST(TypeAssignableTest, Conversions)
{
  EXPECT_TRUE(is_assignable(*Type::date(), *Type::time()));
  EXPECT_FALSE(is_assignable(*Type::time(), *Type::date()));
  EXPECT_TRUE(is_assignable(*Type::number(), *Type::currency()));
  EXPECT_FALSE(is_assignable(*Type::currency(), *Type::number()));
}

TEST(TypeAssignableTest, MeasureUnits)
{
  EXPECT_TRUE(is_assignable(*Type::measure("km"), *Type::measure("m")));
  EXPECT_FALSE(is_assignable(*Type::measure("m"), *Type::measure("ms")));
}

TEST(TypeAssignableTest, PolymorphicMeasureBindsUnitOnce)
{
  TypeScope scope;
  EXPECT_TRUE(is_assignable(*Type::measure("m"), *Type::measure(""), &scope));
  EXPECT_EQ(scope["_unit"], "m");
  EXPECT_TRUE(is_assignable(*Type::measure("km"), *Type::measure(""), &scope));
  EXPECT_FALSE(is_assignable(*Type::measure("ms"), *Type::measure(""), &scope));
}

TEST(TypeAssignableTest, LenientEntities)
{
  EXPECT_FALSE(is_assignable(*Type::string(), *Type::entity("tt:url")));
  EXPECT_TRUE(is_assignable(*Type::string(), *Type::entity("tt:url"), nullptr, true));
  EXPECT_TRUE(is_assignable(*Type::entity("tt:url"), *Type::string(), nullptr, true));
}

TEST(TypeAssignableTest, EntitySubtypes)
{
  EXPECT_TRUE(is_assignable(*Type::entity("tt:username"), *Type::entity("tt:contact")));
  EXPECT_TRUE(is_assignable(*Type::entity("tt:picture_url"), *Type::entity("tt:url")));
  EXPECT_FALSE(is_assignable(*Type::entity("tt:url"), *Type::entity("tt:picture_url")));
}

TEST(TypeAssignableTest, ArrayOfContactsIsAContactGroup)
{
  EXPECT_TRUE(is_assignable(
    *Type::array(Type::entity("tt:contact")), *Type::entity("tt:contact_group")));
}

TEST(TypeAssignableTest, EnumValueAgainstDeclaredEnum)
{
  const auto declared = Type::enumeration(std::vector<std::string>{"on", "off"});
  const auto value_on = Type::enumeration(std::vector<std::string>{"on", "*"});
  const auto value_dim = Type::enumeration(std::vector<std::string>{"dim", "*"});
  EXPECT_TRUE(is_assignable(*value_on, *declared));
  EXPECT_FALSE(is_assignable(*value_dim, *declared));
}

TEST(TypeAssignableTest, UnknownTypesOnlyMatchThemselves)
{
  EXPECT_TRUE(is_assignable(*Type::unknown("Foo"), *Type::unknown("Foo")));
  EXPECT_FALSE(is_assignable(*Type::unknown("Foo"), *Type::any()));
}

}  // namespace thingtalk
