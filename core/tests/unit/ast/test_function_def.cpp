// tests/unit/ast/test_function_def.cpp - Signatures, inheritance and class validation
//
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "thingtalk/ast/class_def.hpp"
#include "thingtalk/ast/values.hpp"
#include "thingtalk/basic/errors.hpp"
#include "thingtalk/test_support/sample_classes.hpp"

namespace thingtalk
{

using test_support::in_opt;
using test_support::in_req;
using test_support::make_query;
using test_support::out;

namespace
{

std::vector<std::string> names_of(const std::vector<ArgumentDefPtr> & args)
{
  std::vector<std::string> names;
  for (const auto & arg : args) {
    names.push_back(arg->name);
  }
  return names;
}

}  // namespace

// ============================================================================
// ArgumentDef
// ============================================================================

TEST(ArgumentDefTest, DirectionFlags)
{
  auto req = in_req("query", Type::string());
  auto opt = in_opt("count", Type::number());
  auto output = out("text", Type::string());

  EXPECT_TRUE(req->is_input);
  EXPECT_TRUE(req->required);
  EXPECT_TRUE(opt->is_input);
  EXPECT_FALSE(opt->required);
  EXPECT_FALSE(output->is_input);
  EXPECT_FALSE(output->required);
}

TEST(ArgumentDefTest, CanonicalFallsBackToCleanName)
{
  auto arg = out("userName", Type::string());
  EXPECT_EQ(arg->canonical(), "user name");

  NLAnnotationMap nl;
  nl["canonical"] = "author";
  auto annotated =
    std::make_shared<ArgumentDef>(ArgDirection::Out, "from", Type::string(), std::move(nl));
  EXPECT_EQ(annotated->canonical(), "author");
}

// ============================================================================
// Compound flattening
// ============================================================================

TEST(ExpressionSignatureTest, CompoundArgumentsAreFlattened)
{
  auto place = Type::compound(
    "", {out("name", Type::string()),
         out("geo", Type::compound("", {out("lat", Type::number()), out("lon", Type::number())}))});
  auto fn = make_query("places", {out("id", Type::string()), in_req("place", place)}, true, false);

  const auto names = fn->args();
  const std::vector<std::string> expected{
    "id", "place", "place.name", "place.geo", "place.geo.lat", "place.geo.lon"};
  EXPECT_EQ(names, expected);

  // fields take over the direction of the argument they belong to
  auto lat = fn->get_argument("place.geo.lat");
  ASSERT_NE(lat, nullptr);
  EXPECT_TRUE(lat->is_input);
  EXPECT_TRUE(lat->required);
}

// ============================================================================
// Inheritance
// ============================================================================

TEST(ExpressionSignatureTest, InheritedArgumentsResolveThroughClass)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");
  ASSERT_NE(movie, nullptr);

  EXPECT_TRUE(movie->has_argument("rating"));
  EXPECT_TRUE(movie->has_argument("duration"));
  EXPECT_TRUE(movie->has_argument("title"));
  EXPECT_FALSE(movie->has_argument("director"));
  EXPECT_TRUE(movie->get_arg_type("duration")->equals(*Type::measure("ms")));
}

TEST(ExpressionSignatureTest, IterateArgumentsLocalFirst)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");

  const std::vector<std::string> expected{"genre", "rating", "duration", "id", "title"};
  EXPECT_EQ(names_of(movie->iterate_arguments()), expected);
}

TEST(ExpressionSignatureTest, DirectionPartitions)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");

  EXPECT_TRUE(movie->in_req().empty());
  EXPECT_EQ(movie->in_opt().count("genre"), 1u);
  const auto outputs = movie->out();
  EXPECT_EQ(outputs.size(), 4u);
  EXPECT_EQ(outputs.count("title"), 1u);
}

TEST(ExpressionSignatureTest, DetachedSignatureCannotResolveParents)
{
  auto orphan = make_query("video", {out("duration", Type::measure("ms"))}, true, false, {"media"});
  EXPECT_TRUE(orphan->has_argument("duration"));
  EXPECT_THROW((void)orphan->has_argument("title"), ResolutionError);
}

TEST(ExpressionSignatureTest, BaseFunctionsDepthFirst)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");
  const std::vector<std::string> expected{"movie", "video", "media"};
  EXPECT_EQ(movie->iterate_base_functions(), expected);
}

// ============================================================================
// Minimal projection
// ============================================================================

TEST(FunctionDefTest, MinimalProjectionDefaultsToId)
{
  auto klass = test_support::twitter_class();
  auto search = klass->get_function(FunctionType::Query, "search");
  ASSERT_TRUE(search->minimal_projection.has_value());
  EXPECT_EQ(*search->minimal_projection, std::vector<std::string>{"id"});

  auto profile = klass->get_function(FunctionType::Query, "profile");
  ASSERT_TRUE(profile->minimal_projection.has_value());
  EXPECT_TRUE(profile->minimal_projection->empty());
}

TEST(FunctionDefTest, MinimalProjectionSeesInheritedId)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");
  ASSERT_TRUE(movie->minimal_projection.has_value());
  EXPECT_EQ(*movie->minimal_projection, std::vector<std::string>{"id"});
}

TEST(FunctionDefTest, MinimalProjectionMustBeInDefaultProjection)
{
  AnnotationMap impl;
  impl["default_projection"] =
    std::make_shared<ArrayValue>(std::vector<ValuePtr>{std::make_shared<StringValue>("text")});
  auto fn = make_query(
    "search", {out("id", Type::string()), out("text", Type::string())}, true, false, {},
    std::move(impl));

  ClassDef::FunctionMap queries;
  queries["search"] = fn;
  EXPECT_THROW(
    (void)ClassDef::create("com.example", {}, {}, std::move(queries), {}), InvariantError);
}

TEST(FunctionDefTest, RequireFilterAnnotation)
{
  auto klass = test_support::ledger_class();
  EXPECT_TRUE(klass->get_function(FunctionType::Query, "entries")->require_filter);
}

TEST(FunctionDefTest, ActionCannotBeList)
{
  EXPECT_THROW(
    (void)std::make_shared<FunctionDef>(
      FunctionType::Action, "post", std::vector<std::string>{}, FunctionQualifiers{true, false},
      std::vector<ArgumentDefPtr>{}),
    InvariantError);
}

TEST(FunctionDefTest, QualifiedName)
{
  auto klass = test_support::twitter_class();
  EXPECT_EQ(klass->get_function(FunctionType::Action, "post")->qualified_name(), "com.twitter.post");
}

// ============================================================================
// Derived signatures
// ============================================================================

TEST(FunctionDefTest, CloneIsIndependent)
{
  auto klass = test_support::twitter_class();
  auto search = klass->get_function(FunctionType::Query, "search");
  auto copy = search->clone_function();

  ASSERT_NE(copy.get(), search.get());
  EXPECT_TRUE(copy->equals(*search));

  copy->is_list = false;
  copy->remove_minimal_projection();
  EXPECT_TRUE(search->is_list);
  EXPECT_EQ(*search->minimal_projection, std::vector<std::string>{"id"});
  EXPECT_EQ(copy->get_class().get(), search->get_class().get());
}

TEST(FunctionDefTest, AddArgumentsKeepsOriginal)
{
  auto klass = test_support::twitter_class();
  auto post = klass->get_function(FunctionType::Action, "post");

  const std::vector<ArgumentDefPtr> extra{in_opt("in_reply_to", Type::string())};
  auto extended = post->add_arguments(extra);
  EXPECT_TRUE(extended->has_argument("in_reply_to"));
  EXPECT_FALSE(post->has_argument("in_reply_to"));
}

TEST(FunctionDefTest, RemoveInheritedArgumentFlattens)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");

  auto without_title = movie->remove_argument("title");
  EXPECT_FALSE(without_title->has_argument("title"));
  EXPECT_TRUE(without_title->has_argument("duration"));
  EXPECT_TRUE(without_title->extends().empty());
  EXPECT_TRUE(movie->has_argument("title"));
}

TEST(FunctionDefTest, FilterArguments)
{
  auto klass = test_support::twitter_class();
  auto search = klass->get_function(FunctionType::Query, "search");

  auto inputs = search->filter_arguments([](const ArgumentDef & arg) { return arg.is_input; });
  EXPECT_EQ(inputs->args(), std::vector<std::string>{"query"});
}

TEST(FunctionDefTest, AsStreamKeepsArguments)
{
  auto klass = test_support::media_class();
  auto movie = klass->get_function(FunctionType::Query, "movie");

  auto stream = movie->as_type(FunctionType::Stream);
  EXPECT_EQ(stream->function_type(), FunctionType::Stream);
  EXPECT_TRUE(stream->has_argument("title"));
}

TEST(FunctionDefTest, PollInterval)
{
  AnnotationMap impl;
  impl["poll_interval"] = std::make_shared<MeasureValue>(5, "min");
  auto fn = make_query("feed", {out("id", Type::string())}, true, true, {}, std::move(impl));
  ASSERT_TRUE(fn->poll_interval().has_value());
  EXPECT_DOUBLE_EQ(*fn->poll_interval(), 300000.0);

  auto plain = make_query("feed", {out("id", Type::string())});
  EXPECT_FALSE(plain->poll_interval().has_value());
}

// ============================================================================
// ClassDef
// ============================================================================

TEST(ClassDefTest, StreamsLookUpQueries)
{
  auto klass = test_support::twitter_class();
  EXPECT_NE(klass->get_function(FunctionType::Stream, "search"), nullptr);
  EXPECT_EQ(klass->get_function(FunctionType::Query, "post"), nullptr);
  EXPECT_EQ(klass->get_function(FunctionType::Action, "nonexistent"), nullptr);
}

TEST(ClassDefTest, MissingParentIsRejected)
{
  ClassDef::FunctionMap queries;
  queries["video"] =
    make_query("video", {out("duration", Type::measure("ms"))}, true, false, {"media"});
  EXPECT_THROW(
    (void)ClassDef::create("org.example", {}, {}, std::move(queries), {}), InvalidClassError);
}

TEST(ClassDefTest, CyclicExtendsIsRejected)
{
  ClassDef::FunctionMap queries;
  queries["a"] = make_query("a", {out("x", Type::number())}, true, false, {"b"});
  queries["b"] = make_query("b", {out("y", Type::number())}, true, false, {"a"});
  EXPECT_THROW(
    (void)ClassDef::create("org.example", {}, {}, std::move(queries), {}), InvalidClassError);
}

TEST(ClassDefTest, CloneRebindsFunctions)
{
  auto klass = test_support::media_class();
  auto copy = klass->clone();

  auto movie = copy->get_function(FunctionType::Query, "movie");
  ASSERT_NE(movie, nullptr);
  EXPECT_NE(movie.get(), klass->get_function(FunctionType::Query, "movie").get());
  EXPECT_EQ(movie->get_class().get(), copy.get());
  EXPECT_TRUE(movie->has_argument("title"));
}

TEST(ClassDefTest, CopiesKeepTheClassAlive)
{
  FunctionDefPtr movie;
  std::weak_ptr<const ClassDef> watch;
  {
    auto klass = test_support::media_class();
    watch = klass;
    movie = klass->get_function(FunctionType::Query, "movie")->clone_function();
  }
  ASSERT_FALSE(watch.expired());
  EXPECT_EQ(movie->get_class(), watch.lock());
  EXPECT_TRUE(movie->has_argument("title"));
  EXPECT_EQ(movie->out().count("duration"), 1u);
  EXPECT_EQ(movie->iterate_arguments().size(), 5u);
}

TEST(ClassDefTest, OwnedFunctionsDoNotKeepTheClassAlive)
{
  auto klass = test_support::media_class();
  std::weak_ptr<const ClassDef> watch = klass;
  auto movie = klass->get_function(FunctionType::Query, "movie");
  klass.reset();

  EXPECT_TRUE(watch.expired());
  EXPECT_THROW((void)movie->has_argument("title"), ResolutionError);
}

TEST(ClassDefTest, MixinImports)
{
  auto loader = std::make_shared<MixinImportStmt>(
    std::vector<std::string>{"loader"}, "org.thingpedia.v2");
  auto config = std::make_shared<MixinImportStmt>(
    std::vector<std::string>{"config"}, "org.thingpedia.config.none");

  auto klass = ClassDef::create("com.example", {}, {loader, config}, {}, {});
  ASSERT_NE(klass->loader(), nullptr);
  EXPECT_EQ(klass->loader()->module, "org.thingpedia.v2");
  ASSERT_NE(klass->config(), nullptr);
  EXPECT_TRUE(klass->config()->has_facet("config"));
}

}  // namespace thingtalk
