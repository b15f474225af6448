// thingtalk/test_support/sample_classes.hpp - Device classes shared by the unit tests
//
// A small Thingpedia: a social network with list queries and actions, a
// class whose functions extend each other, and a query that cannot be
// invoked without a filter.
//
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "thingtalk/ast/class_def.hpp"
#include "thingtalk/ast/values.hpp"

namespace thingtalk::test_support
{

inline ArgumentDefPtr in_req(std::string name, TypePtr type)
{
  return std::make_shared<ArgumentDef>(ArgDirection::InReq, std::move(name), std::move(type));
}

inline ArgumentDefPtr in_opt(std::string name, TypePtr type)
{
  return std::make_shared<ArgumentDef>(ArgDirection::InOpt, std::move(name), std::move(type));
}

inline ArgumentDefPtr out(std::string name, TypePtr type)
{
  return std::make_shared<ArgumentDef>(ArgDirection::Out, std::move(name), std::move(type));
}

inline FunctionDefPtr make_query(
  std::string name, std::vector<ArgumentDefPtr> args, bool is_list = true,
  bool is_monitorable = true, std::vector<std::string> extends = {}, AnnotationMap impl = {})
{
  return std::make_shared<FunctionDef>(
    FunctionType::Query, std::move(name), std::move(extends),
    FunctionQualifiers{is_list, is_monitorable}, std::move(args), NLAnnotationMap{},
    std::move(impl));
}

inline FunctionDefPtr make_action(std::string name, std::vector<ArgumentDefPtr> args)
{
  return std::make_shared<FunctionDef>(
    FunctionType::Action, std::move(name), std::vector<std::string>{}, FunctionQualifiers{},
    std::move(args));
}

/**
 * @com.twitter
 *   monitorable list query search(in req query : String, out id, out text, out author, out count)
 *   monitorable list query home_timeline(out id, out text, out author, out hashtags)
 *   query profile(out user : Entity(tt:username), out location : Location)
 *   action post(in req status : String)
 *   action retweet(in req tweet_id : Entity(com.twitter:id))
 */
inline ClassDefPtr twitter_class()
{
  ClassDef::FunctionMap queries;
  queries["search"] = make_query(
    "search", {in_req("query", Type::string()), out("id", Type::entity("com.twitter:id")),
               out("text", Type::string()), out("author", Type::entity("tt:username")),
               out("count", Type::number())});
  queries["home_timeline"] = make_query(
    "home_timeline",
    {out("id", Type::entity("com.twitter:id")), out("text", Type::string()),
     out("author", Type::entity("tt:username")),
     out("hashtags", Type::array(Type::entity("tt:hashtag")))});
  queries["profile"] = make_query(
    "profile", {out("user", Type::entity("tt:username")), out("location", Type::location())},
    false, false);

  ClassDef::FunctionMap actions;
  actions["post"] = make_action("post", {in_req("status", Type::string())});
  actions["retweet"] =
    make_action("retweet", {in_req("tweet_id", Type::entity("com.twitter:id"))});

  return ClassDef::create(
    "com.twitter", {}, {}, std::move(queries), std::move(actions));
}

/**
 * @org.example.media
 *   list query media(out id : Entity(org.example.media:id), out title : String)
 *   list query video extends media(out duration : Measure(ms))
 *   list query movie extends video(in opt genre : String, out rating : Number)
 */
inline ClassDefPtr media_class()
{
  ClassDef::FunctionMap queries;
  queries["media"] = make_query(
    "media",
    {out("id", Type::entity("org.example.media:id")), out("title", Type::string())}, true,
    false);
  queries["video"] =
    make_query("video", {out("duration", Type::measure("ms"))}, true, false, {"media"});
  queries["movie"] = make_query(
    "movie", {in_opt("genre", Type::string()), out("rating", Type::number())}, true, false,
    {"video"});

  return ClassDef::create("org.example.media", {}, {}, std::move(queries), {});
}

/**
 * @org.example.ledger
 *   #[require_filter=true] list query entries(out id : String, out amount : Currency,
 *                                              out date : Date)
 */
inline ClassDefPtr ledger_class()
{
  AnnotationMap impl;
  impl["require_filter"] = std::make_shared<BooleanValue>(true);

  ClassDef::FunctionMap queries;
  queries["entries"] = make_query(
    "entries",
    {out("id", Type::string()), out("amount", Type::currency()), out("date", Type::date())}, true,
    false, {}, std::move(impl));

  return ClassDef::create("org.example.ledger", {}, {}, std::move(queries), {});
}

}  // namespace thingtalk::test_support
