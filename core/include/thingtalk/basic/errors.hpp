// thingtalk/basic/errors.hpp - Exception types raised by the core
//
// Programmer errors (a tree built or cloned incorrectly) derive from
// std::logic_error and are never recovered. Problems caused by input data
// derive from std::runtime_error. User-facing type errors do not throw;
// they are collected in a DiagnosticBag.
//
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace thingtalk
{

/// A node was constructed with a missing or ill-formed child.
class InvariantError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/// A signature could not resolve an inherited argument or parent function.
class ResolutionError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/// A class declaration is malformed (cyclic or dangling `extends`).
class InvalidClassError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

/// Value::to_js() was called on a value that needs resolution first.
class NotConstantError : public std::runtime_error
{
public:
  NotConstantError() : std::runtime_error("Value is not constant") {}
  using std::runtime_error::runtime_error;
};

/// A Thingpedia manifest could not be converted.
class ManifestError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// A type string could not be parsed.
class TypeParseError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

namespace detail
{

/// Throw InvariantError when a required child is missing.
template <typename Ptr>
inline Ptr && require_node(Ptr && ptr, const char * what)
{
  if (!ptr) {
    throw InvariantError(std::string(what) + " must not be null");
  }
  return std::forward<Ptr>(ptr);
}

}  // namespace detail

}  // namespace thingtalk
