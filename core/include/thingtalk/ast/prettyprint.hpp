// thingtalk/ast/prettyprint.hpp - Surface syntax emission
//
// Regenerates program text from a tree. Emission is one way: the output is
// valid surface syntax but formatting (line breaks, parenthesization) is
// normalized rather than preserved.
//
#pragma once

#include <string>

#include "thingtalk/ast/program.hpp"

namespace thingtalk
{

[[nodiscard]] std::string to_source(const Value & value);
[[nodiscard]] std::string to_source(const Selector & selector);
[[nodiscard]] std::string to_source(const InputParam & param);
[[nodiscard]] std::string to_source(const Invocation & invocation);
[[nodiscard]] std::string to_source(const BooleanExpression & expr);
[[nodiscard]] std::string to_source(const ScalarExpression & expr);
[[nodiscard]] std::string to_source(const Table & table);
[[nodiscard]] std::string to_source(const Stream & stream);
[[nodiscard]] std::string to_source(const Action & action);
[[nodiscard]] std::string to_source(const PermissionFunction & fn);
[[nodiscard]] std::string to_source(const Statement & statement);
[[nodiscard]] std::string to_source(const PermissionRule & rule);
[[nodiscard]] std::string to_source(const Program & program);

/// `in req name : Type #_[...] #[...]`
[[nodiscard]] std::string to_source(const ArgumentDef & arg);
/// A function declaration as it appears in a class body, with the trailing `;`
[[nodiscard]] std::string to_source(const FunctionDef & fn);
/// A class declaration, one member per line
[[nodiscard]] std::string to_source(const ClassDef & klass);

/// Any node, dispatching on its family
[[nodiscard]] std::string to_source(const AstNode & node);

}  // namespace thingtalk
