// thingtalk/ast/builtin.hpp - Signatures of the builtin pseudo-functions
#pragma once

#include <string>

#include "thingtalk/ast/function_def.hpp"

namespace thingtalk::builtin
{

/// True for notify, return and save
[[nodiscard]] bool is_builtin_action(const std::string & name);

/// A fresh signature for a builtin action, or null for other names
[[nodiscard]] FunctionDefPtr make_action(const std::string & name);

}  // namespace thingtalk::builtin
