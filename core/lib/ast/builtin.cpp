// thingtalk/ast/builtin.cpp - Signatures of the builtin pseudo-functions
#include "thingtalk/ast/builtin.hpp"

namespace thingtalk::builtin
{

bool is_builtin_action(const std::string & name)
{
  return name == "notify" || name == "return" || name == "save";
}

FunctionDefPtr make_action(const std::string & name)
{
  if (!is_builtin_action(name)) {
    return nullptr;
  }
  return std::make_shared<FunctionDef>(
    FunctionType::Action, name, std::vector<std::string>{}, FunctionQualifiers{},
    std::vector<ArgumentDefPtr>{});
}

}  // namespace thingtalk::builtin
