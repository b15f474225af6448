// thingtalk/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// A structured debug dump of a tree. Every node becomes an object with its
// kind under "type", its source range, its scalar fields and its children.
// Signatures are summarized by their argument lists.
//
#pragma once

#include <nlohmann/json.hpp>

#include "thingtalk/ast/program.hpp"

namespace thingtalk
{

/**
 * Serialize an AST node to JSON.
 *
 * @param node The AST node to serialize (can be any node type, or null)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Arguments and qualifiers of a signature
[[nodiscard]] nlohmann::json to_json(const ExpressionSignature & signature);

}  // namespace thingtalk
