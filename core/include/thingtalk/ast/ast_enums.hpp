// thingtalk/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds (generated from ast_nodes.def), argument directions, function
// types and the other small closed sets used by the tree.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace thingtalk
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by family so that family membership is a range check.
 */
enum class NodeKind : uint8_t {
#define AST_NODE(Class, Kind, Snake) Kind,
#include "thingtalk/ast/ast_nodes.def"
};

// ============================================================================
// Argument directions and function types
// ============================================================================

/**
 * Direction of a function argument.
 *
 * `None` is used for compound-type fields that are neither input nor
 * output on their own, and for arguments of computed signatures.
 */
enum class ArgDirection : uint8_t {
  InReq,  ///< in req
  InOpt,  ///< in opt
  Out,    ///< out
  None,
};

enum class FunctionType : uint8_t {
  Query,
  Stream,
  Action,
};

enum class SortDirection : uint8_t {
  Asc,
  Desc,
};

/// Anchor of a date edge: start_of(unit) / end_of(unit)
enum class DateEdgeKind : uint8_t {
  StartOf,
  EndOf,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(ArgDirection dir) noexcept
{
  switch (dir) {
    case ArgDirection::InReq:
      return "in req";
    case ArgDirection::InOpt:
      return "in opt";
    case ArgDirection::Out:
      return "out";
    case ArgDirection::None:
      return "none";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FunctionType type) noexcept
{
  switch (type) {
    case FunctionType::Query:
      return "query";
    case FunctionType::Stream:
      return "stream";
    case FunctionType::Action:
      return "action";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(SortDirection dir) noexcept
{
  switch (dir) {
    case SortDirection::Asc:
      return "asc";
    case SortDirection::Desc:
      return "desc";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(DateEdgeKind edge) noexcept
{
  switch (edge) {
    case DateEdgeKind::StartOf:
      return "start_of";
    case DateEdgeKind::EndOf:
      return "end_of";
  }
  return "";
}

[[nodiscard]] inline std::optional<FunctionType> function_type_from_string(
  std::string_view str) noexcept
{
  if (str == "query") return FunctionType::Query;
  if (str == "stream") return FunctionType::Stream;
  if (str == "action") return FunctionType::Action;
  return std::nullopt;
}

[[nodiscard]] inline std::optional<ArgDirection> arg_direction_from_string(
  std::string_view str) noexcept
{
  if (str == "in req") return ArgDirection::InReq;
  if (str == "in opt") return ArgDirection::InOpt;
  if (str == "out") return ArgDirection::Out;
  if (str == "none") return ArgDirection::None;
  return std::nullopt;
}

/// Printable name of a node kind, e.g. "FilteredTable"
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Kind, Snake) \
  case NodeKind::Kind:               \
    return #Kind;
#include "thingtalk/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_value_kind = NodeKind::BooleanValue;
inline constexpr NodeKind k_last_value_kind = NodeKind::NullValue;

inline constexpr NodeKind k_first_selector_kind = NodeKind::DeviceSelector;
inline constexpr NodeKind k_last_selector_kind = NodeKind::BuiltinDevice;

inline constexpr NodeKind k_first_boolean_kind = NodeKind::AndBooleanExpression;
inline constexpr NodeKind k_last_boolean_kind = NodeKind::FalseBooleanExpression;

inline constexpr NodeKind k_first_scalar_kind = NodeKind::PrimaryScalarExpression;
inline constexpr NodeKind k_last_scalar_kind = NodeKind::VarRefScalarExpression;

inline constexpr NodeKind k_first_table_kind = NodeKind::VarRefTable;
inline constexpr NodeKind k_last_table_kind = NodeKind::HistoryTable;

inline constexpr NodeKind k_first_stream_kind = NodeKind::VarRefStream;
inline constexpr NodeKind k_last_stream_kind = NodeKind::JoinStream;

inline constexpr NodeKind k_first_action_kind = NodeKind::VarRefAction;
inline constexpr NodeKind k_last_action_kind = NodeKind::InvocationAction;

inline constexpr NodeKind k_first_permission_kind = NodeKind::SpecifiedPermissionFunction;
inline constexpr NodeKind k_last_permission_kind = NodeKind::StarPermissionFunction;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Rule;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Assignment;

}  // namespace detail

#define THINGTALK_KIND_RANGE(name)                                                \
  [[nodiscard]] constexpr bool is_##name##_kind(NodeKind kind) noexcept          \
  {                                                                               \
    return kind >= detail::k_first_##name##_kind && kind <= detail::k_last_##name##_kind; \
  }

THINGTALK_KIND_RANGE(value)
THINGTALK_KIND_RANGE(selector)
THINGTALK_KIND_RANGE(boolean)
THINGTALK_KIND_RANGE(scalar)
THINGTALK_KIND_RANGE(table)
THINGTALK_KIND_RANGE(stream)
THINGTALK_KIND_RANGE(action)
THINGTALK_KIND_RANGE(permission)
THINGTALK_KIND_RANGE(stmt)

#undef THINGTALK_KIND_RANGE

}  // namespace thingtalk
