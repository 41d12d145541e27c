// cfgcat/ast/ast_enums.hpp - Node kinds and operators of the manifest AST
#pragma once

#include <cstdint>
#include <string_view>

namespace cfgcat
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "cfgcat/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "cfgcat/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "cfgcat/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "cfgcat/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Snake;
#include "cfgcat/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  Eq,   ///< ==
  Ne,   ///< !=
  And,  ///< and
  Or,   ///< or
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
};

/// Relationship arrow of a chain statement
enum class ChainOp : uint8_t {
  Before,  ///< ->
  Notify,  ///< ~>
};

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ChainOp op) noexcept
{
  return op == ChainOp::Before ? "->" : "~>";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::StringLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Missing;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::NodeDef;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Chain;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace cfgcat
