// cfgcat/ast/ast.hpp - Manifest AST node classes
//
// Nodes are arena-allocated by AstContext and use classof() for
// isa/cast/dyn_cast. Type names are stored lower-case ("file", "foo::bar")
// whatever spelling the source used.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "cfgcat/ast/ast_enums.hpp"
#include "cfgcat/basic/casting.hpp"
#include "cfgcat/basic/source_manager.hpp"

namespace cfgcat
{

// ============================================================================
// Base Classes
// ============================================================================

class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base implementing classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category base (Expr, Stmt or AstNode)
 * @tparam K The NodeKind of Derived
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Leaf base for nodes without a category
class SupportNode : public AstNode
{
protected:
  SupportNode(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class ParamDecl;
class AttributeDecl;
class ResourceBody;
class IfBranch;
class CaseClause;
class SelectorCase;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Single-quoted string, or a double-quoted one without interpolation.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;  ///< Escapes already resolved

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Double-quoted string with "$var" / "${var}" parts.
class InterpolatedStringExpr
: public NodeBase<InterpolatedStringExpr, Expr, NodeKind::InterpolatedString>
{
public:
  gsl::span<Expr *> parts;  ///< StringLiteralExpr and VarRefExpr, in source order

  explicit InterpolatedStringExpr(gsl::span<Expr *> p, SourceRange r = {}) : NodeBase(r), parts(p)
  {
  }
};

class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  std::string_view text;  ///< Decimal::parse accepts it

  explicit NumberLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class UndefLiteralExpr : public NodeBase<UndefLiteralExpr, Expr, NodeKind::UndefLiteral>
{
public:
  explicit UndefLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// $x, $::x (top scope) or $a::b::x (scope of class a::b). Stored without '$'.
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Unquoted word used as a value: `ensure => present`
class BareWordExpr : public NodeBase<BareWordExpr, Expr, NodeKind::BareWord>
{
public:
  std::string_view word;

  explicit BareWordExpr(std::string_view w, SourceRange r = {}) : NodeBase(r), word(w) {}
};

class ArrayExpr : public NodeBase<ArrayExpr, Expr, NodeKind::Array>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/// File['/a', '/b']
class ResourceRefExpr : public NodeBase<ResourceRefExpr, Expr, NodeKind::ResourceRef>
{
public:
  std::string_view type_name;
  gsl::span<Expr *> titles;

  ResourceRefExpr(std::string_view t, gsl::span<Expr *> ti, SourceRange r = {})
  : NodeBase(r), type_name(t), titles(ti)
  {
  }
};

class FunctionCallExpr : public NodeBase<FunctionCallExpr, Expr, NodeKind::FunctionCall>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  FunctionCallExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * rr, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(rr)
  {
  }
};

/// $x ? { 'a' => 1, default => 2 }
class SelectorExpr : public NodeBase<SelectorExpr, Expr, NodeKind::Selector>
{
public:
  Expr * subject;
  gsl::span<SelectorCase *> cases;

  SelectorExpr(Expr * s, gsl::span<SelectorCase *> c, SourceRange r = {})
  : NodeBase(r), subject(s), cases(c)
  {
  }
};

/// Parser recovery placeholder
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::Missing>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// node 'web1.example.com', 'web2' { ... }; `node default` is stored as "default"
class NodeStmt : public NodeBase<NodeStmt, Stmt, NodeKind::NodeDef>
{
public:
  gsl::span<std::string_view> names;
  gsl::span<Stmt *> body;

  NodeStmt(gsl::span<std::string_view> n, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), names(n), body(b)
  {
  }
};

class ClassStmt : public NodeBase<ClassStmt, Stmt, NodeKind::ClassDef>
{
public:
  std::string_view name;
  gsl::span<ParamDecl *> params;
  std::string_view parent;  ///< `inherits` target, empty when none
  gsl::span<Stmt *> body;

  ClassStmt(
    std::string_view n, gsl::span<ParamDecl *> p, std::string_view parent_name,
    gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), name(n), params(p), parent(parent_name), body(b)
  {
  }
};

class DefineStmt : public NodeBase<DefineStmt, Stmt, NodeKind::DefineDef>
{
public:
  std::string_view name;
  gsl::span<ParamDecl *> params;
  gsl::span<Stmt *> body;

  DefineStmt(
    std::string_view n, gsl::span<ParamDecl *> p, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), name(n), params(p), body(b)
  {
  }
};

/// include a, b / contain a
class IncludeStmt : public NodeBase<IncludeStmt, Stmt, NodeKind::Include>
{
public:
  gsl::span<Expr *> classes;
  bool contain = false;

  IncludeStmt(gsl::span<Expr *> c, bool is_contain, SourceRange r = {})
  : NodeBase(r), classes(c), contain(is_contain)
  {
  }
};

/// [@@]type { title: attr => v, ...; title2: ... }
class ResourceStmt : public NodeBase<ResourceStmt, Stmt, NodeKind::Resource>
{
public:
  std::string_view type_name;
  bool exported = false;
  gsl::span<ResourceBody *> bodies;

  ResourceStmt(
    std::string_view t, bool is_exported, gsl::span<ResourceBody *> b, SourceRange r = {})
  : NodeBase(r), type_name(t), exported(is_exported), bodies(b)
  {
  }
};

/// File { mode => '0644' }
class ResourceDefaultsStmt
: public NodeBase<ResourceDefaultsStmt, Stmt, NodeKind::ResourceDefaults>
{
public:
  std::string_view type_name;
  gsl::span<AttributeDecl *> attrs;

  ResourceDefaultsStmt(std::string_view t, gsl::span<AttributeDecl *> a, SourceRange r = {})
  : NodeBase(r), type_name(t), attrs(a)
  {
  }
};

class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::Assign>
{
public:
  std::string_view name;
  Expr * value;

  AssignStmt(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// if / elsif / else; the else branch has a null condition and comes last
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  gsl::span<IfBranch *> branches;

  explicit IfStmt(gsl::span<IfBranch *> b, SourceRange r = {}) : NodeBase(r), branches(b) {}
};

class CaseStmt : public NodeBase<CaseStmt, Stmt, NodeKind::Case>
{
public:
  Expr * subject;
  gsl::span<CaseClause *> clauses;

  CaseStmt(Expr * s, gsl::span<CaseClause *> c, SourceRange r = {})
  : NodeBase(r), subject(s), clauses(c)
  {
  }
};

/// Function call in statement position: notice('x')
class CallStmt : public NodeBase<CallStmt, Stmt, NodeKind::Call>
{
public:
  FunctionCallExpr * call;

  explicit CallStmt(FunctionCallExpr * c, SourceRange r = {}) : NodeBase(r), call(c) {}
};

/// Type <<| attr == value |>>; an empty attr collects every exported resource of the type
class CollectorStmt : public NodeBase<CollectorStmt, Stmt, NodeKind::Collector>
{
public:
  std::string_view type_name;
  std::string_view attr;
  BinaryOp op = BinaryOp::Eq;
  Expr * value = nullptr;

  CollectorStmt(
    std::string_view t, std::string_view a, BinaryOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), type_name(t), attr(a), op(o), value(v)
  {
  }
};

/// A -> B ~> C; ops[i] links operands[i] and operands[i + 1]
class ChainStmt : public NodeBase<ChainStmt, Stmt, NodeKind::Chain>
{
public:
  gsl::span<Expr *> operands;
  gsl::span<ChainOp> ops;

  ChainStmt(gsl::span<Expr *> o, gsl::span<ChainOp> a, SourceRange r = {})
  : NodeBase(r), operands(o), ops(a)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class ParamDecl : public NodeBase<ParamDecl, SupportNode, NodeKind::Param>
{
public:
  std::string_view name;
  Expr * default_value;  ///< nullptr when the parameter is mandatory

  ParamDecl(std::string_view n, Expr * d, SourceRange r = {})
  : NodeBase(r), name(n), default_value(d)
  {
  }
};

class AttributeDecl : public NodeBase<AttributeDecl, SupportNode, NodeKind::Attribute>
{
public:
  std::string_view name;
  Expr * value;

  AttributeDecl(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

class ResourceBody : public NodeBase<ResourceBody, SupportNode, NodeKind::ResourceBody>
{
public:
  Expr * title;
  gsl::span<AttributeDecl *> attrs;

  ResourceBody(Expr * t, gsl::span<AttributeDecl *> a, SourceRange r = {})
  : NodeBase(r), title(t), attrs(a)
  {
  }
};

class IfBranch : public NodeBase<IfBranch, SupportNode, NodeKind::IfBranch>
{
public:
  Expr * condition;  ///< nullptr for else
  gsl::span<Stmt *> body;

  IfBranch(Expr * c, gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), condition(c), body(b)
  {
  }
};

class CaseClause : public NodeBase<CaseClause, SupportNode, NodeKind::CaseClause>
{
public:
  gsl::span<Expr *> values;
  bool is_default = false;
  gsl::span<Stmt *> body;

  CaseClause(gsl::span<Expr *> v, bool d, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), values(v), is_default(d), body(b)
  {
  }
};

class SelectorCase : public NodeBase<SelectorCase, SupportNode, NodeKind::SelectorCase>
{
public:
  Expr * match;  ///< nullptr for default
  Expr * result;

  SelectorCase(Expr * m, Expr * res, SourceRange r = {}) : NodeBase(r), match(m), result(res) {}
};

// ============================================================================
// Top-level
// ============================================================================

class Program : public NodeBase<Program, SupportNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> stmts;

  explicit Program(gsl::span<Stmt *> s = {}, SourceRange r = {}) : NodeBase(r), stmts(s) {}
};

}  // namespace cfgcat
