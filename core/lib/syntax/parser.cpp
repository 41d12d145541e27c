// cfgcat/syntax/parser.cpp - Recursive-descent manifest parser
#include "cfgcat/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "cfgcat/basic/decimal.hpp"

namespace cfgcat::syntax
{
namespace
{

constexpr size_t k_max_nesting = 200;

/// Counts one open block or expression level
class NestingScope
{
public:
  explicit NestingScope(size_t & depth) : depth_(depth) { ++depth_; }
  ~NestingScope() { --depth_; }

  NestingScope(const NestingScope &) = delete;
  NestingScope & operator=(const NestingScope &) = delete;

private:
  size_t & depth_;
};

SourceRange join_ranges(SourceRange a, SourceRange b)
{
  if (!a.is_valid()) return b;
  if (!b.is_valid()) return a;
  return {a.get_begin(), b.get_end()};
}

bool is_name_char(char c)
{
  return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

/// Length of the qualified variable name starting at raw[pos] ("x", "::x", "a::b::x")
size_t scan_variable_name(std::string_view raw, size_t pos)
{
  size_t k = pos;
  if (raw.substr(k, 2) == "::") {
    k += 2;
  }
  const size_t first = k;
  while (true) {
    while (k < raw.size() && is_name_char(raw[k])) {
      ++k;
    }
    if (k > first && raw.substr(k, 2) == "::" && k + 2 < raw.size() && is_name_char(raw[k + 2])) {
      k += 2;
      continue;
    }
    break;
  }
  return k == first ? 0 : k - pos;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "end of file";
  }
  return "'" + std::string(t.text) + "'";
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what, RecoverySet recovery)
{
  if (match(k)) {
    return true;
  }

  error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));

  if (recovery == RecoverySet::None) {
    return false;
  }

  while (!at_eof()) {
    if (match(k)) {
      return true;
    }
    const TokenKind kind = cur().kind;
    if (
      (recovery & RecoverySet::Statement) &&
      (kind == TokenKind::Semicolon || kind == TokenKind::RBrace)) {
      return false;
    }
    if ((recovery & RecoverySet::Block) && kind == TokenKind::RBrace) {
      return false;
    }
    if (
      (recovery & RecoverySet::Argument) &&
      (kind == TokenKind::RParen || kind == TokenKind::RBracket)) {
      return false;
    }
    advance();
  }
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  if (nesting_exceeded_) {
    return;
  }
  diags_.report_error(DiagnosticKind::ParseError, std::string(msg))
    .with_location(source_.position(t.range.get_begin()));
}

bool Parser::enter_nesting()
{
  if (nesting_exceeded_) {
    return false;
  }
  if (nesting_ < k_max_nesting) {
    return true;
  }
  error_at(cur(), "nesting exceeds the limit of " + std::to_string(k_max_nesting) + " levels");
  nesting_exceeded_ = true;
  while (!at_eof()) {
    advance();
  }
  return false;
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace) || at(TokenKind::AtAt) || is_statement_keyword(cur())) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_skip_block()
{
  int brace_depth = 0;

  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++brace_depth;
      advance();
      continue;
    }

    if (at(TokenKind::RBrace)) {
      if (brace_depth == 0) {
        // Belongs to an enclosing block
        return;
      }
      --brace_depth;
      advance();
      if (brace_depth == 0) {
        return;
      }
      continue;
    }

    if (brace_depth == 0 && (match(TokenKind::Semicolon) || is_statement_keyword(cur()))) {
      return;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Name && t.text == kw;
}

bool Parser::is_statement_keyword(const Token & t)
{
  static constexpr std::string_view k_keywords[] = {
    "node", "class", "define", "include", "contain", "if", "unless", "case"};
  return t.kind == TokenKind::Name &&
         std::find(std::begin(k_keywords), std::end(k_keywords), t.text) != std::end(k_keywords);
}

std::string_view Parser::type_name_of(const Token & t)
{
  std::string lower(t.text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ast_.intern(lower);
}

// ============================================================================
// Program / blocks
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<Stmt *> stmts;

  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    if (at(TokenKind::RBrace)) {
      error_at(cur(), "unexpected '}' at top level");
      advance();
      continue;
    }

    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    }
    if (idx_ == before) {
      advance();
    }
  }

  return ast_.create<Program>(
    ast_.copy_to_arena(stmts), SourceRange(0, static_cast<uint32_t>(source_.content().size())));
}

gsl::span<Stmt *> Parser::parse_block_body()
{
  if (!enter_nesting()) {
    return {};
  }
  const NestingScope nesting(nesting_);
  if (!expect(TokenKind::LBrace, "'{'")) {
    synchronize_to_stmt();
    return {};
  }

  std::vector<Stmt *> stmts;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    }
    if (idx_ == before) {
      advance();
    }
  }
  expect(TokenKind::RBrace, "'}' to close the block");
  return ast_.copy_to_arena(stmts);
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::AtAt:
      return parse_resource_stmt();

    case TokenKind::Variable:
      if (cur(1).kind == TokenKind::Eq) {
        return parse_assign_stmt();
      }
      error_at(cur(1), "expected '=' after " + describe(t));
      break;

    case TokenKind::TypeRef:
      if (cur(1).kind == TokenKind::LBrace) {
        return parse_defaults_stmt();
      }
      if (cur(1).kind == TokenKind::LCollect) {
        return parse_collector_stmt();
      }
      if (cur(1).kind == TokenKind::LBracket) {
        return parse_chain_stmt();
      }
      error_at(t, "expected '{', '[' or '<<|' after type reference " + describe(t));
      break;

    case TokenKind::Name:
      if (is_kw("node", t)) {
        return parse_node_stmt();
      }
      if (is_kw("class", t) && cur(1).kind != TokenKind::LBrace) {
        return parse_class_stmt();
      }
      if (is_kw("define", t)) {
        return parse_define_stmt();
      }
      if (is_kw("include", t) || is_kw("contain", t)) {
        return parse_include_stmt();
      }
      if (is_kw("if", t) || is_kw("unless", t)) {
        return parse_if_stmt();
      }
      if (is_kw("case", t)) {
        return parse_case_stmt();
      }
      if (cur(1).kind == TokenKind::LBrace) {
        return parse_resource_stmt();
      }
      if (cur(1).kind == TokenKind::LParen) {
        FunctionCallExpr * call = parse_call();
        return ast_.create<CallStmt>(call, call->get_range());
      }
      error_at(t, "expected statement, found " + describe(t));
      break;

    default:
      error_at(t, "expected statement, found " + describe(t));
      break;
  }

  if (!at_eof()) {
    advance();
  }
  synchronize_to_stmt();
  return nullptr;
}

NodeStmt * Parser::parse_node_stmt()
{
  const Token start = advance();  // node

  std::vector<std::string_view> names;
  do {
    const Token & n = cur();
    if (n.kind == TokenKind::SqString) {
      advance();
      names.push_back(ast_.intern(unescape_single(n.text)));
    } else if (n.kind == TokenKind::DqString || n.kind == TokenKind::Name) {
      advance();
      names.push_back(ast_.intern(n.text));
    } else {
      error_at(n, "expected node name, found " + describe(n));
      break;
    }
  } while (match(TokenKind::Comma));

  auto body = parse_block_body();
  return ast_.create<NodeStmt>(
    ast_.copy_to_arena(names), body, join_ranges(start.range, prev().range));
}

ClassStmt * Parser::parse_class_stmt()
{
  const Token start = advance();  // class

  const Token & name = cur();
  if (name.kind != TokenKind::Name) {
    error_at(name, "expected class name, found " + describe(name));
    synchronize_skip_block();
    return nullptr;
  }
  advance();

  auto params = parse_params_opt();

  std::string_view parent;
  if (is_kw("inherits", cur())) {
    advance();
    if (at(TokenKind::Name)) {
      parent = type_name_of(advance());
    } else {
      error_at(cur(), "expected class name after 'inherits'");
    }
  }

  auto body = parse_block_body();
  return ast_.create<ClassStmt>(
    type_name_of(name), params, parent, body, join_ranges(start.range, prev().range));
}

DefineStmt * Parser::parse_define_stmt()
{
  const Token start = advance();  // define

  const Token & name = cur();
  if (name.kind != TokenKind::Name) {
    error_at(name, "expected defined type name, found " + describe(name));
    synchronize_skip_block();
    return nullptr;
  }
  advance();

  auto params = parse_params_opt();
  auto body = parse_block_body();
  return ast_.create<DefineStmt>(
    type_name_of(name), params, body, join_ranges(start.range, prev().range));
}

gsl::span<ParamDecl *> Parser::parse_params_opt()
{
  if (!match(TokenKind::LParen)) {
    return {};
  }

  std::vector<ParamDecl *> params;
  while (!at(TokenKind::RParen) && !at_eof()) {
    const Token & var = cur();
    if (!match(TokenKind::Variable)) {
      error_at(var, "expected parameter variable, found " + describe(var));
      break;
    }
    Expr * default_value = nullptr;
    if (match(TokenKind::Eq)) {
      default_value = parse_expr();
    }
    params.push_back(ast_.create<ParamDecl>(
      ast_.intern(var.text), default_value, join_ranges(var.range, prev().range)));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RParen, "')' after parameters", RecoverySet::Argument);
  return ast_.copy_to_arena(params);
}

IncludeStmt * Parser::parse_include_stmt()
{
  const Token start = advance();  // include / contain

  std::vector<Expr *> classes;
  do {
    classes.push_back(parse_expr());
  } while (match(TokenKind::Comma));

  return ast_.create<IncludeStmt>(
    ast_.copy_to_arena(classes), start.text == "contain", join_ranges(start.range, prev().range));
}

ResourceStmt * Parser::parse_resource_stmt()
{
  const Token start = cur();
  const bool exported = match(TokenKind::AtAt);

  const Token & type_tok = cur();
  if (type_tok.kind != TokenKind::Name) {
    error_at(type_tok, "expected resource type after '@@', found " + describe(type_tok));
    synchronize_skip_block();
    return nullptr;
  }
  advance();

  if (!expect(TokenKind::LBrace, "'{' after resource type")) {
    synchronize_skip_block();
    return nullptr;
  }

  std::vector<ResourceBody *> bodies;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (ResourceBody * body = parse_resource_body()) {
      bodies.push_back(body);
    }
    if (!match(TokenKind::Semicolon)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' after resource body", RecoverySet::Block);

  return ast_.create<ResourceStmt>(
    type_name_of(type_tok), exported, ast_.copy_to_arena(bodies),
    join_ranges(start.range, prev().range));
}

ResourceDefaultsStmt * Parser::parse_defaults_stmt()
{
  const Token & type_tok = advance();
  advance();  // {

  auto attrs = parse_attribute_list();
  expect(TokenKind::RBrace, "'}' after resource defaults", RecoverySet::Block);

  return ast_.create<ResourceDefaultsStmt>(
    type_name_of(type_tok), ast_.copy_to_arena(attrs), join_ranges(type_tok.range, prev().range));
}

AssignStmt * Parser::parse_assign_stmt()
{
  const Token & var = advance();
  advance();  // =

  if (var.text.find("::") != std::string_view::npos) {
    error_at(var, "cannot assign to qualified variable $" + std::string(var.text));
  }

  Expr * value = parse_expr();
  return ast_.create<AssignStmt>(
    ast_.intern(var.text), value, join_ranges(var.range, value->get_range()));
}

IfStmt * Parser::parse_if_stmt()
{
  const Token start = advance();  // if / unless
  const bool negate = start.text == "unless";

  std::vector<IfBranch *> branches;

  Expr * cond = parse_expr();
  if (negate) {
    cond = ast_.create<UnaryExpr>(UnaryOp::Not, cond, cond->get_range());
  }
  auto body = parse_block_body();
  branches.push_back(ast_.create<IfBranch>(cond, body, join_ranges(start.range, prev().range)));

  while (!negate && is_kw("elsif", cur())) {
    const Token kw = advance();
    Expr * elsif_cond = parse_expr();
    auto elsif_body = parse_block_body();
    branches.push_back(
      ast_.create<IfBranch>(elsif_cond, elsif_body, join_ranges(kw.range, prev().range)));
  }

  if (is_kw("else", cur())) {
    const Token kw = advance();
    auto else_body = parse_block_body();
    branches.push_back(
      ast_.create<IfBranch>(nullptr, else_body, join_ranges(kw.range, prev().range)));
  }

  return ast_.create<IfStmt>(
    ast_.copy_to_arena(branches), join_ranges(start.range, prev().range));
}

CaseStmt * Parser::parse_case_stmt()
{
  const Token start = advance();  // case

  Expr * subject = parse_expr();
  if (!expect(TokenKind::LBrace, "'{' after case subject")) {
    synchronize_skip_block();
    return nullptr;
  }

  std::vector<CaseClause *> clauses;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token first = cur();
    const size_t before = idx_;

    std::vector<Expr *> values;
    bool is_default = false;
    do {
      if (is_kw("default", cur())) {
        advance();
        is_default = true;
      } else {
        values.push_back(parse_expr());
      }
    } while (match(TokenKind::Comma));

    expect(TokenKind::Colon, "':' after case values");
    auto body = parse_block_body();
    clauses.push_back(ast_.create<CaseClause>(
      ast_.copy_to_arena(values), is_default, body, join_ranges(first.range, prev().range)));

    if (idx_ == before) {
      advance();
    }
  }
  expect(TokenKind::RBrace, "'}' to close the case statement");

  return ast_.create<CaseStmt>(
    subject, ast_.copy_to_arena(clauses), join_ranges(start.range, prev().range));
}

CollectorStmt * Parser::parse_collector_stmt()
{
  const Token & type_tok = advance();
  advance();  // <<|

  std::string_view attr;
  BinaryOp op = BinaryOp::Eq;
  Expr * value = nullptr;

  if (at(TokenKind::Name)) {
    attr = ast_.intern(advance().text);
    if (match(TokenKind::Ne)) {
      op = BinaryOp::Ne;
    } else if (!match(TokenKind::EqEq)) {
      error_at(cur(), "expected '==' or '!=' in collector query, found " + describe(cur()));
    }
    value = parse_unary();
  }

  expect(TokenKind::RCollect, "'|>>' to close the collector", RecoverySet::Statement);

  return ast_.create<CollectorStmt>(
    type_name_of(type_tok), attr, op, value, join_ranges(type_tok.range, prev().range));
}

ChainStmt * Parser::parse_chain_stmt()
{
  const Token start = cur();

  std::vector<Expr *> operands;
  std::vector<ChainOp> ops;

  operands.push_back(parse_resource_ref());
  while (at(TokenKind::InEdge) || at(TokenKind::InEdgeSub)) {
    ops.push_back(advance().kind == TokenKind::InEdge ? ChainOp::Before : ChainOp::Notify);
    if (!at(TokenKind::TypeRef)) {
      error_at(cur(), "expected resource reference after relationship arrow");
      synchronize_to_stmt();
      return nullptr;
    }
    operands.push_back(parse_resource_ref());
  }

  if (ops.empty()) {
    error_at(cur(), "expected '->' or '~>' after resource reference, found " + describe(cur()));
    synchronize_to_stmt();
    return nullptr;
  }

  return ast_.create<ChainStmt>(
    ast_.copy_to_arena(operands), ast_.copy_to_arena(ops),
    join_ranges(start.range, prev().range));
}

// ============================================================================
// Supporting nodes
// ============================================================================

ResourceBody * Parser::parse_resource_body()
{
  const Token first = cur();
  Expr * title = parse_expr();
  if (!expect(TokenKind::Colon, "':' after resource title", RecoverySet::Statement)) {
    return nullptr;
  }

  auto attrs = parse_attribute_list();
  return ast_.create<ResourceBody>(
    title, ast_.copy_to_arena(attrs), join_ranges(first.range, prev().range));
}

std::vector<AttributeDecl *> Parser::parse_attribute_list()
{
  std::vector<AttributeDecl *> attrs;
  while (at(TokenKind::Name)) {
    attrs.push_back(parse_attribute());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  return attrs;
}

AttributeDecl * Parser::parse_attribute()
{
  const Token & name = advance();
  expect(TokenKind::FatArrow, "'=>' after attribute name");
  Expr * value = parse_expr();
  return ast_.create<AttributeDecl>(
    ast_.intern(name.text), value, join_ranges(name.range, value->get_range()));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (is_kw("or", cur())) {
    advance();
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_equality();
  while (is_kw("and", cur())) {
    advance();
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_unary();
  while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    const BinaryOp op = advance().kind == TokenKind::EqEq ? BinaryOp::Eq : BinaryOp::Ne;
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  if (!enter_nesting()) {
    return ast_.create<MissingExpr>(cur().range);
  }
  const NestingScope nesting(nesting_);
  if (at(TokenKind::Bang)) {
    const Token op = advance();
    Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(
      UnaryOp::Not, operand, join_ranges(op.range, operand->get_range()));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();
  if (at(TokenKind::Question)) {
    e = parse_selector(e);
  }
  return e;
}

Expr * Parser::parse_selector(Expr * subject)
{
  advance();  // ?
  if (!expect(TokenKind::LBrace, "'{' after '?'")) {
    return subject;
  }

  std::vector<SelectorCase *> cases;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token first = cur();
    Expr * match_expr = nullptr;
    if (is_kw("default", cur())) {
      advance();
    } else {
      match_expr = parse_expr();
    }
    expect(TokenKind::FatArrow, "'=>' in selector case");
    Expr * result = parse_expr();
    cases.push_back(
      ast_.create<SelectorCase>(match_expr, result, join_ranges(first.range, prev().range)));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' to close the selector", RecoverySet::Block);

  return ast_.create<SelectorExpr>(
    subject, ast_.copy_to_arena(cases), join_ranges(subject->get_range(), prev().range));
}

std::vector<Expr *> Parser::parse_expr_list(TokenKind close, std::string_view what)
{
  std::vector<Expr *> out;
  while (!at(close) && !at_eof()) {
    out.push_back(parse_expr());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(close, what, RecoverySet::Argument);
  return out;
}

FunctionCallExpr * Parser::parse_call()
{
  const Token & name = advance();
  advance();  // (
  auto args = parse_expr_list(TokenKind::RParen, "')' after function arguments");
  return ast_.create<FunctionCallExpr>(
    ast_.intern(name.text), ast_.copy_to_arena(args), join_ranges(name.range, prev().range));
}

ResourceRefExpr * Parser::parse_resource_ref()
{
  const Token & type_tok = advance();
  expect(TokenKind::LBracket, "'[' after type reference");
  auto titles = parse_expr_list(TokenKind::RBracket, "']' after resource titles");
  return ast_.create<ResourceRefExpr>(
    type_name_of(type_tok), ast_.copy_to_arena(titles), join_ranges(type_tok.range, prev().range));
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::SqString:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(unescape_single(t.text)), t.range);

    case TokenKind::DqString:
      advance();
      return parse_double_quoted(t);

    case TokenKind::Number:
      advance();
      if (!Decimal::parse(t.text)) {
        error_at(t, "invalid number " + describe(t));
      }
      return ast_.create<NumberLiteralExpr>(ast_.intern(t.text), t.range);

    case TokenKind::Variable:
      advance();
      return ast_.create<VarRefExpr>(ast_.intern(t.text), t.range);

    case TokenKind::LBracket: {
      advance();
      auto elems = parse_expr_list(TokenKind::RBracket, "']' after array elements");
      return ast_.create<ArrayExpr>(
        ast_.copy_to_arena(elems), join_ranges(t.range, prev().range));
    }

    case TokenKind::TypeRef:
      if (cur(1).kind == TokenKind::LBracket) {
        return parse_resource_ref();
      }
      error_at(t, "expected '[' after type reference " + describe(t));
      advance();
      return ast_.create<MissingExpr>(t.range);

    case TokenKind::LParen: {
      advance();
      Expr * e = parse_expr();
      expect(TokenKind::RParen, "')' after expression");
      return e;
    }

    case TokenKind::Name:
      if (t.text == "true" || t.text == "false") {
        advance();
        return ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
      }
      if (t.text == "undef") {
        advance();
        return ast_.create<UndefLiteralExpr>(t.range);
      }
      if (cur(1).kind == TokenKind::LParen) {
        return parse_call();
      }
      advance();
      return ast_.create<BareWordExpr>(ast_.intern(t.text), t.range);

    default:
      break;
  }

  error_at(t, "expected expression, found " + describe(t));
  if (
    t.kind != TokenKind::Semicolon && t.kind != TokenKind::RBrace &&
    t.kind != TokenKind::RParen && t.kind != TokenKind::RBracket && t.kind != TokenKind::Eof) {
    advance();
  }
  return ast_.create<MissingExpr>(t.range);
}

// ============================================================================
// Strings
// ============================================================================

std::string Parser::unescape_single(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 1 < raw.size() && (raw[i + 1] == '\'' || raw[i + 1] == '\\')) {
      out.push_back(raw[i + 1]);
      ++i;
      continue;
    }
    out.push_back(raw[i]);
  }
  return out;
}

Expr * Parser::parse_double_quoted(const Token & tok)
{
  const std::string_view raw = tok.text;

  std::vector<Expr *> parts;
  std::string literal;
  bool interpolated = false;

  const auto flush = [&]() {
    if (!literal.empty()) {
      parts.push_back(ast_.create<StringLiteralExpr>(ast_.intern(literal), tok.range));
      literal.clear();
    }
  };
  const auto add_var = [&](std::string_view name) {
    flush();
    parts.push_back(ast_.create<VarRefExpr>(ast_.intern(name), tok.range));
    interpolated = true;
  };

  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];

    if (c == '\\' && i + 1 < raw.size()) {
      const char n = raw[i + 1];
      switch (n) {
        case 'n':
          literal.push_back('\n');
          ++i;
          continue;
        case 't':
          literal.push_back('\t');
          ++i;
          continue;
        case '"':
        case '\\':
        case '$':
          literal.push_back(n);
          ++i;
          continue;
        default:
          // Unknown escapes keep their backslash
          literal.push_back(c);
          continue;
      }
    }

    if (c == '$' && i + 1 < raw.size() && raw[i + 1] == '{') {
      const size_t close = raw.find('}', i + 2);
      if (close == std::string_view::npos) {
        error_at(tok, "unterminated '${' in string");
        break;
      }
      std::string_view inner = trim(raw.substr(i + 2, close - i - 2));
      if (!inner.empty() && inner.front() == '$') {
        inner.remove_prefix(1);
      }
      if (inner.empty() || scan_variable_name(inner, 0) != inner.size()) {
        error_at(tok, "unsupported interpolation '${" + std::string(inner) + "}'");
      } else {
        add_var(inner);
      }
      i = close;
      continue;
    }

    if (c == '$') {
      const size_t len = scan_variable_name(raw, i + 1);
      if (len == 0) {
        literal.push_back('$');
        continue;
      }
      add_var(raw.substr(i + 1, len));
      i += len;
      continue;
    }

    literal.push_back(c);
  }

  if (!interpolated) {
    return ast_.create<StringLiteralExpr>(ast_.intern(literal), tok.range);
  }
  flush();
  return ast_.create<InterpolatedStringExpr>(ast_.copy_to_arena(parts), tok.range);
}

}  // namespace cfgcat::syntax
