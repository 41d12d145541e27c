// cfgcat/syntax/parser.hpp - Recursive-descent manifest parser
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cfgcat/ast/ast.hpp"
#include "cfgcat/ast/ast_context.hpp"
#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/source_manager.hpp"
#include "cfgcat/syntax/token.hpp"

namespace cfgcat::syntax
{

enum class RecoverySet : uint32_t {
  None = 0,
  Statement = 1 << 0,  // ; or }
  Block = 1 << 1,      // }
  Argument = 1 << 2,   // ) or ]
};

inline RecoverySet operator|(RecoverySet a, RecoverySet b)
{
  return static_cast<RecoverySet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(RecoverySet a, RecoverySet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * Builds a Program from a token stream.
 *
 * Every syntax error is reported to the bag as a ParseError; the parser
 * then resynchronizes at the next statement so several errors can be
 * collected from one file. The returned Program is always non-null.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what, RecoverySet recovery = RecoverySet::None);

  void error_at(const Token & t, std::string_view msg);
  [[nodiscard]] bool enter_nesting();
  void synchronize_to_stmt();
  void synchronize_skip_block();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_statement_keyword(const Token & t);

  /// Lower-cased type or class name of a Name/TypeRef token, interned
  [[nodiscard]] std::string_view type_name_of(const Token & t);

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] gsl::span<Stmt *> parse_block_body();
  [[nodiscard]] NodeStmt * parse_node_stmt();
  [[nodiscard]] ClassStmt * parse_class_stmt();
  [[nodiscard]] DefineStmt * parse_define_stmt();
  [[nodiscard]] gsl::span<ParamDecl *> parse_params_opt();
  [[nodiscard]] IncludeStmt * parse_include_stmt();
  [[nodiscard]] ResourceStmt * parse_resource_stmt();
  [[nodiscard]] ResourceDefaultsStmt * parse_defaults_stmt();
  [[nodiscard]] AssignStmt * parse_assign_stmt();
  [[nodiscard]] IfStmt * parse_if_stmt();
  [[nodiscard]] CaseStmt * parse_case_stmt();
  [[nodiscard]] CollectorStmt * parse_collector_stmt();
  [[nodiscard]] ChainStmt * parse_chain_stmt();

  // Supporting nodes
  [[nodiscard]] ResourceBody * parse_resource_body();
  [[nodiscard]] std::vector<AttributeDecl *> parse_attribute_list();
  [[nodiscard]] AttributeDecl * parse_attribute();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_selector(Expr * subject);
  [[nodiscard]] std::vector<Expr *> parse_expr_list(TokenKind close, std::string_view what);
  [[nodiscard]] FunctionCallExpr * parse_call();
  [[nodiscard]] ResourceRefExpr * parse_resource_ref();

  // Strings
  [[nodiscard]] std::string unescape_single(std::string_view raw);
  [[nodiscard]] Expr * parse_double_quoted(const Token & tok);

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;

  /// Blocks and expressions currently open; past the limit the rest of the file is dropped
  size_t nesting_ = 0;
  bool nesting_exceeded_ = false;
};

}  // namespace cfgcat::syntax
