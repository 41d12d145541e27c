// cfgcat/syntax/lexer.cpp - Manifest tokenizer
#include "cfgcat/syntax/lexer.hpp"

#include <cctype>

namespace cfgcat::syntax
{
namespace
{

bool is_name_char(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(unsigned char c) { return std::isdigit(c) != 0; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_trivia()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }
    if (c == '#') {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    if (starts_with("/*")) {
      const size_t start = pos_;
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (eof()) {
        pos_ = start;
        return false;
      }
      advance(2);
      continue;
    }
    break;
  }
  return true;
}

void Lexer::scan_qualified_name()
{
  while (true) {
    while (!eof() && is_name_char(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    if (starts_with("::") && is_name_char(static_cast<unsigned char>(peek(2)))) {
      advance(2);
      continue;
    }
    return;
  }
}

Token Lexer::lex_name_or_typeref()
{
  const auto start = static_cast<uint32_t>(pos_);
  const bool upper = std::isupper(static_cast<unsigned char>(peek())) != 0;
  scan_qualified_name();
  return make(
    upper ? TokenKind::TypeRef : TokenKind::Name, start, static_cast<uint32_t>(pos_));
}

Token Lexer::lex_variable()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // $

  const auto name_start = static_cast<uint32_t>(pos_);
  if (starts_with("::")) {
    advance(2);
  }
  if (!is_name_char(static_cast<unsigned char>(peek()))) {
    return make(TokenKind::Unknown, start, static_cast<uint32_t>(pos_));
  }
  scan_qualified_name();

  Token t = make(TokenKind::Variable, start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(name_start, pos_ - name_start);
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  if (peek() == '-') {
    advance(1);
  }
  while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  if (peek() == '.' && is_digit(static_cast<unsigned char>(peek(1)))) {
    advance(1);
    while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    size_t look = 1;
    if (peek(look) == '+' || peek(look) == '-') {
      ++look;
    }
    if (is_digit(static_cast<unsigned char>(peek(look)))) {
      advance(look);
      while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
    }
  }

  // 12abc is neither a number nor a name
  if (!eof() && is_name_char(static_cast<unsigned char>(peek()))) {
    scan_qualified_name();
    return make(TokenKind::Unknown, start, static_cast<uint32_t>(pos_));
  }
  return make(TokenKind::Number, start, static_cast<uint32_t>(pos_));
}

Token Lexer::lex_string(char quote)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != quote) {
    if (peek() == '\\') {
      advance(1);
      if (eof()) {
        break;
      }
    }
    advance(1);
  }

  if (eof()) {
    // Unterminated: the whole rest of the file is the bad token
    return make(TokenKind::Unknown, start, static_cast<uint32_t>(pos_));
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t = make(
    quote == '\'' ? TokenKind::SqString : TokenKind::DqString, start,
    static_cast<uint32_t>(pos_));
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::next_token()
{
  if (!skip_trivia()) {
    // Unterminated block comment
    const auto start = static_cast<uint32_t>(pos_);
    pos_ = src_.size();
    return make(TokenKind::Unknown, start, static_cast<uint32_t>(pos_));
  }

  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    return make(TokenKind::Eof, start, start);
  }

  const auto c = static_cast<unsigned char>(peek());

  if (std::isalpha(c) != 0 || c == '_') {
    return lex_name_or_typeref();
  }
  // ::apache names the same class as apache
  if (starts_with("::") && std::isalpha(static_cast<unsigned char>(peek(2))) != 0) {
    advance(2);
    Token t = lex_name_or_typeref();
    t.range = SourceRange(start, t.end());
    return t;
  }
  if (is_digit(c) || (c == '-' && is_digit(static_cast<unsigned char>(peek(1))))) {
    return lex_number();
  }
  if (c == '$') {
    return lex_variable();
  }
  if (c == '\'' || c == '"') {
    return lex_string(static_cast<char>(c));
  }

  struct Punct
  {
    std::string_view text;
    TokenKind kind;
  };
  // Longest spellings first
  static constexpr Punct k_puncts[] = {
    {"<<|", TokenKind::LCollect}, {"|>>", TokenKind::RCollect}, {"=>", TokenKind::FatArrow},
    {"==", TokenKind::EqEq},      {"!=", TokenKind::Ne},        {"->", TokenKind::InEdge},
    {"~>", TokenKind::InEdgeSub}, {"@@", TokenKind::AtAt},      {"(", TokenKind::LParen},
    {")", TokenKind::RParen},     {"{", TokenKind::LBrace},     {"}", TokenKind::RBrace},
    {"[", TokenKind::LBracket},   {"]", TokenKind::RBracket},   {",", TokenKind::Comma},
    {":", TokenKind::Colon},      {";", TokenKind::Semicolon},  {"?", TokenKind::Question},
    {"!", TokenKind::Bang},       {"=", TokenKind::Eq},
  };

  for (const auto & p : k_puncts) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return make(p.kind, start, static_cast<uint32_t>(pos_));
    }
  }

  advance(1);
  return make(TokenKind::Unknown, start, static_cast<uint32_t>(pos_));
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(t);
    if (done) {
      break;
    }
  }
  return out;
}

}  // namespace cfgcat::syntax
