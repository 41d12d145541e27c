// cfgcat/syntax/lexer.hpp - Manifest tokenizer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "cfgcat/syntax/token.hpp"

namespace cfgcat::syntax
{

/**
 * Splits manifest text into tokens, skipping whitespace and comments
 * (`# ...` and `/* ... *\/`). Malformed input becomes an Unknown token;
 * the parser reports it. The result always ends with an Eof token.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Whitespace and comments; returns false on an unterminated block comment
  bool skip_trivia();

  /// Consumes [a-zA-Z0-9_]+ segments joined by "::"
  void scan_qualified_name();

  [[nodiscard]] Token lex_name_or_typeref();
  [[nodiscard]] Token lex_variable();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(char quote);

  [[nodiscard]] Token make(TokenKind kind, uint32_t start, uint32_t end) const noexcept
  {
    Token t;
    t.kind = kind;
    t.range = SourceRange(start, end);
    t.text = src_.substr(start, end - start);
    return t;
  }

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace cfgcat::syntax
