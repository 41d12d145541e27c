// cfgcat/syntax/token.hpp - Manifest tokens
#pragma once

#include <cstdint>
#include <string_view>

#include "cfgcat/basic/source_manager.hpp"

namespace cfgcat::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Name,      // file, foo::bar, present, node, class ...
  TypeRef,   // File, Foo::Bar
  Variable,  // $x, $::x, $a::b::x (token.text excludes '$')
  Number,    // 42, -1, 0.5, 1e3
  SqString,  // '...' (token.text is the raw interior)
  DqString,  // "..." (token.text is the raw interior)

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Question,
  Bang,

  Eq,
  EqEq,
  Ne,
  FatArrow,  // =>

  InEdge,     // ->
  InEdgeSub,  // ~>
  AtAt,       // @@
  LCollect,   // <<|
  RCollect,   // |>>
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes / '$')
  std::string_view text;  // slice view, see TokenKind for what it covers

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Name:
      return "name";
    case TokenKind::TypeRef:
      return "type reference";
    case TokenKind::Variable:
      return "variable";
    case TokenKind::Number:
      return "number";
    case TokenKind::SqString:
    case TokenKind::DqString:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Question:
      return "?";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::FatArrow:
      return "=>";
    case TokenKind::InEdge:
      return "->";
    case TokenKind::InEdgeSub:
      return "~>";
    case TokenKind::AtAt:
      return "@@";
    case TokenKind::LCollect:
      return "<<|";
    case TokenKind::RCollect:
      return "|>>";
  }
  return "";
}

}  // namespace cfgcat::syntax
