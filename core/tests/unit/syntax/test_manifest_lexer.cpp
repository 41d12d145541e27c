#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "cfgcat/syntax/lexer.hpp"
#include "cfgcat/syntax/token.hpp"

using cfgcat::syntax::Lexer;
using cfgcat::syntax::Token;
using cfgcat::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds_of(std::string_view src)
{
  Lexer lex(src);
  std::vector<TokenKind> kinds;
  for (const auto & t : lex.lex_all()) {
    kinds.push_back(t.kind);
  }
  return kinds;
}

}  // namespace

TEST(ManifestLexer, SkipsCommentsAndEndsWithEof)
{
  const std::string_view src =
    "# line comment\n"
    "/* block\n comment */\n"
    "include apache # trailing\n";

  Lexer lex(src);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::Name);
  EXPECT_EQ(toks[0].text, "include");
  EXPECT_EQ(toks[1].text, "apache");
  EXPECT_EQ(toks[2].kind, TokenKind::Eof);
}

TEST(ManifestLexer, NamesAndTypeReferences)
{
  Lexer lex("apache::vhost Apache::Vhost ::ntp File");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 5U);
  EXPECT_EQ(toks[0].kind, TokenKind::Name);
  EXPECT_EQ(toks[0].text, "apache::vhost");
  EXPECT_EQ(toks[1].kind, TokenKind::TypeRef);
  EXPECT_EQ(toks[1].text, "Apache::Vhost");
  EXPECT_EQ(toks[2].kind, TokenKind::Name);
  EXPECT_EQ(toks[2].text, "ntp");
  EXPECT_EQ(toks[3].kind, TokenKind::TypeRef);
}

TEST(ManifestLexer, VariablesExcludeSigil)
{
  Lexer lex("$x $::osfamily $apache::params::port");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::Variable);
  EXPECT_EQ(toks[0].text, "x");
  EXPECT_EQ(toks[1].text, "::osfamily");
  EXPECT_EQ(toks[2].text, "apache::params::port");
}

TEST(ManifestLexer, NumbersIncludingNegativeAndExponent)
{
  Lexer lex("42 -1 0.5 1e3");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 5U);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(toks[i].kind, TokenKind::Number) << i;
  }
  EXPECT_EQ(toks[1].text, "-1");
  EXPECT_EQ(toks[3].text, "1e3");
}

TEST(ManifestLexer, StringsCarryRawInterior)
{
  Lexer lex(R"('it\'s' "hello $name")");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::SqString);
  EXPECT_EQ(toks[0].text, R"(it\'s)");
  EXPECT_EQ(toks[1].kind, TokenKind::DqString);
  EXPECT_EQ(toks[1].text, "hello $name");
}

TEST(ManifestLexer, PunctuationPrefersLongestSpelling)
{
  const auto kinds = kinds_of("=> == != -> ~> @@ <<| |>> = !");
  const std::vector<TokenKind> expected = {
    TokenKind::FatArrow, TokenKind::EqEq,    TokenKind::Ne,       TokenKind::InEdge,
    TokenKind::InEdgeSub, TokenKind::AtAt,   TokenKind::LCollect, TokenKind::RCollect,
    TokenKind::Eq,       TokenKind::Bang,    TokenKind::Eof,
  };
  EXPECT_EQ(kinds, expected);
}

TEST(ManifestLexer, UnterminatedInputBecomesUnknown)
{
  EXPECT_EQ(kinds_of("'never closed").front(), TokenKind::Unknown);
  EXPECT_EQ(kinds_of("/* never closed").front(), TokenKind::Unknown);
  EXPECT_EQ(kinds_of("%").front(), TokenKind::Unknown);
}

TEST(ManifestLexer, RangesCoverSource)
{
  const std::string_view src = "file { '/tmp/a': }";
  Lexer lex(src);
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[2].begin(), 7U);
  EXPECT_EQ(src.substr(toks[2].begin(), toks[2].end() - toks[2].begin()), "'/tmp/a'");
}
