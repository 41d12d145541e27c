// cfgcat/syntax/frontend.cpp - High-level parse pipeline
#include "cfgcat/syntax/frontend.hpp"

#include <fmt/core.h>

#include <fstream>
#include <sstream>

#include "cfgcat/syntax/lexer.hpp"
#include "cfgcat/syntax/parser.hpp"

namespace cfgcat
{

std::shared_ptr<ParsedManifest> parse_source(
  const std::filesystem::path & path, std::string source_text, DiagnosticBag & diags)
{
  auto unit = std::make_shared<ParsedManifest>();
  unit->source = SourceFile(path, std::move(source_text));

  syntax::Lexer lexer(unit->source.content());
  syntax::Parser parser(unit->ast, unit->source, diags, lexer.lex_all());
  unit->program = parser.parse_program();
  return unit;
}

Result<ParsedManifestPtr> parse_manifest_text(
  const std::filesystem::path & path, std::string source_text)
{
  DiagnosticBag diags;
  auto unit = parse_source(path, std::move(source_text), diags);

  if (const Diagnostic * first = diags.first_error()) {
    Diagnostic diag = *first;
    const size_t count = diags.errors().size();
    diag.notes.push_back(fmt::format(
      "{} syntax error{} in {}", count, count == 1 ? "" : "s", path.generic_string()));
    return Result<ParsedManifestPtr>::fail(std::move(diag));
  }
  return Result<ParsedManifestPtr>::ok(std::move(unit));
}

Result<ParsedManifestPtr> parse_manifest_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<ParsedManifestPtr>::fail(Diagnostic::error(
      DiagnosticKind::ParseError,
      fmt::format("cannot read manifest '{}'", path.generic_string()),
      SourcePosition{path.generic_string(), 0, 0}));
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_manifest_text(path, ss.str());
}

}  // namespace cfgcat
