// cfgcat/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "cfgcat/ast/ast.hpp"
#include "cfgcat/ast/ast_context.hpp"
#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/result.hpp"
#include "cfgcat/basic/source_manager.hpp"

namespace cfgcat
{

/**
 * One parsed manifest file: its text, the arena holding its AST and the
 * root Program. Immutable once built and shared between compilations.
 */
struct ParsedManifest
{
  SourceFile source;
  AstContext ast;
  Program * program = nullptr;

  [[nodiscard]] SourcePosition position(const AstNode * node) const
  {
    return source.position(node->get_range().get_begin());
  }
};

using ParsedManifestPtr = std::shared_ptr<const ParsedManifest>;

/**
 * Parse pipeline:
 * source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
 *
 * Every syntax error is collected into diags. The program is always produced.
 */
[[nodiscard]] std::shared_ptr<ParsedManifest> parse_source(
  const std::filesystem::path & path, std::string source_text, DiagnosticBag & diags);

/**
 * Parse manifest text. Any syntax error fails the whole file with a
 * ParseError carrying the first error and a note with the error count.
 */
[[nodiscard]] Result<ParsedManifestPtr> parse_manifest_text(
  const std::filesystem::path & path, std::string source_text);

/// Read and parse a manifest file; an unreadable file is a ParseError
[[nodiscard]] Result<ParsedManifestPtr> parse_manifest_file(const std::filesystem::path & path);

}  // namespace cfgcat
