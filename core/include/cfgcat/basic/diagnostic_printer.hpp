// cfgcat/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>

#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/source_manager.hpp"

namespace cfgcat
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0003]: parameter 'uid' must be an integer, not "abc"
 *     --> manifests/site.pp:5:3
 *      |
 *    5 |   user { 'deploy': uid => 'abc' }
 *      |   ^
 *      |
 *      = note: while validating User[deploy]
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Make a file's text available for source context without reading it from disk
  void add_source(SourceFile source);

  void print(const Diagnostic & diag);

  /// Diagnostics sorted by location, unlocated ones last
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_source_line(const SourceFile & source, uint32_t line_index, uint32_t column);
  void print_note(std::string_view message);

  /// Source of a file, read on first use; nullptr when unreadable
  const SourceFile * source_for(const std::string & path);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
  std::map<std::string, SourceFile> sources_;
};

}  // namespace cfgcat
