// cfgcat/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "cfgcat/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace cfgcat
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::add_source(SourceFile source)
{
  std::string key = source.path().string();
  sources_.insert_or_assign(std::move(key), std::move(source));
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  if (diag.location) {
    const SourcePosition & loc = *diag.location;

    // Relative path for cleaner output
    std::error_code ec;
    auto rel_path = std::filesystem::relative(loc.file, std::filesystem::current_path(), ec);
    const std::string filename = ec || rel_path.empty() ? loc.file : rel_path.string();

    // === Location line: --> file:line:col ===
    if (loc.line > 0) {
      fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, loc.line, loc.column);
    } else {
      fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
    }
    fmt::print(os_, "{}\n", gutter_pipe());

    if (loc.line > 0) {
      if (const SourceFile * source = source_for(loc.file)) {
        print_source_line(*source, loc.line - 1, loc.column);
      }
    }
  }

  for (const auto & note : diag.notes) {
    print_note(note);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      if (!a.location || !b.location) {
        return a.location.has_value() && !b.location.has_value();
      }
      if (a.location->file != b.location->file) {
        return a.location->file < b.location->file;
      }
      if (a.location->line != b.location->line) {
        return a.location->line < b.location->line;
      }
      return a.location->column < b.location->column;
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

const SourceFile * DiagnosticPrinter::source_for(const std::string & path)
{
  auto it = sources_.find(path);
  if (it != sources_.end()) {
    return &it->second;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return nullptr;
  }
  std::ostringstream text;
  text << in.rdbuf();
  auto inserted = sources_.emplace(path, SourceFile(path, text.str()));
  return &inserted.first->second;
}

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Notice:
        os_ << rang::fg::cyan;
        break;
    }
    os_ << severity_str;
    if (diag.severity == Severity::Error) {
      os_ << "[" << diag.code() << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else if (diag.severity == Severity::Error) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code(), diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t column)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";  // 4 spaces per tab
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  const uint32_t line_num = line_index + 1;
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  // Marker line, tabs expanded like the source line
  fmt::print(os_, "      {} ", gutter_pipe_only());
  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t char_idx = 0; visual_col < column && char_idx < line.size(); ++char_idx) {
    marker_prefix += line[char_idx] == '\t' ? "    " : " ";
    ++visual_col;
  }
  fmt::print(os_, "{}", marker_prefix);

  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "^" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "^");
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace cfgcat
