// minilang/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "minilang/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace minilang
{

namespace
{

constexpr std::string_view k_arrow = "  -->";
constexpr std::string_view k_pipe = "      |";

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
  }
  return "error";
}

/// Expand tabs to four spaces and drop line terminators
std::string clean_line(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(
  const Diagnostic & diag, const SourceFile * source, std::string_view display_path)
{
  const std::string filename = display_path.empty() ? "<unknown>" : std::string(display_path);

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  FullSourceRange primary_fr;
  if (source != nullptr) {
    primary_fr = source->get_full_range(diag.primary_range());
  }
  print_gutter(k_arrow);
  if (primary_fr.is_valid()) {
    fmt::print(os_, " {}:{}:{}\n", filename, primary_fr.start_line, primary_fr.start_column);
  } else {
    fmt::print(os_, " {}\n", filename);
  }

  print_gutter(k_pipe);
  os_ << '\n';

  // === Labels (source snippets) ===
  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  os_ << '\n';
}

void DiagnosticPrinter::print_all(
  const DiagnosticBag & diags, const SourceFile * source, std::string_view display_path)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, source, display_path);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", severity_name(diag.severity), code, diag.message);
    return;
  }

  os_ << rang::style::bold << rang::fg::red << severity_name(diag.severity) << code
      << rang::fg::reset << ": " << diag.message
      << rang::style::reset << '\n';
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceFile * source)
{
  if (!label.range.is_valid() || source == nullptr) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const FullSourceRange fr = source->get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  // Line number and source text
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold;
    fmt::print(os_, " {:>4} |", line_index + 1);
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, " {:>4} |", line_index + 1);
  }
  fmt::print(os_, " {}\n", clean_line(line));

  // Marker line, padded to the visual start column
  print_gutter(k_pipe);
  std::string marker = " ";
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    marker += (line[i] == '\t') ? "    " : " ";
  }
  os_ << marker;

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  std::string text(marker_len, marker_char);
  if (!label_message.empty()) {
    text += fmt::format(" {}", label_message);
  }

  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    os_ << text << rang::style::reset << rang::fg::reset << '\n';
  } else {
    os_ << text << '\n';
  }
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  print_gutter(k_pipe);
  os_ << '\n';
  print_gutter("   =");
  fmt::print(os_, " {}: {}\n", kind, message);
}

void DiagnosticPrinter::print_gutter(std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << text << rang::style::reset << rang::fg::reset;
  } else {
    os_ << text;
  }
}

}  // namespace minilang
