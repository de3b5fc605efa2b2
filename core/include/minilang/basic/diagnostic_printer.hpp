// minilang/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context and position markers in
// Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "minilang/basic/diagnostic.hpp"
#include "minilang/basic/source_manager.hpp"

namespace minilang
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E006]: Invalid use of undefined Identifier y
 *     --> main.ml:2:5
 *      |
 *    2 | x = y;
 *      |     ^ not declared
 *      |
 *      = help: declare 'y' before using it
 *
 * When no source text is available the location line names only the
 * file and no snippet is printed.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param source Source text the ranges refer to, or nullptr
   * @param display_path Path shown on the location line
   */
  void print(const Diagnostic & diag, const SourceFile * source, std::string_view display_path);

  /// Print all diagnostics of a bag, ordered by primary location.
  void print_all(
    const DiagnosticBag & diags, const SourceFile * source, std::string_view display_path);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceFile * source);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_trailer(std::string_view kind, std::string_view message);

  void print_gutter(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace minilang
