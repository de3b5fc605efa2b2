// minilang/ast/json_reader.hpp - Load parser-produced ASTs from JSON
//
// The external parser hands its tree over as a JSON interchange document:
//
//   { "source": { "path": "...", "text": "..." },   // optional
//     "program": { "kind": "Program", "children": [ ... ] } }
//
// A bare Program object is accepted as the whole document as well.
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "minilang/ast/ast.hpp"
#include "minilang/ast/ast_context.hpp"
#include "minilang/basic/diagnostic.hpp"

namespace minilang
{

/// Diagnostic code of every AST loading problem
inline constexpr std::string_view k_ast_load_error_code = "A001";

struct AstDocument
{
  Program * program = nullptr;
  std::optional<std::string> source_path;
  std::optional<std::string> source_text;

  [[nodiscard]] bool ok() const noexcept { return program != nullptr; }
};

/**
 * Parse and validate an interchange document.
 *
 * Nodes are created in `ast`. The grammar shape the analyzer relies on is
 * checked while reading; the first violation is reported to `diags` as an
 * A001 error naming its JSON pointer, and the returned document has no
 * program. Never throws for malformed input.
 */
[[nodiscard]] AstDocument load_ast_json(
  std::string_view text, AstContext & ast, DiagnosticBag & diags);

/// Same as above, for an already parsed JSON value.
[[nodiscard]] AstDocument load_ast_json(
  const nlohmann::json & doc, AstContext & ast, DiagnosticBag & diags);

}  // namespace minilang
