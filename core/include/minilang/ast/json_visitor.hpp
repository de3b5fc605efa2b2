// minilang/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Renders trees in the same interchange format json_reader accepts.
//
#pragma once

#include <nlohmann/json.hpp>

#include "minilang/ast/ast.hpp"
#include "minilang/basic/source_manager.hpp"

namespace minilang
{

/**
 * Serialize an AST node (and its subtree) to JSON.
 *
 * Node objects carry "kind", and when present "range", "value", "ops"
 * and "children".
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a whole interchange document: the program plus, when
 * available, the source path and text it was parsed from.
 */
[[nodiscard]] nlohmann::json to_json_document(const Program * program, const SourceFile * source);

}  // namespace minilang
