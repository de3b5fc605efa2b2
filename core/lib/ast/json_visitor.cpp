// minilang/ast/json_visitor.cpp - JSON serialization implementation
//
#include "minilang/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "minilang/ast/ast.hpp"
#include "minilang/ast/ast_enums.hpp"
#include "minilang/ast/visitor.hpp"

namespace minilang
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

template <typename OpSpan>
json j_ops(const OpSpan & ops)
{
  json out = json::array();
  for (const auto op : ops) {
    out.push_back(std::string(to_string(op)));
  }
  return out;
}

// ============================================================================
// JsonWriter - builds one object per node, recursing through children
// ============================================================================

class JsonWriter : public ConstAstVisitor<JsonWriter, json>
{
public:
  json visit_node(const AstNode * node)
  {
    json j{{"kind", std::string(to_string(node->get_kind()))}};
    if (node->get_range().is_valid()) {
      j["range"] = j_range(node->get_range());
    }
    if (!node->children.empty()) {
      json children = json::array();
      for (const AstNode * child : node->children) {
        children.push_back(visit(child));
      }
      j["children"] = std::move(children);
    }
    return j;
  }

  json visit_declaration(const Declaration * node)
  {
    json j = visit_node(node);
    j["value"] = std::string(to_keyword(node->declaredType));
    return j;
  }

  json visit_function_stmt(const FunctionStmt * node)
  {
    json j = visit_node(node);
    j["value"] = std::string(to_keyword(node->returnType));
    return j;
  }

  json visit_comp_expr(const CompExpr * node) { return with_ops(node, node->ops); }
  json visit_add_expr(const AddExpr * node) { return with_ops(node, node->ops); }
  json visit_mul_expr(const MulExpr * node) { return with_ops(node, node->ops); }
  json visit_bool_expr(const BoolExpr * node) { return with_ops(node, node->ops); }
  json visit_not_expr(const NotExpr * node) { return with_ops(node, node->ops); }
  json visit_una_expr(const UnaExpr * node) { return with_ops(node, node->ops); }

  json visit_int_value(const IntValue * node)
  {
    json j = visit_node(node);
    j["value"] = node->value;
    return j;
  }

  json visit_bool_value(const BoolValue * node)
  {
    json j = visit_node(node);
    j["value"] = node->value;
    return j;
  }

  json visit_identifier(const Identifier * node)
  {
    json j = visit_node(node);
    j["value"] = std::string(node->name);
    return j;
  }

private:
  template <typename OpSpan>
  json with_ops(const AstNode * node, const OpSpan & ops)
  {
    json j = visit_node(node);
    if (!ops.empty()) {
      j["ops"] = j_ops(ops);
    }
    return j;
  }
};

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nullptr;
  JsonWriter writer;
  return writer.visit(node);
}

nlohmann::json to_json_document(const Program * program, const SourceFile * source)
{
  nlohmann::json doc;
  if (source != nullptr) {
    doc["source"] = nlohmann::json{
      {"path", source->get_path().generic_string()},
      {"text", std::string(source->get_content())}};
  }
  doc["program"] = to_json(program);
  return doc;
}

}  // namespace minilang
