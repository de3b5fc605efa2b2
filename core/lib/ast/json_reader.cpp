// minilang/ast/json_reader.cpp - JSON interchange reader
//
#include "minilang/ast/json_reader.hpp"

#include <fmt/core.h>

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "minilang/ast/ast_enums.hpp"

namespace minilang
{
namespace
{

using nlohmann::json;

/// First grammar violation found while reading; unwinds to load_ast_json.
class LoadError : public std::runtime_error
{
public:
  LoadError(std::string pointer, SourceRange range, const std::string & message)
  : std::runtime_error(message), pointer_(std::move(pointer)), range_(range)
  {
  }

  [[nodiscard]] const std::string & pointer() const noexcept { return pointer_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  std::string pointer_;
  SourceRange range_;
};

/// What the parent accepts at a child position
enum class Slot : uint8_t {
  Statement,   ///< statement, declaration or expression statement
  Expression,  ///< expression other than a bare identifier
  Identifier,  ///< identifier naming a variable or function
  Value,       ///< GenValue operand: any expression, identifiers included
};

std::string_view slot_name(Slot slot)
{
  switch (slot) {
    case Slot::Statement:
      return "a statement";
    case Slot::Expression:
      return "an expression";
    case Slot::Identifier:
      return "an Identifier";
    case Slot::Value:
      return "a value";
  }
  return "a node";
}

bool fits_slot(NodeKind kind, Slot slot)
{
  switch (slot) {
    case Slot::Statement:
      return is_stmt_kind(kind) || is_decl_kind(kind) ||
             (is_expr_kind(kind) && kind != NodeKind::Identifier);
    case Slot::Expression:
      return is_expr_kind(kind) && kind != NodeKind::Identifier;
    case Slot::Identifier:
      return kind == NodeKind::Identifier;
    case Slot::Value:
      return is_expr_kind(kind);
  }
  return false;
}

// ============================================================================
// JsonAstReader
// ============================================================================

class JsonAstReader
{
public:
  explicit JsonAstReader(AstContext & ast) : ast_(ast) {}

  Program * read_program(const json & j, const std::string & pointer)
  {
    return cast<Program>(read_node(j, pointer, std::nullopt));
  }

private:
  AstNode * read_node(const json & j, const std::string & pointer, std::optional<Slot> slot)
  {
    if (!j.is_object()) {
      throw LoadError(pointer, {}, "node must be a JSON object");
    }

    const SourceRange range = read_range(j, pointer);

    const auto kind_it = j.find("kind");
    if (kind_it == j.end() || !kind_it->is_string()) {
      throw LoadError(pointer, range, "node has no \"kind\" string");
    }
    const auto kind_name = kind_it->get<std::string>();
    const auto kind = parse_node_kind(kind_name);
    if (!kind) {
      throw LoadError(pointer, range, fmt::format("unknown node kind '{}'", kind_name));
    }

    if (slot && !fits_slot(*kind, *slot)) {
      throw LoadError(
        pointer, range, fmt::format("{} is not allowed here, expected {}", kind_name, slot_name(*slot)));
    }
    if (!slot && *kind != NodeKind::Program) {
      throw LoadError(
        pointer, range, fmt::format("expected a Program at the root, found {}", kind_name));
    }

    const json & children = children_of(j, pointer, range);

    switch (*kind) {
      case NodeKind::Program:
        return ast_.create<Program>(read_children(children, pointer, 0, Slot::Statement), range);

      case NodeKind::Block:
        return ast_.create<Block>(read_children(children, pointer, 0, Slot::Statement), range);
      case NodeKind::Stmt:
        return ast_.create<Stmt>(read_children(children, pointer, 0, Slot::Statement), range);
      case NodeKind::FunctionBlock:
        return ast_.create<FunctionBlock>(
          read_children(children, pointer, 0, Slot::Statement), range);

      case NodeKind::IfStmt:
        return ast_.create<IfStmt>(read_conditional(children, pointer, range), range);
      case NodeKind::WhileStmt:
        return ast_.create<WhileStmt>(read_conditional(children, pointer, range), range);

      case NodeKind::FunctionStmt: {
        const ValueType type = read_type_keyword(j, pointer, range);
        const size_t body_start = (!children.empty() && is_identifier_object(children[0])) ? 1 : 0;
        std::vector<AstNode *> nodes;
        if (body_start == 1) {
          nodes.push_back(read_node(children[0], child_pointer(pointer, 0), Slot::Identifier));
        }
        append_children(nodes, children, pointer, body_start, Slot::Statement);
        return ast_.create<FunctionStmt>(type, ast_.copy_to_arena(nodes), range);
      }

      case NodeKind::ReturnStmt:
        expect_arity(children, 1, pointer, range, kind_name);
        return ast_.create<ReturnStmt>(read_children(children, pointer, 0, Slot::Expression), range);

      case NodeKind::AssignStmt: {
        expect_arity(children, 2, pointer, range, kind_name);
        std::vector<AstNode *> nodes{
          read_node(children[0], child_pointer(pointer, 0), Slot::Identifier),
          read_node(children[1], child_pointer(pointer, 1), Slot::Expression)};
        return ast_.create<AssignStmt>(ast_.copy_to_arena(nodes), range);
      }

      case NodeKind::Declaration: {
        const ValueType type = read_type_keyword(j, pointer, range);
        expect_arity(children, 1, pointer, range, kind_name);
        return ast_.create<Declaration>(
          type, read_children(children, pointer, 0, Slot::Identifier), range);
      }

      case NodeKind::Expr:
        expect_arity(children, 1, pointer, range, kind_name);
        return ast_.create<Expr>(read_children(children, pointer, 0, Slot::Expression), range);

      case NodeKind::CompExpr:
        return read_binary_layer<CompExpr>(j, children, pointer, range);
      case NodeKind::AddExpr:
        return read_binary_layer<AddExpr>(j, children, pointer, range);
      case NodeKind::MulExpr:
        return read_binary_layer<MulExpr>(j, children, pointer, range);
      case NodeKind::BoolExpr:
        return read_binary_layer<BoolExpr>(j, children, pointer, range);

      case NodeKind::NotExpr:
        expect_arity(children, 1, pointer, range, kind_name);
        return ast_.create<NotExpr>(
          read_children(children, pointer, 0, Slot::Expression),
          read_prefix_ops(j, pointer, range, UnaryOp::Not), range);
      case NodeKind::UnaExpr:
        expect_arity(children, 1, pointer, range, kind_name);
        return ast_.create<UnaExpr>(
          read_children(children, pointer, 0, Slot::Expression),
          read_prefix_ops(j, pointer, range, UnaryOp::Neg), range);

      case NodeKind::GenValue:
        expect_arity(children, 1, pointer, range, kind_name);
        return ast_.create<GenValue>(read_children(children, pointer, 0, Slot::Value), range);

      case NodeKind::BoolValue:
        expect_arity(children, 0, pointer, range, kind_name);
        return ast_.create<BoolValue>(read_bool_literal(j, pointer, range), range);
      case NodeKind::IntValue:
        expect_arity(children, 0, pointer, range, kind_name);
        return ast_.create<IntValue>(read_int_literal(j, pointer, range), range);
      case NodeKind::Identifier: {
        expect_arity(children, 0, pointer, range, kind_name);
        const auto value_it = j.find("value");
        if (value_it == j.end() || !value_it->is_string() || value_it->get<std::string>().empty()) {
          throw LoadError(pointer, range, "Identifier needs a non-empty \"value\" name");
        }
        return ast_.create<Identifier>(ast_.intern(value_it->get<std::string>()), range);
      }
    }

    throw LoadError(pointer, range, fmt::format("unsupported node kind '{}'", kind_name));
  }

  // ===========================================================================
  // Children
  // ===========================================================================

  static std::string child_pointer(const std::string & pointer, size_t index)
  {
    return fmt::format("{}/children/{}", pointer, index);
  }

  const json & children_of(const json & j, const std::string & pointer, SourceRange range) const
  {
    const auto it = j.find("children");
    if (it == j.end()) {
      return empty_children_;
    }
    if (!it->is_array()) {
      throw LoadError(pointer + "/children", range, "\"children\" must be an array");
    }
    return *it;
  }

  void append_children(
    std::vector<AstNode *> & out, const json & children, const std::string & pointer, size_t from,
    Slot slot)
  {
    for (size_t i = from; i < children.size(); ++i) {
      out.push_back(read_node(children[i], child_pointer(pointer, i), slot));
    }
  }

  gsl::span<AstNode *> read_children(
    const json & children, const std::string & pointer, size_t from, Slot slot)
  {
    std::vector<AstNode *> nodes;
    append_children(nodes, children, pointer, from, slot);
    return ast_.copy_to_arena(nodes);
  }

  gsl::span<AstNode *> read_conditional(
    const json & children, const std::string & pointer, SourceRange range)
  {
    if (children.empty()) {
      throw LoadError(pointer, range, "missing condition expression");
    }
    std::vector<AstNode *> nodes{read_node(children[0], child_pointer(pointer, 0), Slot::Expression)};
    append_children(nodes, children, pointer, 1, Slot::Statement);
    return ast_.copy_to_arena(nodes);
  }

  static void expect_arity(
    const json & children, size_t expected, const std::string & pointer, SourceRange range,
    std::string_view kind_name)
  {
    if (children.size() != expected) {
      throw LoadError(
        pointer, range,
        fmt::format("{} expects {} child(ren), found {}", kind_name, expected, children.size()));
    }
  }

  // ===========================================================================
  // Payloads
  // ===========================================================================

  static bool is_identifier_object(const json & j)
  {
    if (!j.is_object()) return false;
    const auto it = j.find("kind");
    return it != j.end() && it->is_string() && it->get<std::string>() == "Identifier";
  }

  static SourceRange read_range(const json & j, const std::string & pointer)
  {
    const auto it = j.find("range");
    if (it == j.end() || it->is_null()) {
      return {};
    }
    const auto start = it->is_object() ? it->find("start") : it->end();
    const auto end = it->is_object() ? it->find("end") : it->end();
    if (
      !it->is_object() || start == it->end() || end == it->end() ||
      !start->is_number_integer() || !end->is_number_integer()) {
      throw LoadError(pointer + "/range", {}, "\"range\" must be {\"start\": n, \"end\": m}");
    }
    const auto s = start->get<int64_t>();
    const auto e = end->get<int64_t>();
    if (s < 0 || s > e || e >= SourceLocation::k_invalid_offset) {
      throw LoadError(pointer + "/range", {}, fmt::format("invalid range [{}, {})", s, e));
    }
    return SourceRange(static_cast<uint32_t>(s), static_cast<uint32_t>(e));
  }

  static ValueType read_type_keyword(const json & j, const std::string & pointer, SourceRange range)
  {
    const auto it = j.find("value");
    if (it != j.end() && it->is_string()) {
      if (auto type = parse_value_type(it->get<std::string>())) {
        return *type;
      }
    }
    throw LoadError(pointer + "/value", range, "expected type keyword \"num\" or \"bool\"");
  }

  static bool read_bool_literal(const json & j, const std::string & pointer, SourceRange range)
  {
    const auto it = j.find("value");
    if (it != j.end()) {
      if (it->is_boolean()) {
        return it->get<bool>();
      }
      if (it->is_string()) {
        const auto text = it->get<std::string>();
        if (text == "true") return true;
        if (text == "false") return false;
      }
    }
    throw LoadError(pointer + "/value", range, "BoolValue needs a boolean \"value\"");
  }

  static int64_t read_int_literal(const json & j, const std::string & pointer, SourceRange range)
  {
    const auto it = j.find("value");
    if (it != j.end()) {
      if (it->is_number_integer()) {
        if (
          it->is_number_unsigned() &&
          it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          throw LoadError(pointer + "/value", range, "integer literal out of range");
        }
        return it->get<int64_t>();
      }
      if (it->is_string()) {
        const auto text = it->get<std::string>();
        int64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
          return value;
        }
      }
    }
    throw LoadError(pointer + "/value", range, "IntValue needs an integer \"value\"");
  }

  template <typename Layer>
  Layer * read_binary_layer(
    const json & j, const json & children, const std::string & pointer, SourceRange range)
  {
    constexpr NodeKind layer = Layer::kind;
    if (children.empty()) {
      throw LoadError(
        pointer, range, fmt::format("{} needs at least one operand", to_string(layer)));
    }

    std::vector<std::string> spellings;
    const auto ops_it = j.find("ops");
    if (ops_it != j.end()) {
      if (!ops_it->is_array()) {
        throw LoadError(pointer + "/ops", range, "\"ops\" must be an array of operators");
      }
      for (const auto & op : *ops_it) {
        if (!op.is_string()) {
          throw LoadError(pointer + "/ops", range, "\"ops\" must be an array of operators");
        }
        spellings.push_back(op.get<std::string>());
      }
    } else if (layer == NodeKind::CompExpr && children.size() == 2) {
      // Single comparison operator carried as the node value
      const auto value_it = j.find("value");
      if (value_it != j.end() && value_it->is_string()) {
        spellings.push_back(value_it->get<std::string>());
      }
    }

    if (spellings.size() != children.size() - 1) {
      throw LoadError(
        pointer, range,
        fmt::format(
          "{} with {} operands needs {} operators, found {}", to_string(layer), children.size(),
          children.size() - 1, spellings.size()));
    }

    std::vector<BinaryOp> ops;
    for (const auto & spelling : spellings) {
      const auto op = parse_binary_op(spelling);
      if (!op || !is_operator_of_layer(layer, *op)) {
        throw LoadError(
          pointer + "/ops", range,
          fmt::format("operator '{}' is not valid in {}", spelling, to_string(layer)));
      }
      ops.push_back(*op);
    }

    auto operands = read_children(children, pointer, 0, Slot::Expression);
    return ast_.create<Layer>(operands, ast_.copy_to_arena(ops), range);
  }

  gsl::span<UnaryOp> read_prefix_ops(
    const json & j, const std::string & pointer, SourceRange range, UnaryOp expected)
  {
    const auto it = j.find("ops");
    if (it == j.end()) {
      return {};
    }
    if (!it->is_array()) {
      throw LoadError(pointer + "/ops", range, "\"ops\" must be an array of operators");
    }
    std::vector<UnaryOp> ops;
    for (const auto & token : *it) {
      const auto op = token.is_string() ? parse_unary_op(token.get<std::string>()) : std::nullopt;
      if (!op || *op != expected) {
        throw LoadError(
          pointer + "/ops", range,
          fmt::format("prefix operators must all be '{}'", to_string(expected)));
      }
      ops.push_back(*op);
    }
    return ast_.copy_to_arena(ops);
  }

  AstContext & ast_;
  const json empty_children_ = json::array();
};

void report_load_error(DiagnosticBag & diags, SourceRange range, std::string message)
{
  diags.report_error(range, std::move(message)).with_code(std::string(k_ast_load_error_code));
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

AstDocument load_ast_json(const nlohmann::json & doc, AstContext & ast, DiagnosticBag & diags)
{
  AstDocument out;
  std::string pointer;
  try {
    const json * program_json = &doc;
    if (doc.is_object() && doc.contains("program")) {
      pointer = "/program";
      program_json = &doc.at("program");

      if (const auto source = doc.find("source"); source != doc.end() && !source->is_null()) {
        if (!source->is_object()) {
          throw LoadError("/source", {}, "\"source\" must be an object");
        }
        if (const auto p = source->find("path"); p != source->end() && p->is_string()) {
          out.source_path = p->get<std::string>();
        }
        if (const auto t = source->find("text"); t != source->end() && t->is_string()) {
          out.source_text = t->get<std::string>();
        }
      }
    }

    JsonAstReader reader(ast);
    out.program = reader.read_program(*program_json, pointer);
  } catch (const LoadError & e) {
    const std::string where = e.pointer().empty() ? "/" : e.pointer();
    report_load_error(
      diags, e.range(), fmt::format("Invalid AST document at '{}': {}", where, e.what()));
    out.program = nullptr;
  } catch (const nlohmann::json::exception & e) {
    const std::string where = pointer.empty() ? "/" : pointer;
    report_load_error(
      diags, {}, fmt::format("Invalid AST document at '{}': {}", where, e.what()));
    out.program = nullptr;
  }
  return out;
}

AstDocument load_ast_json(std::string_view text, AstContext & ast, DiagnosticBag & diags)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    report_load_error(diags, {}, fmt::format("Invalid AST document: {}", e.what()));
    return {};
  }
  return load_ast_json(doc, ast, diags);
}

}  // namespace minilang
