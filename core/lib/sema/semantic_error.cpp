// minilang/sema/semantic_error.cpp - Semantic error messages
#include "minilang/sema/semantic_error.hpp"

#include <fmt/core.h>

namespace minilang
{

std::string_view to_code(SemanticErrorKind kind) noexcept
{
  switch (kind) {
    case SemanticErrorKind::MultipleDeclaration:
      return "E001";
    case SemanticErrorKind::InvalidConditionType:
      return "E002";
    case SemanticErrorKind::InvalidExpressionType:
      return "E003";
    case SemanticErrorKind::InvalidAssignmentType:
      return "E004";
    case SemanticErrorKind::ReturnTypeMismatch:
      return "E005";
    case SemanticErrorKind::UndefinedIdentifier:
      return "E006";
    case SemanticErrorKind::ReturnOutsideFunction:
      return "E007";
    case SemanticErrorKind::MalformedTree:
      return "E100";
  }
  return "E100";
}

SemanticError::SemanticError(
  SemanticErrorKind kind, const std::string & message, SourceRange range)
: std::runtime_error(message), kind_(kind), range_(range)
{
}

SemanticError SemanticError::multiple_declaration(
  std::string_view name, SourceRange range, SourceRange first_declaration)
{
  SemanticError e(
    SemanticErrorKind::MultipleDeclaration,
    fmt::format("Identifier {} has multiple declarations", name), range);
  e.identifier_ = std::string(name);
  if (first_declaration.is_valid()) {
    e.related_range_ = first_declaration;
  }
  return e;
}

SemanticError SemanticError::invalid_condition_type(SourceRange range)
{
  return {SemanticErrorKind::InvalidConditionType, "Invalid type in condition", range};
}

SemanticError SemanticError::invalid_expression_type(SourceRange range)
{
  return {SemanticErrorKind::InvalidExpressionType, "Invalid type in expression", range};
}

SemanticError SemanticError::invalid_assignment_type(std::string_view name, SourceRange range)
{
  SemanticError e(
    SemanticErrorKind::InvalidAssignmentType,
    fmt::format("Invalid type in assignation of Identifier {}", name), range);
  e.identifier_ = std::string(name);
  return e;
}

SemanticError SemanticError::return_type_mismatch(SourceRange range)
{
  return {SemanticErrorKind::ReturnTypeMismatch, "Return type does not match function type", range};
}

SemanticError SemanticError::undefined_identifier(std::string_view name, SourceRange range)
{
  SemanticError e(
    SemanticErrorKind::UndefinedIdentifier,
    fmt::format("Invalid use of undefined Identifier {}", name), range);
  e.identifier_ = std::string(name);
  return e;
}

SemanticError SemanticError::return_outside_function(SourceRange range)
{
  return {SemanticErrorKind::ReturnOutsideFunction, "Return statement outside of function", range};
}

SemanticError SemanticError::malformed_tree(std::string_view detail, SourceRange range)
{
  return {SemanticErrorKind::MalformedTree, fmt::format("Malformed syntax tree: {}", detail), range};
}

}  // namespace minilang
