// minilang/sema/semantic_error.hpp - Semantic error taxonomy
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "minilang/basic/source_manager.hpp"

namespace minilang
{

enum class SemanticErrorKind : uint8_t {
  MultipleDeclaration,    ///< E001
  InvalidConditionType,   ///< E002
  InvalidExpressionType,  ///< E003
  InvalidAssignmentType,  ///< E004
  ReturnTypeMismatch,     ///< E005
  UndefinedIdentifier,    ///< E006
  ReturnOutsideFunction,  ///< E007
  MalformedTree,          ///< E100
};

[[nodiscard]] std::string_view to_code(SemanticErrorKind kind) noexcept;

/**
 * Terminal error of an analysis run. what() is the user-facing message.
 *
 * Thrown at the first violation; the analyzer never catches it.
 */
class SemanticError : public std::runtime_error
{
public:
  SemanticError(SemanticErrorKind kind, const std::string & message, SourceRange range = {});

  [[nodiscard]] SemanticErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view code() const noexcept { return to_code(kind_); }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }

  /// Earlier location involved in the error (first declaration), if any
  [[nodiscard]] const std::optional<SourceRange> & related_range() const noexcept
  {
    return related_range_;
  }

  /// Identifier the message names, empty if none
  [[nodiscard]] const std::string & identifier() const noexcept { return identifier_; }

  // Factories with the message templates
  static SemanticError multiple_declaration(
    std::string_view name, SourceRange range, SourceRange first_declaration);
  static SemanticError invalid_condition_type(SourceRange range);
  static SemanticError invalid_expression_type(SourceRange range);
  static SemanticError invalid_assignment_type(std::string_view name, SourceRange range);
  static SemanticError return_type_mismatch(SourceRange range);
  static SemanticError undefined_identifier(std::string_view name, SourceRange range);
  static SemanticError return_outside_function(SourceRange range);
  static SemanticError malformed_tree(std::string_view detail, SourceRange range);

private:
  SemanticErrorKind kind_;
  SourceRange range_;
  std::optional<SourceRange> related_range_;
  std::string identifier_;
};

}  // namespace minilang
