// minilang/sema/resolution/symbol_table.hpp - Flat identifier table
//
// One table for the whole program: no nested scopes, no shadowing.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "minilang/ast/ast_enums.hpp"
#include "minilang/basic/source_manager.hpp"

namespace minilang
{

/**
 * A declared variable.
 */
struct Symbol
{
  std::string_view name;  ///< Arena-interned; valid while the AstContext lives
  ValueType type;
  SourceRange definitionRange;
};

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Mapping from identifier name to declared type.
 *
 * Each name can be declared at most once, whatever its type. Symbols are
 * kept in declaration order.
 */
class SymbolTable
{
public:
  /**
   * Declare a name.
   *
   * @return false (and leave the table unchanged) if the name is already declared
   */
  bool declare(std::string_view name, ValueType type, SourceRange range = {});

  /// Declared symbol, or nullptr if the name is undeclared
  [[nodiscard]] const Symbol * lookup(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }
  [[nodiscard]] bool empty() const noexcept { return symbols_.empty(); }

  void clear();

  [[nodiscard]] auto begin() const { return symbols_.begin(); }
  [[nodiscard]] auto end() const { return symbols_.end(); }

private:
  std::vector<Symbol> symbols_;
  std::unordered_map<std::string_view, size_t, StringViewHash, StringViewEqual> index_;
};

}  // namespace minilang
