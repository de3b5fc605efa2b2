// minilang/sema/resolution/symbol_table.cpp - Symbol table implementation
//
#include "minilang/sema/resolution/symbol_table.hpp"

namespace minilang
{

bool SymbolTable::declare(std::string_view name, ValueType type, SourceRange range)
{
  if (index_.find(name) != index_.end()) {
    return false;
  }
  index_.emplace(name, symbols_.size());
  symbols_.push_back(Symbol{name, type, range});
  return true;
}

const Symbol * SymbolTable::lookup(std::string_view name) const
{
  auto it = index_.find(name);
  return it != index_.end() ? &symbols_[it->second] : nullptr;
}

void SymbolTable::clear()
{
  symbols_.clear();
  index_.clear();
}

}  // namespace minilang
