// codetrace/instrument/symbol_table.cpp - Symbol table implementation
#include "codetrace/instrument/symbol_table.hpp"

#include <array>
#include <utility>

namespace codetrace
{

void SymbolTable::define(std::string name, std::string type_tag)
{
  types_[std::move(name)] = std::move(type_tag);
}

std::optional<std::string_view> SymbolTable::lookup(std::string_view name) const
{
  const auto it = types_.find(std::string(name));
  if (it == types_.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::string SymbolTable::type_of(std::string_view name, std::string_view fallback) const
{
  const auto found = lookup(name);
  return std::string(found ? *found : fallback);
}

TypeCategory classify_type(std::string_view type_tag)
{
  const auto mentions = [&](std::string_view needle) {
    return type_tag.find(needle) != std::string_view::npos;
  };

  size_t indirection = 0;
  for (const char c : type_tag) {
    if (c == '*' || c == '[') {
      ++indirection;
    }
  }
  if (indirection > 0) {
    // Only a single level of char indirection is printable as text.
    return indirection == 1 && mentions("char") ? TypeCategory::String : TypeCategory::Pointer;
  }

  static constexpr std::array<std::pair<std::string_view, TypeCategory>, 5> k_table{{
    {"int", TypeCategory::Integer},
    {"float", TypeCategory::Float},
    {"double", TypeCategory::Double},
    {"char", TypeCategory::Char},
    {"long", TypeCategory::Long},
  }};
  for (const auto & [needle, category] : k_table) {
    if (mentions(needle)) {
      return category;
    }
  }
  return TypeCategory::Generic;
}

}  // namespace codetrace
