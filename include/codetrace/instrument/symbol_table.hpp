// codetrace/instrument/symbol_table.hpp - Variable name to declared-type mapping
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace codetrace
{

/**
 * Coarse category of a declared type tag.
 *
 * Dynamic languages register every name under the generic `object` tag,
 * which classifies as Generic.
 */
enum class TypeCategory : uint8_t {
  Integer,
  Float,
  Double,
  Char,
  String,   // pointer or array of char
  Pointer,  // any other pointer or array
  Long,
  Generic,
};

/**
 * Per-file mapping from variable name to its declared type tag.
 *
 * Later registrations of the same name overwrite earlier ones.
 */
class SymbolTable
{
public:
  void define(std::string name, std::string type_tag);

  [[nodiscard]] std::optional<std::string_view> lookup(std::string_view name) const;

  /// Type tag of `name`, or `fallback` when the name is unknown
  [[nodiscard]] std::string type_of(std::string_view name, std::string_view fallback) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name).has_value(); }
  [[nodiscard]] size_t size() const noexcept { return types_.size(); }
  [[nodiscard]] bool empty() const noexcept { return types_.empty(); }

  [[nodiscard]] auto begin() const { return types_.begin(); }
  [[nodiscard]] auto end() const { return types_.end(); }

private:
  std::unordered_map<std::string, std::string> types_;
};

/**
 * Classify a C type tag.
 *
 * A single level of pointer or array over `char` is String; any other
 * pointer or array type is Pointer. The remaining tags use the first
 * substring match in the order int, float, double, char, long. Anything
 * else is Generic.
 */
[[nodiscard]] TypeCategory classify_type(std::string_view type_tag);

}  // namespace codetrace
