// codetrace/trace/wire_format.hpp - Trace record tags and field delimiter
//
// One record per output line; fields are separated by a NUL byte and the
// first field is the record tag.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace codetrace
{

/// Separator between the fields of one trace record
inline constexpr char k_field_delimiter = '\0';

enum class RecordKind : uint8_t {
  Meta,
  Assign,
  Decl,
  Read,
  Call,
  ExternalCall,
  Param,
  Return,
  Loop,
  Branch,
  Condition,
  Switch,
  Case,
  Update,
  Ternary,
  Unknown,
};

/// Wire tag of a record kind, e.g. "EXTERNAL_CALL"
[[nodiscard]] std::string_view tag_name(RecordKind kind) noexcept;

/// Record kind for a wire tag; std::nullopt for unrecognized tags
[[nodiscard]] std::optional<RecordKind> kind_from_tag(std::string_view tag) noexcept;

}  // namespace codetrace
