// codetrace/trace/wire_format.cpp - Trace record tag table
#include "codetrace/trace/wire_format.hpp"

#include <array>
#include <utility>

namespace codetrace
{

namespace
{

constexpr std::array<std::pair<RecordKind, std::string_view>, 16> k_tags{{
  {RecordKind::Meta, "META"},
  {RecordKind::Assign, "ASSIGN"},
  {RecordKind::Decl, "DECL"},
  {RecordKind::Read, "READ"},
  {RecordKind::Call, "CALL"},
  {RecordKind::ExternalCall, "EXTERNAL_CALL"},
  {RecordKind::Param, "PARAM"},
  {RecordKind::Return, "RETURN"},
  {RecordKind::Loop, "LOOP"},
  {RecordKind::Branch, "BRANCH"},
  {RecordKind::Condition, "CONDITION"},
  {RecordKind::Switch, "SWITCH"},
  {RecordKind::Case, "CASE"},
  {RecordKind::Update, "UPDATE"},
  {RecordKind::Ternary, "TERNARY"},
  {RecordKind::Unknown, "UNKNOWN"},
}};

}  // namespace

std::string_view tag_name(RecordKind kind) noexcept
{
  for (const auto & [k, tag] : k_tags) {
    if (k == kind) {
      return tag;
    }
  }
  return "UNKNOWN";
}

std::optional<RecordKind> kind_from_tag(std::string_view tag) noexcept
{
  for (const auto & [k, name] : k_tags) {
    // UNKNOWN is never produced by a program; it is the decoder's fallback.
    if (name == tag && k != RecordKind::Unknown) {
      return k;
    }
  }
  return std::nullopt;
}

}  // namespace codetrace
