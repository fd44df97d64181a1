// codetrace/trace/record.hpp - Decoded trace records
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "codetrace/trace/wire_format.hpp"

namespace codetrace
{

// ============================================================================
// Event payloads
// ============================================================================

/// DECL, ASSIGN and READ
struct VariableEvent
{
  std::string subject;
  std::string value;
  std::string address;  ///< empty when the target has no address token
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct CallEvent
{
  std::string subject;
  std::vector<std::string> args;  ///< parameter values in declaration order
  int64_t stack_depth = 0;
};

struct ExternalCallEvent
{
  std::string subject;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct ParamEvent
{
  std::string subject;
  std::string value;
  int64_t line_number = 0;
};

struct UpdateEvent
{
  std::string subject;
  std::string op;  ///< "++" or "--"
  std::string value;
  std::string address;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct ReturnEvent
{
  std::string subtype;  ///< "literal" or the returned variable's name
  std::string value;
  std::optional<std::string> address;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct LoopEvent
{
  std::string subtype;  ///< "while", "for" or "do-while"
  std::optional<std::string> condition;
  std::optional<int64_t> condition_result;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct BranchEvent
{
  std::string subtype;  ///< "if", "elif" or "else"
  std::string condition;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

/// CONDITION and TERNARY
struct ConditionEvent
{
  std::string subject;  ///< condition text
  int64_t condition_result = 0;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct SwitchEvent
{
  std::string subject;  ///< discriminant text
  std::string value;
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

struct CaseEvent
{
  std::string subject;  ///< label value or "default"
  int64_t line_number = 0;
  int64_t stack_depth = 0;
};

/// A line whose tag is not recognized; keeps every raw field, tag included
struct UnknownEvent
{
  std::vector<std::string> args;
};

using TraceEvent = std::variant<
  VariableEvent, CallEvent, ExternalCallEvent, ParamEvent, UpdateEvent, ReturnEvent, LoopEvent,
  BranchEvent, ConditionEvent, SwitchEvent, CaseEvent, UnknownEvent>;

// ============================================================================
// TraceRecord
// ============================================================================

/**
 * One decoded trace record.
 *
 * `id` is the 0-based position of the record in decode order. META lines
 * never become records.
 */
struct TraceRecord
{
  RecordKind kind = RecordKind::Unknown;
  uint64_t id = 0;
  TraceEvent event;

  template <typename T>
  [[nodiscard]] const T * as() const noexcept
  {
    return std::get_if<T>(&event);
  }
};

}  // namespace codetrace
