// codetrace/instrument/trace_statement.hpp - Language-neutral trace emission request
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "codetrace/trace/wire_format.hpp"

namespace codetrace
{

/**
 * One field of a trace record as it should be printed by the target program.
 *
 * Literal fields are printed verbatim. Value fields are target-language
 * expressions evaluated at run time; `format` is the printf conversion used
 * by statically typed targets and ignored otherwise.
 */
struct TraceField
{
  enum class Kind : uint8_t { Literal, Value };

  Kind kind = Kind::Literal;
  std::string text;
  std::string format;
};

/**
 * Ordered fields of one trace record, starting with its tag.
 *
 * Backends render it into a target-language statement that writes the
 * fields separated by the wire delimiter and terminated by a newline.
 */
class TraceStatement
{
public:
  explicit TraceStatement(RecordKind kind)
  {
    fields_.push_back({TraceField::Kind::Literal, std::string(tag_name(kind)), {}});
  }

  TraceStatement & literal(std::string text)
  {
    fields_.push_back({TraceField::Kind::Literal, std::move(text), {}});
    return *this;
  }

  TraceStatement & value(std::string expression, std::string format = {})
  {
    fields_.push_back({TraceField::Kind::Value, std::move(expression), std::move(format)});
    return *this;
  }

  /// 1-based line number of a 0-based CST row
  TraceStatement & line(uint32_t row) { return literal(std::to_string(row + 1)); }

  [[nodiscard]] const std::vector<TraceField> & fields() const noexcept { return fields_; }

private:
  std::vector<TraceField> fields_;
};

}  // namespace codetrace
