// codetrace/trace/decoder.hpp - Raw trace output to typed records
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "codetrace/basic/diagnostic.hpp"
#include "codetrace/instrument/metadata.hpp"
#include "codetrace/trace/record.hpp"

namespace codetrace
{

/**
 * Result of parsing the fields of a single record.
 */
struct RecordParseResult
{
  /// Parsed payload (only valid if success == true)
  TraceEvent event;

  bool success = false;

  /// Reason the fields were rejected
  std::string error;

  static RecordParseResult ok(TraceEvent ev)
  {
    RecordParseResult r;
    r.event = std::move(ev);
    r.success = true;
    return r;
  }

  static RecordParseResult fail(std::string msg)
  {
    RecordParseResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse the fields of one record, tag excluded.
 *
 * Never throws. Integer fields must be decimal; evaluation fields also
 * accept "True"/"False".
 *
 * @param kind Record kind named by the tag (not Meta or Unknown)
 * @param fields Fields following the tag
 */
[[nodiscard]] RecordParseResult parse_record(
  RecordKind kind, gsl::span<const std::string_view> fields);

/**
 * Everything decoded from one program run.
 */
struct DecodeResult
{
  /// META pairs in first-seen order; later values overwrite earlier ones
  Metadata metadata;

  std::vector<TraceRecord> traces;

  /// One warning per malformed line
  DiagnosticBag diagnostics;
};

/**
 * Decode raw program output.
 *
 * CRLF line endings are normalized and blank lines skipped. Unrecognized
 * tags become Unknown records; malformed lines are dropped with a warning
 * that names their 1-based line number.
 */
[[nodiscard]] DecodeResult decode_trace(std::string_view raw);

}  // namespace codetrace
