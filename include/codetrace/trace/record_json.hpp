// codetrace/trace/record_json.hpp - JSON form of decoded traces
#pragma once

#include <nlohmann/json.hpp>

#include "codetrace/instrument/metadata.hpp"
#include "codetrace/trace/decoder.hpp"
#include "codetrace/trace/record.hpp"

namespace codetrace
{

/**
 * Serialize one record.
 *
 * Keys follow the payload layout (`type` first, `id` last); optional
 * fields are omitted when absent.
 */
[[nodiscard]] nlohmann::ordered_json to_json(const TraceRecord & record);

/// Metadata as a flat string object in insertion order
[[nodiscard]] nlohmann::ordered_json to_json(const Metadata & metadata);

/// `{"metadata": ..., "traces": [...]}`
[[nodiscard]] nlohmann::ordered_json to_json(const DecodeResult & result);

}  // namespace codetrace
