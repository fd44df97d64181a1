// codetrace/seed/seed_generator.hpp - Reproducible seeds derived from file metadata
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "codetrace/instrument/metadata.hpp"

namespace codetrace
{

/// Shortest and longest decimal seed
inline constexpr size_t k_min_seed_digits = 19;
inline constexpr size_t k_max_seed_digits = 20;

/**
 * Compact JSON of the metadata with keys sorted.
 *
 * This is the exact byte string that derive_seed() hashes.
 */
[[nodiscard]] std::string canonical_metadata_json(const Metadata & metadata);

/**
 * Derive the seed of a metadata mapping.
 *
 * The SHA-256 digest of the canonical JSON is read as an unsigned integer,
 * its decimal digits are cut into 20-digit chunks and the chunks are XORed
 * together. Results longer than 20 digits keep their first 20; results
 * shorter than 19 are padded with digits from a Mersenne Twister seeded by
 * the first chunk.
 *
 * @return Decimal seed of 19 or 20 digits without leading zeros
 */
[[nodiscard]] std::string derive_seed(const Metadata & metadata);

/// True if `seed` is 19 or 20 decimal digits
[[nodiscard]] bool is_valid_seed_override(std::string_view seed) noexcept;

/**
 * Seed stored in an existing result document.
 *
 * @return The seed, or std::nullopt if the file is missing, unreadable or
 *         holds no valid seed
 */
[[nodiscard]] std::optional<std::string> read_previous_seed(const std::filesystem::path & path);

/**
 * Metadata object of an existing result document.
 *
 * Non-string values are kept as their JSON text. Key order is not
 * preserved, which does not affect the derived seed.
 */
[[nodiscard]] std::optional<Metadata> read_result_metadata(const std::filesystem::path & path);

}  // namespace codetrace
