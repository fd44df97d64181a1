// codetrace/seed/seed_generator.cpp - Reproducible seeds derived from file metadata
#include "codetrace/seed/seed_generator.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

#include "codetrace/basic/source_file.hpp"

namespace codetrace
{

namespace
{

constexpr size_t k_chunk_digits = 20;

/**
 * Arbitrary-precision unsigned integer, limbs most significant first.
 */
class BigUnsigned
{
public:
  static BigUnsigned from_bytes(const unsigned char * data, size_t size)
  {
    BigUnsigned n;
    uint32_t limb = 0;
    size_t filled = (4 - size % 4) % 4;
    for (size_t i = 0; i < size; ++i) {
      limb = (limb << 8) | data[i];
      if (++filled == 4) {
        n.limbs_.push_back(limb);
        limb = 0;
        filled = 0;
      }
    }
    n.trim();
    return n;
  }

  static BigUnsigned from_decimal(std::string_view digits)
  {
    BigUnsigned n;
    for (const char c : digits) {
      uint64_t carry = static_cast<uint64_t>(c - '0');
      for (auto it = n.limbs_.rbegin(); it != n.limbs_.rend(); ++it) {
        const uint64_t cur = static_cast<uint64_t>(*it) * 10 + carry;
        *it = static_cast<uint32_t>(cur);
        carry = cur >> 32;
      }
      if (carry != 0) {
        n.limbs_.insert(n.limbs_.begin(), static_cast<uint32_t>(carry));
      }
    }
    n.trim();
    return n;
  }

  [[nodiscard]] std::string to_decimal() const
  {
    std::vector<uint32_t> work = limbs_;
    std::string digits;
    while (!work.empty()) {
      uint64_t rem = 0;
      for (auto & limb : work) {
        const uint64_t cur = (rem << 32) | limb;
        limb = static_cast<uint32_t>(cur / 10);
        rem = cur % 10;
      }
      digits += static_cast<char>('0' + rem);
      while (!work.empty() && work.front() == 0) {
        work.erase(work.begin());
      }
    }
    if (digits.empty()) {
      return "0";
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
  }

  BigUnsigned & operator^=(const BigUnsigned & other)
  {
    if (other.limbs_.size() > limbs_.size()) {
      limbs_.insert(limbs_.begin(), other.limbs_.size() - limbs_.size(), 0);
    }
    const size_t shift = limbs_.size() - other.limbs_.size();
    for (size_t i = 0; i < other.limbs_.size(); ++i) {
      limbs_[shift + i] ^= other.limbs_[i];
    }
    trim();
    return *this;
  }

  [[nodiscard]] const std::vector<uint32_t> & limbs() const noexcept { return limbs_; }

private:
  void trim()
  {
    const auto first =
      std::find_if(limbs_.begin(), limbs_.end(), [](uint32_t l) { return l != 0; });
    limbs_.erase(limbs_.begin(), first);
  }

  std::vector<uint32_t> limbs_;
};

std::array<unsigned char, 32> sha256(std::string_view data)
{
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int size = 0;
  if (
    EVP_Digest(data.data(), data.size(), digest.data(), &size, EVP_sha256(), nullptr) != 1 ||
    size != 32) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  std::array<unsigned char, 32> out{};
  std::copy_n(digest.begin(), out.size(), out.begin());
  return out;
}

}  // namespace

std::string canonical_metadata_json(const Metadata & metadata)
{
  // nlohmann::json keeps object keys sorted.
  nlohmann::json j = nlohmann::json::object();
  for (const auto & [key, value] : metadata) {
    j[key] = value;
  }
  return j.dump();
}

std::string derive_seed(const Metadata & metadata)
{
  const auto digest = sha256(canonical_metadata_json(metadata));
  const std::string decimal = BigUnsigned::from_bytes(digest.data(), digest.size()).to_decimal();

  std::vector<BigUnsigned> chunks;
  for (size_t pos = 0; pos < decimal.size(); pos += k_chunk_digits) {
    chunks.push_back(BigUnsigned::from_decimal(decimal.substr(pos, k_chunk_digits)));
  }

  BigUnsigned folded;
  for (const auto & chunk : chunks) {
    folded ^= chunk;
  }

  std::string seed = folded.to_decimal();
  if (seed.size() > k_max_seed_digits) {
    seed.resize(k_max_seed_digits);
  }
  if (seed.size() < k_min_seed_digits) {
    const std::vector<uint32_t> & limbs = chunks.front().limbs();
    std::seed_seq seq(limbs.begin(), limbs.end());
    std::mt19937_64 rng(seq);
    if (seed == "0") {
      seed = std::to_string(1 + rng() % 9);
    }
    while (seed.size() < k_min_seed_digits) {
      seed += static_cast<char>('0' + rng() % 10);
    }
  }
  return seed;
}

bool is_valid_seed_override(std::string_view seed) noexcept
{
  return seed.size() >= k_min_seed_digits && seed.size() <= k_max_seed_digits &&
         std::all_of(seed.begin(), seed.end(), [](char c) { return c >= '0' && c <= '9'; });
}

namespace
{

/// Parse a result document; a discarded value if it is missing or invalid
nlohmann::json load_result_document(const std::filesystem::path & path)
{
  std::error_code ec;
  std::string content;
  if (!std::filesystem::is_regular_file(path, ec) || !read_file(path, content)) {
    spdlog::debug("cannot read previous result {}", path.string());
    return nlohmann::json(nlohmann::json::value_t::discarded);
  }
  nlohmann::json doc = nlohmann::json::parse(content, nullptr, false);
  if (!doc.is_discarded() && !doc.is_object()) {
    return nlohmann::json(nlohmann::json::value_t::discarded);
  }
  return doc;
}

}  // namespace

std::optional<std::string> read_previous_seed(const std::filesystem::path & path)
{
  const nlohmann::json doc = load_result_document(path);
  if (doc.is_discarded() || !doc.contains("seed")) {
    spdlog::debug("no seed in previous result {}", path.string());
    return std::nullopt;
  }

  const nlohmann::json & seed = doc["seed"];
  std::string text;
  if (seed.is_number_unsigned()) {
    text = std::to_string(seed.get<uint64_t>());
  } else if (seed.is_string()) {
    text = seed.get<std::string>();
  }
  if (!is_valid_seed_override(text)) {
    return std::nullopt;
  }
  return text;
}

std::optional<Metadata> read_result_metadata(const std::filesystem::path & path)
{
  const nlohmann::json doc = load_result_document(path);
  if (doc.is_discarded() || !doc.contains("metadata") || !doc["metadata"].is_object()) {
    return std::nullopt;
  }

  Metadata metadata;
  for (const auto & item : doc["metadata"].items()) {
    const nlohmann::json & value = item.value();
    metadata.set(item.key(), value.is_string() ? value.get<std::string>() : value.dump());
  }
  return metadata;
}

}  // namespace codetrace
