// codetrace/instrument/metadata.hpp - Ordered file metadata
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codetrace
{

/**
 * Ordered key/value metadata describing one input file.
 *
 * Insertion order is preserved; setting an existing key replaces its value
 * in place.
 */
class Metadata
{
public:
  using Entry = std::pair<std::string, std::string>;

  void set(std::string key, std::string value);

  template <typename T>
  void set_count(std::string key, T value)
  {
    set(std::move(key), std::to_string(value));
  }

  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const { return get(key).has_value(); }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] const std::vector<Entry> & entries() const noexcept { return entries_; }

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

  [[nodiscard]] bool operator==(const Metadata & other) const
  {
    return entries_ == other.entries_;
  }

private:
  std::vector<Entry> entries_;
};

/**
 * Filesystem attributes of an input file, preformatted for metadata.
 */
struct FileAttributes
{
  std::string file_name;
  std::string file_path;  ///< absolute path
  uint64_t file_size = 0;
  std::string file_mode;  ///< ls-style permission string, e.g. "-rw-r--r--"
  std::string modified;   ///< "%Y-%m-%d %H:%M:%S", local time
  std::string accessed;
  std::string created;    ///< inode change time on POSIX systems
};

/**
 * Stat a file and format its attributes.
 *
 * @throws InstrumentError if the file cannot be stat'ed
 */
[[nodiscard]] FileAttributes read_file_attributes(const std::filesystem::path & path);

/// Add the file attribute keys (file_name .. created) to `metadata`
void append_file_attributes(Metadata & metadata, const FileAttributes & attrs);

/// Line counts as `total_lines` (newlines + 1) and `non_blank_lines`
void append_line_counts(Metadata & metadata, std::string_view source);

/// Join names with "," (no spaces)
[[nodiscard]] std::string join_names(const std::vector<std::string> & names);

/// Split a comma-joined list, dropping empty items
[[nodiscard]] std::vector<std::string> split_names(std::string_view joined);

}  // namespace codetrace
