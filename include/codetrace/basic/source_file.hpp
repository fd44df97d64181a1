// codetrace/basic/source_file.hpp - Source locations, ranges and line tables
//
// Byte-offset based locations with on-demand line/column conversion.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace codetrace
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into a source file.
 *
 * Line and column information is computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Half-open byte range [start, end)
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_.offset() - start_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions (1-indexed)
// ============================================================================

struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - Owned source text with a line table
// ============================================================================

/**
 * Source text of one input file.
 *
 * Line indices are 0-based and delimited by '\n' only, matching tree-sitter
 * row numbering. A trailing '\r' is part of the line content.
 */
class SourceFile
{
public:
  SourceFile() { build_line_table(); }
  explicit SourceFile(std::string content);
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  /// Number of '\n'-delimited lines (an empty file has one empty line)
  [[nodiscard]] uint32_t line_count() const noexcept
  {
    return static_cast<uint32_t>(line_offsets_.size());
  }

  [[nodiscard]] uint32_t line_offset(uint32_t line_index) const noexcept;

  /// Content of a 0-indexed line, without the terminating newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  /**
   * Split the content into lines the way a line-oriented editor would.
   *
   * A final newline does not start an extra empty line, and a trailing '\r'
   * is stripped from each line.
   */
  [[nodiscard]] std::vector<std::string_view> split_lines() const;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

/**
 * Read a whole file into a string.
 *
 * @return false if the file could not be opened
 */
[[nodiscard]] bool read_file(const std::filesystem::path & path, std::string & out);

/**
 * Write a string to a file, replacing any previous content.
 *
 * @return false if the file could not be written
 */
[[nodiscard]] bool write_file(const std::filesystem::path & path, std::string_view content);

}  // namespace codetrace
