// codetrace/instrument/insertion_plan.hpp - Line-keyed code insertions
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codetrace/basic/source_file.hpp"

namespace codetrace
{

/**
 * Fragments to insert before or after original source lines.
 *
 * Fragments scheduled for the same line and position keep the order in
 * which they were added. A prelude is emitted ahead of the first line.
 * Inline fragments are spliced into a line at a byte column, for code that
 * shares its line with the statement it accompanies.
 */
class InsertionPlan
{
public:
  void add_prelude(std::string line);
  void add_before(uint32_t row, std::string fragment);
  void add_after(uint32_t row, std::string fragment);
  void add_inline(uint32_t row, uint32_t column, std::string fragment);

  [[nodiscard]] const std::vector<std::string> & before(uint32_t row) const;
  [[nodiscard]] const std::vector<std::string> & after(uint32_t row) const;
  /// `row` with its inline fragments spliced in
  [[nodiscard]] std::string inline_line(uint32_t row, std::string_view line) const;

  [[nodiscard]] size_t fragment_count() const noexcept;
  [[nodiscard]] bool empty() const noexcept { return fragment_count() == 0; }

  /**
   * Rebuild the source with all scheduled fragments.
   *
   * Lines are emitted in order, each preceded by its before-fragments and
   * followed by its after-fragments, joined with '\n'. Fragments keyed past
   * the last line are dropped.
   */
  [[nodiscard]] std::string apply(const SourceFile & source) const;

private:
  std::vector<std::string> prelude_;
  std::map<uint32_t, std::vector<std::string>> before_;
  std::map<uint32_t, std::vector<std::string>> after_;
  std::map<uint32_t, std::vector<std::pair<uint32_t, std::string>>> inline_;
};

}  // namespace codetrace
