// codetrace/instrument/insertion_plan.cpp - Insertion plan implementation
#include "codetrace/instrument/insertion_plan.hpp"

#include <algorithm>
#include <utility>

namespace codetrace
{

namespace
{

const std::vector<std::string> & lookup(
  const std::map<uint32_t, std::vector<std::string>> & table, uint32_t row)
{
  static const std::vector<std::string> empty;
  const auto it = table.find(row);
  return it == table.end() ? empty : it->second;
}

void append_line(std::string & out, std::string_view line)
{
  out.append(line.data(), line.size());
  out += '\n';
}

}  // namespace

void InsertionPlan::add_prelude(std::string line) { prelude_.push_back(std::move(line)); }

void InsertionPlan::add_before(uint32_t row, std::string fragment)
{
  before_[row].push_back(std::move(fragment));
}

void InsertionPlan::add_after(uint32_t row, std::string fragment)
{
  after_[row].push_back(std::move(fragment));
}

void InsertionPlan::add_inline(uint32_t row, uint32_t column, std::string fragment)
{
  inline_[row].emplace_back(column, std::move(fragment));
}

const std::vector<std::string> & InsertionPlan::before(uint32_t row) const
{
  return lookup(before_, row);
}

const std::vector<std::string> & InsertionPlan::after(uint32_t row) const
{
  return lookup(after_, row);
}

std::string InsertionPlan::inline_line(uint32_t row, std::string_view line) const
{
  const auto it = inline_.find(row);
  if (it == inline_.end()) {
    return std::string(line);
  }
  auto edits = it->second;
  std::stable_sort(edits.begin(), edits.end(), [](const auto & a, const auto & b) {
    return a.first < b.first;
  });

  std::string out;
  size_t pos = 0;
  for (const auto & [column, fragment] : edits) {
    const size_t at = std::min<size_t>(column, line.size());
    out.append(line.substr(pos, at - pos));
    out += fragment;
    pos = at;
  }
  out.append(line.substr(pos));
  return out;
}

size_t InsertionPlan::fragment_count() const noexcept
{
  size_t n = 0;
  for (const auto & [row, fragments] : before_) n += fragments.size();
  for (const auto & [row, fragments] : after_) n += fragments.size();
  for (const auto & [row, fragments] : inline_) n += fragments.size();
  return n;
}

std::string InsertionPlan::apply(const SourceFile & source) const
{
  const std::vector<std::string_view> lines = source.split_lines();

  std::string out;
  out.reserve(source.size() + fragment_count() * 64);

  for (const auto & p : prelude_) {
    append_line(out, p);
  }

  for (size_t i = 0; i < lines.size(); ++i) {
    const auto row = static_cast<uint32_t>(i);
    for (const auto & f : before(row)) {
      append_line(out, f);
    }
    append_line(out, inline_line(row, lines[i]));
    for (const auto & f : after(row)) {
      append_line(out, f);
    }
  }

  return out;
}

}  // namespace codetrace
