// codetrace/instrument/metadata.cpp - Metadata and file attribute helpers
#include "codetrace/instrument/metadata.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <sys/stat.h>

#include <algorithm>
#include <ctime>

#include "codetrace/instrument/language_backend.hpp"

namespace codetrace
{

namespace
{

std::string format_mode(mode_t mode)
{
  std::string out(10, '-');
  if (S_ISDIR(mode)) {
    out[0] = 'd';
  } else if (S_ISLNK(mode)) {
    out[0] = 'l';
  } else if (S_ISCHR(mode)) {
    out[0] = 'c';
  } else if (S_ISBLK(mode)) {
    out[0] = 'b';
  } else if (S_ISFIFO(mode)) {
    out[0] = 'p';
  } else if (S_ISSOCK(mode)) {
    out[0] = 's';
  }

  const mode_t bits[9] = {S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP,
                          S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH};
  const char marks[3] = {'r', 'w', 'x'};
  for (int i = 0; i < 9; ++i) {
    if ((mode & bits[i]) != 0) {
      out[static_cast<size_t>(i) + 1] = marks[i % 3];
    }
  }

  if ((mode & S_ISUID) != 0) out[3] = (mode & S_IXUSR) ? 's' : 'S';
  if ((mode & S_ISGID) != 0) out[6] = (mode & S_IXGRP) ? 's' : 'S';
  if ((mode & S_ISVTX) != 0) out[9] = (mode & S_IXOTH) ? 't' : 'T';
  return out;
}

std::string format_local_time(std::time_t t)
{
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(t));
}

}  // namespace

void Metadata::set(std::string key, std::string value)
{
  for (auto & [k, v] : entries_) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string_view> Metadata::get(std::string_view key) const
{
  for (const auto & [k, v] : entries_) {
    if (k == key) {
      return std::string_view(v);
    }
  }
  return std::nullopt;
}

FileAttributes read_file_attributes(const std::filesystem::path & path)
{
  struct stat st
  {
  };
  if (::stat(path.c_str(), &st) != 0) {
    throw InstrumentError("cannot stat '" + path.string() + "'");
  }

  std::error_code ec;
  const auto absolute = std::filesystem::absolute(path, ec);

  FileAttributes attrs;
  attrs.file_name = path.filename().string();
  attrs.file_path = ec ? path.string() : absolute.string();
  attrs.file_size = static_cast<uint64_t>(st.st_size);
  attrs.file_mode = format_mode(st.st_mode);
  attrs.modified = format_local_time(st.st_mtime);
  attrs.accessed = format_local_time(st.st_atime);
  attrs.created = format_local_time(st.st_ctime);
  return attrs;
}

void append_file_attributes(Metadata & metadata, const FileAttributes & attrs)
{
  metadata.set("file_name", attrs.file_name);
  metadata.set("file_path", attrs.file_path);
  metadata.set_count("file_size", attrs.file_size);
  metadata.set("file_mode", attrs.file_mode);
  metadata.set("modified", attrs.modified);
  metadata.set("accessed", attrs.accessed);
  metadata.set("created", attrs.created);
}

void append_line_counts(Metadata & metadata, std::string_view source)
{
  const auto newlines = std::count(source.begin(), source.end(), '\n');
  metadata.set_count("total_lines", newlines + 1);

  size_t non_blank = 0;
  size_t pos = 0;
  while (pos <= source.size()) {
    const size_t nl = source.find('\n', pos);
    const std::string_view line =
      source.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    if (line.find_first_not_of(" \t\r\f\v") != std::string_view::npos) {
      ++non_blank;
    }
    if (nl == std::string_view::npos) {
      break;
    }
    pos = nl + 1;
  }
  metadata.set_count("non_blank_lines", non_blank);
}

std::string join_names(const std::vector<std::string> & names)
{
  std::string out;
  for (const auto & n : names) {
    if (!out.empty()) {
      out += ',';
    }
    out += n;
  }
  return out;
}

std::vector<std::string> split_names(std::string_view joined)
{
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= joined.size()) {
    const size_t comma = joined.find(',', pos);
    const std::string_view item =
      joined.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    pos = comma + 1;
  }
  return out;
}

}  // namespace codetrace
