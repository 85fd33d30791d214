// castlist/basic/source_manager.cpp - Source location implementation
#include "castlist/basic/source_manager.hpp"

#include <algorithm>
#include <functional>

namespace castlist
{

SourceRange range_of(std::string_view source, std::string_view slice) noexcept
{
  const char * const base = source.data();
  const char * const p = slice.data();
  if (base == nullptr || p == nullptr) {
    return {};
  }
  // std::less gives a total order even for unrelated pointers.
  if (std::less<const char *>{}(p, base) || std::less<const char *>{}(base + source.size(), p)) {
    return {};
  }
  const auto start = static_cast<uint32_t>(p - base);
  const auto end =
    static_cast<uint32_t>(std::min(source.size(), static_cast<size_t>(start) + slice.size()));
  return {start, end};
}

LineColumn SourceManager::get_line_column(SourceLocation loc) const noexcept
{
  if (line_offsets_.empty() || loc.is_invalid()) {
    return {};
  }

  uint32_t offset = loc.get_offset();
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && source_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && source_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(source_).substr(start, end - start);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().get_offset();
  result.end_byte = range.get_end().get_offset();

  const auto start_lc = get_line_column(range.get_begin());
  const auto end_lc = get_line_column(range.get_end());

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace castlist
