#include <source_range.hpp>

#include <algorithm>
#include <iterator>

source_range::source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                                    std::size_t column_end, std::size_t row_end)
  : module(module), column_beg(column_beg), row_beg(row_beg), column_end(column_end), row_end(row_end)
{  }

void to_json(nlohmann::json& j, const source_range& s)
{
  j = nlohmann::json{
    { "module", std::string(s.module) },
    { "col_beg", s.column_beg },
    { "row_beg", s.row_beg },
    { "col_end", s.column_end },
    { "row_end", s.row_end },
  };
}

/// SOURCE MAP

source_map::source_map(std::string module, std::string_view text)
  : name(std::move(module)), line_starts({ 0 })
{
  for(std::size_t i = 0; i < text.size(); ++i)
  {
    if(text[i] == '\n')
      line_starts.push_back(i + 1);
  }
}

source_map::source_map(std::string module)
  : name(std::move(module)), line_starts({ 0 })
{  }

std::size_t source_map::row_of(std::size_t offset) const
{
  // index of the last line start that is <= offset
  auto it = std::upper_bound(line_starts.begin(), line_starts.end(), offset);
  return static_cast<std::size_t>(std::distance(line_starts.begin(), it)) - 1;
}

source_range source_map::range(std::size_t offset, std::size_t length) const
{
  const std::size_t last = offset + (length == 0 ? 0 : length - 1);

  const std::size_t row_beg = row_of(offset);
  const std::size_t row_end = row_of(last);

  return source_range { name,
                        offset - line_starts[row_beg] + 1, row_beg + 1,
                        last - line_starts[row_end] + 1, row_end + 1 };
}
