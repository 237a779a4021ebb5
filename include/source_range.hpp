#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <string>
#include <vector>

struct source_range
{
  std::string_view module;

  std::size_t column_beg;
  std::size_t row_beg;

  std::size_t column_end;
  std::size_t row_end;

  source_range() = default;

  source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                  std::size_t column_end, std::size_t row_end);
};

void to_json(nlohmann::json& j, const source_range& s);

// Nodes only carry byte offsets. The source map turns those back into
// row/column ranges once something has to be reported.
class source_map
{
public:
  source_map(std::string module, std::string_view text);
  explicit source_map(std::string module);

  const std::string& module() const { return name; }

  // rows and columns are 1-based
  source_range range(std::size_t offset, std::size_t length = 1) const;
private:
  std::size_t row_of(std::size_t offset) const;

  std::string name;
  std::vector<std::size_t> line_starts;
};
