#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>
#include <cassert>
#include <tuple>

namespace mk_diag
{

static nlohmann::json make(diag_level lv, const source_range& range, const std::string_view& message)
{
  return nlohmann::json {
    { "range", range },
    { "level", lv },
    { "message", std::string(message) },
  };
}

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message)
{
  auto j = make(diag_level::error, range, message);
  j["hrc"] = hrc;
  return j;
}

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{
  auto j = make(diag_level::warn, range, message);
  j["hrc"] = hrc;
  return j;
}

}

diagnostics_manager::~diagnostics_manager()
{ assert(printed && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  auto row = msg["range"]["row_beg"].get<std::size_t>();
  auto col = msg["range"]["col_beg"].get<std::size_t>();

  data[::detail::make_position(msg["range"]["module"].get<std::string>(), row, col)].push_back(msg);

  return *this;
}

std::size_t diagnostics_manager::count(std::uint_fast16_t hrc)
{
  std::lock_guard<std::mutex> guard(mut);

  std::size_t n = 0;
  for(auto& w : data)
  {
    n += std::count_if(w.second.begin(), w.second.end(), [hrc](const nlohmann::json& v)
        { return v.contains("hrc") && v["hrc"].get<std::uint_fast16_t>() == hrc; });
  }
  return n;
}

std::vector<nlohmann::json> diagnostics_manager::messages()
{
  std::lock_guard<std::mutex> guard(mut);

  std::vector<nlohmann::json> all;
  for(auto& w : data)
    all.insert(all.end(), w.second.begin(), w.second.end());

  // robin_map iterates in hash order, report in source order instead
  std::stable_sort(all.begin(), all.end(), [](const nlohmann::json& lhs, const nlohmann::json& rhs)
      {
        const auto& l = lhs["range"];
        const auto& r = rhs["range"];
        return std::make_tuple(l["module"].get<std::string>(), l["row_beg"].get<std::size_t>(), l["col_beg"].get<std::size_t>())
             < std::make_tuple(r["module"].get<std::string>(), r["row_beg"].get<std::size_t>(), r["col_beg"].get<std::size_t>());
      });
  return all;
}

void diagnostics_manager::print(std::FILE* file)
{
  if(printed)
    return;
  for(auto& v : messages())
  {
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}:{}:{}: ",
        v["range"]["module"].get<std::string>(),
        v["range"]["row_beg"].get<std::size_t>(),
        v["range"]["col_beg"].get<std::size_t>());

    auto lv = v["level"].get<diag_level>();

    switch(lv)
    {
    default:
    case diag_level::error:
      {
        fmt::print(file, fg(fmt::color::cornsilk), "(DE-{}) ", v["hrc"].get<std::uint_fast16_t>());
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
      } break;

    case diag_level::warn:
      {
        fmt::print(file, fg(fmt::color::cornsilk), "(DE-{}) ", v["hrc"].get<std::uint_fast16_t>());
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
        fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
      } break;
    }
    fmt::print(file, fg(fmt::color::white), "\n");
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}
