#include <stream_lookup.hpp>
#include <frame_layout.hpp>
#include <ast_printer.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <tree_tool.hpp>
#include <ast_json.hpp>

#include <fmt/format.h>

#include <functional>
#include <iostream>
#include <cassert>
#include <chrono>
#include <future>
#include <vector>
#include <mutex>
#include <map>

static const std::map<emit_classes, std::function<std::string(const dson::expr&)>> emitter =
{
  { emit_classes::sexpr, [](const dson::expr& e) { return dson::to_sexpr(e); } },
  { emit_classes::json, [](const dson::expr& e) { return dson::dump_json(e).dump(2); } },
  { emit_classes::frames, [](const dson::expr& e) { return nlohmann::json(dson::layout_of(e)).dump(); } },
};

std::optional<std::string> tree_tool::render(std::string_view module, emit_classes what)
{
  const source_map src { std::string(module) };

  auto is = stream_lookup.open(module);
  if(!is->is_open())
  {
    diagnostic <<= diagnostic_db::dump::cannot_open(src.range(0), module);
    return std::nullopt;
  }
  auto tree = dson::read_json(*is, src);

  if(!tree)
    return std::nullopt;
  return emitter.at(what)(*tree);
}

void tree_tool::go()
{
  std::vector<std::string_view> tasks;
  if(config.files.empty())
    tasks = { "STDIN" };
  else
    tasks = config.files;

  std::mutex out_mut;
  auto run = [&out_mut](std::string_view t)
  {
    auto text = render(t, config.emit_class);
    if(!text)
      return;

    std::lock_guard<std::mutex> guard(out_mut);
    if(config.files.size() > 1)
      fmt::print("{}:\n", t);
    fmt::print("{}\n", *text);
  };

  std::vector<std::future<void>> runners;
  for(auto tit = tasks.begin(); tit != tasks.end(); )
  {
    for(std::size_t i = runners.size(); tit != tasks.end() && i < config.num_cores; ++i)
    {
      runners.emplace_back(std::async(std::launch::async, run, *tit));

      ++tit;
    }
    for(auto rit = runners.begin(); rit != runners.end(); )
    {
      assert(rit->valid() && "Future has become invalid!");
      if(rit->wait_for(std::chrono::nanoseconds(100)) == std::future_status::ready)
      {
        rit->get();
        rit = runners.erase(rit);
      }
      else
        ++rit;
    }
  }
  for(auto& r : runners)
    r.get();
}
