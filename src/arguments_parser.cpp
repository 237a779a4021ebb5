#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

static const source_range args_range { "args", 0, 0, 0, 0 };

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::option_table options("dsonnet-tree", "Inspects resolved dsonnet syntax trees stored as JSON.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", [](auto){ return std::make_any<bool>(true); })
    (",f,-files", "Accepts arbitrary list of files.", std::make_any<std::vector<std::string_view>>(), "STDIN",
      [](auto x){ std::vector<std::string_view> w; for(auto v : x) w.push_back(v); return w; })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::help), "help",
      [](auto x)
      {
        if(x.empty() || x.front().empty()) return emit_classes::help;
        auto& v = x.front();

        nlohmann::json easy_conversion = std::string(v);
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(args_range);
        return emit_classes::help;
      })
    ("j,-num-cores", "Number of cores to use for processing files. \"*\" to determine automatically.", std::make_any<std::size_t>(1), "1",
      [](auto x)
      {
        if(x.empty())
        {
          diagnostic <<= diagnostic_db::args::num_cores_not_a_number(args_range, "");
          return std::size_t { 1 };
        }
        if(x.front() == "*")
          return std::max<std::size_t>(1, std::thread::hardware_concurrency());

        std::size_t v = 0;
        try
        {
          v = static_cast<std::size_t>(std::stoull(std::string(x.front())));
        }
        catch(const std::logic_error&)
        {
          diagnostic <<= diagnostic_db::args::num_cores_not_a_number(args_range, x.front());
          return std::size_t { 1 };
        }

        if(v == 0)
          diagnostic <<= diagnostic_db::args::num_cores_too_small(args_range);
        else if(std::thread::hardware_concurrency() != 0 && v > std::thread::hardware_concurrency())
          diagnostic <<= diagnostic_db::args::num_cores_too_large(args_range);
        return v;
      })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  if(const auto& files = std::any_cast<std::vector<std::string_view>>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.num_cores = std::max<std::size_t>(1, std::any_cast<std::size_t>(map["j"]));
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
}

namespace detail
{

bool option_spec::is_implicit() const
{ return std::find(names.begin(), names.end(), "") != names.end(); }

std::string option_spec::key() const
{
  // first non-empty spelling, equals options are looked up with a trailing '='
  for(auto n : names)
  {
    if(!n.empty())
      return std::string(n) + (takes_equals ? "=" : "");
  }
  return {};
}

option_table::adder& option_table::adder::operator()(std::string_view spellings, std::string_view description,
    std::any default_value, std::string_view default_str, const value_parser& parser)
{
  option_spec spec { {}, description, std::move(default_value), default_str, parser };

  for(;;)
  {
    auto comma = spellings.find(',');
    auto n = spellings.substr(0, comma);

    if(!n.empty() && n.back() == '=')
    {
      n.remove_suffix(1);
      spec.takes_equals = true;
    }
    spec.names.push_back(n);

    if(comma == std::string_view::npos)
      break;
    spellings.remove_prefix(comma + 1);
  }

  table->specs.push_back(std::move(spec));
  return *this;
}

const option_spec* option_table::find(std::string_view spelling) const
{
  // `spelling` still carries its first '-'
  if(spelling.size() < 2)
    return nullptr;
  spelling.remove_prefix(1);

  for(auto& spec : specs)
  {
    if(std::find(spec.names.begin(), spec.names.end(), spelling) != spec.names.end())
      return &spec;
  }
  return nullptr;
}

const option_spec* option_table::implicit_option() const
{
  auto it = std::find_if(specs.begin(), specs.end(), [](const option_spec& s) { return s.is_implicit(); });
  return it == specs.end() ? nullptr : &*it;
}

std::map<std::string, std::any> option_table::parse(int argc, const char** argv) const
{
  std::map<std::string, std::any> values;
  for(auto& spec : specs)
    values[spec.key()] = spec.default_value;

  // `--emit=json` is handled as `--emit json`
  std::vector<std::string_view> words;
  for(int i = 1; i < argc; ++i)
  {
    std::string_view w = argv[i];
    auto eq = w.find('=');
    if(!w.empty() && w.front() == '-' && eq != std::string_view::npos)
    {
      words.push_back(w.substr(0, eq));
      words.push_back(w.substr(eq + 1));
    }
    else
      words.push_back(w);
  }

  const option_spec* current = implicit_option();
  bool named = false; // current option was spelled out on the command line
  std::vector<std::string_view> pending;

  auto flush = [&]()
  {
    if(current != nullptr && (named || !pending.empty()))
      values[current->key()] = current->parser(pending);
    pending.clear();
  };

  for(auto w : words)
  {
    if(!w.empty() && w.front() == '-')
    {
      flush();
      current = find(w);
      named = true;
      if(current == nullptr)
        diagnostic <<= diagnostic_db::args::unknown_arg(args_range);
      continue;
    }

    if(current == nullptr)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(args_range);
      continue;
    }
    pending.push_back(w);

    if(current->takes_equals)
    {
      flush();
      current = implicit_option();
      named = false;
    }
  }
  flush();

  return values;
}

void option_table::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& spec : specs)
  {
    std::string spelled;
    for(auto n : spec.names)
    {
      if(n.empty())
        continue;
      if(!spelled.empty())
        spelled += " or ";
      spelled += fmt::format("-{}{}", n, spec.takes_equals ? "=" : "");
    }
    fmt::print(f, "  {:<24} {} [default={}]\n", spelled, spec.description, spec.default_str);
  }
}

}

}
