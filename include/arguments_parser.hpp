#pragma once

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace arguments
{

// Fills the global config, problems end up in the diagnostics manager.
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  using value_parser = std::function<std::any(const std::vector<std::string_view>&)>;

  struct option_spec
  {
    // spellings without the leading '-', "" marks the option taking loose arguments
    std::vector<std::string_view> names;
    std::string_view description;
    std::any default_value;
    std::string_view default_str;
    value_parser parser;

    // `--name=value`, exactly one value
    bool takes_equals { false };

    bool is_implicit() const;
    std::string key() const;
  };

  // Options are registered with a chained call:
  //   table.add_options()("h,-help", "Prints this text.", false, "false", parser)(...);
  // and read back by their first spelling from the map parse() returns.
  class option_table
  {
    struct adder
    {
      adder& operator()(std::string_view spellings, std::string_view description, std::any default_value,
                        std::string_view default_str, const value_parser& parser);

      option_table* table;
    };
  public:
    option_table(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    adder add_options() { return { this }; }

    std::map<std::string, std::any> parse(int argc, const char** argv) const;

    void print_help(std::FILE* f) const;
  private:
    const option_spec* find(std::string_view spelling) const;
    const option_spec* implicit_option() const;

    std::string_view name;
    std::string_view description;

    std::vector<option_spec> specs;
  };

}

}
