#include <stream_lookup.hpp>

#include <filesystem>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

static const auto cur_time = [](){
      auto now = std::chrono::system_clock::now();
      auto in_time_t = std::chrono::system_clock::to_time_t(now);

      std::stringstream ss;
      ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d_%H-%M-%S");
      return ss.str();
    };

stream_lookup_t::stream_lookup_t()
  : stdin_module((fs::temp_directory_path() / ("DSON_STDIN_" + cur_time())).string())
#ifdef DSON_TESTING
  ,test_module((fs::temp_directory_path() / ("DSON_TEST_" + cur_time())).string())
#endif
{
}

stream_lookup_t::~stream_lookup_t()
{
  std::error_code ec; // best effort, the files live in the temp directory anyway
  if(stdin_processed)
    fs::remove(stdin_module, ec);
#ifdef DSON_TESTING
  fs::remove(test_module, ec);
#endif
}

void stream_lookup_t::process_stdin()
{
  std::ofstream output_writer(stdin_module);
  output_writer << std::cin.rdbuf();
  stdin_processed = true;
}

std::string stream_lookup_t::path_of(std::string_view str)
{
  if(str == "STDIN")
    return stdin_module;
#ifdef DSON_TESTING
  if(str == "TESTSTREAM")
    return test_module;
#endif
  return std::string(str);
}

std::unique_ptr<std::ifstream> stream_lookup_t::open(std::string_view str)
{
  std::lock_guard<std::mutex> guard(mut);

  if(str == "STDIN" && !stdin_processed)
    process_stdin();

  return std::make_unique<std::ifstream>(path_of(str));
}

#ifdef DSON_TESTING
void stream_lookup_t::write_test(std::string_view str)
{
  std::lock_guard<std::mutex> guard(mut);

  std::ofstream of(test_module);
  of << str;
}
#endif
