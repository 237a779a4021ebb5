#pragma once

#include <string_view>
#include <fstream>
#include <memory>
#include <string>
#include <mutex>

// Opens input streams by module name. "STDIN" is spooled to a temporary
// file on first use, "TESTSTREAM" reads what write_test stored last.
// Every call gets a stream of its own, so one module may be read by several
// threads at once.
struct stream_lookup_t
{
  stream_lookup_t();
  ~stream_lookup_t();

  // The returned stream is not open if the module does not exist.
  std::unique_ptr<std::ifstream> open(std::string_view str);

#ifdef DSON_TESTING
  void write_test(std::string_view str);
#endif
private:
  std::string path_of(std::string_view str);
  void process_stdin();
private:
  std::string stdin_module;
#ifdef DSON_TESTING
  std::string test_module;
#endif

  bool stdin_processed { false };
  std::mutex mut;
};

inline stream_lookup_t stream_lookup;
