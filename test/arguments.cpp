#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <cstdio>
#include <thread>

static std::uint_fast16_t hrc_of(const nlohmann::json& diag)
{ return diag["hrc"].get<std::uint_fast16_t>(); }

static const source_range args_range { "args", 0, 0, 0, 0 };

template<std::size_t N>
static void parse(const char* (&argv)[N])
{
  diagnostic.reset();
  config = config_t {};

  std::FILE* out = std::tmpfile();
  REQUIRE(out != nullptr);
  arguments::parse(static_cast<int>(N), argv, out);
  std::fclose(out);
}

TEST_CASE( "Command line arguments fill the config", "[arguments]" ) {

  SECTION( "emit class and files" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=sexpr", "-f", "a.json", "b.json" };
    parse(argv);

    REQUIRE(diagnostic.empty());
    REQUIRE(config.emit_class == emit_classes::sexpr);
    REQUIRE(!config.print_help);
    REQUIRE(config.files.size() == 2);
    REQUIRE(config.files[0] == "a.json");
    REQUIRE(config.files[1] == "b.json");
    REQUIRE(config.num_cores == 1);
  }

  SECTION( "files without -f" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=frames", "tree.json" };
    parse(argv);

    REQUIRE(diagnostic.empty());
    REQUIRE(config.emit_class == emit_classes::frames);
    REQUIRE(config.files.size() == 1);
    REQUIRE(config.files[0] == "tree.json");
  }

  SECTION( "help flag" ) {
    const char* argv[] = { "dsonnet-tree", "-h" };
    parse(argv);

    REQUIRE(diagnostic.empty());
    REQUIRE(config.print_help);
  }

  SECTION( "no emit class asks for help" ) {
    const char* argv[] = { "dsonnet-tree", "-f", "a.json" };
    parse(argv);

    REQUIRE(config.emit_class == emit_classes::help);
    REQUIRE(config.print_help);
  }

  SECTION( "number of cores" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=json", "-j", "1" };
    parse(argv);

    REQUIRE(diagnostic.empty());
    REQUIRE(config.emit_class == emit_classes::json);
    REQUIRE(config.num_cores == 1);
  }

  SECTION( "all cores" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=json", "-j", "*" };
    parse(argv);

    REQUIRE(diagnostic.empty());
    REQUIRE(config.num_cores == std::max<std::size_t>(1, std::thread::hardware_concurrency()));
  }
  diagnostic.reset();
}

TEST_CASE( "Bad command line arguments are reported", "[arguments]" ) {

  SECTION( "unknown emit class" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=tokens" };
    parse(argv);

    REQUIRE(diagnostic.count(hrc_of(diagnostic_db::args::emit_not_present(args_range))) == 1);
    REQUIRE(config.emit_class == emit_classes::help);
  }

  SECTION( "zero cores" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=sexpr", "-j", "0" };
    parse(argv);

    REQUIRE(diagnostic.count(hrc_of(diagnostic_db::args::num_cores_too_small(args_range))) == 1);
    REQUIRE(config.num_cores == 1);
  }

  SECTION( "cores not a number" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=sexpr", "-j", "many" };
    parse(argv);

    REQUIRE(diagnostic.count(hrc_of(diagnostic_db::args::num_cores_not_a_number(args_range, "many"))) == 1);
    REQUIRE(config.num_cores == 1);
  }

  SECTION( "unknown option" ) {
    const char* argv[] = { "dsonnet-tree", "--emit=sexpr", "--bogus" };
    parse(argv);

    REQUIRE(diagnostic.count(hrc_of(diagnostic_db::args::unknown_arg(args_range))) == 1);
    REQUIRE(diagnostic.error_code() != 0);
  }
  diagnostic.reset();
}
