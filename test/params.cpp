#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <diagnostic_db.hpp>
#include <ast_printer.hpp>
#include <diagnostic.hpp>
#include <ast.hpp>

#include <algorithm>
#include <set>

static const source_map src { "params.dson", "function(a, b=2) a+b" };

static dson::param_decl plain(std::size_t offset, std::string name)
{ return dson::param_decl { offset, std::move(name), std::nullopt }; }

static dson::param_decl defaulted(std::size_t offset, std::string name, double value)
{ return dson::param_decl { offset, std::move(name), dson::expr(dson::mk::number(offset + 2, value)) }; }

TEST_CASE( "Parameter lists assign slots in declaration order", "[params]" ) {

  SECTION( "function with a defaulted parameter" ) {
    diagnostic.reset();
    auto p = dson::params::make(src, { plain(9, "a"), defaulted(12, "b", 2) });
    REQUIRE(p.has_value());

    REQUIRE(p->size() == 2);
    REQUIRE(p->entries()[0].name == "a");
    REQUIRE(p->entries()[0].slot == 0);
    REQUIRE(!p->entries()[0].default_value.has_value());
    REQUIRE(p->entries()[1].name == "b");
    REQUIRE(p->entries()[1].slot == 1);

    REQUIRE(p->required_slots() == std::vector<dson::slot_t> { 0 });
    REQUIRE(p->defaulted_slots().size() == 1);
    REQUIRE(p->defaulted_slots()[0].first == 1);
    REQUIRE(dson::to_sexpr(p->defaulted_slots()[0].second) == "(num 2)");
    REQUIRE(p->all_slots() == std::vector<dson::slot_t> { 0, 1 });

    REQUIRE(p->slot_of("a") == 0u);
    REQUIRE(p->slot_of("b") == 1u);
    REQUIRE(!p->slot_of("c").has_value());

    auto fn = dson::mk::fn(0, std::move(*p),
        dson::mk::binary(17, dson::mk::ident(17, 0), dson::binary_operator::add, dson::mk::ident(19, 1)));
    REQUIRE(dson::to_sexpr(fn) == "(function (params (\"a\" 0 _) (\"b\" 1 (num 2))) (binary + (id 0) (id 1)))");
    REQUIRE(diagnostic.empty());
  }

  SECTION( "empty parameter list" ) {
    diagnostic.reset();
    auto p = dson::params::make(src, {});
    REQUIRE(p.has_value());
    REQUIRE(p->empty());
    REQUIRE(p->required_slots().empty());
    REQUIRE(p->defaulted_slots().empty());
    REQUIRE(p->all_slots().empty());
    REQUIRE(p->name_to_slot().empty());
  }
}

TEST_CASE( "Required and defaulted slots partition all slots", "[params]" ) {

  const std::vector<std::vector<dson::param_decl>> lists = {
    { plain(0, "x") },
    { defaulted(0, "x", 1) },
    { plain(0, "a"), plain(2, "b"), plain(4, "c") },
    { defaulted(0, "a", 1), plain(5, "b"), defaulted(7, "c", 3), plain(12, "d") },
    { defaulted(0, "p", 0), defaulted(5, "q", 1) },
  };

  for(auto& decls : lists)
  {
    diagnostic.reset();
    auto p = dson::params::make(src, decls);
    REQUIRE(p.has_value());

    std::set<dson::slot_t> required(p->required_slots().begin(), p->required_slots().end());
    std::set<dson::slot_t> with_default;
    for(auto& d : p->defaulted_slots())
      with_default.insert(d.first);

    std::vector<dson::slot_t> both;
    std::set_intersection(required.begin(), required.end(), with_default.begin(), with_default.end(),
                          std::back_inserter(both));
    REQUIRE(both.empty());
    REQUIRE(required.size() + with_default.size() == decls.size());

    std::vector<dson::slot_t> expected(decls.size());
    for(std::size_t i = 0; i < expected.size(); ++i)
      expected[i] = static_cast<dson::slot_t>(i);
    REQUIRE(p->all_slots() == expected);

    // name_to_slot is a bijection onto all_slots
    REQUIRE(p->name_to_slot().size() == decls.size());
    std::set<dson::slot_t> mapped;
    for(auto& entry : p->name_to_slot())
      mapped.insert(entry.second);
    REQUIRE(mapped.size() == decls.size());
    for(auto& d : decls)
      REQUIRE(p->slot_of(d.name).has_value());

    REQUIRE(diagnostic.empty());
  }
}

TEST_CASE( "Duplicate parameter names are rejected", "[params]" ) {

  SECTION( "two x" ) {
    diagnostic.reset();
    auto p = dson::params::make(src, { plain(9, "x"), plain(12, "x") });
    REQUIRE(!p.has_value());
    REQUIRE(diagnostic.error_code() != 0);

    auto expected = diagnostic_db::ast::duplicate_parameter_name(src.range(12, 1), "x");
    REQUIRE(diagnostic.count(expected["hrc"].get<std::uint_fast16_t>()) == 1);

    auto msgs = diagnostic.messages();
    REQUIRE(msgs.size() == 1);
    REQUIRE(msgs[0]["message"] == expected["message"]);
    REQUIRE(msgs[0]["range"]["col_beg"] == 13);
  }

  SECTION( "duplicate with a default" ) {
    diagnostic.reset();
    auto p = dson::params::make(src, { defaulted(0, "y", 1), plain(5, "z"), defaulted(7, "y", 2) });
    REQUIRE(!p.has_value());
    REQUIRE(diagnostic.count(diagnostic_db::ast::duplicate_parameter_name(src.range(7), "y")["hrc"].get<std::uint_fast16_t>()) == 1);
  }
  diagnostic.reset();
}
