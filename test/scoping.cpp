#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <diagnostic_db.hpp>
#include <ast_printer.hpp>
#include <diagnostic.hpp>
#include <frame_layout.hpp>
#include <scope.hpp>

static std::uint_fast16_t hrc_of(const nlohmann::json& diag)
{ return diag["hrc"].get<std::uint_fast16_t>(); }

TEST_CASE( "Identifiers resolve to slots", "[scoping]" ) {

  SECTION( "local x = 1; x + 2" ) {
    diagnostic.reset();
    const source_map src { "a.dson", "local x = 1; x + 2" };
    dson::scope_resolver scopes(src);

    scopes.open_scope();
    const auto slot = scopes.declare("x");
    REQUIRE(slot == 0);
    auto x = scopes.identifier(13, "x");
    REQUIRE(x.has_value());
    scopes.close_scope(17);

    auto tree = dson::mk::local(0, { dson::bind { 6, slot, std::nullopt, dson::mk::number(10, 1) } },
        dson::mk::binary(13, *x, dson::binary_operator::add, dson::mk::number(17, 2)));
    REQUIRE(dson::to_sexpr(tree) == "(local ((bind 0 _ (num 1))) (binary + (id 0) (num 2)))");
    REQUIRE(scopes.frame_size() == 1);
    REQUIRE(diagnostic.empty());
  }

  SECTION( "shadowing gives the inner binding its own slot" ) {
    diagnostic.reset();
    // local x = 1; (local x = 2; x) + x
    const source_map src { "shadow.dson", "local x = 1; (local x = 2; x) + x" };
    dson::scope_resolver scopes(src);

    scopes.open_scope();
    REQUIRE(scopes.declare("x") == 0);

    scopes.open_scope();
    REQUIRE(scopes.declare("x") == 1);
    auto inner = scopes.resolve(27, "x");
    scopes.close_scope(28);

    auto outer = scopes.resolve(33, "x");
    scopes.close_scope(33);

    REQUIRE(inner.has_value());
    REQUIRE(outer.has_value());
    REQUIRE(*inner == dson::slot_ref { 1, 0 });
    REQUIRE(*outer == dson::slot_ref { 0, 0 });
  }

  SECTION( "sibling scopes never share a slot" ) {
    diagnostic.reset();
    const source_map src { "siblings.dson" };
    dson::scope_resolver scopes(src);

    scopes.open_scope();
    REQUIRE(scopes.declare("a") == 0);
    scopes.close_scope(0);

    scopes.open_scope();
    REQUIRE(scopes.declare("b") == 1);
    scopes.close_scope(0);

    REQUIRE(scopes.frame_size() == 2);
  }

  SECTION( "parameters shadow outer locals in a new frame" ) {
    diagnostic.reset();
    // local x = 1; local y = 2; function(x) x + y
    const source_map src { "frames.dson" };
    dson::scope_resolver scopes(src);

    scopes.open_scope();
    REQUIRE(scopes.declare("x") == 0);
    REQUIRE(scopes.declare("y") == 1);

    auto p = dson::params::make(src, { dson::param_decl { 36, "x", std::nullopt } });
    REQUIRE(p.has_value());

    scopes.open_frame();
    scopes.declare(*p);
    REQUIRE(scopes.frame_size() == 1);
    REQUIRE(scopes.frame_depth() == 2);

    auto x = scopes.resolve(39, "x");
    auto y = scopes.resolve(43, "y");
    scopes.close_frame(44);

    REQUIRE(x.has_value());
    REQUIRE(y.has_value());
    REQUIRE(*x == dson::slot_ref { 0, 0 });
    REQUIRE(*y == dson::slot_ref { 1, 1 });

    // back in the top level frame
    REQUIRE(scopes.frame_depth() == 1);
    REQUIRE(scopes.frame_size() == 2);
    REQUIRE(scopes.resolve(44, "x") == dson::slot_ref { 0, 0 });
    scopes.close_scope(44);
    REQUIRE(diagnostic.empty());
  }
}

TEST_CASE( "Globals live in the outermost frame", "[scoping]" ) {
  diagnostic.reset();
  const source_map src { "globals.dson" };
  dson::scope_resolver scopes(src, { "std" });

  REQUIRE(scopes.is_global("std"));
  REQUIRE(!scopes.is_global("x"));

  auto top = scopes.identifier(0, "std");
  REQUIRE(top.has_value());
  REQUIRE(dson::to_sexpr(*top) == "(id 0 ^1)");

  scopes.open_frame();
  REQUIRE(scopes.resolve(10, "std") == dson::slot_ref { 0, 2 });

  // a parameter named std hides the global
  REQUIRE(scopes.declare("std") == 0);
  REQUIRE(!scopes.is_global("std"));
  REQUIRE(scopes.resolve(20, "std") == dson::slot_ref { 0, 0 });
  scopes.close_frame(30);

  REQUIRE(scopes.is_global("std"));
  REQUIRE(diagnostic.empty());
}

TEST_CASE( "Defaults see every parameter of their list", "[scoping]" ) {
  // function(a=b, b=1) a
  const source_map src { "defaults.dson", "function(a=b, b=1) a" };

  SECTION( "names declared before the defaults are read" ) {
    diagnostic.reset();
    dson::scope_resolver scopes(src);

    scopes.open_frame();
    REQUIRE(scopes.declare("a") == 0);
    REQUIRE(scopes.declare("b") == 1);

    auto b = scopes.identifier(11, "b");
    REQUIRE(b.has_value());
    REQUIRE(dson::to_sexpr(*b) == "(id 1)");

    auto body = scopes.identifier(19, "a");
    REQUIRE(body.has_value());
    REQUIRE(scopes.frame_size() == 2);
    scopes.close_frame(20);

    auto p = dson::params::make(src, {
        dson::param_decl { 9, "a", dson::expr(*b) },
        dson::param_decl { 14, "b", dson::expr(dson::mk::number(16, 1)) },
      });
    REQUIRE(p.has_value());
    REQUIRE(p->slot_of("b") == 1u);

    // the later parameter is local to the callee, nothing is captured
    const auto layout = dson::layout_of(*p, *body);
    REQUIRE(layout.size == 2);
    REQUIRE(layout.captures.empty());
    REQUIRE(diagnostic.empty());
  }

  SECTION( "declaring a finished parameter list" ) {
    diagnostic.reset();
    auto p = dson::params::make(src, {
        dson::param_decl { 9, "a", dson::expr(dson::mk::ident(11, 1)) },
        dson::param_decl { 14, "b", dson::expr(dson::mk::number(16, 1)) },
      });
    REQUIRE(p.has_value());

    dson::scope_resolver scopes(src);
    scopes.open_frame();
    scopes.declare(*p);

    REQUIRE(scopes.resolve(11, "b") == dson::slot_ref { 1, 0 });
    REQUIRE(scopes.resolve(19, "a") == dson::slot_ref { 0, 0 });
    scopes.close_frame(20);
    REQUIRE(diagnostic.empty());
  }
}

TEST_CASE( "Unresolved identifiers are reported once", "[scoping]" ) {
  diagnostic.reset();
  const source_map src { "unresolved.dson", "local y = 1;\nx + y" };
  dson::scope_resolver scopes(src);

  scopes.open_scope();
  scopes.declare("y");
  auto x = scopes.identifier(13, "x");
  scopes.close_scope(17);

  REQUIRE(!x.has_value());
  REQUIRE(diagnostic.error_code() != 0);

  const auto expected = diagnostic_db::sema::unresolved_identifier(src.range(13), "x");
  REQUIRE(diagnostic.count(hrc_of(expected)) == 1);

  auto msgs = diagnostic.messages();
  REQUIRE(msgs.size() == 1);
  REQUIRE(msgs[0]["range"]["row_beg"] == 2);
  REQUIRE(msgs[0]["range"]["col_beg"] == 1);
  diagnostic.reset();
}

TEST_CASE( "Closing more scopes than were opened is reported", "[scoping]" ) {
  diagnostic.reset();
  const source_map src { "close.dson" };
  dson::scope_resolver scopes(src);

  scopes.close_scope(0);
  scopes.close_frame(0);

  REQUIRE(diagnostic.count(hrc_of(diagnostic_db::sema::close_without_scope(src.range(0)))) == 2);
  REQUIRE(scopes.frame_depth() == 1);
  diagnostic.reset();
}
