#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ast_printer.hpp>
#include <diagnostic.hpp>
#include <ast.hpp>

#include <sstream>

namespace mk = dson::mk;

static const source_map src { "printing.dson" };

TEST_CASE( "Literals print without offsets", "[printing]" ) {
  REQUIRE(dson::to_sexpr(mk::lit_null(3)) == "null");
  REQUIRE(dson::to_sexpr(mk::lit_true(3)) == "true");
  REQUIRE(dson::to_sexpr(mk::lit_false(3)) == "false");
  REQUIRE(dson::to_sexpr(mk::self(3)) == "self");
  REQUIRE(dson::to_sexpr(mk::super(3)) == "super");
  REQUIRE(dson::to_sexpr(mk::dollar(3)) == "$");

  REQUIRE(dson::to_sexpr(mk::number(0, 42)) == "(num 42)");
  REQUIRE(dson::to_sexpr(mk::number(0, -0.5)) == "(num -0.5)");
  REQUIRE(dson::to_sexpr(mk::string(0, "a\"b\n")) == "(str \"a\\\"b\\n\")");
  REQUIRE(dson::to_sexpr(mk::ident(0, 4)) == "(id 4)");
  REQUIRE(dson::to_sexpr(mk::ident(0, 4, 2)) == "(id 4 ^2)");
}

TEST_CASE( "Negative zero is its own literal", "[printing]" ) {
  const dson::expr neg = mk::number(0, -0.0);
  const dson::expr pos = mk::number(0, 0.0);

  REQUIRE(dson::to_sexpr(neg) == "(num -0)");
  REQUIRE(dson::to_sexpr(pos) == "(num 0)");
  REQUIRE(!dson::equal(neg, pos));
  REQUIRE(dson::equal(neg, dson::expr(mk::number(0, -0.0))));
}

TEST_CASE( "Operators print their source spelling", "[printing]" ) {
  auto e = mk::binary(0, mk::unary(0, dson::unary_operator::logical_not, mk::lit_true(1)),
                      dson::binary_operator::logical_or,
                      mk::paren(8, mk::binary(9, mk::number(9, 1), dson::binary_operator::shl, mk::number(14, 2))));
  REQUIRE(dson::to_sexpr(e) == "(binary || (unary ! true) (paren (binary << (num 1) (num 2))))");

  REQUIRE(dson::to_string(dson::binary_operator::in) == "in");
  REQUIRE(dson::binary_operator_from("!=") == dson::binary_operator::ne);
  REQUIRE(dson::unary_operator_from("~") == dson::unary_operator::bit_not);
  REQUIRE(!dson::binary_operator_from("**").has_value());
}

TEST_CASE( "Compound expressions", "[printing]" ) {

  SECTION( "if without else" ) {
    auto e = mk::cond(0, mk::lit_true(3), mk::number(13, 1));
    REQUIRE(dson::to_sexpr(e) == "(if true (num 1) _)");
  }

  SECTION( "assert, error and imports" ) {
    auto e = mk::assertion(0, dson::assert_stmt { mk::lit_false(7), dson::expr(mk::string(15, "no")) },
                           mk::error(21, mk::import_string(27, "msg.txt")));
    REQUIRE(dson::to_sexpr(e) == "(assert (assert-stmt false (str \"no\")) (error (importstr \"msg.txt\")))");
    REQUIRE(dson::to_sexpr(mk::import_code(0, "lib.dson")) == "(import \"lib.dson\")");
  }

  SECTION( "application with named arguments" ) {
    auto e = mk::call(0, mk::ident(0, 0, 1), {
        dson::arg { std::nullopt, mk::number(2, 1) },
        dson::arg { std::string("x"), mk::number(5, 2) },
      });
    REQUIRE(dson::to_sexpr(e) == "(apply (id 0 ^1) (args (num 1) (named \"x\" (num 2))))");
  }

  SECTION( "access forms" ) {
    auto target = mk::ident(0, 1);
    REQUIRE(dson::to_sexpr(mk::field_access(1, target, "f")) == "(select (id 1) \"f\")");
    REQUIRE(dson::to_sexpr(mk::index(1, target, mk::number(2, 0))) == "(lookup (id 1) (num 0))");
    REQUIRE(dson::to_sexpr(mk::range(1, target, std::nullopt, dson::expr(mk::number(4, 3)), std::nullopt))
            == "(slice (id 1) _ (num 3) _)");
  }

  SECTION( "array comprehension" ) {
    // [x for x in [1, 2] if x > 1]
    auto e = mk::comprehension(0, mk::ident(1, 0),
        mk::generator(3, 0, mk::array(12, { mk::number(13, 1), mk::number(16, 2) })),
        { mk::filter(20, mk::binary(23, mk::ident(23, 0), dson::binary_operator::gt, mk::number(27, 1))) });
    REQUIRE(dson::to_sexpr(e) == "(comp (id 0) (for-spec 0 (arr (num 1) (num 2))) (if-spec (binary > (id 0) (num 1))))");
  }

  SECTION( "local function binding" ) {
    // local f(a) = a; f(1)
    auto p = dson::params::make(src, { dson::param_decl { 8, "a", std::nullopt } });
    REQUIRE(p.has_value());
    auto e = mk::local(0, { dson::bind { 6, 0, std::move(p), mk::ident(12, 0) } },
                       mk::call(15, mk::ident(15, 0), { dson::arg { std::nullopt, mk::number(17, 1) } }));
    REQUIRE(dson::to_sexpr(e) == "(local ((bind 0 (params (\"a\" 0 _)) (id 0))) (apply (id 0) (args (num 1))))");
  }

  SECTION( "method field" ) {
    auto p = dson::params::make(src, {});
    REQUIRE(p.has_value());
    auto ml = dson::member_list::make(src, {
        dson::field { 1, dson::fixed_name { "m" }, false, std::move(p), dson::visibility::hidden, mk::lit_null(9) },
      });
    REQUIRE(ml.has_value());
    std::stringstream ss;
    dson::print(ss, dson::obj_body(*ml));
    REQUIRE(ss.str() == "(members (field (fixed \"m\") = hidden (params) null))");
  }
  diagnostic.reset();
}
