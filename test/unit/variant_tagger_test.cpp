#include <gramc/error.hpp>
#include <gramc/rule_registry.hpp>
#include <gramc/variant_tagger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace gramc;

namespace {

  variant_table
  tag(std::string_view source) {
    rule_registry reg;
    reg.add(source);
    return tag_variants(*reg.finalize());
  }

  grammar_error
  tag_error(std::string_view source) {
    try {
      tag(source);
    } catch (const grammar_error& e) {
      return e;
    }
    FAIL("expected grammar_error for: " << source);
    return grammar_error(grammar_errc::syntax, {});
  }

} // namespace

TEST_CASE("variants: explicit and generated tags", "[variant_tagger]") {
  auto table = tag(R"(
    /** An expression. */
    expr ::= num -> number | word | /** grouped */ "(" expr ")" ;
    num :== [0-9]+ ;
    word :== [a-z]+ ;
  )");
  REQUIRE(table.types().size() == 1);

  const auto* expr = table.find("expr");
  REQUIRE(expr);
  REQUIRE(expr->variants.size() == 3);
  CHECK(expr->variants[0].tag == "number");
  CHECK_FALSE(expr->variants[0].generated);
  CHECK(expr->variants[1].tag == "expr_2");
  CHECK(expr->variants[1].generated);
  CHECK(expr->variants[2].tag == "expr_3");
  REQUIRE(expr->variants[2].doc);
  CHECK(*expr->variants[2].doc == "grouped");
  REQUIRE(expr->doc);
  CHECK(*expr->doc == "An expression.");

  CHECK(table.tag("expr", 1) == "expr_2");
}

TEST_CASE("variants: only productions get node types", "[variant_tagger]") {
  auto table = tag(R"(
    a ::= b "x" ;
    b ::= "y" ;
    t :== "z" ;
  )");
  REQUIRE(table.types().size() == 2);
  CHECK(table.types()[0].rule == "a");
  CHECK(table.types()[1].rule == "b");
  CHECK(table.find("t") == nullptr);
  CHECK(table.find("\"x\"") == nullptr);
  CHECK_THROWS_AS(table.tag("t", 0), std::out_of_range);
  CHECK_THROWS_AS(table.tag("a", 5), std::out_of_range);
}

TEST_CASE("variants: numbering follows the merged alternative list",
          "[variant_tagger]") {
  auto table = tag(R"(
    r ::= "a" ;
    r ::= "b" -> bee | "c" ;
  )");
  const auto* r = table.find("r");
  REQUIRE(r);
  REQUIRE(r->variants.size() == 3);
  CHECK(r->variants[0].tag == "r_1");
  CHECK(r->variants[1].tag == "bee");
  CHECK(r->variants[2].tag == "r_3");
}

TEST_CASE("variants: repeated explicit name", "[variant_tagger]") {
  auto e = tag_error(R"(
    x ::= a -> y | b -> y ;
    a :== "a" ;
    b :== "b" ;
  )");
  CHECK(e.kind() == grammar_errc::duplicate_variant_name);
  CHECK(e.rule_name() == "x");
}

TEST_CASE("variants: generated name colliding with an explicit one",
          "[variant_tagger]") {
  auto e = tag_error(R"(
    x ::= "a" | "b" -> x_1 ;
  )");
  CHECK(e.kind() == grammar_errc::duplicate_variant_name);
  CHECK(e.rule_name() == "x");
}

TEST_CASE("variants: same name in different rules is fine",
          "[variant_tagger]") {
  auto table = tag(R"(
    x ::= "a" -> leaf ;
    y ::= "b" -> leaf ;
  )");
  CHECK(table.tag("x", 0) == "leaf");
  CHECK(table.tag("y", 0) == "leaf");
}
