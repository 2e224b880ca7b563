#include <gramc/compiled_grammar.hpp>
#include <gramc/error.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace gramc;

namespace {

  const char* greeting_grammar = R"(
    greeting ::= "hi" name ;
    name :== [a-z]+ ;
    _ :== [ ]+ ;
  )";

  compile_options
  collect_into(std::vector<std::string>& warnings) {
    compile_options options;
    options.on_warning = [&warnings](const std::string& message) {
      warnings.push_back(message);
    };
    return options;
  }

  grammar_errc
  compile_error(std::string_view source) {
    compile_options options;
    options.warnings = false;
    try {
      compile_grammar(source, options);
    } catch (const grammar_error& e) {
      return e.kind();
    }
    FAIL("expected grammar_error for: " << source);
    return grammar_errc::syntax;
  }

} // namespace

// == Pipeline ================================================================

TEST_CASE("compile: greeting end to end", "[compiled_grammar]") {
  std::vector<std::string> warnings;
  auto g = compile_grammar(greeting_grammar, collect_into(warnings));
  CHECK(warnings.empty());

  auto node = g.parse("greeting", "hi bob");
  CHECK(node.rule == "greeting");
  CHECK(node.variant == "greeting_1");
  REQUIRE(node.children.size() == 2);
  CHECK(node.children[0].as_token().rule == "\"hi\"");
  CHECK(node.children[0].as_token().text == "hi");
  CHECK(node.children[1].as_token().rule == "name");
  CHECK(node.children[1].as_token().text == "bob");

  auto tokens = g.tokenize("hi bob");
  REQUIRE(tokens.size() == 2);
  auto from_tokens = g.syntax.parse("greeting", tokens);
  CHECK(from_tokens.variant == "greeting_1");
  CHECK(from_tokens.children[1].as_token() == node.children[1].as_token());
}

TEST_CASE("compile: components share one rule set", "[compiled_grammar]") {
  compile_options options;
  options.warnings = false;
  auto g = compile_grammar(greeting_grammar, options);
  CHECK(g.rules.use_count() > 1);
  CHECK(g.alphabet->real_tokens() ==
        std::vector<std::string>{"\"hi\"", "name"});
  CHECK(g.lexer.alphabet() == std::vector<std::string>{"\"hi\"", "name", "_"});
  REQUIRE(g.variants->find("greeting"));
  CHECK(g.automaton->has_rule(g.rules->index_of("name")));
}

TEST_CASE("compile: parse options reach the parser", "[compiled_grammar]") {
  compile_options options;
  options.warnings = false;
  options.parse_defaults.max_depth = 7;
  auto g = compile_grammar(greeting_grammar, options);
  CHECK(g.syntax.options().max_depth == 7);
}

// == Diagnostics =============================================================

TEST_CASE("compile: warnings for unused rules", "[compiled_grammar]") {
  std::vector<std::string> warnings;
  compile_grammar(R"(
    greeting ::= "hi" name ;
    orphan ::= name ;
    name :== [a-z]+ ;
    spare :== [0-9]+ ;
    _ :== [ ]+ ;
  )",
                  collect_into(warnings));
  CHECK(warnings == std::vector<std::string>{
                        "token fragment 'spare' is never used",
                        "production 'orphan' is unreachable from 'greeting'"});
}

TEST_CASE("compile: warnings can be switched off", "[compiled_grammar]") {
  std::vector<std::string> warnings;
  auto options = collect_into(warnings);
  options.warnings = false;
  compile_grammar(R"(a ::= "x" ; b ::= "y" ;)", options);
  CHECK(warnings.empty());
}

TEST_CASE("compile: grammar without productions", "[compiled_grammar]") {
  std::vector<std::string> warnings;
  auto g = compile_grammar(R"(t :== "x" ;)", collect_into(warnings));
  CHECK(g.alphabet->real_tokens().empty());
  CHECK(warnings ==
        std::vector<std::string>{"token fragment 't' is never used"});
}

// == Errors ==================================================================

TEST_CASE("compile: errors from every stage", "[compiled_grammar]") {
  CHECK(compile_error(R"(a ::= "x")") == grammar_errc::syntax);
  CHECK(compile_error(R"(a ::= b ;)") == grammar_errc::undefined_symbol);
  CHECK(compile_error(R"(a ::= t ; t :== "x" t ;)") ==
        grammar_errc::recursive_token);
  CHECK(compile_error(R"(a ::= "x" -> v | "y" -> v ;)") ==
        grammar_errc::duplicate_variant_name);
  CHECK(compile_error(R"(a ::= t ; t :== a ;)") ==
        grammar_errc::invalid_token_reference);
}

TEST_CASE("compile: error messages name the problem", "[compiled_grammar]") {
  compile_options options;
  options.warnings = false;
  try {
    compile_grammar("a ::= \"x\" ;\nb ::= c ;", options);
    FAIL("expected grammar_error");
  } catch (const grammar_error& e) {
    std::string what = e.what();
    CHECK(what.find("undefined symbol") != std::string::npos);
    CHECK(what.find("'b'") != std::string::npos);
    CHECK(what.find("'c'") != std::string::npos);
    CHECK(e.location().line == 2);
  }
}
