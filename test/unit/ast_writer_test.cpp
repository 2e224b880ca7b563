#include <gramc/ast_writer.hpp>
#include <gramc/compiled_grammar.hpp>
#include <gramc/rule_registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace gramc;

namespace {

  compiled_grammar
  compile(std::string_view source) {
    compile_options options;
    options.warnings = false;
    return compile_grammar(source, options);
  }

} // namespace

// == JSON ====================================================================

TEST_CASE("json: token", "[ast_writer]") {
  token tok;
  tok.rule = "name";
  tok.text = "bob";
  tok.span = {3, 6};
  CHECK(to_json(tok) == R"({"token":"name","text":"bob","span":[3,6]})");
}

TEST_CASE("json: strings are escaped", "[ast_writer]") {
  token tok;
  tok.rule = "\"q\"";
  tok.text = "a\"b\\\n\x01";
  tok.span = {0, 5};
  CHECK(to_json(tok) ==
        R"({"token":"\"q\"","text":"a\"b\\\n\u0001","span":[0,5]})");
}

TEST_CASE("json: parse tree", "[ast_writer]") {
  auto g = compile(R"(
    greeting ::= "hi" name -> formal ;
    name :== [a-z]+ ;
    _ :== [ ]+ ;
  )");
  auto node = g.parse("greeting", "hi bob");
  CHECK(to_json(node) ==
        R"({"rule":"greeting","variant":"formal","span":[0,6],"children":[)"
        R"({"token":"\"hi\"","text":"hi","span":[0,2]},)"
        R"({"token":"name","text":"bob","span":[3,6]}]})");
}

TEST_CASE("json: nested nodes", "[ast_writer]") {
  auto g = compile(R"(
    pair ::= item item ;
    item ::= "x" ;
  )");
  std::ostringstream out;
  write_json(out, g.parse("pair", "xx"));
  CHECK(out.str() ==
        R"({"rule":"pair","variant":"pair_1","span":[0,2],"children":[)"
        R"({"rule":"item","variant":"item_1","span":[0,1],"children":[)"
        R"({"token":"\"x\"","text":"x","span":[0,1]}]},)"
        R"({"rule":"item","variant":"item_1","span":[1,2],"children":[)"
        R"({"token":"\"x\"","text":"x","span":[1,2]}]}]})");
}

// == describe ================================================================

TEST_CASE("describe: merged rules in meta-grammar form", "[ast_writer]") {
  rule_registry reg;
  reg.add(R"(
    /** Greets. */
    greeting ::= "hi" name -> formal ;
    name :== [a-z]+ ;
    _ :== [ ]+ ;
    greeting ::= "yo" ( name | "you" )+ ;
  )");
  auto rules = reg.finalize();
  CHECK(describe(*rules) ==
        "/** Greets. */\n"
        "greeting ::= \"hi\" name -> formal | \"yo\" ( name | \"you\" )+ ;\n"
        "name :== [a-z]+ ;\n"
        "_ :== [ ]+ ;\n");
}

TEST_CASE("describe: output compiles to the same rules", "[ast_writer]") {
  rule_registry first;
  first.add(R"(
    list ::= "[" ( item ( "," item )* )? "]" ;
    item ::= num | list ;
    num :== [0-9]+ #x2E? ;
  )");
  auto text = describe(*first.finalize());

  rule_registry second;
  second.add(text);
  CHECK(describe(*second.finalize()) == text);
}
