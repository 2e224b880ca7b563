#include <gramc/error.hpp>
#include <gramc/pattern_compiler.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace gramc;

namespace {

  grammar_errc
  error_kind(void (*fn)()) {
    try {
      fn();
    } catch (const grammar_error& e) {
      return e.kind();
    }
    FAIL("expected grammar_error");
    return grammar_errc::syntax;
  }

} // namespace

// == Escapes =================================================================

TEST_CASE("pattern: simple escapes", "[pattern_compiler]") {
  std::u32string_view text = U"#t#n#r###'#\"#-#^#]";
  std::size_t pos = 0;
  CHECK(resolve_escape(text, pos) == U'\t');
  CHECK(resolve_escape(text, pos) == U'\n');
  CHECK(resolve_escape(text, pos) == U'\r');
  CHECK(resolve_escape(text, pos) == U'#');
  CHECK(resolve_escape(text, pos) == U'\'');
  CHECK(resolve_escape(text, pos) == U'"');
  CHECK(resolve_escape(text, pos) == U'-');
  CHECK(resolve_escape(text, pos) == U'^');
  CHECK(resolve_escape(text, pos) == U']');
  CHECK(pos == text.size());
}

TEST_CASE("pattern: hex escapes", "[pattern_compiler]") {
  std::size_t pos = 0;
  CHECK(resolve_escape(U"#x41", pos) == U'A');
  CHECK(pos == 4);
  pos = 0;
  CHECK(resolve_escape(U"#u00e9", pos) == 0xE9);
  pos = 0;
  CHECK(resolve_escape(U"#U0001F600", pos) == 0x1F600);
  CHECK(pos == 10);
}

TEST_CASE("pattern: invalid escapes", "[pattern_compiler]") {
  CHECK(error_kind([] {
          std::size_t pos = 0;
          resolve_escape(U"#q", pos);
        }) == grammar_errc::invalid_escape);
  CHECK(error_kind([] {
          std::size_t pos = 0;
          resolve_escape(U"#x4", pos);
        }) == grammar_errc::invalid_escape);
  CHECK(error_kind([] {
          std::size_t pos = 0;
          resolve_escape(U"#U00110000", pos);
        }) == grammar_errc::invalid_escape);
  CHECK(error_kind([] {
          std::size_t pos = 0;
          resolve_escape(U"#uD800", pos);
        }) == grammar_errc::invalid_escape);
  CHECK(error_kind([] {
          std::size_t pos = 0;
          resolve_escape(U"#U0000DFFF", pos);
        }) == grammar_errc::invalid_escape);
  std::size_t pos = 0;
  CHECK(resolve_escape(U"#uD7FF", pos) == 0xD7FF);
  pos = 0;
  CHECK(resolve_escape(U"#uE000", pos) == 0xE000);
  CHECK(error_kind([] {
          std::size_t pos = 0;
          resolve_escape(U"#", pos);
        }) == grammar_errc::invalid_escape);
}

TEST_CASE("pattern: escape errors carry the relative offset",
          "[pattern_compiler]") {
  try {
    compile_string_literal(U"'ab#z'");
    FAIL("expected grammar_error");
  } catch (const grammar_error& e) {
    CHECK(e.kind() == grammar_errc::invalid_escape);
    CHECK(e.location().offset == 3);
  }
}

TEST_CASE("pattern: escape extent", "[pattern_compiler]") {
  CHECK(escape_extent(U"#n", 0) == 2);
  CHECK(escape_extent(U"#x41", 0) == 4);
  CHECK(escape_extent(U"#u00", 0) == 4); // truncated at end of text
  CHECK(escape_extent(U"#", 0) == 1);
  CHECK(escape_extent(U"#x4'", 0) == 3);  // stops at the first non-hex digit
  CHECK(escape_extent(U"#u41]", 0) == 4);
  CHECK(escape_extent(U"ab#Uz", 2) == 2);
}

// == Character sets ==========================================================

TEST_CASE("pattern: character set with ranges", "[pattern_compiler]") {
  auto m = compile_character_set(U"[a-z_0-9]");
  CHECK(m.matches(U'a'));
  CHECK(m.matches(U'q'));
  CHECK(m.matches(U'_'));
  CHECK(m.matches(U'5'));
  CHECK_FALSE(m.matches(U'A'));
  CHECK_FALSE(m.negated());
}

TEST_CASE("pattern: negated character set", "[pattern_compiler]") {
  auto m = compile_character_set(U"[^#n#]]");
  CHECK(m.negated());
  CHECK(m.matches(U'a'));
  CHECK_FALSE(m.matches(U'\n'));
  CHECK_FALSE(m.matches(U']'));
}

TEST_CASE("pattern: escapes inside a set", "[pattern_compiler]") {
  auto m = compile_character_set(U"[#x41-#x43#-]");
  CHECK(m.matches(U'B'));
  CHECK(m.matches(U'-'));
  CHECK_FALSE(m.matches(U'D'));
}

TEST_CASE("pattern: empty sets", "[pattern_compiler]") {
  CHECK_FALSE(compile_character_set(U"[]").matches(U'a'));
  CHECK(compile_character_set(U"[^]").matches(U'a'));
}

TEST_CASE("pattern: overlapping ranges are merged", "[pattern_compiler]") {
  auto m = compile_character_set(U"[d-f a-e]");
  REQUIRE(m.ranges().size() == 2);
  CHECK(m.ranges()[0] == codepoint_range{U' ', U' '});
  CHECK(m.ranges()[1] == codepoint_range{U'a', U'f'});
}

TEST_CASE("pattern: malformed character sets", "[pattern_compiler]") {
  CHECK(error_kind([] { compile_character_set(U"[a^]"); }) ==
        grammar_errc::syntax);
  CHECK(error_kind([] { compile_character_set(U"[-a]"); }) ==
        grammar_errc::syntax);
  CHECK(error_kind([] { compile_character_set(U"[z-a]"); }) ==
        grammar_errc::syntax);
  CHECK(error_kind([] { compile_character_set(U"[a-]"); }) ==
        grammar_errc::syntax);
  CHECK(error_kind([] { compile_character_set(U"[#q]"); }) ==
        grammar_errc::invalid_escape);
}

// == Literals ================================================================

TEST_CASE("pattern: string literal", "[pattern_compiler]") {
  auto seq = compile_string_literal(U"\"a#nb\"");
  REQUIRE(seq.size() == 3);
  CHECK(seq[0].matches(U'a'));
  CHECK(seq[1].matches(U'\n'));
  CHECK(seq[2].matches(U'b'));
  CHECK_FALSE(seq[2].matches(U'a'));
}

TEST_CASE("pattern: single-quoted literal with escaped quote",
          "[pattern_compiler]") {
  auto seq = compile_string_literal(U"'it#'s'");
  REQUIRE(seq.size() == 4);
  CHECK(seq[2].matches(U'\''));
}

TEST_CASE("pattern: empty literal", "[pattern_compiler]") {
  CHECK(error_kind([] { compile_string_literal(U"''"); }) ==
        grammar_errc::empty_literal);
  CHECK(error_kind([] { compile_string_literal(U"\"\""); }) ==
        grammar_errc::empty_literal);
}

TEST_CASE("pattern: character literal", "[pattern_compiler]") {
  CHECK(compile_character_literal(U"#x41").matches(U'A'));
  CHECK(compile_character_literal(U"##").matches(U'#'));
  CHECK(compile_character_literal(U"#n").matches(U'\n'));
  CHECK(error_kind([] { compile_character_literal(U"#x41z"); }) ==
        grammar_errc::invalid_escape);
}
