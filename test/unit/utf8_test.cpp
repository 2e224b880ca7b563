#include <gramc/utf8.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace gramc;

// == Decoding ================================================================

TEST_CASE("utf8: ascii round trip", "[utf8]") {
  auto text = utf8_decode("hi bob");
  CHECK(text == U"hi bob");
  CHECK(utf8_encode(text) == "hi bob");
}

TEST_CASE("utf8: multi-byte sequences decode to one code point each",
          "[utf8]") {
  auto text = utf8_decode("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
  REQUIRE(text.size() == 4);
  CHECK(text[0] == U'a');
  CHECK(text[1] == 0xE9);
  CHECK(text[2] == 0x20AC);
  CHECK(text[3] == 0x1F600);
  CHECK(utf8_encode(text) == "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST_CASE("utf8: malformed input becomes U+FFFD when lenient", "[utf8]") {
  auto text = utf8_decode("a\xFFz");
  REQUIRE(text.size() == 3);
  CHECK(text[1] == 0xFFFD);
}

TEST_CASE("utf8: overlong encoding is malformed", "[utf8]") {
  CHECK(utf8_decode("\xC0\xAF") == std::u32string(2, char32_t{0xFFFD}));
}

TEST_CASE("utf8: strict decoding throws", "[utf8]") {
  CHECK_THROWS_AS(utf8_decode("ok\xE2\x82", true), std::invalid_argument);
  CHECK_NOTHROW(utf8_decode("ok", true));
}

// == Locations ===============================================================

TEST_CASE("utf8: locate counts lines and columns", "[utf8]") {
  std::u32string text = U"ab\ncd\n\nef";
  auto loc = locate(text, 4);
  CHECK(loc.offset == 4);
  CHECK(loc.line == 2);
  CHECK(loc.column == 2);
  CHECK(locate(text, 0).to_string() == "1:1");
  CHECK(locate(text, 7).to_string() == "4:1");
}

TEST_CASE("utf8: line_index agrees with locate", "[utf8]") {
  std::u32string text = U"ab\ncd\n\nef";
  line_index lines(text);
  for (std::size_t i = 0; i <= text.size(); ++i)
    CHECK(lines.locate(i) == locate(text, i));
}
