#include <span>
#include <string_view>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers.hpp>

#include <testing/matchers/expected.hpp>
#include <testing/printers/expected.hpp>
#include <testing/printers/scan_error.hpp>

#include <libs/tokscan/utf8.hpp>

using namespace std::literals;
namespace utf8 = tokscan::utf8;

namespace {

std::span<const std::byte> bytes_of(std::string_view str) {
  return std::as_bytes(std::span{str});
}

} // namespace

SCENARIO("valid UTF-8 text") {
  auto text = GENERATE(""sv, "hello"sv, "\xd0\xbf\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82"sv,
      "\xe2\x82\xac"sv, "\xf0\x9f\x98\x80"sv, "\xf4\x8f\xbf\xbf"sv, "\x01\x7f"sv);
  GIVEN("bytes of valid text") {
    THEN("they are viewed as the same text") {
      REQUIRE_THAT(utf8::as_text(bytes_of(text)), is_expected(text));
    }
  }
}

SCENARIO("invalid UTF-8 sequences") {
  using enum utf8::errc;
  GIVEN("lone continuation byte") {
    THEN("lead byte error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("a\x80"sv)),
          is_unexpected(make_error_code(invalid_lead_byte)));
    }
  }
  GIVEN("byte which never appears in UTF-8") {
    THEN("lead byte error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("\xff"sv)),
          is_unexpected(make_error_code(invalid_lead_byte)));
    }
  }
  GIVEN("multibyte sequence cut at the end") {
    THEN("truncated sequence error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("ok\xe2\x82"sv)),
          is_unexpected(make_error_code(truncated_sequence)));
    }
  }
  GIVEN("multibyte sequence interrupted by ASCII") {
    THEN("continuation error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("\xe2\x82x"sv)),
          is_unexpected(make_error_code(invalid_continuation)));
    }
  }
  GIVEN("overlong encoding of '/'") {
    THEN("overlong error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("\xc0\xaf"sv)),
          is_unexpected(make_error_code(overlong_encoding)));
      REQUIRE_THAT(utf8::as_text(bytes_of("\xe0\x80\xaf"sv)),
          is_unexpected(make_error_code(overlong_encoding)));
    }
  }
  GIVEN("encoded UTF-16 surrogate") {
    THEN("surrogate error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("\xed\xa0\x80"sv)),
          is_unexpected(make_error_code(surrogate)));
    }
  }
  GIVEN("code point above U+10FFFF") {
    THEN("range error is reported") {
      REQUIRE_THAT(utf8::as_text(bytes_of("\xf4\x90\x80\x80"sv)),
          is_unexpected(make_error_code(out_of_range)));
    }
  }
}

TEST_CASE("decode_front", "[utf8]") {
  std::string_view text = "\xe2\x82\xac" "1";
  REQUIRE_THAT(utf8::decode_front(text), is_expected(U'\u20ac'));
  REQUIRE(text == "1");
  REQUIRE_THAT(utf8::decode_front(text), is_expected(U'1'));
  REQUIRE(text.empty());
}

TEST_CASE("utf8 error codes", "[utf8]") {
  std::error_code ec = utf8::errc::surrogate;
  REQUIRE(ec.category() == utf8::utf8_category());
  REQUIRE(std::string_view{ec.category().name()} == "utf-8");
  REQUIRE(ec.message() == "UTF-16 surrogate encoded in UTF-8");
}
