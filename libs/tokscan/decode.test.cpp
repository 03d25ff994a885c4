#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>

#include <testing/matchers/expected.hpp>
#include <testing/printers/expected.hpp>
#include <testing/printers/scan_error.hpp>

#include <libs/tokscan/decode.hpp>

using namespace std::literals;

namespace {

std::span<const std::byte> bytes_of(std::string_view str) {
  return std::as_bytes(std::span{str});
}

} // namespace

SCENARIO("decoding of raw token bytes") {
  GIVEN("bytes of a number") {
    THEN("they are decoded as the number") {
      REQUIRE_THAT(tokscan::decode<int>(bytes_of("-7")), is_expected(-7));
    }
  }

  GIVEN("bytes ending with a single space") {
    auto raw = bytes_of("12 ");

    THEN("the space is dropped before parsing") {
      REQUIRE_THAT(tokscan::decode<int>(raw), is_expected(12));
      REQUIRE_THAT(tokscan::decode<std::string>(raw), is_expected("12"s));
    }
  }

  GIVEN("bytes ending with two spaces") {
    auto raw = bytes_of("ab  ");

    THEN("only one space is dropped") {
      REQUIRE_THAT(tokscan::decode<std::string>(raw), is_expected("ab "s));
    }
  }

  GIVEN("bytes ending with other whitespace") {
    auto raw = bytes_of("12\t");

    THEN("it is kept and parsing fails") {
      REQUIRE_THAT(tokscan::decode<int>(raw), is_unexpected(tokscan::errc::parse));
      REQUIRE_THAT(tokscan::decode<std::string>(raw), is_expected("12\t"s));
    }
  }

  GIVEN("single space") {
    THEN("it decodes to an empty text") {
      REQUIRE_THAT(tokscan::decode<std::string>(bytes_of(" ")), is_expected(""s));
    }
  }

  GIVEN("bytes which are not UTF-8") {
    auto raw = bytes_of("\xff");

    THEN("utf8 error with encoding error cause is returned") {
      const auto res = tokscan::decode<int>(raw);
      REQUIRE_THAT(res, is_unexpected(tokscan::errc::utf8));
      REQUIRE(res.error().cause() == tokscan::utf8::errc::invalid_lead_byte);
    }
  }

  GIVEN("text which does not fit requested type") {
    THEN("parse error with parser error cause is returned") {
      const auto res = tokscan::decode<int>(bytes_of("hello"));
      REQUIRE_THAT(res, is_unexpected(tokscan::errc::parse));
      REQUIRE(res.error().cause() == std::errc::invalid_argument);
    }
  }

  GIVEN("empty bytes") {
    auto raw = bytes_of("");

    THEN("numbers fail to parse") {
      REQUIRE_THAT(tokscan::decode<double>(raw), is_unexpected(tokscan::errc::parse));
    }
    THEN("strings are empty") {
      REQUIRE_THAT(tokscan::decode<std::string>(raw), is_expected(""s));
    }
  }
}

TEST_CASE("decode with custom parser", "[decode]") {
  auto hex = [](std::string_view text) -> std::expected<unsigned, std::error_code> {
    if (!text.starts_with("0x"))
      return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    unsigned res = 0;
    for (char c : text.substr(2)) {
      if (c >= '0' && c <= '9')
        res = res * 16 + static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f')
        res = res * 16 + static_cast<unsigned>(c - 'a' + 10);
      else
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return res;
  };

  REQUIRE_THAT(tokscan::decode<unsigned>(bytes_of("0xff"), hex), is_expected(255u));
  REQUIRE_THAT(tokscan::decode<unsigned>(bytes_of("ff"), hex),
      is_unexpected(tokscan::errc::parse));
}
