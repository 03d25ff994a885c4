#include <array>
#include <utility>

#include <fmt/format.h>

#include "sum_tokens.hpp"

namespace {

using namespace std::literals;

constexpr std::array<std::pair<std::string_view, token_type>, 11> type_names{{
    {"i8"sv, token_type::i8},
    {"i16"sv, token_type::i16},
    {"i32"sv, token_type::i32},
    {"i64"sv, token_type::i64},
    {"u8"sv, token_type::u8},
    {"u16"sv, token_type::u16},
    {"u32"sv, token_type::u32},
    {"u64"sv, token_type::u64},
    {"f32"sv, token_type::f32},
    {"f64"sv, token_type::f64},
    {"string"sv, token_type::string},
}};

} // namespace

std::optional<token_type> parse_token_type(std::string_view name) noexcept {
  for (const auto& [str, type] : type_names) {
    if (str == name)
      return type;
  }
  return std::nullopt;
}

std::string_view to_string(token_type type) noexcept {
  for (const auto& [str, t] : type_names) {
    if (t == type)
      return str;
  }
  return "unknown";
}

std::string format_summary(const summary& sum) {
  return std::visit(
      [&](auto checksum) {
        return fmt::format("tokens: {}\nfailures: {}\nchecksum: {}\n",
            sum.tokens, sum.failures, checksum);
      },
      sum.checksum);
}
