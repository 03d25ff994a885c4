#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

#include <util/io/input.hpp>

#include <libs/tokscan/extract.hpp>
#include <libs/tokscan/stream.hpp>
#include <libs/tokscan/whitespace.hpp>

enum class token_type { i8, i16, i32, i64, u8, u16, u32, u64, f32, f64, string };

std::optional<token_type> parse_token_type(std::string_view name) noexcept;
std::string_view to_string(token_type type) noexcept;

struct sum_options {
  std::optional<size_t> limit;
  bool strict = false;
};

struct summary {
  size_t tokens = 0;
  size_t failures = 0;
  // xor of integers, sum of floats or total size of strings
  std::variant<std::uint64_t, double> checksum = std::uint64_t{0};
};

std::string format_summary(const summary& sum);

namespace detail {

template <typename T>
void accumulate(summary& sum, const T& val) {
  if constexpr (std::is_same_v<T, std::string>)
    std::get<std::uint64_t>(sum.checksum) += val.size();
  else if constexpr (std::is_floating_point_v<T>)
    std::get<double>(sum.checksum) += val;
  else
    std::get<std::uint64_t>(sum.checksum) ^= static_cast<std::uint64_t>(val);
}

} // namespace detail

// Oversized tokens are skipped whole. Source failures end the scan even in
// lenient mode.
template <typename T, io::buffered_input Src>
std::expected<summary, tokscan::error> sum_tokens(
    tokscan::stream<Src>& in, const sum_options& opts) {
  summary res;
  if constexpr (std::is_floating_point_v<T>)
    res.checksum = 0.;
  while (true) {
    if (auto skipped = tokscan::skip_while(in, tokscan::is_delimiter); !skipped)
      return std::unexpected(skipped.error());
    std::error_code ec;
    if (in.fill(ec).empty() && !ec)
      break;

    auto val = opts.limit ? in.template scan_with_limit<T>(*opts.limit)
                          : in.template scan<T>();
    if (val) {
      ++res.tokens;
      detail::accumulate(res, *val);
      continue;
    }
    if (val.error() == tokscan::errc::io)
      return std::unexpected(val.error());
    spdlog::debug("Token #{} is rejected: {}", res.tokens + res.failures + 1,
        val.error());
    ++res.failures;
    if (opts.strict)
      return std::unexpected(val.error());
    if (val.error() == tokscan::errc::buffer_limit_exceeded) {
      if (auto skipped = tokscan::skip_while(in, tokscan::is_token_byte); !skipped)
        return std::unexpected(skipped.error());
    }
  }
  return res;
}
