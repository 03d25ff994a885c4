#pragma once

#include <algorithm>
#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <util/io/input.hpp>

#include <libs/tokscan/error.hpp>
#include <libs/tokscan/whitespace.hpp>

namespace tokscan {

namespace detail {

// Consumes the longest prefix of bytes matching `pred` chunk by chunk. Each
// matched chunk prefix is passed to `act` before being consumed; `act` may
// refuse the chunk by returning an error, in which case it stays unconsumed.
template <io::buffered_input Src, typename Pred, typename Act>
std::expected<void, error> consume_while(Src& src, Pred pred, Act act) {
  using traits = io::buffered_input_traits<Src>;
  while (true) {
    std::error_code ec;
    const auto chunk = traits::fill(src, ec);
    if (ec == std::errc::interrupted)
      continue;
    if (ec)
      return std::unexpected(error{errc::io, ec});

    const auto matched = static_cast<size_t>(
        std::ranges::find_if_not(chunk, pred) - chunk.begin());
    if (auto res = act(chunk.first(matched)); !res)
      return res;
    traits::consume(src, matched);
    if (matched < chunk.size() || chunk.empty())
      return {};
  }
}

} // namespace detail

// Consumes bytes matching `pred`, stops at the first other byte or EOF.
template <io::buffered_input Src, typename Pred>
std::expected<void, error> skip_while(Src& src, Pred pred) {
  return detail::consume_while(src, pred,
      [](std::span<const std::byte>) -> std::expected<void, error> { return {}; });
}

// Leading delimiters are skipped and the token is collected up to the first
// delimiter or EOF, the delimiter stays in the source. Token is empty on EOF.
// Bytes of a token exceeding `limit` consumed before the failure are lost.
template <io::buffered_input Src>
std::expected<std::span<const std::byte>, error> extract_token(
    Src& src, std::vector<std::byte>& token, std::optional<size_t> limit = std::nullopt) {
  token.clear();

  auto skipped = skip_while(src, is_delimiter);
  if (!skipped)
    return std::unexpected(skipped.error());

  auto collected = detail::consume_while(src, is_token_byte,
      [&](std::span<const std::byte> part) -> std::expected<void, error> {
        if (limit && token.size() + part.size() > *limit)
          return std::unexpected(error{errc::buffer_limit_exceeded});
        token.insert(token.end(), part.begin(), part.end());
        return {};
      });
  if (!collected)
    return std::unexpected(collected.error());
  return token;
}

} // namespace tokscan
