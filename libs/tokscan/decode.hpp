#pragma once

#include <expected>
#include <span>
#include <string_view>
#include <utility>

#include <libs/tokscan/error.hpp>
#include <libs/tokscan/parse.hpp>
#include <libs/tokscan/utf8.hpp>

namespace tokscan {

// Single trailing space is dropped before UTF-8 validation
template <typename T, parser<T> P>
std::expected<T, error> decode(std::span<const std::byte> raw, P&& parse) {
  if (!raw.empty() && raw.back() == std::byte{' '})
    raw = raw.first(raw.size() - 1);

  const auto text = utf8::as_text(raw);
  if (!text)
    return std::unexpected(error{errc::utf8, text.error()});

  auto res = std::forward<P>(parse)(*text);
  if (!res)
    return std::unexpected(error{errc::parse, res.error()});
  return std::move(*res);
}

template <parsable T>
std::expected<T, error> decode(std::span<const std::byte> raw) {
  return decode<T>(raw, [](std::string_view text) { return parse_traits<T>::parse(text); });
}

} // namespace tokscan
