#pragma once

#include <cstddef>

namespace tokscan {

// Space and the \t \n \v \f \r control range. Other control characters are
// regular token bytes.
constexpr bool is_delimiter(std::byte b) noexcept {
  const auto c = static_cast<unsigned char>(b);
  return c == 0x20 || (c >= 0x09 && c <= 0x0d);
}

constexpr bool is_token_byte(std::byte b) noexcept { return !is_delimiter(b); }

} // namespace tokscan
