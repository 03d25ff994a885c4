#pragma once

#include <expected>
#include <span>
#include <string_view>
#include <system_error>

namespace tokscan::utf8 {

enum class errc {
  invalid_lead_byte = 1,
  truncated_sequence,
  invalid_continuation,
  overlong_encoding,
  surrogate,
  out_of_range,
};

const std::error_category& utf8_category() noexcept;

inline std::error_code make_error_code(errc err) noexcept {
  return {static_cast<int>(err), utf8_category()};
}

// Removes decoded bytes from `text` on success
std::expected<char32_t, std::error_code> decode_front(std::string_view& text) noexcept;

std::expected<std::string_view, std::error_code> as_text(
    std::span<const std::byte> bytes) noexcept;

} // namespace tokscan::utf8

namespace std {
template <>
struct is_error_code_enum<tokscan::utf8::errc> : std::true_type {};
} // namespace std
