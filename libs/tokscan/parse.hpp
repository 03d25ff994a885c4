#pragma once

#include <charconv>
#include <cstdlib>
#include <concepts>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <libs/tokscan/utf8.hpp>

namespace tokscan {

template <typename T>
struct parse_traits {
  static std::expected<T, std::error_code> parse(std::string_view text) = delete;
};

template <typename T>
concept parsable = requires(std::string_view text) {
  { parse_traits<T>::parse(text) } -> std::same_as<std::expected<T, std::error_code>>;
};

template <typename F, typename T>
concept parser = std::invocable<F&, std::string_view> &&
                 std::same_as<std::invoke_result_t<F&, std::string_view>,
                     std::expected<T, std::error_code>>;

namespace detail {

// Single leading '+' is accepted for consistency with the '-' sign, the sign
// must still be followed by a digit.
constexpr std::string_view strip_plus(std::string_view text) noexcept {
  if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+')
    text.remove_prefix(1);
  return text;
}

template <typename T, typename... A>
std::expected<T, std::error_code> from_chars(std::string_view text, A... a) noexcept {
  text = strip_plus(text);
  T res{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res, a...);
  if (ec != std::errc{})
    return std::unexpected(std::make_error_code(ec));
  if (ptr != text.data() + text.size())
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  return res;
}

template <std::floating_point T>
T strto(const char* str, char** end) noexcept {
  if constexpr (std::same_as<T, float>)
    return std::strtof(str, end);
  else if constexpr (std::same_as<T, double>)
    return std::strtod(str, end);
  else
    return std::strtold(str, end);
}

// std::from_chars leaves the value unset when it does not fit the type,
// strto* rounds it to infinity or zero keeping the sign.
template <std::floating_point T>
std::expected<T, std::error_code> round_out_of_range(std::string_view text) {
  const std::string str{strip_plus(text)};
  char* end = nullptr;
  const T res = strto<T>(str.c_str(), &end);
  if (end != str.c_str() + str.size())
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  return res;
}

template <typename T>
concept character = std::same_as<T, char> || std::same_as<T, char8_t> ||
                    std::same_as<T, char16_t> || std::same_as<T, char32_t> ||
                    std::same_as<T, wchar_t>;

} // namespace detail

template <typename T>
  requires std::integral<T> && (!std::same_as<T, bool>) && (!detail::character<T>)
struct parse_traits<T> {
  static std::expected<T, std::error_code> parse(std::string_view text) noexcept {
    return detail::from_chars<T>(text, 10);
  }
};

template <std::floating_point T>
struct parse_traits<T> {
  static std::expected<T, std::error_code> parse(std::string_view text) {
    // nan(char-sequence) payloads are not accepted
    if (text.find('(') != std::string_view::npos)
      return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    auto res = detail::from_chars<T>(text, std::chars_format::general);
    if (!res && res.error() == std::errc::result_out_of_range)
      return detail::round_out_of_range<T>(text);
    return res;
  }
};

template <>
struct parse_traits<bool> {
  static std::expected<bool, std::error_code> parse(std::string_view text) noexcept {
    if (text == "true")
      return true;
    if (text == "false")
      return false;
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
};

template <>
struct parse_traits<char> {
  static std::expected<char, std::error_code> parse(std::string_view text) noexcept {
    if (text.size() != 1)
      return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    return text.front();
  }
};

template <>
struct parse_traits<char32_t> {
  static std::expected<char32_t, std::error_code> parse(std::string_view text) noexcept {
    auto res = utf8::decode_front(text);
    if (res && !text.empty())
      return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    return res;
  }
};

template <>
struct parse_traits<std::string> {
  static std::expected<std::string, std::error_code> parse(std::string_view text) {
    return std::string{text};
  }
};

} // namespace tokscan
