#pragma once

#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

bool get_flag(std::span<char*>& args, std::string_view flag) noexcept;

// Found option and its value are removed from args
const char* get_option(std::span<char*>& args, std::string_view option) noexcept;

template <typename T>
std::decay_t<T> get_option(
    std::span<char*>& args, std::string_view option, T&& default_val) noexcept {
  const char* val = get_option(args, option);
  if (!val)
    return std::forward<T>(default_val);
  return std::decay_t<T>{val};
}
