#pragma once

#include <algorithm>
#include <span>

#include <util/io/input.hpp>

template <>
inline size_t io::input_traits<std::span<const std::byte>>::read(
    std::span<const std::byte>& in, std::span<std::byte> dest,
    std::error_code&) noexcept {
  const auto sz = std::min(in.size(), dest.size());
  std::ranges::copy(in.subspan(0, sz), dest.data());
  in = in.subspan(sz);
  return sz;
}

// Whole remaining span is a single chunk: in memory data never blocks.
template <>
inline std::span<const std::byte>
io::buffered_input_traits<std::span<const std::byte>>::fill(
    std::span<const std::byte>& in, std::error_code&) noexcept {
  return in;
}

template <>
inline void io::buffered_input_traits<std::span<const std::byte>>::consume(
    std::span<const std::byte>& in, size_t count) noexcept {
  in = in.subspan(std::min(count, in.size()));
}
