#pragma once

#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <util/io/input.hpp>

#include <libs/tokscan/decode.hpp>
#include <libs/tokscan/error.hpp>
#include <libs/tokscan/extract.hpp>
#include <libs/tokscan/parse.hpp>

namespace tokscan {

// Failed scans leave the stream usable, the source stays where reading stopped.
template <io::buffered_input Src>
class stream {
public:
  explicit stream(Src src) noexcept(std::is_nothrow_move_constructible_v<Src>)
      : src_{std::move(src)} {}

  stream(const stream&) = delete;
  stream& operator=(const stream&) = delete;
  stream(stream&&) = default;
  stream& operator=(stream&&) = default;

  template <parsable T>
  std::expected<T, error> scan() {
    return scan_impl<T>(std::nullopt, parse_traits<T>::parse);
  }

  template <parsable T>
  std::expected<T, error> scan_with_limit(size_t limit) {
    return scan_impl<T>(limit, parse_traits<T>::parse);
  }

  template <typename T, parser<T> P>
  std::expected<T, error> scan(P&& parse) {
    return scan_impl<T>(std::nullopt, std::forward<P>(parse));
  }

  template <typename T, parser<T> P>
  std::expected<T, error> scan_with_limit(size_t limit, P&& parse) {
    return scan_impl<T>(limit, std::forward<P>(parse));
  }

  size_t read(std::span<std::byte> dest, std::error_code& ec) noexcept
    requires io::input<Src>
  {
    return io::input_traits<Src>::read(src_, dest, ec);
  }

  std::span<const std::byte> fill(std::error_code& ec) noexcept {
    return io::buffered_input_traits<Src>::fill(src_, ec);
  }

  void consume(size_t count) noexcept {
    io::buffered_input_traits<Src>::consume(src_, count);
  }

  Src& source() noexcept { return src_; }
  const Src& source() const noexcept { return src_; }
  Src release() && noexcept(std::is_nothrow_move_constructible_v<Src>) {
    return std::move(src_);
  }

private:
  template <typename T, typename P>
  std::expected<T, error> scan_impl(std::optional<size_t> limit, P&& parse) {
    auto raw = extract_token(src_, token_, limit);
    if (!raw)
      return std::unexpected(raw.error());
    return decode<T>(*raw, std::forward<P>(parse));
  }

private:
  Src src_;
  std::vector<std::byte> token_;
};

} // namespace tokscan

namespace io {

template <buffered_input Src>
  requires input<Src>
struct input_traits<tokscan::stream<Src>> {
  static size_t read(tokscan::stream<Src>& in, std::span<std::byte> dest,
      std::error_code& ec) noexcept {
    return in.read(dest, ec);
  }
};

template <buffered_input Src>
struct buffered_input_traits<tokscan::stream<Src>> {
  static std::span<const std::byte> fill(
      tokscan::stream<Src>& in, std::error_code& ec) noexcept {
    return in.fill(ec);
  }
  static void consume(tokscan::stream<Src>& in, size_t count) noexcept {
    in.consume(count);
  }
};

} // namespace io
