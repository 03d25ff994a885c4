#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <span>
#include <system_error>
#include <utility>

#include <util/io/input.hpp>

namespace io {

template <input In>
class buffered_reader {
public:
  static constexpr size_t default_capacity = 8 * 1024;

  explicit buffered_reader(In in, size_t capacity = default_capacity)
      : in_{std::move(in)},
        buf_{std::make_unique<std::byte[]>(std::max<size_t>(capacity, 1))},
        capacity_{std::max<size_t>(capacity, 1)} {}

  buffered_reader(buffered_reader&&) noexcept = default;
  buffered_reader& operator=(buffered_reader&&) noexcept = default;

  size_t capacity() const noexcept { return capacity_; }
  std::span<const std::byte> buffered() const noexcept {
    return {buf_.get() + pos_, filled_ - pos_};
  }

  In& get() noexcept { return in_; }
  const In& get() const noexcept { return in_; }

  std::span<const std::byte> fill(std::error_code& ec) noexcept {
    if (pos_ == filled_) {
      pos_ = filled_ = 0;
      filled_ = input_traits<In>::read(in_, {buf_.get(), capacity_}, ec);
      if (ec)
        filled_ = 0;
    }
    return buffered();
  }

  void consume(size_t count) noexcept {
    pos_ = std::min(pos_ + count, filled_);
  }

  size_t read(std::span<std::byte> dest, std::error_code& ec) noexcept {
    // Large reads skip the buffer entirely when there is nothing buffered.
    if (pos_ == filled_ && dest.size() >= capacity_) {
      pos_ = filled_ = 0;
      return input_traits<In>::read(in_, dest, ec);
    }
    const auto avail = fill(ec);
    if (ec)
      return 0;
    const auto sz = std::min(avail.size(), dest.size());
    std::memcpy(dest.data(), avail.data(), sz);
    consume(sz);
    return sz;
  }

private:
  In in_;
  std::unique_ptr<std::byte[]> buf_;
  size_t capacity_;
  size_t pos_ = 0;
  size_t filled_ = 0;
};

template <input In>
struct input_traits<buffered_reader<In>> {
  static size_t read(buffered_reader<In>& in, std::span<std::byte> dest,
      std::error_code& ec) noexcept {
    return in.read(dest, ec);
  }
};

template <input In>
struct buffered_input_traits<buffered_reader<In>> {
  static std::span<const std::byte> fill(
      buffered_reader<In>& in, std::error_code& ec) noexcept {
    return in.fill(ec);
  }
  static void consume(buffered_reader<In>& in, size_t count) noexcept {
    in.consume(count);
  }
};

} // namespace io
