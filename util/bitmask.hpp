#pragma once

#include <type_traits>

template <typename E>
class bitmask {
public:
  using value_type = std::underlying_type_t<E>;

  constexpr bitmask() noexcept = default;
  constexpr bitmask(const E e) noexcept : val_(static_cast<value_type>(e)) {}

  constexpr bitmask operator|(const bitmask rhs) const noexcept {
    return bitmask(static_cast<value_type>(val_ | rhs.val_));
  }
  constexpr bitmask operator&(const bitmask rhs) const noexcept {
    return bitmask(static_cast<value_type>(val_ & rhs.val_));
  }

  constexpr bool operator==(const bitmask& rhs) const noexcept = default;

  constexpr explicit operator bool() const noexcept { return val_ != 0; }

  constexpr value_type value() const noexcept { return val_; }

private:
  constexpr explicit bitmask(const value_type t) noexcept : val_(t) {}

private:
  value_type val_ = 0;
};
