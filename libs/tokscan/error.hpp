#pragma once

#include <string>
#include <system_error>

#include <fmt/format.h>

namespace tokscan {

enum class errc {
  io = 1,
  utf8,
  parse,
  buffer_limit_exceeded,
};

const std::error_category& scan_category() noexcept;

inline std::error_code make_error_code(errc err) noexcept {
  return {static_cast<int>(err), scan_category()};
}

// Cause is the error reported by the failed stage, limit violations have none.
class error {
public:
  error(errc kind, std::error_code cause = {}) noexcept
      : kind_{kind}, cause_{cause} {}

  errc kind() const noexcept { return kind_; }
  const std::error_code& cause() const noexcept { return cause_; }

  std::string message() const;

  operator std::error_code() const noexcept { return make_error_code(kind_); }

  friend bool operator==(const error& lhs, errc rhs) noexcept {
    return lhs.kind_ == rhs;
  }
  friend bool operator==(const error& lhs, const error& rhs) noexcept {
    return lhs.kind_ == rhs.kind_ && lhs.cause_ == rhs.cause_;
  }

private:
  errc kind_;
  std::error_code cause_;
};

} // namespace tokscan

namespace std {
template <>
struct is_error_code_enum<tokscan::errc> : std::true_type {};
} // namespace std

template <>
struct fmt::formatter<tokscan::error> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const tokscan::error& err, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(err.message(), ctx);
  }
};
