#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <span>
#include <system_error>
#include <utility>

#include <filesystem>

#include <util/bitmask.hpp>
#include <util/io/input.hpp>

namespace fs = std::filesystem;

namespace io {

class file_descriptor {
  static constexpr int invalid = -1;

public:
  using native_handle_t = int;

  constexpr file_descriptor() noexcept = default;
  constexpr explicit file_descriptor(native_handle_t fd) noexcept : fd_(fd) {}

  file_descriptor(const file_descriptor&) = delete;
  file_descriptor& operator=(const file_descriptor&) = delete;

  constexpr file_descriptor(file_descriptor&& rhs) noexcept : fd_(rhs.fd_) {
    rhs.fd_ = invalid;
  }
  constexpr file_descriptor& operator=(file_descriptor&& rhs) noexcept {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = rhs.fd_;
    rhs.fd_ = invalid;
    return *this;
  }

  ~file_descriptor() noexcept {
    if (fd_ >= 0)
      ::close(fd_);
  }

  void close() noexcept {
    if (fd_ >= 0)
      ::close(std::exchange(fd_, invalid));
  }
  constexpr explicit operator bool() const noexcept { return fd_ != invalid; }
  constexpr native_handle_t native_handle() const noexcept { return fd_; }

private:
  native_handle_t fd_ = invalid;
};

enum class mode : int {
  read_only = O_RDONLY,
  cloexec = O_CLOEXEC,
  nonblock = O_NONBLOCK,
};
constexpr bitmask<mode> operator|(mode lhs, mode rhs) noexcept {
  return bitmask<mode>{lhs} | rhs;
}

inline file_descriptor open(const fs::path& path, bitmask<mode> flags) {
  int fd = -1;
  do
    fd = ::open(path.c_str(), flags.value());
  while (fd < 0 && errno == EINTR);
  if (fd < 0)
    throw std::system_error{
        errno, std::system_category(), "open " + path.string()};
  return file_descriptor{fd};
}

inline size_t read(const file_descriptor& fd, std::span<std::byte> buf,
    std::error_code& ec) noexcept {
  ssize_t res;
  do
    res = ::read(fd.native_handle(), buf.data(), buf.size());
  while (res < 0 && errno == EINTR);
  if (res < 0) {
    ec = {errno, std::system_category()};
    return 0;
  }
  return static_cast<size_t>(res);
}

template <>
inline size_t input_traits<file_descriptor>::read(file_descriptor& in,
    std::span<std::byte> dest, std::error_code& ec) noexcept {
  return ::io::read(static_cast<const file_descriptor&>(in), dest, ec);
}

} // namespace io
