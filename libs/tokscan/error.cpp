#include <string>

#include <fmt/format.h>

#include <libs/tokscan/error.hpp>

namespace tokscan {

const std::error_category& scan_category() noexcept {
  static const struct final : std::error_category {
    const char* name() const noexcept override { return "tokscan"; }

    std::string message(int cond) const override {
      if (cond == 0)
        return std::generic_category().message(0);
      switch (static_cast<errc>(cond)) {
      case errc::io: return "Failed to read token bytes";
      case errc::utf8: return "Token is not a valid UTF-8 text";
      case errc::parse: return "Failed to parse token into requested type";
      case errc::buffer_limit_exceeded: return "Token size limit exceeded";
      }
      return "Unknown scan error " + std::to_string(cond);
    }
  } inst;
  return inst;
}

std::string error::message() const {
  if (!cause_)
    return make_error_code(kind_).message();
  return fmt::format("{}: {}", make_error_code(kind_).message(), cause_.message());
}

} // namespace tokscan
