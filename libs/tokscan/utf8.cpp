#include <string>

#include <libs/tokscan/utf8.hpp>

namespace tokscan::utf8 {

namespace {

constexpr bool is_within(unsigned c, unsigned lo, unsigned hi) noexcept {
  return c >= lo && c <= hi;
}

constexpr size_t sequence_length(unsigned char lead) noexcept {
  if (lead < 0x80)
    return 1;
  if (is_within(lead, 0xc0, 0xdf))
    return 2;
  if (is_within(lead, 0xe0, 0xef))
    return 3;
  if (is_within(lead, 0xf0, 0xf7))
    return 4;
  return 0;
}

// Smallest code point which requires sequence of given length
constexpr char32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};

} // namespace

const std::error_category& utf8_category() noexcept {
  static const struct final : std::error_category {
    const char* name() const noexcept override { return "utf-8"; }

    std::string message(int cond) const override {
      if (cond == 0)
        return std::generic_category().message(0);
      switch (static_cast<errc>(cond)) {
      case errc::invalid_lead_byte: return "Invalid UTF-8 lead byte";
      case errc::truncated_sequence: return "Incomplete UTF-8 sequence";
      case errc::invalid_continuation: return "Invalid UTF-8 continuation byte";
      case errc::overlong_encoding: return "Overlong UTF-8 encoding";
      case errc::surrogate: return "UTF-16 surrogate encoded in UTF-8";
      case errc::out_of_range: return "Code point is out of Unicode range";
      }
      return "Unknown UTF-8 error " + std::to_string(cond);
    }
  } inst;
  return inst;
}

std::expected<char32_t, std::error_code> decode_front(std::string_view& text) noexcept {
  if (text.empty())
    return std::unexpected(make_error_code(errc::truncated_sequence));
  const auto lead = static_cast<unsigned char>(text.front());
  const size_t len = sequence_length(lead);
  if (len == 0)
    return std::unexpected(make_error_code(errc::invalid_lead_byte));
  if (len == 1) {
    text.remove_prefix(1);
    return static_cast<char32_t>(lead);
  }
  if (text.size() < len)
    return std::unexpected(make_error_code(errc::truncated_sequence));

  char32_t cp = lead & ((1u << (7 - len)) - 1);
  for (size_t k = 1; k < len; ++k) {
    const auto next = static_cast<unsigned char>(text[k]);
    if (!is_within(next, 0x80, 0xbf))
      return std::unexpected(make_error_code(errc::invalid_continuation));
    cp = (cp << 6) | (next & 0x3f);
  }

  if (cp < min_code_point[len])
    return std::unexpected(make_error_code(errc::overlong_encoding));
  if (is_within(cp, 0xd800, 0xdfff))
    return std::unexpected(make_error_code(errc::surrogate));
  if (cp > 0x10ffff)
    return std::unexpected(make_error_code(errc::out_of_range));
  text.remove_prefix(len);
  return cp;
}

std::expected<std::string_view, std::error_code> as_text(
    std::span<const std::byte> bytes) noexcept {
  const std::string_view res{
      reinterpret_cast<const char*>(bytes.data()), bytes.size()};
  std::string_view rest = res;
  while (!rest.empty()) {
    // ASCII fast path
    if (static_cast<unsigned char>(rest.front()) < 0x80) {
      rest.remove_prefix(1);
      continue;
    }
    if (auto cp = decode_front(rest); !cp)
      return std::unexpected(cp.error());
  }
  return res;
}

} // namespace tokscan::utf8
