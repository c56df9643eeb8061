#include "gdbsession/mi/hex.hpp"

#include <array>
#include <charconv>

namespace gdbsession::mi {

namespace {

constexpr std::array<char, 16> k_hex = {
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f',
};

std::optional<uint8_t> hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <typename T>
bool parse_full(std::string_view text, T& value, int base) {
  value = 0;
  if (text.empty()) {
    return false;
  }
  const char* end = text.data() + text.size();
  auto result = std::from_chars(text.data(), end, value, base);
  return result.ec == std::errc{} && result.ptr == end;
}

} // namespace

bool parse_hex_byte(char hi, char lo, uint8_t& out) {
  auto hi_val = hex_value(hi);
  auto lo_val = hex_value(lo);
  if (!hi_val || !lo_val) {
    return false;
  }
  out = static_cast<uint8_t>((*hi_val << 4) | *lo_val);
  return true;
}

bool decode_hex(std::string_view hex, std::span<std::byte> out) {
  if (hex.size() != out.size() * 2) {
    return false;
  }

  for (size_t i = 0; i < out.size(); ++i) {
    uint8_t value = 0;
    if (!parse_hex_byte(hex[i * 2], hex[i * 2 + 1], value)) {
      return false;
    }
    out[i] = static_cast<std::byte>(value);
  }
  return true;
}

std::optional<std::vector<std::byte>> decode_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<std::byte> out(hex.size() / 2);
  if (!decode_hex(hex, out)) {
    return std::nullopt;
  }
  return out;
}

std::string encode_hex(std::span<const std::byte> data) {
  std::string out;
  out.resize(data.size() * 2);

  for (size_t i = 0; i < data.size(); ++i) {
    uint8_t value = std::to_integer<uint8_t>(data[i]);
    out[i * 2] = k_hex[(value >> 4) & 0x0f];
    out[i * 2 + 1] = k_hex[value & 0x0f];
  }

  return out;
}

bool parse_hex_u64(std::string_view text, uint64_t& value) {
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }
  return parse_full(text, value, 16);
}

bool parse_dec_int(std::string_view text, int& value) { return parse_full(text, value, 10); }

bool parse_dec_u64(std::string_view text, uint64_t& value) { return parse_full(text, value, 10); }

} // namespace gdbsession::mi
