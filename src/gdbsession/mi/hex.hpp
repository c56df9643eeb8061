#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gdbsession::mi {

bool parse_hex_byte(char hi, char lo, uint8_t& out);
bool decode_hex(std::string_view hex, std::span<std::byte> out);
std::optional<std::vector<std::byte>> decode_hex(std::string_view hex);
std::string encode_hex(std::span<const std::byte> data);

// Accepts an optional 0x/0X prefix.
bool parse_hex_u64(std::string_view text, uint64_t& value);
bool parse_dec_int(std::string_view text, int& value);
bool parse_dec_u64(std::string_view text, uint64_t& value);

} // namespace gdbsession::mi
