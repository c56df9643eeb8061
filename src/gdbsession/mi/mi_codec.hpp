#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gdbsession/mi/mi_types.hpp"

namespace gdbsession::mi {

inline constexpr size_t k_max_line_size = 1 << 20;
inline constexpr size_t k_max_nesting = 256;

// A command as issued to GDB. `options` are fixed flags chosen by this library
// and are written verbatim. `parameters` may carry client text and are always
// passed through quote_parameter().
struct mi_command {
  std::string operation;
  std::vector<std::string> options;
  std::vector<std::string> parameters;
  // Set for commands that read flags with GDB's option parser: a parameter
  // starting with '-' is then preceded by "--".
  bool ends_options = false;
};

// Returns the wire line without the trailing newline.
std::string encode_command(uint64_t token, const mi_command& command);

std::string quote_c_string(std::string_view value);
std::string quote_parameter(std::string_view value);

// Never throws. Lines that are not valid MI come back as console stream
// records holding the raw text.
record parse_record(std::string_view line);

// Splits a byte stream into lines and decodes each one. Partial lines stay
// buffered until their terminator arrives.
class record_parser {
public:
  void append(std::span<const std::byte> data);
  void append(std::string_view data);
  bool has_record() const;
  record pop_record();
  size_t buffered() const { return line_.size(); }
  void reset();

private:
  std::string line_;
  std::deque<record> records_;

  void finish_line();
};

} // namespace gdbsession::mi
