#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "gdbsession/mi/mi_types.hpp"
#include "gdbsession/model.hpp"

namespace gdbsession {

inline constexpr size_t k_default_max_memory_read = 65536;
inline constexpr size_t k_default_memory_count = 256;

class memory_reader {
public:
  enum class request_status { ok, empty_address, invalid_count };
  enum class reply_status { ok, stale, malformed };

  explicit memory_reader(size_t max_read = k_default_max_memory_read) : max_read_(max_read) {}

  size_t max_read() const { return max_read_; }
  request_status validate(std::string_view address, int64_t count) const;

  // Starts a new generation; replies to earlier requests are dropped.
  void expect(uint64_t token, std::string address, size_t count);
  bool is_pending(uint64_t token) const { return pending_.contains(token); }

  reply_status on_result(uint64_t token, const mi::mi_results& results, memory_block& out);
  // False when the error belongs to a superseded request.
  bool on_error(uint64_t token);

  const std::optional<memory_block>& last() const { return last_; }
  uint64_t generation() const { return generation_; }
  void reset();

private:
  struct request {
    uint64_t generation = 0;
    std::string address;
    size_t count = 0;
  };

  size_t max_read_;
  uint64_t generation_ = 0;
  std::map<uint64_t, request> pending_;
  std::optional<memory_block> last_;
};

} // namespace gdbsession
