#include "gdbsession/memory_reader.hpp"

#include "gdbsession/mi/mi_payloads.hpp"

namespace gdbsession {

memory_reader::request_status memory_reader::validate(std::string_view address, int64_t count) const {
  if (address.find_first_not_of(" \t") == std::string_view::npos) {
    return request_status::empty_address;
  }
  if (count <= 0 || static_cast<uint64_t>(count) > max_read_) {
    return request_status::invalid_count;
  }
  return request_status::ok;
}

void memory_reader::expect(uint64_t token, std::string address, size_t count) {
  ++generation_;
  pending_[token] = request{generation_, std::move(address), count};
}

memory_reader::reply_status memory_reader::on_result(uint64_t token, const mi::mi_results& results,
                                                     memory_block& out) {
  auto it = pending_.find(token);
  if (it == pending_.end()) {
    return reply_status::stale;
  }
  auto generation = it->second.generation;
  pending_.erase(it);
  if (generation != generation_) {
    return reply_status::stale;
  }

  auto block = mi::decode_memory(results);
  if (!block) {
    return reply_status::malformed;
  }
  last_ = *block;
  out = std::move(*block);
  return reply_status::ok;
}

bool memory_reader::on_error(uint64_t token) {
  auto it = pending_.find(token);
  if (it == pending_.end()) {
    return false;
  }
  auto generation = it->second.generation;
  pending_.erase(it);
  return generation == generation_;
}

void memory_reader::reset() {
  pending_.clear();
  last_.reset();
  ++generation_;
}

} // namespace gdbsession
