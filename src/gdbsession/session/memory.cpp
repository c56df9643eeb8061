#include "gdbsession/session/session.hpp"

#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession {

void session::do_read_memory(const action_request& request) {
  switch (memory_.validate(request.address, request.count)) {
  case memory_reader::request_status::empty_address:
    send_error("read_memory: missing address");
    return;
  case memory_reader::request_status::invalid_count:
    send_error("read_memory: count must be between 1 and " + std::to_string(memory_.max_read()));
    return;
  case memory_reader::request_status::ok:
    break;
  }
  if (require_debugger("read_memory") != action_status::accepted) {
    return;
  }

  auto count = static_cast<size_t>(request.count);
  if (auto token = send(mi::commands::data_read_memory_bytes(request.address, count), request_kind::memory)) {
    memory_.expect(*token, request.address, count);
  }
}

void session::on_memory_result(uint64_t token, const mi::result_record& record) {
  if (record.cls == mi::result_class::error) {
    if (memory_.on_error(token)) {
      send_error("read_memory: " + mi::decode_error_message(record.results));
    }
    return;
  }

  memory_block block;
  switch (memory_.on_result(token, record.results, block)) {
  case memory_reader::reply_status::ok:
    publish(messages::memory_read(block));
    break;
  case memory_reader::reply_status::stale:
    trace(operator_level::debug, "dropping superseded memory reply");
    break;
  case memory_reader::reply_status::malformed:
    send_error("read_memory: malformed debugger reply");
    break;
  }
}

} // namespace gdbsession
