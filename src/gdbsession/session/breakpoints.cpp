#include "gdbsession/session/session.hpp"

#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession {

void session::do_toggle_breakpoint(const action_request& request) {
  auto key = parse_location(request.location);
  if (!key) {
    send_error("break: invalid location: " + request.location);
    return;
  }
  auto location = format_location(*key);

  auto result = breakpoints_.toggle(*key);
  switch (result.kind) {
  case breakpoint_registry::toggle_kind::insert: {
    if (!debugger_) {
      breakpoints_.add_unbound(*key);
      add_log(log_level::info, "breakpoint at " + location + " will be set on init");
      return;
    }
    auto token = send(mi::commands::break_insert(location), request_kind::break_insert);
    if (token) {
      breakpoints_.add_pending(*key, *token, std::chrono::steady_clock::now() + options_.breakpoint_timeout);
    }
    break;
  }
  case breakpoint_registry::toggle_kind::remove_live:
    send(mi::commands::break_delete(result.id), request_kind::break_delete);
    trace(operator_level::info, "breakpoint " + result.id + " at " + location + " removed");
    break;
  case breakpoint_registry::toggle_kind::cancel_pending:
    trace(operator_level::info, "pending breakpoint at " + location + " cancelled");
    break;
  case breakpoint_registry::toggle_kind::restore_pending:
    trace(operator_level::info, "pending breakpoint at " + location + " restored");
    break;
  case breakpoint_registry::toggle_kind::drop_unbound:
    trace(operator_level::info, "unbound breakpoint at " + location + " dropped");
    break;
  }
}

void session::do_remove_breakpoint(const action_request& request) {
  if (!breakpoints_.remove(request.id)) {
    send_error("remove_breakpoint: no breakpoint with id " + request.id);
    return;
  }
  send(mi::commands::break_delete(request.id), request_kind::break_delete);
}

void session::on_break_insert_result(uint64_t token, const mi::result_record& record) {
  if (record.cls == mi::result_class::error) {
    if (breakpoints_.reject(token)) {
      send_error("break: " + mi::decode_error_message(record.results));
    }
    return;
  }

  auto info = mi::decode_breakpoint(record.results);
  if (!info) {
    if (breakpoints_.reject(token)) {
      send_error("break: debugger reply carried no breakpoint");
    }
    return;
  }
  on_breakpoint_confirmed(breakpoints_.confirm(token, *info));
}

void session::on_breakpoint_confirmed(const breakpoint_registry::confirmation& confirmation) {
  using kind = breakpoint_registry::confirm_kind;
  switch (confirmation.kind) {
  case kind::live:
    publish(messages::breakpoint_created(confirmation.bp));
    add_log(log_level::info, "breakpoint " + confirmation.bp.id + " set at " + confirmation.bp.file + ":" +
                                 std::to_string(confirmation.bp.line));
    break;
  case kind::duplicate:
    add_log(log_level::info, "breakpoint " + confirmation.existing_id + " is already set at " + confirmation.bp.file +
                                 ":" + std::to_string(confirmation.bp.line));
    send(mi::commands::break_delete(confirmation.bp.id), request_kind::break_delete);
    break;
  case kind::cancelled:
  case kind::stale:
    trace(operator_level::info, "deleting unwanted breakpoint " + confirmation.bp.id);
    send(mi::commands::break_delete(confirmation.bp.id), request_kind::break_delete);
    break;
  case kind::ignored:
    break;
  }
}

void session::replay_breakpoints() {
  auto deadline = std::chrono::steady_clock::now() + options_.breakpoint_timeout;
  for (const auto& key : breakpoints_.unbound_keys()) {
    auto token = send(mi::commands::break_insert(format_location(key)), request_kind::break_insert);
    if (!token) {
      return;
    }
    breakpoints_.add_pending(key, *token, deadline);
  }
}

void session::expire_breakpoints(std::chrono::steady_clock::time_point now) {
  for (const auto& key : breakpoints_.expire(now)) {
    send_error("break: no confirmation for " + format_location(key) + " within " +
               std::to_string(options_.breakpoint_timeout.count()) + " ms");
  }
}

} // namespace gdbsession
