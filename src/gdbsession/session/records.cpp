#include "gdbsession/session/session.hpp"

#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession {

namespace {

std::string where(const std::optional<source_location>& location) {
  if (!location || location->file.empty()) {
    return {};
  }
  return " at " + location->file + ":" + std::to_string(location->line);
}

std::string strip_newline(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

} // namespace

void session::process_record(mi::record& record) {
  if (auto* result = std::get_if<mi::result_record>(&record)) {
    on_result(*result);
    return;
  }
  if (auto* async = std::get_if<mi::async_record>(&record)) {
    switch (async->kind) {
    case mi::async_kind::exec:
      on_exec_async(*async);
      break;
    case mi::async_kind::notify:
      on_notify(*async);
      break;
    case mi::async_kind::status:
      trace(operator_level::debug, "status " + async->async_class);
      break;
    }
    return;
  }
  if (auto* stream = std::get_if<mi::stream_record>(&record)) {
    on_stream(*stream);
  }
}

void session::on_result(const mi::result_record& record) {
  if (!record.token) {
    if (record.cls == mi::result_class::error) {
      send_error(mi::decode_error_message(record.results));
    }
    return;
  }

  auto it = pending_.find(*record.token);
  if (it == pending_.end()) {
    trace(operator_level::debug, "reply for untracked token " + std::to_string(*record.token));
    return;
  }
  auto token = it->first;
  auto pending = it->second;
  pending_.erase(it);

  switch (pending.kind) {
  case request_kind::exec:
    on_exec_result(record);
    break;
  case request_kind::stack:
  case request_kind::variables:
    on_fetch_result(pending.kind, pending.generation, record);
    break;
  case request_kind::break_insert:
    on_break_insert_result(token, record);
    break;
  case request_kind::break_delete:
    if (record.cls == mi::result_class::error) {
      send_error("break-delete: " + mi::decode_error_message(record.results));
    }
    break;
  case request_kind::var_create:
  case request_kind::var_children:
    on_var_result(token, pending.kind, record);
    break;
  case request_kind::memory:
    on_memory_result(token, record);
    break;
  case request_kind::var_delete:
  case request_kind::ignore:
    break;
  }
}

void session::on_exec_result(const mi::result_record& record) {
  exec_in_flight_ = false;
  switch (record.cls) {
  case mi::result_class::running:
    if (snapshot_.status != session_status::running) {
      enter_running();
    }
    break;
  case mi::result_class::error:
    send_error(mi::decode_error_message(record.results));
    break;
  default:
    break;
  }
}

void session::on_exec_async(const mi::async_record& record) {
  if (record.async_class == "running") {
    exec_in_flight_ = false;
    if (snapshot_.status != session_status::running) {
      enter_running();
    }
    return;
  }
  if (record.async_class == "stopped") {
    on_stopped(mi::decode_stop(record.results));
    return;
  }
  trace(operator_level::debug, "exec " + record.async_class);
}

void session::on_notify(const mi::async_record& record) {
  if (record.async_class == "breakpoint-created") {
    auto info = mi::decode_breakpoint(record.results);
    // Temporary breakpoints belong to -exec-run --start.
    if (info && !info->temporary) {
      on_breakpoint_confirmed(breakpoints_.notify_created(*info));
    }
    return;
  }
  if (record.async_class == "breakpoint-deleted") {
    if (auto id = mi::decode_deleted_breakpoint(record.results)) {
      if (breakpoints_.notify_deleted(*id)) {
        add_log(log_level::info, "breakpoint " + *id + " deleted");
      }
    }
    return;
  }
  trace(operator_level::debug, "notify " + record.async_class);
}

void session::on_stream(const mi::stream_record& record) {
  switch (record.kind) {
  case mi::stream_kind::console:
  case mi::stream_kind::target:
    publish(messages::console(record.text));
    break;
  case mi::stream_kind::log: {
    auto text = strip_newline(record.text);
    if (!text.empty()) {
      add_log(log_level::gdb, std::move(text));
    }
    break;
  }
  }
}

void session::enter_running() {
  exec_in_flight_ = false;
  set_status(session_status::running);
  clear_frame_state();
  ++fetch_generation_;
  fetch_ = stop_fetch{};
  release_varobjs();
  publish_state();
  add_log(log_level::info, "[Running]");
}

void session::on_stopped(const mi::stop_event& event) {
  exec_in_flight_ = false;
  last_stop_ = stop_description{event.reason, event.signal_name, event.signal_meaning, event.exit_code};

  auto category = mi::classify_stop(event);
  if (category == mi::stop_category::exited) {
    set_status(session_status::exited);
    clear_frame_state();
    ++fetch_generation_;
    fetch_ = stop_fetch{};
    release_varobjs();
    publish_state();

    std::string text = "[Exited] Reason: " + event.reason;
    if (event.exit_code) {
      text += " (code " + std::to_string(*event.exit_code) + ")";
    }
    add_log(log_level::info, std::move(text));
    return;
  }

  clear_frame_state();
  snapshot_.location = mi::location_of(event);

  if (category == mi::stop_category::fatal) {
    set_status(session_status::stopped);
    std::string text = "[Stopped] " + event.reason;
    if (!event.signal_name.empty()) {
      text += " " + event.signal_name;
      if (!event.signal_meaning.empty()) {
        text += " (" + event.signal_meaning + ")";
      }
    }
    add_log(log_level::error, text + where(snapshot_.location));
  } else {
    set_status(session_status::paused);
    auto reason = event.reason.empty() ? std::string("stopped") : event.reason;
    add_log(log_level::info, "[Paused] " + reason + where(snapshot_.location));
  }

  begin_fetch();
}

void session::begin_fetch() {
  fetch_ = stop_fetch{};
  fetch_.generation = ++fetch_generation_;
  fetch_.active = true;

  if (!send(mi::commands::stack_list_frames(), request_kind::stack, fetch_.generation)) {
    return;
  }
  send(mi::commands::stack_list_variables(), request_kind::variables, fetch_.generation);
}

void session::on_fetch_result(request_kind kind, uint64_t generation, const mi::result_record& record) {
  if (!fetch_.active || generation != fetch_.generation) {
    trace(operator_level::debug, "dropping superseded frame reply");
    return;
  }

  bool ok = record.cls == mi::result_class::done;
  if (!ok) {
    trace(operator_level::warning, "frame fetch failed: " + mi::decode_error_message(record.results));
  }

  if (kind == request_kind::stack) {
    snapshot_.stack = ok ? mi::decode_stack(record.results) : std::vector<stack_frame>{};
    fetch_.stack_done = true;
  } else {
    snapshot_.variables = ok ? mi::decode_variables(record.results) : std::vector<variable>{};
    fetch_.variables_done = true;
  }

  if (!fetch_.stack_done || !fetch_.variables_done) {
    return;
  }

  fetch_.active = false;
  if (!snapshot_.location && !snapshot_.stack.empty()) {
    const auto& top = snapshot_.stack.front();
    snapshot_.location = source_location{top.file, top.fullname, top.line, top.function};
  }
  publish_state();
}

void session::clear_frame_state() {
  snapshot_.location.reset();
  snapshot_.stack.clear();
  snapshot_.variables.clear();
}

} // namespace gdbsession
