#include "gdbsession/session/session.hpp"

#include <filesystem>
#include <system_error>

#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession {

namespace {

bool can_launch(session_status status) {
  return status == session_status::ready || status == session_status::exited || status == session_status::stopped;
}

} // namespace

void session::handle_item(work_item& item) {
  if (auto* attach = std::get_if<attach_request>(&item)) {
    handle_attach(attach->target);
    return;
  }
  handle_action(std::get<action_request>(item));
}

void session::handle_attach(const std::shared_ptr<channel>& target) {
  if (!broadcaster_.subscribe(target)) {
    return;
  }
  trace(operator_level::info, "channel attached");
  replay_to(target);
}

void session::handle_action(const action_request& request) {
  trace(operator_level::debug, std::string("action ") + std::string(to_string(request.kind)));

  switch (request.kind) {
  case action_kind::init:
    do_init(request);
    break;
  case action_kind::run:
    do_run(request);
    break;
  case action_kind::cont:
  case action_kind::next:
  case action_kind::step:
    do_resume(request);
    break;
  case action_kind::stop:
    do_stop();
    break;
  case action_kind::set_breakpoint:
    do_toggle_breakpoint(request);
    break;
  case action_kind::remove_breakpoint:
    do_remove_breakpoint(request);
    break;
  case action_kind::var_create:
    do_var_create(request);
    break;
  case action_kind::var_list_children:
    do_var_list_children(request);
    break;
  case action_kind::var_expand:
    do_var_expand(request);
    break;
  case action_kind::var_collapse:
    do_var_collapse(request);
    break;
  case action_kind::read_memory:
    do_read_memory(request);
    break;
  case action_kind::get_context:
    publish_state();
    break;
  case action_kind::get_analysis_context:
    publish(messages::analysis(build_analysis_context()));
    break;
  case action_kind::discard:
    do_discard();
    break;
  }
}

action_status session::require_debugger(std::string_view action) {
  if (debugger_) {
    return action_status::accepted;
  }
  send_error(std::string(action) + ": no debugger running, send init first");
  return action_status::rejected;
}

action_status session::require_frame(std::string_view action) {
  auto status = snapshot_.status;
  if (status != session_status::paused && status != session_status::stopped) {
    send_error(std::string(action) + ": not available while " + std::string(to_string(status)));
    return action_status::rejected;
  }
  return require_debugger(action);
}

void session::do_init(const action_request& request) {
  if (!can_launch(snapshot_.status)) {
    send_error("init: not available while " + std::string(to_string(snapshot_.status)));
    return;
  }

  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path path(request.executable);
  if (request.executable.empty() || !fs::is_regular_file(path, ec)) {
    send_error("init: executable not found: " + request.executable);
    return;
  }
  auto absolute = fs::absolute(path, ec);
  if (ec) {
    absolute = path;
  }

  spawn_request spawn;
  spawn.gdb_path = options_.gdb_path;
  spawn.extra_args = options_.gdb_args;
  spawn.executable = absolute.string();

  auto next = options_.make_debugger();
  auto status = next ? next->spawn(spawn) : spawn_status::fork_failed;
  if (status != spawn_status::ok) {
    send_error("init: failed to start debugger: " + std::string(to_string(status)));
    return;
  }

  // The old process goes only once the replacement is up.
  teardown_debugger(true);
  debugger_ = std::move(next);
  debugger_running_ = true;
  executable_ = spawn.executable;

  clear_frame_state();
  varobjs_.invalidate();
  memory_.reset();
  last_stop_.reset();
  breakpoints_.unbind_all();
  replay_breakpoints();

  set_status(session_status::ready);
  publish_state();
  add_log(log_level::info, "[Ready] debugger started for " + executable_);
}

void session::do_run(const action_request& request) {
  if (!can_launch(snapshot_.status)) {
    send_error("run: not available while " + std::string(to_string(snapshot_.status)));
    return;
  }
  if (require_debugger("run") != action_status::accepted) {
    return;
  }
  if (exec_in_flight_) {
    send_error("run: an execution command is already in progress");
    return;
  }
  if (send(mi::commands::exec_run(request.stop_at_entry), request_kind::exec)) {
    exec_in_flight_ = true;
  }
}

void session::do_resume(const action_request& request) {
  auto name = to_string(request.kind);
  if (snapshot_.status != session_status::paused) {
    send_error(std::string(name) + ": not available while " + std::string(to_string(snapshot_.status)));
    return;
  }
  if (require_debugger(name) != action_status::accepted) {
    return;
  }
  if (exec_in_flight_) {
    send_error(std::string(name) + ": an execution command is already in progress");
    return;
  }

  mi::mi_command command;
  switch (request.kind) {
  case action_kind::next:
    command = mi::commands::exec_next();
    break;
  case action_kind::step:
    command = mi::commands::exec_step();
    break;
  default:
    command = mi::commands::exec_continue();
    break;
  }
  if (send(command, request_kind::exec)) {
    exec_in_flight_ = true;
  }
}

void session::do_stop() {
  teardown_debugger(true);
  clear_frame_state();
  varobjs_.invalidate();
  memory_.reset();
  last_stop_.reset();
  breakpoints_.unbind_all();

  set_status(session_status::ready);
  publish_state();
  add_log(log_level::info, "[Ready] debugger stopped");
}

void session::do_discard() {
  do_stop();
  add_log(log_level::info, "[Discarded] session closed");
  discarded_ = true;
}

} // namespace gdbsession
