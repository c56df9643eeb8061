#include "gdbsession/session/session.hpp"

#include <algorithm>

namespace gdbsession {

void session::publish_state() { publish(messages::state_update(snapshot_)); }

void session::publish(const std::string& message) { broadcaster_.broadcast(message); }

void session::add_log(log_level level, std::string text) {
  trace(level == log_level::error ? operator_level::warning : operator_level::info, text);

  log_entry entry{level, std::move(text), utc_timestamp()};
  auto message = messages::log_event(entry);
  logs_.push_back(std::move(entry));
  while (logs_.size() > options_.log_history) {
    logs_.pop_front();
  }
  publish(message);
}

void session::send_error(std::string text) {
  add_log(log_level::error, text);
  publish(messages::error(text));
}

void session::replay_to(const std::shared_ptr<channel>& target) {
  if (!broadcaster_.send_to(target, messages::state_update(snapshot_))) {
    return;
  }
  for (const auto& bp : breakpoints_.live()) {
    if (!broadcaster_.send_to(target, messages::breakpoint_created(bp))) {
      return;
    }
  }
  auto count = std::min(options_.log_replay, logs_.size());
  for (auto it = logs_.end() - static_cast<std::ptrdiff_t>(count); it != logs_.end(); ++it) {
    if (!broadcaster_.send_to(target, messages::log_event(*it))) {
      return;
    }
  }
}

analysis_context session::build_analysis_context() const {
  analysis_context context;

  for (const auto& frame : snapshot_.stack) {
    context.stack_trace += "#" + std::to_string(frame.level) + " ";
    context.stack_trace += frame.function.empty() ? frame.address : frame.function;
    if (!frame.file.empty()) {
      context.stack_trace += " at " + frame.file + ":" + std::to_string(frame.line);
    }
    context.stack_trace += "\n";
  }

  if (last_stop_) {
    if (!last_stop_->signal_name.empty()) {
      context.exception_msg = last_stop_->signal_name;
      if (!last_stop_->signal_meaning.empty()) {
        context.exception_msg += ": " + last_stop_->signal_meaning;
      }
    } else if (last_stop_->exit_code) {
      context.exception_msg = "exited with code " + std::to_string(*last_stop_->exit_code);
    } else {
      context.exception_msg = last_stop_->reason;
    }
  }

  auto count = std::min(options_.log_replay, logs_.size());
  for (auto it = logs_.end() - static_cast<std::ptrdiff_t>(count); it != logs_.end(); ++it) {
    if (!context.recent_logs.empty()) {
      context.recent_logs += "\n";
    }
    context.recent_logs += it->text;
  }

  if (snapshot_.location) {
    context.current_file =
        snapshot_.location->fullname.empty() ? snapshot_.location->file : snapshot_.location->fullname;
  }
  context.variables = snapshot_.variables;
  return context;
}

} // namespace gdbsession
