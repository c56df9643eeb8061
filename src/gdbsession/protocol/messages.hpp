#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "gdbsession/model.hpp"

namespace gdbsession {

enum class action_kind {
  init,
  run,
  cont,
  next,
  step,
  stop,
  set_breakpoint,
  remove_breakpoint,
  var_create,
  var_list_children,
  var_expand,
  var_collapse,
  read_memory,
  get_context,
  get_analysis_context,
  discard,
};

std::optional<action_kind> parse_action_kind(std::string_view name);
std::string_view to_string(action_kind kind);

struct action_request {
  action_kind kind = action_kind::get_context;
  std::string executable;
  bool stop_at_entry = false;
  std::string location;
  std::string id;
  std::string expression;
  std::string name;
  std::string address;
  int64_t count = 256;
};

enum class parse_status { ok, invalid_json, not_object, missing_action, unknown_action, invalid_args };

struct parse_result {
  parse_status status = parse_status::ok;
  action_request request;
  std::string error;

  bool ok() const { return status == parse_status::ok; }
};

parse_result parse_action(const nlohmann::json& message);
// Never throws; malformed JSON is reported as invalid_json.
parse_result parse_action_text(std::string_view line);

// A handshake is an object carrying "session" and no "action".
std::optional<std::string> parse_handshake(const nlohmann::json& message);

namespace messages {

std::string state_update(const state_snapshot& snapshot);
std::string breakpoint_created(const breakpoint& bp);
std::string var_created(const var_object& object);
std::string var_children(std::string_view handle, std::string_view expression, const std::vector<var_object>& children);
std::string memory_read(const memory_block& block);
std::string log_event(const log_entry& entry);
std::string console(std::string_view text);
std::string error(std::string_view text);
std::string analysis(const analysis_context& context);

} // namespace messages

} // namespace gdbsession
