#include "gdbsession/protocol/messages.hpp"

#include <array>
#include <utility>

#include "gdbsession/mi/hex.hpp"

namespace gdbsession {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<std::string_view, action_kind>, 16> k_actions = {{
    {"init", action_kind::init},
    {"run", action_kind::run},
    {"continue", action_kind::cont},
    {"next", action_kind::next},
    {"step", action_kind::step},
    {"stop", action_kind::stop},
    {"break", action_kind::set_breakpoint},
    {"remove_breakpoint", action_kind::remove_breakpoint},
    {"var_create", action_kind::var_create},
    {"var_list_children", action_kind::var_list_children},
    {"var_expand", action_kind::var_expand},
    {"var_collapse", action_kind::var_collapse},
    {"read_memory", action_kind::read_memory},
    {"get_context", action_kind::get_context},
    {"get_analysis_context", action_kind::get_analysis_context},
    {"discard", action_kind::discard},
}};

// GDB output is not guaranteed to be UTF-8.
std::string dump(const json& message) { return message.dump(-1, ' ', false, json::error_handler_t::replace); }

std::string envelope(std::string_view type, json payload) {
  json message{{"type", type}, {"payload", std::move(payload)}};
  return dump(message);
}

// Ids and names may arrive as strings or numbers.
bool read_text(const json& args, const char* key, std::string& out) {
  auto it = args.find(key);
  if (it == args.end()) {
    return false;
  }
  if (it->is_string()) {
    out = it->get<std::string>();
    return true;
  }
  if (it->is_number_integer()) {
    out = std::to_string(it->get<int64_t>());
    return true;
  }
  return false;
}

parse_result invalid_args(action_kind kind, std::string_view detail) {
  parse_result result;
  result.status = parse_status::invalid_args;
  result.request.kind = kind;
  result.error = std::string(to_string(kind)) + ": " + std::string(detail);
  return result;
}

} // namespace

void to_json(json& j, const source_location& loc) {
  j = json{{"file", loc.file}, {"fullname", loc.fullname}, {"line", loc.line}, {"function", loc.function}};
}

void to_json(json& j, const stack_frame& frame) {
  j = json{{"level", frame.level}, {"address", frame.address},   {"function", frame.function},
           {"file", frame.file},   {"fullname", frame.fullname}, {"line", frame.line}};
}

void to_json(json& j, const variable& var) {
  j = json{{"name", var.name}, {"value", var.value}};
  if (var.type) {
    j["type"] = *var.type;
  }
}

void to_json(json& j, const var_object& object) {
  j = json{{"name", object.handle},
           {"expression", object.expression},
           {"numchild", object.numchild},
           {"value", object.value},
           {"type", object.type}};
}

void to_json(json& j, const breakpoint& bp) {
  j = json{{"id", bp.id}, {"file", bp.file}, {"line", bp.line}};
  if (!bp.fullname.empty()) {
    j["fullname"] = bp.fullname;
  }
}

void to_json(json& j, const log_entry& entry) {
  j = json{{"level", to_string(entry.level)}, {"text", entry.text}, {"timestamp", entry.timestamp}};
}

std::optional<action_kind> parse_action_kind(std::string_view name) {
  for (const auto& [text, kind] : k_actions) {
    if (text == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view to_string(action_kind kind) {
  for (const auto& [text, value] : k_actions) {
    if (value == kind) {
      return text;
    }
  }
  return "unknown";
}

parse_result parse_action(const json& message) {
  parse_result result;
  if (!message.is_object()) {
    result.status = parse_status::not_object;
    result.error = "message must be a JSON object";
    return result;
  }

  auto action = message.find("action");
  if (action == message.end() || !action->is_string()) {
    result.status = parse_status::missing_action;
    result.error = "message has no action";
    return result;
  }

  auto name = action->get<std::string>();
  auto kind = parse_action_kind(name);
  if (!kind) {
    result.status = parse_status::unknown_action;
    result.error = "unknown action: " + name;
    return result;
  }

  static const json empty = json::object();
  const json* args = &empty;
  if (auto it = message.find("args"); it != message.end() && !it->is_null()) {
    if (!it->is_object()) {
      return invalid_args(*kind, "args must be an object");
    }
    args = &*it;
  }

  action_request& request = result.request;
  request.kind = *kind;

  switch (*kind) {
  case action_kind::init:
    if (!read_text(*args, "executable", request.executable) || request.executable.empty()) {
      return invalid_args(*kind, "missing executable");
    }
    break;
  case action_kind::run:
    if (auto it = args->find("stop_at_entry"); it != args->end() && !it->is_null()) {
      if (!it->is_boolean()) {
        return invalid_args(*kind, "stop_at_entry must be a boolean");
      }
      request.stop_at_entry = it->get<bool>();
    }
    break;
  case action_kind::set_breakpoint:
    if (!read_text(*args, "location", request.location) || request.location.empty()) {
      return invalid_args(*kind, "missing location");
    }
    break;
  case action_kind::remove_breakpoint:
    if (!read_text(*args, "id", request.id) || request.id.empty()) {
      return invalid_args(*kind, "missing id");
    }
    break;
  case action_kind::var_create:
  case action_kind::var_expand:
  case action_kind::var_collapse:
    if (!read_text(*args, "expression", request.expression) || request.expression.empty()) {
      return invalid_args(*kind, "missing expression");
    }
    break;
  case action_kind::var_list_children:
    if (!read_text(*args, "name", request.name) || request.name.empty()) {
      return invalid_args(*kind, "missing name");
    }
    break;
  case action_kind::read_memory:
    if (!read_text(*args, "address", request.address) || request.address.empty()) {
      return invalid_args(*kind, "missing address");
    }
    if (auto it = args->find("count"); it != args->end() && !it->is_null()) {
      if (it->is_number_integer()) {
        request.count = it->get<int64_t>();
      } else if (it->is_string()) {
        uint64_t count = 0;
        if (!mi::parse_dec_u64(it->get<std::string>(), count)) {
          return invalid_args(*kind, "count must be an integer");
        }
        request.count = static_cast<int64_t>(count);
      } else {
        return invalid_args(*kind, "count must be an integer");
      }
    }
    break;
  default:
    break;
  }
  return result;
}

parse_result parse_action_text(std::string_view line) {
  json message = json::parse(line, nullptr, false);
  if (message.is_discarded()) {
    parse_result result;
    result.status = parse_status::invalid_json;
    result.error = "malformed JSON message";
    return result;
  }
  return parse_action(message);
}

std::optional<std::string> parse_handshake(const json& message) {
  if (!message.is_object() || message.contains("action")) {
    return std::nullopt;
  }
  auto it = message.find("session");
  if (it == message.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto id = it->get<std::string>();
  if (id.empty()) {
    return std::nullopt;
  }
  return id;
}

namespace messages {

std::string state_update(const state_snapshot& snapshot) {
  json payload{{"status", to_string(snapshot.status)},
               {"location", nullptr},
               {"stack", snapshot.stack},
               {"variables", snapshot.variables}};
  if (snapshot.location) {
    payload["location"] = *snapshot.location;
  }
  return envelope("state_update", std::move(payload));
}

std::string breakpoint_created(const breakpoint& bp) { return envelope("breakpoint_created", bp); }

std::string var_created(const var_object& object) { return envelope("var_created", object); }

std::string var_children(std::string_view handle, std::string_view expression,
                         const std::vector<var_object>& children) {
  return envelope("var_children", json{{"name", handle}, {"expression", expression}, {"children", children}});
}

std::string memory_read(const memory_block& block) {
  return envelope("memory_read", json{{"address", block.address_text}, {"contents", mi::encode_hex(block.bytes)}});
}

std::string log_event(const log_entry& entry) { return envelope("log_event", entry); }

std::string console(std::string_view text) { return envelope("console", text); }

std::string error(std::string_view text) { return envelope("error", text); }

std::string analysis(const analysis_context& context) {
  return envelope("analysis_context", json{{"stack_trace", context.stack_trace},
                                           {"exception_msg", context.exception_msg},
                                           {"recent_logs", context.recent_logs},
                                           {"current_file", context.current_file},
                                           {"variables", context.variables}});
}

} // namespace messages

} // namespace gdbsession
