#include "gdbsession/mi/mi_payloads.hpp"

#include <array>
#include <charconv>
#include <string_view>

#include "gdbsession/mi/hex.hpp"

namespace gdbsession::mi {

namespace {

constexpr std::array<std::string_view, 6> k_fatal_signals = {
    "SIGSEGV", "SIGABRT", "SIGBUS", "SIGFPE", "SIGILL", "SIGSYS",
};

int int_or(const std::optional<std::string>& text, int fallback) {
  if (!text) {
    return fallback;
  }
  int value = 0;
  if (!parse_dec_int(*text, value)) {
    return fallback;
  }
  return value;
}

std::string string_or_empty(const mi_value& value, std::string_view name) {
  return value.string_of(name).value_or(std::string{});
}

// GDB reports exit codes in octal ("exit-code=\"011\"").
std::optional<int> parse_exit_code(const std::optional<std::string>& text) {
  if (!text || text->empty()) {
    return std::nullopt;
  }
  int value = 0;
  const char* end = text->data() + text->size();
  auto result = std::from_chars(text->data(), end, value, 8);
  if (result.ec != std::errc{} || result.ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<variable> decode_variable(const mi_value& value) {
  if (!value.is_tuple()) {
    return std::nullopt;
  }
  auto name = value.string_of("name");
  if (!name) {
    return std::nullopt;
  }
  variable out;
  out.name = std::move(*name);
  out.value = string_or_empty(value, "value");
  out.type = value.string_of("type");
  return out;
}

} // namespace

std::optional<stack_frame> decode_frame(const mi_value& value) {
  if (!value.is_tuple()) {
    return std::nullopt;
  }
  stack_frame frame;
  frame.level = int_or(value.string_of("level"), 0);
  frame.address = string_or_empty(value, "addr");
  frame.function = string_or_empty(value, "func");
  frame.file = string_or_empty(value, "file");
  frame.fullname = string_or_empty(value, "fullname");
  frame.line = int_or(value.string_of("line"), 0);
  return frame;
}

std::vector<stack_frame> decode_stack(const mi_results& results) {
  std::vector<stack_frame> frames;
  const auto* stack = find_result(results, "stack");
  if (!stack || !stack->is_list()) {
    return frames;
  }
  frames.reserve(stack->items.size());
  for (const auto& item : stack->items) {
    if (auto frame = decode_frame(item.value)) {
      frames.push_back(std::move(*frame));
    }
  }
  return frames;
}

std::vector<variable> decode_variables(const mi_results& results) {
  std::vector<variable> out;
  const auto* list = find_result(results, "variables");
  if (!list) {
    list = find_result(results, "locals");
  }
  if (!list || !list->is_list()) {
    return out;
  }
  for (const auto& item : list->items) {
    if (item.value.is_string() && item.name == "name") {
      out.push_back(variable{item.value.text, {}, std::nullopt});
      continue;
    }
    if (auto var = decode_variable(item.value)) {
      out.push_back(std::move(*var));
    }
  }
  return out;
}

std::optional<breakpoint_info> decode_breakpoint(const mi_results& results) {
  const auto* bkpt = find_result(results, "bkpt");
  if (!bkpt || !bkpt->is_tuple()) {
    return std::nullopt;
  }
  auto number = bkpt->string_of("number");
  if (!number || number->empty()) {
    return std::nullopt;
  }

  breakpoint_info info;
  info.bp.id = std::move(*number);
  info.bp.file = string_or_empty(*bkpt, "file");
  info.bp.fullname = string_or_empty(*bkpt, "fullname");
  info.bp.line = int_or(bkpt->string_of("line"), 0);
  info.original_location = string_or_empty(*bkpt, "original-location");
  info.temporary = bkpt->string_of("disp").value_or("keep") == "del";

  // Pending breakpoints (no symbol table yet) only carry original-location.
  if (info.bp.line == 0 && !info.original_location.empty()) {
    auto colon = info.original_location.rfind(':');
    if (colon != std::string::npos) {
      int line = 0;
      if (parse_dec_int(std::string_view(info.original_location).substr(colon + 1), line)) {
        info.bp.line = line;
        if (info.bp.file.empty()) {
          info.bp.file = info.original_location.substr(0, colon);
        }
      }
    }
  }
  return info;
}

std::optional<std::string> decode_deleted_breakpoint(const mi_results& results) {
  auto id = find_string(results, "id");
  if (!id || id->empty()) {
    return std::nullopt;
  }
  return id;
}

std::optional<var_object> decode_var_created(const mi_results& results, const std::string& expression) {
  auto name = find_string(results, "name");
  if (!name || name->empty()) {
    return std::nullopt;
  }
  var_object out;
  out.handle = std::move(*name);
  out.expression = expression;
  out.value = find_string(results, "value").value_or(std::string{});
  out.type = find_string(results, "type").value_or(std::string{});
  out.numchild = int_or(find_string(results, "numchild"), 0);
  return out;
}

std::vector<var_object> decode_var_children(const mi_results& results, const std::string& parent) {
  std::vector<var_object> out;
  const auto* children = find_result(results, "children");
  if (!children || !children->is_list()) {
    return out;
  }
  out.reserve(children->items.size());
  for (const auto& item : children->items) {
    const auto& child = item.value;
    if (!child.is_tuple()) {
      continue;
    }
    auto name = child.string_of("name");
    if (!name) {
      continue;
    }
    var_object obj;
    obj.handle = std::move(*name);
    obj.expression = string_or_empty(child, "exp");
    obj.value = string_or_empty(child, "value");
    obj.type = string_or_empty(child, "type");
    obj.numchild = int_or(child.string_of("numchild"), 0);
    obj.parent = parent;
    out.push_back(std::move(obj));
  }
  return out;
}

// Each block carries its absolute `begin` and `offset` = begin - requested
// address. GDB lists readable blocks in address order; the result is the
// contiguous run starting at the first one.
std::optional<memory_block> decode_memory(const mi_results& results) {
  const auto* memory = find_result(results, "memory");
  if (!memory || !memory->is_list() || memory->items.empty()) {
    return std::nullopt;
  }

  memory_block block;
  bool first = true;
  uint64_t requested = 0;
  uint64_t next_address = 0;
  for (const auto& item : memory->items) {
    const auto& entry = item.value;
    auto begin_text = entry.string_of("begin");
    auto contents = entry.string_of("contents");
    if (!begin_text || !contents) {
      return std::nullopt;
    }
    uint64_t begin = 0;
    if (!parse_hex_u64(*begin_text, begin)) {
      return std::nullopt;
    }
    uint64_t offset = 0;
    if (auto offset_text = entry.string_of("offset")) {
      if (!parse_hex_u64(*offset_text, offset) || offset > begin) {
        return std::nullopt;
      }
    }
    auto bytes = decode_hex(*contents);
    if (!bytes) {
      return std::nullopt;
    }

    if (first) {
      requested = begin - offset;
      block.base_address = begin;
      block.address_text = *begin_text;
      first = false;
    } else {
      if (begin - offset != requested) {
        return std::nullopt;
      }
      if (begin != next_address) {
        // Unreadable hole: later bytes would land at the wrong offsets.
        break;
      }
    }
    block.bytes.insert(block.bytes.end(), bytes->begin(), bytes->end());
    next_address = begin + bytes->size();
  }
  return block;
}

stop_event decode_stop(const mi_results& results) {
  stop_event event;
  event.reason = find_string(results, "reason").value_or(std::string{});
  if (const auto* frame = find_result(results, "frame")) {
    event.frame = decode_frame(*frame);
  }
  event.signal_name = find_string(results, "signal-name").value_or(std::string{});
  event.signal_meaning = find_string(results, "signal-meaning").value_or(std::string{});
  event.exit_code = parse_exit_code(find_string(results, "exit-code"));
  event.breakpoint_id = find_string(results, "bkptno");
  return event;
}

std::string decode_error_message(const mi_results& results) {
  auto msg = find_string(results, "msg");
  if (!msg || msg->empty()) {
    return "unknown debugger error";
  }
  return *msg;
}

stop_category classify_stop(const stop_event& event) {
  if (event.reason == "exited-normally" || event.reason == "exited") {
    return stop_category::exited;
  }
  if (event.reason == "exited-signalled") {
    return stop_category::fatal;
  }
  if (event.reason == "signal-received") {
    for (auto name : k_fatal_signals) {
      if (event.signal_name == name) {
        return stop_category::fatal;
      }
    }
  }
  return stop_category::paused;
}

std::optional<source_location> location_of(const stop_event& event) {
  if (!event.frame) {
    return std::nullopt;
  }
  source_location loc;
  loc.file = event.frame->file;
  loc.fullname = event.frame->fullname;
  loc.line = event.frame->line;
  loc.function = event.frame->function;
  return loc;
}

} // namespace gdbsession::mi
