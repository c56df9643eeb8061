#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gdbsession/mi/mi_types.hpp"
#include "gdbsession/model.hpp"

namespace gdbsession::mi {

// Typed views of MI payloads. Everything downstream of the codec works on
// these instead of raw mi_value trees.

struct breakpoint_info {
  breakpoint bp;
  std::string original_location;
  bool temporary = false;
};

enum class stop_category { paused, exited, fatal };

struct stop_event {
  std::string reason;
  std::optional<stack_frame> frame;
  std::string signal_name;
  std::string signal_meaning;
  std::optional<int> exit_code;
  std::optional<std::string> breakpoint_id;
};

std::optional<stack_frame> decode_frame(const mi_value& value);
std::vector<stack_frame> decode_stack(const mi_results& results);
std::vector<variable> decode_variables(const mi_results& results);
std::optional<breakpoint_info> decode_breakpoint(const mi_results& results);
std::optional<std::string> decode_deleted_breakpoint(const mi_results& results);
std::optional<var_object> decode_var_created(const mi_results& results, const std::string& expression);
std::vector<var_object> decode_var_children(const mi_results& results, const std::string& parent);
std::optional<memory_block> decode_memory(const mi_results& results);
stop_event decode_stop(const mi_results& results);
std::string decode_error_message(const mi_results& results);

stop_category classify_stop(const stop_event& event);
std::optional<source_location> location_of(const stop_event& event);

} // namespace gdbsession::mi
