#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdbsession {

enum class session_status { ready, running, paused, stopped, exited };

std::string_view to_string(session_status status);

struct source_location {
  std::string file;
  std::string fullname;
  int line = 0;
  std::string function;
};

struct stack_frame {
  int level = 0;
  std::string address;
  std::string function;
  std::string file;
  std::string fullname;
  int line = 0;
};

struct variable {
  std::string name;
  std::string value;
  std::optional<std::string> type;
};

struct var_object {
  std::string handle;
  std::string expression;
  std::string value;
  std::string type;
  int numchild = 0;
  std::optional<std::string> parent;
};

struct breakpoint {
  std::string id;
  std::string file;
  std::string fullname;
  int line = 0;
};

struct memory_block {
  uint64_t base_address = 0;
  std::string address_text;
  std::vector<std::byte> bytes;
};

struct state_snapshot {
  session_status status = session_status::ready;
  std::optional<source_location> location;
  std::vector<stack_frame> stack;
  std::vector<variable> variables;
};

// Levels of the client-visible log stream.
enum class log_level { info, error, gdb };

std::string_view to_string(log_level level);

struct log_entry {
  log_level level = log_level::info;
  std::string text;
  std::string timestamp;
};

struct stop_description {
  std::string reason;
  std::string signal_name;
  std::string signal_meaning;
  std::optional<int> exit_code;
};

// Request body for the crash-analysis service.
struct analysis_context {
  std::string stack_trace;
  std::string exception_msg;
  std::string recent_logs;
  std::string current_file;
  std::vector<variable> variables;
};

} // namespace gdbsession
