#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession::mi::commands {

mi_command break_insert(std::string_view location) { return {"-break-insert", {}, {std::string(location)}, true}; }

mi_command break_delete(std::string_view id) { return {"-break-delete", {}, {std::string(id)}}; }

mi_command exec_run(bool stop_at_entry) {
  mi_command command{"-exec-run", {}, {}};
  if (stop_at_entry) {
    command.options.push_back("--start");
  }
  return command;
}

mi_command exec_next() { return {"-exec-next", {}, {}}; }

mi_command exec_step() { return {"-exec-step", {}, {}}; }

mi_command exec_continue() { return {"-exec-continue", {}, {}}; }

mi_command stack_list_frames() { return {"-stack-list-frames", {}, {}}; }

mi_command stack_list_variables() { return {"-stack-list-variables", {"--simple-values"}, {}}; }

// "-" lets GDB pick the handle, "*" binds the varobj to the current frame.
mi_command var_create(std::string_view expression) { return {"-var-create", {"-", "*"}, {std::string(expression)}}; }

mi_command var_list_children(std::string_view handle) {
  return {"-var-list-children", {"--all-values"}, {std::string(handle)}};
}

mi_command var_delete(std::string_view handle) { return {"-var-delete", {}, {std::string(handle)}}; }

mi_command data_read_memory_bytes(std::string_view address, size_t count) {
  return {"-data-read-memory-bytes", {}, {std::string(address), std::to_string(count)}, true};
}

mi_command gdb_exit() { return {"-gdb-exit", {}, {}}; }

} // namespace gdbsession::mi::commands
