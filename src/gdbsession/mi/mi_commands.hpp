#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "gdbsession/mi/mi_codec.hpp"

namespace gdbsession::mi::commands {

mi_command break_insert(std::string_view location);
mi_command break_delete(std::string_view id);
mi_command exec_run(bool stop_at_entry);
mi_command exec_next();
mi_command exec_step();
mi_command exec_continue();
mi_command stack_list_frames();
mi_command stack_list_variables();
mi_command var_create(std::string_view expression);
mi_command var_list_children(std::string_view handle);
mi_command var_delete(std::string_view handle);
mi_command data_read_memory_bytes(std::string_view address, size_t count);
mi_command gdb_exit();

} // namespace gdbsession::mi::commands
