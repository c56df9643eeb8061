#include "gdbsession/model.hpp"

namespace gdbsession {

std::string_view to_string(session_status status) {
  switch (status) {
  case session_status::ready:
    return "Ready";
  case session_status::running:
    return "Running";
  case session_status::paused:
    return "Paused";
  case session_status::stopped:
    return "Stopped";
  case session_status::exited:
    return "Exited";
  }
  return "Ready";
}

std::string_view to_string(log_level level) {
  switch (level) {
  case log_level::info:
    return "info";
  case log_level::error:
    return "error";
  case log_level::gdb:
    return "gdb";
  }
  return "info";
}

} // namespace gdbsession
