#include "gdbsession/debugger/debugger_io.hpp"

namespace gdbsession {

std::string_view to_string(spawn_status status) {
  switch (status) {
  case spawn_status::ok:
    return "ok";
  case spawn_status::exec_failed:
    return "could not execute debugger";
  case spawn_status::pty_failed:
    return "could not allocate pseudo-terminal";
  case spawn_status::fork_failed:
    return "could not fork";
  }
  return "unknown";
}

} // namespace gdbsession
