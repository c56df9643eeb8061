#pragma once

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gdbsession {

struct spawn_request {
  std::string gdb_path = "gdb";
  std::vector<std::string> extra_args;
  std::string executable;
};

enum class spawn_status { ok, exec_failed, pty_failed, fork_failed };

std::string_view to_string(spawn_status status);

// Byte pipe to one debugger process. read() returns <= 0 once the process is
// gone (EOF or EIO on the terminal).
class debugger_io {
public:
  virtual ~debugger_io() = default;

  virtual spawn_status spawn(const spawn_request& request) = 0;
  // False once the process has exited, even if the terminal stays open.
  virtual bool alive() = 0;
  virtual bool readable(std::chrono::milliseconds timeout) = 0;
  virtual std::ptrdiff_t read(std::span<std::byte> out) = 0;
  virtual std::ptrdiff_t write(std::span<const std::byte> data) = 0;
  // Ends the process (TERM, then KILL, process group wide) and reaps it.
  virtual void terminate() = 0;
};

} // namespace gdbsession
