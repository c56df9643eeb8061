#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <span>

#include "gdbsession/debugger/debugger_io.hpp"

namespace gdbsession {

// GDB in MI3 mode on a pseudo-terminal. The terminal is put in raw mode so
// commands are not echoed back into the record stream.
class pty_debugger final : public debugger_io {
public:
  pty_debugger();
  ~pty_debugger() override;

  pty_debugger(pty_debugger&&) noexcept;
  pty_debugger& operator=(pty_debugger&&) noexcept;

  pty_debugger(const pty_debugger&) = delete;
  pty_debugger& operator=(const pty_debugger&) = delete;

  spawn_status spawn(const spawn_request& request) override;
  bool alive() override;
  bool readable(std::chrono::milliseconds timeout) override;
  std::ptrdiff_t read(std::span<std::byte> out) override;
  std::ptrdiff_t write(std::span<const std::byte> data) override;
  void terminate() override;

private:
  class impl;
  std::unique_ptr<impl> impl_;
};

} // namespace gdbsession
