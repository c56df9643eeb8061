#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace gdbsession {

// One accepted client stream. disconnect() may be called from any thread and
// wakes a reader blocked in readable().
class connection {
public:
  virtual ~connection() = default;

  virtual bool connected() const = 0;
  virtual bool readable(std::chrono::milliseconds timeout) = 0;
  virtual std::ptrdiff_t read(std::span<std::byte> out) = 0;
  virtual std::ptrdiff_t write(std::span<const std::byte> data) = 0;
  virtual void disconnect() = 0;
};

class transport {
public:
  virtual ~transport() = default;

  virtual bool listen(std::string_view address) = 0;
  virtual bool pending(std::chrono::milliseconds timeout) = 0;
  virtual std::unique_ptr<connection> accept() = 0;
  virtual std::optional<uint16_t> local_port() const = 0;
  virtual void close() = 0;
};

} // namespace gdbsession
