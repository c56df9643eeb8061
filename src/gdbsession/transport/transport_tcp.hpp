#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "gdbsession/transport/transport.hpp"

namespace gdbsession {

// Listens on "host:port", "[v6]:port", "*:port" or a bare port. Port 0 picks
// a free port, reported by local_port().
class transport_tcp final : public transport {
public:
  transport_tcp();
  ~transport_tcp() override;

  transport_tcp(transport_tcp&&) noexcept;
  transport_tcp& operator=(transport_tcp&&) noexcept;

  transport_tcp(const transport_tcp&) = delete;
  transport_tcp& operator=(const transport_tcp&) = delete;

  bool listen(std::string_view address) override;
  bool pending(std::chrono::milliseconds timeout) override;
  std::unique_ptr<connection> accept() override;
  std::optional<uint16_t> local_port() const override;
  void close() override;

private:
  class impl;
  std::unique_ptr<impl> impl_;
};

} // namespace gdbsession
