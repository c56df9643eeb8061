#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "gdbsession/log.hpp"
#include "gdbsession/server/tcp_channel.hpp"
#include "gdbsession/session/registry.hpp"
#include "gdbsession/transport/transport.hpp"

namespace gdbsession {

inline constexpr std::string_view k_default_session = "default";
inline constexpr size_t k_max_message_size = 1 << 20;

struct server_options {
  std::string listen_address = "127.0.0.1:8001";
  size_t channel_queue_limit = 1024;
  // A connection that stays silent this long is bound to the default session.
  std::chrono::milliseconds handshake_timeout{500};
  std::chrono::milliseconds reap_interval{1000};
};

// Accepts client connections and binds each one to a session. Every
// connection gets a reader thread; writes go through its tcp_channel.
class server {
public:
  server(session_registry& registry, std::unique_ptr<transport> transport, server_options options = {},
         log_sink sink = {});
  ~server();

  server(const server&) = delete;
  server& operator=(const server&) = delete;

  bool listen();
  std::optional<uint16_t> port() const;
  void serve_forever();
  bool poll(std::chrono::milliseconds timeout);
  void stop();
  size_t clients() const;

private:
  struct client {
    std::thread thread;
    std::shared_ptr<tcp_channel> channel;
    std::atomic<bool> done{false};
  };

  session_registry& registry_;
  std::unique_ptr<transport> transport_;
  server_options options_;
  log_sink sink_;

  std::atomic<bool> running_{false};
  mutable std::mutex clients_mutex_;
  std::vector<std::unique_ptr<client>> clients_;
  std::chrono::steady_clock::time_point last_reap_;

  void serve_client(client& state, std::shared_ptr<connection> conn);
  void handle_line(std::string_view line, bool first, std::shared_ptr<session>& bound,
                   const std::shared_ptr<tcp_channel>& target);
  std::shared_ptr<session> bind(const std::string& id, const std::shared_ptr<tcp_channel>& target);
  void collect_finished();
  void trace(operator_level level, std::string_view text) const;
};

} // namespace gdbsession
