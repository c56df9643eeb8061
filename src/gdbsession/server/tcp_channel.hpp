#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "gdbsession/channel/channel.hpp"
#include "gdbsession/transport/transport.hpp"

namespace gdbsession {

// A channel over one client connection. Messages are queued and written as
// JSON lines by a dedicated writer thread; a full queue closes the channel.
class tcp_channel final : public channel {
public:
  tcp_channel(std::shared_ptr<connection> conn, size_t queue_limit);
  ~tcp_channel() override;

  tcp_channel(const tcp_channel&) = delete;
  tcp_channel& operator=(const tcp_channel&) = delete;

  bool deliver(std::string message) override;
  bool open() const override;
  void close() override;

  bool overflowed() const;

private:
  std::shared_ptr<connection> conn_;
  size_t queue_limit_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool closed_ = false;
  bool overflowed_ = false;
  std::thread writer_;

  void writer_loop();
};

} // namespace gdbsession
