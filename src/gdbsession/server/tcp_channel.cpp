#include "gdbsession/server/tcp_channel.hpp"

#include <span>

namespace gdbsession {

tcp_channel::tcp_channel(std::shared_ptr<connection> conn, size_t queue_limit)
    : conn_(std::move(conn)), queue_limit_(queue_limit) {
  writer_ = std::thread(&tcp_channel::writer_loop, this);
}

tcp_channel::~tcp_channel() {
  close();
  if (writer_.joinable()) {
    writer_.join();
  }
}

bool tcp_channel::deliver(std::string message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (queue_.size() < queue_limit_) {
      message.push_back('\n');
      queue_.push_back(std::move(message));
      cv_.notify_one();
      return true;
    }
    overflowed_ = true;
  }
  // A client this far behind has lost messages; drop the connection.
  close();
  return false;
}

bool tcp_channel::open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_ && conn_->connected();
}

void tcp_channel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    queue_.clear();
  }
  cv_.notify_all();
  conn_->disconnect();
}

bool tcp_channel::overflowed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return overflowed_;
}

void tcp_channel::writer_loop() {
  while (true) {
    std::string message;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
      if (closed_) {
        return;
      }
      message = std::move(queue_.front());
      queue_.pop_front();
    }

    auto bytes = std::span<const std::byte>(reinterpret_cast<const std::byte*>(message.data()), message.size());
    if (conn_->write(bytes) != static_cast<std::ptrdiff_t>(message.size())) {
      close();
      return;
    }
  }
}

} // namespace gdbsession
