#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gdbsession/channel/channel.hpp"

namespace gdbsession {

class broadcaster {
public:
  using channel_ptr = std::shared_ptr<channel>;
  using clock = std::chrono::steady_clock;

  broadcaster();

  bool subscribe(channel_ptr target);
  // Removes without closing; the caller still owns the connection.
  bool unsubscribe(const channel* target);

  // Delivers to every subscriber. Channels that refuse a message are closed
  // and removed. Returns the number of successful deliveries.
  size_t broadcast(const std::string& message);
  // Delivers to one subscriber only, with the same drop rule.
  bool send_to(const channel_ptr& target, std::string message);

  size_t subscribers() const;
  // Time the subscriber set last became empty (construction time initially).
  clock::time_point idle_since() const;
  void close_all();

private:
  mutable std::mutex mutex_;
  std::vector<channel_ptr> channels_;
  clock::time_point idle_since_;

  std::shared_ptr<channel> drop_locked(const channel* target);
};

} // namespace gdbsession
