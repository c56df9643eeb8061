#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "gdbsession/session/session.hpp"

namespace gdbsession {

// Maps client-chosen session ids to live sessions so a reconnecting client
// finds its debugger again.
class session_registry {
public:
  using clock = std::chrono::steady_clock;

  session_registry(session_options options, std::chrono::seconds grace_period, bool start_workers = true);
  ~session_registry();

  session_registry(const session_registry&) = delete;
  session_registry& operator=(const session_registry&) = delete;

  std::shared_ptr<session> get_or_create(const std::string& id);
  std::shared_ptr<session> find(std::string_view id) const;
  bool remove(std::string_view id);

  // Drops discarded sessions, and sessions whose debugger is gone and that
  // had no subscriber for the whole grace period. Returns the removed ids.
  std::vector<std::string> reap(clock::time_point now);
  void shutdown();

  size_t size() const;
  std::chrono::seconds grace_period() const { return grace_period_; }

private:
  session_options options_;
  std::chrono::seconds grace_period_;
  bool start_workers_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<session>, std::less<>> sessions_;
};

} // namespace gdbsession
