#include "gdbsession/channel/broadcaster.hpp"

#include <algorithm>

namespace gdbsession {

broadcaster::broadcaster() : idle_since_(clock::now()) {}

bool broadcaster::subscribe(channel_ptr target) {
  if (!target) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(channels_.begin(), channels_.end(), target) != channels_.end()) {
    return false;
  }
  channels_.push_back(std::move(target));
  return true;
}

bool broadcaster::unsubscribe(const channel* target) {
  std::lock_guard<std::mutex> lock(mutex_);
  return drop_locked(target) != nullptr;
}

size_t broadcaster::broadcast(const std::string& message) {
  std::vector<channel_ptr> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets = channels_;
  }

  size_t delivered = 0;
  std::vector<const channel*> failed;
  for (const auto& target : targets) {
    if (target->open() && target->deliver(message)) {
      ++delivered;
    } else {
      failed.push_back(target.get());
    }
  }

  std::vector<channel_ptr> dropped;
  if (!failed.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* target : failed) {
      if (auto ptr = drop_locked(target)) {
        dropped.push_back(std::move(ptr));
      }
    }
  }
  for (const auto& target : dropped) {
    target->close();
  }
  return delivered;
}

bool broadcaster::send_to(const channel_ptr& target, std::string message) {
  if (!target) {
    return false;
  }
  if (target->open() && target->deliver(std::move(message))) {
    return true;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_locked(target.get());
  }
  target->close();
  return false;
}

size_t broadcaster::subscribers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.size();
}

broadcaster::clock::time_point broadcaster::idle_since() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_since_;
}

void broadcaster::close_all() {
  std::vector<channel_ptr> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.swap(channels_);
    idle_since_ = clock::now();
  }
  for (const auto& target : targets) {
    target->close();
  }
}

std::shared_ptr<channel> broadcaster::drop_locked(const channel* target) {
  auto it = std::find_if(channels_.begin(), channels_.end(), [&](const auto& ptr) { return ptr.get() == target; });
  if (it == channels_.end()) {
    return nullptr;
  }
  auto dropped = std::move(*it);
  channels_.erase(it);
  if (channels_.empty()) {
    idle_since_ = clock::now();
  }
  return dropped;
}

} // namespace gdbsession
