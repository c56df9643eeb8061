#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "gdbsession/channel/channel.hpp"

namespace gdbsession::test {

class recording_channel final : public channel {
public:
  bool deliver(std::string message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_ || closed_) {
      return false;
    }
    messages_.push_back(nlohmann::json::parse(message));
    return true;
  }

  bool open() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
  }

  void close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }

  void refuse() {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
  }

  std::vector<nlohmann::json> take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    out.swap(messages_);
    return out;
  }

  std::vector<nlohmann::json> take(std::string_view type) {
    std::vector<nlohmann::json> out;
    for (auto& message : take()) {
      if (message.value("type", std::string{}) == type) {
        out.push_back(std::move(message));
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> messages_;
  bool accepting_ = true;
  bool closed_ = false;
};

inline size_t count_type(const std::vector<nlohmann::json>& messages, std::string_view type) {
  size_t count = 0;
  for (const auto& message : messages) {
    if (message.value("type", std::string{}) == type) {
      ++count;
    }
  }
  return count;
}

} // namespace gdbsession::test
