#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gdbsession/debugger/debugger_io.hpp"
#include "gdbsession/session/session.hpp"

namespace gdbsession::test {

// What a fake debugger process has seen and what it will say next. Shared
// between the test body and the debugger_io the session owns.
struct debugger_script {
  spawn_status spawn_result = spawn_status::ok;
  spawn_request spawned;
  std::string output;
  std::string input;
  bool eof = false;
  // The process is gone but the terminal has not reported EOF.
  bool exited = false;
  bool terminated = false;

  void push_output(std::string_view text) { output.append(text); }

  // Returns the complete command lines written since the last call.
  std::vector<std::string> take_commands() {
    std::vector<std::string> lines;
    size_t newline = 0;
    while ((newline = input.find('\n')) != std::string::npos) {
      lines.push_back(input.substr(0, newline));
      input.erase(0, newline + 1);
    }
    return lines;
  }
};

class scripted_debugger final : public debugger_io {
public:
  explicit scripted_debugger(std::shared_ptr<debugger_script> script) : script_(std::move(script)) {}

  spawn_status spawn(const spawn_request& request) override {
    script_->spawned = request;
    return script_->spawn_result;
  }

  bool alive() override { return !script_->terminated && !script_->eof && !script_->exited; }

  bool readable(std::chrono::milliseconds) override { return !script_->output.empty() || script_->eof; }

  std::ptrdiff_t read(std::span<std::byte> out) override {
    if (script_->output.empty()) {
      return script_->eof ? 0 : -1;
    }
    size_t count = std::min(out.size(), script_->output.size());
    std::memcpy(out.data(), script_->output.data(), count);
    script_->output.erase(0, count);
    return static_cast<std::ptrdiff_t>(count);
  }

  std::ptrdiff_t write(std::span<const std::byte> data) override {
    if (script_->terminated) {
      return -1;
    }
    script_->input.append(reinterpret_cast<const char*>(data.data()), data.size());
    return static_cast<std::ptrdiff_t>(data.size());
  }

  void terminate() override { script_->terminated = true; }

private:
  std::shared_ptr<debugger_script> script_;
};

// Hands out one scripted debugger per spawn and keeps every script.
class debugger_farm {
public:
  debugger_factory factory() {
    return [this] {
      auto script = std::make_shared<debugger_script>();
      script->spawn_result = next_spawn_result;
      scripts.push_back(script);
      return std::make_unique<scripted_debugger>(script);
    };
  }

  debugger_script& current() { return *scripts.back(); }

  spawn_status next_spawn_result = spawn_status::ok;
  std::vector<std::shared_ptr<debugger_script>> scripts;
};

inline uint64_t token_of(std::string_view command) {
  uint64_t token = 0;
  for (char c : command) {
    if (c < '0' || c > '9') {
      break;
    }
    token = token * 10 + static_cast<uint64_t>(c - '0');
  }
  return token;
}

// Finds the newest command whose operation matches and returns its token.
inline uint64_t token_for(const std::vector<std::string>& commands, std::string_view operation) {
  for (auto it = commands.rbegin(); it != commands.rend(); ++it) {
    auto digits = it->find_first_not_of("0123456789");
    if (digits != std::string::npos && std::string_view(*it).substr(digits).starts_with(operation)) {
      return token_of(*it);
    }
  }
  return 0;
}

} // namespace gdbsession::test
