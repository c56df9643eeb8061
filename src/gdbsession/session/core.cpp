#include "gdbsession/session/session.hpp"

#include <array>

#include "gdbsession/debugger/pty_debugger.hpp"
#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession {

namespace {

constexpr size_t k_read_chunk = 4096;

std::span<const std::byte> as_bytes(std::string_view text) {
  return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

} // namespace

session::session(std::string id, session_options options)
    : id_(std::move(id)), options_(std::move(options)), memory_(options_.max_memory_read) {
  if (!options_.make_debugger) {
    options_.make_debugger = [] { return std::make_unique<pty_debugger>(); };
  }
}

session::~session() { shutdown(); }

void session::submit(action_request request) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.emplace_back(std::move(request));
  }
  queue_cv_.notify_one();
}

void session::attach(std::shared_ptr<channel> target) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.emplace_back(attach_request{std::move(target)});
  }
  queue_cv_.notify_one();
}

void session::detach(const channel* target) {
  if (broadcaster_.unsubscribe(target)) {
    trace(operator_level::info, "channel detached, debugger keeps running");
  }
}

void session::start() {
  if (worker_.joinable()) {
    return;
  }
  stop_requested_ = false;
  worker_ = std::thread(&session::worker_loop, this);
}

void session::shutdown() {
  stop_requested_ = true;
  queue_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  teardown_debugger(true);
  broadcaster_.close_all();
}

bool session::poll(std::chrono::milliseconds timeout) {
  bool processed = drain_queue();

  if (debugger_) {
    processed = read_debugger(processed ? std::chrono::milliseconds(0) : timeout) || processed;
  } else if (!processed) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || stop_requested_.load(); });
  }

  expire_breakpoints(std::chrono::steady_clock::now());
  return processed;
}

void session::worker_loop() {
  trace(operator_level::info, "worker started");
  while (!stop_requested_) {
    poll(options_.poll_interval);
  }
  trace(operator_level::info, "worker stopped");
}

bool session::drain_queue() {
  std::deque<work_item> items;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    items.swap(queue_);
  }

  for (auto& item : items) {
    if (discarded_) {
      break;
    }
    handle_item(item);
  }
  return !items.empty();
}

bool session::read_debugger(std::chrono::milliseconds timeout) {
  if (!debugger_->readable(timeout)) {
    // The inferior may hold the terminal open after GDB itself died.
    if (!debugger_->alive()) {
      debugger_lost();
      return true;
    }
    return false;
  }

  std::array<std::byte, k_read_chunk> buffer{};
  auto bytes_read = debugger_->read(buffer);
  if (bytes_read <= 0) {
    debugger_lost();
    return true;
  }

  parser_.append(std::span<const std::byte>(buffer.data(), static_cast<size_t>(bytes_read)));
  while (debugger_ && parser_.has_record()) {
    auto record = parser_.pop_record();
    process_record(record);
  }
  return true;
}

std::optional<uint64_t> session::send(const mi::mi_command& command, request_kind kind, uint64_t generation) {
  if (!debugger_) {
    return std::nullopt;
  }

  uint64_t token = next_token_++;
  auto line = mi::encode_command(token, command);
  trace(operator_level::debug, "-> " + line);
  line.push_back('\n');

  auto written = debugger_->write(as_bytes(line));
  if (written != static_cast<std::ptrdiff_t>(line.size())) {
    debugger_lost();
    return std::nullopt;
  }

  pending_[token] = pending_command{kind, generation};
  return token;
}

void session::teardown_debugger(bool graceful) {
  if (!debugger_) {
    return;
  }

  if (graceful) {
    auto line = mi::encode_command(next_token_++, mi::commands::gdb_exit());
    line.push_back('\n');
    if (debugger_->write(as_bytes(line)) < 0) {
      trace(operator_level::debug, "debugger closed before -gdb-exit");
    }
  }

  debugger_->terminate();
  debugger_.reset();
  debugger_running_ = false;
  parser_.reset();
  pending_.clear();
  exec_in_flight_ = false;
  fetch_ = stop_fetch{};
}

void session::debugger_lost() {
  trace(operator_level::error, "debugger terminated unexpectedly");
  teardown_debugger(false);
  clear_frame_state();
  varobjs_.invalidate();
  memory_.reset();
  breakpoints_.unbind_all();
  set_status(session_status::exited);
  publish_state();
  add_log(log_level::error, "[Exited] debugger terminated unexpectedly");
}

void session::set_status(session_status status) {
  snapshot_.status = status;
  published_status_ = status;
}

void session::trace(operator_level level, std::string_view text) const {
  if (!options_.sink) {
    return;
  }
  std::string line = "[";
  line += id_;
  line += "] ";
  line += text;
  options_.sink(level, line);
}

} // namespace gdbsession
