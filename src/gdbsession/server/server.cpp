#include "gdbsession/server/server.hpp"

#include <array>

#include <nlohmann/json.hpp>

#include "gdbsession/protocol/messages.hpp"

namespace gdbsession {

namespace {

constexpr size_t k_read_chunk = 4096;
constexpr std::chrono::milliseconds k_read_slice{100};

} // namespace

server::server(session_registry& registry, std::unique_ptr<transport> transport, server_options options,
               log_sink sink)
    : registry_(registry), transport_(std::move(transport)), options_(std::move(options)), sink_(std::move(sink)),
      last_reap_(std::chrono::steady_clock::now()) {}

server::~server() { stop(); }

bool server::listen() {
  if (!transport_->listen(options_.listen_address)) {
    trace(operator_level::error, "cannot listen on " + options_.listen_address);
    return false;
  }
  running_ = true;
  trace(operator_level::info, "listening on " + options_.listen_address);
  return true;
}

std::optional<uint16_t> server::port() const { return transport_->local_port(); }

void server::serve_forever() {
  while (running_) {
    poll(k_read_slice);
  }
}

bool server::poll(std::chrono::milliseconds timeout) {
  collect_finished();

  bool accepted = false;
  if (running_ && transport_->pending(timeout)) {
    if (auto accepted_conn = transport_->accept()) {
      std::shared_ptr<connection> conn = std::move(accepted_conn);
      auto state = std::make_unique<client>();
      state->channel = std::make_shared<tcp_channel>(conn, options_.channel_queue_limit);
      auto* raw = state.get();
      state->thread = std::thread([this, raw, conn] { serve_client(*raw, conn); });

      std::lock_guard<std::mutex> lock(clients_mutex_);
      clients_.push_back(std::move(state));
      accepted = true;
    }
  }

  auto now = std::chrono::steady_clock::now();
  if (now - last_reap_ >= options_.reap_interval) {
    last_reap_ = now;
    for (const auto& id : registry_.reap(now)) {
      trace(operator_level::info, "session " + id + " reclaimed");
    }
  }
  return accepted;
}

void server::stop() {
  running_ = false;
  transport_->close();

  std::vector<std::unique_ptr<client>> clients;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients.swap(clients_);
  }
  for (auto& state : clients) {
    state->channel->close();
  }
  for (auto& state : clients) {
    if (state->thread.joinable()) {
      state->thread.join();
    }
  }
}

size_t server::clients() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  return clients_.size();
}

void server::serve_client(client& state, std::shared_ptr<connection> conn) {
  auto& target = state.channel;
  std::shared_ptr<session> bound;
  std::string buffer;
  bool first = true;
  auto connected_at = std::chrono::steady_clock::now();

  while (running_ && conn->connected() && target->open()) {
    if (!conn->readable(k_read_slice)) {
      if (!bound && std::chrono::steady_clock::now() - connected_at >= options_.handshake_timeout) {
        bound = bind(std::string(k_default_session), target);
        first = false;
      }
      continue;
    }

    std::array<std::byte, k_read_chunk> chunk{};
    auto bytes_read = conn->read(chunk);
    if (bytes_read <= 0) {
      break;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<size_t>(bytes_read));

    size_t newline = 0;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      handle_line(line, first, bound, target);
      first = false;
    }

    if (buffer.size() > k_max_message_size) {
      buffer.clear();
      target->deliver(messages::error("message exceeds " + std::to_string(k_max_message_size) + " bytes"));
    }
  }

  if (bound) {
    bound->detach(target.get());
  }
  if (target->overflowed()) {
    trace(operator_level::warning, "connection dropped, outbound queue full");
  }
  target->close();
  state.done = true;
}

void server::handle_line(std::string_view line, bool first, std::shared_ptr<session>& bound,
                         const std::shared_ptr<tcp_channel>& target) {
  auto message = nlohmann::json::parse(line, nullptr, false);

  if (first && !bound) {
    if (!message.is_discarded()) {
      if (auto id = parse_handshake(message)) {
        bound = bind(*id, target);
        return;
      }
    }
    bound = bind(std::string(k_default_session), target);
  }

  if (message.is_discarded()) {
    target->deliver(messages::error("malformed JSON message"));
    return;
  }

  auto parsed = parse_action(message);
  if (!parsed.ok()) {
    target->deliver(messages::error(parsed.error));
    return;
  }

  if (parsed.request.kind == action_kind::discard) {
    auto id = bound->id();
    bound->detach(target.get());
    registry_.remove(id);
    trace(operator_level::info, "session " + id + " discarded");
    bound = bind(id, target);
    return;
  }

  bound->submit(std::move(parsed.request));
}

std::shared_ptr<session> server::bind(const std::string& id, const std::shared_ptr<tcp_channel>& target) {
  auto bound = registry_.get_or_create(id);
  bound->attach(target);
  trace(operator_level::info, "connection bound to session " + id);
  return bound;
}

void server::collect_finished() {
  std::vector<std::unique_ptr<client>> finished;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if ((*it)->done) {
        finished.push_back(std::move(*it));
        it = clients_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& state : finished) {
    if (state->thread.joinable()) {
      state->thread.join();
    }
  }
}

void server::trace(operator_level level, std::string_view text) const {
  if (sink_) {
    sink_(level, text);
  }
}

} // namespace gdbsession
