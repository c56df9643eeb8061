#include "gdbsession/transport/transport_tcp.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <limits>
#include <string>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace gdbsession {

namespace {

class socket_handle {
public:
  socket_handle() = default;
  explicit socket_handle(int sock) : sock_(sock) {}

  socket_handle(socket_handle&& other) noexcept : sock_(other.release()) {}
  socket_handle& operator=(socket_handle&& other) noexcept {
    if (this != &other) {
      close();
      sock_ = other.release();
    }
    return *this;
  }

  socket_handle(const socket_handle&) = delete;
  socket_handle& operator=(const socket_handle&) = delete;

  ~socket_handle() { close(); }

  int get() const { return sock_; }
  bool valid() const { return sock_ >= 0; }

  int release() {
    int current = sock_;
    sock_ = -1;
    return current;
  }

  void reset(int sock = -1) {
    close();
    sock_ = sock;
  }

  void close() {
    if (sock_ >= 0) {
      ::close(sock_);
      sock_ = -1;
    }
  }

private:
  int sock_ = -1;
};

struct host_port {
  std::string host;
  std::string port;
};

std::optional<host_port> parse_address(std::string_view address) {
  if (address.empty()) {
    return std::nullopt;
  }

  std::string_view host;
  std::string_view port;

  if (address.front() == '[') {
    auto end = address.find(']');
    if (end == std::string_view::npos) {
      return std::nullopt;
    }
    if (end + 1 >= address.size() || address[end + 1] != ':') {
      return std::nullopt;
    }
    host = address.substr(1, end - 1);
    port = address.substr(end + 2);
  } else {
    auto first_colon = address.find(':');
    auto last_colon = address.rfind(':');
    if (first_colon != std::string_view::npos && first_colon != last_colon) {
      return std::nullopt;
    }
    if (last_colon == std::string_view::npos) {
      port = address;
    } else {
      host = address.substr(0, last_colon);
      port = address.substr(last_colon + 1);
    }
  }

  if (port.empty()) {
    return std::nullopt;
  }

  std::string host_str(host);
  if (host_str == "*") {
    host_str.clear();
  }
  return host_port{host_str, std::string(port)};
}

void set_listen_options(int sock) {
  int yes = 1;
  setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
}

void set_stream_options(int sock) {
  int yes = 1;
  setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
}

bool wait_readable(int sock, std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = sock;
  pfd.events = POLLIN;
  int ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(timeout.count(), std::numeric_limits<int>::max()));
  int result = ::poll(&pfd, 1, ms);
  return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
}

class tcp_connection final : public connection {
public:
  explicit tcp_connection(socket_handle sock) : sock_(std::move(sock)) {}
  ~tcp_connection() override { disconnect(); }

  bool connected() const override { return connected_.load(); }

  bool readable(std::chrono::milliseconds timeout) override {
    if (!connected_) {
      return false;
    }
    return wait_readable(sock_.get(), timeout);
  }

  std::ptrdiff_t read(std::span<std::byte> out) override {
    if (!connected_) {
      return -1;
    }
    if (out.empty()) {
      return 0;
    }
    while (true) {
      auto got = ::recv(sock_.get(), out.data(), out.size(), 0);
      if (got < 0 && errno == EINTR) {
        continue;
      }
      return got;
    }
  }

  // Writes everything or fails.
  std::ptrdiff_t write(std::span<const std::byte> data) override {
    if (!connected_) {
      return -1;
    }
    size_t sent = 0;
    while (sent < data.size()) {
      auto result = ::send(sock_.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (result < 0) {
        if (errno == EINTR) {
          continue;
        }
        return -1;
      }
      sent += static_cast<size_t>(result);
    }
    return static_cast<std::ptrdiff_t>(sent);
  }

  // The descriptor stays open until destruction so a concurrent reader never
  // sees it reused.
  void disconnect() override {
    if (connected_.exchange(false)) {
      ::shutdown(sock_.get(), SHUT_RDWR);
    }
  }

private:
  socket_handle sock_;
  std::atomic<bool> connected_{true};
};

} // namespace

class transport_tcp::impl {
public:
  bool listen(std::string_view address) {
    close();

    auto parsed = parse_address(address);
    if (!parsed) {
      return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    const char* host = parsed->host.empty() ? nullptr : parsed->host.c_str();
    addrinfo* result = nullptr;
    if (getaddrinfo(host, parsed->port.c_str(), &hints, &result) != 0) {
      return false;
    }

    for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
      int sock = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
      if (sock < 0) {
        continue;
      }

      set_listen_options(sock);
      if (::bind(sock, rp->ai_addr, rp->ai_addrlen) != 0) {
        ::close(sock);
        continue;
      }

      if (::listen(sock, SOMAXCONN) != 0) {
        ::close(sock);
        continue;
      }

      listen_socket_.reset(sock);
      break;
    }

    freeaddrinfo(result);
    return listen_socket_.valid();
  }

  bool pending(std::chrono::milliseconds timeout) {
    if (!listen_socket_.valid()) {
      return false;
    }
    return wait_readable(listen_socket_.get(), timeout);
  }

  std::unique_ptr<connection> accept() {
    if (!listen_socket_.valid()) {
      return nullptr;
    }

    int sock = ::accept4(listen_socket_.get(), nullptr, nullptr, SOCK_CLOEXEC);
    if (sock < 0) {
      return nullptr;
    }

    set_stream_options(sock);
    return std::make_unique<tcp_connection>(socket_handle(sock));
  }

  std::optional<uint16_t> local_port() const {
    if (!listen_socket_.valid()) {
      return std::nullopt;
    }
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(listen_socket_.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      return std::nullopt;
    }
    if (addr.ss_family == AF_INET) {
      return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
      return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return std::nullopt;
  }

  void close() { listen_socket_.close(); }

private:
  socket_handle listen_socket_;
};

transport_tcp::transport_tcp() : impl_(std::make_unique<impl>()) {}
transport_tcp::~transport_tcp() = default;

transport_tcp::transport_tcp(transport_tcp&&) noexcept = default;
transport_tcp& transport_tcp::operator=(transport_tcp&&) noexcept = default;

bool transport_tcp::listen(std::string_view address) { return impl_->listen(address); }
bool transport_tcp::pending(std::chrono::milliseconds timeout) { return impl_->pending(timeout); }
std::unique_ptr<connection> transport_tcp::accept() { return impl_->accept(); }
std::optional<uint16_t> transport_tcp::local_port() const { return impl_->local_port(); }
void transport_tcp::close() { impl_->close(); }

} // namespace gdbsession
