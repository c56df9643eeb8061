#include "gdbsession/debugger/pty_debugger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <limits>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace gdbsession {

namespace {

constexpr std::chrono::milliseconds k_exit_wait{300};
constexpr std::chrono::milliseconds k_term_wait{500};
constexpr std::chrono::milliseconds k_reap_step{10};

class fd_handle {
public:
  fd_handle() = default;
  explicit fd_handle(int fd) : fd_(fd) {}

  fd_handle(fd_handle&& other) noexcept : fd_(other.release()) {}
  fd_handle& operator=(fd_handle&& other) noexcept {
    if (this != &other) {
      close();
      fd_ = other.release();
    }
    return *this;
  }

  fd_handle(const fd_handle&) = delete;
  fd_handle& operator=(const fd_handle&) = delete;

  ~fd_handle() { close(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  int release() {
    int current = fd_;
    fd_ = -1;
    return current;
  }

  void reset(int fd = -1) {
    close();
    fd_ = fd;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

std::vector<std::string> build_argv(const spawn_request& request) {
  std::vector<std::string> argv = {
      request.gdb_path, "--nx", "--quiet", "--interpreter=mi3", "--eval-command=set debuginfod enabled off",
  };
  argv.insert(argv.end(), request.extra_args.begin(), request.extra_args.end());
  argv.push_back(request.executable);
  return argv;
}

// Runs in the forked child. Reports errno through the pipe when exec fails.
[[noreturn]] void exec_child(const std::vector<std::string>& args, int report_fd) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  setenv("TERM", "dumb", 1);
  execvp(argv[0], argv.data());

  int err = errno;
  ssize_t ignored = ::write(report_fd, &err, sizeof(err));
  (void) ignored;
  _exit(127);
}

bool wait_for_exit(pid_t pid, std::chrono::milliseconds budget) {
  auto deadline = std::chrono::steady_clock::now() + budget;
  while (true) {
    int status = 0;
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid || (result < 0 && errno == ECHILD)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(k_reap_step);
  }
}

} // namespace

class pty_debugger::impl {
public:
  ~impl() { terminate(); }

  spawn_status spawn(const spawn_request& request) {
    terminate();

    int report[2] = {-1, -1};
    if (::pipe2(report, O_CLOEXEC) != 0) {
      return spawn_status::fork_failed;
    }
    fd_handle report_read(report[0]);
    fd_handle report_write(report[1]);

    termios raw{};
    cfmakeraw(&raw);

    auto args = build_argv(request);

    int master = -1;
    pid_t pid = ::forkpty(&master, nullptr, &raw, nullptr);
    if (pid < 0) {
      return errno == ENOENT ? spawn_status::pty_failed : spawn_status::fork_failed;
    }
    if (pid == 0) {
      exec_child(args, report_write.get());
    }

    report_write.close();
    master_.reset(master);
    pid_ = pid;

    // The pipe closes on successful exec; data means exec failed.
    int child_errno = 0;
    ssize_t got = 0;
    do {
      got = ::read(report_read.get(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    if (got > 0) {
      ::waitpid(pid_, nullptr, 0);
      pid_ = -1;
      master_.close();
      return spawn_status::exec_failed;
    }

    ::fcntl(master_.get(), F_SETFD, FD_CLOEXEC);
    return spawn_status::ok;
  }

  bool alive() {
    if (pid_ <= 0) {
      return false;
    }
    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_ || (result < 0 && errno == ECHILD)) {
      pid_ = -1;
      return false;
    }
    return true;
  }

  bool readable(std::chrono::milliseconds timeout) {
    if (!master_.valid()) {
      return false;
    }
    pollfd pfd{};
    pfd.fd = master_.get();
    pfd.events = POLLIN;
    int ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(timeout.count(), std::numeric_limits<int>::max()));
    int result = ::poll(&pfd, 1, ms);
    // POLLHUP is readable too: the following read() reports the EOF.
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
  }

  std::ptrdiff_t read(std::span<std::byte> out) {
    if (!master_.valid()) {
      return -1;
    }
    if (out.empty()) {
      return 0;
    }
    while (true) {
      ssize_t got = ::read(master_.get(), out.data(), out.size());
      if (got < 0 && errno == EINTR) {
        continue;
      }
      return got;
    }
  }

  std::ptrdiff_t write(std::span<const std::byte> data) {
    if (!master_.valid()) {
      return -1;
    }
    size_t written = 0;
    while (written < data.size()) {
      ssize_t sent = ::write(master_.get(), data.data() + written, data.size() - written);
      if (sent < 0) {
        if (errno == EINTR) {
          continue;
        }
        return -1;
      }
      written += static_cast<size_t>(sent);
    }
    return static_cast<std::ptrdiff_t>(written);
  }

  void terminate() {
    if (pid_ > 0) {
      if (!wait_for_exit(pid_, k_exit_wait)) {
        ::kill(-pid_, SIGTERM);
        if (!wait_for_exit(pid_, k_term_wait)) {
          ::kill(-pid_, SIGKILL);
          while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
          }
        }
      }
      pid_ = -1;
    }
    master_.close();
  }

private:
  fd_handle master_;
  pid_t pid_ = -1;
};

pty_debugger::pty_debugger() : impl_(std::make_unique<impl>()) {}
pty_debugger::~pty_debugger() = default;

pty_debugger::pty_debugger(pty_debugger&&) noexcept = default;
pty_debugger& pty_debugger::operator=(pty_debugger&&) noexcept = default;

spawn_status pty_debugger::spawn(const spawn_request& request) { return impl_->spawn(request); }
bool pty_debugger::alive() { return impl_->alive(); }
bool pty_debugger::readable(std::chrono::milliseconds timeout) { return impl_->readable(timeout); }
std::ptrdiff_t pty_debugger::read(std::span<std::byte> out) { return impl_->read(out); }
std::ptrdiff_t pty_debugger::write(std::span<const std::byte> data) { return impl_->write(data); }
void pty_debugger::terminate() { impl_->terminate(); }

} // namespace gdbsession
