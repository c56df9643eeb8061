#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <args.hxx>

#include "gdbsession/gdbsession.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

gdbsession::log_sink make_stderr_sink(bool verbose) {
  auto mutex = std::make_shared<std::mutex>();
  return [mutex, verbose](gdbsession::operator_level level, std::string_view text) {
    if (level == gdbsession::operator_level::debug && !verbose) {
      return;
    }
    std::lock_guard<std::mutex> lock(*mutex);
    std::cerr << gdbsession::utc_timestamp() << " " << gdbsession::to_string(level) << " " << text << "\n";
  };
}

int run_server(const gdbsession::server_options& server_options, const gdbsession::session_options& options,
               std::chrono::seconds grace) {
  gdbsession::session_registry registry(options, grace);
  gdbsession::server server(registry, std::make_unique<gdbsession::transport_tcp>(), server_options, options.sink);
  if (!server.listen()) {
    std::cerr << "failed to listen on " << server_options.listen_address << "\n";
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  std::cout << "gdbsessiond " << gdbsession::version() << "\n";
  std::cout << "listening on " << server_options.listen_address << "\n" << std::flush;

  while (!g_stop) {
    server.poll(std::chrono::milliseconds(100));
  }

  server.stop();
  registry.shutdown();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  args::ArgumentParser parser("gdbsessiond: GDB/MI debug session orchestrator");
  args::HelpFlag help(parser, "help", "display this help menu", {'h', "help"});
  args::ValueFlag<std::string> listen(parser, "addr", "listen address", {'l', "listen"});
  args::ValueFlag<std::string> gdb(parser, "path", "debugger executable", {"gdb"});
  args::ValueFlag<int> grace(parser, "seconds", "idle time before an orphaned session is reclaimed",
                             {"grace-seconds"});
  args::ValueFlag<int> bp_timeout(parser, "ms", "breakpoint confirmation timeout", {"breakpoint-timeout-ms"});
  args::ValueFlag<int> max_memory(parser, "bytes", "largest accepted memory read", {"max-memory"});
  args::Flag verbose(parser, "verbose", "log MI traffic", {'v', "verbose"});

  try {
    parser.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& err) {
    std::cerr << err.what() << "\n";
    std::cerr << parser;
    return 1;
  }

  gdbsession::server_options server_options;
  if (listen) {
    server_options.listen_address = args::get(listen);
  }

  gdbsession::session_options options;
  if (gdb) {
    options.gdb_path = args::get(gdb);
  }
  int grace_seconds = grace ? args::get(grace) : 300;
  int timeout_ms = bp_timeout ? args::get(bp_timeout) : 5000;
  int memory_limit = max_memory ? args::get(max_memory) : static_cast<int>(gdbsession::k_default_max_memory_read);

  if (grace_seconds < 0) {
    std::cerr << "grace-seconds must not be negative\n";
    return 1;
  }
  if (timeout_ms <= 0) {
    std::cerr << "breakpoint-timeout-ms must be positive\n";
    return 1;
  }
  if (memory_limit <= 0) {
    std::cerr << "max-memory must be positive\n";
    return 1;
  }

  options.breakpoint_timeout = std::chrono::milliseconds(timeout_ms);
  options.max_memory_read = static_cast<size_t>(memory_limit);
  options.sink = make_stderr_sink(args::get(verbose));

  return run_server(server_options, options, std::chrono::seconds(grace_seconds));
}
