#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "gdbsession/breakpoint_registry.hpp"
#include "gdbsession/channel/broadcaster.hpp"
#include "gdbsession/debugger/debugger_io.hpp"
#include "gdbsession/log.hpp"
#include "gdbsession/memory_reader.hpp"
#include "gdbsession/mi/mi_codec.hpp"
#include "gdbsession/mi/mi_payloads.hpp"
#include "gdbsession/model.hpp"
#include "gdbsession/protocol/messages.hpp"
#include "gdbsession/varobj_tree.hpp"

namespace gdbsession {

using debugger_factory = std::function<std::unique_ptr<debugger_io>()>;

struct session_options {
  std::string gdb_path = "gdb";
  std::vector<std::string> gdb_args;
  std::chrono::milliseconds breakpoint_timeout{5000};
  std::chrono::milliseconds poll_interval{50};
  size_t max_memory_read = k_default_max_memory_read;
  size_t log_history = 50;
  size_t log_replay = 10;
  // Defaults to a pty_debugger.
  debugger_factory make_debugger;
  log_sink sink;
};

// Outcome of validating an action against the current state.
enum class action_status { accepted, rejected };

// One debugging session: a debugger process plus the state rebuilt from its
// output. All state is owned by a single worker that calls poll(); other
// threads only submit work.
class session {
public:
  session(std::string id, session_options options);
  ~session();

  session(const session&) = delete;
  session& operator=(const session&) = delete;

  const std::string& id() const { return id_; }

  // Thread-safe entry points.
  void submit(action_request request);
  void attach(std::shared_ptr<channel> target);
  void detach(const channel* target);

  void start();
  void shutdown();
  bool poll(std::chrono::milliseconds timeout);

  // Thread-safe observers.
  session_status status() const { return published_status_.load(); }
  bool has_debugger() const { return debugger_running_.load(); }
  bool discarded() const { return discarded_.load(); }
  size_t subscribers() const { return broadcaster_.subscribers(); }
  std::chrono::steady_clock::time_point idle_since() const { return broadcaster_.idle_since(); }

  // Worker-side views.
  const state_snapshot& snapshot() const { return snapshot_; }
  const breakpoint_registry& breakpoints() const { return breakpoints_; }
  const varobj_tree& varobjs() const { return varobjs_; }
  const memory_reader& memory() const { return memory_; }
  const std::deque<log_entry>& logs() const { return logs_; }
  bool exec_in_flight() const { return exec_in_flight_; }
  analysis_context build_analysis_context() const;

private:
  enum class request_kind { exec, stack, variables, break_insert, break_delete, var_create, var_children, var_delete, memory, ignore };

  struct pending_command {
    request_kind kind = request_kind::ignore;
    uint64_t generation = 0;
  };

  struct attach_request {
    std::shared_ptr<channel> target;
  };

  using work_item = std::variant<action_request, attach_request>;

  struct stop_fetch {
    uint64_t generation = 0;
    bool active = false;
    bool stack_done = false;
    bool variables_done = false;
  };

  std::string id_;
  session_options options_;
  broadcaster broadcaster_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<work_item> queue_;

  std::thread worker_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> discarded_{false};
  std::atomic<bool> debugger_running_{false};
  std::atomic<session_status> published_status_{session_status::ready};

  std::unique_ptr<debugger_io> debugger_;
  mi::record_parser parser_;
  uint64_t next_token_ = 1;
  std::map<uint64_t, pending_command> pending_;

  state_snapshot snapshot_;
  std::optional<stop_description> last_stop_;
  std::string executable_;
  bool exec_in_flight_ = false;
  uint64_t fetch_generation_ = 0;
  stop_fetch fetch_;

  breakpoint_registry breakpoints_;
  varobj_tree varobjs_;
  memory_reader memory_;
  std::deque<log_entry> logs_;

  // core.cpp
  void worker_loop();
  bool drain_queue();
  bool read_debugger(std::chrono::milliseconds timeout);
  std::optional<uint64_t> send(const mi::mi_command& command, request_kind kind, uint64_t generation = 0);
  void teardown_debugger(bool graceful);
  void debugger_lost();
  void set_status(session_status status);
  void trace(operator_level level, std::string_view text) const;

  // dispatch.cpp
  void handle_item(work_item& item);
  void handle_attach(const std::shared_ptr<channel>& target);
  void handle_action(const action_request& request);
  action_status require_debugger(std::string_view action);
  action_status require_frame(std::string_view action);
  void do_init(const action_request& request);
  void do_run(const action_request& request);
  void do_resume(const action_request& request);
  void do_stop();
  void do_discard();

  // records.cpp
  void process_record(mi::record& record);
  void on_result(const mi::result_record& record);
  void on_exec_async(const mi::async_record& record);
  void on_notify(const mi::async_record& record);
  void on_stream(const mi::stream_record& record);
  void on_exec_result(const mi::result_record& record);
  void enter_running();
  void on_stopped(const mi::stop_event& event);
  void begin_fetch();
  void on_fetch_result(request_kind kind, uint64_t generation, const mi::result_record& record);
  void clear_frame_state();

  // breakpoints.cpp
  void do_toggle_breakpoint(const action_request& request);
  void do_remove_breakpoint(const action_request& request);
  void on_break_insert_result(uint64_t token, const mi::result_record& record);
  void on_breakpoint_confirmed(const breakpoint_registry::confirmation& confirmation);
  void replay_breakpoints();
  void expire_breakpoints(std::chrono::steady_clock::time_point now);

  // variables.cpp
  void do_var_create(const action_request& request);
  void do_var_list_children(const action_request& request);
  void do_var_expand(const action_request& request);
  void do_var_collapse(const action_request& request);
  void on_var_result(uint64_t token, request_kind kind, const mi::result_record& record);
  void release_varobjs();

  // memory.cpp
  void do_read_memory(const action_request& request);
  void on_memory_result(uint64_t token, const mi::result_record& record);

  // publish.cpp
  void publish_state();
  void publish(const std::string& message);
  void add_log(log_level level, std::string text);
  void send_error(std::string text);
  void replay_to(const std::shared_ptr<channel>& target);
};

} // namespace gdbsession
