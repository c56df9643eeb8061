#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "gdbsession/mi/mi_payloads.hpp"
#include "gdbsession/model.hpp"

namespace gdbsession {

// `file` is kept as the client spelled it. Locations without a ":line" suffix
// (function names) use line 0 and match on the raw text only.
struct location_key {
  std::string file;
  int line = 0;
};

std::optional<location_key> parse_location(std::string_view location);
std::string format_location(const location_key& key);

// True for identical paths and for paths where one is a suffix of the other
// starting at a '/' boundary ("src/main.c" and "/home/u/src/main.c").
bool paths_equivalent(std::string_view a, std::string_view b);

enum class breakpoint_state { pending, live, unbound };

std::string_view to_string(breakpoint_state state);

struct breakpoint_entry {
  location_key key;
  breakpoint_state state = breakpoint_state::unbound;
  std::string id;
  std::string reported_file;
  std::string fullname;
  int reported_line = 0;
  std::optional<uint64_t> token;
  std::chrono::steady_clock::time_point deadline{};
  bool cancel_on_confirm = false;

  bool matches(const location_key& other) const;
  breakpoint view() const;
};

// Debugger-agnostic bookkeeping for breakpoints. The owner issues the MI
// commands; this class decides which ones and tracks confirmations.
class breakpoint_registry {
public:
  enum class toggle_kind {
    insert,          // send -break-insert, then call add_pending()
    remove_live,     // send -break-delete for `id`
    cancel_pending,  // delete once confirmed
    restore_pending, // a cancelled pending entry is wanted again
    drop_unbound,    // no debugger involvement
  };

  struct toggle_result {
    toggle_kind kind = toggle_kind::insert;
    std::string id;
  };

  enum class confirm_kind {
    live,      // new live breakpoint, broadcast it
    cancelled, // toggled off while pending, delete `bp.id` in the debugger
    stale,     // request already timed out, delete `bp.id` in the debugger
    duplicate, // landed on the site of live breakpoint `existing_id`, delete `bp.id`
    ignored,
  };

  struct confirmation {
    confirm_kind kind = confirm_kind::ignored;
    breakpoint bp;
    std::string existing_id;
  };

  toggle_result toggle(const location_key& key);
  void add_pending(const location_key& key, uint64_t token, std::chrono::steady_clock::time_point deadline);
  // Records a breakpoint requested while no debugger runs; init replays it.
  void add_unbound(const location_key& key);

  confirmation confirm(uint64_t token, const mi::breakpoint_info& info);
  confirmation notify_created(const mi::breakpoint_info& info);
  bool notify_deleted(std::string_view id);
  bool reject(uint64_t token);
  std::vector<location_key> expire(std::chrono::steady_clock::time_point now);

  bool remove(std::string_view id);
  void unbind_all();
  std::vector<location_key> unbound_keys() const;

  std::vector<breakpoint> live() const;
  const breakpoint_entry* find(const location_key& key) const;
  const breakpoint_entry* find_id(std::string_view id) const;
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  // Tokens remembered for replies that have not arrived yet.
  size_t tracked_tokens() const { return timed_out_.size() + settled_tokens_.size(); }

private:
  // Expired requests whose reply may still arrive. Only the newest are kept;
  // an older straggler is treated as stale by confirm() anyway.
  static constexpr size_t k_timed_out_limit = 64;

  std::vector<breakpoint_entry> entries_;
  std::map<uint64_t, location_key> timed_out_;
  std::set<uint64_t> settled_tokens_;

  breakpoint_entry* find_mutable(const location_key& key);
  breakpoint_entry* find_token(uint64_t token);
  bool id_known(std::string_view id) const;
  const breakpoint_entry* live_at(const breakpoint_entry& except, const breakpoint& site) const;
  confirmation settle(breakpoint_entry& entry, const mi::breakpoint_info& info);
};

} // namespace gdbsession
