#include "gdbsession/breakpoint_registry.hpp"

#include <algorithm>

#include "gdbsession/mi/hex.hpp"

namespace gdbsession {

namespace {

bool line_matches(int expected, int requested, int reported) {
  return expected == requested || (reported != 0 && expected == reported);
}

// Location key GDB reports for a breakpoint, preferring what the client asked for.
location_key key_of(const mi::breakpoint_info& info) {
  if (info.bp.line == 0 && !info.original_location.empty()) {
    if (auto parsed = parse_location(info.original_location)) {
      return *parsed;
    }
  }
  location_key key;
  key.file = info.bp.file.empty() ? info.bp.fullname : info.bp.file;
  key.line = info.bp.line;
  return key;
}

bool key_matches_info(const location_key& key, const mi::breakpoint_info& info) {
  if (!info.original_location.empty() && info.original_location == format_location(key)) {
    return true;
  }
  if (key.line == 0 || info.bp.line != key.line) {
    return false;
  }
  return paths_equivalent(key.file, info.bp.file) || paths_equivalent(key.file, info.bp.fullname);
}

} // namespace

std::optional<location_key> parse_location(std::string_view location) {
  while (!location.empty() && (location.front() == ' ' || location.front() == '\t')) {
    location.remove_prefix(1);
  }
  while (!location.empty() && (location.back() == ' ' || location.back() == '\t')) {
    location.remove_suffix(1);
  }
  if (location.empty()) {
    return std::nullopt;
  }

  auto colon = location.rfind(':');
  if (colon != std::string_view::npos && colon > 0) {
    int line = 0;
    if (mi::parse_dec_int(location.substr(colon + 1), line)) {
      if (line <= 0) {
        return std::nullopt;
      }
      return location_key{std::string(location.substr(0, colon)), line};
    }
  }
  return location_key{std::string(location), 0};
}

std::string format_location(const location_key& key) {
  if (key.line == 0) {
    return key.file;
  }
  return key.file + ":" + std::to_string(key.line);
}

bool paths_equivalent(std::string_view a, std::string_view b) {
  if (a.empty() || b.empty()) {
    return false;
  }
  if (a == b) {
    return true;
  }
  auto shorter = a.size() < b.size() ? a : b;
  auto longer = a.size() < b.size() ? b : a;
  if (!longer.ends_with(shorter)) {
    return false;
  }
  if (shorter.front() == '/') {
    return true;
  }
  return longer[longer.size() - shorter.size() - 1] == '/';
}

std::string_view to_string(breakpoint_state state) {
  switch (state) {
  case breakpoint_state::pending:
    return "pending";
  case breakpoint_state::live:
    return "live";
  case breakpoint_state::unbound:
    return "unbound";
  }
  return "unbound";
}

bool breakpoint_entry::matches(const location_key& other) const {
  if (key.line == 0 || other.line == 0) {
    return key.line == other.line && key.file == other.file;
  }
  if (!line_matches(other.line, key.line, reported_line)) {
    return false;
  }
  return paths_equivalent(other.file, key.file) || paths_equivalent(other.file, reported_file) ||
         paths_equivalent(other.file, fullname);
}

breakpoint breakpoint_entry::view() const {
  breakpoint bp;
  bp.id = id;
  bp.file = key.line == 0 && !reported_file.empty() ? reported_file : key.file;
  bp.fullname = fullname;
  bp.line = reported_line != 0 ? reported_line : key.line;
  return bp;
}

breakpoint_registry::toggle_result breakpoint_registry::toggle(const location_key& key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& entry) { return entry.matches(key); });
  if (it == entries_.end()) {
    return {toggle_kind::insert, {}};
  }

  switch (it->state) {
  case breakpoint_state::live: {
    toggle_result result{toggle_kind::remove_live, it->id};
    entries_.erase(it);
    return result;
  }
  case breakpoint_state::pending:
    it->cancel_on_confirm = !it->cancel_on_confirm;
    return {it->cancel_on_confirm ? toggle_kind::cancel_pending : toggle_kind::restore_pending, {}};
  case breakpoint_state::unbound:
    entries_.erase(it);
    return {toggle_kind::drop_unbound, {}};
  }
  return {toggle_kind::insert, {}};
}

void breakpoint_registry::add_pending(const location_key& key, uint64_t token,
                                      std::chrono::steady_clock::time_point deadline) {
  breakpoint_entry* entry = find_mutable(key);
  if (!entry) {
    entries_.push_back(breakpoint_entry{});
    entry = &entries_.back();
    entry->key = key;
  }
  entry->state = breakpoint_state::pending;
  entry->id.clear();
  entry->token = token;
  entry->deadline = deadline;
  entry->cancel_on_confirm = false;
}

void breakpoint_registry::add_unbound(const location_key& key) {
  if (find_mutable(key)) {
    return;
  }
  breakpoint_entry entry;
  entry.key = key;
  entries_.push_back(std::move(entry));
}

breakpoint_registry::confirmation breakpoint_registry::confirm(uint64_t token, const mi::breakpoint_info& info) {
  if (timed_out_.erase(token) > 0) {
    return {confirm_kind::stale, info.bp};
  }
  if (settled_tokens_.erase(token) > 0) {
    return {confirm_kind::ignored, {}};
  }
  if (auto* entry = find_token(token)) {
    auto result = settle(*entry, info);
    settled_tokens_.erase(token);
    return result;
  }
  if (id_known(info.bp.id)) {
    return {confirm_kind::ignored, {}};
  }
  return {confirm_kind::stale, info.bp};
}

breakpoint_registry::confirmation breakpoint_registry::notify_created(const mi::breakpoint_info& info) {
  if (id_known(info.bp.id)) {
    return {confirm_kind::ignored, {}};
  }

  for (auto& entry : entries_) {
    if (entry.state == breakpoint_state::pending && key_matches_info(entry.key, info)) {
      return settle(entry, info);
    }
  }

  for (auto it = timed_out_.begin(); it != timed_out_.end(); ++it) {
    if (key_matches_info(it->second, info)) {
      settled_tokens_.insert(it->first);
      timed_out_.erase(it);
      return {confirm_kind::stale, info.bp};
    }
  }

  // Created from the console: adopt it if its location is free.
  auto key = key_of(info);
  if (key.file.empty() || find(key)) {
    return {confirm_kind::ignored, {}};
  }
  breakpoint_entry entry;
  entry.key = key;
  entry.state = breakpoint_state::live;
  entry.id = info.bp.id;
  entry.reported_file = info.bp.file;
  entry.fullname = info.bp.fullname;
  entry.reported_line = info.bp.line;
  entries_.push_back(std::move(entry));
  return {confirm_kind::live, entries_.back().view()};
}

bool breakpoint_registry::notify_deleted(std::string_view id) { return remove(id); }

bool breakpoint_registry::reject(uint64_t token) {
  // A timed-out request was already reported.
  if (timed_out_.erase(token) > 0) {
    return false;
  }
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const auto& entry) { return entry.token == token; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

std::vector<location_key> breakpoint_registry::expire(std::chrono::steady_clock::time_point now) {
  std::vector<location_key> expired;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->state == breakpoint_state::pending && it->token && it->deadline <= now) {
      timed_out_.emplace(*it->token, it->key);
      expired.push_back(it->key);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  while (timed_out_.size() > k_timed_out_limit) {
    timed_out_.erase(timed_out_.begin());
  }
  return expired;
}

bool breakpoint_registry::remove(std::string_view id) {
  if (id.empty()) {
    return false;
  }
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const auto& entry) { return entry.state == breakpoint_state::live && entry.id == id; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

void breakpoint_registry::unbind_all() {
  std::erase_if(entries_, [](const auto& entry) { return entry.cancel_on_confirm; });
  for (auto& entry : entries_) {
    entry.state = breakpoint_state::unbound;
    entry.id.clear();
    entry.token.reset();
  }
  timed_out_.clear();
  settled_tokens_.clear();
}

std::vector<location_key> breakpoint_registry::unbound_keys() const {
  std::vector<location_key> keys;
  for (const auto& entry : entries_) {
    if (entry.state == breakpoint_state::unbound) {
      keys.push_back(entry.key);
    }
  }
  return keys;
}

std::vector<breakpoint> breakpoint_registry::live() const {
  std::vector<breakpoint> out;
  for (const auto& entry : entries_) {
    if (entry.state == breakpoint_state::live) {
      out.push_back(entry.view());
    }
  }
  return out;
}

const breakpoint_entry* breakpoint_registry::find(const location_key& key) const {
  for (const auto& entry : entries_) {
    if (entry.matches(key)) {
      return &entry;
    }
  }
  return nullptr;
}

const breakpoint_entry* breakpoint_registry::find_id(std::string_view id) const {
  for (const auto& entry : entries_) {
    if (!entry.id.empty() && entry.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

breakpoint_entry* breakpoint_registry::find_mutable(const location_key& key) {
  for (auto& entry : entries_) {
    if (entry.matches(key)) {
      return &entry;
    }
  }
  return nullptr;
}

breakpoint_entry* breakpoint_registry::find_token(uint64_t token) {
  for (auto& entry : entries_) {
    if (entry.token == token) {
      return &entry;
    }
  }
  return nullptr;
}

bool breakpoint_registry::id_known(std::string_view id) const { return find_id(id) != nullptr; }

const breakpoint_entry* breakpoint_registry::live_at(const breakpoint_entry& except, const breakpoint& site) const {
  if (site.line == 0) {
    return nullptr;
  }
  for (const auto& entry : entries_) {
    if (&entry == &except || entry.state != breakpoint_state::live) {
      continue;
    }
    auto existing = entry.view();
    if (existing.line != site.line) {
      continue;
    }
    if (paths_equivalent(entry.fullname, site.fullname) || paths_equivalent(entry.reported_file, site.file) ||
        paths_equivalent(existing.file, site.file) || paths_equivalent(existing.file, site.fullname)) {
      return &entry;
    }
  }
  return nullptr;
}

breakpoint_registry::confirmation breakpoint_registry::settle(breakpoint_entry& entry,
                                                              const mi::breakpoint_info& info) {
  if (entry.token) {
    settled_tokens_.insert(*entry.token);
  }
  entry.token.reset();
  entry.id = info.bp.id;
  entry.reported_file = info.bp.file;
  entry.fullname = info.bp.fullname;
  entry.reported_line = info.bp.line;

  auto drop = [&](confirm_kind kind, std::string existing_id) {
    breakpoint bp = entry.view();
    entries_.erase(entries_.begin() + (&entry - entries_.data()));
    return confirmation{kind, std::move(bp), std::move(existing_id)};
  };

  if (entry.cancel_on_confirm) {
    return drop(confirm_kind::cancelled, {});
  }
  // GDB moves a breakpoint on a line without code to the next one that has
  // code, which may already carry a live breakpoint.
  if (const auto* existing = live_at(entry, info.bp)) {
    return drop(confirm_kind::duplicate, existing->id);
  }

  entry.state = breakpoint_state::live;
  return {confirm_kind::live, entry.view()};
}

} // namespace gdbsession
