#include "gdbsession/session/registry.hpp"

namespace gdbsession {

session_registry::session_registry(session_options options, std::chrono::seconds grace_period, bool start_workers)
    : options_(std::move(options)), grace_period_(grace_period), start_workers_(start_workers) {}

session_registry::~session_registry() { shutdown(); }

std::shared_ptr<session> session_registry::get_or_create(const std::string& id) {
  std::shared_ptr<session> created;
  std::shared_ptr<session> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end() && !it->second->discarded()) {
      return it->second;
    }

    created = std::make_shared<session>(id, options_);
    if (start_workers_) {
      created->start();
    }
    if (it != sessions_.end()) {
      previous = std::move(it->second);
      it->second = created;
    } else {
      sessions_.emplace(id, created);
    }
  }

  if (options_.sink) {
    options_.sink(operator_level::info, "created session " + id);
  }
  // A discarded predecessor is joined outside the lock.
  if (previous) {
    previous->shutdown();
  }
  return created;
}

std::shared_ptr<session> session_registry::find(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool session_registry::remove(std::string_view id) {
  std::shared_ptr<session> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      return false;
    }
    removed = std::move(it->second);
    sessions_.erase(it);
  }
  removed->shutdown();
  return true;
}

std::vector<std::string> session_registry::reap(clock::time_point now) {
  std::vector<std::shared_ptr<session>> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      const auto& candidate = it->second;
      bool idle = candidate->subscribers() == 0 && now - candidate->idle_since() >= grace_period_;
      if (candidate->discarded() || (idle && !candidate->has_debugger())) {
        expired.push_back(candidate);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::vector<std::string> ids;
  ids.reserve(expired.size());
  for (auto& candidate : expired) {
    candidate->shutdown();
    ids.push_back(candidate->id());
    if (options_.sink) {
      options_.sink(operator_level::info, "reclaimed session " + candidate->id());
    }
  }
  return ids;
}

void session_registry::shutdown() {
  std::map<std::string, std::shared_ptr<session>, std::less<>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [id, entry] : sessions) {
    entry->shutdown();
  }
}

size_t session_registry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace gdbsession
