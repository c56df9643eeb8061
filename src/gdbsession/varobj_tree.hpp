#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gdbsession/mi/mi_types.hpp"
#include "gdbsession/model.hpp"

namespace gdbsession {

// Mirrors the GDB variable objects created during the current pause.
// Every transition into Running invalidates the whole tree.
class varobj_tree {
public:
  enum class request_kind { create, list_children };

  struct pending_request {
    request_kind kind = request_kind::create;
    std::string expression;
    std::string handle;
    uint64_t epoch = 0;
    bool expand = false;
  };

  struct children_reply {
    std::string handle;
    std::string expression;
    std::vector<var_object> children;
  };

  struct created_reply {
    var_object object;
    bool expand = false;
  };

  uint64_t epoch() const { return epoch_; }

  const var_object* by_expression(std::string_view expression) const;
  const var_object* by_handle(std::string_view handle) const;
  // Resolves a root expression first, then any known handle.
  const var_object* resolve(std::string_view name) const;
  std::optional<std::vector<var_object>> cached_children(std::string_view handle) const;
  bool is_expanded(std::string_view handle) const;

  void expect_create(uint64_t token, std::string expression, bool expand);
  void expect_children(uint64_t token, std::string handle);
  bool is_pending(uint64_t token) const;
  bool create_pending(std::string_view expression) const;

  // Both return nothing for tokens from an older epoch or unknown tokens.
  std::optional<created_reply> on_created(uint64_t token, const mi::mi_results& results);
  std::optional<children_reply> on_children(uint64_t token, const mi::mi_results& results);
  // Returns the request the error belongs to, or nothing when it is stale.
  std::optional<pending_request> on_error(uint64_t token);

  bool collapse(std::string_view name);

  // Drops every handle, cached child list and pending request and starts a new
  // epoch. Returns the root handles so the owner can release them in GDB.
  std::vector<std::string> invalidate();

  size_t size() const { return nodes_.size(); }
  size_t pending() const { return pending_.size(); }

private:
  struct node {
    var_object object;
    bool listed = false;
    bool expanded = false;
    std::vector<std::string> children;
  };

  uint64_t epoch_ = 0;
  std::map<std::string, node, std::less<>> nodes_;
  std::map<std::string, std::string, std::less<>> roots_;
  std::map<uint64_t, pending_request> pending_;

  std::optional<pending_request> take(uint64_t token, request_kind kind);
};

} // namespace gdbsession
