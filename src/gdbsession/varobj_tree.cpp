#include "gdbsession/varobj_tree.hpp"

#include "gdbsession/mi/mi_payloads.hpp"

namespace gdbsession {

const var_object* varobj_tree::by_expression(std::string_view expression) const {
  auto root = roots_.find(expression);
  if (root == roots_.end()) {
    return nullptr;
  }
  return by_handle(root->second);
}

const var_object* varobj_tree::by_handle(std::string_view handle) const {
  auto it = nodes_.find(handle);
  if (it == nodes_.end()) {
    return nullptr;
  }
  return &it->second.object;
}

const var_object* varobj_tree::resolve(std::string_view name) const {
  if (const auto* object = by_expression(name)) {
    return object;
  }
  return by_handle(name);
}

std::optional<std::vector<var_object>> varobj_tree::cached_children(std::string_view handle) const {
  auto it = nodes_.find(handle);
  if (it == nodes_.end() || !it->second.listed) {
    return std::nullopt;
  }
  std::vector<var_object> children;
  children.reserve(it->second.children.size());
  for (const auto& child : it->second.children) {
    if (const auto* object = by_handle(child)) {
      children.push_back(*object);
    }
  }
  return children;
}

bool varobj_tree::is_expanded(std::string_view handle) const {
  auto it = nodes_.find(handle);
  return it != nodes_.end() && it->second.expanded;
}

void varobj_tree::expect_create(uint64_t token, std::string expression, bool expand) {
  pending_request request;
  request.kind = request_kind::create;
  request.expression = std::move(expression);
  request.epoch = epoch_;
  request.expand = expand;
  pending_[token] = std::move(request);
}

void varobj_tree::expect_children(uint64_t token, std::string handle) {
  pending_request request;
  request.kind = request_kind::list_children;
  if (const auto* object = by_handle(handle)) {
    request.expression = object->expression;
  }
  request.handle = std::move(handle);
  request.epoch = epoch_;
  pending_[token] = std::move(request);
}

bool varobj_tree::is_pending(uint64_t token) const { return pending_.contains(token); }

bool varobj_tree::create_pending(std::string_view expression) const {
  for (const auto& [token, request] : pending_) {
    if (request.kind == request_kind::create && request.expression == expression) {
      return true;
    }
  }
  return false;
}

std::optional<varobj_tree::created_reply> varobj_tree::on_created(uint64_t token, const mi::mi_results& results) {
  auto request = take(token, request_kind::create);
  if (!request) {
    return std::nullopt;
  }
  auto object = mi::decode_var_created(results, request->expression);
  if (!object) {
    return std::nullopt;
  }

  node entry;
  entry.object = *object;
  entry.expanded = request->expand;
  roots_[request->expression] = object->handle;
  nodes_[object->handle] = std::move(entry);
  return created_reply{std::move(*object), request->expand};
}

std::optional<varobj_tree::children_reply> varobj_tree::on_children(uint64_t token, const mi::mi_results& results) {
  auto request = take(token, request_kind::list_children);
  if (!request) {
    return std::nullopt;
  }
  auto parent = nodes_.find(request->handle);
  if (parent == nodes_.end()) {
    return std::nullopt;
  }

  children_reply reply;
  reply.handle = request->handle;
  reply.expression = parent->second.object.expression;
  reply.children = mi::decode_var_children(results, request->handle);

  parent->second.listed = true;
  parent->second.expanded = true;
  parent->second.children.clear();
  for (const auto& child : reply.children) {
    parent->second.children.push_back(child.handle);
    auto existing = nodes_.find(child.handle);
    if (existing == nodes_.end()) {
      node entry;
      entry.object = child;
      nodes_.emplace(child.handle, std::move(entry));
    } else {
      existing->second.object = child;
    }
  }
  return reply;
}

std::optional<varobj_tree::pending_request> varobj_tree::on_error(uint64_t token) {
  auto it = pending_.find(token);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  auto request = std::move(it->second);
  pending_.erase(it);
  if (request.epoch != epoch_) {
    return std::nullopt;
  }
  return request;
}

bool varobj_tree::collapse(std::string_view name) {
  const auto* object = resolve(name);
  if (!object) {
    return false;
  }
  nodes_.find(object->handle)->second.expanded = false;
  return true;
}

std::vector<std::string> varobj_tree::invalidate() {
  std::vector<std::string> released;
  released.reserve(roots_.size());
  for (const auto& [expression, handle] : roots_) {
    released.push_back(handle);
  }
  nodes_.clear();
  roots_.clear();
  pending_.clear();
  ++epoch_;
  return released;
}

std::optional<varobj_tree::pending_request> varobj_tree::take(uint64_t token, request_kind kind) {
  auto it = pending_.find(token);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  auto request = std::move(it->second);
  pending_.erase(it);
  if (request.epoch != epoch_ || request.kind != kind) {
    return std::nullopt;
  }
  return request;
}

} // namespace gdbsession
