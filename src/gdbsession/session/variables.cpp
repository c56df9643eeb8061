#include "gdbsession/session/session.hpp"

#include "gdbsession/mi/mi_commands.hpp"

namespace gdbsession {

void session::do_var_create(const action_request& request) {
  if (require_frame("var_create") != action_status::accepted) {
    return;
  }
  const auto& expression = request.expression;
  if (varobjs_.by_expression(expression)) {
    send_error("var_create: variable object for " + expression + " already exists");
    return;
  }
  if (varobjs_.create_pending(expression)) {
    send_error("var_create: variable object for " + expression + " is already being created");
    return;
  }
  if (auto token = send(mi::commands::var_create(expression), request_kind::var_create)) {
    varobjs_.expect_create(*token, expression, false);
  }
}

void session::do_var_list_children(const action_request& request) {
  if (require_frame("var_list_children") != action_status::accepted) {
    return;
  }
  if (!varobjs_.by_handle(request.name)) {
    send_error("var_list_children: unknown variable object " + request.name);
    return;
  }
  if (auto token = send(mi::commands::var_list_children(request.name), request_kind::var_children)) {
    varobjs_.expect_children(*token, request.name);
  }
}

void session::do_var_expand(const action_request& request) {
  if (require_frame("var_expand") != action_status::accepted) {
    return;
  }

  const auto* object = varobjs_.resolve(request.expression);
  if (!object) {
    if (varobjs_.create_pending(request.expression)) {
      return;
    }
    if (auto token = send(mi::commands::var_create(request.expression), request_kind::var_create)) {
      varobjs_.expect_create(*token, request.expression, true);
    }
    return;
  }

  if (auto cached = varobjs_.cached_children(object->handle)) {
    publish(messages::var_children(object->handle, object->expression, *cached));
    return;
  }
  if (object->numchild == 0) {
    publish(messages::var_children(object->handle, object->expression, {}));
    return;
  }

  auto handle = object->handle;
  if (auto token = send(mi::commands::var_list_children(handle), request_kind::var_children)) {
    varobjs_.expect_children(*token, handle);
  }
}

void session::do_var_collapse(const action_request& request) {
  if (!varobjs_.collapse(request.expression)) {
    send_error("var_collapse: unknown variable object " + request.expression);
  }
}

void session::on_var_result(uint64_t token, request_kind kind, const mi::result_record& record) {
  const char* name = kind == request_kind::var_create ? "var_create" : "var_list_children";

  if (record.cls == mi::result_class::error) {
    if (varobjs_.on_error(token)) {
      send_error(std::string(name) + ": " + mi::decode_error_message(record.results));
    }
    return;
  }

  if (kind == request_kind::var_create) {
    auto reply = varobjs_.on_created(token, record.results);
    if (!reply) {
      trace(operator_level::debug, "dropping stale var_create reply");
      // GDB still created the object; nothing refers to it any more.
      if (auto orphan = mi::decode_var_created(record.results, {})) {
        send(mi::commands::var_delete(orphan->handle), request_kind::var_delete);
      }
      return;
    }
    publish(messages::var_created(reply->object));
    if (!reply->expand) {
      return;
    }
    if (reply->object.numchild == 0) {
      publish(messages::var_children(reply->object.handle, reply->object.expression, {}));
      return;
    }
    if (auto next = send(mi::commands::var_list_children(reply->object.handle), request_kind::var_children)) {
      varobjs_.expect_children(*next, reply->object.handle);
    }
    return;
  }

  auto reply = varobjs_.on_children(token, record.results);
  if (!reply) {
    trace(operator_level::debug, "dropping stale var_list_children reply");
    return;
  }
  publish(messages::var_children(reply->handle, reply->expression, reply->children));
}

void session::release_varobjs() {
  for (const auto& handle : varobjs_.invalidate()) {
    if (!send(mi::commands::var_delete(handle), request_kind::var_delete)) {
      break;
    }
  }
}

} // namespace gdbsession
