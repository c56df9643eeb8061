#include "gdbsession/mi/mi_types.hpp"

namespace gdbsession::mi {

const mi_value* mi_value::find(std::string_view name) const {
  if (type == kind::string) {
    return nullptr;
  }
  return find_result(items, name);
}

std::optional<std::string> mi_value::string_of(std::string_view name) const {
  if (type == kind::string) {
    return std::nullopt;
  }
  return find_string(items, name);
}

const mi_value* find_result(const mi_results& results, std::string_view name) {
  for (const auto& result : results) {
    if (result.name == name) {
      return &result.value;
    }
  }
  return nullptr;
}

std::optional<std::string> find_string(const mi_results& results, std::string_view name) {
  const auto* value = find_result(results, name);
  if (!value || !value->is_string()) {
    return std::nullopt;
  }
  return value->text;
}

std::string_view to_string(result_class cls) {
  switch (cls) {
  case result_class::done:
    return "done";
  case result_class::running:
    return "running";
  case result_class::connected:
    return "connected";
  case result_class::error:
    return "error";
  case result_class::exit:
    return "exit";
  }
  return "done";
}

std::string_view to_string(async_kind kind) {
  switch (kind) {
  case async_kind::exec:
    return "exec";
  case async_kind::status:
    return "status";
  case async_kind::notify:
    return "notify";
  }
  return "exec";
}

std::string_view to_string(stream_kind kind) {
  switch (kind) {
  case stream_kind::console:
    return "console";
  case stream_kind::target:
    return "target";
  case stream_kind::log:
    return "log";
  }
  return "console";
}

} // namespace gdbsession::mi
