#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gdbsession::mi {

struct mi_result;

// An MI value: a c-string constant, a tuple `{...}` or a list `[...]`.
// Lists may hold bare values (empty names) or named results; GDB emits
// duplicate names inside lists (children=[child={..},child={..}]).
struct mi_value {
  enum class kind { string, tuple, list };

  kind type = kind::string;
  std::string text;
  std::vector<mi_result> items;

  bool is_string() const { return type == kind::string; }
  bool is_tuple() const { return type == kind::tuple; }
  bool is_list() const { return type == kind::list; }

  const mi_value* find(std::string_view name) const;
  std::optional<std::string> string_of(std::string_view name) const;
};

struct mi_result {
  std::string name;
  mi_value value;
};

using mi_results = std::vector<mi_result>;

const mi_value* find_result(const mi_results& results, std::string_view name);
std::optional<std::string> find_string(const mi_results& results, std::string_view name);

enum class result_class { done, running, connected, error, exit };

enum class async_kind { exec, status, notify };

enum class stream_kind { console, target, log };

struct result_record {
  std::optional<uint64_t> token;
  result_class cls = result_class::done;
  mi_results results;
};

struct async_record {
  std::optional<uint64_t> token;
  async_kind kind = async_kind::exec;
  std::string async_class;
  mi_results results;
};

struct stream_record {
  stream_kind kind = stream_kind::console;
  std::string text;
};

struct prompt_record {};

using record = std::variant<result_record, async_record, stream_record, prompt_record>;

std::string_view to_string(result_class cls);
std::string_view to_string(async_kind kind);
std::string_view to_string(stream_kind kind);

} // namespace gdbsession::mi
