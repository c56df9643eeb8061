#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace gdbsession {

// Operator-facing severity. Distinct from log_level, which is what clients see.
enum class operator_level { debug, info, warning, error };

std::string_view to_string(operator_level level);

// The library never prints. Hosts install a sink to receive diagnostics.
using log_sink = std::function<void(operator_level, std::string_view)>;

// ISO-8601 UTC with microseconds, e.g. 2024-05-01T12:00:00.000123+00:00.
std::string utc_timestamp();

} // namespace gdbsession
