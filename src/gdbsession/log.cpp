#include "gdbsession/log.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace gdbsession {

std::string_view to_string(operator_level level) {
  switch (level) {
  case operator_level::debug:
    return "debug";
  case operator_level::info:
    return "info";
  case operator_level::warning:
    return "warning";
  case operator_level::error:
    return "error";
  }
  return "info";
}

std::string utc_timestamp() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto seconds = time_point_cast<std::chrono::seconds>(now);
  auto micros = duration_cast<microseconds>(now - seconds).count();

  std::time_t t = system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(micros));
  return buffer;
}

} // namespace gdbsession
