#include <sbdump/config.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>

namespace sbdump {

std::optional<unsigned> parse_jobs(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  errno = 0;
  char *end = nullptr;
  const unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0' || v == 0 || v > 1024 ||
      s.front() == '-')
    return std::nullopt;
  return static_cast<unsigned>(v);
}

bool is_log_level(const std::string &s) {
  static const char *const names[] = {"trace", "debug",    "info", "warn",
                                      "warning", "err", "error", "critical",
                                      "off"};
  for (const char *n : names)
    if (s == n)
      return true;
  return false;
}

DumpConfig config_from_env() {
  DumpConfig cfg;
  if (const char *e = std::getenv("SBDUMP_JOBS")) {
    if (auto j = parse_jobs(e))
      cfg.jobs = *j;
    else
      spdlog::warn("ignoring SBDUMP_JOBS={}", e);
  }
  if (const char *e = std::getenv("SBDUMP_LOG_LEVEL")) {
    if (is_log_level(e))
      cfg.log_level = e;
    else
      spdlog::warn("ignoring SBDUMP_LOG_LEVEL={}", e);
  }
  return cfg;
}

} // namespace sbdump
