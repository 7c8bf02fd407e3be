#pragma once
#include <optional>
#include <string>

namespace sbdump {

struct DumpConfig {
  std::string dir;               // directory holding .sbstore/.pset pairs
  std::string name;              // only this list, empty = all
  bool verbose = false;          // dump every record in hex
  bool dry = false;              // list databases and quit
  bool verify_checksum = false;  // recompute MD5 of each .sbstore
  bool fail_fast = false;        // stop at the first broken list
  unsigned jobs = 1;             // lists decoded concurrently
  std::string log_level = "info";
};

// Defaults overridden by SBDUMP_JOBS / SBDUMP_LOG_LEVEL when set and valid.
DumpConfig config_from_env();

std::optional<unsigned> parse_jobs(const std::string &s);
bool is_log_level(const std::string &s);

} // namespace sbdump
