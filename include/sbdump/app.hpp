#pragma once
#include <sbdump/config.hpp>

#include <ostream>

namespace sbdump {

class App {
public:
  int run(int argc, char **argv);
};

// Scans cfg.dir, decodes every list and prints the report to `out`.
// Returns 0 on success, 1 if the directory or any list failed.
int run_dump(const DumpConfig &cfg, std::ostream &out);

} // namespace sbdump
