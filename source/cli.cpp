#include <sbdump/cli.hpp>

#include <string_view>

namespace sbdump {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  DumpConfig cfg = config_from_env();
  bool have_dir = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "-h" || a == "--help") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }
    if (a == "-v" || a == "--verbose") {
      cfg.verbose = true;
    } else if (a == "-n" || a == "--dry") {
      cfg.dry = true;
    } else if (a == "--verify-checksum") {
      cfg.verify_checksum = true;
    } else if (a == "--fail-fast") {
      cfg.fail_fast = true;
    } else if (a == "--name") {
      if (!has_arg(i, argc)) {
        r.error = "--name: value required";
        return r;
      }
      cfg.name = argv[++i];
    } else if (a.substr(0, 7) == "--name=") {
      cfg.name = std::string(a.substr(7));
    } else if (a == "-j" || a == "--jobs") {
      if (!has_arg(i, argc)) {
        r.error = std::string(a) + ": value required";
        return r;
      }
      auto j = parse_jobs(argv[++i]);
      if (!j) {
        r.error = std::string(a) + ": expected a positive number, got '" +
                  argv[i] + "'";
        return r;
      }
      cfg.jobs = *j;
    } else if (a == "--log-level") {
      if (!has_arg(i, argc)) {
        r.error = "--log-level: value required";
        return r;
      }
      std::string lvl = argv[++i];
      if (!is_log_level(lvl)) {
        r.error = "--log-level: unknown level '" + lvl + "'";
        return r;
      }
      cfg.log_level = lvl;
    } else if (!a.empty() && a.front() == '-') {
      r.error = "unknown option: " + std::string(a);
      return r;
    } else {
      if (have_dir) {
        r.error = "unexpected argument: " + std::string(a);
        return r;
      }
      cfg.dir = std::string(a);
      have_dir = true;
    }
  }

  if (!have_dir) {
    r.error = "sbstore_dir required";
    return r;
  }
  r.cmd = CmdDump{cfg};
  return r;
}

} // namespace sbdump
