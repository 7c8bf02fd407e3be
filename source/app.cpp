#include <sbdump/app.hpp>
#include <sbdump/cli.hpp>
#include <sbdump/dataset.hpp>
#include <sbdump/report.hpp>
#include <sbdump/scanner.hpp>
#include <sbdump/thread_pool.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#ifndef SBDUMP_VERSION
#define SBDUMP_VERSION "unknown"
#endif

namespace sbdump {

static void print_help() {
  std::cout <<
      R"(sbdump - dump Safe Browsing database files (.sbstore + .pset)

Usage:
  sbdump [options] <sbstore_dir>

  <sbstore_dir> is usually the 'safebrowsing' directory of a browser profile.

Options:
  -v, --verbose          list database contents (prefixes/completes) in hex
  -n, --dry              dry run: list available databases and quit
  --name NAME            process only the list named NAME
  --verify-checksum      recompute the MD5 of each .sbstore and compare
  --fail-fast            stop at the first list that fails to decode
  -j, --jobs N           decode up to N lists concurrently (env SBDUMP_JOBS)
  --log-level LEVEL      trace|debug|info|warn|error|critical|off
                         (env SBDUMP_LOG_LEVEL, default info)
  -h, --help             show this help
  --version              show version
)";
}

namespace {

struct Outcome {
  std::optional<ListDataset> dataset;
  std::string error;
};

Outcome decode_one(const ListFiles &lf, const DecodeOptions &opts) {
  Outcome o;
  try {
    const auto store = read_file(lf.store_path);
    const auto pset = read_file(lf.prefix_set_path);
    spdlog::debug("[list={}] sbstore {} bytes, pset {} bytes", lf.name,
                  store.size(), pset.size());
    auto r = decode_list(lf.name, store, pset, opts);
    if (r.ok())
      o.dataset = std::move(r.dataset);
    else
      o.error = r.error->what();
  } catch (const std::exception &e) {
    o.error = e.what();
  }
  return o;
}

} // namespace

int run_dump(const DumpConfig &cfg, std::ostream &out) {
  std::vector<ListFiles> lists;
  try {
    lists = scan_lists(cfg.dir, cfg.name);
  } catch (const std::exception &e) {
    spdlog::error("[scan] {}", e.what());
    return 1;
  }
  if (lists.empty()) {
    if (cfg.name.empty())
      spdlog::warn("[scan] no {} files in {}", kStoreSuffix, cfg.dir);
    else
      spdlog::warn("[scan] no list named '{}' in {}", cfg.name, cfg.dir);
    return 0;
  }

  if (cfg.dry) {
    for (const auto &lf : lists)
      out << "- Reading sbstore: " << lf.name << "\n";
    return 0;
  }

  DecodeOptions opts;
  opts.verify_checksum = cfg.verify_checksum;

  std::vector<Outcome> outcomes(lists.size());
  if (cfg.jobs > 1 && lists.size() > 1) {
    ThreadPool pool(std::min<unsigned>(cfg.jobs, lists.size()));
    for (size_t i = 0; i < lists.size(); ++i)
      pool.submit([&, i] { outcomes[i] = decode_one(lists[i], opts); });
    pool.wait_idle();
  }

  int failed = 0;
  for (size_t i = 0; i < lists.size(); ++i) {
    const ListFiles &lf = lists[i];
    out << "- Reading sbstore: " << lf.name << "\n";
    if (cfg.jobs <= 1 || lists.size() == 1)
      outcomes[i] = decode_one(lf, opts);

    Outcome &o = outcomes[i];
    if (!o.dataset) {
      spdlog::error("[list={}] {}", lf.name, o.error);
      ++failed;
      if (cfg.fail_fast)
        break;
      continue;
    }
    print_list(out, *o.dataset, cfg.verbose);
    out << "\n";
    o.dataset.reset();
  }

  if (failed)
    spdlog::error("{} of {} list(s) failed to decode", failed, lists.size());
  return failed ? 1 : 0;
}

int App::run(int argc, char **argv) {
  if (!spdlog::get("sbdump"))
    spdlog::set_default_logger(spdlog::stderr_color_mt("sbdump"));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    print_help();
    return 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;
        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("sbdump {}\n", SBDUMP_VERSION);
          return 0;
        } else {
          spdlog::set_level(spdlog::level::from_str(c.cfg.log_level));
          spdlog::debug("dir={} name={} verbose={} dry={} verify={} jobs={}",
                        c.cfg.dir, c.cfg.name.empty() ? "<ALL>" : c.cfg.name,
                        c.cfg.verbose, c.cfg.dry, c.cfg.verify_checksum,
                        c.cfg.jobs);
          return run_dump(c.cfg, std::cout);
        }
      },
      *pr.cmd);
}

} // namespace sbdump
