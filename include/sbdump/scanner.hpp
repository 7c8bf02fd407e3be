#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sbdump {

struct ListFiles {
  std::string name;
  std::filesystem::path store_path;      // <dir>/<name>.sbstore
  std::filesystem::path prefix_set_path; // <dir>/<name>.pset, may be missing
};

inline constexpr const char *kStoreSuffix = ".sbstore";
inline constexpr const char *kPrefixSetSuffix = ".pset";

// All *.sbstore files in `dir`, sorted by list name. A non-empty
// `name_filter` keeps only that list. Throws std::runtime_error if `dir`
// is not a readable directory.
std::vector<ListFiles> scan_lists(const std::filesystem::path &dir,
                                  const std::string &name_filter);

std::vector<uint8_t> read_file(const std::filesystem::path &path);

} // namespace sbdump
