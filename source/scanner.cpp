#include <sbdump/scanner.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sbdump {

static bool ends_with(const std::string &s, const char *suffix) {
  const size_t n = std::strlen(suffix);
  return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

std::vector<ListFiles> scan_lists(const fs::path &dir,
                                  const std::string &name_filter) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    throw std::runtime_error("not a directory: " + dir.string());

  std::vector<ListFiles> out;
  fs::directory_iterator it(dir, ec);
  if (ec)
    throw std::runtime_error("cannot list " + dir.string() + ": " +
                             ec.message());
  for (const auto &e : it) {
    std::error_code fec;
    if (!e.is_regular_file(fec))
      continue;
    const std::string file = e.path().filename().string();
    if (!ends_with(file, kStoreSuffix))
      continue;
    if (file.size() == std::strlen(kStoreSuffix)) {
      spdlog::debug("[scan] skip {}: empty list name", file);
      continue;
    }
    std::string name = file.substr(0, file.size() - std::strlen(kStoreSuffix));
    if (!name_filter.empty() && name != name_filter) {
      spdlog::debug("[scan] skip {} (filter={})", name, name_filter);
      continue;
    }
    ListFiles lf;
    lf.store_path = e.path();
    lf.prefix_set_path = dir / (name + kPrefixSetSuffix);
    lf.name = std::move(name);
    out.push_back(std::move(lf));
  }

  std::sort(out.begin(), out.end(),
            [](const ListFiles &a, const ListFiles &b) { return a.name < b.name; });
  spdlog::debug("[scan] {}: {} list(s)", dir.string(), out.size());
  return out;
}

std::vector<uint8_t> read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("open: " + path.string());
  in.seekg(0, std::ios::end);
  const auto size = in.tellg();
  if (size < 0)
    throw std::runtime_error("tell: " + path.string());
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> buf(static_cast<size_t>(size));
  if (!buf.empty() &&
      !in.read(reinterpret_cast<char *>(buf.data()),
               static_cast<std::streamsize>(buf.size())))
    throw std::runtime_error("read: " + path.string());
  return buf;
}

} // namespace sbdump
