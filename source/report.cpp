#include <sbdump/report.hpp>
#include <sbdump/util.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <set>
#include <string>

namespace sbdump {

static std::string join_chunks(const std::set<uint32_t> &chunks) {
  return fmt::format("{}", fmt::join(chunks, ","));
}

void print_list(std::ostream &out, const ListDataset &ds, bool verbose) {
  const StoreHeader &h = ds.header;
  const std::string &n = ds.name;

  out << fmt::format("[{}] Magic {:X} Version {} NumAddChunk: {} "
                     "NumSubChunk: {} NumAddPrefix: {} NumSubPrefix: {} "
                     "NumAddComplete: {} NumSubComplete: {}\n",
                     n, h.magic, h.version, h.num_add_chunk, h.num_sub_chunk,
                     h.num_add_prefix, h.num_sub_prefix, h.num_add_complete,
                     h.num_sub_complete);

  if (verbose) {
    out << fmt::format("[{}] AddChunks: {}\n", n, join_chunks(ds.add_chunks));
    out << fmt::format("[{}] SubChunks: {}\n", n, join_chunks(ds.sub_chunks));

    for (const auto &p : ds.add_prefixes)
      out << fmt::format("[{}] addPrefix[chunk:{}] {}\n", n, p.add_chunk,
                         hex_prefix(p.prefix));
    for (const auto &p : ds.sub_prefixes)
      out << fmt::format("[{}] subPrefix[chunk:{}] {}\n", n, p.sub_chunk,
                         hex_prefix(p.prefix));
    for (const auto &c : ds.add_completes)
      out << fmt::format("[{}] addComplete[chunk:{}] {}\n", n, c.add_chunk,
                         hex_bytes(c.hash.data(), c.hash.size()));
    for (const auto &c : ds.sub_completes)
      out << fmt::format("[{}] subComplete[chunk:{}]: {}\n", n, c.sub_chunk,
                         hex_bytes(c.hash.data(), c.hash.size()));
  }

  out << fmt::format("[{}] MD5: {}\n", n,
                     hex_bytes(ds.checksum.data(), ds.checksum.size()));
}

} // namespace sbdump
