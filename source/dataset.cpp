#include <sbdump/dataset.hpp>
#include <sbdump/prefix_set.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <tuple>
#include <utility>

namespace sbdump {

std::vector<AddPrefix>
fill_add_prefixes(const std::vector<PendingAddPrefix> &pending,
                  const std::vector<uint32_t> &prefixes) {
  if (prefixes.size() != pending.size()) {
    throw FormatError(FormatErrorKind::PrefixCountMismatch,
                      fmt::format("Prefixes: {} AddPrefixes: {}",
                                  prefixes.size(), pending.size()));
  }
  std::vector<AddPrefix> out;
  out.reserve(pending.size());
  for (size_t i = 0; i < pending.size(); ++i)
    out.push_back(AddPrefix{prefixes[i], pending[i].add_chunk});
  return out;
}

void sort_records(ListDataset &ds) {
  std::stable_sort(ds.add_prefixes.begin(), ds.add_prefixes.end(),
                   [](const AddPrefix &a, const AddPrefix &b) {
                     return std::tie(a.prefix, a.add_chunk) <
                            std::tie(b.prefix, b.add_chunk);
                   });
  std::stable_sort(ds.sub_prefixes.begin(), ds.sub_prefixes.end(),
                   [](const SubPrefix &a, const SubPrefix &b) {
                     return std::tie(a.prefix, a.sub_chunk, a.add_chunk) <
                            std::tie(b.prefix, b.sub_chunk, b.add_chunk);
                   });
  std::stable_sort(ds.add_completes.begin(), ds.add_completes.end(),
                   [](const AddComplete &a, const AddComplete &b) {
                     return std::tie(a.hash, a.add_chunk) <
                            std::tie(b.hash, b.add_chunk);
                   });
  std::stable_sort(ds.sub_completes.begin(), ds.sub_completes.end(),
                   [](const SubComplete &a, const SubComplete &b) {
                     return std::tie(a.hash, a.sub_chunk, a.add_chunk) <
                            std::tie(b.hash, b.sub_chunk, b.add_chunk);
                   });
}

ListDataset assemble_list(std::string name, StoreContents store,
                          const std::vector<uint32_t> &prefixes) {
  ListDataset ds;
  ds.add_prefixes = fill_add_prefixes(store.add_prefixes, prefixes);
  ds.name = std::move(name);
  ds.header = store.header;
  ds.checksum = store.checksum;
  ds.add_chunks = std::move(store.add_chunks);
  ds.sub_chunks = std::move(store.sub_chunks);
  ds.sub_prefixes = std::move(store.sub_prefixes);
  ds.add_completes = std::move(store.add_completes);
  ds.sub_completes = std::move(store.sub_completes);
  sort_records(ds);
  return ds;
}

DecodeResult decode_list(std::string name,
                         const std::vector<uint8_t> &store_bytes,
                         const std::vector<uint8_t> &pset_bytes,
                         const DecodeOptions &opts) {
  DecodeResult r;
  try {
    StoreContents store = parse_store(store_bytes);
    if (opts.verify_checksum)
      verify_store_checksum(store_bytes, store);
    const auto prefixes = decode_prefix_set(pset_bytes);
    r.dataset = assemble_list(std::move(name), std::move(store), prefixes);
  } catch (const FormatError &e) {
    r.error = e;
  }
  return r;
}

} // namespace sbdump
