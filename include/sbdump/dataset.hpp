#pragma once
#include <sbdump/error.hpp>
#include <sbdump/records.hpp>
#include <sbdump/store.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sbdump {

// One fully decoded list: add prefixes filled from .pset and every record
// sequence in canonical order.
struct ListDataset {
  std::string name;
  StoreHeader header;
  Md5Digest checksum{};
  std::set<uint32_t> add_chunks;
  std::set<uint32_t> sub_chunks;
  std::vector<AddPrefix> add_prefixes;
  std::vector<SubPrefix> sub_prefixes;
  std::vector<AddComplete> add_completes;
  std::vector<SubComplete> sub_completes;
};

// prefixes[i] goes to pending[i] (store order). Sizes must match, else
// FormatError(PrefixCountMismatch).
std::vector<AddPrefix>
fill_add_prefixes(const std::vector<PendingAddPrefix> &pending,
                  const std::vector<uint32_t> &prefixes);

// Stable sorts:
//   add prefixes   (prefix, add_chunk)
//   sub prefixes   (prefix, sub_chunk, add_chunk)
//   add completes  (hash, add_chunk)
//   sub completes  (hash, sub_chunk, add_chunk)
void sort_records(ListDataset &ds);

ListDataset assemble_list(std::string name, StoreContents store,
                          const std::vector<uint32_t> &prefixes);

struct DecodeOptions {
  bool verify_checksum = false;
};

struct DecodeResult {
  std::optional<ListDataset> dataset;
  std::optional<FormatError> error;

  bool ok() const { return dataset.has_value(); }
};

// Never throws on malformed input; the failure is returned in `error`.
DecodeResult decode_list(std::string name,
                         const std::vector<uint8_t> &store_bytes,
                         const std::vector<uint8_t> &pset_bytes,
                         const DecodeOptions &opts = {});

} // namespace sbdump
