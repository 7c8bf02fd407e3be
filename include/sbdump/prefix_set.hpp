#pragma once
#include <cstdint>
#include <vector>

namespace sbdump {

// .pset layout, little-endian:
//   uint32 version, index_size, delta_size
//   uint32[index_size] index prefixes   (anchors)
//   uint32[index_size] index starts     (first delta of each anchor's run)
//   uint16[delta_size] deltas
struct PrefixSetIndex {
  uint32_t version = 0;
  std::vector<uint32_t> prefixes;
  std::vector<uint32_t> starts;
  std::vector<uint16_t> deltas;
};

PrefixSetIndex read_prefix_set_index(const std::vector<uint8_t> &bytes);

// Rebuilds the ascending prefix list from anchors + deltas.
// A run whose [start, end) falls outside the delta array throws
// FormatError(InvalidIndex).
std::vector<uint32_t> expand_prefix_set(const PrefixSetIndex &index);

// read + expand. A list starting with prefix 0 is the encoding of the
// empty set and comes back empty.
std::vector<uint32_t> decode_prefix_set(const std::vector<uint8_t> &bytes);

} // namespace sbdump
