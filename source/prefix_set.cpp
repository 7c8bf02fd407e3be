#include <sbdump/byte_reader.hpp>
#include <sbdump/error.hpp>
#include <sbdump/prefix_set.hpp>

#include <fmt/format.h>

namespace sbdump {

PrefixSetIndex read_prefix_set_index(const std::vector<uint8_t> &bytes) {
  ByteReader in(bytes);
  PrefixSetIndex idx;
  idx.version = in.read_u32("pset version");
  const uint32_t index_size = in.read_u32("pset index size");
  const uint32_t delta_size = in.read_u32("pset delta size");
  idx.prefixes = in.read_u32_array(index_size, "pset index prefixes");
  idx.starts = in.read_u32_array(index_size, "pset index starts");
  idx.deltas = in.read_u16_array(delta_size, "pset deltas");
  return idx;
}

std::vector<uint32_t> expand_prefix_set(const PrefixSetIndex &index) {
  const size_t n = index.prefixes.size();
  const size_t delta_size = index.deltas.size();
  if (index.starts.size() != n) {
    throw FormatError(FormatErrorKind::InvalidIndex,
                      fmt::format("{} index prefixes but {} index starts", n,
                                  index.starts.size()));
  }

  std::vector<uint32_t> out;
  out.reserve(n + delta_size);
  for (size_t i = 0; i < n; ++i) {
    uint32_t prefix = index.prefixes[i];
    out.push_back(prefix);

    const size_t start = index.starts[i];
    const size_t end = (i + 1 < n) ? index.starts[i + 1] : delta_size;
    if (start > end || end > delta_size) {
      throw FormatError(FormatErrorKind::InvalidIndex,
                        fmt::format("index {}: delta range [{}, {}) outside "
                                    "{} deltas",
                                    i, start, end, delta_size));
    }
    for (size_t j = start; j < end; ++j) {
      prefix += index.deltas[j];
      out.push_back(prefix);
    }
  }
  return out;
}

std::vector<uint32_t> decode_prefix_set(const std::vector<uint8_t> &bytes) {
  auto prefixes = expand_prefix_set(read_prefix_set_index(bytes));
  if (!prefixes.empty() && prefixes.front() == 0)
    prefixes.clear();
  return prefixes;
}

} // namespace sbdump
