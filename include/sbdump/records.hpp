#pragma once
#include <array>
#include <cstdint>
#include <tuple>

namespace sbdump {

using FullHash = std::array<uint8_t, 32>;
using Md5Digest = std::array<uint8_t, 16>;

struct AddPrefix {
  uint32_t prefix;
  uint32_t add_chunk;

  bool operator==(const AddPrefix &o) const {
    return std::tie(prefix, add_chunk) == std::tie(o.prefix, o.add_chunk);
  }
  bool operator!=(const AddPrefix &o) const { return !(*this == o); }
};

struct SubPrefix {
  uint32_t prefix;
  uint32_t add_chunk;
  uint32_t sub_chunk;

  bool operator==(const SubPrefix &o) const {
    return std::tie(prefix, add_chunk, sub_chunk) ==
           std::tie(o.prefix, o.add_chunk, o.sub_chunk);
  }
  bool operator!=(const SubPrefix &o) const { return !(*this == o); }
};

struct AddComplete {
  FullHash hash;
  uint32_t add_chunk;

  bool operator==(const AddComplete &o) const {
    return std::tie(hash, add_chunk) == std::tie(o.hash, o.add_chunk);
  }
  bool operator!=(const AddComplete &o) const { return !(*this == o); }
};

struct SubComplete {
  FullHash hash;
  uint32_t add_chunk;
  uint32_t sub_chunk;

  bool operator==(const SubComplete &o) const {
    return std::tie(hash, add_chunk, sub_chunk) ==
           std::tie(o.hash, o.add_chunk, o.sub_chunk);
  }
  bool operator!=(const SubComplete &o) const { return !(*this == o); }
};

// AddPrefix as read from .sbstore: the prefix value itself lives in the
// .pset file and is attached later by fill_add_prefixes().
struct PendingAddPrefix {
  uint32_t add_chunk;
};

} // namespace sbdump
