#pragma once
#include <sbdump/error.hpp>
#include <sbdump/records.hpp>
#include <sbdump/store.hpp>

#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <vector>

// In-memory builders for .sbstore / .pset images used across the tests.
namespace fixtures {

inline constexpr uint32_t kStoreMagic = 0x1231af3bu;
inline constexpr uint32_t kStoreVersion = 3;

inline void put_u32(std::vector<uint8_t> &b, uint32_t v) {
  b.push_back(static_cast<uint8_t>(v));
  b.push_back(static_cast<uint8_t>(v >> 8));
  b.push_back(static_cast<uint8_t>(v >> 16));
  b.push_back(static_cast<uint8_t>(v >> 24));
}

inline void put_u16(std::vector<uint8_t> &b, uint16_t v) {
  b.push_back(static_cast<uint8_t>(v));
  b.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_bytes(std::vector<uint8_t> &b, const uint8_t *p, size_t n) {
  b.insert(b.end(), p, p + n);
}

inline std::vector<uint8_t> deflate(const std::vector<uint8_t> &raw) {
  uLongf bound = ::compressBound(static_cast<uLong>(raw.size()));
  std::vector<uint8_t> out(bound);
  int rc = ::compress2(out.data(), &bound, raw.data(),
                       static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION);
  if (rc != Z_OK)
    throw std::runtime_error("compress2 failed");
  out.resize(bound);
  return out;
}

inline void put_slice(std::vector<uint8_t> &b, const std::vector<uint8_t> &raw) {
  auto z = deflate(raw);
  put_u32(b, static_cast<uint32_t>(z.size()));
  put_bytes(b, z.data(), z.size());
}

inline void put_byte_sliced(std::vector<uint8_t> &b,
                            const std::vector<uint32_t> &vals) {
  std::vector<uint8_t> s[4];
  for (uint32_t v : vals) {
    s[0].push_back(static_cast<uint8_t>(v >> 24));
    s[1].push_back(static_cast<uint8_t>(v >> 16));
    s[2].push_back(static_cast<uint8_t>(v >> 8));
    s[3].push_back(static_cast<uint8_t>(v));
  }
  put_slice(b, s[0]);
  put_slice(b, s[1]);
  put_slice(b, s[2]);
  put_bytes(b, s[3].data(), s[3].size());
}

inline sbdump::FullHash make_hash(uint8_t seed) {
  sbdump::FullHash h{};
  for (size_t i = 0; i < h.size(); ++i)
    h[i] = static_cast<uint8_t>(seed + i);
  return h;
}

struct StoreLayout {
  uint32_t magic = kStoreMagic;
  uint32_t version = kStoreVersion;
  std::vector<uint32_t> add_chunks;
  std::vector<uint32_t> sub_chunks;
  std::vector<uint32_t> add_prefix_chunks;
  std::vector<sbdump::SubPrefix> sub_prefixes;
  std::vector<sbdump::AddComplete> add_completes;
  std::vector<sbdump::SubComplete> sub_completes;
};

// Everything up to, not including, the checksum.
inline std::vector<uint8_t> build_store_body(const StoreLayout &s) {
  std::vector<uint8_t> b;
  put_u32(b, s.magic);
  put_u32(b, s.version);
  put_u32(b, static_cast<uint32_t>(s.add_chunks.size()));
  put_u32(b, static_cast<uint32_t>(s.sub_chunks.size()));
  put_u32(b, static_cast<uint32_t>(s.add_prefix_chunks.size()));
  put_u32(b, static_cast<uint32_t>(s.sub_prefixes.size()));
  put_u32(b, static_cast<uint32_t>(s.add_completes.size()));
  put_u32(b, static_cast<uint32_t>(s.sub_completes.size()));
  for (uint32_t c : s.add_chunks)
    put_u32(b, c);
  for (uint32_t c : s.sub_chunks)
    put_u32(b, c);

  std::vector<uint32_t> sp_add, sp_sub, sp_val;
  for (const auto &p : s.sub_prefixes) {
    sp_add.push_back(p.add_chunk);
    sp_sub.push_back(p.sub_chunk);
    sp_val.push_back(p.prefix);
  }
  put_byte_sliced(b, s.add_prefix_chunks);
  put_byte_sliced(b, sp_add);
  put_byte_sliced(b, sp_sub);
  put_byte_sliced(b, sp_val);

  for (const auto &c : s.add_completes) {
    put_bytes(b, c.hash.data(), c.hash.size());
    put_u32(b, c.add_chunk);
  }
  for (const auto &c : s.sub_completes) {
    put_bytes(b, c.hash.data(), c.hash.size());
    put_u32(b, c.add_chunk);
    put_u32(b, c.sub_chunk);
  }
  return b;
}

// Body plus a correct MD5 trailer.
inline std::vector<uint8_t> build_store(const StoreLayout &s) {
  auto b = build_store_body(s);
  b.resize(b.size() + sbdump::kStoreChecksumSize, 0);
  const auto md5 = sbdump::compute_store_checksum(b);
  std::memcpy(b.data() + b.size() - md5.size(), md5.data(), md5.size());
  return b;
}

inline std::vector<uint8_t> build_pset(const std::vector<uint32_t> &prefixes,
                                       const std::vector<uint32_t> &starts,
                                       const std::vector<uint16_t> &deltas,
                                       uint32_t version = 1) {
  std::vector<uint8_t> b;
  put_u32(b, version);
  put_u32(b, static_cast<uint32_t>(prefixes.size()));
  put_u32(b, static_cast<uint32_t>(deltas.size()));
  for (uint32_t p : prefixes)
    put_u32(b, p);
  for (uint32_t s : starts)
    put_u32(b, s);
  for (uint16_t d : deltas)
    put_u16(b, d);
  return b;
}

// Encodes an ascending prefix list: a new anchor whenever the gap does not
// fit in 16 bits or the current run reaches `max_run` deltas.
inline std::vector<uint8_t> encode_prefix_set(const std::vector<uint32_t> &sorted,
                                              size_t max_run = 100) {
  std::vector<uint32_t> anchors, starts;
  std::vector<uint16_t> deltas;
  if (sorted.empty())
    return build_pset({0}, {0}, {});
  size_t run = 0;
  for (size_t i = 0; i < sorted.size(); ++i) {
    if (i == 0 || sorted[i] - sorted[i - 1] > 0xffff || run >= max_run) {
      anchors.push_back(sorted[i]);
      starts.push_back(static_cast<uint32_t>(deltas.size()));
      run = 0;
      continue;
    }
    deltas.push_back(static_cast<uint16_t>(sorted[i] - sorted[i - 1]));
    ++run;
  }
  return build_pset(anchors, starts, deltas);
}

template <class F> std::optional<sbdump::FormatErrorKind> error_kind(F &&f) {
  try {
    f();
  } catch (const sbdump::FormatError &e) {
    return e.kind();
  }
  return std::nullopt;
}

} // namespace fixtures
