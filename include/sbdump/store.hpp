#pragma once
#include <sbdump/records.hpp>

#include <cstdint>
#include <set>
#include <vector>

namespace sbdump {

// .sbstore layout, all integers little-endian:
//   StoreHeader (8 x uint32)
//   uint32[num_add_chunk]            add chunk ids
//   uint32[num_sub_chunk]            sub chunk ids
//   byte sliced (num_add_prefix)     AddPrefix add chunk
//   byte sliced (num_sub_prefix)     SubPrefix add chunk
//   byte sliced (num_sub_prefix)     SubPrefix sub chunk
//   byte sliced (num_sub_prefix)     SubPrefix prefix
//   {32 bytes, uint32 add}[num_add_complete]
//   {32 bytes, uint32 add, uint32 sub}[num_sub_complete]
//   16 bytes                         MD5 of everything before it
//
// Add prefix values are not stored here; they come from the .pset file.

struct StoreHeader {
  uint32_t magic = 0;
  uint32_t version = 0;
  uint32_t num_add_chunk = 0;
  uint32_t num_sub_chunk = 0;
  uint32_t num_add_prefix = 0;
  uint32_t num_sub_prefix = 0;
  uint32_t num_add_complete = 0;
  uint32_t num_sub_complete = 0;
};

inline constexpr size_t kStoreHeaderSize = 8 * sizeof(uint32_t);
inline constexpr size_t kStoreChecksumSize = 16;

struct StoreContents {
  StoreHeader header;
  std::set<uint32_t> add_chunks;
  std::set<uint32_t> sub_chunks;
  std::vector<PendingAddPrefix> add_prefixes; // store order
  std::vector<SubPrefix> sub_prefixes;
  std::vector<AddComplete> add_completes;
  std::vector<SubComplete> sub_completes;
  Md5Digest checksum{};
};

// Decodes a whole .sbstore image. Magic, version and checksum are recorded,
// not validated. Throws FormatError.
StoreContents parse_store(const std::vector<uint8_t> &bytes);

// MD5 over every byte before the trailing checksum.
Md5Digest compute_store_checksum(const std::vector<uint8_t> &bytes);

// Throws FormatError(ChecksumMismatch) if contents.checksum does not match.
void verify_store_checksum(const std::vector<uint8_t> &bytes,
                           const StoreContents &contents);

} // namespace sbdump
