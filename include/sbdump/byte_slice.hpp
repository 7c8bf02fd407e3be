#pragma once
#include <sbdump/byte_reader.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sbdump {

// Byte-sliced column layout (n values):
//   uint32 len; len bytes zlib   -> n bytes, MSB of each value
//   uint32 len; len bytes zlib   -> n bytes, 2nd byte
//   uint32 len; len bytes zlib   -> n bytes, 3rd byte
//   n bytes                      -> LSB, stored raw
//
// The upper bytes of neighbouring chunk ids / prefixes correlate well and
// compress; the LSB does not and is left uncompressed.

// Inflate one zlib slice that must expand to exactly `expected` bytes.
// `slice_no` only feeds the error text.
std::vector<uint8_t> inflate_slice(const uint8_t *src, size_t len,
                                   size_t expected, int slice_no);

std::vector<uint32_t> decode_byte_sliced(ByteReader &in, uint32_t count);

} // namespace sbdump
