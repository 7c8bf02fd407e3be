#include <sbdump/byte_reader.hpp>
#include <sbdump/error.hpp>

#include <fmt/format.h>

namespace sbdump {

void ByteReader::require(size_t n, std::string_view what) const {
  if (n > remaining()) {
    throw FormatError(FormatErrorKind::Truncated,
                      fmt::format("{} at offset {}: need {} bytes, {} available",
                                  what, pos_, n, remaining()));
  }
}

// checks the whole array up front so a bogus count never allocates
void ByteReader::require_elems(size_t n, size_t elem_size,
                               std::string_view what) const {
  if (n > remaining() / elem_size) {
    throw FormatError(FormatErrorKind::Truncated,
                      fmt::format("{} at offset {}: need {} x {} bytes, {} "
                                  "available",
                                  what, pos_, n, elem_size, remaining()));
  }
}

uint32_t ByteReader::read_u32(std::string_view what) {
  require(4, what);
  const uint8_t *p = data_ + pos_;
  pos_ += 4;
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t ByteReader::read_u16(std::string_view what) {
  require(2, what);
  const uint8_t *p = data_ + pos_;
  pos_ += 2;
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

const uint8_t *ByteReader::read_span(size_t n, std::string_view what) {
  require(n, what);
  const uint8_t *p = data_ + pos_;
  pos_ += n;
  return p;
}

std::vector<uint8_t> ByteReader::read_bytes(size_t n, std::string_view what) {
  const uint8_t *p = read_span(n, what);
  return std::vector<uint8_t>(p, p + n);
}

std::vector<uint32_t> ByteReader::read_u32_array(size_t n,
                                                 std::string_view what) {
  require_elems(n, 4, what);
  std::vector<uint32_t> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i)
    out.push_back(read_u32(what));
  return out;
}

std::vector<uint16_t> ByteReader::read_u16_array(size_t n,
                                                 std::string_view what) {
  require_elems(n, 2, what);
  std::vector<uint16_t> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i)
    out.push_back(read_u16(what));
  return out;
}

} // namespace sbdump
