#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <vector>

namespace sbdump {

// Little-endian cursor over an in-memory file image.
// Every read is bounds-checked and throws FormatError(Truncated) when short.
class ByteReader {
public:
  ByteReader(const uint8_t *data, size_t size) : data_(data), size_(size) {}
  explicit ByteReader(const std::vector<uint8_t> &buf)
      : data_(buf.data()), size_(buf.size()) {}

  uint32_t read_u32(std::string_view what = "uint32");
  uint16_t read_u16(std::string_view what = "uint16");

  // Returns a pointer into the underlying buffer; valid while it lives.
  const uint8_t *read_span(size_t n, std::string_view what);
  std::vector<uint8_t> read_bytes(size_t n, std::string_view what);

  std::vector<uint32_t> read_u32_array(size_t n, std::string_view what);
  std::vector<uint16_t> read_u16_array(size_t n, std::string_view what);

  template <size_t N> std::array<uint8_t, N> read_array(std::string_view what) {
    std::array<uint8_t, N> out{};
    std::memcpy(out.data(), read_span(N, what), N);
    return out;
  }

  size_t offset() const { return pos_; }
  size_t remaining() const { return size_ - pos_; }
  bool at_end() const { return pos_ == size_; }

private:
  void require(size_t n, std::string_view what) const;
  void require_elems(size_t n, size_t elem_size, std::string_view what) const;

  const uint8_t *data_;
  size_t size_;
  size_t pos_ = 0;
};

} // namespace sbdump
