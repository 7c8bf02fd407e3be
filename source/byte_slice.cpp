#include <sbdump/byte_slice.hpp>
#include <sbdump/error.hpp>

#include <fmt/format.h>
#include <zlib.h>

#include <cstring>
#include <limits>

namespace sbdump {

namespace {

// Owns a z_stream for the duration of one inflate.
class Inflater {
public:
  Inflater() {
    std::memset(&strm_, 0, sizeof(strm_));
    ok_ = (::inflateInit(&strm_) == Z_OK);
  }
  ~Inflater() {
    if (ok_)
      ::inflateEnd(&strm_);
  }
  Inflater(const Inflater &) = delete;
  Inflater &operator=(const Inflater &) = delete;

  bool ok() const { return ok_; }
  z_stream &stream() { return strm_; }

private:
  z_stream strm_;
  bool ok_ = false;
};

} // namespace

std::vector<uint8_t> inflate_slice(const uint8_t *src, size_t len,
                                   size_t expected, int slice_no) {
  if (len > std::numeric_limits<uInt>::max() ||
      expected >= std::numeric_limits<uInt>::max()) {
    throw FormatError(FormatErrorKind::DecompressionError,
                      fmt::format("slice {}: sizes exceed zlib limits "
                                  "(compressed {}, expected {})",
                                  slice_no, len, expected));
  }

  Inflater inf;
  if (!inf.ok()) {
    throw FormatError(FormatErrorKind::DecompressionError,
                      fmt::format("slice {}: inflateInit failed", slice_no));
  }

  // one spare byte: filling it means the slice is longer than expected
  std::vector<uint8_t> out(expected + 1);
  z_stream &strm = inf.stream();
  strm.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(src));
  strm.avail_in = static_cast<uInt>(len);
  strm.next_out = reinterpret_cast<Bytef *>(out.data());
  strm.avail_out = static_cast<uInt>(out.size());

  const int rc = ::inflate(&strm, Z_FINISH);
  if (rc == Z_STREAM_END) {
    const size_t got = static_cast<size_t>(strm.total_out);
    if (got != expected) {
      throw FormatError(FormatErrorKind::SliceLengthMismatch,
                        fmt::format("slice {}: expected {} bytes, inflated {}",
                                    slice_no, expected, got));
    }
    out.resize(got);
    return out;
  }
  if (rc == Z_BUF_ERROR && strm.avail_out == 0) {
    throw FormatError(FormatErrorKind::SliceLengthMismatch,
                      fmt::format("slice {}: expected {} bytes, inflated more",
                                  slice_no, expected));
  }
  const char *msg = strm.msg ? strm.msg : "incomplete or truncated stream";
  throw FormatError(FormatErrorKind::DecompressionError,
                    fmt::format("slice {}: inflate failed (rc={}): {}",
                                slice_no, rc, msg));
}

std::vector<uint32_t> decode_byte_sliced(ByteReader &in, uint32_t count) {
  std::vector<uint8_t> slices[3];
  for (int s = 0; s < 3; ++s) {
    const uint32_t comp_size = in.read_u32("byte slice compressed size");
    const uint8_t *comp = in.read_span(comp_size, "byte slice data");
    // the raw LSB slice still has to fit; bounds the inflate buffer by the input
    if (count > in.remaining()) {
      throw FormatError(FormatErrorKind::Truncated,
                        fmt::format("byte slice raw LSB at offset {}: need {} "
                                    "bytes, {} available",
                                    in.offset(), count, in.remaining()));
    }
    slices[s] = inflate_slice(comp, comp_size, count, s + 1);
  }
  const uint8_t *lsb = in.read_span(count, "byte slice raw LSB");

  std::vector<uint32_t> out(count);
  for (uint32_t i = 0; i < count; ++i) {
    out[i] = (static_cast<uint32_t>(slices[0][i]) << 24) |
             (static_cast<uint32_t>(slices[1][i]) << 16) |
             (static_cast<uint32_t>(slices[2][i]) << 8) |
             static_cast<uint32_t>(lsb[i]);
  }
  return out;
}

} // namespace sbdump
