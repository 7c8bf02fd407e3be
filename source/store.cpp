#include <sbdump/byte_reader.hpp>
#include <sbdump/byte_slice.hpp>
#include <sbdump/error.hpp>
#include <sbdump/util.hpp>
#include <sbdump/store.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace sbdump {

static StoreHeader read_header(ByteReader &in) {
  StoreHeader h;
  h.magic = in.read_u32("header magic");
  h.version = in.read_u32("header version");
  h.num_add_chunk = in.read_u32("header numAddChunk");
  h.num_sub_chunk = in.read_u32("header numSubChunk");
  h.num_add_prefix = in.read_u32("header numAddPrefix");
  h.num_sub_prefix = in.read_u32("header numSubPrefix");
  h.num_add_complete = in.read_u32("header numAddComplete");
  h.num_sub_complete = in.read_u32("header numSubComplete");
  return h;
}

StoreContents parse_store(const std::vector<uint8_t> &bytes) {
  ByteReader in(bytes);
  StoreContents out;
  out.header = read_header(in);
  const StoreHeader &h = out.header;

  for (uint32_t chunk : in.read_u32_array(h.num_add_chunk, "add chunk ids"))
    out.add_chunks.insert(chunk);
  for (uint32_t chunk : in.read_u32_array(h.num_sub_chunk, "sub chunk ids"))
    out.sub_chunks.insert(chunk);

  const auto add_prefix_add = decode_byte_sliced(in, h.num_add_prefix);
  const auto sub_prefix_add = decode_byte_sliced(in, h.num_sub_prefix);
  const auto sub_prefix_sub = decode_byte_sliced(in, h.num_sub_prefix);
  const auto sub_prefix_val = decode_byte_sliced(in, h.num_sub_prefix);

  out.add_prefixes.reserve(add_prefix_add.size());
  for (uint32_t chunk : add_prefix_add)
    out.add_prefixes.push_back(PendingAddPrefix{chunk});

  out.sub_prefixes.reserve(h.num_sub_prefix);
  for (uint32_t i = 0; i < h.num_sub_prefix; ++i) {
    out.sub_prefixes.push_back(
        SubPrefix{sub_prefix_val[i], sub_prefix_add[i], sub_prefix_sub[i]});
  }

  // each record still gets its own bounds check; this just avoids
  // reserving for a count the file cannot possibly hold
  if (static_cast<uint64_t>(h.num_add_complete) * 36 <= in.remaining())
    out.add_completes.reserve(h.num_add_complete);
  for (uint32_t i = 0; i < h.num_add_complete; ++i) {
    AddComplete c{};
    c.hash = in.read_array<32>("add complete hash");
    c.add_chunk = in.read_u32("add complete add chunk");
    out.add_completes.push_back(c);
  }

  if (static_cast<uint64_t>(h.num_sub_complete) * 40 <= in.remaining())
    out.sub_completes.reserve(h.num_sub_complete);
  for (uint32_t i = 0; i < h.num_sub_complete; ++i) {
    SubComplete c{};
    c.hash = in.read_array<32>("sub complete hash");
    c.add_chunk = in.read_u32("sub complete add chunk");
    c.sub_chunk = in.read_u32("sub complete sub chunk");
    out.sub_completes.push_back(c);
  }

  out.checksum = in.read_array<kStoreChecksumSize>("checksum");

  if (!in.at_end()) {
    throw FormatError(FormatErrorKind::TrailingData,
                      fmt::format("file doesn't end where expected: {} bytes "
                                  "remaining after checksum at offset {}",
                                  in.remaining(), in.offset()));
  }
  return out;
}

namespace {
struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
} // namespace

Md5Digest compute_store_checksum(const std::vector<uint8_t> &bytes) {
  if (bytes.size() < kStoreChecksumSize) {
    throw FormatError(FormatErrorKind::Truncated,
                      fmt::format("checksum: need {} bytes, file has {}",
                                  kStoreChecksumSize, bytes.size()));
  }
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");

  Md5Digest out{};
  unsigned int len = 0;
  const size_t body = bytes.size() - kStoreChecksumSize;
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), body) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 ||
      len != out.size()) {
    throw std::runtime_error("MD5 digest failed");
  }
  return out;
}

void verify_store_checksum(const std::vector<uint8_t> &bytes,
                           const StoreContents &contents) {
  const Md5Digest actual = compute_store_checksum(bytes);
  if (actual != contents.checksum) {
    throw FormatError(FormatErrorKind::ChecksumMismatch,
                      fmt::format("stored MD5 {} != computed {}",
                                  hex_bytes(contents.checksum.data(),
                                            contents.checksum.size()),
                                  hex_bytes(actual.data(), actual.size())));
  }
}

} // namespace sbdump
