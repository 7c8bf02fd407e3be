#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace sbdump {

enum class FormatErrorKind {
  Truncated,           // stream ended before a declared read completed
  DecompressionError,  // slice is not a valid zlib/DEFLATE stream
  SliceLengthMismatch, // slice length differs from the column count
  PrefixCountMismatch, // .sbstore and .pset disagree on add prefix count
  TrailingData,        // bytes left after the checksum
  InvalidIndex,        // prefix-set index range outside the delta array
  ChecksumMismatch,    // strict mode only
};

std::string_view to_string(FormatErrorKind kind);

class FormatError : public std::runtime_error {
public:
  FormatError(FormatErrorKind kind, const std::string &detail);

  FormatErrorKind kind() const { return kind_; }
  const std::string &detail() const { return detail_; }

private:
  FormatErrorKind kind_;
  std::string detail_;
};

} // namespace sbdump
