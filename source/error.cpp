#include <sbdump/error.hpp>

namespace sbdump {

std::string_view to_string(FormatErrorKind kind) {
  switch (kind) {
  case FormatErrorKind::Truncated:
    return "Truncated";
  case FormatErrorKind::DecompressionError:
    return "DecompressionError";
  case FormatErrorKind::SliceLengthMismatch:
    return "SliceLengthMismatch";
  case FormatErrorKind::PrefixCountMismatch:
    return "PrefixCountMismatch";
  case FormatErrorKind::TrailingData:
    return "TrailingData";
  case FormatErrorKind::InvalidIndex:
    return "InvalidIndex";
  case FormatErrorKind::ChecksumMismatch:
    return "ChecksumMismatch";
  }
  return "Unknown";
}

FormatError::FormatError(FormatErrorKind kind, const std::string &detail)
    : std::runtime_error(std::string(to_string(kind)) + ": " + detail),
      kind_(kind), detail_(detail) {}

} // namespace sbdump
