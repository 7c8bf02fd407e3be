#include <sbdump/util.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace sbdump {

std::string hex_bytes(const uint8_t *data, size_t len) {
  return fmt::format("{:02x}", fmt::join(data, data + len, ""));
}

std::string hex_prefix(uint32_t prefix) { return fmt::format("{:08x}", prefix); }

} // namespace sbdump
