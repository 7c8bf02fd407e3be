#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sbdump {

// lowercase hex, byte order as given
std::string hex_bytes(const uint8_t *data, size_t len);

// 8 hex digits, most significant byte first
std::string hex_prefix(uint32_t prefix);

} // namespace sbdump
