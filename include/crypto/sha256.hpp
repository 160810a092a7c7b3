#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace wdi {

// Lowercase hex digest, empty on OpenSSL failure.
std::string Sha256Hex(std::span<const std::uint8_t> data);

} // namespace wdi
