#pragma once

#include "error.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace snapgate::util {

inline constexpr size_t SHA256_HEX_LENGTH = 64;

// SHA-256 of `data` as lowercase hex.
[[nodiscard]] auto sha256_hex(std::span<const uint8_t> data) -> Result<std::string>;

} // namespace snapgate::util
