#pragma once
#include <cstdint>
#include <vector>

#include "util/status.hpp"

namespace codec
{

// Each little-endian byte pair becomes one integer in [0, 65536).
// bytes.size() must be even.
cjkpost::Status bytes_to_ints(const std::vector<std::uint8_t> &bytes,
                              std::vector<std::int32_t>       &out);

// Inverse of bytes_to_ints; only the low 16 bits of each integer are kept.
void ints_to_bytes(const std::vector<std::int32_t> &ints, std::vector<std::uint8_t> &out);

}  // namespace codec
