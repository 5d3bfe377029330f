#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/random.hpp"
#include "proto/header.hpp"
#include "util/status.hpp"

namespace frag
{

// [header 8B][chunk][random padding] -> exactly UNIT_SIZE bytes -> UNIT_CODEPOINTS codepoints.
// chunk.size() must be <= SLOT_SIZE.
cjkpost::Status pack_unit(const HeaderBytes               &hdr,
                          const std::vector<std::uint8_t> &chunk,
                          crypto::RandomSource            &rng,
                          std::string                     &out);

// slot keeps its trailing padding; callers cut it to the length the header announces.
cjkpost::Status unpack_unit(std::string_view           unit,
                            HeaderBytes               &hdr,
                            std::vector<std::uint8_t> &slot);

// A unit made of random bytes only, same shape as a real one.
cjkpost::Status random_unit(crypto::RandomSource &rng, std::string &out);

}  // namespace frag
