#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "crypto/cipher.hpp"
#include "crypto/random.hpp"
#include "util/status.hpp"

/*
Header: one 64-bit word, big-endian on the wire, then passed through the header cipher.

  bit 63      more    1 = another unit follows (dummy header), 0 = terminal header
  bits 58-62  blocks  ciphertext slot length = blocks * 16
  bits 52-57  proto   protocol id, 0..63
  bits 0-51   filler  clock/random, never read back
*/

namespace frag
{

// --- Unit geometry ---
inline constexpr std::size_t HDR_SIZE        = crypto::HEADER_BLOCK_SIZE;  // 8
inline constexpr std::size_t SLOT_SIZE       = 272;
inline constexpr std::size_t UNIT_SIZE       = HDR_SIZE + SLOT_SIZE;  // 280
inline constexpr std::size_t UNIT_CODEPOINTS = UNIT_SIZE / 2;         // 140

// --- Header bit fields ---
inline constexpr unsigned      PROTO_SHIFT    = 52;
inline constexpr unsigned      BLOCKS_SHIFT   = 58;
inline constexpr unsigned      MORE_SHIFT     = 63;
inline constexpr std::uint64_t FILLER_MASK    = (std::uint64_t{1} << PROTO_SHIFT) - 1;
inline constexpr std::uint64_t PROTO_MASK     = 0x3F;
inline constexpr std::uint64_t BLOCKS_MASK    = 0x1F;
inline constexpr int           PROTOCOL_LIMIT = 64;
inline constexpr std::size_t   MAX_BLOCKS     = 31;

using HeaderBytes = std::array<std::uint8_t, HDR_SIZE>;

struct HeaderFields
{
    std::uint8_t  blocks{0};
    std::uint8_t  protocol_id{0};
    bool          more{false};
    std::uint64_t filler{0};

    std::size_t slot_len() const
    {
        return static_cast<std::size_t>(blocks) * crypto::AES_BLOCK_SIZE;
    }
};

// Raw bit packing, no cipher involved
std::uint64_t pack_bits(const HeaderFields &h);
HeaderFields  unpack_bits(std::uint64_t word);

// Cipher block count announced for a plaintext of payload_len bytes
inline std::size_t block_count(std::size_t payload_len)
{
    return payload_len / crypto::AES_BLOCK_SIZE + 1;
}

class HeaderCodec
{
  public:
    HeaderCodec(crypto::HeaderCipher &cipher, crypto::RandomSource &rng)
        : cipher_(cipher), rng_(rng)
    {
    }

    // Real header: blocks derived from payload_len, filler from the clock
    cjkpost::Status encode(std::size_t payload_len, int protocol_id, bool more, HeaderBytes &out);
    // Continuation header: random filler, more = true
    cjkpost::Status encode_dummy(HeaderBytes &out);
    cjkpost::Status decode(const HeaderBytes &in, HeaderFields &out);

  private:
    cjkpost::Status seal(std::uint64_t word, HeaderBytes &out);

    crypto::HeaderCipher &cipher_;
    crypto::RandomSource &rng_;
};

}  // namespace frag
