#include <chrono>

#include "proto/header.hpp"
#include "util/log.hpp"

namespace frag
{

using cjkpost::Status;

std::uint64_t pack_bits(const HeaderFields &h)
{
    std::uint64_t w = h.filler & FILLER_MASK;
    w |= (static_cast<std::uint64_t>(h.protocol_id) & PROTO_MASK) << PROTO_SHIFT;
    w |= (static_cast<std::uint64_t>(h.blocks) & BLOCKS_MASK) << BLOCKS_SHIFT;
    w |= static_cast<std::uint64_t>(h.more ? 1 : 0) << MORE_SHIFT;
    return w;
}

HeaderFields unpack_bits(std::uint64_t w)
{
    HeaderFields h;
    h.filler      = w & FILLER_MASK;
    h.protocol_id = static_cast<std::uint8_t>((w >> PROTO_SHIFT) & PROTO_MASK);
    h.blocks      = static_cast<std::uint8_t>((w >> BLOCKS_SHIFT) & BLOCKS_MASK);
    h.more        = ((w >> MORE_SHIFT) & 1) == 1;
    return h;
}

Status HeaderCodec::encode(std::size_t payload_len, int protocol_id, bool more, HeaderBytes &out)
{
    if (protocol_id < 0 || protocol_id >= PROTOCOL_LIMIT)
    {
        LOG_ERROR("protocol id %d outside [0, %d)", protocol_id, PROTOCOL_LIMIT);
        return Status::InvalidInput;
    }
    const std::size_t blocks = block_count(payload_len);
    if (blocks > MAX_BLOCKS)
    {
        LOG_ERROR("payload length %zu needs %zu blocks (max %zu)", payload_len, blocks,
                  MAX_BLOCKS);
        return Status::InvalidInput;
    }

    using namespace std::chrono;
    const auto ms =
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();

    // 40 bits of clock, 12 random bits so headers built in the same millisecond differ
    HeaderFields h;
    h.filler = ((static_cast<std::uint64_t>(ms) & 0xFFFFFFFFFFull) << 12) |
               (rng_.next_u64() & 0xFFF);
    h.protocol_id = static_cast<std::uint8_t>(protocol_id);
    h.blocks      = static_cast<std::uint8_t>(blocks);
    h.more        = more;
    return seal(pack_bits(h), out);
}

Status HeaderCodec::encode_dummy(HeaderBytes &out)
{
    return seal(rng_.next_u64() | (std::uint64_t{1} << MORE_SHIFT), out);
}

Status HeaderCodec::decode(const HeaderBytes &in, HeaderFields &out)
{
    std::uint8_t plain[HDR_SIZE];
    if (!cipher_.decrypt_block(in.data(), plain))
    {
        LOG_ERROR("header block decrypt failed");
        return Status::CryptoFailure;
    }
    std::uint64_t w = 0;
    for (std::size_t i = 0; i < HDR_SIZE; ++i)
        w = (w << 8) | plain[i];
    out = unpack_bits(w);
    return Status::Ok;
}

Status HeaderCodec::seal(std::uint64_t word, HeaderBytes &out)
{
    std::uint8_t plain[HDR_SIZE];
    // big-endian
    for (std::size_t i = 0; i < HDR_SIZE; ++i)
        plain[i] = static_cast<std::uint8_t>(word >> (8 * (HDR_SIZE - 1 - i)));
    if (!cipher_.encrypt_block(plain, out.data()))
    {
        LOG_ERROR("header block encrypt failed");
        return Status::CryptoFailure;
    }
    return Status::Ok;
}

}  // namespace frag
