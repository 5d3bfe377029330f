#include <algorithm>

#include "codec/cp_string.hpp"
#include "proto/unit.hpp"
#include "util/log.hpp"

namespace frag
{

using cjkpost::Status;

Status pack_unit(const HeaderBytes               &hdr,
                 const std::vector<std::uint8_t> &chunk,
                 crypto::RandomSource            &rng,
                 std::string                     &out)
{
    if (chunk.size() > SLOT_SIZE)
    {
        LOG_ERROR("chunk too large (%zu > %zu)", chunk.size(), SLOT_SIZE);
        return Status::InvalidInput;
    }
    std::vector<std::uint8_t> bytes(UNIT_SIZE);
    std::copy(hdr.begin(), hdr.end(), bytes.begin());
    std::copy(chunk.begin(), chunk.end(), bytes.begin() + HDR_SIZE);
    rng.fill(bytes.data() + HDR_SIZE + chunk.size(), SLOT_SIZE - chunk.size());

    return codec::bytes_to_string(bytes, out);
}

Status unpack_unit(std::string_view unit, HeaderBytes &hdr, std::vector<std::uint8_t> &slot)
{
    std::vector<std::uint8_t> bytes;
    if (Status st = codec::string_to_bytes(unit, bytes); st != Status::Ok)
        return st;
    if (bytes.size() != UNIT_SIZE)
    {
        LOG_WARN("unit carries %zu bytes, expected %zu", bytes.size(), UNIT_SIZE);
        return Status::InvalidInput;
    }
    std::copy(bytes.begin(), bytes.begin() + HDR_SIZE, hdr.begin());
    slot.assign(bytes.begin() + HDR_SIZE, bytes.end());
    return Status::Ok;
}

Status random_unit(crypto::RandomSource &rng, std::string &out)
{
    std::vector<std::uint8_t> bytes(UNIT_SIZE);
    rng.fill(bytes.data(), bytes.size());
    return codec::bytes_to_string(bytes, out);
}

}  // namespace frag
