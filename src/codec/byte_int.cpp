#include "codec/byte_int.hpp"
#include "util/log.hpp"

namespace codec
{

cjkpost::Status bytes_to_ints(const std::vector<std::uint8_t> &bytes,
                              std::vector<std::int32_t>       &out)
{
    if (bytes.size() % 2 != 0)
    {
        LOG_ERROR("odd byte count (%zu)", bytes.size());
        return cjkpost::Status::InvalidInput;
    }
    out.clear();
    out.reserve(bytes.size() / 2);
    for (std::size_t i = 0; i < bytes.size(); i += 2)
    {
        // low byte first
        out.push_back(static_cast<std::int32_t>(bytes[i]) |
                      (static_cast<std::int32_t>(bytes[i + 1]) << 8));
    }
    return cjkpost::Status::Ok;
}

void ints_to_bytes(const std::vector<std::int32_t> &ints, std::vector<std::uint8_t> &out)
{
    out.clear();
    out.reserve(ints.size() * 2);
    for (std::int32_t v : ints)
    {
        out.push_back(static_cast<std::uint8_t>(v & 0xFF));
        out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }
}

}  // namespace codec
