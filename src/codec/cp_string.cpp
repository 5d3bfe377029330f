#include <utility>

#include "codec/cp_string.hpp"
#include "codec/byte_int.hpp"
#include "codec/cjk_block.hpp"
#include "codec/utf8.hpp"
#include "util/log.hpp"

namespace codec
{

using cjkpost::Status;

Status ints_to_string(const std::vector<std::int32_t> &ints, std::string &out)
{
    std::string s;
    // Extension B needs 4 bytes, the BMP blocks 3
    s.reserve(ints.size() * 4);
    for (std::int32_t v : ints)
    {
        char32_t cp = 0;
        if (Status st = int_to_codepoint(v, cp); st != Status::Ok)
            return st;
        if (!utf8_append(s, cp))
            return Status::InvalidInput;
    }
    out = std::move(s);
    return Status::Ok;
}

Status string_to_ints(std::string_view s, std::vector<std::int32_t> &out)
{
    std::vector<std::int32_t> ints;
    std::size_t               pos = 0;
    while (pos < s.size())
    {
        char32_t cp = 0;
        if (!utf8_next(s, pos, cp))
        {
            LOG_ERROR("malformed UTF-8 at byte %zu", pos);
            return Status::InvalidInput;
        }
        std::int32_t n = 0;
        if (Status st = codepoint_to_int(cp, n); st != Status::Ok)
            return st;
        ints.push_back(n);
    }
    out = std::move(ints);
    return Status::Ok;
}

Status bytes_to_string(const std::vector<std::uint8_t> &bytes, std::string &out)
{
    std::vector<std::int32_t> ints;
    if (Status st = bytes_to_ints(bytes, ints); st != Status::Ok)
        return st;
    return ints_to_string(ints, out);
}

Status string_to_bytes(std::string_view s, std::vector<std::uint8_t> &out)
{
    std::vector<std::int32_t> ints;
    if (Status st = string_to_ints(s, ints); st != Status::Ok)
        return st;
    ints_to_bytes(ints, out);
    return Status::Ok;
}

std::size_t codepoint_count(std::string_view s)
{
    std::size_t n   = 0;
    std::size_t pos = 0;
    while (pos < s.size())
    {
        char32_t cp = 0;
        if (!utf8_next(s, pos, cp))
            return std::string_view::npos;
        ++n;
    }
    return n;
}

}  // namespace codec
