#include "codec/cjk_block.hpp"
#include "util/log.hpp"

namespace codec
{

cjkpost::Status int_to_codepoint(std::int64_t n, char32_t &cp)
{
    if (n < 0 || n >= DOMAIN_SIZE)
    {
        LOG_ERROR("integer %lld outside [0, %lld)", static_cast<long long>(n),
                  static_cast<long long>(DOMAIN_SIZE));
        return cjkpost::Status::InvalidInput;
    }
    if (n < BLOCK1_END)
        cp = static_cast<char32_t>(BLOCK1_FIRST + n);
    else if (n < BLOCK2_END)
        cp = static_cast<char32_t>(BLOCK2_FIRST + (n - BLOCK1_END));
    else
        cp = static_cast<char32_t>(BLOCK3_FIRST + (n - BLOCK2_END));
    return cjkpost::Status::Ok;
}

cjkpost::Status codepoint_to_int(char32_t cp, std::int32_t &n)
{
    if (cp >= BLOCK1_FIRST && cp <= BLOCK1_LAST)
        n = static_cast<std::int32_t>(cp - BLOCK1_FIRST);
    else if (cp >= BLOCK2_FIRST && cp <= BLOCK2_LAST)
        n = static_cast<std::int32_t>(cp - BLOCK2_FIRST + BLOCK1_END);
    else if (cp >= BLOCK3_FIRST && cp <= BLOCK3_LAST)
        n = static_cast<std::int32_t>(cp - BLOCK3_FIRST + BLOCK2_END);
    else
    {
        LOG_ERROR("codepoint U+%04X is not in a CJK block", static_cast<unsigned>(cp));
        return cjkpost::Status::InvalidInput;
    }
    return cjkpost::Status::Ok;
}

}  // namespace codec
