#include <sodium.h>

#include "crypto/key.hpp"
#include "crypto/random.hpp"
#include "util/log.hpp"

namespace crypto
{

SodiumRandom::SodiumRandom()
{
    if (!ensure_sodium_init())
        LOG_ERROR("sodium_init failed, randombytes will fall back to its default source");
}

void SodiumRandom::fill(std::uint8_t *buf, std::size_t n)
{
    if (n)
        randombytes_buf(buf, n);
}

std::uint64_t SodiumRandom::next_u64()
{
    std::uint64_t v = 0;
    randombytes_buf(&v, sizeof v);
    return v;
}

}  // namespace crypto
