#pragma once
#include <cstddef>
#include <cstdint>

namespace crypto
{

// Secure random source. Implementations must be safe to share between threads.
class RandomSource
{
  public:
    virtual ~RandomSource() = default;

    virtual void          fill(std::uint8_t *buf, std::size_t n) = 0;
    virtual std::uint64_t next_u64()                               = 0;
};

// libsodium randombytes; thread-safe once sodium_init has run
class SodiumRandom : public RandomSource
{
  public:
    SodiumRandom();

    void          fill(std::uint8_t *buf, std::size_t n) override;
    std::uint64_t next_u64() override;
};

}  // namespace crypto
