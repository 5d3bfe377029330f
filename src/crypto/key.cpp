#include <cstdlib>
#include <sodium.h>

#include "crypto/key.hpp"
#include "util/log.hpp"

namespace crypto
{

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::optional<Key> key_from_hex(std::string_view hex)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return std::nullopt;
    }
    if (hex.size() != constants::KEY_SIZE * 2)
        return std::nullopt;

    Key         key{};
    std::size_t out_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(key.data(), key.size(), hex.data(), hex.size(), nullptr, &out_len, &end) !=
            0 ||
        out_len != key.size() || end != hex.data() + hex.size())
    {
        wipe_key(key);
        return std::nullopt;
    }
    return key;
}

std::optional<Key> key_from_env(const char *env_var)
{
    if (!env_var)
        return std::nullopt;
    const char *s = std::getenv(env_var);
    if (!s)
        return std::nullopt;
    auto key = key_from_hex(s);
    if (!key)
        LOG_ERROR("%s is not %zu hex digits", env_var, constants::KEY_SIZE * 2);
    return key;
}

void wipe_key(Key &k)
{
    sodium_memzero(k.data(), k.size());
}

}  // namespace crypto
