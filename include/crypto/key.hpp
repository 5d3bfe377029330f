#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "util/constants.hpp"

namespace crypto
{

using Key = std::array<std::uint8_t, constants::KEY_SIZE>;

// Exactly KEY_SIZE*2 hex digits, nothing else.
std::optional<Key> key_from_hex(std::string_view hex);

// nullopt when env_var is unset or holds malformed hex.
std::optional<Key> key_from_env(const char *env_var);

void wipe_key(Key &k);

bool ensure_sodium_init();

}  // namespace crypto
