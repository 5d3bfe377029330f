#pragma once
#include <cstddef>
#include <string_view>

namespace constants
{
// Environment
inline constexpr const char *ENV_KEY       = "CJKPOST_KEY";
inline constexpr const char *ENV_LOG_LEVEL = "CJKPOST_LOG_LEVEL";

// 16-byte key shared by the payload cipher and the header cipher
inline constexpr std::size_t      KEY_SIZE        = 16;
inline constexpr std::string_view DEFAULT_KEY_HEX = "e233fb87e25dfd0e75a2752f4e6cead2";

}  // namespace constants
