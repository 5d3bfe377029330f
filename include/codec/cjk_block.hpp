#pragma once
#include <cstdint>

#include "util/status.hpp"

namespace codec
{

/*
Integer domain [0, DOMAIN_SIZE) laid over three CJK blocks, densest first:

  [0,     42720)  ->  U+20000 .. U+2A6DF   (Extension B)
  [42720, 63712)  ->  U+4E00  .. U+9FFF    (Unified Ideographs)
  [63712, 70304)  ->  U+3400  .. U+4DBF    (Extension A)
*/
inline constexpr char32_t     BLOCK1_FIRST = 0x20000;
inline constexpr char32_t     BLOCK1_LAST  = 0x2A6DF;
inline constexpr char32_t     BLOCK2_FIRST = 0x4E00;
inline constexpr char32_t     BLOCK2_LAST  = 0x9FFF;
inline constexpr char32_t     BLOCK3_FIRST = 0x3400;
inline constexpr char32_t     BLOCK3_LAST  = 0x4DBF;

inline constexpr std::int64_t BLOCK1_END  = BLOCK1_LAST - BLOCK1_FIRST + 1;               // 42720
inline constexpr std::int64_t BLOCK2_END  = BLOCK1_END + (BLOCK2_LAST - BLOCK2_FIRST + 1);  // 63712
inline constexpr std::int64_t DOMAIN_SIZE = BLOCK2_END + (BLOCK3_LAST - BLOCK3_FIRST + 1);  // 70304

static_assert(DOMAIN_SIZE == 70304, "CJK domain size");

cjkpost::Status int_to_codepoint(std::int64_t n, char32_t &cp);
cjkpost::Status codepoint_to_int(char32_t cp, std::int32_t &n);

}  // namespace codec
