#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace codec
{

// Appends the UTF-8 encoding of cp. cp must be a scalar value (<= U+10FFFF, not a surrogate).
bool utf8_append(std::string &out, char32_t cp);

// Decodes one codepoint starting at s[pos] and advances pos past all of its bytes.
// Rejects truncated sequences, bad continuation bytes, overlong forms and surrogates.
bool utf8_next(std::string_view s, std::size_t &pos, char32_t &cp);

}  // namespace codec
