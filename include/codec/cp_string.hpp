#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "util/status.hpp"

/*
bytes  --bytes_to_ints-->  ints  --int_to_codepoint-->  codepoints  --utf8-->  string
string --utf8_next-->  codepoints  --codepoint_to_int-->  ints  --ints_to_bytes-->  bytes

Strings are UTF-8. Every integer maps to exactly one codepoint, so a string carries
half as many codepoints as the bytes it encodes.
*/

namespace codec
{

cjkpost::Status ints_to_string(const std::vector<std::int32_t> &ints, std::string &out);
cjkpost::Status string_to_ints(std::string_view s, std::vector<std::int32_t> &out);

cjkpost::Status bytes_to_string(const std::vector<std::uint8_t> &bytes, std::string &out);
cjkpost::Status string_to_bytes(std::string_view s, std::vector<std::uint8_t> &out);

// Number of codepoints in a UTF-8 string; npos if s is not valid UTF-8.
std::size_t codepoint_count(std::string_view s);

}  // namespace codec
