#include <cstdint>

#include "codec/utf8.hpp"

namespace codec
{

bool utf8_append(std::string &out, char32_t cp)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return false;

    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return true;
}

bool utf8_next(std::string_view s, std::size_t &pos, char32_t &cp)
{
    if (pos >= s.size())
        return false;

    const std::uint8_t b0 = static_cast<std::uint8_t>(s[pos]);
    std::size_t        width;
    char32_t           min;
    if (b0 < 0x80)
    {
        cp = b0;
        pos += 1;
        return true;
    }
    else if ((b0 & 0xE0) == 0xC0)
    {
        width = 2;
        min   = 0x80;
        cp    = b0 & 0x1F;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        width = 3;
        min   = 0x800;
        cp    = b0 & 0x0F;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        width = 4;
        min   = 0x10000;
        cp    = b0 & 0x07;
    }
    else
    {
        return false;  // continuation byte or 0xF8..0xFF as lead
    }

    if (s.size() - pos < width)
        return false;

    for (std::size_t i = 1; i < width; ++i)
    {
        const std::uint8_t b = static_cast<std::uint8_t>(s[pos + i]);
        if ((b & 0xC0) != 0x80)
            return false;
        cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return false;

    pos += width;
    return true;
}

}  // namespace codec
