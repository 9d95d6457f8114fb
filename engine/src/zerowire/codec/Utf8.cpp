#include <zerowire/codec/Utf8.hpp>

namespace zerowire::codec
{

bool isValidUtf8(std::span<const std::uint8_t> bytes) noexcept
{
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n)
    {
        const std::uint8_t b0 = bytes[i];
        if (b0 < 0x80)
        {
            ++i;
            continue;
        }

        std::size_t width = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF)
        {
            width = 2;
        }
        else if (b0 >= 0xE0 && b0 <= 0xEF)
        {
            width = 3;
            if (b0 == 0xE0)
                lo = 0xA0; // overlong
            else if (b0 == 0xED)
                hi = 0x9F; // surrogate
        }
        else if (b0 >= 0xF0 && b0 <= 0xF4)
        {
            width = 4;
            if (b0 == 0xF0)
                lo = 0x90;
            else if (b0 == 0xF4)
                hi = 0x8F;
        }
        else
        {
            return false;
        }

        if (n - i < width)
            return false;
        if (bytes[i + 1] < lo || bytes[i + 1] > hi)
            return false;
        for (std::size_t k = 2; k < width; ++k)
        {
            if ((bytes[i + k] & 0xC0) != 0x80)
                return false;
        }
        i += width;
    }
    return true;
}

std::size_t encodeUtf8(char32_t cp, std::uint8_t out[4]) noexcept
{
    const auto c = static_cast<std::uint32_t>(cp);
    if (c < 0x80)
    {
        out[0] = static_cast<std::uint8_t>(c);
        return 1;
    }
    if (c < 0x800)
    {
        out[0] = static_cast<std::uint8_t>(0xC0 | (c >> 6));
        out[1] = static_cast<std::uint8_t>(0x80 | (c & 0x3F));
        return 2;
    }
    if (c >= 0xD800 && c <= 0xDFFF)
        return 0;
    if (c < 0x10000)
    {
        out[0] = static_cast<std::uint8_t>(0xE0 | (c >> 12));
        out[1] = static_cast<std::uint8_t>(0x80 | ((c >> 6) & 0x3F));
        out[2] = static_cast<std::uint8_t>(0x80 | (c & 0x3F));
        return 3;
    }
    if (c <= 0x10FFFF)
    {
        out[0] = static_cast<std::uint8_t>(0xF0 | (c >> 18));
        out[1] = static_cast<std::uint8_t>(0x80 | ((c >> 12) & 0x3F));
        out[2] = static_cast<std::uint8_t>(0x80 | ((c >> 6) & 0x3F));
        out[3] = static_cast<std::uint8_t>(0x80 | (c & 0x3F));
        return 4;
    }
    return 0;
}

bool decodeSingleCodePoint(std::string_view s, char32_t &out) noexcept
{
    if (s.empty())
        return false;

    const auto b0 = static_cast<std::uint8_t>(s[0]);
    std::size_t width = 1;
    std::uint32_t cp = b0;
    if (b0 >= 0xF0)
    {
        width = 4;
        cp = b0 & 0x07;
    }
    else if (b0 >= 0xE0)
    {
        width = 3;
        cp = b0 & 0x0F;
    }
    else if (b0 >= 0xC0)
    {
        width = 2;
        cp = b0 & 0x1F;
    }

    if (s.size() != width)
        return false;
    for (std::size_t k = 1; k < width; ++k)
        cp = (cp << 6) | (static_cast<std::uint8_t>(s[k]) & 0x3F);

    out = static_cast<char32_t>(cp);
    return true;
}

} // namespace zerowire::codec
