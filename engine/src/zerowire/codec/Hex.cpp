#include <zerowire/codec/Hex.hpp>

#include <cassert>

namespace zerowire::codec
{

std::size_t hexEncode(std::span<const std::uint8_t> in, std::span<char> out) noexcept
{
    assert(out.size() >= in.size() * 2);
    std::size_t w = 0;
    for (const std::uint8_t b : in)
    {
        hexEncodeByte(b, out.data() + w);
        w += 2;
    }
    return w;
}

bool hexDecodeInPlace(std::span<std::uint8_t> buf, std::size_t &decoded,
                      std::size_t &consumed) noexcept
{
    std::size_t read = 0;
    std::size_t write = 0;
    for (;;)
    {
        std::uint8_t hi = 0;
        if (read >= buf.size() || !parseHexNibble(buf[read], hi))
        {
            decoded = write;
            consumed = read;
            return true;
        }
        std::uint8_t lo = 0;
        if (read + 1 >= buf.size() || !parseHexNibble(buf[read + 1], lo))
        {
            decoded = write;
            consumed = read + 1;
            return false;
        }
        // 쓰기 위치는 항상 읽기 위치의 절반
        assert(write <= read);
        buf[write++] = static_cast<std::uint8_t>((hi << 4) | lo);
        read += 2;
    }
}

} // namespace zerowire::codec
