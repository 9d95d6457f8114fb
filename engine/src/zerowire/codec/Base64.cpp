#include <zerowire/codec/Base64.hpp>

#include <array>
#include <cassert>

namespace zerowire::codec
{
namespace
{

constexpr std::array<std::int8_t, 256> makeDecodeTable() noexcept
{
    std::array<std::int8_t, 256> t{};
    for (auto &v : t)
        v = -1;
    for (std::size_t i = 0; i < kBase64Alphabet.size(); ++i)
        t[static_cast<std::uint8_t>(kBase64Alphabet[i])] = static_cast<std::int8_t>(i);
    return t;
}

constexpr std::array<std::int8_t, 256> kDecodeTable = makeDecodeTable();

} // namespace

int base64Value(std::uint8_t ch) noexcept
{
    return kDecodeTable[ch];
}

std::uint8_t base64Encode(std::span<const std::uint8_t> in, char *out) noexcept
{
    std::size_t i = 0;
    std::size_t w = 0;
    for (; i + 3 <= in.size(); i += 3)
    {
        const std::uint32_t n = (static_cast<std::uint32_t>(in[i]) << 16) |
                                (static_cast<std::uint32_t>(in[i + 1]) << 8) | in[i + 2];
        out[w++] = kBase64Alphabet[(n >> 18) & 0x3F];
        out[w++] = kBase64Alphabet[(n >> 12) & 0x3F];
        out[w++] = kBase64Alphabet[(n >> 6) & 0x3F];
        out[w++] = kBase64Alphabet[n & 0x3F];
    }

    switch (in.size() - i)
    {
    case 1:
    {
        const std::uint32_t n = static_cast<std::uint32_t>(in[i]) << 16;
        out[w++] = kBase64Alphabet[(n >> 18) & 0x3F];
        out[w++] = kBase64Alphabet[(n >> 12) & 0x3F];
        return 2;
    }
    case 2:
    {
        const std::uint32_t n =
            (static_cast<std::uint32_t>(in[i]) << 16) | (static_cast<std::uint32_t>(in[i + 1]) << 8);
        out[w++] = kBase64Alphabet[(n >> 18) & 0x3F];
        out[w++] = kBase64Alphabet[(n >> 12) & 0x3F];
        out[w++] = kBase64Alphabet[(n >> 6) & 0x3F];
        return 1;
    }
    default:
        return 0;
    }
}

Base64Decoded base64DecodeInPlace(std::span<std::uint8_t> buf) noexcept
{
    std::size_t read = 0;
    std::size_t write = 0;
    std::uint32_t acc = 0;
    int pending = 0;

    while (read < buf.size())
    {
        const int v = kDecodeTable[buf[read]];
        if (v < 0)
            break;
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        ++read;
        if (++pending == 4)
        {
            // 4글자를 다 읽은 뒤에만 3바이트를 쓴다: write + 3 <= read
            assert(write + 3 <= read);
            buf[write++] = static_cast<std::uint8_t>(acc >> 16);
            buf[write++] = static_cast<std::uint8_t>(acc >> 8);
            buf[write++] = static_cast<std::uint8_t>(acc);
            acc = 0;
            pending = 0;
        }
    }

    // 꼬리: 2글자 -> 1바이트, 3글자 -> 2바이트, 1글자 -> 버림
    switch (pending)
    {
    case 2:
        assert(write + 1 <= read);
        buf[write++] = static_cast<std::uint8_t>(acc >> 4);
        break;
    case 3:
        assert(write + 2 <= read);
        buf[write++] = static_cast<std::uint8_t>(acc >> 10);
        buf[write++] = static_cast<std::uint8_t>(acc >> 2);
        break;
    default:
        break;
    }

    return Base64Decoded{write, read};
}

} // namespace zerowire::codec
