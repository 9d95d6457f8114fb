#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

namespace zerowire::codec
{
// MessagePack 은 모든 다중 바이트 필드를 network byte order(big-endian)로 싣는다.

inline void storeU16Be(std::uint16_t v, std::uint8_t out[2]) noexcept
{
    out[0] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 0) & 0xFF);
}

inline void storeU32Be(std::uint32_t v, std::uint8_t out[4]) noexcept
{
    out[0] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    out[2] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>((v >> 0) & 0xFF);
}

inline void storeU64Be(std::uint64_t v, std::uint8_t out[8]) noexcept
{
    storeU32Be(static_cast<std::uint32_t>(v >> 32), out);
    storeU32Be(static_cast<std::uint32_t>(v), out + 4);
}

inline std::uint16_t loadU16Be(const std::uint8_t *p) noexcept
{
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                      (static_cast<std::uint16_t>(p[1]) << 0));
}

inline std::uint32_t loadU32Be(const std::uint8_t *p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | (static_cast<std::uint32_t>(p[3]) << 0);
}

inline std::uint64_t loadU64Be(const std::uint8_t *p) noexcept
{
    return (static_cast<std::uint64_t>(loadU32Be(p)) << 32) | loadU32Be(p + 4);
}

// IEEE-754 비트 패턴 그대로 싣는다 (-0.0, NaN payload 보존)
inline void storeF32Be(float v, std::uint8_t out[4]) noexcept
{
    storeU32Be(std::bit_cast<std::uint32_t>(v), out);
}

inline void storeF64Be(double v, std::uint8_t out[8]) noexcept
{
    storeU64Be(std::bit_cast<std::uint64_t>(v), out);
}

inline float loadF32Be(const std::uint8_t *p) noexcept
{
    return std::bit_cast<float>(loadU32Be(p));
}

inline double loadF64Be(const std::uint8_t *p) noexcept
{
    return std::bit_cast<double>(loadU64Be(p));
}

} // namespace zerowire::codec
