#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace zerowire::codec
{

/// 대문자 hex 테이블. 프로세스 전역 상수입니다.
inline constexpr std::array<char, 16> kHexUpper = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

/// hex 한 글자를 nibble 로. hex 가 아니면 false.
[[nodiscard]] constexpr bool parseHexNibble(std::uint8_t ch, std::uint8_t &out) noexcept
{
    if (ch >= '0' && ch <= '9')
    {
        out = static_cast<std::uint8_t>(ch - '0');
        return true;
    }
    const auto lower = static_cast<std::uint8_t>(ch | 0x20);
    if (lower >= 'a' && lower <= 'f')
    {
        out = static_cast<std::uint8_t>(lower - 'a' + 10);
        return true;
    }
    return false;
}

inline void hexEncodeByte(std::uint8_t b, char out[2]) noexcept
{
    out[0] = kHexUpper[b >> 4];
    out[1] = kHexUpper[b & 0x0F];
}

/// in 을 out 에 대문자 hex 로 기록합니다. out 은 최소 2 * in.size() 바이트여야 합니다.
/// @return 기록한 글자 수
std::size_t hexEncode(std::span<const std::uint8_t> in, std::span<char> out) noexcept;

/// buf 앞부분의 hex 쌍을 같은 버퍼 앞쪽으로 디코드합니다 (write <= read).
///
/// - 짝수 위치에서 hex 가 아닌 글자(또는 버퍼 끝)를 만나면 멈추고 true.
///   consumed 는 그 글자의 위치, decoded 는 만들어진 바이트 수(= consumed / 2).
/// - 쌍의 두 번째 글자가 없거나 hex 가 아니면 false (consumed 는 그 위치).
[[nodiscard]] bool hexDecodeInPlace(std::span<std::uint8_t> buf, std::size_t &decoded,
                                    std::size_t &consumed) noexcept;

} // namespace zerowire::codec
