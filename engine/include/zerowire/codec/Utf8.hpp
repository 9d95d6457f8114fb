#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::codec
{

/// 엄격한 UTF-8 검사 (overlong, surrogate, U+10FFFF 초과 거부)
[[nodiscard]] bool isValidUtf8(std::span<const std::uint8_t> bytes) noexcept;

[[nodiscard]] inline bool isValidUtf8(std::string_view s) noexcept
{
    return isValidUtf8(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/// cp 를 out 에 UTF-8 로 기록합니다. surrogate 나 범위 밖이면 0.
[[nodiscard]] std::size_t encodeUtf8(char32_t cp, std::uint8_t out[4]) noexcept;

/// s 가 정확히 코드 포인트 하나로 이루어져 있으면 out 에 담고 true.
/// s 는 이미 유효한 UTF-8 이어야 합니다.
[[nodiscard]] bool decodeSingleCodePoint(std::string_view s, char32_t &out) noexcept;

} // namespace zerowire::codec
