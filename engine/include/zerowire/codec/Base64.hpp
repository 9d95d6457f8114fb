#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::codec
{

/// 표준 base64 알파벳 (RFC 4648, '+' '/'). 프로세스 전역 상수입니다.
inline constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/// 패딩 없이 인코드했을 때의 글자 수
[[nodiscard]] constexpr std::size_t base64EncodedLen(std::size_t bytes) noexcept
{
    return (bytes * 4 + 2) / 3;
}

/// base64 글자 하나의 6비트 값. 알파벳이 아니면 -1.
[[nodiscard]] int base64Value(std::uint8_t ch) noexcept;

/// in 을 패딩 없이 out 에 기록합니다. out 은 base64EncodedLen(in.size()) 이상이어야 합니다.
/// @return 패딩을 붙였다면 필요했을 '=' 개수 (0..2)
std::uint8_t base64Encode(std::span<const std::uint8_t> in, char *out) noexcept;

struct Base64Decoded
{
    std::size_t decoded{0}; // buf 앞쪽에 기록된 바이트 수
    std::size_t encoded{0}; // 소비한 base64 글자 수 (첫 비알파벳 글자의 위치)
};

/// buf 앞부분의 base64 텍스트를 같은 버퍼 앞쪽으로 디코드합니다.
///
/// - 4글자 -> 3바이트. 쓰기 인덱스는 읽기 인덱스를 절대 앞지르지 않습니다.
/// - 첫 비알파벳 글자('=', '"' 등)에서 멈춥니다. 패딩 처리는 호출자 몫입니다.
/// - 남은 1~3글자는 누산기를 잘라 0~2 바이트를 더 만듭니다.
[[nodiscard]] Base64Decoded base64DecodeInPlace(std::span<std::uint8_t> buf) noexcept;

} // namespace zerowire::codec
