#pragma once

#include <cstdint>
#include <string_view>

namespace zerowire::json
{

/// JSON 역직렬화 오류. Ok(0) 이 성공이며 첫 오류에서 즉시 중단한다.
enum class DeError : std::uint8_t
{
    Ok = 0,
    UnexpectedEof,
    InvalidEscapeSequence,
    StringControlChar,
    ExpectedColon,
    ExpectedArrayCommaOrEnd,
    LeadingArrayComma,
    TrailingArrayComma,
    ExpectedObjectCommaOrEnd,
    LeadingObjectComma,
    TrailingObjectComma,
    ExpectedToken,
    ExpectedNull,
    ExpectedString,
    ExpectedArrayEnd,
    ExpectedArray,
    ExpectedObject,
    ExpectedEnumValue,
    ExpectedEnumObjectEnd,
    InvalidNumber,
    InvalidType,
    InvalidUnicodeCodePoint,
    KeyMustBeAString,
    TrailingCharacters,
    UnexpectedChar,
    InvalidLength,
    DepthLimitExceeded, // '[' / '{' 중첩이 maxDepth 를 넘음
    Custom, // 메시지는 Deserializer::customMessage()
};

/// JSON 직렬화 오류
enum class SerError : std::uint8_t
{
    Ok = 0,
    Writer,         // 싱크 용량 부족
    InvalidKeyType, // 객체 키로 쓸 수 없는 타입
    FormatError,    // collectStr 포맷 실패
    Custom,         // 메시지는 Serializer::customMessage()
};

[[nodiscard]] std::string_view toString(DeError e) noexcept;
[[nodiscard]] std::string_view toString(SerError e) noexcept;

} // namespace zerowire::json
