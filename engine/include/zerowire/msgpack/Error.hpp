#pragma once

#include <cstdint>
#include <string_view>

namespace zerowire::msgpack
{

/// MessagePack 역직렬화 오류. Ok(0) 이 성공.
enum class DeError : std::uint8_t
{
    Ok = 0,
    UnexpectedEof,
    ReservedCode,   // 0xC1
    UnsupportedExt, // 확장 타입은 건너뛰기만 가능
    InvalidInteger, // 목표 폭으로 손실 없이 옮길 수 없음
    InvalidType,
    InvalidUnicodeCodePoint,
    ExpectedInteger,
    ExpectedNumber,
    ExpectedString,
    ExpectedBin,
    ExpectedNil,
    ExpectedArray,
    ExpectedMap,
    ExpectedStruct,
    ExpectedIdentifier,
    TrailingElements, // visitor 가 멈춘 뒤에도 선언된 원소가 남음
    InvalidLength,
    DepthLimitExceeded, // 컨테이너 중첩이 maxDepth 를 넘음
    Custom,
};

/// MessagePack 직렬화 오류
enum class SerError : std::uint8_t
{
    Ok = 0,
    Writer,
    MapLength,  // 길이를 모르거나 선언과 개수가 다름
    SeqLength,
    StrLength,  // u32 범위를 넘는 문자열
    DataLength, // u32 범위를 넘는 바이트 배열
    FormatError,
    Custom,
};

[[nodiscard]] std::string_view toString(DeError e) noexcept;
[[nodiscard]] std::string_view toString(SerError e) noexcept;

} // namespace zerowire::msgpack
