#pragma once

#include <cstddef>
#include <cstdint>

namespace zerowire::msgpack
{

/// MessagePack 태그 바이트.
/// 다중 바이트 길이/값 필드는 모두 big-endian 이다 (codec/Endian.hpp).
namespace tag
{
inline constexpr std::uint8_t kMinPosFixInt = 0x00;
inline constexpr std::uint8_t kMaxPosFixInt = 0x7F;
inline constexpr std::uint8_t kNegFixInt = 0xE0; // 111xxxxx, -32..-1
inline constexpr std::int8_t kMinNegFixInt = -32;

inline constexpr std::uint8_t kFixMap = 0x80; // 1000xxxx
inline constexpr std::uint8_t kFixMapMax = 0x8F;
inline constexpr std::uint8_t kFixArray = 0x90; // 1001xxxx
inline constexpr std::uint8_t kFixArrayMax = 0x9F;
inline constexpr std::uint8_t kFixStr = 0xA0; // 101xxxxx
inline constexpr std::uint8_t kFixStrMax = 0xBF;

inline constexpr std::uint8_t kNil = 0xC0;
inline constexpr std::uint8_t kReserved = 0xC1;
inline constexpr std::uint8_t kFalse = 0xC2;
inline constexpr std::uint8_t kTrue = 0xC3;

inline constexpr std::uint8_t kBin8 = 0xC4;
inline constexpr std::uint8_t kBin16 = 0xC5;
inline constexpr std::uint8_t kBin32 = 0xC6;

inline constexpr std::uint8_t kExt8 = 0xC7;
inline constexpr std::uint8_t kExt16 = 0xC8;
inline constexpr std::uint8_t kExt32 = 0xC9;

inline constexpr std::uint8_t kFloat32 = 0xCA;
inline constexpr std::uint8_t kFloat64 = 0xCB;

inline constexpr std::uint8_t kUInt8 = 0xCC;
inline constexpr std::uint8_t kUInt16 = 0xCD;
inline constexpr std::uint8_t kUInt32 = 0xCE;
inline constexpr std::uint8_t kUInt64 = 0xCF;

inline constexpr std::uint8_t kInt8 = 0xD0;
inline constexpr std::uint8_t kInt16 = 0xD1;
inline constexpr std::uint8_t kInt32 = 0xD2;
inline constexpr std::uint8_t kInt64 = 0xD3;

inline constexpr std::uint8_t kFixExt1 = 0xD4;
inline constexpr std::uint8_t kFixExt2 = 0xD5;
inline constexpr std::uint8_t kFixExt4 = 0xD6;
inline constexpr std::uint8_t kFixExt8 = 0xD7;
inline constexpr std::uint8_t kFixExt16 = 0xD8;

inline constexpr std::uint8_t kStr8 = 0xD9;
inline constexpr std::uint8_t kStr16 = 0xDA;
inline constexpr std::uint8_t kStr32 = 0xDB;

inline constexpr std::uint8_t kArray16 = 0xDC;
inline constexpr std::uint8_t kArray32 = 0xDD;

inline constexpr std::uint8_t kMap16 = 0xDE;
inline constexpr std::uint8_t kMap32 = 0xDF;

// payload 를 가진 enum variant 는 원소 하나짜리 fixmap 으로 싣는다
inline constexpr std::uint8_t kFixMap1 = kFixMap | 1;
} // namespace tag

inline constexpr std::size_t kMaxFixMapSize = 0x0F;
inline constexpr std::size_t kMaxFixArraySize = 0x0F;
inline constexpr std::size_t kMaxFixStrSize = 0x1F;

[[nodiscard]] constexpr bool isPosFixInt(std::uint8_t c) noexcept { return c <= tag::kMaxPosFixInt; }
[[nodiscard]] constexpr bool isNegFixInt(std::uint8_t c) noexcept { return c >= tag::kNegFixInt; }
[[nodiscard]] constexpr bool isFixMap(std::uint8_t c) noexcept
{
    return c >= tag::kFixMap && c <= tag::kFixMapMax;
}
[[nodiscard]] constexpr bool isFixArray(std::uint8_t c) noexcept
{
    return c >= tag::kFixArray && c <= tag::kFixArrayMax;
}
[[nodiscard]] constexpr bool isFixStr(std::uint8_t c) noexcept
{
    return c >= tag::kFixStr && c <= tag::kFixStrMax;
}

} // namespace zerowire::msgpack
