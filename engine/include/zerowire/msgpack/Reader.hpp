#pragma once

#include <zerowire/buffer/Cursor.hpp>
#include <zerowire/msgpack/Error.hpp>
#include <zerowire/msgpack/Magic.hpp>
#include <zerowire/serde/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

namespace zerowire::msgpack
{

/**
 * @brief 읽기 전용 버퍼 위의 MessagePack 태그 리더입니다.
 *
 * [Wire Format]
 * - 값 하나 = 태그 1바이트 + (태그에 따라) big-endian 길이/값 필드 + payload
 * - 다중 바이트 필드는 fetch 단계에서 길이를 먼저 확인하므로, 잘린 입력은 항상 UnexpectedEof.
 *
 * [메모리 정책]
 * - 입력은 수정하지 않습니다. 문자열/바이트는 입력 안을 가리키는 span 으로 빌려줍니다.
 */
class Reader
{
  public:
    explicit Reader(std::span<const std::uint8_t> input) noexcept : cur_(input) {}

    [[nodiscard]] DeError peek(std::uint8_t &out) const noexcept
    {
        return cur_.peek(out) ? DeError::Ok : DeError::UnexpectedEof;
    }

    void eatSome(std::size_t n) noexcept { cur_.advance(n); }

    /// 한 바이트를 읽고 소비한다
    [[nodiscard]] DeError fetch(std::uint8_t &out) noexcept
    {
        ZW_TRY(peek(out));
        cur_.advance(1);
        return DeError::Ok;
    }

    [[nodiscard]] DeError fetchU16(std::uint16_t &out) noexcept;
    [[nodiscard]] DeError fetchU32(std::uint32_t &out) noexcept;
    [[nodiscard]] DeError fetchU64(std::uint64_t &out) noexcept;

    /// 태그 하나를 읽어 정수 값을 만들고 T 로 손실 없이 옮긴다.
    /// 정수 태그가 아니면 ExpectedInteger, 범위를 넘으면 InvalidInteger.
    template <class T>
    [[nodiscard]] DeError parseInteger(T &out) noexcept;

    /// float32/64, 모든 정수 태그(확장), nil(NaN). 그 밖은 ExpectedNumber.
    [[nodiscard]] DeError parseFloat32(float &out) noexcept;
    [[nodiscard]] DeError parseFloat64(double &out) noexcept;

    /// fixstr/str8/16/32 + UTF-8 검증
    [[nodiscard]] DeError parseStr(std::string_view &out) noexcept;

    /// bin8/16/32
    [[nodiscard]] DeError parseBytes(std::span<const std::uint8_t> &out) noexcept;

    /// fixarray/array16/32 헤더 (ExpectedArray)
    [[nodiscard]] DeError parseArrayLen(std::size_t &len) noexcept;

    /// fixmap/map16/32 헤더 (ExpectedMap)
    [[nodiscard]] DeError parseMapLen(std::size_t &len) noexcept;

    /// 모양을 모르는 값 하나를 protocol 호출 없이 통째로 건너뜁니다 (확장 포함).
    [[nodiscard]] DeError eatMessage() noexcept;

    /// 아직 읽지 않은 바이트 수 (tail)
    [[nodiscard]] std::size_t end() const noexcept { return cur_.remaining(); }

    [[nodiscard]] std::size_t remaining() const noexcept { return cur_.remaining(); }

  protected:
    buffer::ConstCursor cur_;

  private:
    /// n 바이트가 남아 있으면 그 시작 포인터를 주고 소비한다
    [[nodiscard]] DeError fetchRaw(std::size_t n, const std::uint8_t *&p) noexcept;

    [[nodiscard]] DeError skip(std::size_t n) noexcept;

    /// 값 하나의 태그/길이/payload 를 소비하고, 컨테이너면 뒤따를 자식 개수를 돌려준다
    [[nodiscard]] DeError eatHeader(std::size_t &children) noexcept;

    template <class F>
    [[nodiscard]] DeError parseFloat(F &out) noexcept;

    template <class T, class S>
    [[nodiscard]] static DeError narrow(S v, T &out) noexcept
    {
        if (!std::in_range<T>(v))
            return DeError::InvalidInteger;
        out = static_cast<T>(v);
        return DeError::Ok;
    }
};

template <class T>
DeError Reader::parseInteger(T &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));

    if (isPosFixInt(c))
        return narrow(c, out);
    if (isNegFixInt(c))
        return narrow(static_cast<std::int8_t>(c), out);

    switch (c)
    {
    case tag::kUInt8:
    {
        std::uint8_t v = 0;
        ZW_TRY(fetch(v));
        return narrow(v, out);
    }
    case tag::kUInt16:
    {
        std::uint16_t v = 0;
        ZW_TRY(fetchU16(v));
        return narrow(v, out);
    }
    case tag::kUInt32:
    {
        std::uint32_t v = 0;
        ZW_TRY(fetchU32(v));
        return narrow(v, out);
    }
    case tag::kUInt64:
    {
        std::uint64_t v = 0;
        ZW_TRY(fetchU64(v));
        return narrow(v, out);
    }
    case tag::kInt8:
    {
        std::uint8_t v = 0;
        ZW_TRY(fetch(v));
        return narrow(static_cast<std::int8_t>(v), out);
    }
    case tag::kInt16:
    {
        std::uint16_t v = 0;
        ZW_TRY(fetchU16(v));
        return narrow(static_cast<std::int16_t>(v), out);
    }
    case tag::kInt32:
    {
        std::uint32_t v = 0;
        ZW_TRY(fetchU32(v));
        return narrow(static_cast<std::int32_t>(v), out);
    }
    case tag::kInt64:
    {
        std::uint64_t v = 0;
        ZW_TRY(fetchU64(v));
        return narrow(static_cast<std::int64_t>(v), out);
    }
    default:
        return DeError::ExpectedInteger;
    }
}

} // namespace zerowire::msgpack
