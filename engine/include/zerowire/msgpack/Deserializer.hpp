#pragma once

#include <zerowire/codec/Utf8.hpp>
#include <zerowire/msgpack/Error.hpp>
#include <zerowire/msgpack/Magic.hpp>
#include <zerowire/msgpack/Reader.hpp>
#include <zerowire/serde/Deserialize.hpp>
#include <zerowire/serde/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::msgpack
{

template <class De>
class CountingAccess;
template <class De>
class UnitVariantAccess;
template <class De>
class VariantAccess;

/**
 * @brief 읽기 전용 슬라이스에서 값을 읽는 MessagePack 역직렬화기입니다.
 *
 * - 선행 태그 바이트 하나로 모양을 고릅니다.
 * - 정수는 어떤 정수 태그든 받아서 목표 폭으로 손실 없이 옮깁니다 (InvalidInteger).
 * - 구조체는 map(필드 이름/인덱스 키) 과 array(위치) 둘 다 받습니다.
 * - end() 는 소비하지 않은 바이트 수를 돌려주므로, 호출자가 tail 로 다시 부르면
 *   연속된 메시지를 하나씩 읽을 수 있습니다.
 */
class Deserializer : public Reader, public serde::ErrorReporting<Deserializer, DeError>
{
  public:
    using Error = DeError;

    /// array/map 및 payload variant 중첩 기본 상한
    static constexpr std::size_t kDefaultMaxDepth = 128;

    explicit Deserializer(std::span<const std::uint8_t> input,
                          std::size_t maxDepth = kDefaultMaxDepth) noexcept
        : Reader(input), maxDepth_(maxDepth)
    {
    }

    [[nodiscard]] serde::ErrorMessage &errorMessage() noexcept { return message_; }
    [[nodiscard]] std::string_view customMessage() const noexcept { return message_.view(); }

    template <class V>
    DeError deserializeAny(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(peek(c));

        if (isPosFixInt(c))
            return deserializeU8(visitor);
        if (isNegFixInt(c))
            return deserializeI8(visitor);
        if (isFixMap(c))
            return deserializeMap(visitor);
        if (isFixArray(c))
            return deserializeSeq(visitor);
        if (isFixStr(c))
            return deserializeStr(visitor);

        switch (c)
        {
        case tag::kNil:
            return deserializeUnit(visitor);
        case tag::kReserved:
            return DeError::ReservedCode;
        case tag::kFalse:
        case tag::kTrue:
            return deserializeBool(visitor);
        case tag::kBin8:
        case tag::kBin16:
        case tag::kBin32:
            return deserializeBytes(visitor);
        case tag::kFloat32:
            return deserializeF32(visitor);
        case tag::kFloat64:
            return deserializeF64(visitor);
        case tag::kUInt8:
            return deserializeU8(visitor);
        case tag::kUInt16:
            return deserializeU16(visitor);
        case tag::kUInt32:
            return deserializeU32(visitor);
        case tag::kUInt64:
            return deserializeU64(visitor);
        case tag::kInt8:
            return deserializeI8(visitor);
        case tag::kInt16:
            return deserializeI16(visitor);
        case tag::kInt32:
            return deserializeI32(visitor);
        case tag::kInt64:
            return deserializeI64(visitor);
        case tag::kStr8:
        case tag::kStr16:
        case tag::kStr32:
            return deserializeStr(visitor);
        case tag::kArray16:
        case tag::kArray32:
            return deserializeSeq(visitor);
        case tag::kMap16:
        case tag::kMap32:
            return deserializeMap(visitor);
        default:
            // ext8/16/32, fixext1..16
            return DeError::UnsupportedExt;
        }
    }

    template <class V>
    DeError deserializeBool(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(fetch(c));
        if (c == tag::kTrue)
            return visitor.visitBool(*this, true);
        if (c == tag::kFalse)
            return visitor.visitBool(*this, false);
        return DeError::InvalidType;
    }

    template <class V>
    DeError deserializeI8(V &visitor)
    {
        std::int8_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitI8(*this, n);
    }
    template <class V>
    DeError deserializeI16(V &visitor)
    {
        std::int16_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitI16(*this, n);
    }
    template <class V>
    DeError deserializeI32(V &visitor)
    {
        std::int32_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitI32(*this, n);
    }
    template <class V>
    DeError deserializeI64(V &visitor)
    {
        std::int64_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitI64(*this, n);
    }
    template <class V>
    DeError deserializeU8(V &visitor)
    {
        std::uint8_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitU8(*this, n);
    }
    template <class V>
    DeError deserializeU16(V &visitor)
    {
        std::uint16_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitU16(*this, n);
    }
    template <class V>
    DeError deserializeU32(V &visitor)
    {
        std::uint32_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitU32(*this, n);
    }
    template <class V>
    DeError deserializeU64(V &visitor)
    {
        std::uint64_t n = 0;
        ZW_TRY(parseInteger(n));
        return visitor.visitU64(*this, n);
    }

    template <class V>
    DeError deserializeF32(V &visitor)
    {
        float f = 0.0F;
        ZW_TRY(parseFloat32(f));
        return visitor.visitF32(*this, f);
    }
    template <class V>
    DeError deserializeF64(V &visitor)
    {
        double f = 0.0;
        ZW_TRY(parseFloat64(f));
        return visitor.visitF64(*this, f);
    }

    template <class V>
    DeError deserializeChar(V &visitor)
    {
        std::string_view s;
        ZW_TRY(parseStr(s));
        char32_t ch = 0;
        if (!codec::decodeSingleCodePoint(s, ch))
            return DeError::InvalidLength;
        return visitor.visitChar(*this, ch);
    }

    template <class V>
    DeError deserializeStr(V &visitor)
    {
        std::string_view s;
        ZW_TRY(parseStr(s));
        return visitor.visitBorrowedStr(*this, s);
    }
    template <class V>
    DeError deserializeString(V &visitor)
    {
        return deserializeStr(visitor);
    }

    template <class V>
    DeError deserializeBytes(V &visitor)
    {
        std::span<const std::uint8_t> bytes;
        ZW_TRY(parseBytes(bytes));
        return visitor.visitBorrowedBytes(*this, bytes);
    }
    template <class V>
    DeError deserializeByteBuf(V &visitor)
    {
        return deserializeBytes(visitor);
    }

    template <class V>
    DeError deserializeOption(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(peek(c));
        if (c == tag::kNil)
        {
            eatSome(1);
            return visitor.visitNone(*this);
        }
        return visitor.visitSome(*this);
    }

    template <class V>
    DeError deserializeUnit(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(fetch(c));
        if (c != tag::kNil)
            return DeError::ExpectedNil;
        return visitor.visitUnit(*this);
    }

    template <class V>
    DeError deserializeSeq(V &visitor)
    {
        std::size_t len = 0;
        ZW_TRY(parseArrayLen(len));
        return visitCounted<false>(len, visitor);
    }

    template <class V>
    DeError deserializeTuple(std::size_t, V &visitor)
    {
        return deserializeSeq(visitor);
    }

    template <class V>
    DeError deserializeMap(V &visitor)
    {
        std::size_t len = 0;
        ZW_TRY(parseMapLen(len));
        return visitCounted<true>(len, visitor);
    }

    /// map 이면 키 기반, array 면 위치 기반
    template <class V>
    DeError deserializeStruct(std::string_view, std::span<const std::string_view>, V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(peek(c));
        if (isFixMap(c) || c == tag::kMap16 || c == tag::kMap32)
            return deserializeMap(visitor);
        if (isFixArray(c) || c == tag::kArray16 || c == tag::kArray32)
            return deserializeSeq(visitor);
        return DeError::ExpectedStruct;
    }

    /// 원소 하나짜리 fixmap 은 payload 를 가진 variant, 그 밖은 unit variant 식별자
    template <class V>
    DeError deserializeEnum(std::string_view, std::span<const std::string_view>, V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(peek(c));
        if (c == tag::kFixMap1)
        {
            eatSome(1);
            return nested([&]() -> DeError {
                VariantAccess<Deserializer> access(*this);
                return visitor.visitEnum(*this, access);
            });
        }
        UnitVariantAccess<Deserializer> access(*this);
        return visitor.visitEnum(*this, access);
    }

    template <class V>
    DeError deserializeIdentifier(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(peek(c));
        if (isPosFixInt(c) || c == tag::kUInt8 || c == tag::kUInt16 || c == tag::kUInt32)
            return deserializeU32(visitor);
        if (isFixStr(c) || c == tag::kStr8 || c == tag::kStr16 || c == tag::kStr32)
            return deserializeStr(visitor);
        return DeError::ExpectedIdentifier;
    }

    /// eatMessage 는 재귀하지 않으므로 깊이 제한 없이 건너뛴다
    template <class V>
    DeError deserializeIgnoredAny(V &visitor)
    {
        ZW_TRY(eatMessage());
        return visitor.visitUnit(*this);
    }

    [[nodiscard]] std::size_t maxDepth() const noexcept { return maxDepth_; }

  private:
    template <bool IsMap, class V>
    DeError visitCounted(std::size_t len, V &visitor);

    template <class Fn>
    DeError nested(Fn &&body)
    {
        if (depth_ >= maxDepth_)
            return DeError::DepthLimitExceeded;
        ++depth_;
        const DeError err = body();
        --depth_;
        return err;
    }

    serde::ErrorMessage message_;
    std::size_t depth_{0};
    std::size_t maxDepth_;
};

/// 남은 원소 수를 세는 seq / map access
template <class De>
class CountingAccess
{
  public:
    CountingAccess(De &de, std::size_t count) noexcept : de_(de), count_(count) {}

    [[nodiscard]] std::size_t sizeHint() const noexcept { return count_; }

    template <class T>
    DeError nextElement(T &out, bool &got)
    {
        got = count_ != 0;
        if (!got)
            return DeError::Ok;
        --count_;
        return serde::deserialize(de_, out);
    }

    template <class K>
    DeError nextKey(K &out, bool &got)
    {
        return nextElement(out, got);
    }

    template <class V>
    DeError nextValue(V &out)
    {
        return serde::deserialize(de_, out);
    }

  private:
    De &de_;
    std::size_t count_{0};
};

template <bool IsMap, class V>
DeError Deserializer::visitCounted(std::size_t len, V &visitor)
{
    return nested([&]() -> DeError {
        CountingAccess<Deserializer> access(*this, len);
        if constexpr (IsMap)
            ZW_TRY(visitor.visitMap(*this, access));
        else
            ZW_TRY(visitor.visitSeq(*this, access));
        if (access.sizeHint() != 0)
            return DeError::TrailingElements;
        return DeError::Ok;
    });
}

template <class De>
class UnitVariantAccess
{
  public:
    explicit UnitVariantAccess(De &de) noexcept : de_(de) {}

    template <class Id>
    DeError variant(Id &id)
    {
        return serde::deserialize(de_, id);
    }

    DeError unitVariant() noexcept { return DeError::Ok; }

    template <class T>
    DeError newtypeVariant(T &)
    {
        return DeError::InvalidType;
    }
    template <class V>
    DeError tupleVariant(std::size_t, V &)
    {
        return DeError::InvalidType;
    }
    template <class V>
    DeError structVariant(std::span<const std::string_view>, V &)
    {
        return DeError::InvalidType;
    }

  private:
    De &de_;
};

/// 0x81 다음의 (식별자, payload) 쌍
template <class De>
class VariantAccess
{
  public:
    explicit VariantAccess(De &de) noexcept : de_(de) {}

    template <class Id>
    DeError variant(Id &id)
    {
        return serde::deserialize(de_, id);
    }

    DeError unitVariant() noexcept { return DeError::InvalidType; }

    template <class T>
    DeError newtypeVariant(T &out)
    {
        return serde::deserialize(de_, out);
    }
    template <class V>
    DeError tupleVariant(std::size_t len, V &visitor)
    {
        return de_.deserializeTuple(len, visitor);
    }
    template <class V>
    DeError structVariant(std::span<const std::string_view> fields, V &visitor)
    {
        return de_.deserializeStruct("", fields, visitor);
    }

  private:
    De &de_;
};

} // namespace zerowire::msgpack
