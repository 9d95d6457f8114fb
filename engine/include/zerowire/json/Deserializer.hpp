#pragma once

#include <zerowire/codec/Utf8.hpp>
#include <zerowire/json/ByteDecoder.hpp>
#include <zerowire/json/Error.hpp>
#include <zerowire/json/Reader.hpp>
#include <zerowire/serde/Deserialize.hpp>
#include <zerowire/serde/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::json
{

template <class De>
class CommaSeparated;
template <class De>
class MapKey;
template <class De>
class UnitVariantAccess;
template <class De>
class VariantAccess;

/**
 * @brief 가변 슬라이스에서 값을 읽는 JSON 역직렬화기입니다.
 *
 * - 다음 의미 있는 바이트로 생성 규칙을 고릅니다:
 *   n -> null, t/f -> bool, '"' -> 문자열, 0-9/'-' -> 숫자, '[' -> 시퀀스, '{' -> 맵.
 * - 값 하나당 visitor 콜백은 최대 한 번, 그 값의 문법을 모두 검증한 뒤에만 부릅니다.
 * - 빌려주는 문자열/바이트는 입력 버퍼 안의 span 이며 버퍼 수명 동안 유효합니다.
 *
 * D 는 '"' 로 시작하는 바이트 필드의 해석 전략입니다 (ByteDecoder.hpp).
 */
template <ByteDecoder D = HexStrByteDecoder>
class Deserializer : public Reader, public serde::ErrorReporting<Deserializer<D>, DeError>
{
  public:
    using Error = DeError;

    /// '[' / '{' 중첩 기본 상한. 넘으면 DepthLimitExceeded (스택 보호)
    static constexpr std::size_t kDefaultMaxDepth = 128;

    explicit Deserializer(std::span<std::uint8_t> input,
                          std::size_t maxDepth = kDefaultMaxDepth) noexcept
        : Reader(input), maxDepth_(maxDepth)
    {
    }

    [[nodiscard]] serde::ErrorMessage &errorMessage() noexcept { return message_; }

    /// 마지막 Custom 오류의 메시지
    [[nodiscard]] std::string_view customMessage() const noexcept { return message_.view(); }

    template <class V>
    DeError deserializeAny(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        switch (c)
        {
        case 'n':
            return deserializeUnit(visitor);
        case 't':
        case 'f':
            return deserializeBool(visitor);
        case '"':
            return deserializeStr(visitor);
        case '[':
            return deserializeSeq(visitor);
        case '{':
            return deserializeMap(visitor);
        default:
            break;
        }
        if (c != '-' && (c < '0' || c > '9'))
            return DeError::UnexpectedChar;

        // 정수처럼 보이면 정수로, 범위를 넘거나 소수/지수가 있으면 f64 로
        if (numberLooksIntegral())
        {
            const std::size_t pos = cur_.position();
            if (c == '-')
            {
                std::int64_t n = 0;
                const DeError err = parseSigned(n);
                if (err == DeError::Ok)
                    return visitor.visitI64(*this, n);
                if (err != DeError::InvalidNumber)
                    return err;
            }
            else
            {
                std::uint64_t n = 0;
                const DeError err = parseUnsigned(n);
                if (err == DeError::Ok)
                    return visitor.visitU64(*this, n);
                if (err != DeError::InvalidNumber)
                    return err;
            }
            cur_.rewind(pos);
        }
        return deserializeF64(visitor);
    }

    template <class V>
    DeError deserializeBool(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        bool value = false;
        if (c == 't')
        {
            eatSome(1);
            ZW_TRY(parseTokenContent("rue"));
            value = true;
        }
        else if (c == 'f')
        {
            eatSome(1);
            ZW_TRY(parseTokenContent("alse"));
        }
        else
        {
            return DeError::UnexpectedChar;
        }
        return visitor.visitBool(*this, value);
    }

    template <class V>
    DeError deserializeI8(V &visitor)
    {
        std::int8_t n = 0;
        ZW_TRY(parseSigned(n));
        return visitor.visitI8(*this, n);
    }
    template <class V>
    DeError deserializeI16(V &visitor)
    {
        std::int16_t n = 0;
        ZW_TRY(parseSigned(n));
        return visitor.visitI16(*this, n);
    }
    template <class V>
    DeError deserializeI32(V &visitor)
    {
        std::int32_t n = 0;
        ZW_TRY(parseSigned(n));
        return visitor.visitI32(*this, n);
    }
    template <class V>
    DeError deserializeI64(V &visitor)
    {
        std::int64_t n = 0;
        ZW_TRY(parseSigned(n));
        return visitor.visitI64(*this, n);
    }

    template <class V>
    DeError deserializeU8(V &visitor)
    {
        std::uint8_t n = 0;
        ZW_TRY(parseUnsigned(n));
        return visitor.visitU8(*this, n);
    }
    template <class V>
    DeError deserializeU16(V &visitor)
    {
        std::uint16_t n = 0;
        ZW_TRY(parseUnsigned(n));
        return visitor.visitU16(*this, n);
    }
    template <class V>
    DeError deserializeU32(V &visitor)
    {
        std::uint32_t n = 0;
        ZW_TRY(parseUnsigned(n));
        return visitor.visitU32(*this, n);
    }
    template <class V>
    DeError deserializeU64(V &visitor)
    {
        std::uint64_t n = 0;
        ZW_TRY(parseUnsigned(n));
        return visitor.visitU64(*this, n);
    }

    // null 은 NaN 으로 읽는다 (직렬화기가 비유한 수를 null 로 쓰기 때문)
    template <class V>
    DeError deserializeF32(V &visitor)
    {
        float f = 0.0F;
        bool isNull = false;
        ZW_TRY(parseFloat32(f, isNull));
        return visitor.visitF32(*this, f);
    }
    template <class V>
    DeError deserializeF64(V &visitor)
    {
        double f = 0.0;
        bool isNull = false;
        ZW_TRY(parseFloat64(f, isNull));
        return visitor.visitF64(*this, f);
    }

    template <class V>
    DeError deserializeChar(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c != '"')
            return DeError::ExpectedString;
        eatSome(1);
        std::string_view s;
        ZW_TRY(parseStrContent(s));
        char32_t ch = 0;
        if (!codec::decodeSingleCodePoint(s, ch))
            return DeError::InvalidLength;
        return visitor.visitChar(*this, ch);
    }

    template <class V>
    DeError deserializeStr(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c != '"')
            return DeError::ExpectedString;
        eatSome(1);
        std::string_view s;
        ZW_TRY(parseStrContent(s));
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
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        std::span<const std::uint8_t> bytes;
        if (c == '"')
        {
            eatSome(1);
            ZW_TRY(D::decode(*this, bytes));
        }
        else if (c == '[')
        {
            eatSome(1);
            ZW_TRY(parseArrayBytesContent(bytes));
        }
        else
        {
            return DeError::UnexpectedChar;
        }
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
        ZW_TRY(eatWhitespace(c));
        if (c == 'n')
        {
            eatSome(1);
            ZW_TRY(parseTokenContent("ull"));
            return visitor.visitNone(*this);
        }
        return visitor.visitSome(*this);
    }

    template <class V>
    DeError deserializeUnit(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c != 'n')
            return DeError::ExpectedNull;
        eatSome(1);
        ZW_TRY(parseTokenContent("ull"));
        return visitor.visitUnit(*this);
    }

    template <class V>
    DeError deserializeSeq(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c != '[')
            return DeError::ExpectedArray;
        eatSome(1);

        return nested([&]() -> DeError {
            CommaSeparated<Deserializer> access(*this);
            ZW_TRY(visitor.visitSeq(*this, access));

            ZW_TRY(eatWhitespace(c));
            if (c != ']')
                return DeError::ExpectedArrayEnd;
            eatSome(1);
            return DeError::Ok;
        });
    }

    template <class V>
    DeError deserializeTuple(std::size_t, V &visitor)
    {
        return deserializeSeq(visitor);
    }

    template <class V>
    DeError deserializeMap(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c != '{')
            return DeError::ExpectedObject;
        eatSome(1);

        return nested([&]() -> DeError {
            CommaSeparated<Deserializer> access(*this);
            ZW_TRY(visitor.visitMap(*this, access));

            ZW_TRY(eatWhitespace(c));
            if (c != '}')
                return DeError::ExpectedObjectCommaOrEnd;
            eatSome(1);
            return DeError::Ok;
        });
    }

    /// '[' 면 위치 기반, 그 밖은 객체
    template <class V>
    DeError deserializeStruct(std::string_view, std::span<const std::string_view>, V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c == '[')
            return deserializeSeq(visitor);
        return deserializeMap(visitor);
    }

    /// "name" 은 unit variant, {"name": payload} 는 payload 를 가진 variant
    template <class V>
    DeError deserializeEnum(std::string_view, std::span<const std::string_view>, V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        if (c == '"')
        {
            UnitVariantAccess<Deserializer> access(*this);
            return visitor.visitEnum(*this, access);
        }
        if (c != '{')
            return DeError::ExpectedEnumValue;

        eatSome(1);
        return nested([&]() -> DeError {
            VariantAccess<Deserializer> access(*this);
            ZW_TRY(visitor.visitEnum(*this, access));
            ZW_TRY(eatWhitespace(c));
            if (c != '}')
                return DeError::ExpectedEnumObjectEnd;
            eatSome(1);
            return DeError::Ok;
        });
    }

    template <class V>
    DeError deserializeIdentifier(V &visitor)
    {
        return deserializeStr(visitor);
    }

    /// 내용은 버리지만 문법은 끝까지 검증한다
    template <class V>
    DeError deserializeIgnoredAny(V &visitor)
    {
        std::uint8_t c = 0;
        ZW_TRY(eatWhitespace(c));
        switch (c)
        {
        case 'n':
            return deserializeUnit(visitor);
        case 't':
        case 'f':
            return deserializeBool(visitor);
        case '"':
            eatSome(1);
            ZW_TRY(eatStr());
            return visitor.visitUnit(*this);
        case '[':
            return deserializeSeq(visitor);
        case '{':
            return deserializeMap(visitor);
        default:
            break;
        }
        if (c == '-' || (c >= '0' && c <= '9'))
        {
            ZW_TRY(eatNumber());
            return visitor.visitUnit(*this);
        }
        return DeError::UnexpectedChar;
    }

    [[nodiscard]] std::size_t maxDepth() const noexcept { return maxDepth_; }

  private:
    // 컨테이너 하나 안쪽을 읽는 동안만 깊이를 올린다
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

/// 시퀀스/맵 순회 상태: 첫 원소 플래그 하나와 구분자 규칙
template <class De>
class CommaSeparated
{
  public:
    explicit CommaSeparated(De &de) noexcept : de_(de) {}

    [[nodiscard]] std::size_t sizeHint() const noexcept { return 0; }

    template <class T>
    DeError nextElement(T &out, bool &got)
    {
        ZW_TRY(step(']', DeError::LeadingArrayComma, DeError::TrailingArrayComma,
                    DeError::ExpectedArrayCommaOrEnd, got));
        if (!got)
            return DeError::Ok;
        return serde::deserialize(de_, out);
    }

    template <class K>
    DeError nextKey(K &out, bool &got)
    {
        ZW_TRY(step('}', DeError::LeadingObjectComma, DeError::TrailingObjectComma,
                    DeError::ExpectedObjectCommaOrEnd, got));
        if (!got)
            return DeError::Ok;

        std::uint8_t c = 0;
        ZW_TRY(de_.peek(c));
        if (c != '"')
            return DeError::KeyMustBeAString;
        MapKey<De> key(de_);
        return serde::deserialize(key, out);
    }

    template <class V>
    DeError nextValue(V &out)
    {
        ZW_TRY(de_.parseKeyColon());
        return serde::deserialize(de_, out);
    }

  private:
    DeError step(std::uint8_t close, DeError leading, DeError trailing, DeError missing, bool &more)
    {
        more = false;
        std::uint8_t c = 0;
        ZW_TRY(de_.eatWhitespace(c));
        if (c == close)
            return DeError::Ok;

        if (c == ',')
        {
            if (first_)
                return leading;
            de_.eatSome(1);
            ZW_TRY(de_.eatWhitespace(c));
            if (c == close)
                return trailing;
        }
        else if (first_)
        {
            first_ = false;
        }
        else
        {
            return missing;
        }
        more = true;
        return DeError::Ok;
    }

    De &de_;
    bool first_{true};
};

/// 객체 키 역직렬화기.
/// 문자열류는 그대로 읽고, 정수/실수/bool 은 따옴표 안의 내용을 그 타입으로 파싱한 뒤
/// 닫는 따옴표가 바로 뒤따라야 한다 ("42" 는 되고 "42x" 는 안 된다).
template <class De>
class MapKey : public serde::ErrorReporting<MapKey<De>, DeError>
{
  public:
    using Error = DeError;

    explicit MapKey(De &de) noexcept : de_(de) {}

    [[nodiscard]] serde::ErrorMessage &errorMessage() noexcept { return de_.errorMessage(); }

    template <class V>
    DeError deserializeAny(V &visitor)
    {
        return de_.deserializeStr(visitor);
    }

    template <class V>
    DeError deserializeBool(V &visitor)
    {
        ZW_TRY(openQuote());
        std::uint8_t c = 0;
        ZW_TRY(de_.peek(c));
        bool value = false;
        if (c == 't')
        {
            de_.eatSome(1);
            ZW_TRY(de_.parseTokenContent("rue"));
            value = true;
        }
        else if (c == 'f')
        {
            de_.eatSome(1);
            ZW_TRY(de_.parseTokenContent("alse"));
        }
        else
        {
            return DeError::ExpectedToken;
        }
        ZW_TRY(closeQuote(DeError::ExpectedToken));
        return visitor.visitBool(*this, value);
    }

    template <class V>
    DeError deserializeI8(V &visitor)
    {
        std::int8_t n = 0;
        ZW_TRY(quotedSigned(n));
        return visitor.visitI8(*this, n);
    }
    template <class V>
    DeError deserializeI16(V &visitor)
    {
        std::int16_t n = 0;
        ZW_TRY(quotedSigned(n));
        return visitor.visitI16(*this, n);
    }
    template <class V>
    DeError deserializeI32(V &visitor)
    {
        std::int32_t n = 0;
        ZW_TRY(quotedSigned(n));
        return visitor.visitI32(*this, n);
    }
    template <class V>
    DeError deserializeI64(V &visitor)
    {
        std::int64_t n = 0;
        ZW_TRY(quotedSigned(n));
        return visitor.visitI64(*this, n);
    }
    template <class V>
    DeError deserializeU8(V &visitor)
    {
        std::uint8_t n = 0;
        ZW_TRY(quotedUnsigned(n));
        return visitor.visitU8(*this, n);
    }
    template <class V>
    DeError deserializeU16(V &visitor)
    {
        std::uint16_t n = 0;
        ZW_TRY(quotedUnsigned(n));
        return visitor.visitU16(*this, n);
    }
    template <class V>
    DeError deserializeU32(V &visitor)
    {
        std::uint32_t n = 0;
        ZW_TRY(quotedUnsigned(n));
        return visitor.visitU32(*this, n);
    }
    template <class V>
    DeError deserializeU64(V &visitor)
    {
        std::uint64_t n = 0;
        ZW_TRY(quotedUnsigned(n));
        return visitor.visitU64(*this, n);
    }

    template <class V>
    DeError deserializeF32(V &visitor)
    {
        ZW_TRY(openQuote());
        float f = 0.0F;
        bool isNull = false;
        ZW_TRY(de_.parseFloat32(f, isNull));
        ZW_TRY(closeQuote(DeError::InvalidNumber));
        return visitor.visitF32(*this, f);
    }
    template <class V>
    DeError deserializeF64(V &visitor)
    {
        ZW_TRY(openQuote());
        double f = 0.0;
        bool isNull = false;
        ZW_TRY(de_.parseFloat64(f, isNull));
        ZW_TRY(closeQuote(DeError::InvalidNumber));
        return visitor.visitF64(*this, f);
    }

    template <class V>
    DeError deserializeChar(V &visitor)
    {
        return de_.deserializeChar(visitor);
    }
    template <class V>
    DeError deserializeStr(V &visitor)
    {
        return de_.deserializeStr(visitor);
    }
    template <class V>
    DeError deserializeString(V &visitor)
    {
        return de_.deserializeStr(visitor);
    }
    template <class V>
    DeError deserializeBytes(V &visitor)
    {
        return de_.deserializeBytes(visitor);
    }
    template <class V>
    DeError deserializeByteBuf(V &visitor)
    {
        return de_.deserializeBytes(visitor);
    }

    // 키는 null 일 수 없다
    template <class V>
    DeError deserializeOption(V &visitor)
    {
        return visitor.visitSome(*this);
    }
    template <class V>
    DeError deserializeUnit(V &visitor)
    {
        return de_.deserializeUnit(visitor);
    }
    template <class V>
    DeError deserializeSeq(V &visitor)
    {
        return de_.deserializeSeq(visitor);
    }
    template <class V>
    DeError deserializeTuple(std::size_t len, V &visitor)
    {
        return de_.deserializeTuple(len, visitor);
    }
    template <class V>
    DeError deserializeMap(V &visitor)
    {
        return de_.deserializeMap(visitor);
    }
    template <class V>
    DeError deserializeStruct(std::string_view name, std::span<const std::string_view> fields,
                              V &visitor)
    {
        return de_.deserializeStruct(name, fields, visitor);
    }
    template <class V>
    DeError deserializeEnum(std::string_view name, std::span<const std::string_view> variants,
                            V &visitor)
    {
        return de_.deserializeEnum(name, variants, visitor);
    }
    template <class V>
    DeError deserializeIdentifier(V &visitor)
    {
        return de_.deserializeStr(visitor);
    }
    template <class V>
    DeError deserializeIgnoredAny(V &visitor)
    {
        return de_.deserializeIgnoredAny(visitor);
    }

  private:
    DeError openQuote()
    {
        std::uint8_t c = 0;
        ZW_TRY(de_.peek(c));
        if (c != '"')
            return DeError::ExpectedString;
        de_.eatSome(1);
        return DeError::Ok;
    }

    DeError closeQuote(DeError onMismatch)
    {
        std::uint8_t c = 0;
        ZW_TRY(de_.peek(c));
        if (c != '"')
            return onMismatch;
        de_.eatSome(1);
        return DeError::Ok;
    }

    template <class T>
    DeError quotedSigned(T &out)
    {
        ZW_TRY(openQuote());
        ZW_TRY(de_.parseSigned(out));
        return closeQuote(DeError::InvalidNumber);
    }

    template <class T>
    DeError quotedUnsigned(T &out)
    {
        ZW_TRY(openQuote());
        ZW_TRY(de_.parseUnsigned(out));
        return closeQuote(DeError::InvalidNumber);
    }

    De &de_;
};

/// 따옴표 문자열 하나로 된 enum: unit variant 만 가능
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

/// {"name": payload} 형태의 enum
template <class De>
class VariantAccess
{
  public:
    explicit VariantAccess(De &de) noexcept : de_(de) {}

    template <class Id>
    DeError variant(Id &id)
    {
        ZW_TRY(serde::deserialize(de_, id));
        return de_.parseKeyColon();
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

} // namespace zerowire::json
