#include <zerowire/msgpack/Reader.hpp>

#include <zerowire/codec/Endian.hpp>
#include <zerowire/codec/Utf8.hpp>

#include <limits>

namespace zerowire::msgpack
{

DeError Reader::fetchRaw(std::size_t n, const std::uint8_t *&p) noexcept
{
    if (cur_.remaining() < n)
        return DeError::UnexpectedEof;
    p = cur_.rest().data();
    cur_.advance(n);
    return DeError::Ok;
}

DeError Reader::skip(std::size_t n) noexcept
{
    if (cur_.remaining() < n)
        return DeError::UnexpectedEof;
    cur_.advance(n);
    return DeError::Ok;
}

DeError Reader::fetchU16(std::uint16_t &out) noexcept
{
    const std::uint8_t *p = nullptr;
    ZW_TRY(fetchRaw(2, p));
    out = codec::loadU16Be(p);
    return DeError::Ok;
}

DeError Reader::fetchU32(std::uint32_t &out) noexcept
{
    const std::uint8_t *p = nullptr;
    ZW_TRY(fetchRaw(4, p));
    out = codec::loadU32Be(p);
    return DeError::Ok;
}

DeError Reader::fetchU64(std::uint64_t &out) noexcept
{
    const std::uint8_t *p = nullptr;
    ZW_TRY(fetchRaw(8, p));
    out = codec::loadU64Be(p);
    return DeError::Ok;
}

template <class F>
DeError Reader::parseFloat(F &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));

    if (isPosFixInt(c))
    {
        out = static_cast<F>(c);
        return DeError::Ok;
    }
    if (isNegFixInt(c))
    {
        out = static_cast<F>(static_cast<std::int8_t>(c));
        return DeError::Ok;
    }

    const std::uint8_t *p = nullptr;
    switch (c)
    {
    case tag::kFloat32:
        ZW_TRY(fetchRaw(4, p));
        out = static_cast<F>(codec::loadF32Be(p));
        return DeError::Ok;
    case tag::kFloat64:
        ZW_TRY(fetchRaw(8, p));
        out = static_cast<F>(codec::loadF64Be(p));
        return DeError::Ok;
    case tag::kNil:
        out = std::numeric_limits<F>::quiet_NaN();
        return DeError::Ok;
    case tag::kUInt8:
        ZW_TRY(fetchRaw(1, p));
        out = static_cast<F>(p[0]);
        return DeError::Ok;
    case tag::kUInt16:
        ZW_TRY(fetchRaw(2, p));
        out = static_cast<F>(codec::loadU16Be(p));
        return DeError::Ok;
    case tag::kUInt32:
        ZW_TRY(fetchRaw(4, p));
        out = static_cast<F>(codec::loadU32Be(p));
        return DeError::Ok;
    case tag::kUInt64:
        ZW_TRY(fetchRaw(8, p));
        out = static_cast<F>(codec::loadU64Be(p));
        return DeError::Ok;
    case tag::kInt8:
        ZW_TRY(fetchRaw(1, p));
        out = static_cast<F>(static_cast<std::int8_t>(p[0]));
        return DeError::Ok;
    case tag::kInt16:
        ZW_TRY(fetchRaw(2, p));
        out = static_cast<F>(static_cast<std::int16_t>(codec::loadU16Be(p)));
        return DeError::Ok;
    case tag::kInt32:
        ZW_TRY(fetchRaw(4, p));
        out = static_cast<F>(static_cast<std::int32_t>(codec::loadU32Be(p)));
        return DeError::Ok;
    case tag::kInt64:
        ZW_TRY(fetchRaw(8, p));
        out = static_cast<F>(static_cast<std::int64_t>(codec::loadU64Be(p)));
        return DeError::Ok;
    default:
        return DeError::ExpectedNumber;
    }
}

DeError Reader::parseFloat32(float &out) noexcept
{
    return parseFloat(out);
}

DeError Reader::parseFloat64(double &out) noexcept
{
    return parseFloat(out);
}

DeError Reader::parseStr(std::string_view &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));

    std::size_t len = 0;
    if (isFixStr(c))
    {
        len = c & kMaxFixStrSize;
    }
    else if (c == tag::kStr8)
    {
        std::uint8_t n = 0;
        ZW_TRY(fetch(n));
        len = n;
    }
    else if (c == tag::kStr16)
    {
        std::uint16_t n = 0;
        ZW_TRY(fetchU16(n));
        len = n;
    }
    else if (c == tag::kStr32)
    {
        std::uint32_t n = 0;
        ZW_TRY(fetchU32(n));
        len = n;
    }
    else
    {
        return DeError::ExpectedString;
    }

    const std::uint8_t *p = nullptr;
    ZW_TRY(fetchRaw(len, p));
    if (!codec::isValidUtf8(std::span<const std::uint8_t>(p, len)))
        return DeError::InvalidUnicodeCodePoint;
    out = std::string_view(reinterpret_cast<const char *>(p), len);
    return DeError::Ok;
}

DeError Reader::parseBytes(std::span<const std::uint8_t> &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));

    std::size_t len = 0;
    switch (c)
    {
    case tag::kBin8:
    {
        std::uint8_t n = 0;
        ZW_TRY(fetch(n));
        len = n;
        break;
    }
    case tag::kBin16:
    {
        std::uint16_t n = 0;
        ZW_TRY(fetchU16(n));
        len = n;
        break;
    }
    case tag::kBin32:
    {
        std::uint32_t n = 0;
        ZW_TRY(fetchU32(n));
        len = n;
        break;
    }
    default:
        return DeError::ExpectedBin;
    }

    const std::uint8_t *p = nullptr;
    ZW_TRY(fetchRaw(len, p));
    out = std::span<const std::uint8_t>(p, len);
    return DeError::Ok;
}

DeError Reader::parseArrayLen(std::size_t &len) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));
    if (isFixArray(c))
    {
        len = c & kMaxFixArraySize;
        return DeError::Ok;
    }
    if (c == tag::kArray16)
    {
        std::uint16_t n = 0;
        ZW_TRY(fetchU16(n));
        len = n;
        return DeError::Ok;
    }
    if (c == tag::kArray32)
    {
        std::uint32_t n = 0;
        ZW_TRY(fetchU32(n));
        len = n;
        return DeError::Ok;
    }
    return DeError::ExpectedArray;
}

DeError Reader::parseMapLen(std::size_t &len) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));
    if (isFixMap(c))
    {
        len = c & kMaxFixMapSize;
        return DeError::Ok;
    }
    if (c == tag::kMap16)
    {
        std::uint16_t n = 0;
        ZW_TRY(fetchU16(n));
        len = n;
        return DeError::Ok;
    }
    if (c == tag::kMap32)
    {
        std::uint32_t n = 0;
        ZW_TRY(fetchU32(n));
        len = n;
        return DeError::Ok;
    }
    return DeError::ExpectedMap;
}

DeError Reader::eatMessage() noexcept
{
    // 재귀 대신 아직 건너뛸 값의 개수만 센다. 중첩 깊이가 스택을 쓰지 않는다
    std::size_t pending = 1;
    while (pending != 0)
    {
        --pending;
        std::size_t children = 0;
        ZW_TRY(eatHeader(children));

        // 자식마다 최소 1바이트: 남은 입력보다 많이 선언했으면 잘린 메시지
        if (children > cur_.remaining() || pending > cur_.remaining() - children)
            return DeError::UnexpectedEof;
        pending += children;
    }
    return DeError::Ok;
}

DeError Reader::eatHeader(std::size_t &children) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(fetch(c));

    // 스칼라는 건너뛸 payload 길이, 컨테이너는 자식 개수
    std::size_t payload = 0;
    children = 0;

    if (isPosFixInt(c) || isNegFixInt(c))
        return DeError::Ok;
    if (isFixMap(c))
        children = (c & kMaxFixMapSize) * 2;
    else if (isFixArray(c))
        children = c & kMaxFixArraySize;
    else if (isFixStr(c))
        payload = c & kMaxFixStrSize;
    else
    {
        std::uint8_t n8 = 0;
        std::uint16_t n16 = 0;
        std::uint32_t n32 = 0;
        switch (c)
        {
        case tag::kReserved:
            return DeError::ReservedCode;
        case tag::kNil:
        case tag::kFalse:
        case tag::kTrue:
            return DeError::Ok;
        case tag::kBin8:
        case tag::kStr8:
            ZW_TRY(fetch(n8));
            payload = n8;
            break;
        case tag::kBin16:
        case tag::kStr16:
            ZW_TRY(fetchU16(n16));
            payload = n16;
            break;
        case tag::kBin32:
        case tag::kStr32:
            ZW_TRY(fetchU32(n32));
            payload = n32;
            break;
        case tag::kExt8: // 길이 + type 1바이트
            ZW_TRY(fetch(n8));
            payload = std::size_t{1} + n8;
            break;
        case tag::kExt16:
            ZW_TRY(fetchU16(n16));
            payload = std::size_t{1} + n16;
            break;
        case tag::kExt32:
            ZW_TRY(fetchU32(n32));
            payload = std::size_t{1} + n32;
            break;
        case tag::kUInt8:
        case tag::kInt8:
            payload = 1;
            break;
        case tag::kUInt16:
        case tag::kInt16:
            payload = 2;
            break;
        case tag::kFloat32:
        case tag::kUInt32:
        case tag::kInt32:
            payload = 4;
            break;
        case tag::kFloat64:
        case tag::kUInt64:
        case tag::kInt64:
            payload = 8;
            break;
        case tag::kFixExt1:
            payload = 2;
            break;
        case tag::kFixExt2:
            payload = 3;
            break;
        case tag::kFixExt4:
            payload = 5;
            break;
        case tag::kFixExt8:
            payload = 9;
            break;
        case tag::kFixExt16:
            payload = 17;
            break;
        case tag::kArray16:
            ZW_TRY(fetchU16(n16));
            children = n16;
            break;
        case tag::kArray32:
            ZW_TRY(fetchU32(n32));
            children = n32;
            break;
        case tag::kMap16:
            ZW_TRY(fetchU16(n16));
            children = std::size_t{n16} * 2;
            break;
        case tag::kMap32:
            ZW_TRY(fetchU32(n32));
            children = std::size_t{n32} * 2;
            break;
        default:
            return DeError::ReservedCode;
        }
    }

    return skip(payload);
}

} // namespace zerowire::msgpack
