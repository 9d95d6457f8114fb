#include <zerowire/json/Reader.hpp>

#include <zerowire/codec/Base64.hpp>
#include <zerowire/codec/Hex.hpp>
#include <zerowire/codec/Utf8.hpp>

#include <cassert>
#include <charconv>
#include <cmath>
#include <cstring>
#include <limits>
#include <system_error>

namespace zerowire::json
{
namespace
{

constexpr bool isWhitespace(std::uint8_t c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

constexpr bool isNumberChar(std::uint8_t c) noexcept
{
    return (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E';
}

// '\b' '\f' '\n' '\r' '\t' 등 한 글자 escape. 0 이면 인식하지 못한 escape.
constexpr std::uint8_t unescapeChar(std::uint8_t c) noexcept
{
    switch (c)
    {
    case '"':
        return '"';
    case '\\':
        return '\\';
    case '/':
        return '/';
    case 'b':
        return 0x08;
    case 'f':
        return 0x0C;
    case 'n':
        return 0x0A;
    case 'r':
        return 0x0D;
    case 't':
        return 0x09;
    default:
        return 0;
    }
}

/// from_chars 가 out_of_range 를 낸 숫자 텍스트가 너무 큰 쪽인지 (아니면 너무 작은 쪽).
/// 첫 유효 숫자의 10진 자릿수 위치 + 지수의 부호로 판단한다.
bool isOverflowMagnitude(std::string_view text) noexcept
{
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+'))
        ++i;

    long long intDigits = 0;
    long long fracZeros = 0;
    bool seenDot = false;
    bool seenNonZero = false;
    for (; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '.')
        {
            seenDot = true;
            continue;
        }
        if (c < '0' || c > '9')
            break;
        if (!seenDot)
        {
            if (seenNonZero || c != '0')
            {
                seenNonZero = true;
                ++intDigits;
            }
        }
        else if (!seenNonZero)
        {
            if (c == '0')
                ++fracZeros;
            else
                seenNonZero = true;
        }
    }

    long long exponent = 0;
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E'))
    {
        ++i;
        bool negExp = false;
        if (i < text.size() && (text[i] == '-' || text[i] == '+'))
            negExp = text[i++] == '-';
        for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i)
        {
            if (exponent < 1'000'000'000)
                exponent = exponent * 10 + (text[i] - '0');
        }
        if (negExp)
            exponent = -exponent;
    }

    const long long magnitude = intDigits > 0 ? intDigits + exponent : exponent - fracZeros;
    return magnitude > 0;
}

} // namespace

DeError Reader::eatWhitespace(std::uint8_t &next) noexcept
{
    std::uint8_t c = 0;
    while (cur_.peek(c))
    {
        if (!isWhitespace(c))
        {
            next = c;
            return DeError::Ok;
        }
        cur_.advance(1);
    }
    return DeError::UnexpectedEof;
}

DeError Reader::end() noexcept
{
    std::uint8_t c = 0;
    if (eatWhitespace(c) == DeError::UnexpectedEof)
        return DeError::Ok;
    return DeError::TrailingCharacters;
}

DeError Reader::parseTokenContent(std::string_view token) noexcept
{
    const auto rest = cur_.rest();
    if (rest.size() < token.size())
        return DeError::UnexpectedEof;
    if (std::memcmp(rest.data(), token.data(), token.size()) != 0)
        return DeError::ExpectedToken;
    cur_.advance(token.size());
    return DeError::Ok;
}

std::size_t Reader::matchFloat() const noexcept
{
    const auto rest = cur_.rest();
    std::size_t n = 0;
    while (n < rest.size() && isNumberChar(rest[n]))
        ++n;
    return n;
}

bool Reader::numberLooksIntegral() const noexcept
{
    const auto rest = cur_.rest();
    const std::size_t n = matchFloat();
    for (std::size_t i = 0; i < n; ++i)
    {
        if (rest[i] == '.' || rest[i] == 'e' || rest[i] == 'E')
            return false;
    }
    return true;
}

template <class F>
DeError Reader::parseFloat(F &out, bool &isNull) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(eatWhitespace(c));

    isNull = false;
    if (c == 'n')
    {
        cur_.advance(1);
        ZW_TRY(parseTokenContent("ull"));
        isNull = true;
        out = std::numeric_limits<F>::quiet_NaN();
        return DeError::Ok;
    }

    const std::size_t len = matchFloat();
    const auto rest = cur_.rest();
    const char *first = reinterpret_cast<const char *>(rest.data());
    const char *last = first + len;

    // from_chars 는 '+' 를 받지 않는다. "+-1" 은 거부.
    if (first != last && *first == '+')
    {
        ++first;
        if (first != last && *first == '-')
            return DeError::InvalidNumber;
    }
    if (first == last)
        return DeError::InvalidNumber;

    F value{};
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range)
    {
        const std::string_view text(first, static_cast<std::size_t>(last - first));
        const bool negative = text.front() == '-';
        if (isOverflowMagnitude(text))
            value = negative ? -std::numeric_limits<F>::infinity() : std::numeric_limits<F>::infinity();
        else
            value = negative ? -F(0) : F(0);
    }
    else if (ec != std::errc{} || ptr != last)
    {
        return DeError::InvalidNumber;
    }

    cur_.advance(len);
    out = value;
    return DeError::Ok;
}

DeError Reader::parseFloat32(float &out, bool &isNull) noexcept
{
    return parseFloat(out, isNull);
}

DeError Reader::parseFloat64(double &out, bool &isNull) noexcept
{
    return parseFloat(out, isNull);
}

DeError Reader::eatNumber() noexcept
{
    double ignored = 0.0;
    bool isNull = false;
    return parseFloat(ignored, isNull);
}

DeError Reader::parseKeyColon() noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(eatWhitespace(c));
    if (c != ':')
        return DeError::ExpectedColon;
    cur_.advance(1);
    return DeError::Ok;
}

DeError Reader::eatStr() noexcept
{
    const auto rest = cur_.rest();
    std::size_t pos = 0;
    for (;;)
    {
        while (pos < rest.size() && rest[pos] != '"' && rest[pos] >= 0x20)
            ++pos;
        if (pos == rest.size())
            return DeError::UnexpectedEof;
        if (rest[pos] != '"')
            return DeError::StringControlChar;

        // 따옴표 앞 역슬래시가 짝수 개면 문자열 끝, 홀수 개면 escape 된 따옴표
        std::size_t backslashes = 0;
        while (backslashes < pos && rest[pos - 1 - backslashes] == '\\')
            ++backslashes;
        if (backslashes % 2 == 0)
        {
            cur_.advance(pos + 1);
            return DeError::Ok;
        }
        ++pos;
    }
}

DeError Reader::unescape(std::size_t &len, std::size_t &consumed) noexcept
{
    const std::span<std::uint8_t> buf = cur_.rest();
    std::size_t read = 0;
    std::size_t write = 0;

    for (;;)
    {
        std::size_t runEnd = read;
        while (runEnd < buf.size() && buf[runEnd] != '"' && buf[runEnd] != '\\' &&
               buf[runEnd] >= 0x20)
            ++runEnd;
        if (runEnd == buf.size())
            return DeError::UnexpectedEof;

        // escape 로 생긴 빈틈만큼 평문 구간을 앞으로 당긴다
        if (write != read)
            std::memmove(buf.data() + write, buf.data() + read, runEnd - read);
        write += runEnd - read;
        read = runEnd;
        assert(write <= read);

        const std::uint8_t c = buf[read];
        if (c == '"')
        {
            len = write;
            consumed = read + 1;
            return DeError::Ok;
        }
        if (c != '\\')
            return DeError::StringControlChar;

        if (read + 1 >= buf.size())
            return DeError::UnexpectedEof;
        const std::uint8_t esc = buf[read + 1];

        if (esc == 'u')
        {
            if (buf.size() - read < 6)
                return DeError::UnexpectedEof;
            char32_t code = 0;
            for (std::size_t k = 2; k < 6; ++k)
            {
                std::uint8_t nib = 0;
                if (!codec::parseHexNibble(buf[read + k], nib))
                    return DeError::InvalidEscapeSequence;
                code = (code << 4) | nib;
            }
            // UTF-16 코드 유닛 하나를 그대로 인코드한다. surrogate 는 조합하지 않고 거부.
            std::uint8_t utf8[4]{};
            const std::size_t n = codec::encodeUtf8(code, utf8);
            if (n == 0)
                return DeError::InvalidUnicodeCodePoint;
            // n <= 3 < 6: 쓰기 위치는 읽기 위치를 넘지 않는다
            assert(write + n <= read + 6);
            std::memcpy(buf.data() + write, utf8, n);
            write += n;
            read += 6;
            continue;
        }

        const std::uint8_t unescaped = unescapeChar(esc);
        if (unescaped == 0)
            return DeError::InvalidEscapeSequence;
        buf[write++] = unescaped;
        read += 2;
    }
}

DeError Reader::parseStrBytesContent(std::span<const std::uint8_t> &out) noexcept
{
    std::size_t len = 0;
    std::size_t consumed = 0;
    ZW_TRY(unescape(len, consumed));
    out = cur_.takeSpan(len, consumed - len);
    return DeError::Ok;
}

DeError Reader::parseStrContent(std::string_view &out) noexcept
{
    std::span<const std::uint8_t> bytes;
    ZW_TRY(parseStrBytesContent(bytes));
    if (!codec::isValidUtf8(bytes))
        return DeError::InvalidUnicodeCodePoint;
    out = std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    return DeError::Ok;
}

DeError Reader::parseHexBytesContent(std::span<const std::uint8_t> &out) noexcept
{
    const std::span<std::uint8_t> buf = cur_.rest();
    std::size_t decoded = 0;
    std::size_t consumed = 0;
    if (!codec::hexDecodeInPlace(buf, decoded, consumed))
        return DeError::UnexpectedChar;
    if (consumed >= buf.size() || buf[consumed] != '"')
        return DeError::UnexpectedChar;
    out = cur_.takeSpan(decoded, consumed + 1 - decoded);
    return DeError::Ok;
}

DeError Reader::parseBase64BytesContent(std::span<const std::uint8_t> &out) noexcept
{
    const std::span<std::uint8_t> buf = cur_.rest();
    const codec::Base64Decoded res = codec::base64DecodeInPlace(buf);

    std::size_t pos = res.encoded;
    for (int pad = 0; pad < 2 && pos < buf.size() && buf[pos] == '='; ++pad)
        ++pos;
    if (pos >= buf.size() || buf[pos] != '"')
        return DeError::UnexpectedChar;
    out = cur_.takeSpan(res.decoded, pos + 1 - res.decoded);
    return DeError::Ok;
}

DeError Reader::parseArrayBytesContent(std::span<const std::uint8_t> &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(eatWhitespace(c));
    if (c == ']')
    {
        out = cur_.takeSpan(0, 1);
        return DeError::Ok;
    }

    const std::size_t start = cur_.position();
    std::size_t write = start;
    for (;;)
    {
        std::uint8_t byte = 0;
        ZW_TRY(parseUnsigned(byte));
        // 숫자는 최소 한 글자이므로 쓰기 위치는 항상 읽기 위치 뒤에 있다
        assert(write < cur_.position());
        cur_.view()[write++] = byte;

        ZW_TRY(eatWhitespace(c));
        if (c == ']')
            break;
        if (c != ',')
            return DeError::UnexpectedChar;
        cur_.advance(1);
    }

    const std::size_t close = cur_.position();
    cur_.rewind(start);
    out = cur_.takeSpan(write - start, close + 1 - write);
    return DeError::Ok;
}

bool Reader::startsWith(std::string_view prefix) const noexcept
{
    const auto rest = cur_.rest();
    return rest.size() >= prefix.size() &&
           std::memcmp(rest.data(), prefix.data(), prefix.size()) == 0;
}

} // namespace zerowire::json
