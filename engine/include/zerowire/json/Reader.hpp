#pragma once

#include <zerowire/buffer/Cursor.hpp>
#include <zerowire/json/Error.hpp>
#include <zerowire/serde/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

namespace zerowire::json
{

/**
 * @brief 가변 버퍼 위의 JSON 렉서입니다.
 *
 * [메모리 정책]
 * - 문자열 unescape, hex/base64/배열 바이트 디코드는 모두 입력 버퍼 안에서 제자리로 합니다.
 * - 결과는 같은 버퍼를 가리키는 span 이며, 커서는 takeSpan() 으로 결과 뒤의 새 뷰로 옮겨갑니다.
 * - 압축(compaction)은 (read, write) 두 인덱스로 하고 항상 write <= read 입니다.
 *
 * [오류 정책]
 * - 모든 함수는 DeError 를 돌려주며 첫 오류에서 멈춥니다. 실패 후 버퍼 내용은 신뢰할 수 없습니다.
 *
 * *Content 함수는 여는 따옴표('"' 또는 '[')를 이미 먹은 상태에서 부릅니다.
 */
class Reader
{
  public:
    explicit Reader(std::span<std::uint8_t> input) noexcept : cur_(input) {}

    /// 다음 바이트 (공백 포함). 입력 끝이면 UnexpectedEof.
    [[nodiscard]] DeError peek(std::uint8_t &out) const noexcept
    {
        return cur_.peek(out) ? DeError::Ok : DeError::UnexpectedEof;
    }

    void eatSome(std::size_t n) noexcept { cur_.advance(n); }

    /// 공백(SP, TAB, CR, LF)을 건너뛰고 다음 의미 있는 바이트를 돌려줍니다.
    [[nodiscard]] DeError eatWhitespace(std::uint8_t &next) noexcept;

    /// 남은 입력이 공백뿐이어야 성공 (TrailingCharacters)
    [[nodiscard]] DeError end() noexcept;

    /// token 과 정확히 일치해야 한다. 짧으면 UnexpectedEof, 다르면 ExpectedToken.
    [[nodiscard]] DeError parseTokenContent(std::string_view token) noexcept;

    template <class T>
    [[nodiscard]] DeError parseUnsigned(T &out) noexcept;

    template <class T>
    [[nodiscard]] DeError parseSigned(T &out) noexcept;

    /// null 이면 isNull = true, out = NaN
    [[nodiscard]] DeError parseFloat32(float &out, bool &isNull) noexcept;
    [[nodiscard]] DeError parseFloat64(double &out, bool &isNull) noexcept;

    /// 숫자(또는 null) 하나를 f64 로 검증하고 버린다
    [[nodiscard]] DeError eatNumber() noexcept;

    /// 커서 위치의 숫자 텍스트에 '.', 'e', 'E' 가 없으면 true
    [[nodiscard]] bool numberLooksIntegral() const noexcept;

    /// 공백 뒤 ':' 를 먹는다 (ExpectedColon)
    [[nodiscard]] DeError parseKeyColon() noexcept;

    /// 문자열 내용을 검증만 하고 버린다 (짝수/홀수 역슬래시 규칙)
    [[nodiscard]] DeError eatStr() noexcept;

    /// unescape + UTF-8 검증. 닫는 따옴표까지 먹는다.
    [[nodiscard]] DeError parseStrContent(std::string_view &out) noexcept;

    /// unescape 만 하고 바이트로 돌려준다
    [[nodiscard]] DeError parseStrBytesContent(std::span<const std::uint8_t> &out) noexcept;

    /// hex 쌍 다음에 바로 '"'
    [[nodiscard]] DeError parseHexBytesContent(std::span<const std::uint8_t> &out) noexcept;

    /// base64 다음에 '=' 0~2개, 그리고 '"'
    [[nodiscard]] DeError parseBase64BytesContent(std::span<const std::uint8_t> &out) noexcept;

    /// 쉼표로 구분된 0..255 숫자들 다음에 ']'. 값은 배열 텍스트 자리에 제자리로 기록된다.
    [[nodiscard]] DeError parseArrayBytesContent(std::span<const std::uint8_t> &out) noexcept;

    /// 남은 입력이 prefix 로 시작하는지 (공백 건너뛰지 않음)
    [[nodiscard]] bool startsWith(std::string_view prefix) const noexcept;

    [[nodiscard]] std::size_t remaining() const noexcept { return cur_.remaining(); }

  protected:
    buffer::MutCursor cur_;

  private:
    template <class T>
    [[nodiscard]] DeError accumulate(T value, bool negative, T &out) noexcept;

    template <class F>
    [[nodiscard]] DeError parseFloat(F &out, bool &isNull) noexcept;

    /// 숫자를 이루는 글자 [0-9+-.eE] 의 길이
    [[nodiscard]] std::size_t matchFloat() const noexcept;

    /// 두 인덱스 unescape. len = 결과 길이, consumed = 닫는 따옴표 다음까지 읽은 길이
    [[nodiscard]] DeError unescape(std::size_t &len, std::size_t &consumed) noexcept;
};

// ---------------------------------------------------------------------------
// 정수: 모든 폭이 하나의 누산 루틴을 공유한다 (value*10 +/- digit, 폭별 overflow 검사)
// ---------------------------------------------------------------------------

template <class T>
DeError Reader::accumulate(T value, bool negative, T &out) noexcept
{
    constexpr T kMax = std::numeric_limits<T>::max();
    constexpr T kMin = std::numeric_limits<T>::min();

    std::uint8_t c = 0;
    while (cur_.peek(c) && c >= '0' && c <= '9')
    {
        const auto d = static_cast<T>(c - '0');
        if (negative)
        {
            if (value < static_cast<T>((kMin + d) / 10))
                return DeError::InvalidNumber;
            value = static_cast<T>(value * 10 - d);
        }
        else
        {
            if (value > static_cast<T>((kMax - d) / 10))
                return DeError::InvalidNumber;
            value = static_cast<T>(value * 10 + d);
        }
        cur_.advance(1);
    }
    out = value;
    return DeError::Ok;
}

template <class T>
DeError Reader::parseUnsigned(T &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(eatWhitespace(c));

    if (c == '-')
        return DeError::InvalidNumber;
    if (c == '0')
    {
        // 선행 0 은 그 자체로 끝. "01" 의 '1' 은 뒤따르는 글자로 남는다.
        cur_.advance(1);
        out = 0;
        return DeError::Ok;
    }
    if (c < '1' || c > '9')
        return DeError::InvalidType;

    cur_.advance(1);
    return accumulate(static_cast<T>(c - '0'), false, out);
}

template <class T>
DeError Reader::parseSigned(T &out) noexcept
{
    std::uint8_t c = 0;
    ZW_TRY(eatWhitespace(c));

    bool negative = false;
    if (c == '-')
    {
        negative = true;
        cur_.advance(1);
        ZW_TRY(peek(c));
    }
    if (c == '0')
    {
        cur_.advance(1);
        out = 0;
        return DeError::Ok;
    }
    if (c < '1' || c > '9')
        return DeError::InvalidType;

    cur_.advance(1);
    const auto first = static_cast<T>(c - '0');
    return accumulate(negative ? static_cast<T>(-first) : first, negative, out);
}

} // namespace zerowire::json
