#pragma once

#include <zerowire/json/Error.hpp>
#include <zerowire/json/Reader.hpp>

#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::json
{

/// '"' 로 시작하는 바이트 필드를 어떻게 해석할지 고르는 전략.
/// 여는 따옴표를 먹은 뒤에 불리며, 닫는 따옴표까지 소비해야 합니다.
/// Deserializer 의 템플릿 인자로 한 번 정해지면 그 호출 전체에 똑같이 적용됩니다.
template <class D>
concept ByteDecoder = requires(Reader &rd, std::span<const std::uint8_t> &out) {
    { D::decode(rd, out) } -> std::same_as<DeError>;
};

/// 문자열과 똑같이 unescape 한 내용을 그대로 바이트로
struct StringByteDecoder
{
    static DeError decode(Reader &rd, std::span<const std::uint8_t> &out) noexcept
    {
        return rd.parseStrBytesContent(out);
    }
};

/// hex 쌍 (기본값)
struct HexStrByteDecoder
{
    static DeError decode(Reader &rd, std::span<const std::uint8_t> &out) noexcept
    {
        return rd.parseHexBytesContent(out);
    }
};

struct Base64ByteDecoder
{
    static DeError decode(Reader &rd, std::span<const std::uint8_t> &out) noexcept
    {
        return rd.parseBase64BytesContent(out);
    }
};

/// "base64,..." / "hex,..." 접두어를 보고 고른다. 접두어가 없으면 문자열 내용 그대로.
struct PrefixByteDecoder
{
    static constexpr std::string_view kBase64Prefix = "base64,";
    static constexpr std::string_view kHexPrefix = "hex,";

    static DeError decode(Reader &rd, std::span<const std::uint8_t> &out) noexcept
    {
        if (rd.startsWith(kBase64Prefix))
        {
            rd.eatSome(kBase64Prefix.size());
            return rd.parseBase64BytesContent(out);
        }
        if (rd.startsWith(kHexPrefix))
        {
            rd.eatSome(kHexPrefix.size());
            return rd.parseHexBytesContent(out);
        }
        return rd.parseStrBytesContent(out);
    }
};

static_assert(ByteDecoder<StringByteDecoder>);
static_assert(ByteDecoder<HexStrByteDecoder>);
static_assert(ByteDecoder<Base64ByteDecoder>);
static_assert(ByteDecoder<PrefixByteDecoder>);

} // namespace zerowire::json
