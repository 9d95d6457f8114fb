#pragma once

#include <zerowire/codec/Base64.hpp>
#include <zerowire/codec/Hex.hpp>
#include <zerowire/sink/ByteSink.hpp>

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::json
{

/// 바이트 필드를 JSON 텍스트로 쓰는 전략. 실패(false)는 싱크 용량 부족뿐입니다.
template <class B>
concept ByteEncoder = requires(sink::SliceWriter &w, std::span<const std::uint8_t> bytes) {
    { B::encode(w, bytes) } -> std::same_as<bool>;
};

namespace detail
{
// 스택 청크 단위로 인코드해서 힙을 쓰지 않는다
inline constexpr std::size_t kHexChunk = 64;
inline constexpr std::size_t kBase64Chunk = 48; // 3 의 배수

template <sink::ByteSink W>
bool writeHex(W &w, std::span<const std::uint8_t> bytes)
{
    std::array<char, kHexChunk * 2> text{};
    while (!bytes.empty())
    {
        const std::size_t n = bytes.size() < kHexChunk ? bytes.size() : kHexChunk;
        const std::size_t len = codec::hexEncode(bytes.first(n), text);
        if (!w.writeStr(std::string_view(text.data(), len)))
            return false;
        bytes = bytes.subspan(n);
    }
    return true;
}

template <sink::ByteSink W>
bool writeBase64(W &w, std::span<const std::uint8_t> bytes)
{
    std::array<char, codec::base64EncodedLen(kBase64Chunk)> text{};
    while (!bytes.empty())
    {
        const std::size_t n = bytes.size() < kBase64Chunk ? bytes.size() : kBase64Chunk;
        (void)codec::base64Encode(bytes.first(n), text.data());
        if (!w.writeStr(std::string_view(text.data(), codec::base64EncodedLen(n))))
            return false;
        bytes = bytes.subspan(n);
    }
    return true;
}
} // namespace detail

/// [1,2,3] (기본값)
struct ArrayByteEncoder
{
    template <sink::ByteSink W>
    static bool encode(W &w, std::span<const std::uint8_t> bytes)
    {
        if (!w.writeByte('['))
            return false;
        char digits[3];
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            if (i != 0 && !w.writeByte(','))
                return false;
            const auto res = std::to_chars(digits, digits + sizeof(digits), bytes[i]);
            if (!w.writeStr(std::string_view(digits, static_cast<std::size_t>(res.ptr - digits))))
                return false;
        }
        return w.writeByte(']');
    }
};

/// "0102" (대문자)
struct HexStrByteEncoder
{
    template <sink::ByteSink W>
    static bool encode(W &w, std::span<const std::uint8_t> bytes)
    {
        return w.writeByte('"') && detail::writeHex(w, bytes) && w.writeByte('"');
    }
};

/// "AQID" (패딩 없음)
struct Base64ByteEncoder
{
    template <sink::ByteSink W>
    static bool encode(W &w, std::span<const std::uint8_t> bytes)
    {
        return w.writeByte('"') && detail::writeBase64(w, bytes) && w.writeByte('"');
    }
};

/// 바이트를 그대로 싣는다. 따옴표도 이스케이프도 없다 (호출자가 유효성을 책임진다).
struct PassThroughByteEncoder
{
    template <sink::ByteSink W>
    static bool encode(W &w, std::span<const std::uint8_t> bytes)
    {
        return w.write(bytes);
    }
};

struct HexPrefix
{
    static constexpr std::string_view value = "hex,";
};

struct Base64Prefix
{
    static constexpr std::string_view value = "base64,";
};

/// "hex,0102". P::value 가 따옴표 바로 뒤에 붙는다.
template <class P = HexPrefix>
struct PrefixedHexByteEncoder
{
    template <sink::ByteSink W>
    static bool encode(W &w, std::span<const std::uint8_t> bytes)
    {
        return w.writeByte('"') && w.writeStr(P::value) && detail::writeHex(w, bytes) &&
               w.writeByte('"');
    }
};

/// "base64,AQID"
template <class P = Base64Prefix>
struct PrefixedBase64ByteEncoder
{
    template <sink::ByteSink W>
    static bool encode(W &w, std::span<const std::uint8_t> bytes)
    {
        return w.writeByte('"') && w.writeStr(P::value) && detail::writeBase64(w, bytes) &&
               w.writeByte('"');
    }
};

static_assert(ByteEncoder<ArrayByteEncoder>);
static_assert(ByteEncoder<HexStrByteEncoder>);
static_assert(ByteEncoder<Base64ByteEncoder>);
static_assert(ByteEncoder<PassThroughByteEncoder>);
static_assert(ByteEncoder<PrefixedHexByteEncoder<>>);
static_assert(ByteEncoder<PrefixedBase64ByteEncoder<>>);

} // namespace zerowire::json
