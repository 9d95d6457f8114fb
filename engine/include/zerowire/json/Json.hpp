#pragma once

#include <zerowire/json/ByteDecoder.hpp>
#include <zerowire/json/ByteEncoder.hpp>
#include <zerowire/json/Deserializer.hpp>
#include <zerowire/json/Error.hpp>
#include <zerowire/json/Serializer.hpp>
#include <zerowire/serde/Deserialize.hpp>
#include <zerowire/serde/Error.hpp>
#include <zerowire/serde/Serialize.hpp>
#include <zerowire/sink/ByteSink.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace zerowire::json
{

/// input 전체를 값 하나로 읽습니다. 값 뒤에는 공백만 올 수 있습니다.
/// input 은 제자리에서 다시 쓰이며, out 이 빌린 문자열/바이트는 input 을 가리킵니다.
/// Custom 오류면 message 에 본문을 복사합니다 (nullptr 이면 버림).
/// maxDepth 는 '[' / '{' 중첩 상한입니다.
template <ByteDecoder D, class T>
[[nodiscard]] DeError fromMutSliceWithDecoder(
    std::span<std::uint8_t> input, T &out, serde::ErrorMessage *message = nullptr,
    std::size_t maxDepth = Deserializer<D>::kDefaultMaxDepth)
{
    Deserializer<D> de(input, maxDepth);
    DeError err = serde::deserialize(de, out);
    if (err == DeError::Ok)
        err = de.end();
    if (err == DeError::Custom && message != nullptr)
        *message = de.errorMessage();
    return err;
}

template <class T>
[[nodiscard]] DeError fromMutSlice(std::span<std::uint8_t> input, T &out,
                                   serde::ErrorMessage *message = nullptr,
                                   std::size_t maxDepth = Deserializer<>::kDefaultMaxDepth)
{
    return fromMutSliceWithDecoder<HexStrByteDecoder>(input, out, message, maxDepth);
}

template <ByteEncoder B, sink::ByteSink W, class T>
[[nodiscard]] SerError toWriterWithEncoder(W &writer, const T &value,
                                           serde::ErrorMessage *message = nullptr)
{
    Serializer<W, B> ser(writer);
    const SerError err = serde::serialize(value, ser);
    if (err == SerError::Custom && message != nullptr)
        *message = ser.errorMessage();
    return err;
}

template <sink::ByteSink W, class T>
[[nodiscard]] SerError toWriter(W &writer, const T &value, serde::ErrorMessage *message = nullptr)
{
    return toWriterWithEncoder<ArrayByteEncoder>(writer, value, message);
}

/// out 뒤에 덧붙입니다
template <class T>
[[nodiscard]] SerError toString(const T &value, std::string &out)
{
    sink::StringWriter writer(out);
    return toWriter(writer, value);
}

template <class T>
[[nodiscard]] SerError toStringHex(const T &value, std::string &out)
{
    sink::StringWriter writer(out);
    return toWriterWithEncoder<HexStrByteEncoder>(writer, value);
}

template <class T>
[[nodiscard]] SerError toStringBase64(const T &value, std::string &out)
{
    sink::StringWriter writer(out);
    return toWriterWithEncoder<Base64ByteEncoder>(writer, value);
}

template <class T>
[[nodiscard]] SerError toStringPassBytes(const T &value, std::string &out)
{
    sink::StringWriter writer(out);
    return toWriterWithEncoder<PassThroughByteEncoder>(writer, value);
}

} // namespace zerowire::json
