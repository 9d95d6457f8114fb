#pragma once

#include <zerowire/msgpack/Deserializer.hpp>
#include <zerowire/msgpack/Error.hpp>
#include <zerowire/msgpack/Serializer.hpp>
#include <zerowire/serde/Deserialize.hpp>
#include <zerowire/serde/Error.hpp>
#include <zerowire/serde/Serialize.hpp>
#include <zerowire/sink/ByteSink.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace zerowire::msgpack
{

/// input 앞에서 값 하나를 읽고, 사용한 바이트 수를 consumed 에 돌려줍니다.
/// 뒤에 남은 바이트는 오류가 아닙니다 (다음 메시지).
template <class T>
[[nodiscard]] DeError fromSlice(std::span<const std::uint8_t> input, T &out, std::size_t &consumed,
                                serde::ErrorMessage *message = nullptr,
                                std::size_t maxDepth = Deserializer::kDefaultMaxDepth)
{
    Deserializer de(input, maxDepth);
    const DeError err = serde::deserialize(de, out);
    if (err == DeError::Custom && message != nullptr)
        *message = de.errorMessage();
    consumed = input.size() - de.end();
    return err;
}

/// fromSlice 와 같지만 읽지 않은 나머지를 tail 로 돌려줍니다.
template <class T>
[[nodiscard]] DeError fromSliceSplitTail(std::span<const std::uint8_t> input, T &out,
                                         std::span<const std::uint8_t> &tail,
                                         serde::ErrorMessage *message = nullptr)
{
    std::size_t consumed = 0;
    const DeError err = fromSlice(input, out, consumed, message);
    tail = input.subspan(consumed);
    return err;
}

template <class Profile, sink::ByteSink W, class T>
[[nodiscard]] SerError toWriterWithProfile(W &writer, const T &value,
                                           serde::ErrorMessage *message = nullptr)
{
    Serializer<W, Profile> ser(writer);
    const SerError err = serde::serialize(value, ser);
    if (err == SerError::Custom && message != nullptr)
        *message = ser.errorMessage();
    return err;
}

template <sink::ByteSink W, class T>
[[nodiscard]] SerError toWriter(W &writer, const T &value, serde::ErrorMessage *message = nullptr)
{
    return toWriterWithProfile<CompactProfile>(writer, value, message);
}

template <sink::ByteSink W, class T>
[[nodiscard]] SerError toWriterNamed(W &writer, const T &value,
                                     serde::ErrorMessage *message = nullptr)
{
    return toWriterWithProfile<NamedProfile>(writer, value, message);
}

/// out 뒤에 덧붙입니다 (compact profile)
template <class T>
[[nodiscard]] SerError toVector(const T &value, std::vector<std::uint8_t> &out)
{
    sink::VectorWriter writer(out);
    return toWriter(writer, value);
}

template <class T>
[[nodiscard]] SerError toVectorNamed(const T &value, std::vector<std::uint8_t> &out)
{
    sink::VectorWriter writer(out);
    return toWriterNamed(writer, value);
}

} // namespace zerowire::msgpack
