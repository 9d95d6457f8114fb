#pragma once

#include <zerowire/codec/Endian.hpp>
#include <zerowire/codec/Utf8.hpp>
#include <zerowire/msgpack/Error.hpp>
#include <zerowire/msgpack/Magic.hpp>
#include <zerowire/serde/Error.hpp>
#include <zerowire/serde/Serialize.hpp>
#include <zerowire/sink/ByteSink.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <string_view>

namespace zerowire::msgpack
{

/// 구조체는 array (이름 없음), enum variant 는 인덱스로 싣는다
struct CompactProfile
{
    static constexpr bool kStructAsMap = false;
    static constexpr bool kVariantByName = false;
};

/// 구조체는 필드 이름을 키로 한 map, enum variant 는 이름으로 싣는다
struct NamedProfile
{
    static constexpr bool kStructAsMap = true;
    static constexpr bool kVariantByName = true;
};

/**
 * @brief 싱크에 MessagePack 을 쓰는 직렬화기입니다.
 *
 * [Wire Format]
 * - 정수는 값을 표현할 수 있는 가장 짧은 태그로 씁니다.
 *   signed  : fixint[-32,127] -> int8 -> uint8 -> int16 -> uint16 -> int32 -> uint32 -> int64
 *   unsigned: fixint[0,127] -> uint8 -> uint16 -> uint32 -> uint64
 * - str / bin / array / map 길이 헤더도 같은 규칙 (fix 형 -> 8 -> 16 -> 32).
 * - payload 를 가진 enum variant: 0x81, 식별자, payload
 *
 * seq / map 은 길이를 미리 알아야 하며, end() 에서 실제 개수와 다르면 SeqLength / MapLength.
 */
template <sink::ByteSink W, class Profile = CompactProfile>
class Serializer : public serde::ErrorReporting<Serializer<W, Profile>, SerError>
{
  public:
    using Error = SerError;

    class Compound
    {
      public:
        using Error = SerError;

        enum class Kind : std::uint8_t
        {
            Seq,   // 개수 검사
            Map,   // 개수 검사
            Tuple, // 길이 고정
            Struct,
        };

        Compound() noexcept = default;
        Compound(Serializer *ser, Kind kind, std::size_t len) noexcept
            : ser_(ser), kind_(kind), len_(len)
        {
        }

        template <class T>
        SerError serializeElement(const T &v)
        {
            if (kind_ == Kind::Seq)
            {
                if (len_ == 0)
                    return SerError::SeqLength;
                --len_;
            }
            return serde::serialize(v, *ser_);
        }

        template <class K>
        SerError serializeKey(const K &key)
        {
            if (len_ == 0)
                return SerError::MapLength;
            --len_;
            return serde::serialize(key, *ser_);
        }

        template <class V>
        SerError serializeValue(const V &v)
        {
            return serde::serialize(v, *ser_);
        }

        template <class V>
        SerError serializeField(std::string_view name, const V &v)
        {
            if constexpr (Profile::kStructAsMap)
                ZW_TRY(ser_->writeStr(name));
            return serde::serialize(v, *ser_);
        }

        SerError end() const noexcept
        {
            if (len_ == 0)
                return SerError::Ok;
            return kind_ == Kind::Map ? SerError::MapLength : SerError::SeqLength;
        }

      private:
        Serializer *ser_{nullptr};
        Kind kind_{Kind::Tuple};
        std::size_t len_{0};
    };

    using SerializeSeq = Compound;
    using SerializeTuple = Compound;
    using SerializeMap = Compound;
    using SerializeStruct = Compound;
    using SerializeTupleVariant = Compound;
    using SerializeStructVariant = Compound;

    explicit Serializer(W &writer) noexcept : w_(writer) {}

    [[nodiscard]] W &writer() noexcept { return w_; }
    [[nodiscard]] serde::ErrorMessage &errorMessage() noexcept { return message_; }
    [[nodiscard]] std::string_view customMessage() const noexcept { return message_.view(); }

    SerError serializeBool(bool v) { return put(v ? tag::kTrue : tag::kFalse); }

    SerError serializeI8(std::int8_t v) { return writeSigned(v); }
    SerError serializeI16(std::int16_t v) { return writeSigned(v); }
    SerError serializeI32(std::int32_t v) { return writeSigned(v); }
    SerError serializeI64(std::int64_t v) { return writeSigned(v); }

    SerError serializeU8(std::uint8_t v) { return writeUnsigned(v); }
    SerError serializeU16(std::uint16_t v) { return writeUnsigned(v); }
    SerError serializeU32(std::uint32_t v) { return writeUnsigned(v); }
    SerError serializeU64(std::uint64_t v) { return writeUnsigned(v); }

    SerError serializeF32(float v)
    {
        std::uint8_t buf[5] = {tag::kFloat32};
        codec::storeF32Be(v, buf + 1);
        return putBytes(buf);
    }

    SerError serializeF64(double v)
    {
        std::uint8_t buf[9] = {tag::kFloat64};
        codec::storeF64Be(v, buf + 1);
        return putBytes(buf);
    }

    SerError serializeChar(char32_t v)
    {
        std::uint8_t utf8[4]{};
        const std::size_t n = codec::encodeUtf8(v, utf8);
        if (n == 0)
            return this->custom("invalid char U+{:X}", static_cast<std::uint32_t>(v));
        return writeStr(std::string_view(reinterpret_cast<const char *>(utf8), n));
    }

    SerError serializeStr(std::string_view v) { return writeStr(v); }

    SerError serializeBytes(std::span<const std::uint8_t> v)
    {
        const std::size_t n = v.size();
        if (n <= std::numeric_limits<std::uint8_t>::max())
        {
            ZW_TRY(put(tag::kBin8));
            ZW_TRY(put(static_cast<std::uint8_t>(n)));
        }
        else if (n <= std::numeric_limits<std::uint16_t>::max())
        {
            ZW_TRY(writeTagU16(tag::kBin16, static_cast<std::uint16_t>(n)));
        }
        else if (n <= std::numeric_limits<std::uint32_t>::max())
        {
            ZW_TRY(writeTagU32(tag::kBin32, static_cast<std::uint32_t>(n)));
        }
        else
        {
            return SerError::DataLength;
        }
        return w_.write(v) ? SerError::Ok : SerError::Writer;
    }

    SerError serializeNone() { return put(tag::kNil); }

    template <class T>
    SerError serializeSome(const T &v)
    {
        return serde::serialize(v, *this);
    }

    SerError serializeUnit() { return put(tag::kNil); }
    SerError serializeUnitStruct(std::string_view) { return put(tag::kNil); }

    SerError serializeUnitVariant(std::string_view, std::uint32_t index, std::string_view variant)
    {
        return writeVariant(index, variant);
    }

    template <class T>
    SerError serializeNewtypeStruct(std::string_view, const T &v)
    {
        return serde::serialize(v, *this);
    }

    template <class T>
    SerError serializeNewtypeVariant(std::string_view, std::uint32_t index,
                                     std::string_view variant, const T &v)
    {
        ZW_TRY(put(tag::kFixMap1));
        ZW_TRY(writeVariant(index, variant));
        return serde::serialize(v, *this);
    }

    SerError serializeSeq(std::optional<std::size_t> len, Compound &out)
    {
        if (!len)
            return SerError::SeqLength;
        ZW_TRY(writeArrayLen(*len));
        out = Compound(this, Compound::Kind::Seq, *len);
        return SerError::Ok;
    }

    SerError serializeTuple(std::size_t len, Compound &out)
    {
        ZW_TRY(writeArrayLen(len));
        out = Compound(this, Compound::Kind::Tuple, 0);
        return SerError::Ok;
    }

    SerError serializeMap(std::optional<std::size_t> len, Compound &out)
    {
        if (!len)
            return SerError::MapLength;
        ZW_TRY(writeMapLen(*len));
        out = Compound(this, Compound::Kind::Map, *len);
        return SerError::Ok;
    }

    SerError serializeStruct(std::string_view, std::size_t len, Compound &out)
    {
        if constexpr (Profile::kStructAsMap)
            ZW_TRY(writeMapLen(len));
        else
            ZW_TRY(writeArrayLen(len));
        out = Compound(this, Compound::Kind::Struct, 0);
        return SerError::Ok;
    }

    SerError serializeTupleVariant(std::string_view, std::uint32_t index, std::string_view variant,
                                   std::size_t len, Compound &out)
    {
        ZW_TRY(put(tag::kFixMap1));
        ZW_TRY(writeVariant(index, variant));
        return serializeTuple(len, out);
    }

    SerError serializeStructVariant(std::string_view name, std::uint32_t index,
                                    std::string_view variant, std::size_t len, Compound &out)
    {
        ZW_TRY(put(tag::kFixMap1));
        ZW_TRY(writeVariant(index, variant));
        return serializeStruct(name, len, out);
    }

    /// 길이를 먼저 재고(포맷 1회), 헤더를 쓴 뒤 다시 포맷하며 바로 싱크로 보낸다
    template <typename... Args>
    SerError collectStr(std::format_string<Args...> fmt, Args &&...args)
    {
        try
        {
            CountingOut counter;
            counter = std::vformat_to(counter, fmt.get(), std::make_format_args(args...));
            ZW_TRY(writeStrLen(counter.count()));

            writeFailed_ = false;
            std::vformat_to(SinkOut(this), fmt.get(), std::make_format_args(args...));
        }
        catch (const std::format_error &)
        {
            return SerError::FormatError;
        }
        return writeFailed_ ? SerError::Writer : SerError::Ok;
    }

    // ---- 저수준 출력 ----

    SerError put(std::uint8_t b) { return w_.writeByte(b) ? SerError::Ok : SerError::Writer; }

    template <std::size_t N>
    SerError putBytes(const std::uint8_t (&buf)[N])
    {
        return w_.write(std::span<const std::uint8_t>(buf, N)) ? SerError::Ok : SerError::Writer;
    }

    SerError writeSigned(std::int64_t v)
    {
        if (v >= tag::kMinNegFixInt && v <= tag::kMaxPosFixInt)
            return put(static_cast<std::uint8_t>(v));
        if (v >= std::numeric_limits<std::int8_t>::min() && v < 0)
        {
            const std::uint8_t buf[2] = {tag::kInt8, static_cast<std::uint8_t>(v)};
            return putBytes(buf);
        }
        if (v >= 0)
            return writeUnsignedWide(static_cast<std::uint64_t>(v), false);
        if (v >= std::numeric_limits<std::int16_t>::min())
            return writeTagU16(tag::kInt16, static_cast<std::uint16_t>(v));
        if (v >= std::numeric_limits<std::int32_t>::min())
            return writeTagU32(tag::kInt32, static_cast<std::uint32_t>(v));
        return writeTagU64(tag::kInt64, static_cast<std::uint64_t>(v));
    }

    SerError writeUnsigned(std::uint64_t v) { return writeUnsignedWide(v, true); }

    SerError writeStr(std::string_view s)
    {
        ZW_TRY(writeStrLen(s.size()));
        return w_.writeStr(s) ? SerError::Ok : SerError::Writer;
    }

  private:
    class CountingOut
    {
      public:
        using difference_type = std::ptrdiff_t;

        CountingOut &operator*() noexcept { return *this; }
        CountingOut &operator++() noexcept { return *this; }
        CountingOut operator++(int) noexcept { return *this; }
        CountingOut &operator=(char) noexcept
        {
            ++count_;
            return *this;
        }

        [[nodiscard]] std::size_t count() const noexcept { return count_; }

      private:
        std::size_t count_{0};
    };

    class SinkOut
    {
      public:
        using difference_type = std::ptrdiff_t;

        SinkOut() noexcept = default;
        explicit SinkOut(Serializer *ser) noexcept : ser_(ser) {}

        SinkOut &operator*() noexcept { return *this; }
        SinkOut &operator++() noexcept { return *this; }
        SinkOut operator++(int) noexcept { return *this; }
        SinkOut &operator=(char c)
        {
            if (!ser_->writeFailed_ && !ser_->w_.writeByte(static_cast<std::uint8_t>(c)))
                ser_->writeFailed_ = true;
            return *this;
        }

      private:
        Serializer *ser_{nullptr};
    };

    // signed 에서 온 양수는 같은 폭이면 intN 이 uintN 보다 먼저다 (int8 은 음수만)
    SerError writeUnsignedWide(std::uint64_t v, bool unsignedSource)
    {
        if (v <= tag::kMaxPosFixInt)
            return put(static_cast<std::uint8_t>(v));
        if (v <= std::numeric_limits<std::uint8_t>::max())
        {
            const std::uint8_t buf[2] = {tag::kUInt8, static_cast<std::uint8_t>(v)};
            return putBytes(buf);
        }
        if (!unsignedSource && v <= static_cast<std::uint64_t>(std::numeric_limits<std::int16_t>::max()))
            return writeTagU16(tag::kInt16, static_cast<std::uint16_t>(v));
        if (v <= std::numeric_limits<std::uint16_t>::max())
            return writeTagU16(tag::kUInt16, static_cast<std::uint16_t>(v));
        if (!unsignedSource && v <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()))
            return writeTagU32(tag::kInt32, static_cast<std::uint32_t>(v));
        if (v <= std::numeric_limits<std::uint32_t>::max())
            return writeTagU32(tag::kUInt32, static_cast<std::uint32_t>(v));
        if (!unsignedSource)
            return writeTagU64(tag::kInt64, v);
        return writeTagU64(tag::kUInt64, v);
    }

    SerError writeTagU16(std::uint8_t t, std::uint16_t v)
    {
        std::uint8_t buf[3] = {t};
        codec::storeU16Be(v, buf + 1);
        return putBytes(buf);
    }

    SerError writeTagU32(std::uint8_t t, std::uint32_t v)
    {
        std::uint8_t buf[5] = {t};
        codec::storeU32Be(v, buf + 1);
        return putBytes(buf);
    }

    SerError writeTagU64(std::uint8_t t, std::uint64_t v)
    {
        std::uint8_t buf[9] = {t};
        codec::storeU64Be(v, buf + 1);
        return putBytes(buf);
    }

    SerError writeVariant(std::uint32_t index, std::string_view variant)
    {
        if constexpr (Profile::kVariantByName)
            return writeStr(variant);
        else
            return writeUnsigned(index);
    }

    SerError writeStrLen(std::size_t len)
    {
        if (len <= kMaxFixStrSize)
            return put(static_cast<std::uint8_t>(tag::kFixStr | len));
        if (len <= std::numeric_limits<std::uint8_t>::max())
        {
            const std::uint8_t buf[2] = {tag::kStr8, static_cast<std::uint8_t>(len)};
            return putBytes(buf);
        }
        if (len <= std::numeric_limits<std::uint16_t>::max())
            return writeTagU16(tag::kStr16, static_cast<std::uint16_t>(len));
        if (len <= std::numeric_limits<std::uint32_t>::max())
            return writeTagU32(tag::kStr32, static_cast<std::uint32_t>(len));
        return SerError::StrLength;
    }

    SerError writeArrayLen(std::size_t len)
    {
        if (len <= kMaxFixArraySize)
            return put(static_cast<std::uint8_t>(tag::kFixArray | len));
        if (len <= std::numeric_limits<std::uint16_t>::max())
            return writeTagU16(tag::kArray16, static_cast<std::uint16_t>(len));
        if (len <= std::numeric_limits<std::uint32_t>::max())
            return writeTagU32(tag::kArray32, static_cast<std::uint32_t>(len));
        return SerError::SeqLength;
    }

    SerError writeMapLen(std::size_t len)
    {
        if (len <= kMaxFixMapSize)
            return put(static_cast<std::uint8_t>(tag::kFixMap | len));
        if (len <= std::numeric_limits<std::uint16_t>::max())
            return writeTagU16(tag::kMap16, static_cast<std::uint16_t>(len));
        if (len <= std::numeric_limits<std::uint32_t>::max())
            return writeTagU32(tag::kMap32, static_cast<std::uint32_t>(len));
        return SerError::MapLength;
    }

    W &w_;
    serde::ErrorMessage message_;
    bool writeFailed_{false};
};

} // namespace zerowire::msgpack
