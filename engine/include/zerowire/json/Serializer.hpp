#pragma once

#include <zerowire/codec/Hex.hpp>
#include <zerowire/codec/Utf8.hpp>
#include <zerowire/json/ByteEncoder.hpp>
#include <zerowire/json/Error.hpp>
#include <zerowire/serde/Error.hpp>
#include <zerowire/serde/Serialize.hpp>
#include <zerowire/sink/ByteSink.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>

namespace zerowire::json
{

/// 0x00..0x1F 제어 바이트의 이스케이프 글자. 'u' 는 \u00XX 로 씁니다.
inline constexpr std::array<char, 32> kControlEscapes = {
    'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'b', 't', 'n', 'u', 'f', 'r', 'u', 'u',
    'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u', 'u',
};

[[nodiscard]] constexpr bool needsEscape(std::uint8_t b) noexcept
{
    return b < 0x20 || b == '"' || b == '\\';
}

template <class S>
class KeySerializer;

/**
 * @brief 싱크에 compact JSON 을 쓰는 직렬화기입니다.
 *
 * - 출력은 append-only 이고 싱크 용량 부족은 SerError::Writer 하나로 보고합니다.
 * - 정수는 고정 자릿수 버퍼, 실수는 std::to_chars 최단 표현. 비유한 수는 null.
 * - B 는 바이트 필드 인코딩 전략입니다 (ByteEncoder.hpp).
 */
template <sink::ByteSink W, ByteEncoder B = ArrayByteEncoder>
class Serializer : public serde::ErrorReporting<Serializer<W, B>, SerError>
{
  public:
    using Error = SerError;

    /// seq / tuple / map / struct / variant 공용 compound. 첫 원소 플래그 하나만 가진다.
    class Compound
    {
      public:
        using Error = SerError;

        enum class Close : std::uint8_t
        {
            Array,
            Object,
            TupleVariant,
            StructVariant,
        };

        Compound() noexcept = default;
        Compound(Serializer *ser, Close close) noexcept : ser_(ser), close_(close) {}

        template <class T>
        SerError serializeElement(const T &v)
        {
            ZW_TRY(separator());
            return serde::serialize(v, *ser_);
        }

        template <class K>
        SerError serializeKey(const K &key)
        {
            ZW_TRY(separator());
            KeySerializer<Serializer> keySer(*ser_);
            return serde::serialize(key, keySer);
        }

        template <class V>
        SerError serializeValue(const V &v)
        {
            ZW_TRY(ser_->put(':'));
            return serde::serialize(v, *ser_);
        }

        template <class V>
        SerError serializeField(std::string_view name, const V &v)
        {
            ZW_TRY(separator());
            ZW_TRY(ser_->writeQuoted(name));
            ZW_TRY(ser_->put(':'));
            return serde::serialize(v, *ser_);
        }

        SerError end()
        {
            switch (close_)
            {
            case Close::Array:
                return ser_->put(']');
            case Close::Object:
                return ser_->put('}');
            case Close::TupleVariant:
                return ser_->putStr("]}");
            case Close::StructVariant:
                return ser_->putStr("}}");
            }
            return SerError::Ok;
        }

      private:
        SerError separator()
        {
            if (first_)
            {
                first_ = false;
                return SerError::Ok;
            }
            return ser_->put(',');
        }

        Serializer *ser_{nullptr};
        Close close_{Close::Array};
        bool first_{true};
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

    SerError serializeBool(bool v) { return putStr(v ? "true" : "false"); }

    SerError serializeI8(std::int8_t v) { return writeSigned(v); }
    SerError serializeI16(std::int16_t v) { return writeSigned(v); }
    SerError serializeI32(std::int32_t v) { return writeSigned(v); }
    SerError serializeI64(std::int64_t v) { return writeSigned(v); }

    SerError serializeU8(std::uint8_t v) { return writeUnsigned(v, false); }
    SerError serializeU16(std::uint16_t v) { return writeUnsigned(v, false); }
    SerError serializeU32(std::uint32_t v) { return writeUnsigned(v, false); }
    SerError serializeU64(std::uint64_t v) { return writeUnsigned(v, false); }

    SerError serializeF32(float v) { return writeFloat(v); }
    SerError serializeF64(double v) { return writeFloat(v); }

    SerError serializeChar(char32_t v)
    {
        std::uint8_t utf8[4]{};
        const std::size_t n = codec::encodeUtf8(v, utf8);
        if (n == 0)
            return this->custom("invalid char U+{:X}", static_cast<std::uint32_t>(v));
        return writeQuoted(std::string_view(reinterpret_cast<const char *>(utf8), n));
    }

    SerError serializeStr(std::string_view v) { return writeQuoted(v); }

    SerError serializeBytes(std::span<const std::uint8_t> v)
    {
        return B::encode(w_, v) ? SerError::Ok : SerError::Writer;
    }

    SerError serializeNone() { return putStr("null"); }

    template <class T>
    SerError serializeSome(const T &v)
    {
        return serde::serialize(v, *this);
    }

    SerError serializeUnit() { return putStr("null"); }
    SerError serializeUnitStruct(std::string_view) { return putStr("null"); }

    SerError serializeUnitVariant(std::string_view, std::uint32_t, std::string_view variant)
    {
        return writeQuoted(variant);
    }

    template <class T>
    SerError serializeNewtypeStruct(std::string_view, const T &v)
    {
        return serde::serialize(v, *this);
    }

    template <class T>
    SerError serializeNewtypeVariant(std::string_view, std::uint32_t, std::string_view variant,
                                     const T &v)
    {
        ZW_TRY(put('{'));
        ZW_TRY(writeQuoted(variant));
        ZW_TRY(put(':'));
        ZW_TRY(serde::serialize(v, *this));
        return put('}');
    }

    SerError serializeSeq(std::optional<std::size_t>, Compound &out)
    {
        ZW_TRY(put('['));
        out = Compound(this, Compound::Close::Array);
        return SerError::Ok;
    }

    SerError serializeTuple(std::size_t, Compound &out)
    {
        return serializeSeq(std::nullopt, out);
    }

    SerError serializeMap(std::optional<std::size_t>, Compound &out)
    {
        ZW_TRY(put('{'));
        out = Compound(this, Compound::Close::Object);
        return SerError::Ok;
    }

    SerError serializeStruct(std::string_view, std::size_t, Compound &out)
    {
        return serializeMap(std::nullopt, out);
    }

    SerError serializeTupleVariant(std::string_view, std::uint32_t, std::string_view variant,
                                   std::size_t, Compound &out)
    {
        ZW_TRY(put('{'));
        ZW_TRY(writeQuoted(variant));
        ZW_TRY(putStr(":["));
        out = Compound(this, Compound::Close::TupleVariant);
        return SerError::Ok;
    }

    SerError serializeStructVariant(std::string_view, std::uint32_t, std::string_view variant,
                                    std::size_t, Compound &out)
    {
        ZW_TRY(put('{'));
        ZW_TRY(writeQuoted(variant));
        ZW_TRY(putStr(":{"));
        out = Compound(this, Compound::Close::StructVariant);
        return SerError::Ok;
    }

    /// 포맷 결과를 임시 문자열 없이 이스케이프하며 바로 싱크로 흘린다
    template <typename... Args>
    SerError collectStr(std::format_string<Args...> fmt, Args &&...args)
    {
        ZW_TRY(put('"'));
        writeFailed_ = false;
        try
        {
            std::format_to(EscapingOut(this), fmt, std::forward<Args>(args)...);
        }
        catch (const std::format_error &)
        {
            return SerError::FormatError;
        }
        if (writeFailed_)
            return SerError::Writer;
        return put('"');
    }

    // ---- 저수준 출력 (Compound / KeySerializer 가 사용) ----

    SerError put(std::uint8_t b) { return w_.writeByte(b) ? SerError::Ok : SerError::Writer; }
    SerError putStr(std::string_view s) { return w_.writeStr(s) ? SerError::Ok : SerError::Writer; }

    /// "..." 로 감싸고 이스케이프 (이스케이프가 필요 없는 구간은 한 번에 복사)
    SerError writeQuoted(std::string_view s)
    {
        ZW_TRY(put('"'));
        std::size_t runStart = 0;
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            const auto b = static_cast<std::uint8_t>(s[i]);
            if (!needsEscape(b))
                continue;
            if (i > runStart)
                ZW_TRY(putStr(s.substr(runStart, i - runStart)));
            ZW_TRY(writeEscape(b));
            runStart = i + 1;
        }
        if (runStart < s.size())
            ZW_TRY(putStr(s.substr(runStart)));
        return put('"');
    }

    template <class T>
    SerError writeSigned(T v)
    {
        const auto wide = static_cast<std::int64_t>(v);
        const std::uint64_t magnitude =
            wide < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(wide)
                     : static_cast<std::uint64_t>(wide);
        return writeUnsigned(magnitude, wide < 0);
    }

    SerError writeUnsigned(std::uint64_t v, bool negative)
    {
        std::array<char, 21> buf{};
        char *const last = buf.data() + buf.size();
        char *p = last;
        do
        {
            *--p = static_cast<char>('0' + v % 10);
            v /= 10;
        } while (v != 0);
        if (negative)
            *--p = '-';
        return putStr(std::string_view(p, static_cast<std::size_t>(last - p)));
    }

  private:
    class EscapingOut
    {
      public:
        using difference_type = std::ptrdiff_t;

        EscapingOut() noexcept = default;
        explicit EscapingOut(Serializer *ser) noexcept : ser_(ser) {}

        EscapingOut &operator*() noexcept { return *this; }
        EscapingOut &operator++() noexcept { return *this; }
        EscapingOut operator++(int) noexcept { return *this; }

        EscapingOut &operator=(char c)
        {
            if (ser_->writeFailed_)
                return *this;
            const auto b = static_cast<std::uint8_t>(c);
            const SerError err = needsEscape(b) ? ser_->writeEscape(b) : ser_->put(b);
            if (err != SerError::Ok)
                ser_->writeFailed_ = true;
            return *this;
        }

      private:
        Serializer *ser_{nullptr};
    };

    SerError writeEscape(std::uint8_t b)
    {
        if (b == '"')
            return putStr("\\\"");
        if (b == '\\')
            return putStr("\\\\");

        const char esc = kControlEscapes[b];
        if (esc != 'u')
        {
            const char two[2] = {'\\', esc};
            return putStr(std::string_view(two, 2));
        }
        char six[6] = {'\\', 'u', '0', '0', 0, 0};
        codec::hexEncodeByte(b, six + 4);
        return putStr(std::string_view(six, 6));
    }

    /// 최단 왕복 자릿수를 ECMAScript Number.prototype.toString 규칙으로 배치한다.
    /// 1e-7 <= |v| < 1e21 은 고정소수점 ("100000000000000000000", "0.000001"),
    /// 그 밖은 지수 표기 ("1e+21", "1.5e-7"). -0 은 "0".
    template <class F>
    SerError writeFloat(F v)
    {
        if (!std::isfinite(v))
            return putStr("null");
        if (v == 0)
            return put('0');

        // "-d.ddde-XX" 에서 자릿수와 지수만 뽑는다
        std::array<char, 32> sci{};
        const auto res =
            std::to_chars(sci.data(), sci.data() + sci.size(), v, std::chars_format::scientific);
        if (res.ec != std::errc{})
            return SerError::FormatError;

        const char *p = sci.data();
        const bool negative = *p == '-';
        if (negative)
            ++p;
        std::array<char, 20> digits{};
        int k = 0;
        for (; p != res.ptr && *p != 'e'; ++p)
        {
            if (*p != '.')
                digits[static_cast<std::size_t>(k++)] = *p;
        }
        if (p == res.ptr)
            return SerError::FormatError;
        ++p; // 'e'
        const bool negExp = *p == '-';
        ++p; // 부호
        int exp = 0;
        for (; p != res.ptr; ++p)
            exp = exp * 10 + (*p - '0');
        if (negExp)
            exp = -exp;

        // n: 소수점이 첫 자리 뒤 몇 번째에 오는지
        const int n = exp + 1;
        std::array<char, 48> out{};
        std::size_t len = 0;
        const auto emit = [&](char c) { out[len++] = c; };
        const auto emitDigits = [&](int from, int to) {
            for (int i = from; i < to; ++i)
                emit(digits[static_cast<std::size_t>(i)]);
        };

        if (negative)
            emit('-');
        if (k <= n && n <= 21)
        {
            emitDigits(0, k);
            for (int i = k; i < n; ++i)
                emit('0');
        }
        else if (0 < n && n <= 21)
        {
            emitDigits(0, n);
            emit('.');
            emitDigits(n, k);
        }
        else if (-6 < n && n <= 0)
        {
            emit('0');
            emit('.');
            for (int i = n; i < 0; ++i)
                emit('0');
            emitDigits(0, k);
        }
        else
        {
            emit(digits[0]);
            if (k > 1)
            {
                emit('.');
                emitDigits(1, k);
            }
            emit('e');
            emit(n - 1 < 0 ? '-' : '+');
            const auto tail = std::to_chars(out.data() + len, out.data() + out.size(),
                                            n - 1 < 0 ? 1 - n : n - 1);
            len = static_cast<std::size_t>(tail.ptr - out.data());
        }
        return putStr(std::string_view(out.data(), len));
    }

    W &w_;
    serde::ErrorMessage message_;
    bool writeFailed_{false};
};

/// 객체 키 직렬화기. 문자열/문자는 그대로, 정수와 bool 은 따옴표로 감싸고,
/// unit variant 는 이름을 쓴다. 나머지는 InvalidKeyType.
template <class S>
class KeySerializer : public serde::ErrorReporting<KeySerializer<S>, SerError>
{
  public:
    using Error = SerError;
    using SerializeSeq = typename S::Compound;
    using SerializeTuple = typename S::Compound;
    using SerializeMap = typename S::Compound;
    using SerializeStruct = typename S::Compound;
    using SerializeTupleVariant = typename S::Compound;
    using SerializeStructVariant = typename S::Compound;

    explicit KeySerializer(S &ser) noexcept : ser_(ser) {}

    [[nodiscard]] serde::ErrorMessage &errorMessage() noexcept { return ser_.errorMessage(); }

    SerError serializeBool(bool v) { return ser_.putStr(v ? "\"true\"" : "\"false\""); }

    SerError serializeI8(std::int8_t v) { return quoted([&] { return ser_.writeSigned(v); }); }
    SerError serializeI16(std::int16_t v) { return quoted([&] { return ser_.writeSigned(v); }); }
    SerError serializeI32(std::int32_t v) { return quoted([&] { return ser_.writeSigned(v); }); }
    SerError serializeI64(std::int64_t v) { return quoted([&] { return ser_.writeSigned(v); }); }
    SerError serializeU8(std::uint8_t v) { return quoted([&] { return ser_.writeUnsigned(v, false); }); }
    SerError serializeU16(std::uint16_t v) { return quoted([&] { return ser_.writeUnsigned(v, false); }); }
    SerError serializeU32(std::uint32_t v) { return quoted([&] { return ser_.writeUnsigned(v, false); }); }
    SerError serializeU64(std::uint64_t v) { return quoted([&] { return ser_.writeUnsigned(v, false); }); }

    SerError serializeF32(float) { return SerError::InvalidKeyType; }
    SerError serializeF64(double) { return SerError::InvalidKeyType; }

    SerError serializeChar(char32_t v) { return ser_.serializeChar(v); }
    SerError serializeStr(std::string_view v) { return ser_.writeQuoted(v); }

    SerError serializeBytes(std::span<const std::uint8_t>) { return SerError::InvalidKeyType; }
    SerError serializeNone() { return SerError::InvalidKeyType; }
    template <class T>
    SerError serializeSome(const T &)
    {
        return SerError::InvalidKeyType;
    }
    SerError serializeUnit() { return SerError::InvalidKeyType; }
    SerError serializeUnitStruct(std::string_view) { return SerError::InvalidKeyType; }

    SerError serializeUnitVariant(std::string_view, std::uint32_t, std::string_view variant)
    {
        return ser_.writeQuoted(variant);
    }

    template <class T>
    SerError serializeNewtypeStruct(std::string_view, const T &v)
    {
        return serde::serialize(v, *this);
    }
    template <class T>
    SerError serializeNewtypeVariant(std::string_view, std::uint32_t, std::string_view, const T &)
    {
        return SerError::InvalidKeyType;
    }

    SerError serializeSeq(std::optional<std::size_t>, SerializeSeq &) { return SerError::InvalidKeyType; }
    SerError serializeTuple(std::size_t, SerializeTuple &) { return SerError::InvalidKeyType; }
    SerError serializeMap(std::optional<std::size_t>, SerializeMap &) { return SerError::InvalidKeyType; }
    SerError serializeStruct(std::string_view, std::size_t, SerializeStruct &)
    {
        return SerError::InvalidKeyType;
    }
    SerError serializeTupleVariant(std::string_view, std::uint32_t, std::string_view, std::size_t,
                                   SerializeTupleVariant &)
    {
        return SerError::InvalidKeyType;
    }
    SerError serializeStructVariant(std::string_view, std::uint32_t, std::string_view, std::size_t,
                                    SerializeStructVariant &)
    {
        return SerError::InvalidKeyType;
    }

    template <typename... Args>
    SerError collectStr(std::format_string<Args...> fmt, Args &&...args)
    {
        return ser_.collectStr(fmt, std::forward<Args>(args)...);
    }

  private:
    template <class Fn>
    SerError quoted(Fn &&body)
    {
        ZW_TRY(ser_.put('"'));
        ZW_TRY(body());
        return ser_.put('"');
    }

    S &ser_;
};

} // namespace zerowire::json
