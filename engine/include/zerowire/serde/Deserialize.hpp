#pragma once

#include <zerowire/codec/Utf8.hpp>
#include <zerowire/serde/Describe.hpp>
#include <zerowire/serde/Error.hpp>
#include <zerowire/serde/Visitor.hpp>

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace zerowire::serde
{

/// 타입별 역직렬화 규칙. 특수화는 다음을 제공한다:
///   template <class De> static typename De::Error deserialize(De &de, T &out);
template <class T>
struct Deserialize;

template <class T, class De>
[[nodiscard]] typename De::Error deserialize(De &de, T &out)
{
    return Deserialize<T>::deserialize(de, out);
}

// ---------------------------------------------------------------------------
// primitives
// ---------------------------------------------------------------------------

template <>
struct Deserialize<bool>
{
    class BoolVisitor : public Visitor<BoolVisitor>
    {
      public:
        explicit BoolVisitor(bool &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a boolean"; }

        template <class De>
        typename De::Error visitBool(De &, bool v)
        {
            out_ = v;
            return {};
        }

      private:
        bool &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, bool &out)
    {
        BoolVisitor v(out);
        return de.deserializeBool(v);
    }
};

/// 정수는 폭과 부호를 가리지 않고 받은 뒤 무손실 범위 검사로 좁힌다.
template <class T>
class IntegerVisitor : public Visitor<IntegerVisitor<T>>
{
  public:
    explicit IntegerVisitor(T &out) noexcept : out_(out) {}
    std::string_view expecting() const noexcept { return "an integer"; }

    template <class De>
    typename De::Error visitI64(De &de, std::int64_t v)
    {
        if (!std::in_range<T>(v))
            return de.invalidValue(Unexpected::signedInt(v), expecting());
        out_ = static_cast<T>(v);
        return {};
    }

    template <class De>
    typename De::Error visitU64(De &de, std::uint64_t v)
    {
        if (!std::in_range<T>(v))
            return de.invalidValue(Unexpected::unsignedInt(v), expecting());
        out_ = static_cast<T>(v);
        return {};
    }

  private:
    T &out_;
};

template <class T>
    requires SignedInteger<T>
struct Deserialize<T>
{
    template <class De>
    static typename De::Error deserialize(De &de, T &out)
    {
        IntegerVisitor<T> v(out);
        if constexpr (sizeof(T) == 1)
            return de.deserializeI8(v);
        else if constexpr (sizeof(T) == 2)
            return de.deserializeI16(v);
        else if constexpr (sizeof(T) == 4)
            return de.deserializeI32(v);
        else
            return de.deserializeI64(v);
    }
};

template <class T>
    requires UnsignedInteger<T>
struct Deserialize<T>
{
    template <class De>
    static typename De::Error deserialize(De &de, T &out)
    {
        IntegerVisitor<T> v(out);
        if constexpr (sizeof(T) == 1)
            return de.deserializeU8(v);
        else if constexpr (sizeof(T) == 2)
            return de.deserializeU16(v);
        else if constexpr (sizeof(T) == 4)
            return de.deserializeU32(v);
        else
            return de.deserializeU64(v);
    }
};

template <class T>
class FloatVisitor : public Visitor<FloatVisitor<T>>
{
  public:
    explicit FloatVisitor(T &out) noexcept : out_(out) {}
    std::string_view expecting() const noexcept { return "a floating point number"; }

    template <class De>
    typename De::Error visitF32(De &, float v)
    {
        out_ = static_cast<T>(v);
        return {};
    }
    template <class De>
    typename De::Error visitF64(De &, double v)
    {
        out_ = static_cast<T>(v);
        return {};
    }
    template <class De>
    typename De::Error visitI64(De &, std::int64_t v)
    {
        out_ = static_cast<T>(v);
        return {};
    }
    template <class De>
    typename De::Error visitU64(De &, std::uint64_t v)
    {
        out_ = static_cast<T>(v);
        return {};
    }

  private:
    T &out_;
};

template <class T>
    requires std::is_floating_point_v<T>
struct Deserialize<T>
{
    template <class De>
    static typename De::Error deserialize(De &de, T &out)
    {
        FloatVisitor<T> v(out);
        if constexpr (std::is_same_v<T, float>)
            return de.deserializeF32(v);
        else
            return de.deserializeF64(v);
    }
};

template <>
struct Deserialize<char32_t>
{
    class CharVisitor : public Visitor<CharVisitor>
    {
      public:
        explicit CharVisitor(char32_t &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a character"; }

        template <class De>
        typename De::Error visitChar(De &, char32_t v)
        {
            out_ = v;
            return {};
        }
        template <class De>
        typename De::Error visitStr(De &de, std::string_view v)
        {
            if (!codec::decodeSingleCodePoint(v, out_))
                return de.invalidValue(Unexpected::str(v), expecting());
            return {};
        }

      private:
        char32_t &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, char32_t &out)
    {
        CharVisitor v(out);
        return de.deserializeChar(v);
    }
};

// ---------------------------------------------------------------------------
// strings / bytes
// ---------------------------------------------------------------------------

/// 입력 버퍼를 빌려오는 문자열. 전송 중에 복사된(transient) 문자열은 거부한다.
template <>
struct Deserialize<std::string_view>
{
    class BorrowedStrVisitor : public Visitor<BorrowedStrVisitor>
    {
      public:
        explicit BorrowedStrVisitor(std::string_view &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a borrowed string"; }

        template <class De>
        typename De::Error visitBorrowedStr(De &, std::string_view v)
        {
            out_ = v;
            return {};
        }

      private:
        std::string_view &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::string_view &out)
    {
        BorrowedStrVisitor v(out);
        return de.deserializeStr(v);
    }
};

template <>
struct Deserialize<std::string>
{
    class StringVisitor : public Visitor<StringVisitor>
    {
      public:
        explicit StringVisitor(std::string &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a string"; }

        template <class De>
        typename De::Error visitStr(De &, std::string_view v)
        {
            out_.assign(v);
            return {};
        }
        template <class De>
        typename De::Error visitBytes(De &de, std::span<const std::uint8_t> v)
        {
            if (!codec::isValidUtf8(v))
                return de.invalidValue(Unexpected::of(Unexpected::Kind::Bytes), expecting());
            out_.assign(reinterpret_cast<const char *>(v.data()), v.size());
            return {};
        }

      private:
        std::string &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::string &out)
    {
        StringVisitor v(out);
        return de.deserializeString(v);
    }
};

/// 입력 버퍼를 빌려오는 바이트열 (JSON 은 제자리 디코드된 결과)
template <>
struct Deserialize<std::span<const std::uint8_t>>
{
    class BorrowedBytesVisitor : public Visitor<BorrowedBytesVisitor>
    {
      public:
        explicit BorrowedBytesVisitor(std::span<const std::uint8_t> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a borrowed byte array"; }

        template <class De>
        typename De::Error visitBorrowedBytes(De &, std::span<const std::uint8_t> v)
        {
            out_ = v;
            return {};
        }
        template <class De>
        typename De::Error visitBorrowedStr(De &, std::string_view v)
        {
            out_ = std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(v.data()),
                                                 v.size());
            return {};
        }

      private:
        std::span<const std::uint8_t> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::span<const std::uint8_t> &out)
    {
        BorrowedBytesVisitor v(out);
        return de.deserializeBytes(v);
    }
};

template <>
struct Deserialize<ByteBuf>
{
    class ByteBufVisitor : public Visitor<ByteBufVisitor>
    {
      public:
        explicit ByteBufVisitor(ByteBuf &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a byte array"; }

        template <class De>
        typename De::Error visitBytes(De &, std::span<const std::uint8_t> v)
        {
            out_.bytes.assign(v.begin(), v.end());
            return {};
        }
        template <class De>
        typename De::Error visitStr(De &, std::string_view v)
        {
            out_.bytes.assign(v.begin(), v.end());
            return {};
        }
        template <class De, class Access>
        typename De::Error visitSeq(De &, Access &acc)
        {
            out_.bytes.clear();
            for (;;)
            {
                std::uint8_t b = 0;
                bool got = false;
                ZW_TRY(acc.nextElement(b, got));
                if (!got)
                    return {};
                out_.bytes.push_back(b);
            }
        }

      private:
        ByteBuf &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, ByteBuf &out)
    {
        ByteBufVisitor v(out);
        return de.deserializeByteBuf(v);
    }
};

// ---------------------------------------------------------------------------
// option / unit / ignored
// ---------------------------------------------------------------------------

template <class T>
struct Deserialize<std::optional<T>>
{
    class OptionVisitor : public Visitor<OptionVisitor>
    {
      public:
        explicit OptionVisitor(std::optional<T> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "option"; }

        template <class De>
        typename De::Error visitNone(De &)
        {
            out_.reset();
            return {};
        }
        template <class De>
        typename De::Error visitUnit(De &)
        {
            out_.reset();
            return {};
        }
        template <class De>
        typename De::Error visitSome(De &de)
        {
            out_.emplace();
            return serde::deserialize(de, *out_);
        }

      private:
        std::optional<T> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::optional<T> &out)
    {
        OptionVisitor v(out);
        return de.deserializeOption(v);
    }
};

class UnitVisitor : public Visitor<UnitVisitor>
{
  public:
    std::string_view expecting() const noexcept { return "unit"; }

    template <class De>
    typename De::Error visitUnit(De &)
    {
        return {};
    }
};

template <class T>
    requires UnitLike<T>
struct Deserialize<T>
{
    template <class De>
    static typename De::Error deserialize(De &de, T &)
    {
        UnitVisitor v;
        return de.deserializeUnit(v);
    }
};

/// 어떤 값이든 문법만 검증하고 버린다.
class IgnoredAnyVisitor : public Visitor<IgnoredAnyVisitor>
{
  public:
    std::string_view expecting() const noexcept { return "anything at all"; }

    template <class De>
    typename De::Error visitBool(De &, bool)
    {
        return {};
    }
    template <class De>
    typename De::Error visitI64(De &, std::int64_t)
    {
        return {};
    }
    template <class De>
    typename De::Error visitU64(De &, std::uint64_t)
    {
        return {};
    }
    template <class De>
    typename De::Error visitF64(De &, double)
    {
        return {};
    }
    template <class De>
    typename De::Error visitChar(De &, char32_t)
    {
        return {};
    }
    template <class De>
    typename De::Error visitStr(De &, std::string_view)
    {
        return {};
    }
    template <class De>
    typename De::Error visitBytes(De &, std::span<const std::uint8_t>)
    {
        return {};
    }
    template <class De>
    typename De::Error visitUnit(De &)
    {
        return {};
    }
    template <class De>
    typename De::Error visitNone(De &)
    {
        return {};
    }
    template <class De>
    typename De::Error visitSome(De &de)
    {
        IgnoredAny ignored;
        return serde::deserialize(de, ignored);
    }
    template <class De, class Access>
    typename De::Error visitSeq(De &, Access &acc)
    {
        for (;;)
        {
            IgnoredAny ignored;
            bool got = false;
            ZW_TRY(acc.nextElement(ignored, got));
            if (!got)
                return {};
        }
    }
    template <class De, class Access>
    typename De::Error visitMap(De &, Access &acc)
    {
        for (;;)
        {
            IgnoredAny key;
            bool got = false;
            ZW_TRY(acc.nextKey(key, got));
            if (!got)
                return {};
            IgnoredAny value;
            ZW_TRY(acc.nextValue(value));
        }
    }
};

template <>
struct Deserialize<IgnoredAny>
{
    template <class De>
    static typename De::Error deserialize(De &de, IgnoredAny &)
    {
        IgnoredAnyVisitor v;
        return de.deserializeIgnoredAny(v);
    }
};

// ---------------------------------------------------------------------------
// containers
// ---------------------------------------------------------------------------

template <class T, class Alloc>
struct Deserialize<std::vector<T, Alloc>>
{
    class VecVisitor : public Visitor<VecVisitor>
    {
      public:
        explicit VecVisitor(std::vector<T, Alloc> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a sequence"; }

        template <class De, class Access>
        typename De::Error visitSeq(De &, Access &acc)
        {
            out_.clear();
            out_.reserve(acc.sizeHint());
            for (;;)
            {
                T elem{};
                bool got = false;
                ZW_TRY(acc.nextElement(elem, got));
                if (!got)
                    return {};
                out_.push_back(std::move(elem));
            }
        }

      private:
        std::vector<T, Alloc> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::vector<T, Alloc> &out)
    {
        VecVisitor v(out);
        return de.deserializeSeq(v);
    }
};

template <class T, std::size_t N>
struct Deserialize<std::array<T, N>>
{
    class ArrayVisitor : public Visitor<ArrayVisitor>
    {
      public:
        explicit ArrayVisitor(std::array<T, N> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a fixed size array"; }

        template <class De, class Access>
        typename De::Error visitSeq(De &de, Access &acc)
        {
            for (std::size_t i = 0; i < N; ++i)
            {
                bool got = false;
                ZW_TRY(acc.nextElement(out_[i], got));
                if (!got)
                    return de.invalidLength(i, expecting());
            }
            return {};
        }

      private:
        std::array<T, N> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::array<T, N> &out)
    {
        ArrayVisitor v(out);
        return de.deserializeTuple(N, v);
    }
};

/// tuple / pair 공통: 위치 순서대로 원소를 채운다.
template <class Tuple>
class TupleVisitor : public Visitor<TupleVisitor<Tuple>>
{
  public:
    static constexpr std::size_t kSize = std::tuple_size_v<Tuple>;

    explicit TupleVisitor(Tuple &out) noexcept : out_(out) {}
    std::string_view expecting() const noexcept { return "a tuple"; }

    template <class De, class Access>
    typename De::Error visitSeq(De &de, Access &acc)
    {
        typename De::Error err{};
        std::size_t filled = 0;
        bool short_ = false;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (void)((readOne(acc, std::get<I>(out_), err, short_) ? (++filled, true) : false) &&
                   ...);
        }(std::make_index_sequence<kSize>{});
        if (err != typename De::Error{})
            return err;
        if (short_)
            return de.invalidLength(filled, expecting());
        return {};
    }

  private:
    template <class Access, class Elem, class Err>
    static bool readOne(Access &acc, Elem &elem, Err &err, bool &short_)
    {
        bool got = false;
        err = acc.nextElement(elem, got);
        if (err != Err{})
            return false;
        if (!got)
        {
            short_ = true;
            return false;
        }
        return true;
    }

    Tuple &out_;
};

template <class... Ts>
struct Deserialize<std::tuple<Ts...>>
{
    template <class De>
    static typename De::Error deserialize(De &de, std::tuple<Ts...> &out)
    {
        TupleVisitor<std::tuple<Ts...>> v(out);
        return de.deserializeTuple(sizeof...(Ts), v);
    }
};

template <class A, class B>
struct Deserialize<std::pair<A, B>>
{
    template <class De>
    static typename De::Error deserialize(De &de, std::pair<A, B> &out)
    {
        TupleVisitor<std::pair<A, B>> v(out);
        return de.deserializeTuple(2, v);
    }
};

template <class K, class V, class Cmp, class Alloc>
struct Deserialize<std::map<K, V, Cmp, Alloc>>
{
    class MapVisitor : public Visitor<MapVisitor>
    {
      public:
        explicit MapVisitor(std::map<K, V, Cmp, Alloc> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "a map"; }

        template <class De, class Access>
        typename De::Error visitMap(De &, Access &acc)
        {
            out_.clear();
            for (;;)
            {
                K key{};
                bool got = false;
                ZW_TRY(acc.nextKey(key, got));
                if (!got)
                    return {};
                V value{};
                ZW_TRY(acc.nextValue(value));
                out_.insert_or_assign(std::move(key), std::move(value));
            }
        }

      private:
        std::map<K, V, Cmp, Alloc> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, std::map<K, V, Cmp, Alloc> &out)
    {
        MapVisitor v(out);
        return de.deserializeMap(v);
    }
};

// ---------------------------------------------------------------------------
// structs: 배열(위치) / 맵(이름 또는 인덱스) 두 경로가 하나의 필드 대입 루틴을 공유한다
// ---------------------------------------------------------------------------

/// 구조체 필드 식별자. 모르는 이름/인덱스는 index == count (무시 대상).
template <class T>
struct FieldKey
{
    std::size_t index{StructInfo<T>::count};
};

template <class T>
struct Deserialize<FieldKey<T>>
{
    class FieldKeyVisitor : public Visitor<FieldKeyVisitor>
    {
      public:
        explicit FieldKeyVisitor(FieldKey<T> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "field identifier"; }

        template <class De>
        typename De::Error visitU64(De &, std::uint64_t v)
        {
            out_.index = v < StructInfo<T>::count ? static_cast<std::size_t>(v) : StructInfo<T>::count;
            return {};
        }
        template <class De>
        typename De::Error visitStr(De &, std::string_view v)
        {
            out_.index = StructInfo<T>::indexOf(v);
            return {};
        }
        template <class De>
        typename De::Error visitBytes(De &, std::span<const std::uint8_t> v)
        {
            out_.index = StructInfo<T>::indexOf(
                std::string_view(reinterpret_cast<const char *>(v.data()), v.size()));
            return {};
        }

      private:
        FieldKey<T> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, FieldKey<T> &out)
    {
        FieldKeyVisitor v(out);
        return de.deserializeIdentifier(v);
    }
};

/// 공유 필드 대입 루틴: index 번째 필드 슬롯을 read(slot) 으로 채운다.
template <class T, class Err, class Read>
Err assignField(T &obj, std::size_t index, Read &&read)
{
    return StructInfo<T>::template withField<Err>(
        index, [&](const auto &desc) -> Err { return read(obj.*(desc.member)); });
}

template <class T>
class StructVisitor : public Visitor<StructVisitor<T>>
{
    using Info = StructInfo<T>;

  public:
    explicit StructVisitor(T &out) noexcept : out_(out) {}
    std::string_view expecting() const noexcept { return "a struct"; }

    // 배열 형태: 선언 순서대로
    template <class De, class Access>
    typename De::Error visitSeq(De &de, Access &acc)
    {
        using Err = typename De::Error;
        for (std::size_t i = 0; i < Info::count; ++i)
        {
            bool got = false;
            ZW_TRY((assignField<T, Err>(out_, i,
                                        [&](auto &slot) { return acc.nextElement(slot, got); })));
            if (!got)
            {
                if (Info::allowMissing)
                    return {};
                return de.invalidLength(i, expecting());
            }
        }
        return {};
    }

    // 맵 형태: 키는 필드 이름 또는 인덱스
    template <class De, class Access>
    typename De::Error visitMap(De &de, Access &acc)
    {
        using Err = typename De::Error;
        std::bitset<Info::count == 0 ? 1 : Info::count> seen;
        for (;;)
        {
            FieldKey<T> key;
            bool got = false;
            ZW_TRY(acc.nextKey(key, got));
            if (!got)
                break;
            if (key.index >= Info::count)
            {
                IgnoredAny ignored;
                ZW_TRY(acc.nextValue(ignored));
                continue;
            }
            if (seen.test(key.index))
                return de.duplicateField(Info::names[key.index]);
            seen.set(key.index);
            ZW_TRY((assignField<T, Err>(out_, key.index,
                                        [&](auto &slot) { return acc.nextValue(slot); })));
        }

        for (std::size_t i = 0; i < Info::count; ++i)
        {
            if (seen.test(i))
                continue;
            const bool optional = Info::template withField<bool>(i, [&](const auto &desc) {
                using M = typename std::remove_cvref_t<decltype(desc)>::member_type;
                if constexpr (IsOptional<M>::value)
                {
                    (out_.*(desc.member)).reset();
                    return true;
                }
                else
                {
                    return false;
                }
            });
            if (!optional && !Info::allowMissing)
                return de.missingField(Info::names[i]);
        }
        return {};
    }

  private:
    T &out_;
};

template <class T>
    requires DescribedStruct<T>
struct Deserialize<T>
{
    template <class De>
    static typename De::Error deserialize(De &de, T &out)
    {
        StructVisitor<T> v(out);
        return de.deserializeStruct(StructTraits<T>::name,
                                    std::span<const std::string_view>(StructInfo<T>::names), v);
    }
};

// ---------------------------------------------------------------------------
// enums
// ---------------------------------------------------------------------------

/// variant 식별자: 인덱스 또는 이름
template <std::size_t N>
struct VariantKey
{
    std::span<const std::string_view, N> names;
    std::size_t index{0};
};

template <std::size_t N>
struct Deserialize<VariantKey<N>>
{
    class VariantKeyVisitor : public Visitor<VariantKeyVisitor>
    {
      public:
        explicit VariantKeyVisitor(VariantKey<N> &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "variant identifier"; }

        template <class De>
        typename De::Error visitU64(De &de, std::uint64_t v)
        {
            if (v >= N)
                return de.variantIndexOutOfRange(v, N);
            out_.index = static_cast<std::size_t>(v);
            return {};
        }
        template <class De>
        typename De::Error visitStr(De &de, std::string_view v)
        {
            const std::size_t i = findName(out_.names, v);
            if (i >= N)
                return de.unknownVariant(v, out_.names);
            out_.index = i;
            return {};
        }
        template <class De>
        typename De::Error visitBytes(De &de, std::span<const std::uint8_t> v)
        {
            return visitStr(de, std::string_view(reinterpret_cast<const char *>(v.data()), v.size()));
        }

      private:
        VariantKey<N> &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, VariantKey<N> &out)
    {
        VariantKeyVisitor v(out);
        return de.deserializeIdentifier(v);
    }
};

/// C-like enum: unit variant 만 있다
template <class E>
    requires DescribedEnum<E>
struct Deserialize<E>
{
    static constexpr std::size_t N = EnumTraits<E>::variants.size();

    class EnumVisitor : public Visitor<EnumVisitor>
    {
      public:
        explicit EnumVisitor(E &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "enum"; }

        template <class De, class Access>
        typename De::Error visitEnum(De &, Access &acc)
        {
            VariantKey<N> key{EnumTraits<E>::variants};
            ZW_TRY(acc.variant(key));
            ZW_TRY(acc.unitVariant());
            out_ = static_cast<E>(key.index);
            return {};
        }

      private:
        E &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, E &out)
    {
        EnumVisitor v(out);
        return de.deserializeEnum(EnumTraits<E>::name,
                                  std::span<const std::string_view>(EnumTraits<E>::variants), v);
    }
};

/// std::variant 기반 enum: 대안 타입이 variant 모양을 정한다.
///   Unit          -> unit variant
///   StructTraits  -> struct variant
///   std::tuple    -> tuple variant
///   그 밖         -> newtype variant
template <class V>
    requires DescribedVariant<V>
struct Deserialize<V>
{
    static constexpr std::size_t N = std::variant_size_v<V>;
    static_assert(VariantTraits<V>::variants.size() == N);

    class VariantVisitor : public Visitor<VariantVisitor>
    {
      public:
        explicit VariantVisitor(V &out) noexcept : out_(out) {}
        std::string_view expecting() const noexcept { return "enum"; }

        template <class De, class Access>
        typename De::Error visitEnum(De &, Access &acc)
        {
            using Err = typename De::Error;
            VariantKey<N> key{VariantTraits<V>::variants};
            ZW_TRY(acc.variant(key));

            Err err{};
            [&]<std::size_t... I>(std::index_sequence<I...>) {
                (void)((I == key.index ? (err = readAlternative<I>(acc), true) : false) || ...);
            }(std::make_index_sequence<N>{});
            return err;
        }

      private:
        template <std::size_t I, class Access>
        auto readAlternative(Access &acc)
        {
            using A = std::variant_alternative_t<I, V>;
            auto &slot = out_.template emplace<I>();
            if constexpr (UnitLike<A>)
            {
                return acc.unitVariant();
            }
            else if constexpr (DescribedStruct<A>)
            {
                StructVisitor<A> sv(slot);
                return acc.structVariant(std::span<const std::string_view>(StructInfo<A>::names), sv);
            }
            else if constexpr (IsTuple<A>::value)
            {
                TupleVisitor<A> tv(slot);
                return acc.tupleVariant(std::tuple_size_v<A>, tv);
            }
            else
            {
                return acc.newtypeVariant(slot);
            }
        }

        V &out_;
    };

    template <class De>
    static typename De::Error deserialize(De &de, V &out)
    {
        VariantVisitor v(out);
        return de.deserializeEnum(VariantTraits<V>::name,
                                  std::span<const std::string_view>(VariantTraits<V>::variants), v);
    }
};

} // namespace zerowire::serde
