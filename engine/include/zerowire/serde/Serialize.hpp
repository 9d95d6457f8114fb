#pragma once

#include <zerowire/serde/Describe.hpp>
#include <zerowire/serde/Error.hpp>

#include <array>
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

/// 타입별 직렬화 규칙. 특수화는 다음을 제공한다:
///   template <class Ser> static typename Ser::Error serialize(const T &v, Ser &ser);
///
/// compound 는 out 파라미터로 연다:
///   typename Ser::SerializeSeq seq;
///   ZW_TRY(ser.serializeSeq(len, seq));
///   ZW_TRY(seq.serializeElement(x));
///   return seq.end();
template <class T>
struct Serialize;

template <class T, class Ser>
[[nodiscard]] typename Ser::Error serialize(const T &v, Ser &ser)
{
    return Serialize<T>::serialize(v, ser);
}

template <>
struct Serialize<bool>
{
    template <class Ser>
    static typename Ser::Error serialize(bool v, Ser &ser)
    {
        return ser.serializeBool(v);
    }
};

template <class T>
    requires SignedInteger<T>
struct Serialize<T>
{
    template <class Ser>
    static typename Ser::Error serialize(T v, Ser &ser)
    {
        if constexpr (sizeof(T) == 1)
            return ser.serializeI8(static_cast<std::int8_t>(v));
        else if constexpr (sizeof(T) == 2)
            return ser.serializeI16(static_cast<std::int16_t>(v));
        else if constexpr (sizeof(T) == 4)
            return ser.serializeI32(static_cast<std::int32_t>(v));
        else
            return ser.serializeI64(static_cast<std::int64_t>(v));
    }
};

template <class T>
    requires UnsignedInteger<T>
struct Serialize<T>
{
    template <class Ser>
    static typename Ser::Error serialize(T v, Ser &ser)
    {
        if constexpr (sizeof(T) == 1)
            return ser.serializeU8(static_cast<std::uint8_t>(v));
        else if constexpr (sizeof(T) == 2)
            return ser.serializeU16(static_cast<std::uint16_t>(v));
        else if constexpr (sizeof(T) == 4)
            return ser.serializeU32(static_cast<std::uint32_t>(v));
        else
            return ser.serializeU64(static_cast<std::uint64_t>(v));
    }
};

template <class T>
    requires std::is_floating_point_v<T>
struct Serialize<T>
{
    template <class Ser>
    static typename Ser::Error serialize(T v, Ser &ser)
    {
        if constexpr (std::is_same_v<T, float>)
            return ser.serializeF32(v);
        else
            return ser.serializeF64(static_cast<double>(v));
    }
};

template <>
struct Serialize<char32_t>
{
    template <class Ser>
    static typename Ser::Error serialize(char32_t v, Ser &ser)
    {
        return ser.serializeChar(v);
    }
};

template <>
struct Serialize<std::string_view>
{
    template <class Ser>
    static typename Ser::Error serialize(std::string_view v, Ser &ser)
    {
        return ser.serializeStr(v);
    }
};

template <>
struct Serialize<std::string>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::string &v, Ser &ser)
    {
        return ser.serializeStr(v);
    }
};

template <>
struct Serialize<std::span<const std::uint8_t>>
{
    template <class Ser>
    static typename Ser::Error serialize(std::span<const std::uint8_t> v, Ser &ser)
    {
        return ser.serializeBytes(v);
    }
};

template <>
struct Serialize<ByteBuf>
{
    template <class Ser>
    static typename Ser::Error serialize(const ByteBuf &v, Ser &ser)
    {
        return ser.serializeBytes(std::span<const std::uint8_t>(v.bytes));
    }
};

template <class T>
struct Serialize<std::optional<T>>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::optional<T> &v, Ser &ser)
    {
        if (!v)
            return ser.serializeNone();
        return ser.serializeSome(*v);
    }
};

template <class T>
    requires UnitLike<T>
struct Serialize<T>
{
    template <class Ser>
    static typename Ser::Error serialize(const T &, Ser &ser)
    {
        return ser.serializeUnit();
    }
};

template <class T, class Alloc>
struct Serialize<std::vector<T, Alloc>>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::vector<T, Alloc> &v, Ser &ser)
    {
        typename Ser::SerializeSeq seq;
        ZW_TRY(ser.serializeSeq(std::optional<std::size_t>(v.size()), seq));
        for (const T &elem : v)
            ZW_TRY(seq.serializeElement(elem));
        return seq.end();
    }
};

template <class T, std::size_t N>
struct Serialize<std::array<T, N>>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::array<T, N> &v, Ser &ser)
    {
        typename Ser::SerializeTuple tup;
        ZW_TRY(ser.serializeTuple(N, tup));
        for (const T &elem : v)
            ZW_TRY(tup.serializeElement(elem));
        return tup.end();
    }
};

/// tuple / pair 원소를 compound 에 차례로 넣는다
template <class Tuple, class Compound>
typename Compound::Error serializeTupleElements(const Tuple &v, Compound &out)
{
    typename Compound::Error err{};
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (void)(((err = out.serializeElement(std::get<I>(v))) == typename Compound::Error{}) && ...);
    }(std::make_index_sequence<std::tuple_size_v<Tuple>>{});
    return err;
}

template <class... Ts>
struct Serialize<std::tuple<Ts...>>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::tuple<Ts...> &v, Ser &ser)
    {
        typename Ser::SerializeTuple tup;
        ZW_TRY(ser.serializeTuple(sizeof...(Ts), tup));
        ZW_TRY(serializeTupleElements(v, tup));
        return tup.end();
    }
};

template <class A, class B>
struct Serialize<std::pair<A, B>>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::pair<A, B> &v, Ser &ser)
    {
        typename Ser::SerializeTuple tup;
        ZW_TRY(ser.serializeTuple(2, tup));
        ZW_TRY(tup.serializeElement(v.first));
        ZW_TRY(tup.serializeElement(v.second));
        return tup.end();
    }
};

template <class K, class V, class Cmp, class Alloc>
struct Serialize<std::map<K, V, Cmp, Alloc>>
{
    template <class Ser>
    static typename Ser::Error serialize(const std::map<K, V, Cmp, Alloc> &v, Ser &ser)
    {
        typename Ser::SerializeMap map;
        ZW_TRY(ser.serializeMap(std::optional<std::size_t>(v.size()), map));
        for (const auto &[key, value] : v)
        {
            ZW_TRY(map.serializeKey(key));
            ZW_TRY(map.serializeValue(value));
        }
        return map.end();
    }
};

/// 구조체 필드를 선언 순서대로 serializeField(name, value) 로 넘긴다
template <class T, class Compound>
typename Compound::Error serializeStructFields(const T &v, Compound &out)
{
    typename Compound::Error err{};
    std::apply(
        [&](const auto &...desc) {
            (void)(((err = out.serializeField(desc.name, v.*(desc.member))) ==
                    typename Compound::Error{}) &&
                   ...);
        },
        StructTraits<T>::fields);
    return err;
}

template <class T>
    requires DescribedStruct<T>
struct Serialize<T>
{
    template <class Ser>
    static typename Ser::Error serialize(const T &v, Ser &ser)
    {
        typename Ser::SerializeStruct st;
        ZW_TRY(ser.serializeStruct(StructTraits<T>::name, StructInfo<T>::count, st));
        ZW_TRY(serializeStructFields(v, st));
        return st.end();
    }
};

template <class E>
    requires DescribedEnum<E>
struct Serialize<E>
{
    template <class Ser>
    static typename Ser::Error serialize(E v, Ser &ser)
    {
        const auto index = static_cast<std::size_t>(v);
        const auto &names = EnumTraits<E>::variants;
        if (index >= names.size())
            return ser.custom("enum value {} of `{}` has no variant", index, EnumTraits<E>::name);
        return ser.serializeUnitVariant(EnumTraits<E>::name, static_cast<std::uint32_t>(index),
                                        names[index]);
    }
};

template <class V>
    requires DescribedVariant<V>
struct Serialize<V>
{
    template <class Ser>
    static typename Ser::Error serialize(const V &v, Ser &ser)
    {
        if (v.valueless_by_exception())
            return ser.custom("valueless variant `{}`", VariantTraits<V>::name);

        const auto index = static_cast<std::uint32_t>(v.index());
        const std::string_view name = VariantTraits<V>::name;
        const std::string_view variant = VariantTraits<V>::variants[v.index()];

        return std::visit(
            [&](const auto &alt) -> typename Ser::Error {
                using A = std::remove_cvref_t<decltype(alt)>;
                if constexpr (UnitLike<A>)
                {
                    return ser.serializeUnitVariant(name, index, variant);
                }
                else if constexpr (DescribedStruct<A>)
                {
                    typename Ser::SerializeStructVariant sv;
                    ZW_TRY(ser.serializeStructVariant(name, index, variant, StructInfo<A>::count,
                                                      sv));
                    ZW_TRY(serializeStructFields(alt, sv));
                    return sv.end();
                }
                else if constexpr (IsTuple<A>::value)
                {
                    typename Ser::SerializeTupleVariant tv;
                    ZW_TRY(ser.serializeTupleVariant(name, index, variant, std::tuple_size_v<A>,
                                                     tv));
                    ZW_TRY(serializeTupleElements(alt, tv));
                    return tv.end();
                }
                else
                {
                    return ser.serializeNewtypeVariant(name, index, variant, alt);
                }
            },
            v);
    }
};

} // namespace zerowire::serde
