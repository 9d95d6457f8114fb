#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace zerowire::serde
{

// ============================================================================
// 타입 자기 기술(self-description)
//
//   struct Point { int x; int y; };
//   template <> struct zerowire::serde::StructTraits<Point> {
//       static constexpr std::string_view name = "Point";
//       static constexpr auto fields = std::make_tuple(field("x", &Point::x),
//                                                      field("y", &Point::y));
//       // static constexpr bool allowMissing = true;  // 빠진 필드는 현재 값 유지
//   };
//
//   enum class Flavor { Strawberry, Vanilla };
//   template <> struct zerowire::serde::EnumTraits<Flavor> {
//       static constexpr std::string_view name = "Flavor";
//       static constexpr std::array<std::string_view, 2> variants = {"Strawberry", "Vanilla"};
//   };
//
//   using Shape = std::variant<Unit, Circle, std::tuple<int, int>>;
//   template <> struct zerowire::serde::VariantTraits<Shape> { name, variants };
// ============================================================================

/// 값이 없는 타입 (unit / unit variant)
struct Unit
{
    friend constexpr bool operator==(Unit, Unit) noexcept { return true; }
};

/// 소유하는 바이트 버퍼. std::vector<uint8_t> 는 숫자 시퀀스로 다루고,
/// 이 타입은 바이트 문자열(JSON 전략 / MessagePack bin)로 다룬다.
struct ByteBuf
{
    std::vector<std::uint8_t> bytes;

    friend bool operator==(const ByteBuf &, const ByteBuf &) = default;
};

/// 내용을 검증만 하고 버리는 타입 (모르는 필드 건너뛰기)
struct IgnoredAny
{
};

template <class T>
struct StructTraits; // 사용자가 특수화

template <class E>
struct EnumTraits; // C-like enum: 0..N-1 값

template <class V>
struct VariantTraits; // std::variant 기반 data-bearing enum

template <class Owner, class Member>
struct FieldDesc
{
    std::string_view name;
    Member Owner::*member;

    using owner_type = Owner;
    using member_type = Member;
};

template <class Owner, class Member>
constexpr FieldDesc<Owner, Member> field(std::string_view name, Member Owner::*member) noexcept
{
    return FieldDesc<Owner, Member>{name, member};
}

template <class T>
concept DescribedStruct = requires {
    StructTraits<T>::name;
    StructTraits<T>::fields;
};

template <class T>
concept DescribedEnum = std::is_enum_v<T> && requires {
    EnumTraits<T>::name;
    EnumTraits<T>::variants;
};

template <class T>
concept DescribedVariant = requires {
    VariantTraits<T>::name;
    VariantTraits<T>::variants;
};

template <class T>
struct IsOptional : std::false_type
{
};
template <class T>
struct IsOptional<std::optional<T>> : std::true_type
{
};

template <class T>
struct IsTuple : std::false_type
{
};
template <class... Ts>
struct IsTuple<std::tuple<Ts...>> : std::true_type
{
};

template <class T>
concept SignedInteger = std::is_integral_v<T> && std::is_signed_v<T> && !std::is_same_v<T, char> &&
                        !std::is_same_v<T, wchar_t>;

template <class T>
concept UnsignedInteger = std::is_integral_v<T> && std::is_unsigned_v<T> &&
                          !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
                          !std::is_same_v<T, char8_t> &&
                          !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t> &&
                          !std::is_same_v<T, wchar_t>;

template <class T>
concept UnitLike = std::is_same_v<T, Unit> || std::is_same_v<T, std::monostate>;

/// StructTraits 에서 뽑은 컴파일 타임 정보
template <class T>
struct StructInfo
{
    using Fields = std::remove_cvref_t<decltype(StructTraits<T>::fields)>;
    static constexpr std::size_t count = std::tuple_size_v<Fields>;

    static constexpr std::array<std::string_view, count> names =
        []<std::size_t... I>(std::index_sequence<I...>) {
            return std::array<std::string_view, count>{std::get<I>(StructTraits<T>::fields).name...};
        }(std::make_index_sequence<count>{});

    static constexpr bool allowMissing = [] {
        if constexpr (requires { StructTraits<T>::allowMissing; })
            return static_cast<bool>(StructTraits<T>::allowMissing);
        else
            return false;
    }();

    /// 이름 -> 인덱스. 없으면 count.
    static constexpr std::size_t indexOf(std::string_view name) noexcept
    {
        for (std::size_t i = 0; i < count; ++i)
        {
            if (names[i] == name)
                return i;
        }
        return count;
    }

    /// 런타임 인덱스를 컴파일 타임 필드 기술자로 바꿔 fn(desc) 를 호출한다.
    /// index 가 범위 밖이면 fn 을 부르지 않고 R{} 를 돌려준다.
    template <class R, class Fn>
    static R withField(std::size_t index, Fn &&fn)
    {
        R result{};
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (void)((I == index ? (result = fn(std::get<I>(StructTraits<T>::fields)), true)
                               : false) ||
                   ...);
        }(std::make_index_sequence<count>{});
        return result;
    }
};

/// 이름 목록에서 인덱스 찾기. 없으면 names.size().
constexpr std::size_t findName(std::span<const std::string_view> names,
                               std::string_view name) noexcept
{
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (names[i] == name)
            return i;
    }
    return names.size();
}

} // namespace zerowire::serde
