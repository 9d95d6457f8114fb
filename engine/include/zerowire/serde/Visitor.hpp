#pragma once

#include <zerowire/codec/Utf8.hpp>
#include <zerowire/serde/Error.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace zerowire::serde
{

/// 값 구성 프로토콜의 visitor 베이스 (CRTP, 가상 함수 없음).
///
/// deserializer 는 값 하나를 읽을 때마다 아래 visit* 중 정확히 하나만 부른다.
/// 파생 visitor 는 받아들일 모양만 재정의하고, 나머지는 기본 구현이
/// "invalid type: ..., expected <expecting()>" custom 오류로 거절한다.
///
/// - 좁은 정수는 visitI64 / visitU64 로, f32 는 visitF64 로 모인다.
/// - borrowed 형태는 기본적으로 transient 형태로 넘어간다.
/// - De 는 실제로 값을 읽은 deserializer (JSON map key 처럼 래퍼일 수 있다).
template <class Derived>
class Visitor
{
  public:
    template <class De>
    typename De::Error visitBool(De &de, bool v)
    {
        return de.invalidType(Unexpected::boolean(v), self().expecting());
    }

    template <class De>
    typename De::Error visitI8(De &de, std::int8_t v)
    {
        return self().visitI64(de, v);
    }
    template <class De>
    typename De::Error visitI16(De &de, std::int16_t v)
    {
        return self().visitI64(de, v);
    }
    template <class De>
    typename De::Error visitI32(De &de, std::int32_t v)
    {
        return self().visitI64(de, v);
    }
    template <class De>
    typename De::Error visitI64(De &de, std::int64_t v)
    {
        return de.invalidType(Unexpected::signedInt(v), self().expecting());
    }

    template <class De>
    typename De::Error visitU8(De &de, std::uint8_t v)
    {
        return self().visitU64(de, v);
    }
    template <class De>
    typename De::Error visitU16(De &de, std::uint16_t v)
    {
        return self().visitU64(de, v);
    }
    template <class De>
    typename De::Error visitU32(De &de, std::uint32_t v)
    {
        return self().visitU64(de, v);
    }
    template <class De>
    typename De::Error visitU64(De &de, std::uint64_t v)
    {
        return de.invalidType(Unexpected::unsignedInt(v), self().expecting());
    }

    template <class De>
    typename De::Error visitF32(De &de, float v)
    {
        return self().visitF64(de, v);
    }
    template <class De>
    typename De::Error visitF64(De &de, double v)
    {
        return de.invalidType(Unexpected::floating(v), self().expecting());
    }

    // 기본: UTF-8 로 인코드해서 visitStr 로 넘긴다
    template <class De>
    typename De::Error visitChar(De &de, char32_t v)
    {
        std::uint8_t utf8[4]{};
        const std::size_t n = codec::encodeUtf8(v, utf8);
        return self().visitStr(de, std::string_view(reinterpret_cast<const char *>(utf8), n));
    }

    template <class De>
    typename De::Error visitStr(De &de, std::string_view v)
    {
        return de.invalidType(Unexpected::str(v), self().expecting());
    }
    template <class De>
    typename De::Error visitBorrowedStr(De &de, std::string_view v)
    {
        return self().visitStr(de, v);
    }

    template <class De>
    typename De::Error visitBytes(De &de, std::span<const std::uint8_t>)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Bytes), self().expecting());
    }
    template <class De>
    typename De::Error visitBorrowedBytes(De &de, std::span<const std::uint8_t> v)
    {
        return self().visitBytes(de, v);
    }

    template <class De>
    typename De::Error visitUnit(De &de)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Unit), self().expecting());
    }
    template <class De>
    typename De::Error visitNone(De &de)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Option), self().expecting());
    }
    template <class De>
    typename De::Error visitSome(De &de)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Option), self().expecting());
    }

    template <class De, class Access>
    typename De::Error visitSeq(De &de, Access &)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Seq), self().expecting());
    }
    template <class De, class Access>
    typename De::Error visitMap(De &de, Access &)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Map), self().expecting());
    }
    template <class De, class Access>
    typename De::Error visitEnum(De &de, Access &)
    {
        return de.invalidType(Unexpected::of(Unexpected::Kind::Enum), self().expecting());
    }

  protected:
    Visitor() = default;

  private:
    Derived &self() noexcept { return static_cast<Derived &>(*this); }
};

} // namespace zerowire::serde
