#pragma once

#include <zerowire/codec/Utf8.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string_view>
#include <utility>

/// 첫 번째 오류를 그대로 위로 돌려준다. 오류 enum 은 0(Ok)이 성공이어야 한다.
#define ZW_TRY(expr)                                                                               \
    do                                                                                             \
    {                                                                                              \
        if (auto zwTryErr_ = (expr); zwTryErr_ != decltype(zwTryErr_){})                           \
            return zwTryErr_;                                                                      \
    } while (0)

namespace zerowire::serde
{

/// custom 오류 메시지를 담는 고정 크기 버퍼 (힙 없음, 넘치면 잘린다)
class ErrorMessage
{
  public:
    static constexpr std::size_t kCapacity = 160;

    template <typename... Args>
    void assign(std::format_string<Args...> fmt, Args &&...args)
    {
        len_ = 0;
        append(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void append(std::format_string<Args...> fmt, Args &&...args)
    {
        const std::size_t room = kCapacity - len_;
        const auto res = std::format_to_n(buf_.data() + len_, static_cast<std::ptrdiff_t>(room),
                                          fmt, std::forward<Args>(args)...);
        len_ += std::min(static_cast<std::size_t>(res.size), room);
    }

    void clear() noexcept { len_ = 0; }
    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }
    [[nodiscard]] std::string_view view() const noexcept { return {buf_.data(), len_}; }

  private:
    std::array<char, kCapacity> buf_{};
    std::size_t len_{0};
};

/// invalid type / invalid value 메시지에 들어가는 "실제로 만난 값" 설명
struct Unexpected
{
    enum class Kind : std::uint8_t
    {
        Bool,
        Unsigned,
        Signed,
        Float,
        Char,
        Str,
        Bytes,
        Unit,
        Option,
        Seq,
        Map,
        Enum,
        UnitVariant,
        NewtypeVariant,
        TupleVariant,
        StructVariant,
    };

    Kind kind{Kind::Unit};
    bool b{false};
    std::uint64_t u{0};
    std::int64_t i{0};
    double f{0.0};
    char32_t c{0};
    std::string_view s{};

    static Unexpected boolean(bool v) noexcept { return {.kind = Kind::Bool, .b = v}; }
    static Unexpected unsignedInt(std::uint64_t v) noexcept { return {.kind = Kind::Unsigned, .u = v}; }
    static Unexpected signedInt(std::int64_t v) noexcept { return {.kind = Kind::Signed, .i = v}; }
    static Unexpected floating(double v) noexcept { return {.kind = Kind::Float, .f = v}; }
    static Unexpected character(char32_t v) noexcept { return {.kind = Kind::Char, .c = v}; }
    static Unexpected str(std::string_view v) noexcept { return {.kind = Kind::Str, .s = v}; }
    static Unexpected of(Kind k) noexcept { return {.kind = k}; }
};

} // namespace zerowire::serde

template <>
struct std::formatter<zerowire::serde::Unexpected> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(const zerowire::serde::Unexpected &u, FormatContext &ctx) const
    {
        using Kind = zerowire::serde::Unexpected::Kind;
        switch (u.kind)
        {
        case Kind::Bool:
            return std::format_to(ctx.out(), "boolean `{}`", u.b);
        case Kind::Unsigned:
            return std::format_to(ctx.out(), "integer `{}`", u.u);
        case Kind::Signed:
            return std::format_to(ctx.out(), "integer `{}`", u.i);
        case Kind::Float:
            return std::format_to(ctx.out(), "floating point `{}`", u.f);
        case Kind::Char:
        {
            std::uint8_t utf8[4]{};
            const std::size_t n = zerowire::codec::encodeUtf8(u.c, utf8);
            return std::format_to(ctx.out(), "character `{}`",
                                  std::string_view(reinterpret_cast<const char *>(utf8), n));
        }
        case Kind::Str:
            return std::format_to(ctx.out(), "string \"{}\"", u.s);
        case Kind::Bytes:
            return std::format_to(ctx.out(), "byte array");
        case Kind::Unit:
            return std::format_to(ctx.out(), "unit value");
        case Kind::Option:
            return std::format_to(ctx.out(), "Option value");
        case Kind::Seq:
            return std::format_to(ctx.out(), "sequence");
        case Kind::Map:
            return std::format_to(ctx.out(), "map");
        case Kind::Enum:
            return std::format_to(ctx.out(), "enum");
        case Kind::UnitVariant:
            return std::format_to(ctx.out(), "unit variant");
        case Kind::NewtypeVariant:
            return std::format_to(ctx.out(), "newtype variant");
        case Kind::TupleVariant:
            return std::format_to(ctx.out(), "tuple variant");
        case Kind::StructVariant:
            return std::format_to(ctx.out(), "struct variant");
        }
        return ctx.out();
    }
};

namespace zerowire::serde
{

/// (de)serializer 공통 오류 보고 믹스인 (CRTP).
///
/// Derived 는 `ErrorMessage &errorMessage()` 를 제공해야 하고,
/// ErrorT 는 `Custom` 값을 가져야 한다.
template <class Derived, class ErrorT>
class ErrorReporting
{
  public:
    template <typename... Args>
    ErrorT custom(std::format_string<Args...> fmt, Args &&...args)
    {
        self().errorMessage().assign(fmt, std::forward<Args>(args)...);
        return ErrorT::Custom;
    }

    ErrorT invalidType(const Unexpected &unexp, std::string_view expected)
    {
        return custom("invalid type: {}, expected {}", unexp, expected);
    }

    ErrorT invalidValue(const Unexpected &unexp, std::string_view expected)
    {
        return custom("invalid value: {}, expected {}", unexp, expected);
    }

    ErrorT invalidLength(std::size_t len, std::string_view expected)
    {
        return custom("invalid length {}, expected {}", len, expected);
    }

    ErrorT variantIndexOutOfRange(std::uint64_t index, std::size_t count)
    {
        return custom("invalid value: integer `{}`, expected variant index 0 <= i < {}", index,
                      count);
    }

    ErrorT unknownVariant(std::string_view name, std::span<const std::string_view> expected)
    {
        ErrorMessage &msg = self().errorMessage();
        msg.assign("unknown variant `{}`, ", name);
        appendOneOf(msg, expected, "there are no variants");
        return ErrorT::Custom;
    }

    ErrorT missingField(std::string_view name) { return custom("missing field `{}`", name); }

    ErrorT duplicateField(std::string_view name) { return custom("duplicate field `{}`", name); }

  private:
    Derived &self() noexcept { return static_cast<Derived &>(*this); }

    static void appendOneOf(ErrorMessage &msg, std::span<const std::string_view> names,
                            std::string_view none)
    {
        switch (names.size())
        {
        case 0:
            msg.append("{}", none);
            return;
        case 1:
            msg.append("expected `{}`", names[0]);
            return;
        case 2:
            msg.append("expected `{}` or `{}`", names[0], names[1]);
            return;
        default:
            msg.append("expected one of `{}`", names[0]);
            for (std::size_t i = 1; i < names.size(); ++i)
                msg.append(", `{}`", names[i]);
            return;
        }
    }
};

} // namespace zerowire::serde
