#include <zerowire/json/Json.hpp>
#include <zerowire/serde/Describe.hpp>
#include <zerowire/serde/Value.hpp>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace
{
int g_fail = 0;

#define CHECK(expr)                                                                                \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
        {                                                                                          \
            ++g_fail;                                                                              \
            std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " :: " #expr << "\n";     \
        }                                                                                          \
    } while (0)

struct Point
{
    std::int32_t x{0};
    std::int32_t y{0};
};

struct Listener
{
    std::string_view name;
    std::optional<std::uint16_t> port;
    std::vector<bool> flags;
};

enum class Flavor
{
    Strawberry,
    Vanilla,
};

using Shape = std::variant<zerowire::serde::Unit, double, std::tuple<std::int32_t, std::int32_t>,
                           Point>;
} // namespace

namespace zerowire::serde
{
template <>
struct StructTraits<Point>
{
    static constexpr std::string_view name = "Point";
    static constexpr auto fields = std::make_tuple(field("x", &Point::x), field("y", &Point::y));
};

template <>
struct StructTraits<Listener>
{
    static constexpr std::string_view name = "Listener";
    static constexpr auto fields =
        std::make_tuple(field("name", &Listener::name), field("port", &Listener::port),
                        field("flags", &Listener::flags));
};

template <>
struct EnumTraits<Flavor>
{
    static constexpr std::string_view name = "Flavor";
    static constexpr std::array<std::string_view, 2> variants = {"Strawberry", "Vanilla"};
};

template <>
struct VariantTraits<Shape>
{
    static constexpr std::string_view name = "Shape";
    static constexpr std::array<std::string_view, 4> variants = {"Empty", "Circle", "Rect",
                                                                 "Point"};
};
} // namespace zerowire::serde

namespace
{
using zerowire::json::DeError;
using zerowire::json::fromMutSlice;
using zerowire::serde::ErrorMessage;
using zerowire::serde::Value;

std::vector<std::uint8_t> buf(std::string_view s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

template <class T>
DeError parse(std::vector<std::uint8_t> &b, T &out, ErrorMessage *msg = nullptr)
{
    return fromMutSlice(std::span<std::uint8_t>(b), out, msg);
}

void test_struct_from_object_any_order()
{
    auto b = buf(R"( { "y" : -2, "x" : 1 } )");
    Point p;
    CHECK(parse(b, p) == DeError::Ok);
    CHECK(p.x == 1);
    CHECK(p.y == -2);
}

void test_struct_from_array()
{
    auto b = buf("[3,4]");
    Point p;
    CHECK(parse(b, p) == DeError::Ok);
    CHECK(p.x == 3);
    CHECK(p.y == 4);
}

void test_struct_ignores_unknown_fields()
{
    auto b = buf(R"({"x":1,"extra":{"a":[1,2.5,{"b":null}],"s":"q\"}"},"y":2})");
    Point p;
    CHECK(parse(b, p) == DeError::Ok);
    CHECK(p.x == 1);
    CHECK(p.y == 2);
}

void test_struct_missing_and_duplicate_field()
{
    {
        auto b = buf(R"({"x":1})");
        Point p;
        ErrorMessage msg;
        CHECK(parse(b, p, &msg) == DeError::Custom);
        CHECK(msg.view() == "missing field `y`");
    }
    {
        auto b = buf(R"({"x":1,"x":2,"y":3})");
        Point p;
        ErrorMessage msg;
        CHECK(parse(b, p, &msg) == DeError::Custom);
        CHECK(msg.view() == "duplicate field `x`");
    }
}

void test_optional_field_and_borrowed_name()
{
    {
        auto b = buf(R"({"name":"svc","flags":[true,false]})");
        Listener l;
        l.port = 1;
        CHECK(parse(b, l) == DeError::Ok);
        CHECK(l.name == "svc");
        CHECK(!l.port.has_value());
        CHECK(l.flags.size() == 2);
        CHECK(l.flags[0] && !l.flags[1]);
    }
    {
        auto b = buf(R"({"name":"a\tb","port":8080,"flags":[]})");
        Listener l;
        CHECK(parse(b, l) == DeError::Ok);
        CHECK(l.name == "a\tb");
        // 이름은 입력 버퍼 안을 가리킨다
        const auto *p = reinterpret_cast<const std::uint8_t *>(l.name.data());
        CHECK(p >= b.data() && p < b.data() + b.size());
        CHECK(l.port == std::optional<std::uint16_t>(8080));
        CHECK(l.flags.empty());
    }
}

void test_integer_widths()
{
    {
        auto b = buf("255");
        std::uint8_t v = 0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == 255);
    }
    {
        auto b = buf("256");
        std::uint8_t v = 0;
        CHECK(parse(b, v) == DeError::InvalidNumber);
    }
    {
        auto b = buf("-128");
        std::int8_t v = 0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == -128);
    }
    {
        auto b = buf("-129");
        std::int8_t v = 0;
        CHECK(parse(b, v) == DeError::InvalidNumber);
    }
    {
        auto b = buf("-0");
        std::int32_t v = 7;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == 0);
    }
    {
        auto b = buf("-1");
        std::uint32_t v = 0;
        CHECK(parse(b, v) == DeError::InvalidNumber);
    }
    {
        auto b = buf(R"("1")");
        std::uint32_t v = 0;
        CHECK(parse(b, v) == DeError::InvalidType);
    }
    {
        auto b = buf("18446744073709551615");
        std::uint64_t v = 0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == std::numeric_limits<std::uint64_t>::max());
    }
}

void test_float_edges()
{
    {
        auto b = buf("null");
        double v = 0.0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(std::isnan(v));
    }
    {
        auto b = buf("-1e500");
        double v = 0.0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(std::isinf(v) && v < 0);
    }
    {
        auto b = buf("-1e-500");
        double v = 1.0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == 0.0 && std::signbit(v));
    }
    {
        auto b = buf("+1.5");
        float v = 0.0F;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == 1.5F);
    }
    {
        auto b = buf("1.5x");
        double v = 0.0;
        CHECK(parse(b, v) == DeError::TrailingCharacters);
    }
}

void test_string_unescape_in_place()
{
    auto b = buf(R"("a\nb\u0041\u00e9\"q")");
    std::string_view s;
    CHECK(parse(b, s) == DeError::Ok);
    CHECK(s == "a\nbA\xC3\xA9\"q");
    CHECK(reinterpret_cast<const std::uint8_t *>(s.data()) == b.data() + 1);
}

void test_string_errors()
{
    {
        auto b = buf(R"("\ud800")");
        std::string_view s;
        CHECK(parse(b, s) == DeError::InvalidUnicodeCodePoint);
    }
    {
        auto b = buf("\"a\x01"
                     "b\"");
        std::string_view s;
        CHECK(parse(b, s) == DeError::StringControlChar);
    }
    {
        auto b = buf(R"("\x")");
        std::string_view s;
        CHECK(parse(b, s) == DeError::InvalidEscapeSequence);
    }
    {
        auto b = buf(R"("abc)");
        std::string_view s;
        CHECK(parse(b, s) == DeError::UnexpectedEof);
    }
    {
        auto b = buf("12");
        std::string s;
        CHECK(parse(b, s) == DeError::ExpectedString);
    }
}

void test_char()
{
    {
        auto b = buf("\"\xC3\xA9\"");
        char32_t c = 0;
        CHECK(parse(b, c) == DeError::Ok);
        CHECK(c == 0xE9);
    }
    {
        auto b = buf(R"("ab")");
        char32_t c = 0;
        CHECK(parse(b, c) == DeError::InvalidLength);
    }
    {
        auto b = buf("1");
        char32_t c = 0;
        CHECK(parse(b, c) == DeError::ExpectedString);
    }
}

void test_sequence_comma_rules()
{
    {
        auto b = buf("[ 1 , 2 ]");
        std::vector<std::int32_t> v;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK((v == std::vector<std::int32_t>{1, 2}));
    }
    {
        auto b = buf("[,1]");
        std::vector<std::int32_t> v;
        CHECK(parse(b, v) == DeError::LeadingArrayComma);
    }
    {
        auto b = buf("[1,]");
        std::vector<std::int32_t> v;
        CHECK(parse(b, v) == DeError::TrailingArrayComma);
    }
    {
        auto b = buf("[1 2]");
        std::vector<std::int32_t> v;
        CHECK(parse(b, v) == DeError::ExpectedArrayCommaOrEnd);
    }
    {
        auto b = buf("{}");
        std::vector<std::int32_t> v;
        CHECK(parse(b, v) == DeError::ExpectedArray);
    }
}

void test_map_keys()
{
    {
        auto b = buf(R"({"1":true,"22":false})");
        std::map<std::uint32_t, bool> m;
        CHECK(parse(b, m) == DeError::Ok);
        CHECK(m.size() == 2);
        CHECK(m[1] == true);
        CHECK(m[22] == false);
    }
    {
        auto b = buf(R"({"1x":true})");
        std::map<std::uint32_t, bool> m;
        CHECK(parse(b, m) == DeError::InvalidNumber);
    }
    {
        auto b = buf(R"({1:true})");
        std::map<std::uint32_t, bool> m;
        CHECK(parse(b, m) == DeError::KeyMustBeAString);
    }
    {
        auto b = buf(R"({"a" 1})");
        std::map<std::string, std::int32_t> m;
        CHECK(parse(b, m) == DeError::ExpectedColon);
    }
}

void test_enum_forms()
{
    {
        auto b = buf(R"("Vanilla")");
        Flavor f = Flavor::Strawberry;
        CHECK(parse(b, f) == DeError::Ok);
        CHECK(f == Flavor::Vanilla);
    }
    {
        auto b = buf(R"("Chocolate")");
        Flavor f = Flavor::Strawberry;
        ErrorMessage msg;
        CHECK(parse(b, f, &msg) == DeError::Custom);
        CHECK(msg.view() == "unknown variant `Chocolate`, expected `Strawberry` or `Vanilla`");
    }
    {
        auto b = buf("5");
        Flavor f = Flavor::Strawberry;
        CHECK(parse(b, f) == DeError::ExpectedEnumValue);
    }
    {
        auto b = buf(R"("Empty")");
        Shape s = 1.0;
        CHECK(parse(b, s) == DeError::Ok);
        CHECK(s.index() == 0);
    }
    {
        auto b = buf(R"({"Circle":2.5})");
        Shape s;
        CHECK(parse(b, s) == DeError::Ok);
        CHECK(s.index() == 1 && std::get<1>(s) == 2.5);
    }
    {
        auto b = buf(R"({"Rect":[1,2]})");
        Shape s;
        CHECK(parse(b, s) == DeError::Ok);
        CHECK(s.index() == 2);
        CHECK(std::get<2>(s) == std::make_tuple(1, 2));
    }
    {
        auto b = buf(R"({ "Point" : { "x" : 5, "y" : 6 } })");
        Shape s;
        CHECK(parse(b, s) == DeError::Ok);
        CHECK(s.index() == 3);
        CHECK(std::get<3>(s).x == 5 && std::get<3>(s).y == 6);
    }
    {
        // payload 없는 variant 를 객체 형태로, payload 있는 variant 를 이름만으로
        auto b1 = buf(R"({"Empty":null})");
        Shape s;
        CHECK(parse(b1, s) == DeError::InvalidType);
        auto b2 = buf(R"("Circle")");
        CHECK(parse(b2, s) == DeError::InvalidType);
    }
    {
        auto b = buf(R"({"Circle":2.5,"x":1})");
        Shape s;
        CHECK(parse(b, s) == DeError::ExpectedEnumObjectEnd);
    }
}

void test_trailing_characters()
{
    {
        auto b = buf("  7  \n");
        std::uint32_t v = 0;
        CHECK(parse(b, v) == DeError::Ok);
        CHECK(v == 7);
    }
    {
        auto b = buf("1 2");
        std::uint32_t v = 0;
        CHECK(parse(b, v) == DeError::TrailingCharacters);
    }
    {
        auto b = buf("");
        std::uint32_t v = 0;
        CHECK(parse(b, v) == DeError::UnexpectedEof);
    }
}

void test_nesting_depth_limit()
{
    using zerowire::json::Deserializer;
    const auto nested = [](std::size_t depth) {
        return buf(std::string(depth, '[') + std::string(depth, ']'));
    };

    Value v;
    auto ok = nested(Deserializer<>::kDefaultMaxDepth);
    CHECK(parse(ok, v) == DeError::Ok);
    auto tooDeep = nested(Deserializer<>::kDefaultMaxDepth + 1);
    CHECK(parse(tooDeep, v) == DeError::DepthLimitExceeded);

    // 객체와 enum 객체 형태도 한 단계씩
    auto objects = buf(R"({"a":{"b":{}}})");
    CHECK(fromMutSlice(std::span<std::uint8_t>(objects), v, nullptr, 2) ==
          DeError::DepthLimitExceeded);
    auto rect = buf(R"({"Rect":[1,2]})");
    Shape s;
    CHECK(fromMutSlice(std::span<std::uint8_t>(rect), s, nullptr, 1) ==
          DeError::DepthLimitExceeded);
    rect = buf(R"({"Rect":[1,2]})");
    CHECK(fromMutSlice(std::span<std::uint8_t>(rect), s, nullptr, 2) == DeError::Ok);

    // 버리는 필드 안의 중첩도 같은 한도를 따른다
    auto unknown = buf(R"({"x":1,"skip":[[[[]]]],"y":2})");
    Point p;
    CHECK(fromMutSlice(std::span<std::uint8_t>(unknown), p, nullptr, 4) ==
          DeError::DepthLimitExceeded);
    unknown = buf(R"({"x":1,"skip":[[[[]]]],"y":2})");
    CHECK(fromMutSlice(std::span<std::uint8_t>(unknown), p, nullptr, 5) == DeError::Ok);
    CHECK(p.x == 1 && p.y == 2);
}

void test_value_any()
{
    auto b = buf(R"({"a":[1,-2,3.5,true,null,"s"],"big":18446744073709551616})");
    Value v;
    CHECK(parse(b, v) == DeError::Ok);
    CHECK(v.kind() == Value::Kind::Object);

    const Value *a = v.find("a");
    CHECK(a != nullptr);
    if (a == nullptr || a->asArray() == nullptr)
        return;
    const Value::Array &items = *a->asArray();
    CHECK(items.size() == 6);
    if (items.size() != 6)
        return;
    CHECK(items[0] == Value(std::uint64_t{1}));
    CHECK(items[1] == Value(std::int64_t{-2}));
    CHECK(items[2] == Value(3.5));
    CHECK(items[3] == Value(true));
    CHECK(items[4].isNull());
    CHECK(items[5] == Value("s"));

    // u64 를 넘는 정수는 실수로 떨어진다
    const Value *big = v.find("big");
    CHECK(big != nullptr && big->kind() == Value::Kind::Float);
    CHECK(v.find("missing") == nullptr);
}
} // namespace

int main()
{
    test_struct_from_object_any_order();
    test_struct_from_array();
    test_struct_ignores_unknown_fields();
    test_struct_missing_and_duplicate_field();
    test_optional_field_and_borrowed_name();
    test_integer_widths();
    test_float_edges();
    test_string_unescape_in_place();
    test_string_errors();
    test_char();
    test_sequence_comma_rules();
    test_map_keys();
    test_enum_forms();
    test_trailing_characters();
    test_value_any();
    test_nesting_depth_limit();

    if (g_fail == 0)
    {
        std::cout << "[OK] zerowire.json.deserializer\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
