#include <zerowire/json/Json.hpp>
#include <zerowire/serde/Describe.hpp>
#include <zerowire/serde/Value.hpp>
#include <zerowire/sink/ByteSink.hpp>

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
using zerowire::json::SerError;
using zerowire::serde::Value;

template <class T>
std::string dump(const T &value, SerError expected = SerError::Ok)
{
    std::string out;
    const SerError err = zerowire::json::toString(value, out);
    CHECK(err == expected);
    return out;
}

void test_struct_as_object()
{
    CHECK(dump(Point{1, -2}) == R"({"x":1,"y":-2})");
    CHECK(dump(std::vector<Point>{{1, 2}, {3, 4}}) == R"([{"x":1,"y":2},{"x":3,"y":4}])");
    CHECK(dump(std::vector<Point>{}) == "[]");
}

void test_integer_extremes()
{
    CHECK(dump(std::numeric_limits<std::int64_t>::min()) == "-9223372036854775808");
    CHECK(dump(std::numeric_limits<std::uint64_t>::max()) == "18446744073709551615");
    CHECK(dump(std::int8_t{-7}) == "-7");
    CHECK(dump(std::uint16_t{0}) == "0");
}

void test_float_shortest_form()
{
    CHECK(dump(1.0) == "1");
    CHECK(dump(-0.0) == "0");
    CHECK(dump(0.1) == "0.1");
    CHECK(dump(1.5F) == "1.5");
    CHECK(dump(-123.456) == "-123.456");
    CHECK(dump(1234567.0) == "1234567");
    CHECK(dump(std::numeric_limits<double>::quiet_NaN()) == "null");
    CHECK(dump(-std::numeric_limits<double>::infinity()) == "null");
}

// 1e-7 <= |x| < 1e21 은 고정소수점, 그 밖은 지수 (JavaScript 숫자 표기와 같다)
void test_float_fixed_and_exponent_ranges()
{
    CHECK(dump(1e20) == "100000000000000000000");
    CHECK(dump(1.5e20) == "150000000000000000000");
    CHECK(dump(1e21) == "1e+21");
    CHECK(dump(-1.25e21) == "-1.25e+21");
    CHECK(dump(1e-6) == "0.000001");
    CHECK(dump(1.5e-6) == "0.0000015");
    CHECK(dump(1e-7) == "1e-7");
    CHECK(dump(1.5e-7) == "1.5e-7");
    CHECK(dump(std::numeric_limits<double>::max()) == "1.7976931348623157e+308");
    CHECK(dump(5e-324) == "5e-324");
    CHECK(dump(-2.3456789012345e-23F) == "-2.3456788e-23");
}

void test_string_escapes()
{
    const std::string_view s("\"\\\n\t\x01\x1F/", 7);
    CHECK(dump(s) == R"("\"\\\n\t\u0001\u001F/")");
    CHECK(dump(std::string("plain")) == R"("plain")");
    CHECK(dump(std::string_view("\xC3\xA9")) == "\"\xC3\xA9\"");
    CHECK(dump(char32_t{0x1F600}) == "\"\xF0\x9F\x98\x80\"");
}

void test_options_and_tuples()
{
    CHECK(dump(std::optional<std::int32_t>{}) == "null");
    CHECK(dump(std::vector<std::optional<std::int32_t>>{1, std::nullopt}) == "[1,null]");
    CHECK(dump(std::make_tuple(std::int32_t{1}, true, std::string("a"))) == R"([1,true,"a"])");
    CHECK(dump(zerowire::serde::Unit{}) == "null");
}

void test_enum_shapes()
{
    CHECK(dump(Flavor::Vanilla) == R"("Vanilla")");
    CHECK(dump(Shape{zerowire::serde::Unit{}}) == R"("Empty")");
    CHECK(dump(Shape{2.5}) == R"({"Circle":2.5})");
    CHECK(dump(Shape{std::make_tuple(1, 2)}) == R"({"Rect":[1,2]})");
    CHECK(dump(Shape{Point{5, 6}}) == R"({"Point":{"x":5,"y":6}})");
}

void test_map_keys()
{
    CHECK(dump(std::map<std::uint32_t, bool>{{1, true}, {22, false}}) ==
          R"({"1":true,"22":false})");
    CHECK(dump(std::map<bool, std::int32_t>{{false, 0}, {true, 1}}) == R"({"false":0,"true":1})");
    CHECK(dump(std::map<std::string, std::vector<std::int32_t>>{{"a", {1}}, {"b", {}}}) ==
          R"({"a":[1],"b":[]})");
    CHECK(dump(std::map<Flavor, std::int32_t>{{Flavor::Vanilla, 3}}) == R"({"Vanilla":3})");

    dump(std::map<double, std::int32_t>{{1.5, 1}}, SerError::InvalidKeyType);

    Value obj(Value::Object{{Value(std::uint64_t{7}), Value(true)}});
    CHECK(dump(obj) == R"({"7":true})");
    Value bad(Value::Object{{Value(Value::Array{}), Value(true)}});
    dump(bad, SerError::InvalidKeyType);
}

void test_value_round_trip_text()
{
    Value v(Value::Object{
        {Value("a"), Value(Value::Array{Value(std::uint64_t{1}), Value(std::int64_t{-2}),
                                        Value(3.5), Value(true), Value(), Value("s")})},
    });
    CHECK(dump(v) == R"({"a":[1,-2,3.5,true,null,"s"]})");
}

void test_writer_capacity()
{
    zerowire::sink::FixedWriter<4> small;
    const SerError err = zerowire::json::toWriter(small, std::string_view("hello"));
    CHECK(err == SerError::Writer);

    zerowire::sink::FixedWriter<16> enough;
    CHECK(zerowire::json::toWriter(enough, std::string_view("hello")) == SerError::Ok);
    CHECK(enough.view() == R"("hello")");
}

void test_collect_str_escapes()
{
    std::string out;
    zerowire::sink::StringWriter w(out);
    zerowire::json::Serializer<zerowire::sink::StringWriter> ser(w);
    CHECK(ser.collectStr("{}-{}", 42, std::string_view("a\"b")) == SerError::Ok);
    CHECK(out == R"("42-a\"b")");
}
} // namespace

int main()
{
    test_struct_as_object();
    test_integer_extremes();
    test_float_shortest_form();
    test_float_fixed_and_exponent_ranges();
    test_string_escapes();
    test_options_and_tuples();
    test_enum_shapes();
    test_map_keys();
    test_value_round_trip_text();
    test_writer_capacity();
    test_collect_str_escapes();

    if (g_fail == 0)
    {
        std::cout << "[OK] zerowire.json.serializer\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
