#include <zerowire/msgpack/MsgPack.hpp>
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
using zerowire::msgpack::SerError;
using Bytes = std::vector<std::uint8_t>;

template <class T>
Bytes pack(const T &value)
{
    Bytes out;
    CHECK(zerowire::msgpack::toVector(value, out) == SerError::Ok);
    return out;
}

template <class T>
Bytes packNamed(const T &value)
{
    Bytes out;
    CHECK(zerowire::msgpack::toVectorNamed(value, out) == SerError::Ok);
    return out;
}

Bytes concat(Bytes head, std::string_view tail)
{
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

void test_unsigned_minimal_width()
{
    CHECK((pack(std::uint32_t{0}) == Bytes{0x00}));
    CHECK((pack(std::uint32_t{127}) == Bytes{0x7F}));
    CHECK((pack(std::uint32_t{128}) == Bytes{0xCC, 0x80}));
    CHECK((pack(std::uint32_t{300}) == Bytes{0xCD, 0x01, 0x2C}));
    CHECK((pack(std::uint32_t{70000}) == Bytes{0xCE, 0x00, 0x01, 0x11, 0x70}));
    CHECK((pack(std::numeric_limits<std::uint64_t>::max()) ==
           Bytes{0xCF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
}

void test_signed_minimal_width()
{
    CHECK((pack(std::int32_t{-1}) == Bytes{0xFF}));
    CHECK((pack(std::int32_t{-32}) == Bytes{0xE0}));
    CHECK((pack(std::int32_t{-33}) == Bytes{0xD0, 0xDF}));
    CHECK((pack(std::int32_t{-129}) == Bytes{0xD1, 0xFF, 0x7F}));
    CHECK((pack(std::int32_t{200}) == Bytes{0xCC, 0xC8}));
    // 같은 폭이면 signed 원본의 양수는 intN 태그
    CHECK((pack(std::int32_t{300}) == Bytes{0xD1, 0x01, 0x2C}));
    CHECK((pack(std::int64_t{70000}) == Bytes{0xD2, 0x00, 0x01, 0x11, 0x70}));
    CHECK((pack(std::numeric_limits<std::int64_t>::min()) ==
           Bytes{0xD3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

void test_scalars()
{
    CHECK((pack(true) == Bytes{0xC3}));
    CHECK((pack(false) == Bytes{0xC2}));
    CHECK((pack(std::optional<std::int32_t>{}) == Bytes{0xC0}));
    CHECK((pack(std::optional<std::int32_t>{5}) == Bytes{0x05}));
    CHECK((pack(1.5) == Bytes{0xCB, 0x3F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
    CHECK((pack(1.5F) == Bytes{0xCA, 0x3F, 0xC0, 0x00, 0x00}));
    CHECK((pack(-0.0) == Bytes{0xCB, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
    CHECK((pack(char32_t{0xE9}) == Bytes{0xA2, 0xC3, 0xA9}));
}

void test_strings_and_bytes()
{
    CHECK((pack(std::string_view("abc")) == Bytes{0xA3, 'a', 'b', 'c'}));
    CHECK((pack(std::string()) == Bytes{0xA0}));

    const std::string s31(31, 'x');
    CHECK(pack(s31) == concat(Bytes{0xBF}, s31));
    const std::string s32(32, 'x');
    CHECK(pack(s32) == concat(Bytes{0xD9, 0x20}, s32));
    const std::string s256(256, 'x');
    CHECK(pack(s256) == concat(Bytes{0xDA, 0x01, 0x00}, s256));

    CHECK((pack(zerowire::serde::ByteBuf{{1, 2}}) == Bytes{0xC4, 0x02, 0x01, 0x02}));
    CHECK((pack(zerowire::serde::ByteBuf{}) == Bytes{0xC4, 0x00}));
}

void test_containers()
{
    CHECK((pack(std::vector<std::int32_t>{1, 2, 3}) == Bytes{0x93, 0x01, 0x02, 0x03}));
    CHECK((pack(std::vector<std::int32_t>{}) == Bytes{0x90}));

    const Bytes sixteen = pack(std::vector<std::uint8_t>(16, 7));
    CHECK(sixteen.size() == 3 + 16);
    CHECK(sixteen[0] == 0xDC && sixteen[1] == 0x00 && sixteen[2] == 0x10);

    CHECK((pack(std::map<std::string, std::int32_t>{{"a", 1}}) == Bytes{0x81, 0xA1, 'a', 0x01}));
    CHECK((pack(std::make_tuple(std::int32_t{1}, true)) == Bytes{0x92, 0x01, 0xC3}));
}

void test_struct_profiles()
{
    CHECK((pack(Point{1, 2}) == Bytes{0x92, 0x01, 0x02}));
    CHECK((packNamed(Point{1, 2}) == Bytes{0x82, 0xA1, 'x', 0x01, 0xA1, 'y', 0x02}));
}

void test_enum_profiles()
{
    CHECK((pack(Flavor::Vanilla) == Bytes{0x01}));
    CHECK(packNamed(Flavor::Vanilla) == concat(Bytes{0xA7}, "Vanilla"));

    CHECK((pack(Shape{zerowire::serde::Unit{}}) == Bytes{0x00}));
    CHECK(packNamed(Shape{zerowire::serde::Unit{}}) == concat(Bytes{0xA5}, "Empty"));

    CHECK((pack(Shape{2.5}) ==
           Bytes{0x81, 0x01, 0xCB, 0x40, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
    CHECK((pack(Shape{std::make_tuple(1, 2)}) == Bytes{0x81, 0x02, 0x92, 0x01, 0x02}));
    CHECK((pack(Shape{Point{5, 6}}) == Bytes{0x81, 0x03, 0x92, 0x05, 0x06}));

    Bytes named = concat(Bytes{0x81, 0xA5}, "Point");
    named.insert(named.end(), {0x82, 0xA1, 'x', 0x05, 0xA1, 'y', 0x06});
    CHECK(packNamed(Shape{Point{5, 6}}) == named);
}

void test_value()
{
    using zerowire::serde::Value;
    Value v(Value::Object{
        {Value("a"), Value(Value::Array{Value(std::uint64_t{1}), Value(std::int64_t{-1}), Value()})},
        {Value(std::uint64_t{2}), Value(zerowire::serde::ByteBuf{{9}})},
    });
    const Bytes expected{0x82, 0xA1, 'a', 0x93, 0x01, 0xFF, 0xC0, 0x02, 0xC4, 0x01, 0x09};
    CHECK(pack(v) == expected);
}

void test_length_mismatch()
{
    Bytes out;
    zerowire::sink::VectorWriter w(out);
    zerowire::msgpack::Serializer<zerowire::sink::VectorWriter> ser(w);

    zerowire::msgpack::Serializer<zerowire::sink::VectorWriter>::SerializeSeq seq;
    CHECK(ser.serializeSeq(std::optional<std::size_t>(3), seq) == SerError::Ok);
    CHECK(seq.serializeElement(std::int32_t{1}) == SerError::Ok);
    CHECK(seq.end() == SerError::SeqLength);

    zerowire::msgpack::Serializer<zerowire::sink::VectorWriter>::SerializeMap map;
    CHECK(ser.serializeMap(std::optional<std::size_t>(0), map) == SerError::Ok);
    CHECK(map.serializeKey(std::int32_t{1}) == SerError::MapLength);

    CHECK(ser.serializeSeq(std::nullopt, seq) == SerError::SeqLength);
    CHECK(ser.serializeMap(std::nullopt, map) == SerError::MapLength);
}

void test_collect_str()
{
    Bytes out;
    zerowire::sink::VectorWriter w(out);
    zerowire::msgpack::Serializer<zerowire::sink::VectorWriter> ser(w);
    CHECK(ser.collectStr("{}-{}", 7, std::string_view("ab")) == SerError::Ok);
    CHECK((out == Bytes{0xA4, '7', '-', 'a', 'b'}));
}

void test_writer_failure()
{
    zerowire::sink::FixedWriter<2> small;
    CHECK(zerowire::msgpack::toWriter(small, std::string_view("abc")) == SerError::Writer);

    Bytes out;
    zerowire::sink::VectorWriter limited(out, 3);
    CHECK(zerowire::msgpack::toWriter(limited, std::uint32_t{70000}) == SerError::Writer);
}
} // namespace

int main()
{
    test_unsigned_minimal_width();
    test_signed_minimal_width();
    test_scalars();
    test_strings_and_bytes();
    test_containers();
    test_struct_profiles();
    test_enum_profiles();
    test_value();
    test_length_mismatch();
    test_collect_str();
    test_writer_failure();

    if (g_fail == 0)
    {
        std::cout << "[OK] zerowire.msgpack.serializer\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
