#include <zerowire/codec/Base64.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
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

std::vector<std::uint8_t> bytesOf(std::string_view s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string encode(std::string_view s, std::uint8_t &padding)
{
    std::string out(zerowire::codec::base64EncodedLen(s.size()), '?');
    padding = zerowire::codec::base64Encode(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()),
        out.data());
    return out;
}

void test_encode_reports_padding()
{
    std::uint8_t pad = 9;
    CHECK(encode("abc", pad) == "YWJj");
    CHECK(pad == 0);
    CHECK(encode("ab", pad) == "YWI");
    CHECK(pad == 1);
    CHECK(encode("a", pad) == "YQ");
    CHECK(pad == 2);
    CHECK(encode("Hello", pad) == "SGVsbG8");
    CHECK(pad == 1);
    CHECK(encode("", pad).empty());
    CHECK(pad == 0);
}

void test_decode_stops_at_padding()
{
    auto buf = bytesOf("SGVsbG8=\"");
    const auto r = zerowire::codec::base64DecodeInPlace(buf);
    CHECK(r.decoded == 5);
    CHECK(r.encoded == 7);
    CHECK(std::string(buf.begin(), buf.begin() + 5) == "Hello");
    CHECK(buf[7] == '=');
}

void test_decode_full_quads_write_never_passes_read()
{
    // 0x00 0x00 0x00 0xFF 0xFF 0xFF
    auto buf = bytesOf("AAAA////");
    const auto r = zerowire::codec::base64DecodeInPlace(buf);
    CHECK(r.decoded == 6);
    CHECK(r.encoded == 8);
    CHECK(buf[0] == 0x00 && buf[2] == 0x00);
    CHECK(buf[3] == 0xFF && buf[5] == 0xFF);
}

void test_decode_partial_tail()
{
    auto two = bytesOf("QUJDRA");
    auto r = zerowire::codec::base64DecodeInPlace(two);
    CHECK(r.decoded == 4);
    CHECK(std::string(two.begin(), two.begin() + 4) == "ABCD");

    // 1글자 꼬리는 바이트를 만들지 못한다
    auto one = bytesOf("QUJDR");
    r = zerowire::codec::base64DecodeInPlace(one);
    CHECK(r.decoded == 3);
    CHECK(r.encoded == 5);
}

void test_alphabet_table()
{
    CHECK(zerowire::codec::kBase64Alphabet.size() == 64);
    CHECK(zerowire::codec::base64Value('A') == 0);
    CHECK(zerowire::codec::base64Value('/') == 63);
    CHECK(zerowire::codec::base64Value('=') == -1);
    CHECK(zerowire::codec::base64Value('-') == -1);
}
} // namespace

int main()
{
    test_encode_reports_padding();
    test_decode_stops_at_padding();
    test_decode_full_quads_write_never_passes_read();
    test_decode_partial_tail();
    test_alphabet_table();

    if (g_fail == 0)
    {
        std::cout << "[OK] zerowire.codec.base64\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
