#include <zerowire/codec/Utf8.hpp>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string_view>

int main()
{
    using zerowire::codec::decodeSingleCodePoint;
    using zerowire::codec::encodeUtf8;
    using zerowire::codec::isValidUtf8;

    // 1) 검증: overlong / surrogate / 범위 밖 거부
    assert(isValidUtf8(std::string_view("plain ascii")));
    assert(isValidUtf8(std::string_view("\xED\x95\x9C\xEA\xB8\x80"))); // "한글"
    assert(isValidUtf8(std::string_view("\xF0\x9F\x98\x80")));         // U+1F600
    assert(!isValidUtf8(std::string_view("\xC0\xAF")));                // overlong '/'
    assert(!isValidUtf8(std::string_view("\xED\xA0\x80")));            // U+D800
    assert(!isValidUtf8(std::string_view("\xF4\x90\x80\x80")));        // > U+10FFFF
    assert(!isValidUtf8(std::string_view("\xE2\x82")));                // 잘림

    // 2) 인코드: 폭별 + surrogate 는 0
    std::uint8_t out[4] = {};
    assert(encodeUtf8(U'A', out) == 1 && out[0] == 'A');
    assert(encodeUtf8(U'é', out) == 2 && out[0] == 0xC3 && out[1] == 0xA9);
    assert(encodeUtf8(U'€', out) == 3 && out[0] == 0xE2 && out[1] == 0x82 && out[2] == 0xAC);
    assert(encodeUtf8(U'\U0001F600', out) == 4 && out[0] == 0xF0 && out[3] == 0x80);
    assert(encodeUtf8(static_cast<char32_t>(0xD800), out) == 0);
    assert(encodeUtf8(static_cast<char32_t>(0xDFFF), out) == 0);
    assert(encodeUtf8(static_cast<char32_t>(0x110000), out) == 0);

    // 3) 코드 포인트 하나
    char32_t cp = 0;
    assert(decodeSingleCodePoint("\xE2\x82\xAC", cp) && cp == U'€');
    assert(decodeSingleCodePoint("x", cp) && cp == U'x');
    assert(!decodeSingleCodePoint("xy", cp));
    assert(!decodeSingleCodePoint("", cp));

    std::cout << "Utf8Tests OK\n";
    return 0;
}
