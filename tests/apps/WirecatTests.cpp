#include "WirecatApplication.hpp"

#include <zerowire/core/GlobalConfig.hpp>
#include <zerowire/core/Logger.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>
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

using zerowire::core::GlobalConfig;
using zerowire::core::WirecatConfig;
using Bytes = std::vector<std::uint8_t>;

Bytes buf(std::string_view s)
{
    return Bytes(s.begin(), s.end());
}

bool throwsWith(const std::function<void()> &fn, std::string_view needle)
{
    try
    {
        fn();
    }
    catch (const std::runtime_error &e)
    {
        return std::string_view(e.what()).find(needle) != std::string_view::npos;
    }
    return false;
}

void test_json_to_msgpack_profiles()
{
    GlobalConfig cfg{};
    wirecat::WirecatApplication compact(cfg);

    Bytes in = buf(R"({"a":1,"b":[true,null]})");
    Bytes out;
    compact.jsonToMsgpack(in, out);
    CHECK((out == Bytes{0x82, 0xA1, 'a', 0x01, 0xA1, 'b', 0x92, 0xC3, 0xC0}));

    // Value 에는 구조체/variant 가 없어서 두 profile 의 출력이 같다
    cfg.codec.msgpackProfile = zerowire::MsgpackProfile::Named;
    wirecat::WirecatApplication named(cfg);
    Bytes in2 = buf(R"({"a":1,"b":[true,null]})");
    Bytes out2;
    named.jsonToMsgpack(in2, out2);
    CHECK(out2 == out);
}

void test_json_errors_carry_stage()
{
    GlobalConfig cfg{};
    wirecat::WirecatApplication app(cfg);

    CHECK(throwsWith(
        [&] {
            Bytes in = buf("[1,]");
            Bytes out;
            app.jsonToMsgpack(in, out);
        },
        "json decode: "));
}

void test_msgpack_to_json_lines()
{
    GlobalConfig cfg{};
    wirecat::WirecatApplication app(cfg);

    // {"k": bin[1,2]} , -1 , "x"
    const Bytes in{0x81, 0xA1, 'k', 0xC4, 0x02, 0x01, 0x02, 0xFF, 0xA1, 'x'};
    std::string out;
    CHECK(app.msgpackToJson(in, out) == 3);
    CHECK(out == "{\"k\":[1,2]}\n-1\n\"x\"\n");

    cfg.codec.jsonBytes = zerowire::JsonBytes::Base64;
    wirecat::WirecatApplication b64(cfg);
    out.clear();
    CHECK(b64.msgpackToJson(in, out) == 3);
    CHECK(out == "{\"k\":\"AQI\"}\n-1\n\"x\"\n");

    cfg.codec.jsonBytes = zerowire::JsonBytes::Hex;
    wirecat::WirecatApplication hex(cfg);
    out.clear();
    CHECK(hex.msgpackToJson(in, out) == 3);
    CHECK(out == "{\"k\":\"0102\"}\n-1\n\"x\"\n");
}

void test_msgpack_stream_errors()
{
    GlobalConfig cfg{};
    wirecat::WirecatApplication app(cfg);

    CHECK(throwsWith(
        [&] {
            std::string out;
            app.msgpackToJson(Bytes{0x01, 0x92, 0x01}, out);
        },
        "truncated message at offset 1"));

    CHECK(throwsWith(
        [&] {
            std::string out;
            app.msgpackToJson(Bytes{0xC1}, out);
        },
        "reserved_code"));

    // 문법은 맞지만 JSON 으로 옮길 수 없는 키
    CHECK(throwsWith(
        [&] {
            std::string out;
            app.msgpackToJson(Bytes{0x81, 0x90, 0x01}, out);
        },
        "json encode: "));
}

void test_nesting_limit_from_config()
{
    // [[[...[0]...]]] 200 단계
    Bytes packed(200, 0x91);
    packed.push_back(0x00);
    const std::string json = std::string(200, '[') + "0" + std::string(200, ']');

    GlobalConfig cfg{};
    wirecat::WirecatApplication strict(cfg);
    CHECK(throwsWith(
        [&] {
            std::string out;
            strict.msgpackToJson(packed, out);
        },
        "msgpack decode: MessagePack nesting exceeds the depth limit"));
    CHECK(throwsWith(
        [&] {
            Bytes in = buf(json);
            Bytes out;
            strict.jsonToMsgpack(in, out);
        },
        "json decode: JSON nesting exceeds the depth limit"));

    cfg.codec.maxDepth = 256;
    wirecat::WirecatApplication relaxed(cfg);
    std::string out;
    CHECK(relaxed.msgpackToJson(packed, out) == 1);
    CHECK(out == json + "\n");

    Bytes in = buf(json);
    Bytes repacked;
    relaxed.jsonToMsgpack(in, repacked);
    CHECK(repacked == packed);
}

void test_run_with_files()
{
    const auto dir = std::filesystem::temp_directory_path();
    const std::string tag = std::to_string(::getpid());
    const std::string inPath = (dir / ("wirecat_in_" + tag + ".json")).string();
    const std::string midPath = (dir / ("wirecat_mid_" + tag + ".mpk")).string();
    const std::string outPath = (dir / ("wirecat_out_" + tag + ".json")).string();

    {
        std::ofstream os(inPath, std::ios::binary);
        os << R"({"name":"zerowire","ports":[80,443]})";
    }

    GlobalConfig cfg{};
    cfg.wirecat.mode = WirecatConfig::Mode::JsonToMsgpack;
    cfg.wirecat.input = inPath;
    cfg.wirecat.output = midPath;
    wirecat::WirecatApplication toPack(cfg);
    toPack.run();

    cfg.wirecat.mode = WirecatConfig::Mode::MsgpackToJson;
    cfg.wirecat.input = midPath;
    cfg.wirecat.output = outPath;
    wirecat::WirecatApplication toJson(cfg);
    toJson.run();

    std::ifstream is(outPath, std::ios::binary);
    const std::string result((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    CHECK(result == "{\"name\":\"zerowire\",\"ports\":[80,443]}\n");

    // 입력 크기 제한
    cfg.codec.maxInputBytes = 4;
    cfg.codec.maxMessageLen = 0;
    cfg.wirecat.mode = WirecatConfig::Mode::JsonToMsgpack;
    cfg.wirecat.input = inPath;
    cfg.wirecat.output = midPath;
    wirecat::WirecatApplication limited(cfg);
    CHECK(throwsWith([&] { limited.run(); }, "input exceeds max_input_bytes"));

    std::error_code ec;
    std::filesystem::remove(inPath, ec);
    std::filesystem::remove(midPath, ec);
    std::filesystem::remove(outPath, ec);
}
} // namespace

int main()
{
    auto logger = std::make_shared<zerowire::core::Logger>();
    logger->setMinLevel(zerowire::core::LogLevel::Fatal);
    zerowire::core::setLogger(logger);

    test_json_to_msgpack_profiles();
    test_json_errors_carry_stage();
    test_msgpack_to_json_lines();
    test_msgpack_stream_errors();
    test_nesting_limit_from_config();
    test_run_with_files();

    zerowire::core::shutdownLogger();

    if (g_fail == 0)
    {
        std::cout << "[OK] wirecat.application\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
