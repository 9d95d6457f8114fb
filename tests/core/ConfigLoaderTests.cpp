#include <zerowire/EngineConfig.hpp>
#include <zerowire/core/ConfigLoader.hpp>
#include <zerowire/core/Defaults.hpp>
#include <zerowire/core/Logger.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>

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

using zerowire::core::ConfigLoader;
using zerowire::core::GlobalConfig;
using zerowire::core::WirecatConfig;

// 테스트마다 임시 TOML 파일 하나. 소멸 시 삭제.
class TempToml
{
  public:
    TempToml(std::string_view name, std::string_view body)
        : path_(std::filesystem::temp_directory_path() /
                ("zerowire_" + std::to_string(::getpid()) + "_" + std::string(name) + ".toml"))
    {
        std::ofstream os(path_);
        os << body;
    }
    ~TempToml()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

  private:
    std::filesystem::path path_;
};

template <class Ex>
bool throwsWith(const std::string &path, std::string_view needle)
{
    try
    {
        (void)ConfigLoader::loadFile(path);
    }
    catch (const Ex &e)
    {
        return std::string_view(e.what()).find(needle) != std::string_view::npos;
    }
    return false;
}

void test_full_config()
{
    TempToml f("full", R"(
[engine]
log_level = "debug"
log_file_path = "wirecat.log"

[codec]
json_bytes = "BASE64"
msgpack_profile = "named"
max_input_bytes = 4096
max_message_len = 1024
max_depth = 64

[app.wirecat]
mode = "msgpack2json"
input = "in.mpk"
output = "out.json"
)");

    const GlobalConfig cfg = ConfigLoader::loadFile(f.path());
    CHECK(cfg.engine.logLevel == zerowire::core::LogLevel::Debug);
    CHECK(cfg.engine.logFilePath == "wirecat.log");
    CHECK(cfg.codec.jsonBytes == zerowire::JsonBytes::Base64);
    CHECK(cfg.codec.msgpackProfile == zerowire::MsgpackProfile::Named);
    CHECK(cfg.codec.maxInputBytes == 4096);
    CHECK(cfg.codec.maxMessageLen == 1024);
    CHECK(zerowire::effectiveMaxDepth(cfg.codec) == 64);
    CHECK(cfg.wirecat.mode == WirecatConfig::Mode::MsgpackToJson);
    CHECK(cfg.wirecat.input == "in.mpk");
    CHECK(cfg.wirecat.output == "out.json");
}

void test_defaults_when_sections_absent()
{
    TempToml f("minimal", "[engine]\n");

    const GlobalConfig cfg = ConfigLoader::loadFile(f.path());
    CHECK(cfg.engine.logLevel == zerowire::core::LogLevel::Info);
    CHECK(cfg.engine.logFilePath.empty());
    CHECK(cfg.codec.jsonBytes == zerowire::JsonBytes::Array);
    CHECK(cfg.codec.msgpackProfile == zerowire::MsgpackProfile::Compact);
    CHECK(cfg.wirecat.mode == WirecatConfig::Mode::JsonToMsgpack);
    CHECK(cfg.wirecat.input.empty());

    CHECK(zerowire::effectiveMaxInputBytes(cfg.codec) == zerowire::core::defaults::kMaxInputBytes);
    CHECK(zerowire::effectiveMaxMessageLen(cfg.codec) == zerowire::core::defaults::kMaxMessageLen);
    CHECK(zerowire::effectiveMaxDepth(cfg.codec) == zerowire::core::defaults::kMaxDepth);
}

void test_rejects_bad_values()
{
    {
        TempToml f("no_engine", "[codec]\njson_bytes = \"hex\"\n");
        CHECK(throwsWith<std::runtime_error>(f.path(), "Missing required [engine] section"));
    }
    {
        TempToml f("bad_level", "[engine]\nlog_level = \"loud\"\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "Invalid log_level: loud"));
    }
    {
        TempToml f("bad_bytes", "[engine]\n[codec]\njson_bytes = \"octal\"\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "Invalid json_bytes: octal"));
    }
    {
        TempToml f("bad_type", "[engine]\n[codec]\nmax_input_bytes = \"big\"\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "max_input_bytes must be an integer"));
    }
    {
        TempToml f("bad_depth", "[engine]\n[codec]\nmax_depth = \"deep\"\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "[codec] max_depth must be an integer"));
    }
    {
        TempToml f("negative", "[engine]\n[codec]\nmax_message_len = -1\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "must be non-negative"));
    }
    {
        TempToml f("tiny_msg", "[engine]\n[codec]\nmax_message_len = 8\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "[CodecConfig]"));
    }
    {
        TempToml f("msg_gt_input",
                   "[engine]\n[codec]\nmax_input_bytes = 64\nmax_message_len = 128\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "[CodecConfig]"));
    }
    {
        TempToml f("bad_mode", "[engine]\n[app.wirecat]\nmode = \"xml2json\"\n");
        CHECK(throwsWith<std::invalid_argument>(f.path(), "Invalid mode: xml2json"));
    }
    {
        TempToml f("same_io", "[engine]\n[app.wirecat]\ninput = \"a\"\noutput = \"a\"\n");
        CHECK(throwsWith<std::runtime_error>(f.path(), "input and output must differ"));
    }
    {
        TempToml f("syntax", "[engine\nlog_level = \n");
        CHECK(throwsWith<std::runtime_error>(f.path(), "TOML Parse Error"));
    }
    CHECK(throwsWith<std::runtime_error>("/nonexistent/zerowire.toml", "Config file not found"));
}

void test_enum_names()
{
    CHECK(zerowire::parseJsonBytes("Hex") == zerowire::JsonBytes::Hex);
    CHECK(zerowire::parseJsonBytes("pass") == zerowire::JsonBytes::Pass);
    CHECK(zerowire::toString(zerowire::JsonBytes::Base64) == "base64");
    CHECK(zerowire::parseMsgpackProfile("COMPACT") == zerowire::MsgpackProfile::Compact);
    CHECK(zerowire::toString(zerowire::MsgpackProfile::Named) == "named");
}
} // namespace

int main()
{
    auto logger = std::make_shared<zerowire::core::Logger>();
    logger->setMinLevel(zerowire::core::LogLevel::Fatal);
    zerowire::core::setLogger(logger);

    test_full_config();
    test_defaults_when_sections_absent();
    test_rejects_bad_values();
    test_enum_names();

    zerowire::core::shutdownLogger();

    if (g_fail == 0)
    {
        std::cout << "[OK] zerowire.core.config_loader\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
