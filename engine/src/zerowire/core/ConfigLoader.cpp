#include <zerowire/core/ConfigLoader.hpp>

#include <zerowire/EngineConfig.hpp>
#include <zerowire/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace zerowire::core
{
namespace
{

constexpr std::array<std::pair<std::string_view, LogLevel>, 7> kLogLevelNames{{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"fatal", LogLevel::Fatal},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

LogLevel parseLogLevel(std::string_view s)
{
    for (const auto &[name, level] : kLogLevelNames)
    {
        if (equalsIgnoreCase(name, s))
            return level;
    }
    throw std::invalid_argument("Invalid log_level: " + std::string(s));
}

// mode 는 CLI 에 쓰는 이름 그대로 (대소문자 구분)
WirecatConfig::Mode parseMode(std::string_view s)
{
    if (s == "json2msgpack")
        return WirecatConfig::Mode::JsonToMsgpack;
    if (s == "msgpack2json")
        return WirecatConfig::Mode::MsgpackToJson;
    throw std::invalid_argument("Invalid mode: " + std::string(s));
}

/// 섹션 하나의 키를 타입 검사와 함께 읽는다. 타입이 다르면 조용히 넘기지 않는다.
class Section
{
  public:
    Section(const toml::table *table, std::string_view name) : table_(table), name_(name) {}

    [[nodiscard]] bool present() const noexcept { return table_ != nullptr; }

    template <class Fn>
    void str(std::string_view key, Fn &&apply) const
    {
        const auto node = lookup(key);
        if (!node)
            return;
        auto v = node.template value<std::string>();
        if (!v)
            throw std::invalid_argument(where(key) + " must be a string");
        apply(*v);
    }

    // [Strict] 음수는 키 이름과 함께 실패
    void size(std::string_view key, std::size_t &out) const
    {
        const auto node = lookup(key);
        if (!node)
            return;
        auto v = node.template value<std::int64_t>();
        if (!v)
            throw std::invalid_argument(where(key) + " must be an integer");
        if (*v < 0)
            throw std::invalid_argument(where(key) + " must be non-negative: " + std::to_string(*v));
        out = static_cast<std::size_t>(*v);
    }

  private:
    // "[codec] max_input_bytes"
    [[nodiscard]] std::string where(std::string_view key) const
    {
        return "[" + std::string(name_) + "] " + std::string(key);
    }

    [[nodiscard]] toml::node_view<const toml::node> lookup(std::string_view key) const
    {
        if (!table_)
            return {};
        return (*table_)[key];
    }

    const toml::table *table_;
    std::string_view name_;
};

void readEngine(const toml::table &root, EngineConfig &engine)
{
    const Section s(root["engine"].as_table(), "engine");
    if (!s.present())
        throw std::runtime_error("Missing required [engine] section");

    s.str("log_level", [&](const std::string &v) { engine.logLevel = parseLogLevel(v); });
    s.str("log_file_path", [&](const std::string &v) { engine.logFilePath = v; });
}

void readCodec(const toml::table &root, CodecConfig &codec)
{
    const Section s(root["codec"].as_table(), "codec");

    s.str("json_bytes", [&](const std::string &v) { codec.jsonBytes = parseJsonBytes(v); });
    s.str("msgpack_profile",
          [&](const std::string &v) { codec.msgpackProfile = parseMsgpackProfile(v); });
    s.size("max_input_bytes", codec.maxInputBytes);
    s.size("max_message_len", codec.maxMessageLen);
    s.size("max_depth", codec.maxDepth);
}

void readWirecat(const toml::table &root, WirecatConfig &app)
{
    const Section s(root["app"]["wirecat"].as_table(), "app.wirecat");

    s.str("mode", [&](const std::string &v) { app.mode = parseMode(v); });
    s.str("input", [&](const std::string &v) { app.input = v; });
    s.str("output", [&](const std::string &v) { app.output = v; });

    // 같은 파일을 읽으면서 덮어쓰면 입력이 잘린다
    if (!app.input.empty() && app.input == app.output)
        throw std::runtime_error("Config Error: wirecat input and output must differ");
}

struct CliArgs
{
    bool help{false};
    std::optional<std::string> configPath;
};

CliArgs scanCli(int argc, char **argv)
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            args.help = true;
        }
        else if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            args.configPath = argv[++i];
        }
    }
    return args;
}

void printUsage(const char *argv0)
{
    const std::string exe = (argv0 && *argv0) ? std::filesystem::path(argv0).filename().string()
                                              : std::string("wirecat");
    std::cout << "Usage: " << exe << " --config <path.toml>\n"
              << "  [codec] json_bytes = array | hex | base64 | pass\n"
              << "  [app.wirecat] mode = json2msgpack | msgpack2json\n";
}

} // namespace

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    const CliArgs args = scanCli(argc, argv);
    const char *argv0 = argc > 0 ? argv[0] : nullptr;

    if (args.help)
    {
        printUsage(argv0);
        std::exit(0);
    }
    if (!args.configPath)
    {
        printUsage(argv0);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }
    return loadFile(*args.configPath);
}

GlobalConfig ConfigLoader::loadFile(const std::string &configPath)
{
    if (!std::filesystem::exists(configPath))
        throw std::runtime_error("Config file not found: " + configPath);

    toml::table root;
    try
    {
        root = toml::parse_file(configPath);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    GlobalConfig cfg{};
    readEngine(root, cfg.engine);
    readCodec(root, cfg.codec);
    readWirecat(root, cfg.wirecat);
    validateCodecConfig(cfg.codec);

    SLOG_INFO("ConfigLoader", "Loaded", "path={} json_bytes={} msgpack_profile={} mode={}",
              configPath, toString(cfg.codec.jsonBytes), toString(cfg.codec.msgpackProfile),
              cfg.wirecat.mode == WirecatConfig::Mode::JsonToMsgpack ? "json2msgpack"
                                                                     : "msgpack2json");
    return cfg;
}

} // namespace zerowire::core
