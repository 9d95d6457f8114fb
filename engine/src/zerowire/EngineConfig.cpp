#include <zerowire/EngineConfig.hpp>

#include <zerowire/core/Defaults.hpp>

#include <cctype>
#include <stdexcept>
#include <string>

namespace zerowire
{

namespace
{
std::string makeErrorMessage(const std::string &detail)
{
    return "[CodecConfig] " + detail;
}

[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = makeErrorMessage(detail);
    SLOG_ERROR("CodecConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}

std::string lowered(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v;
}
} // namespace

JsonBytes parseJsonBytes(std::string_view s)
{
    const std::string v = lowered(s);
    if (v == "array")
        return JsonBytes::Array;
    if (v == "hex")
        return JsonBytes::Hex;
    if (v == "base64")
        return JsonBytes::Base64;
    if (v == "pass")
        return JsonBytes::Pass;
    throw std::invalid_argument("Invalid json_bytes: " + std::string(s));
}

MsgpackProfile parseMsgpackProfile(std::string_view s)
{
    const std::string v = lowered(s);
    if (v == "compact")
        return MsgpackProfile::Compact;
    if (v == "named")
        return MsgpackProfile::Named;
    throw std::invalid_argument("Invalid msgpack_profile: " + std::string(s));
}

std::string_view toString(JsonBytes v) noexcept
{
    switch (v)
    {
    case JsonBytes::Array:
        return "array";
    case JsonBytes::Hex:
        return "hex";
    case JsonBytes::Base64:
        return "base64";
    case JsonBytes::Pass:
        return "pass";
    }
    return "array";
}

std::string_view toString(MsgpackProfile v) noexcept
{
    return v == MsgpackProfile::Named ? "named" : "compact";
}

void validateCodecConfig(const CodecConfig &config)
{
    if (config.maxMessageLen != 0 && config.maxMessageLen < core::defaults::kMinMessageLen)
    {
        throwConfigError("maxMessageLen is too small (min 16 bytes when specified)");
    }

    // 메시지 하나가 입력 전체보다 클 수는 없다
    if (config.maxInputBytes != 0 && config.maxMessageLen > config.maxInputBytes)
    {
        throwConfigError("maxMessageLen must not exceed maxInputBytes");
    }
}

std::size_t effectiveMaxInputBytes(const CodecConfig &config) noexcept
{
    return config.maxInputBytes != 0 ? config.maxInputBytes : core::defaults::kMaxInputBytes;
}

std::size_t effectiveMaxMessageLen(const CodecConfig &config) noexcept
{
    return config.maxMessageLen != 0 ? config.maxMessageLen : core::defaults::kMaxMessageLen;
}

std::size_t effectiveMaxDepth(const CodecConfig &config) noexcept
{
    return config.maxDepth != 0 ? config.maxDepth : core::defaults::kMaxDepth;
}

} // namespace zerowire
