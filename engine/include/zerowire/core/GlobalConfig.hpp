#pragma once

#include <zerowire/EngineConfig.hpp>

#include <cstdint>
#include <string>

namespace zerowire::core
{

using EngineConfig = zerowire::EngineConfig;
using CodecConfig = zerowire::CodecConfig;

// wirecat CLI 전용 설정 ([app.wirecat])
struct WirecatConfig
{
    enum class Mode : std::uint8_t
    {
        JsonToMsgpack,
        MsgpackToJson,
    };

    Mode mode{Mode::JsonToMsgpack};

    // 빈 문자열이면 stdin / stdout
    std::string input{};
    std::string output{};
};

// 전체 통합 설정
struct GlobalConfig
{
    EngineConfig engine{};
    CodecConfig codec{};
    WirecatConfig wirecat{};
};

} // namespace zerowire::core
