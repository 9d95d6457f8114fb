#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <zerowire/core/Logger.hpp>

namespace zerowire
{

/// 프로세스 공통 설정 ([engine] 섹션)
struct EngineConfig
{
    /// 로그를 기록할 파일 경로입니다.
    /// - 빈 문자열("")이면 std::clog 로만 출력합니다.
    std::string logFilePath;

    /// 기본 로그 레벨입니다.
    core::LogLevel logLevel = core::LogLevel::Info;
};

/// JSON 으로 바이트 문자열을 내보낼 때 쓰는 전략
enum class JsonBytes : std::uint8_t
{
    Array,  // [1,2,3]
    Hex,    // "0A0B"
    Base64, // "AQID"
    Pass,   // 원본 바이트 그대로 (검증 없음)
};

enum class MsgpackProfile : std::uint8_t
{
    Compact, // struct = array, variant = index
    Named,   // struct = map, variant = name
};

/// 코덱 정책 ([codec] 섹션). 0 은 기본값(core::defaults) 사용.
struct CodecConfig
{
    JsonBytes jsonBytes = JsonBytes::Array;
    MsgpackProfile msgpackProfile = MsgpackProfile::Compact;

    /// 입력 전체 크기 상한(bytes)
    std::size_t maxInputBytes = 0;

    /// MessageFramer 가 허용하는 메시지 하나의 최대 길이(bytes)
    std::size_t maxMessageLen = 0;

    /// 역직렬화 시 array/object 중첩 상한
    std::size_t maxDepth = 0;
};

/// 대소문자 무시. 알 수 없는 이름은 std::invalid_argument.
[[nodiscard]] JsonBytes parseJsonBytes(std::string_view s);
[[nodiscard]] MsgpackProfile parseMsgpackProfile(std::string_view s);

[[nodiscard]] std::string_view toString(JsonBytes v) noexcept;
[[nodiscard]] std::string_view toString(MsgpackProfile v) noexcept;

/// CodecConfig 필드 값에 대한 기본 검증을 수행합니다.
void validateCodecConfig(const CodecConfig &config);

[[nodiscard]] std::size_t effectiveMaxInputBytes(const CodecConfig &config) noexcept;
[[nodiscard]] std::size_t effectiveMaxMessageLen(const CodecConfig &config) noexcept;
[[nodiscard]] std::size_t effectiveMaxDepth(const CodecConfig &config) noexcept;

} // namespace zerowire
