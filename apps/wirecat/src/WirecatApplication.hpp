#pragma once

#include <zerowire/core/GlobalConfig.hpp>
#include <zerowire/serde/Value.hpp>
#include <zerowire/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace wirecat
{

/// JSON <-> MessagePack 변환기.
/// 입력 전체를 읽어(max_input_bytes 제한) serde::Value 를 거쳐 반대 포맷으로 씁니다.
class WirecatApplication final : private zerowire::util::NonCopyable
{
  public:
    explicit WirecatApplication(const zerowire::core::GlobalConfig &cfg);

    // 실패는 std::runtime_error 로 던진다 (main 에서 "Fatal: ...")
    void run();

    // 변환 본체. 파일 I/O 없이 테스트에서도 부른다.
    // JSON 값 하나 -> MessagePack 메시지 하나 (input 은 제자리에서 다시 쓰인다)
    void jsonToMsgpack(std::span<std::uint8_t> input, std::vector<std::uint8_t> &out) const;

    // 연속된 MessagePack 메시지들 -> 메시지당 JSON 한 줄. 반환값은 메시지 수.
    std::size_t msgpackToJson(std::span<const std::uint8_t> input, std::string &out) const;

  private:
    [[nodiscard]] std::vector<std::uint8_t> readInput() const;
    void writeOutput(std::span<const std::uint8_t> bytes) const;

    void writeJson(const zerowire::serde::Value &value, std::string &out) const;

    zerowire::core::GlobalConfig cfg_{};
};

} // namespace wirecat
