#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <zerowire/core/Logger.hpp>
#include <zerowire/msgpack/Reader.hpp>

namespace zerowire::msgpack
{

/// framer 결과 상태입니다.
/// - NeedMore: 다음 메시지가 아직 다 들어오지 않음 (out 비어 있음)
/// - Framed:   out 에 메시지 하나 전체(태그 포함)를 채워 반환
/// - Invalid:  예약 태그 / 최대 길이 초과. 이후 입력은 신뢰할 수 없으므로 호출자가 중단한다.
enum class FrameResult : std::uint8_t
{
    NeedMore = 0,
    Framed = 1,
    Invalid = 2,
};

/**
 * @brief 연속으로 붙어 있는 MessagePack 메시지들의 경계를 디코딩 없이 잡아냅니다.
 *
 * [Wire Format]
 * - 별도 길이 헤더가 없습니다. 메시지 하나 = 값 하나 (컨테이너면 자식 전체 포함).
 * - 경계는 Reader::eatMessage() 로 태그/길이 필드만 따라가며 계산합니다.
 *   eatMessage 는 재귀하지 않으므로 중첩 깊이에 상관없이 스택을 쓰지 않습니다.
 *
 * [메모리 정책]
 * - 입력을 복사하지 않습니다. out 은 input 의 앞부분을 가리키는 span 입니다.
 * - 호출자는 Framed 를 받으면 out.size() 만큼 입력을 전진시킵니다.
 */
class MessageFramer
{
  public:
    static constexpr std::size_t kDefaultMaxMessageLen = 1024U * 1024U; // 1 MiB

    explicit MessageFramer(std::size_t maxMessageLen = kDefaultMaxMessageLen) noexcept
        : maxMessageLen_(maxMessageLen)
    {
    }

    [[nodiscard]] std::size_t maxMessageLen() const noexcept { return maxMessageLen_; }
    [[nodiscard]] const char *lastErrorReason() const noexcept { return lastErrorReason_; }

    FrameResult tryFrame(std::span<const std::uint8_t> input, std::span<const std::uint8_t> &out)
    {
        lastErrorReason_ = nullptr;
        out = {};

        // 1. 태그 1바이트도 없으면 대기
        if (input.empty())
            return FrameResult::NeedMore;

        // 2. 값 하나를 통째로 건너뛰어 길이를 잰다.
        //    최대 길이 + 1 바이트까지만 본다 (버퍼가 아무리 커도 스캔 비용은 max 에 묶인다)
        const std::size_t window =
            maxMessageLen_ < input.size() ? maxMessageLen_ + 1 : input.size();
        const std::span<const std::uint8_t> head = input.first(window);
        Reader reader(head);
        const DeError err = reader.eatMessage();
        const std::size_t consumed = head.size() - reader.remaining();

        // 3. 잘린 메시지: 이미 최대 길이를 넘었으면 더 기다려도 소용없다
        if (err == DeError::UnexpectedEof)
        {
            if (head.size() > maxMessageLen_)
            {
                lastErrorReason_ = "message_len_exceeds_max";
                SLOG_WARN("MessageFramer", "InvalidMessageLen", "buffered={} max={}", input.size(),
                          maxMessageLen_);
                return FrameResult::Invalid;
            }
            return FrameResult::NeedMore;
        }

        // 4. 예약 태그(0xC1) 등 해석 불가
        if (err != DeError::Ok)
        {
            lastErrorReason_ = "reserved_code";
            SLOG_WARN("MessageFramer", "InvalidTag", "offset={} tag=0x{:02X}", consumed - 1,
                      input[consumed - 1]);
            return FrameResult::Invalid;
        }

        // 5. 완성된 메시지의 길이 정책
        if (consumed > maxMessageLen_)
        {
            lastErrorReason_ = "message_len_exceeds_max";
            SLOG_WARN("MessageFramer", "InvalidMessageLen", "len={} max={}", consumed,
                      maxMessageLen_);
            return FrameResult::Invalid;
        }

        out = input.first(consumed);
        return FrameResult::Framed;
    }

  private:
    std::size_t maxMessageLen_{kDefaultMaxMessageLen};
    const char *lastErrorReason_{nullptr};
};

} // namespace zerowire::msgpack
