#include <zerowire/core/Logger.hpp>
#include <zerowire/msgpack/MessageFramer.hpp>

#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <span>
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

std::shared_ptr<zerowire::core::CaptureLogger> g_log;

using zerowire::msgpack::FrameResult;
using zerowire::msgpack::MessageFramer;
using Bytes = std::vector<std::uint8_t>;

std::span<const std::uint8_t> view(const Bytes &b)
{
    return std::span<const std::uint8_t>(b.data(), b.size());
}

void test_empty_needs_more()
{
    MessageFramer framer;
    std::span<const std::uint8_t> out;
    CHECK(framer.tryFrame({}, out) == FrameResult::NeedMore);
    CHECK(out.empty());
    CHECK(framer.lastErrorReason() == nullptr);
}

void test_frames_back_to_back_messages()
{
    // [1, "a"] 다음에 true, 그 다음 {"k": [nil]}
    const Bytes stream{0x92, 0x01, 0xA1, 'a', 0xC3, 0x81, 0xA1, 'k', 0x91, 0xC0};
    MessageFramer framer;

    std::span<const std::uint8_t> rest = view(stream);
    std::span<const std::uint8_t> out;

    CHECK(framer.tryFrame(rest, out) == FrameResult::Framed);
    CHECK(out.size() == 4);
    CHECK(out.data() == stream.data());
    rest = rest.subspan(out.size());

    CHECK(framer.tryFrame(rest, out) == FrameResult::Framed);
    CHECK(out.size() == 1);
    CHECK(out[0] == 0xC3);
    rest = rest.subspan(out.size());

    CHECK(framer.tryFrame(rest, out) == FrameResult::Framed);
    CHECK(out.size() == 5);
    rest = rest.subspan(out.size());

    CHECK(rest.empty());
    CHECK(framer.tryFrame(rest, out) == FrameResult::NeedMore);
}

void test_truncated_message_waits()
{
    MessageFramer framer;
    std::span<const std::uint8_t> out;

    const Bytes partialArray{0x93, 0x01, 0x02};
    CHECK(framer.tryFrame(view(partialArray), out) == FrameResult::NeedMore);
    CHECK(out.empty());

    const Bytes partialStr{0xD9, 0x10, 'a', 'b'};
    CHECK(framer.tryFrame(view(partialStr), out) == FrameResult::NeedMore);

    const Bytes partialHeader{0xCD, 0x01};
    CHECK(framer.tryFrame(view(partialHeader), out) == FrameResult::NeedMore);
}

void test_ext_is_skipped_not_decoded()
{
    const Bytes ext{0xD4, 0x01, 0x00, 0xC7, 0x02, 0x05, 0xAA, 0xBB};
    MessageFramer framer;
    std::span<const std::uint8_t> out;

    CHECK(framer.tryFrame(view(ext), out) == FrameResult::Framed);
    CHECK(out.size() == 3);
    CHECK(framer.tryFrame(view(ext).subspan(3), out) == FrameResult::Framed);
    CHECK(out.size() == 5);
}

void test_reserved_code_is_invalid()
{
    MessageFramer framer;
    std::span<const std::uint8_t> out;

    g_log->clear();
    const Bytes top{0xC1};
    CHECK(framer.tryFrame(view(top), out) == FrameResult::Invalid);
    CHECK(g_log->count("WARN | MessageFramer | InvalidTag | offset=0 tag=0xC1") == 1);
    CHECK(framer.lastErrorReason() != nullptr);
    CHECK(std::strcmp(framer.lastErrorReason(), "reserved_code") == 0);
    CHECK(out.empty());

    const Bytes nested{0x92, 0x01, 0xC1};
    CHECK(framer.tryFrame(view(nested), out) == FrameResult::Invalid);
    CHECK(std::strcmp(framer.lastErrorReason(), "reserved_code") == 0);
    CHECK(g_log->count("offset=2 tag=0xC1") == 1);
}

void test_max_message_len()
{
    g_log->clear();
    MessageFramer framer(3);
    CHECK(framer.maxMessageLen() == 3);
    std::span<const std::uint8_t> out;

    // 완성됐지만 길다
    const Bytes longArray{0x93, 0x01, 0x02, 0x03};
    CHECK(framer.tryFrame(view(longArray), out) == FrameResult::Invalid);
    CHECK(std::strcmp(framer.lastErrorReason(), "message_len_exceeds_max") == 0);

    CHECK(g_log->count("InvalidMessageLen | len=4 max=3") == 1);

    // 아직 잘렸지만 이미 최대 길이를 넘었다
    const Bytes longPartial{0x94, 0x01, 0x02, 0x03};
    CHECK(framer.tryFrame(view(longPartial), out) == FrameResult::Invalid);
    CHECK(std::strcmp(framer.lastErrorReason(), "message_len_exceeds_max") == 0);
    CHECK(g_log->count("InvalidMessageLen | buffered=4 max=3") == 1);

    // 정확히 최대 길이는 허용, 성공하면 사유는 지워진다
    const Bytes exact{0x92, 0x01, 0x02};
    CHECK(framer.tryFrame(view(exact), out) == FrameResult::Framed);
    CHECK(out.size() == 3);
    CHECK(framer.lastErrorReason() == nullptr);
}

void test_deep_nesting_does_not_recurse()
{
    // [[[[...[0]...]]]] 백만 단계. 값으로는 정상이고 1 MiB 안에 들어간다
    Bytes deep(1'000'000, 0x91);
    deep.push_back(0x00);

    MessageFramer framer;
    std::span<const std::uint8_t> out;
    CHECK(framer.tryFrame(view(deep), out) == FrameResult::Framed);
    CHECK(out.size() == deep.size());

    // 닫히지 않은 중첩은 최대 길이 안에서는 대기
    const Bytes unclosed(1000, 0x91);
    CHECK(framer.tryFrame(view(unclosed), out) == FrameResult::NeedMore);
    CHECK(out.empty());
}

void test_scan_is_bounded_by_max_message_len()
{
    g_log->clear();
    MessageFramer framer(1024);
    std::span<const std::uint8_t> out;

    // max 를 넘는 중첩 prefix: 끝까지 스캔하지 않고 max + 1 바이트에서 끊는다
    Bytes deep(1'000'000, 0x91);
    CHECK(framer.tryFrame(view(deep), out) == FrameResult::Invalid);
    CHECK(std::strcmp(framer.lastErrorReason(), "message_len_exceeds_max") == 0);
    CHECK(g_log->count("InvalidMessageLen | buffered=1000000 max=1024") == 1);

    // 완결됐더라도 max 밖에서 끝나는 메시지는 길이 초과
    deep.push_back(0x00);
    CHECK(framer.tryFrame(view(deep), out) == FrameResult::Invalid);
    CHECK(out.empty());

    // 선언한 원소 수가 남은 입력보다 많으면 잘린 메시지로 본다
    const Bytes hugeArray{0xDD, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
    CHECK(framer.tryFrame(view(hugeArray), out) == FrameResult::NeedMore);
}
} // namespace

int main()
{
    // 거부 경로의 WARN 레코드를 모아서 확인한다
    g_log = std::make_shared<zerowire::core::CaptureLogger>(zerowire::core::LogLevel::Warn);
    zerowire::core::setLogger(g_log);

    test_empty_needs_more();
    test_frames_back_to_back_messages();
    test_truncated_message_waits();
    test_ext_is_skipped_not_decoded();
    test_reserved_code_is_invalid();
    test_max_message_len();
    test_deep_nesting_does_not_recurse();
    test_scan_is_bounded_by_max_message_len();

    zerowire::core::shutdownLogger();

    if (g_fail == 0)
    {
        std::cout << "[OK] zerowire.msgpack.framer\n";
        return 0;
    }

    std::cerr << "[NG] failures=" << g_fail << "\n";
    return 1;
}
