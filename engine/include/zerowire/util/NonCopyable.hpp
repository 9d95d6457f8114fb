#pragma once

namespace zerowire::util {

/// 복사 금지, 이동 허용.
/// ILogger 구현체, WirecatApplication 처럼 스트림/설정을 하나만 소유하는 타입이 상속합니다.
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

/// 복사/이동 모두 금지. 자기 주소를 다른 스레드에 넘긴 타입 (Logger 의 writer 스레드).
class Pinned {
  protected:
    Pinned() = default;
    ~Pinned() = default;

    Pinned(const Pinned &) = delete;
    Pinned &operator=(const Pinned &) = delete;
    Pinned(Pinned &&) = delete;
    Pinned &operator=(Pinned &&) = delete;
};

} // namespace zerowire::util
