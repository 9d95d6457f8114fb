#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zerowire::sink {

/// 직렬화 출력 싱크 규약입니다.
///
/// - append-only. 코어는 싱크를 절대 읽지 않습니다.
/// - 세 메서드 모두 용량이 바닥나면 false 를 돌려줍니다 (유일한 실패 신호).
/// - 실패 후 싱크에 남은 내용은 부분 출력이므로 호출자가 버려야 합니다.
template <class W>
concept ByteSink = requires(W &w, std::span<const std::uint8_t> bytes, std::uint8_t b,
                            std::string_view s) {
    { w.write(bytes) } -> std::same_as<bool>;
    { w.writeByte(b) } -> std::same_as<bool>;
    { w.writeStr(s) } -> std::same_as<bool>;
};

inline std::span<const std::uint8_t> asBytes(std::string_view s) noexcept {
    return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

/// 호출자가 준 고정 버퍼에 쓰는 싱크. 힙을 전혀 쓰지 않습니다.
class SliceWriter {
  public:
    SliceWriter() noexcept = default;
    explicit SliceWriter(std::span<std::uint8_t> buf) noexcept : buf_(buf) {}

    [[nodiscard]] std::size_t len() const noexcept { return len_; }
    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }
    [[nodiscard]] std::size_t capacity() const noexcept { return buf_.size(); }
    [[nodiscard]] std::size_t remCapacity() const noexcept { return buf_.size() - len_; }

    /// 지금까지 기록된 부분
    [[nodiscard]] std::span<std::uint8_t> written() const noexcept { return buf_.first(len_); }
    [[nodiscard]] std::string_view view() const noexcept {
        return {reinterpret_cast<const char *>(buf_.data()), len_};
    }

    /// 기록된 부분과 남은 용량으로 나눈다. 이후 이 writer 는 비어 있다.
    std::span<std::uint8_t> split(std::span<std::uint8_t> &rest) noexcept {
        auto head = buf_.first(len_);
        rest = buf_.subspan(len_);
        buf_ = {};
        len_ = 0;
        return head;
    }

    void clear() noexcept { len_ = 0; }

    bool write(std::span<const std::uint8_t> bytes) noexcept {
        if (bytes.size() > remCapacity()) {
            return false;
        }
        if (!bytes.empty()) {
            std::memcpy(buf_.data() + len_, bytes.data(), bytes.size());
        }
        len_ += bytes.size();
        return true;
    }

    bool writeByte(std::uint8_t b) noexcept {
        if (len_ >= buf_.size()) {
            return false;
        }
        buf_[len_++] = b;
        return true;
    }

    bool writeStr(std::string_view s) noexcept { return write(asBytes(s)); }

  private:
    std::span<std::uint8_t> buf_{};
    std::size_t len_{0};
};

/// 내부에 N 바이트 저장소를 가진 SliceWriter (스택에 올리기 좋다)
template <std::size_t N>
class FixedWriter {
  public:
    [[nodiscard]] std::size_t len() const noexcept { return len_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return N; }
    [[nodiscard]] std::span<const std::uint8_t> written() const noexcept {
        return std::span<const std::uint8_t>(buf_.data(), len_);
    }
    [[nodiscard]] std::string_view view() const noexcept {
        return {reinterpret_cast<const char *>(buf_.data()), len_};
    }
    void clear() noexcept { len_ = 0; }

    bool write(std::span<const std::uint8_t> bytes) noexcept {
        if (bytes.size() > N - len_) {
            return false;
        }
        if (!bytes.empty()) {
            std::memcpy(buf_.data() + len_, bytes.data(), bytes.size());
        }
        len_ += bytes.size();
        return true;
    }
    bool writeByte(std::uint8_t b) noexcept {
        if (len_ >= N) {
            return false;
        }
        buf_[len_++] = b;
        return true;
    }
    bool writeStr(std::string_view s) noexcept { return write(asBytes(s)); }

  private:
    std::array<std::uint8_t, N> buf_{};
    std::size_t len_{0};
};

/// std::vector 에 붙이는 싱크. 용량 제한은 maxLen 으로 흉내낸다 (0 = 무제한).
class VectorWriter {
  public:
    explicit VectorWriter(std::vector<std::uint8_t> &out, std::size_t maxLen = 0) noexcept
        : out_(out), maxLen_(maxLen) {}

    [[nodiscard]] std::size_t len() const noexcept { return out_.size(); }

    bool write(std::span<const std::uint8_t> bytes) {
        if (!fits_(bytes.size())) {
            return false;
        }
        out_.insert(out_.end(), bytes.begin(), bytes.end());
        return true;
    }
    bool writeByte(std::uint8_t b) {
        if (!fits_(1)) {
            return false;
        }
        out_.push_back(b);
        return true;
    }
    bool writeStr(std::string_view s) { return write(asBytes(s)); }

  private:
    [[nodiscard]] bool fits_(std::size_t n) const noexcept {
        return maxLen_ == 0 || out_.size() + n <= maxLen_;
    }

    std::vector<std::uint8_t> &out_;
    std::size_t maxLen_{0};
};

/// std::string 에 붙이는 싱크. JSON 을 문자열로 바로 뽑을 때 사용.
class StringWriter {
  public:
    explicit StringWriter(std::string &out) noexcept : out_(out) {}

    [[nodiscard]] std::size_t len() const noexcept { return out_.size(); }

    bool write(std::span<const std::uint8_t> bytes) {
        out_.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        return true;
    }
    bool writeByte(std::uint8_t b) {
        out_.push_back(static_cast<char>(b));
        return true;
    }
    bool writeStr(std::string_view s) {
        out_.append(s);
        return true;
    }

  private:
    std::string &out_;
};

static_assert(ByteSink<SliceWriter>);
static_assert(ByteSink<FixedWriter<8>>);
static_assert(ByteSink<VectorWriter>);
static_assert(ByteSink<StringWriter>);

} // namespace zerowire::sink
