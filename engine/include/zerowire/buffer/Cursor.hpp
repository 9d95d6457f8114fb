#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace zerowire::buffer {

/// 버퍼 하나에 대한 배타적 참조 + 읽기 인덱스입니다.
///
/// ===== 불변식 =====
/// - 관찰 가능한 모든 시점에서 index <= size.
/// - advance(n) 은 범위 검사를 하지 않는다. 반드시 앞선 검사(peek/remaining) 뒤에만 부른다.
///   (debug 빌드에서는 assert 로 확인)
///
/// ===== 수명 =====
/// - Cursor 는 데이터를 소유하지 않는다. 원본 버퍼가 Cursor 보다 오래 살아야 한다.
/// - takeSpan() 이 돌려준 span 은 Cursor 가 사라진 뒤에도 원본 버퍼 수명 동안 유효하다.
///
/// Byte = std::uint8_t       : JSON (제자리 unescape 를 위해 쓰기 가능)
/// Byte = const std::uint8_t : MessagePack (읽기 전용)
template <class Byte>
class BasicCursor {
    static_assert(std::is_same_v<std::remove_const_t<Byte>, std::uint8_t>);

  public:
    BasicCursor() noexcept = default;
    explicit BasicCursor(std::span<Byte> input) noexcept : input_(input) {}

    /// 다음 바이트. 입력 끝이면 false.
    [[nodiscard]] bool peek(std::uint8_t &out) const noexcept {
        if (index_ >= input_.size()) {
            return false;
        }
        out = input_[index_];
        return true;
    }

    [[nodiscard]] bool peekAt(std::size_t offset, std::uint8_t &out) const noexcept {
        if (offset >= remaining()) {
            return false;
        }
        out = input_[index_ + offset];
        return true;
    }

    void advance(std::size_t n) noexcept {
        assert(n <= remaining());
        index_ += n;
    }

    /// 현재 뷰 안에서 이전 위치로 되돌린다 (pos <= position()).
    void rewind(std::size_t pos) noexcept {
        assert(pos <= index_);
        index_ = pos;
    }

    [[nodiscard]] std::size_t position() const noexcept { return index_; }
    [[nodiscard]] std::size_t size() const noexcept { return input_.size(); }
    [[nodiscard]] std::size_t remaining() const noexcept { return input_.size() - index_; }
    [[nodiscard]] bool atEnd() const noexcept { return index_ == input_.size(); }

    /// 아직 읽지 않은 부분
    [[nodiscard]] std::span<Byte> rest() const noexcept { return input_.subspan(index_); }

    /// 현재 뷰 전체 (position() 이전 포함). 제자리 쓰기는 position() 앞쪽에만 한다.
    [[nodiscard]] std::span<Byte> view() const noexcept { return input_; }

    /// [index, index+len) 을 잘라 돌려주고, 커서를 [index+len+skip, size) 의 새 뷰로 옮긴다.
    ///
    /// - skip 은 닫는 구분자나 unescape 로 생긴 빈틈을 버리는 데 쓴다.
    /// - 돌려준 span 과 새 뷰는 겹치지 않는다 (len + skip <= remaining 이 전제).
    /// - 전제가 깨지면 debug 빌드는 assert, release 빌드는 빈 span + 커서를 끝으로 보낸다.
    std::span<Byte> takeSpan(std::size_t len, std::size_t skip) noexcept {
        const std::size_t avail = remaining();
        assert(len <= avail && skip <= avail - len);
        if (len > avail || skip > avail - len) {
            input_ = input_.subspan(input_.size());
            index_ = 0;
            return {};
        }
        auto head = input_.subspan(index_, len);
        input_ = input_.subspan(index_ + len + skip);
        index_ = 0;
        return head;
    }

  private:
    std::span<Byte> input_{};
    std::size_t index_{0};
};

using MutCursor = BasicCursor<std::uint8_t>;
using ConstCursor = BasicCursor<const std::uint8_t>;

} // namespace zerowire::buffer
