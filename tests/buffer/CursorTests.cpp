#include <zerowire/buffer/Cursor.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using zerowire::buffer::ConstCursor;
using zerowire::buffer::MutCursor;

namespace {

bool test_peek_advance_rewind() {
    const std::vector<std::uint8_t> data = {'a', 'b', 'c'};
    ConstCursor cur(data);

    std::uint8_t b = 0;
    if (!cur.peek(b) || b != 'a') {
        std::cerr << "[peek] first byte mismatch\n";
        return false;
    }
    cur.advance(2);
    if (cur.position() != 2 || cur.remaining() != 1) {
        std::cerr << "[advance] position=" << cur.position() << "\n";
        return false;
    }
    if (!cur.peekAt(0, b) || b != 'c' || cur.peekAt(1, b)) {
        std::cerr << "[peekAt] bounds mismatch\n";
        return false;
    }
    cur.rewind(1);
    if (!cur.peek(b) || b != 'b') {
        std::cerr << "[rewind] expected 'b'\n";
        return false;
    }
    cur.advance(2);
    if (!cur.atEnd() || cur.peek(b)) {
        std::cerr << "[end] cursor should be at end\n";
        return false;
    }
    return true;
}

bool test_take_span_splits_without_overlap() {
    std::vector<std::uint8_t> data = {'"', 'h', 'i', '"', ',', '1'};
    MutCursor cur(data);
    cur.advance(1); // opening quote

    // "hi" 를 빌려주고 닫는 따옴표 1바이트를 버린다
    auto head = cur.takeSpan(2, 1);
    if (head.size() != 2 || head.data() != data.data() + 1) {
        std::cerr << "[takeSpan] head mismatch\n";
        return false;
    }
    if (cur.size() != 2 || cur.position() != 0) {
        std::cerr << "[takeSpan] new view size=" << cur.size() << "\n";
        return false;
    }
    if (head.data() + head.size() + 1 != cur.rest().data()) {
        std::cerr << "[takeSpan] gap mismatch\n";
        return false;
    }

    // 빌린 span 에 쓰기가 가능해야 한다 (제자리 unescape)
    head[0] = 'H';
    if (data[1] != 'H') {
        std::cerr << "[takeSpan] head does not alias input\n";
        return false;
    }
    return true;
}

bool test_take_span_whole_rest() {
    const std::vector<std::uint8_t> data = {1, 2, 3};
    ConstCursor cur(data);
    auto all = cur.takeSpan(3, 0);
    if (all.size() != 3 || !cur.atEnd() || cur.remaining() != 0) {
        std::cerr << "[takeSpan] whole rest\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_peek_advance_rewind();
    ok &= test_take_span_splits_without_overlap();
    ok &= test_take_span_whole_rest();

    if (!ok) {
        std::cerr << "CursorTests FAILED\n";
        return 1;
    }
    std::cout << "CursorTests OK\n";
    return 0;
}
