#pragma once
#include <cstddef>

namespace zerowire::core::defaults
{

// ===== Input policy =====
inline constexpr std::size_t kMaxInputBytes = 64U * 1024U * 1024U; // 64 MiB

// ===== Framing policy =====
inline constexpr std::size_t kMaxMessageLen = 1024U * 1024U; // 1 MiB

// maxMessageLen 은 이보다 작게 줄 수 없다 (태그 + 최소 헤더)
inline constexpr std::size_t kMinMessageLen = 16;

// ===== Decode policy =====
inline constexpr std::size_t kMaxDepth = 128; // array/map 중첩

} // namespace zerowire::core::defaults
