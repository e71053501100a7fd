#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ubj::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// FixedBuffer 默认初始容量：小文档优先走 inline 预分配路径，减少频繁堆分配。
inline constexpr std::size_t kDefaultFixedBufferCapacity = 8 * 1024;

// FixedBuffer 默认最大容量：用于避免极端情况下无上限扩容导致内存耗尽。
inline constexpr std::size_t kDefaultFixedBufferMaxCapacity = 64 * 1024 * 1024;  // 64MB

// 流式输入的最小预读块（与逐字节 read 相比显著减少系统调用次数）。
inline constexpr std::size_t kStreamReadAheadChunk = 256;

}  // 命名空间 ubj::core
