#pragma once

#include "ubj/core/common.hpp"
#include "ubj/core/error.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <system_error>

namespace ubj::core {

/**
 * @brief 预分配 + 可扩容的字节缓冲区（读写指针模型）。
 *
 * 用途：
 * - BufferedSink：编码输出先落在这里，攒够一块再交给下游 sink；
 * - IStreamSource：流式解码的预读窗口，解码结束后把未消费部分“退回”给流。
 *
 * 小数据优先使用 inline 存储（kDefaultFixedBufferCapacity），超出后切到 heap，
 * 容量受 max_capacity 约束。本类不做线程安全保证。
 */
class FixedBuffer final {
public:
    explicit FixedBuffer(
        std::size_t initial_capacity = kDefaultFixedBufferCapacity,
        std::size_t max_capacity = kDefaultFixedBufferMaxCapacity);

    FixedBuffer(const FixedBuffer &) = delete;
    FixedBuffer &operator=(const FixedBuffer &) = delete;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return write_pos_ - read_pos_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    void clear() noexcept;

    [[nodiscard]] bytes_view readable_bytes() const noexcept;

    /**
     * @brief 保证尾部至少有 n 字节可写空间，并返回整个可写区。
     *
     * 依次尝试：直接可用 -> compact 回收已读前缀 -> 扩容（2 倍增长，受上限约束）。
     */
    std::error_code prepare(std::size_t n, mutable_bytes_view &out) noexcept;

    std::error_code commit(std::size_t n) noexcept;
    std::error_code append(bytes_view data) noexcept;
    std::error_code consume(std::size_t n) noexcept;

    /**
     * @brief 从可读区拷出至多 out.size() 字节并消费，返回实际拷出的字节数。
     */
    std::size_t take(mutable_bytes_view out) noexcept;

private:
    [[nodiscard]] byte *base() noexcept { return heap_ ? heap_.get() : inline_.data(); }
    [[nodiscard]] const byte *base() const noexcept {
        return heap_ ? heap_.get() : inline_.data();
    }

    void compact() noexcept;
    std::error_code grow(std::size_t min_capacity) noexcept;

    std::array<byte, kDefaultFixedBufferCapacity> inline_{};
    std::unique_ptr<byte[]> heap_;

    std::size_t max_capacity_{0};
    std::size_t capacity_{0};
    std::size_t read_pos_{0};
    std::size_t write_pos_{0};
};

} // namespace ubj::core
