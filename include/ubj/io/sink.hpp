#pragma once

#include "ubj/core/buffer.hpp"
#include "ubj/core/common.hpp"

#include <cstddef>
#include <iosfwd>
#include <system_error>
#include <vector>

namespace ubj::io {

using byte = ubj::core::byte;
using bytes_view = ubj::core::bytes_view;

/**
 * @brief 编码输出的最小写能力。
 *
 * 编码器只调用 write()/flush()，从不关闭或接管 sink 的生命周期。
 */
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual std::error_code write(bytes_view data) noexcept = 0;

  // 文档写完后由编码器调用一次；无缓冲的 sink 直接返回成功。
  virtual std::error_code flush() noexcept { return {}; }
};

/**
 * @brief 追加写入 std::vector<byte>。
 */
class VectorSink final : public ByteSink {
 public:
  explicit VectorSink(std::vector<byte>& out) noexcept : out_(out) {}

  std::error_code write(bytes_view data) noexcept override;

 private:
  std::vector<byte>& out_;
};

/**
 * @brief 写入 std::ostream（二进制）；流进入失败状态时返回 core::errc::io_error。
 */
class OStreamSink final : public ByteSink {
 public:
  explicit OStreamSink(std::ostream& os) noexcept : os_(os) {}

  std::error_code write(bytes_view data) noexcept override;
  std::error_code flush() noexcept override;

 private:
  std::ostream& os_;
};

/**
 * @brief 先把小块写入攒进 FixedBuffer，达到阈值后整块交给下游 sink。
 *
 * 编码器每个 marker 只写 1 字节，下游是 ostream/socket 时用它可以大幅减少调用次数。
 * 注意：数据只有在 flush() 之后才保证全部到达下游。
 */
class BufferedSink final : public ByteSink {
 public:
  explicit BufferedSink(ByteSink& inner, std::size_t chunk_size = ubj::core::kDefaultFixedBufferCapacity);

  std::error_code write(bytes_view data) noexcept override;
  std::error_code flush() noexcept override;

  [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size(); }

 private:
  std::error_code drain() noexcept;

  ByteSink& inner_;
  std::size_t chunk_size_;
  ubj::core::FixedBuffer buffer_;
};

}  // namespace ubj::io
