#pragma once

#include "ubj/core/buffer.hpp"
#include "ubj/io/source.hpp"

#include <cstddef>
#include <iosfwd>
#include <system_error>

namespace ubj::io {

/**
 * @brief 以 std::istream 为输入的 source。
 *
 * - 可定位的流（tellg() 有效）：按 kStreamReadAheadChunk 为单位预读到 FixedBuffer，
 *   finish() 时用相对 seek 把未消费的预读退还给流，因此同一个流上可以连续解码多个文档；
 * - 不可定位的流（管道、std::cin 等）：关闭预读，只按解码器请求的精确字节数读取，
 *   不会多吃下一个文档的字节。
 */
class IStreamSource final : public ByteSource {
 public:
  explicit IStreamSource(std::istream& is);

  std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept override;

  [[nodiscard]] std::size_t position() const noexcept override { return position_; }

  std::error_code finish() noexcept override;

  [[nodiscard]] bool read_ahead_enabled() const noexcept { return read_ahead_; }

 private:
  std::error_code fill() noexcept;

  std::istream& is_;
  bool read_ahead_{false};
  std::size_t position_{0};
  ubj::core::FixedBuffer ahead_;
};

}  // namespace ubj::io
