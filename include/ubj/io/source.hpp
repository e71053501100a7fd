#pragma once

#include "ubj/core/common.hpp"

#include <cstddef>
#include <system_error>

namespace ubj::io {

using byte = ubj::core::byte;
using bytes_view = ubj::core::bytes_view;
using mutable_bytes_view = ubj::core::mutable_bytes_view;

/**
 * @brief 解码输入的最小拉取式读能力。
 *
 * 约定：
 * - read_some() 允许“短读”（n < out.size()），n == 0 表示输入已结束；
 * - position() 是已交付给解码器的字节总数，用于错误偏移与连续文档定位；
 * - finish() 在每次 decode 调用结束（无论成败）时被调用一次，
 *   带预读的实现应在此把多读的字节退还给底层流；
 * - 解码器从不关闭 source。
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept = 0;

  [[nodiscard]] virtual std::size_t position() const noexcept = 0;

  virtual std::error_code finish() noexcept { return {}; }
};

/**
 * @brief 基于内存字节区间的 source（天然可定位）。
 *
 * 同一 BytesSource 可以连续调用 decode 读取首尾相接的多个文档。
 */
class BytesSource final : public ByteSource {
 public:
  explicit BytesSource(bytes_view in) noexcept : in_(in) {}

  std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept override;

  [[nodiscard]] std::size_t position() const noexcept override { return pos_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

}  // namespace ubj::io
