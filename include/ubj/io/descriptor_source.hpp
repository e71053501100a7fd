#pragma once

/*
 * POSIX 文件描述符（管道/socket/tty）输入的 source。
 *
 * 基于 asio::posix::stream_descriptor 的同步 read_some：
 * - 不可定位，因此不做预读，每次只读取解码器请求的字节数（允许短读）；
 * - asio::error::eof 视为输入结束（n == 0），由解码器判定为 insufficient input；
 * - 不接管 fd：析构时 release()，关闭 fd 仍是调用方的责任。
 */

#include <asio/detail/config.hpp>

#if !defined(ASIO_HAS_POSIX_STREAM_DESCRIPTOR)
#error "ubj::io::DescriptorSource 仅支持 POSIX（需要 ASIO_HAS_POSIX_STREAM_DESCRIPTOR）"
#endif

#include "ubj/io/source.hpp"

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <system_error>

namespace ubj::io {

class DescriptorSource final : public ByteSource {
 public:
  DescriptorSource(asio::io_context& io, int fd);
  ~DescriptorSource() override;

  DescriptorSource(const DescriptorSource&) = delete;
  DescriptorSource& operator=(const DescriptorSource&) = delete;

  std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept override;

  [[nodiscard]] std::size_t position() const noexcept override { return position_; }

 private:
  asio::posix::stream_descriptor stream_;
  std::size_t position_{0};
};

}  // namespace ubj::io
