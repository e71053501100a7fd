#include "ubj/io/descriptor_source.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>

namespace ubj::io {

DescriptorSource::DescriptorSource(asio::io_context& io, int fd) : stream_(io, fd) {}

DescriptorSource::~DescriptorSource() {
  if (stream_.is_open()) {
    (void)stream_.release();
  }
}

std::error_code DescriptorSource::read_some(mutable_bytes_view out, std::size_t& n) noexcept {
  n = 0;
  if (out.empty()) {
    return {};
  }
  std::error_code ec;
  n = stream_.read_some(asio::buffer(out.data(), out.size()), ec);
  if (ec == asio::error::eof) {
    n = 0;
    return {};
  }
  if (ec) {
    return ec;
  }
  position_ += n;
  return {};
}

}  // namespace ubj::io
