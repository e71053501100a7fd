#include "ubj/io/sink.hpp"

#include "ubj/core/error.hpp"

#include <new>
#include <ostream>
#include <stdexcept>

namespace ubj::io {

std::error_code VectorSink::write(bytes_view data) noexcept {
  try {
    out_.insert(out_.end(), data.begin(), data.end());
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::buffer_overflow);
  } catch (const std::length_error&) {
    return core::make_error_code(core::errc::buffer_overflow);
  }
  return {};
}

std::error_code OStreamSink::write(bytes_view data) noexcept {
  if (data.empty()) {
    return {};
  }
  os_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!os_) {
    return core::make_error_code(core::errc::io_error);
  }
  return {};
}

std::error_code OStreamSink::flush() noexcept {
  os_.flush();
  if (!os_) {
    return core::make_error_code(core::errc::io_error);
  }
  return {};
}

BufferedSink::BufferedSink(ByteSink& inner, std::size_t chunk_size)
    : inner_(inner), chunk_size_(chunk_size == 0 ? 1 : chunk_size), buffer_(chunk_size_) {}

std::error_code BufferedSink::write(bytes_view data) noexcept {
  // 大块数据（例如长字符串、bytes）不再经过缓冲，先排空已有内容保证顺序。
  if (data.size() >= chunk_size_) {
    auto ec = drain();
    if (ec) {
      return ec;
    }
    return inner_.write(data);
  }
  if (buffer_.size() + data.size() > chunk_size_) {
    auto ec = drain();
    if (ec) {
      return ec;
    }
  }
  return buffer_.append(data);
}

std::error_code BufferedSink::drain() noexcept {
  if (buffer_.empty()) {
    return {};
  }
  auto ec = inner_.write(buffer_.readable_bytes());
  buffer_.clear();
  return ec;
}

std::error_code BufferedSink::flush() noexcept {
  auto ec = drain();
  if (ec) {
    return ec;
  }
  return inner_.flush();
}

}  // namespace ubj::io
