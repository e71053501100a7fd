#include "ubj/io/stream_source.hpp"

#include "ubj/core/error.hpp"

#include <spdlog/spdlog.h>

#include <istream>

namespace ubj::io {

IStreamSource::IStreamSource(std::istream& is)
    : is_(is), ahead_(ubj::core::kStreamReadAheadChunk) {
  // tellg() 失败说明底层 streambuf 不支持定位：此时不能预读。
  read_ahead_ = static_cast<bool>(is_) && is_.tellg() != std::istream::pos_type(-1);
  if (!read_ahead_) {
    is_.clear(is_.rdstate() & ~std::ios::failbit);
  }
}

std::error_code IStreamSource::fill() noexcept {
  ubj::core::mutable_bytes_view dst{};
  auto ec = ahead_.prepare(ubj::core::kStreamReadAheadChunk, dst);
  if (ec) {
    return ec;
  }
  is_.read(reinterpret_cast<char*>(dst.data()), static_cast<std::streamsize>(dst.size()));
  if (is_.bad()) {
    return ubj::core::make_error_code(ubj::core::errc::io_error);
  }
  return ahead_.commit(static_cast<std::size_t>(is_.gcount()));
}

std::error_code IStreamSource::read_some(mutable_bytes_view out, std::size_t& n) noexcept {
  n = 0;
  if (out.empty()) {
    return {};
  }

  if (!read_ahead_ || (ahead_.empty() && out.size() >= ubj::core::kStreamReadAheadChunk)) {
    is_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (is_.bad()) {
      return ubj::core::make_error_code(ubj::core::errc::io_error);
    }
    n = static_cast<std::size_t>(is_.gcount());
    position_ += n;
    return {};
  }

  if (ahead_.empty()) {
    auto ec = fill();
    if (ec) {
      return ec;
    }
  }
  n = ahead_.take(out);
  position_ += n;
  return {};
}

std::error_code IStreamSource::finish() noexcept {
  if (!read_ahead_ || ahead_.empty()) {
    return {};
  }
  const auto unread = static_cast<std::streamoff>(ahead_.size());
  ahead_.clear();
  // 预读越过了 EOF 时流处于 eof|fail 状态，seek 之前必须先清掉。
  is_.clear();
  is_.seekg(-unread, std::ios::cur);
  if (!is_) {
    spdlog::debug("[ubj] istream source: failed to rewind {} read-ahead bytes", unread);
    return ubj::core::make_error_code(ubj::core::errc::io_error);
  }
  return {};
}

}  // namespace ubj::io
