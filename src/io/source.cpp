#include "ubj/io/source.hpp"

#include <algorithm>
#include <cstring>

namespace ubj::io {

std::error_code BytesSource::read_some(mutable_bytes_view out, std::size_t& n) noexcept {
  n = std::min(out.size(), remaining());
  if (n != 0) {
    std::memcpy(out.data(), in_.data() + pos_, n);
    pos_ += n;
  }
  return {};
}

}  // namespace ubj::io
