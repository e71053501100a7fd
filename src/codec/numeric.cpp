#include "ubj/codec/numeric.hpp"

#include "ubj/codec/errors.hpp"
#include "ubj/format/utf8.hpp"

#include <array>
#include <bit>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>

namespace ubj::codec {
namespace {

using ubj::format::marker;
using ubj::format::to_byte;

template <class UInt>
void put_be(byte* dst, UInt v) noexcept {
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto shift = static_cast<unsigned>(8u * (sizeof(UInt) - 1u - i));
    dst[i] = static_cast<byte>((v >> shift) & 0xFFu);
  }
}

template <class UInt>
UInt get_be(bytes_view payload) noexcept {
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    v = static_cast<UInt>((v << 8) | payload[i]);
  }
  return v;
}

}  // namespace

marker integer_marker_for(std::int64_t v) noexcept {
  if (v >= 0) {
    if (v <= 0xFF) {
      return marker::uint8;
    }
    if (v <= std::numeric_limits<std::int16_t>::max()) {
      return marker::int16;
    }
    if (v <= std::numeric_limits<std::int32_t>::max()) {
      return marker::int32;
    }
    return marker::int64;
  }
  if (v >= std::numeric_limits<std::int8_t>::min()) {
    return marker::int8;
  }
  if (v >= std::numeric_limits<std::int16_t>::min()) {
    return marker::int16;
  }
  if (v >= std::numeric_limits<std::int32_t>::min()) {
    return marker::int32;
  }
  return marker::int64;
}

std::error_code write_integer(io::ByteSink& sink, std::int64_t v) noexcept {
  // 标记 + 最大 8 字节 payload，一次写出。
  std::array<byte, 9> tmp{};
  const auto m = integer_marker_for(v);
  tmp[0] = to_byte(m);
  const auto width = ubj::format::integer_width(tmp[0]);
  switch (width) {
    case 1:
      tmp[1] = static_cast<byte>(static_cast<std::uint8_t>(v));
      break;
    case 2:
      put_be<std::uint16_t>(&tmp[1], static_cast<std::uint16_t>(v));
      break;
    case 4:
      put_be<std::uint32_t>(&tmp[1], static_cast<std::uint32_t>(v));
      break;
    default:
      put_be<std::uint64_t>(&tmp[1], static_cast<std::uint64_t>(v));
      break;
  }
  return sink.write(bytes_view{tmp.data(), 1 + width});
}

std::error_code write_length(io::ByteSink& sink, std::size_t length) noexcept {
  return write_integer(sink, static_cast<std::int64_t>(length));
}

std::error_code write_decimal(io::ByteSink& sink, const ubj::format::Decimal& v) noexcept {
  const auto text = v.to_string();
  const byte m = to_byte(marker::high_precision);
  auto ec = sink.write(bytes_view{&m, 1});
  if (ec) {
    return ec;
  }
  ec = write_length(sink, text.size());
  if (ec) {
    return ec;
  }
  return sink.write(bytes_view{reinterpret_cast<const byte*>(text.data()), text.size()});
}

std::error_code write_float(io::ByteSink& sink, double v, bool allow_float32) noexcept {
  if (!std::isfinite(v)) {
    const byte m = to_byte(marker::null);
    return sink.write(bytes_view{&m, 1});
  }

  const double mag = std::fabs(v);
  if (v == 0.0 || (allow_float32 && kFloat32Min <= mag && mag <= kFloat32Max)) {
    std::array<byte, 5> tmp{};
    tmp[0] = to_byte(marker::float32);
    put_be<std::uint32_t>(&tmp[1], std::bit_cast<std::uint32_t>(static_cast<float>(v)));
    return sink.write(bytes_view{tmp.data(), tmp.size()});
  }
  if (kFloat64Min <= mag && mag <= kFloat64Max) {
    std::array<byte, 9> tmp{};
    tmp[0] = to_byte(marker::float64);
    put_be<std::uint64_t>(&tmp[1], std::bit_cast<std::uint64_t>(v));
    return sink.write(bytes_view{tmp.data(), tmp.size()});
  }
  return write_decimal(sink, ubj::format::Decimal::from_double(v));
}

std::int64_t unpack_integer(byte m, bytes_view payload) noexcept {
  switch (static_cast<marker>(m)) {
    case marker::uint8:
      return static_cast<std::int64_t>(payload[0]);
    case marker::int8:
      return static_cast<std::int64_t>(std::bit_cast<std::int8_t>(payload[0]));
    case marker::int16:
      return static_cast<std::int64_t>(std::bit_cast<std::int16_t>(get_be<std::uint16_t>(payload)));
    case marker::int32:
      return static_cast<std::int64_t>(std::bit_cast<std::int32_t>(get_be<std::uint32_t>(payload)));
    case marker::int64:
      return std::bit_cast<std::int64_t>(get_be<std::uint64_t>(payload));
    default:
      return 0;
  }
}

float unpack_float32(bytes_view payload) noexcept {
  return std::bit_cast<float>(get_be<std::uint32_t>(payload));
}

double unpack_float64(bytes_view payload) noexcept {
  return std::bit_cast<double>(get_be<std::uint64_t>(payload));
}

std::error_code parse_decimal_text(bytes_view text, ubj::format::Decimal& out) noexcept {
  const std::string_view s{reinterpret_cast<const char*>(text.data()), text.size()};
  if (!ubj::format::is_valid_utf8(s)) {
    return make_error_code(decode_errc::invalid_utf8);
  }
  if (ubj::format::Decimal::parse(s, out)) {
    return make_error_code(decode_errc::invalid_decimal);
  }
  return {};
}

}  // namespace ubj::codec
