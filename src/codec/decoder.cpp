#include "ubj/codec/decoder.hpp"

#include "ubj/codec/numeric.hpp"
#include "ubj/core/error.hpp"
#include "ubj/core/log.hpp"
#include "ubj/format/markers.hpp"
#include "ubj/format/utf8.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

namespace ubj::codec {
namespace {

using ubj::format::Array;
using ubj::format::Bytes;
using ubj::format::Decimal;
using ubj::format::Object;
using ubj::format::Value;
using ubj::format::marker;
using ubj::format::mutable_bytes_view;
using ubj::format::to_byte;

// 长字符串/bytes 分块读取：声明的长度不可信，不能一次按声明长度分配。
constexpr std::size_t kPayloadChunk = 64 * 1024;

// 按 `#` 预留容量的上限（同理：count 来自输入）。
constexpr std::size_t kReserveLimit = 4096;

constexpr bool is_marker(byte b, marker m) noexcept { return b == to_byte(m); }

Value no_data_value(byte m) {
  if (is_marker(m, marker::true_)) {
    return Value::boolean(true);
  }
  if (is_marker(m, marker::false_)) {
    return Value::boolean(false);
  }
  return Value::null();
}

const char* integer_context(byte m) noexcept {
  switch (static_cast<marker>(m)) {
    case marker::int8:
      return "int8";
    case marker::uint8:
      return "uint8";
    case marker::int16:
      return "int16";
    case marker::int32:
      return "int32";
    default:
      return "int64";
  }
}

}  // namespace

Decoder::Decoder(io::ByteSource& source, DecodeOptions options) noexcept
    : source_(source), options_(std::move(options)) {}

std::error_code Decoder::fail(std::error_code ec, const char* context) noexcept {
  error_offset_ = source_.position();
  error_context_ = context;
  if (ubj::core::debug_enabled()) {
    spdlog::debug("[ubj] decode: {} at offset {} ({})", ec.message(), error_offset_, error_context_);
  }
  return ec;
}

std::error_code Decoder::read_exact(mutable_bytes_view out, const char* context) noexcept {
  std::size_t done = 0;
  while (done < out.size()) {
    std::size_t n = 0;
    auto ec = source_.read_some(out.subspan(done), n);
    if (ec) {
      return fail(ec, context);
    }
    if (n == 0) {
      return fail(make_error_code(decode_errc::insufficient_input), context);
    }
    done += n;
  }
  return {};
}

std::error_code Decoder::read_marker(byte& m, const char* context) noexcept {
  return read_exact(mutable_bytes_view{&m, 1}, context);
}

std::error_code Decoder::read_integer_payload(byte m, std::int64_t& out, const char* context) noexcept {
  const auto width = ubj::format::integer_width(m);
  if (width == 0) {
    return fail(make_error_code(decode_errc::integer_marker_expected), context);
  }
  std::array<byte, 8> payload{};
  auto ec = read_exact(mutable_bytes_view{payload.data(), width}, context);
  if (ec) {
    return ec;
  }
  out = unpack_integer(m, bytes_view{payload.data(), width});
  return {};
}

std::error_code Decoder::read_length(byte m, std::size_t& out, const char* context) noexcept {
  std::int64_t v = 0;
  auto ec = read_integer_payload(m, v, context);
  if (ec) {
    return ec;
  }
  if (v < 0) {
    return fail(make_error_code(decode_errc::negative_length), context);
  }
  out = static_cast<std::size_t>(v);
  return {};
}

std::error_code Decoder::read_text(std::size_t length, std::string& out, const char* context) {
  out.clear();
  std::size_t done = 0;
  while (done < length) {
    const std::size_t chunk = std::min(length - done, kPayloadChunk);
    out.resize(done + chunk);
    auto ec = read_exact(mutable_bytes_view{reinterpret_cast<byte*>(out.data()) + done, chunk}, context);
    if (ec) {
      return ec;
    }
    done += chunk;
  }
  return {};
}

std::error_code Decoder::read_key(byte m, std::string& out) {
  std::size_t length = 0;
  auto ec = read_length(m, length, "object key length");
  if (!ec) {
    ec = read_text(length, out, "object key");
  }
  if (ec) {
    return ec;
  }
  if (options_.intern_object_keys && interned_keys_.contains(out)) {
    return {};
  }
  if (!ubj::format::is_valid_utf8(out)) {
    return fail(make_error_code(decode_errc::invalid_utf8), "object key");
  }
  if (options_.intern_object_keys) {
    interned_keys_.insert(out);
  }
  return {};
}

std::error_code Decoder::start_value(byte m, Value& value, bool& complete, bool in_container) {
  complete = true;
  switch (static_cast<marker>(m)) {
    case marker::null:
      value = Value::null();
      return {};
    case marker::true_:
      value = Value::boolean(true);
      return {};
    case marker::false_:
      value = Value::boolean(false);
      return {};
    case marker::int8:
    case marker::uint8:
    case marker::int16:
    case marker::int32:
    case marker::int64: {
      std::int64_t v = 0;
      auto ec = read_integer_payload(m, v, integer_context(m));
      if (ec) {
        return ec;
      }
      value = Value::integer(v);
      return {};
    }
    case marker::float32: {
      std::array<byte, 4> payload{};
      auto ec = read_exact(mutable_bytes_view{payload}, "float32");
      if (ec) {
        return ec;
      }
      value = Value::float32(unpack_float32(bytes_view{payload}));
      return {};
    }
    case marker::float64: {
      std::array<byte, 8> payload{};
      auto ec = read_exact(mutable_bytes_view{payload}, "float64");
      if (ec) {
        return ec;
      }
      value = Value::float64(unpack_float64(bytes_view{payload}));
      return {};
    }
    case marker::high_precision: {
      byte lm = 0;
      std::size_t length = 0;
      std::string text;
      auto ec = read_marker(lm, "highprec length");
      if (!ec) {
        ec = read_length(lm, length, "highprec length");
      }
      if (!ec) {
        ec = read_text(length, text, "highprec");
      }
      if (ec) {
        return ec;
      }
      Decimal d;
      ec = parse_decimal_text(bytes_view{reinterpret_cast<const byte*>(text.data()), text.size()}, d);
      if (ec) {
        return fail(ec, "highprec");
      }
      value = Value::decimal(std::move(d));
      return {};
    }
    case marker::char_: {
      byte c = 0;
      auto ec = read_marker(c, "char");
      if (ec) {
        return ec;
      }
      // 单字节只能是 ASCII 才是合法的 UTF-8。
      if (c >= 0x80) {
        return fail(make_error_code(decode_errc::invalid_utf8), "char");
      }
      value = Value::string(std::string(1, static_cast<char>(c)));
      return {};
    }
    case marker::string: {
      byte lm = 0;
      std::size_t length = 0;
      std::string text;
      auto ec = read_marker(lm, "string length");
      if (!ec) {
        ec = read_length(lm, length, "string length");
      }
      if (!ec) {
        ec = read_text(length, text, "string");
      }
      if (ec) {
        return ec;
      }
      if (!ubj::format::is_valid_utf8(text)) {
        return fail(make_error_code(decode_errc::invalid_utf8), "string");
      }
      value = Value::string(std::move(text));
      return {};
    }
    case marker::array_start:
      return open_container(false, value, complete);
    case marker::object_start:
      return open_container(true, value, complete);
    default:
      break;
  }
  if (in_container) {
    return fail(make_error_code(decode_errc::invalid_container_marker), "container value type marker");
  }
  return fail(make_error_code(decode_errc::invalid_marker), "type marker");
}

std::error_code Decoder::open_container(bool is_mapping, Value& value, bool& complete) {
  complete = false;
  if (options_.max_depth != 0 && stack_.size() >= options_.max_depth) {
    return fail(ubj::core::make_error_code(ubj::core::errc::depth_exceeded), "container");
  }

  Frame frame;
  frame.is_mapping = is_mapping;

  byte b = 0;
  auto ec = read_marker(b, "container type, count or 1st key/value type");
  if (ec) {
    return ec;
  }
  if (is_marker(b, marker::container_type)) {
    ec = read_marker(b, "container type");
    if (ec) {
      return ec;
    }
    if (!ubj::format::is_valid_container_type(b)) {
      return fail(make_error_code(decode_errc::invalid_container_type), "container type");
    }
    frame.declared_type = b;
    ec = read_marker(b, "container count");
    if (ec) {
      return ec;
    }
  }

  if (is_marker(b, marker::container_count)) {
    byte lm = 0;
    ec = read_marker(lm, "container count");
    if (!ec) {
      ec = read_length(lm, frame.remaining, "container count");
    }
    if (ec) {
      return ec;
    }
    frame.counted = true;
  } else if (frame.declared_type != 0) {
    return fail(make_error_code(decode_errc::type_without_count), "container count");
  } else {
    frame.has_first_marker = true;
    frame.first_marker = b;
  }

  if (frame.counted && !is_mapping) {
    // `[$U#n`：整块原始字节。
    if (is_marker(frame.declared_type, marker::uint8) && !options_.no_bytes) {
      Bytes raw;
      std::size_t done = 0;
      while (done < frame.remaining) {
        const std::size_t chunk = std::min(frame.remaining - done, kPayloadChunk);
        raw.resize(done + chunk);
        ec = read_exact(mutable_bytes_view{raw.data() + done, chunk}, "bytes array");
        if (ec) {
          return ec;
        }
        done += chunk;
      }
      value = Value::bytes(std::move(raw));
      complete = true;
      return {};
    }
    // `[$Z#n` / `[$T#n` / `[$F#n`：不读元素，直接复制 n 份。
    if (ubj::format::is_no_data_type(frame.declared_type)) {
      Array items;
      try {
        items.assign(frame.remaining, no_data_value(frame.declared_type));
      } catch (const std::bad_alloc&) {
        return fail(ubj::core::make_error_code(ubj::core::errc::buffer_overflow), "no-data array");
      } catch (const std::length_error&) {
        return fail(ubj::core::make_error_code(ubj::core::errc::buffer_overflow), "no-data array");
      }
      value = Value::array(std::move(items));
      complete = true;
      return {};
    }
    frame.items.reserve(std::min(frame.remaining, kReserveLimit));
  } else if (frame.counted) {
    if (options_.object_pairs_hook) {
      frame.pairs.reserve(std::min(frame.remaining, kReserveLimit));
    } else {
      frame.object.reserve(std::min(frame.remaining, kReserveLimit));
    }
  }

  stack_.push_back(std::move(frame));
  return {};
}

std::error_code Decoder::finish_container(Value& value, bool& complete) {
  auto frame = std::move(stack_.back());
  stack_.pop_back();
  complete = true;

  if (!frame.is_mapping) {
    value = Value::array(std::move(frame.items));
    return {};
  }
  if (options_.object_pairs_hook) {
    auto ec = options_.object_pairs_hook(std::move(frame.pairs), value);
    if (ec) {
      return fail(ec, "object_pairs_hook");
    }
    return {};
  }
  if (options_.object_hook) {
    auto ec = options_.object_hook(std::move(frame.object), value);
    if (ec) {
      return fail(ec, "object_hook");
    }
    return {};
  }
  value = Value::object(std::move(frame.object));
  return {};
}

void Decoder::attach(Value&& value) {
  auto& frame = stack_.back();
  if (!frame.is_mapping) {
    frame.items.push_back(std::move(value));
  } else if (options_.object_pairs_hook) {
    frame.pairs.emplace_back(std::move(frame.pending_key), std::move(value));
  } else {
    frame.object.insert_or_assign(std::move(frame.pending_key), std::move(value));
  }
  frame.pending_key.clear();
}

std::error_code Decoder::step(Value& value, bool& complete) {
  auto& frame = stack_.back();
  byte m = 0;

  if (frame.counted) {
    if (frame.remaining == 0) {
      return finish_container(value, complete);
    }
    --frame.remaining;
    if (frame.is_mapping) {
      auto ec = read_marker(m, "object key length");
      if (ec) {
        return ec;
      }
      if (is_marker(m, marker::noop)) {
        return fail(make_error_code(decode_errc::noop_in_typed_container), "object key length");
      }
      ec = read_key(m, frame.pending_key);
      if (ec) {
        return ec;
      }
    }
    if (frame.declared_type != 0) {
      m = frame.declared_type;
    } else {
      const char* context = frame.is_mapping ? "object value type marker" : "array value type marker";
      auto ec = read_marker(m, context);
      if (ec) {
        return ec;
      }
      if (is_marker(m, marker::noop)) {
        return fail(make_error_code(decode_errc::noop_in_typed_container), context);
      }
    }
    return start_value(m, value, complete, true);
  }

  // 未声明类型与数量：读到结束标记为止，元素/键值对之间允许 no-op。
  if (frame.has_first_marker) {
    m = frame.first_marker;
    frame.has_first_marker = false;
  } else {
    auto ec = read_marker(m, frame.is_mapping ? "object key length" : "array value type marker");
    if (ec) {
      return ec;
    }
  }
  while (is_marker(m, marker::noop)) {
    auto ec = read_marker(m, "marker after no-op");
    if (ec) {
      return ec;
    }
  }

  if (frame.is_mapping) {
    if (is_marker(m, marker::object_end)) {
      return finish_container(value, complete);
    }
    auto ec = read_key(m, frame.pending_key);
    if (!ec) {
      ec = read_marker(m, "object value type marker");
    }
    if (ec) {
      return ec;
    }
  } else if (is_marker(m, marker::array_end)) {
    return finish_container(value, complete);
  }
  return start_value(m, value, complete, true);
}

std::error_code Decoder::run(Value& out) {
  byte m = 0;
  std::size_t n = 0;
  auto ec = source_.read_some(mutable_bytes_view{&m, 1}, n);
  if (ec) {
    return fail(ec, "type marker");
  }
  if (n == 0) {
    return fail(make_error_code(decode_errc::no_input), "type marker");
  }

  Value value;
  bool complete = false;
  ec = start_value(m, value, complete, false);
  while (!ec) {
    if (complete) {
      if (stack_.empty()) {
        out = std::move(value);
        return {};
      }
      attach(std::move(value));
      complete = false;
    }
    ec = step(value, complete);
  }
  return ec;
}

std::error_code Decoder::decode(Value& out) noexcept {
  stack_.clear();
  interned_keys_.clear();
  error_offset_ = 0;
  error_context_ = {};

  // 帧栈、字符串、容器的分配失败统一映射为 buffer_overflow，不让异常越过 noexcept 边界。
  std::error_code ec;
  try {
    ec = run(out);
  } catch (const std::bad_alloc&) {
    ec = fail(ubj::core::make_error_code(ubj::core::errc::buffer_overflow), "allocation");
  } catch (const std::length_error&) {
    ec = fail(ubj::core::make_error_code(ubj::core::errc::buffer_overflow), "allocation");
  }
  stack_.clear();
  const auto finish_ec = source_.finish();
  if (ec) {
    if (finish_ec) {
      spdlog::debug("[ubj] decode: source finish failed after error: {}", finish_ec.message());
    }
    return ec;
  }
  return finish_ec;
}

std::error_code decode(io::ByteSource& source, Value& out, const DecodeOptions& options) noexcept {
  Decoder decoder(source, options);
  return decoder.decode(out);
}

std::error_code decode_one(bytes_view in, Value& out, std::size_t& consumed, const DecodeOptions& options) noexcept {
  io::BytesSource source(in);
  Decoder decoder(source, options);
  const auto ec = decoder.decode(out);
  consumed = ec ? 0 : source.position();
  return ec;
}

}  // namespace ubj::codec
