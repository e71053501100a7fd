#include "ubj/codec/encoder.hpp"

#include "ubj/codec/numeric.hpp"
#include "ubj/core/error.hpp"
#include "ubj/core/log.hpp"
#include "ubj/format/markers.hpp"
#include "ubj/format/utf8.hpp"
#include "ubj/utils/value_dump.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace ubj::codec {
namespace {

using ubj::format::Array;
using ubj::format::Bytes;
using ubj::format::Object;
using ubj::format::Value;
using ubj::format::marker;
using ubj::format::to_byte;
using ubj::format::value_kind;

// 编码栈帧：一个正在遍历的容器。
struct EncodeFrame final {
  Value container;  // 持有容器（fallback 转换结果只在这里存活）
  const void* identity{nullptr};
  bool is_mapping{false};
  std::size_t next{0};
  std::vector<const Object::entry_type*> sorted{};  // 仅 sort_keys 时使用
};

// 全部元素都是同一个 null/true/false 时返回该标记，否则返回 0。
byte uniform_no_data_marker(const Array& arr) noexcept {
  byte found = 0;
  for (const auto& item : arr) {
    byte m = 0;
    if (item.is_null()) {
      m = to_byte(marker::null);
    } else if (const auto* b = item.get_if<bool>()) {
      m = to_byte(*b ? marker::true_ : marker::false_);
    } else {
      return 0;
    }
    if (found != 0 && found != m) {
      return 0;
    }
    found = m;
  }
  return found;
}

class ValueEncoder final {
 public:
  ValueEncoder(io::ByteSink& sink, const EncodeOptions& options) noexcept
      : sink_(sink), options_(options) {}

  std::error_code run(const Value& root) {
    auto ec = write_value(root);
    while (!ec && !stack_.empty()) {
      auto& top = stack_.back();
      if (top.is_mapping) {
        const auto* obj = top.container.as_object();
        const std::size_t n = options_.sort_keys ? top.sorted.size() : obj->size();
        if (top.next >= n) {
          ec = close_container();
          continue;
        }
        // 注意：write_value 可能 push 新帧使 top 失效，entry 指向容器内部，不受影响。
        const auto& entry = options_.sort_keys ? *top.sorted[top.next] : obj->entries()[top.next];
        ++top.next;
        ec = write_key(entry.first);
        if (!ec) {
          ec = write_value(entry.second);
        }
      } else {
        const auto* arr = top.container.as_array();
        if (top.next >= arr->size()) {
          ec = close_container();
          continue;
        }
        const auto& item = (*arr)[top.next];
        ++top.next;
        ec = write_value(item);
      }
    }
    if (ec) {
      return ec;
    }
    return sink_.flush();
  }

 private:
  std::error_code write_marker(marker m) noexcept {
    const byte b = to_byte(m);
    return sink_.write(bytes_view{&b, 1});
  }

  std::error_code write_raw(std::string_view s) noexcept {
    return sink_.write(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
  }

  std::error_code write_string(const std::string& s) {
    if (!ubj::format::is_valid_utf8(s)) {
      spdlog::debug("[ubj] encode: string value is not valid utf-8 (size={})", s.size());
      return make_error_code(encode_errc::invalid_text);
    }
    // 单字节 UTF-8（ASCII）使用 `C`，不写长度。
    if (s.size() == 1) {
      auto ec = write_marker(marker::char_);
      if (ec) {
        return ec;
      }
      return write_raw(s);
    }
    auto ec = write_marker(marker::string);
    if (!ec) {
      ec = write_length(sink_, s.size());
    }
    if (ec) {
      return ec;
    }
    return write_raw(s);
  }

  // object 键：与字符串相同，但不写 `S`。
  std::error_code write_key(const std::string& key) {
    if (!ubj::format::is_valid_utf8(key)) {
      spdlog::debug("[ubj] encode: object key is not valid utf-8 (size={})", key.size());
      return make_error_code(encode_errc::invalid_key);
    }
    auto ec = write_length(sink_, key.size());
    if (ec) {
      return ec;
    }
    return write_raw(key);
  }

  // `[$U#<n>` + 原始字节，没有 `]`。
  std::error_code write_bytes(const Bytes& b) {
    const byte head[] = {to_byte(marker::array_start), to_byte(marker::container_type), to_byte(marker::uint8),
                         to_byte(marker::container_count)};
    auto ec = sink_.write(bytes_view{head, sizeof(head)});
    if (!ec) {
      ec = write_length(sink_, b.size());
    }
    if (ec) {
      return ec;
    }
    return sink_.write(bytes_view{b.data(), b.size()});
  }

  std::error_code write_value(const Value& v) {
    const bool allow_float32 = !options_.no_float32;
    switch (v.kind()) {
      case value_kind::string:
        return write_string(*v.get_if<std::string>());
      case value_kind::null:
        return write_marker(marker::null);
      case value_kind::boolean:
        return write_marker(*v.get_if<bool>() ? marker::true_ : marker::false_);
      case value_kind::integer:
        return write_integer(sink_, *v.get_if<std::int64_t>());
      case value_kind::float32:
        return write_float(sink_, static_cast<double>(*v.get_if<float>()), allow_float32);
      case value_kind::float64:
        return write_float(sink_, *v.get_if<double>(), allow_float32);
      case value_kind::decimal:
        return write_decimal(sink_, *v.get_if<ubj::format::Decimal>());
      case value_kind::bytes:
        return write_bytes(*v.get_if<Bytes>());
      case value_kind::object:
      case value_kind::array:
        return open_container(v);
      case value_kind::extension:
        return write_with_fallback(v);
    }
    return make_error_code(encode_errc::unsupported_type);
  }

  std::error_code write_with_fallback(const Value& v) {
    const auto& ext = *v.get_if<std::shared_ptr<const ubj::format::Extension>>();
    const std::string_view type_name = ext ? ext->type_name() : std::string_view{"<null extension>"};
    if (!options_.fallback) {
      spdlog::debug("[ubj] encode: cannot encode item of type {}", type_name);
      return make_error_code(encode_errc::unsupported_type);
    }

    Value converted;
    const auto ec = options_.fallback(v, converted);
    if (ec) {
      spdlog::debug("[ubj] encode: fallback failed for type {}: {}", type_name, ec.message());
      return make_error_code(encode_errc::fallback_failed);
    }
    if (converted.kind() == value_kind::extension) {
      spdlog::debug("[ubj] encode: fallback for type {} returned another extension value", type_name);
      return make_error_code(encode_errc::unsupported_type);
    }
    // dump 代价较高，只在 debug 级别打开时生成。
    if (ubj::core::debug_enabled()) {
      ubj::utils::ValueDumpOptions dump_options;
      dump_options.multiline = false;
      dump_options.max_depth = 2;
      dump_options.max_items = 8;
      spdlog::debug("[ubj] encode: fallback for type {} -> {}", type_name,
                    ubj::utils::dump_value(converted, dump_options));
    }
    return write_value(converted);
  }

  std::error_code open_container(const Value& v) {
    const void* id = v.identity();
    if (open_.contains(id)) {
      spdlog::debug("[ubj] encode: circular reference detected at depth {}", stack_.size());
      return make_error_code(encode_errc::circular_reference);
    }
    if (options_.max_depth != 0 && stack_.size() >= options_.max_depth) {
      spdlog::debug("[ubj] encode: nesting depth limit {} exceeded", options_.max_depth);
      return ubj::core::make_error_code(ubj::core::errc::depth_exceeded);
    }

    EncodeFrame frame;
    frame.identity = id;
    std::size_t count = 0;
    if (const auto* arr = v.as_array()) {
      count = arr->size();
      if (options_.compact_no_data_arrays && !arr->empty()) {
        const byte m = uniform_no_data_marker(*arr);
        if (m != 0) {
          const byte head[] = {to_byte(marker::array_start), to_byte(marker::container_type), m,
                               to_byte(marker::container_count)};
          auto ec = sink_.write(bytes_view{head, sizeof(head)});
          if (ec) {
            return ec;
          }
          return write_length(sink_, count);
        }
      }
      auto ec = write_marker(marker::array_start);
      if (ec) {
        return ec;
      }
    } else {
      const auto* obj = v.as_object();
      count = obj->size();
      frame.is_mapping = true;
      if (options_.sort_keys) {
        frame.sorted = obj->sorted_entries();
      }
      auto ec = write_marker(marker::object_start);
      if (ec) {
        return ec;
      }
    }

    if (options_.container_count) {
      auto ec = write_marker(marker::container_count);
      if (!ec) {
        ec = write_length(sink_, count);
      }
      if (ec) {
        return ec;
      }
    }

    frame.container = v;
    open_.insert(id);
    stack_.push_back(std::move(frame));
    return {};
  }

  std::error_code close_container() {
    const bool is_mapping = stack_.back().is_mapping;
    open_.erase(stack_.back().identity);
    stack_.pop_back();
    if (options_.container_count) {
      return {};
    }
    return write_marker(is_mapping ? marker::object_end : marker::array_end);
  }

  io::ByteSink& sink_;
  const EncodeOptions& options_;
  std::vector<EncodeFrame> stack_{};
  std::unordered_set<const void*> open_{};
};

std::error_code run_encoder(ValueEncoder& encoder, const Value& value) noexcept {
  try {
    return encoder.run(value);
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::buffer_overflow);
  } catch (const std::length_error&) {
    return core::make_error_code(core::errc::buffer_overflow);
  }
}

}  // namespace

std::error_code encode(const Value& value, io::ByteSink& sink, const EncodeOptions& options) noexcept {
  io::BufferedSink buffered(sink);
  ValueEncoder encoder(buffered, options);
  return run_encoder(encoder, value);
}

std::error_code encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options) noexcept {
  const auto old_size = out.size();
  io::VectorSink sink(out);
  ValueEncoder encoder(sink, options);
  const auto ec = run_encoder(encoder, value);
  if (ec) {
    out.resize(old_size);
  }
  return ec;
}

}  // namespace ubj::codec
