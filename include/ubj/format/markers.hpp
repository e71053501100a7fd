#pragma once

#include "ubj/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace ubj::format {

using byte = ubj::core::byte;
using bytes_view = ubj::core::bytes_view;
using mutable_bytes_view = ubj::core::mutable_bytes_view;

/**
 * @brief UBJSON 单字节标记（类型标记 + 容器结构标记）。
 *
 * 所有数值 payload 均为大端序；容器可选的 `$`（元素类型）与 `#`（元素数量）
 * 修饰符紧跟在 `[` / `{` 之后，且 `$` 必须先于 `#` 出现。
 */
enum class marker : std::uint8_t {
  null = 'Z',
  true_ = 'T',
  false_ = 'F',

  int8 = 'i',
  uint8 = 'U',
  int16 = 'I',
  int32 = 'l',
  int64 = 'L',

  float32 = 'd',
  float64 = 'D',
  high_precision = 'H',

  char_ = 'C',
  string = 'S',

  array_start = '[',
  array_end = ']',
  object_start = '{',
  object_end = '}',

  container_type = '$',
  container_count = '#',

  noop = 'N',
};

[[nodiscard]] constexpr byte to_byte(marker m) noexcept { return static_cast<byte>(m); }

/**
 * @brief 是否为“标量值”类型标记（不含容器起止与修饰符）。
 */
[[nodiscard]] constexpr bool is_scalar_type(byte b) noexcept {
  switch (static_cast<marker>(b)) {
    case marker::null:
    case marker::true_:
    case marker::false_:
    case marker::int8:
    case marker::uint8:
    case marker::int16:
    case marker::int32:
    case marker::int64:
    case marker::float32:
    case marker::float64:
    case marker::high_precision:
    case marker::char_:
    case marker::string:
      return true;
    default:
      return false;
  }
}

// null/true/false 没有 payload，[$T#n 这类容器可以直接按数量复制。
[[nodiscard]] constexpr bool is_no_data_type(byte b) noexcept {
  return b == to_byte(marker::null) || b == to_byte(marker::true_) || b == to_byte(marker::false_);
}

// `$` 之后允许的元素类型：任意标量，或嵌套容器的起始标记。
[[nodiscard]] constexpr bool is_valid_container_type(byte b) noexcept {
  return is_scalar_type(b) || b == to_byte(marker::array_start) || b == to_byte(marker::object_start);
}

/**
 * @brief 定长整数标记的 payload 字节数；非整数标记返回 0。
 */
[[nodiscard]] constexpr std::size_t integer_width(byte b) noexcept {
  switch (static_cast<marker>(b)) {
    case marker::int8:
    case marker::uint8:
      return 1;
    case marker::int16:
      return 2;
    case marker::int32:
      return 4;
    case marker::int64:
      return 8;
    default:
      return 0;
  }
}

}  // namespace ubj::format
