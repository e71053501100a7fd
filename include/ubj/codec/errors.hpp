#pragma once

#include <system_error>

namespace ubj::codec {

/**
 * @brief 编码错误（调用方可恢复：值本身无法表示为 UBJSON）。
 */
enum class encode_errc : int {
  ok = 0,
  unsupported_type = 1,
  invalid_key = 2,
  invalid_text = 3,
  circular_reference = 4,
  fallback_failed = 5,
};

/**
 * @brief 解码错误（输入字节流非法或不完整）。
 */
enum class decode_errc : int {
  ok = 0,
  no_input = 1,
  insufficient_input = 2,
  invalid_marker = 3,
  invalid_container_marker = 4,
  integer_marker_expected = 5,
  negative_length = 6,
  invalid_utf8 = 7,
  invalid_decimal = 8,
  invalid_container_type = 9,
  type_without_count = 10,
  noop_in_typed_container = 11,
  hook_failed = 12,
};

const std::error_category& encode_category() noexcept;
const std::error_category& decode_category() noexcept;

std::error_code make_error_code(encode_errc e) noexcept;
std::error_code make_error_code(decode_errc e) noexcept;

}  // namespace ubj::codec

namespace std {
template <>
struct is_error_code_enum<ubj::codec::encode_errc> : true_type {};
template <>
struct is_error_code_enum<ubj::codec::decode_errc> : true_type {};
}  // namespace std
