#pragma once

#include <system_error>

namespace ubj::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 编解码接口统一返回 std::error_code，不抛异常；
 * - depth_exceeded 刻意不归入 encode/decode 错误域：
 *   它描述的是调用方配置的资源上限，而不是“输入非法”。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
  depth_exceeded = 3,
  io_error = 4,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace ubj::core

namespace std {
template <>
struct is_error_code_enum<ubj::core::errc> : true_type {};
}  // namespace std
