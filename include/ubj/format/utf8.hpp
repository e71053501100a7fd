#pragma once

#include <string_view>

namespace ubj::format {

/**
 * @brief 严格 UTF-8 校验：拒绝过长编码、代理区码点（U+D800..U+DFFF）与超出 U+10FFFF 的序列。
 */
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

}  // namespace ubj::format
