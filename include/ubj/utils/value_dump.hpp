#pragma once

#include "ubj/format/value.hpp"

#include <cstddef>
#include <string>

namespace ubj::utils {

/**
 * @brief Value 的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 输出不是 JSON：带类型前缀（int/float32/decimal/bytes...），便于确认解码得到的具体类型；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没；
 * - 输出深度受 max_depth 约束，因此对含环的值也能安全输出。
 */
struct ValueDumpOptions final {
    // 最大展开深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // Array/Object 最大输出元素数（0 表示不限制）。
    std::size_t max_items{128};

    // 字符串/bytes 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // 容器是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（终端更易读；写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const ubj::format::Value &value,
                                     ValueDumpOptions options = {});

} // namespace ubj::utils
