#pragma once

#include "ubj/core/common.hpp"
#include "ubj/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ubj::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 把 “5B 23 55 02 ...” 这类抓包/日志文本解析为 UBJSON 字节；
 * - 解码失败时以 hexdump 形式输出出错位置附近的字节。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏；UBJSON 的标记都是可打印 ASCII，默认打开。
    bool show_ascii{true};

    // 是否输出 ANSI 颜色控制码（终端更易读；写入日志/文件时建议关闭）。
    bool enable_color{false};

    // 高亮的字节偏移（例如 Decoder::error_offset()）；超出范围表示不高亮。
    std::size_t highlight_offset{static_cast<std::size_t>(-1)};
};

/**
 * @brief 将 bytes 以 hexdump 形式格式化为字符串。
 */
[[nodiscard]] std::string hex_dump(ubj::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 紧凑格式：“5b 55 01”（以单个空格分隔，不换行）。
 */
[[nodiscard]] std::string to_hex(ubj::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<ubj::core::byte> &out) noexcept;

} // namespace ubj::utils
