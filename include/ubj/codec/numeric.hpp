#pragma once

#include "ubj/format/decimal.hpp"
#include "ubj/format/markers.hpp"
#include "ubj/io/sink.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <system_error>

namespace ubj::codec {

using byte = ubj::format::byte;
using bytes_view = ubj::format::bytes_view;

// float32 与 float64 的可用幅值区间（超出区间的有限值退化为 `H`）。
inline constexpr double kFloat32Min = 1.18e-38;
inline constexpr double kFloat32Max = 3.4e38;
inline constexpr double kFloat64Min = 2.23e-308;
inline constexpr double kFloat64Max = std::numeric_limits<double>::max();

/**
 * @brief 为整数选择最小的标记：0..255 -> U，-128..-1 -> i，其余依次 I/l/L。
 */
[[nodiscard]] ubj::format::marker integer_marker_for(std::int64_t v) noexcept;

/**
 * @brief 写入“标记 + 大端 payload”形式的整数（最小宽度）。
 */
std::error_code write_integer(io::ByteSink& sink, std::int64_t v) noexcept;

/**
 * @brief 写入字符串/键/`H`/`#` 使用的长度（同样是带标记的整数）。
 */
std::error_code write_length(io::ByteSink& sink, std::size_t length) noexcept;

/**
 * @brief 写入浮点数。
 *
 * - NaN/Inf：写 `Z`（有损，解码为 null）；
 * - 0（含 -0）：总是 float32；
 * - allow_float32 且 1.18e-38 <= |v| <= 3.4e38：float32；
 * - 2.23e-308 <= |v| < 1.8e308：float64；
 * - 其余（次正规数等）：`H` 十进制文本。
 */
std::error_code write_float(io::ByteSink& sink, double v, bool allow_float32) noexcept;

/**
 * @brief 写入 `H` + 长度 + 十进制文本（非有限 Decimal 也按文本写出，可无损往返）。
 */
std::error_code write_decimal(io::ByteSink& sink, const ubj::format::Decimal& v) noexcept;

/**
 * @brief 按整数标记解出大端 payload（payload 长度必须等于 integer_width(marker)）。
 *
 * `U` 为无符号，其余为有符号（补码符号扩展）。
 */
[[nodiscard]] std::int64_t unpack_integer(byte marker, bytes_view payload) noexcept;

[[nodiscard]] float unpack_float32(bytes_view payload) noexcept;
[[nodiscard]] double unpack_float64(bytes_view payload) noexcept;

/**
 * @brief 校验 `H` 文本（先 UTF-8，再十进制语法）。
 *
 * 返回 decode_errc::invalid_utf8 或 decode_errc::invalid_decimal。
 */
std::error_code parse_decimal_text(bytes_view text, ubj::format::Decimal& out) noexcept;

}  // namespace ubj::codec
