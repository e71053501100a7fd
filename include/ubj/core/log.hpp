#pragma once

#include <cstdint>

namespace ubj::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 编解码内部只在 debug/trace 级别输出诊断（错误偏移、环引用、fallback 调用等），
 *   默认 info 级别下保持静默；
 * - spdlog 类型不出现在 public headers 中，业务侧通过 set_log_level 调整全局级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief 当前级别是否会输出 debug 日志。
 *
 * 供热路径在拼装较重的诊断字符串（例如 dump_value）前先行判断。
 */
[[nodiscard]] bool debug_enabled() noexcept;

} // namespace ubj::core
