#include "ubj/core/log.hpp"

#include <spdlog/spdlog.h>

namespace ubj::core {
namespace {

// LogLevel 与 spdlog::level::level_enum 取值一一对应，直接转换。
static_assert(static_cast<int>(LogLevel::trace) == spdlog::level::trace);
static_assert(static_cast<int>(LogLevel::debug) == spdlog::level::debug);
static_assert(static_cast<int>(LogLevel::info) == spdlog::level::info);
static_assert(static_cast<int>(LogLevel::warn) == spdlog::level::warn);
static_assert(static_cast<int>(LogLevel::error) == spdlog::level::err);
static_assert(static_cast<int>(LogLevel::critical) == spdlog::level::critical);
static_assert(static_cast<int>(LogLevel::off) == spdlog::level::off);

} // namespace

void set_log_level(LogLevel level) noexcept {
    if (level > LogLevel::off) {
        level = LogLevel::off;
    }
    // 只调整全局级别；sink/pattern 仍由业务侧配置。
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
}

LogLevel log_level() noexcept {
    const auto level = spdlog::get_level();
    if (level < spdlog::level::trace || level > spdlog::level::off) {
        return LogLevel::off;
    }
    return static_cast<LogLevel>(level);
}

bool debug_enabled() noexcept { return spdlog::should_log(spdlog::level::debug); }

} // namespace ubj::core
