#pragma once

#include "ubj/codec/errors.hpp"
#include "ubj/format/value.hpp"
#include "ubj/io/sink.hpp"

#include <cstddef>
#include <functional>
#include <system_error>
#include <vector>

namespace ubj::codec {

/**
 * @brief 无法直接编码的值（Extension）的转换回调。
 *
 * 回调把 in 转换为可编码的 out 并返回成功；返回任何错误时编码以
 * encode_errc::fallback_failed 失败（原始错误码写入 debug 日志）。
 * 转换结果仍是 Extension 时不会再次调用回调，编码以 unsupported_type 失败。
 */
using EncodeFallback = std::function<std::error_code(const ubj::format::Value& in, ubj::format::Value& out)>;

struct EncodeOptions final {
  // 每个容器都写 `#` + 元素数量，并省略结束标记。
  bool container_count{false};
  // object 按键的 UTF-8 字节序输出（同一键集合得到逐字节相同的结果）。
  bool sort_keys{false};
  // 禁用 float32（0 除外）。
  bool no_float32{false};
  // 元素全部为同一个 null/true/false 的非空数组写为 `[$Z#n` 形式。
  bool compact_no_data_arrays{false};
  // 最大容器嵌套深度；0 表示不限制（只受内存约束）。
  std::size_t max_depth{0};
  EncodeFallback fallback{};
};

/**
 * @brief 把 value 编码为一个完整的 UBJSON 文档写入 sink。
 *
 * 容器遍历使用显式栈，不依赖调用栈深度；结束时对 sink 调用一次 flush()。
 * 失败时 sink 中可能残留不完整的数据（调用方应丢弃）。
 *
 * 错误：
 * - encode_errc::*：值无法表示为 UBJSON；
 * - core::errc::depth_exceeded：超过 max_depth；
 * - sink 返回的错误原样传递。
 */
std::error_code encode(const ubj::format::Value& value,
                       io::ByteSink& sink,
                       const EncodeOptions& options = {}) noexcept;

/**
 * @brief 编码并追加到 out；失败时 out 恢复为调用前的长度。
 */
std::error_code encode(const ubj::format::Value& value,
                       std::vector<ubj::format::byte>& out,
                       const EncodeOptions& options = {}) noexcept;

}  // namespace ubj::codec
