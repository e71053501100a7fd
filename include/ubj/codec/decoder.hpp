#pragma once

#include "ubj/codec/errors.hpp"
#include "ubj/format/value.hpp"
#include "ubj/io/source.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace ubj::codec {

using Entry = ubj::format::Object::entry_type;

/**
 * @brief object 解码完成后的替换回调：接收完整的 Object，产出替代值。
 *
 * 回调返回的错误会中止解码并原样返回（通用失败请使用 decode_errc::hook_failed）。
 */
using ObjectHook = std::function<std::error_code(ubj::format::Object&& object, ubj::format::Value& out)>;

/**
 * @brief 与 ObjectHook 相同，但接收按出现顺序排列的键值对（重复键不合并）。
 *
 * 同时设置两个回调时只调用 pairs 回调。
 */
using ObjectPairsHook = std::function<std::error_code(std::vector<Entry>&& pairs, ubj::format::Value& out)>;

struct DecodeOptions final {
  // `[$U#n` 解码为 n 个整数组成的 Array，而不是 Bytes。
  bool no_bytes{false};
  // 复用已校验过的 object 键文本（同一文档内重复键很多时减少 UTF-8 校验）。
  bool intern_object_keys{false};
  // 最大容器嵌套深度；0 表示不限制（只受内存约束）。
  std::size_t max_depth{0};
  ObjectHook object_hook{};
  ObjectPairsHook object_pairs_hook{};
};

/**
 * @brief 流式 UBJSON 解码器（显式容器栈，不递归）。
 *
 * 每次 decode() 从 source 读取恰好一个完整的值；之后的字节不会被消费，
 * 因此同一 source 上重复调用可以依次读出首尾相接的多个文档。
 * 失败时记录检测到错误时的字节偏移与上下文（并以 debug 级别写日志）。
 *
 * 错误：decode_errc::*；超过 max_depth 时为 core::errc::depth_exceeded；
 * source 返回的错误原样传递。
 */
class Decoder final {
 public:
  explicit Decoder(io::ByteSource& source, DecodeOptions options = {}) noexcept;

  std::error_code decode(ubj::format::Value& out) noexcept;

  // 最近一次失败时 source 的位置（已读取的字节数）。
  [[nodiscard]] std::size_t error_offset() const noexcept { return error_offset_; }
  // 最近一次失败时正在读取的内容（例如 "string"、"int16"、"object key"）。
  [[nodiscard]] std::string_view error_context() const noexcept { return error_context_; }

 private:
  // 容器帧：正在构造中的一个 array/object。
  struct Frame final {
    bool is_mapping{false};
    bool counted{false};
    ubj::format::byte declared_type{0};  // 0 表示未声明 `$`
    std::size_t remaining{0};            // counted 时尚未读取的元素数
    bool has_first_marker{false};        // 读取 `$`/`#` 时多读到的首个标记
    ubj::format::byte first_marker{0};
    ubj::format::Array items{};
    ubj::format::Object object{};
    std::vector<Entry> pairs{};  // 仅 object_pairs_hook 时使用
    std::string pending_key{};
  };

  std::error_code run(ubj::format::Value& out);
  std::error_code step(ubj::format::Value& value, bool& complete);
  std::error_code start_value(ubj::format::byte m, ubj::format::Value& value, bool& complete,
                              bool in_container);
  std::error_code open_container(bool is_mapping, ubj::format::Value& value, bool& complete);
  std::error_code finish_container(ubj::format::Value& value, bool& complete);
  void attach(ubj::format::Value&& value);

  std::error_code read_exact(ubj::format::mutable_bytes_view out, const char* context) noexcept;
  std::error_code read_marker(ubj::format::byte& m, const char* context) noexcept;
  std::error_code read_integer_payload(ubj::format::byte m, std::int64_t& out, const char* context) noexcept;
  std::error_code read_length(ubj::format::byte m, std::size_t& out, const char* context) noexcept;
  std::error_code read_text(std::size_t length, std::string& out, const char* context);
  std::error_code read_key(ubj::format::byte m, std::string& out);

  std::error_code fail(std::error_code ec, const char* context) noexcept;

  io::ByteSource& source_;
  DecodeOptions options_;
  std::vector<Frame> stack_{};
  std::unordered_set<std::string> interned_keys_{};
  std::size_t error_offset_{0};
  std::string_view error_context_{};
};

/**
 * @brief 从 source 解码一个值（等价于构造临时 Decoder 调用一次 decode）。
 */
std::error_code decode(io::ByteSource& source, ubj::format::Value& out, const DecodeOptions& options = {}) noexcept;

/**
 * @brief 从内存解码一个值；成功时 consumed 为该值占用的字节数（之后的字节被忽略）。
 */
std::error_code decode_one(ubj::format::bytes_view in,
                           ubj::format::Value& out,
                           std::size_t& consumed,
                           const DecodeOptions& options = {}) noexcept;

}  // namespace ubj::codec
