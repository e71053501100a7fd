#pragma once

#include "ubj/format/decimal.hpp"
#include "ubj/format/markers.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace ubj::format {

class Value;
class Object;

using Array = std::vector<Value>;
using Bytes = std::vector<byte>;

/**
 * @brief 编码器无法直接识别的用户类型（只能经由 EncodeOptions::fallback 转换后编码）。
 */
class Extension {
 public:
  virtual ~Extension() = default;

  [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;
};

enum class value_kind : std::uint8_t {
  null = 0,
  boolean,
  integer,
  decimal,
  float32,
  float64,
  string,
  bytes,
  array,
  object,
  extension,
};

[[nodiscard]] std::string_view to_string(value_kind kind) noexcept;

/**
 * @brief UBJSON 数据值（带标签的联合体）。
 *
 * 约定：
 * - Array/Object 通过 shared_ptr 持有：拷贝 Value 共享同一个容器（引用语义），
 *   因而同一子容器可以出现在文档多处，也可以（错误地）形成环；
 *   编码器以 identity() 做环检测。
 * - integer 只承载 int64 范围；超出范围的整数用 Decimal 表示（编码为 `H`）。
 * - string 必须是合法 UTF-8（编码时校验）。
 * - 析构是非递归的：极深的嵌套结构在释放时不会耗尽调用栈。
 */
class Value final {
 public:
  using storage_type = std::variant<std::monostate,
                                    bool,
                                    std::int64_t,
                                    Decimal,
                                    float,
                                    double,
                                    std::string,
                                    Bytes,
                                    std::shared_ptr<Array>,
                                    std::shared_ptr<Object>,
                                    std::shared_ptr<const Extension>>;

  Value() noexcept = default;
  ~Value();

  Value(const Value&) = default;
  Value& operator=(const Value&) = default;

  // 被移动后的 Value 置为 null（而不是悬空的空 shared_ptr）。
  Value(Value&& other) noexcept;
  Value& operator=(Value&& other) noexcept;

  static Value null() noexcept { return Value{}; }
  static Value boolean(bool v);
  static Value integer(std::int64_t v);
  // 大于 INT64_MAX 的无符号数转为 Decimal。
  static Value from_unsigned(std::uint64_t v);
  static Value decimal(Decimal v);
  static Value float32(float v);
  static Value float64(double v);
  static Value string(std::string v);
  static Value bytes(Bytes v);
  static Value array(Array v = {});
  static Value object(Object v);
  static Value object();
  static Value shared(std::shared_ptr<Array> v);
  static Value shared(std::shared_ptr<Object> v);
  static Value extension(std::shared_ptr<const Extension> v);

  [[nodiscard]] value_kind kind() const noexcept { return static_cast<value_kind>(storage_.index()); }

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_null() const noexcept { return kind() == value_kind::null; }
  [[nodiscard]] bool is_container() const noexcept {
    return kind() == value_kind::array || kind() == value_kind::object;
  }

  // 容器访问：非容器返回 nullptr。
  [[nodiscard]] Array* as_array() const noexcept;
  [[nodiscard]] Object* as_object() const noexcept;

  /**
   * @brief 容器的引用身份（共享同一容器的 Value 返回同一地址）；标量返回 nullptr。
   */
  [[nodiscard]] const void* identity() const noexcept;

  // 结构相等（非递归实现）；float32 与 float64 按数值比较，Extension 按身份比较。
  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  explicit Value(storage_type storage) noexcept : storage_(std::move(storage)) {}

  void release_children() noexcept;

  storage_type storage_{};
};

/**
 * @brief 保持插入顺序的字符串键映射（UBJSON object）。
 *
 * 重复插入同一个键时原位替换值（保留首次出现的位置），与字典语义一致。
 * 相等比较与键顺序无关。
 */
class Object final {
 public:
  using entry_type = std::pair<std::string, Value>;
  using container_type = std::vector<entry_type>;
  using const_iterator = container_type::const_iterator;

  Object() = default;
  Object(std::initializer_list<entry_type> entries);

  // 返回 true 表示新增键，false 表示替换已有键的值。
  bool insert_or_assign(std::string key, Value value);

  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] Value* find(std::string_view key) noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  void reserve(std::size_t n);
  void clear() noexcept;

  // 只提供只读遍历：键与 index_ 必须保持一致，修改值请通过 find()/insert_or_assign()。
  [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

  [[nodiscard]] const container_type& entries() const noexcept { return entries_; }

  /**
   * @brief 按键（UTF-8 字节序，即码点序）升序排列的条目指针。
   */
  [[nodiscard]] std::vector<const entry_type*> sorted_entries() const;

  friend bool operator==(const Object& lhs, const Object& rhs) noexcept;

 private:
  friend class Value;

  // 透明哈希：find(string_view) 不需要临时构造 std::string。
  struct key_hash final {
    using is_transparent = void;
    std::size_t operator()(std::string_view key) const noexcept { return std::hash<std::string_view>{}(key); }
  };

  container_type entries_;
  std::unordered_map<std::string, std::size_t, key_hash, std::equal_to<>> index_;
};

}  // namespace ubj::format
