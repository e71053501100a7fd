#include "ubj/format/value.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace ubj::format {
namespace {

using work_list = std::vector<std::pair<const Value*, const Value*>>;

[[nodiscard]] double numeric_of(const Value& v) noexcept {
  if (const auto* f = v.get_if<float>()) {
    return static_cast<double>(*f);
  }
  return *v.get_if<double>();
}

[[nodiscard]] bool is_float_kind(value_kind k) noexcept {
  return k == value_kind::float32 || k == value_kind::float64;
}

bool push_object_pairs(const Object& lhs, const Object& rhs, work_list& work) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (const auto& [key, value] : lhs) {
    const auto* other = rhs.find(key);
    if (other == nullptr) {
      return false;
    }
    work.emplace_back(&value, other);
  }
  return true;
}

// 显式栈上的逐对比较：嵌套深度只消耗堆内存。
bool drain_equal(work_list& work) {
  while (!work.empty()) {
    const auto [a, b] = work.back();
    work.pop_back();

    const auto ka = a->kind();
    const auto kb = b->kind();
    if (is_float_kind(ka) && is_float_kind(kb)) {
      if (numeric_of(*a) != numeric_of(*b)) {
        return false;
      }
      continue;
    }
    if (ka != kb) {
      return false;
    }

    switch (ka) {
      case value_kind::null:
        break;
      case value_kind::boolean:
        if (*a->get_if<bool>() != *b->get_if<bool>()) {
          return false;
        }
        break;
      case value_kind::integer:
        if (*a->get_if<std::int64_t>() != *b->get_if<std::int64_t>()) {
          return false;
        }
        break;
      case value_kind::decimal:
        if (*a->get_if<Decimal>() != *b->get_if<Decimal>()) {
          return false;
        }
        break;
      case value_kind::string:
        if (*a->get_if<std::string>() != *b->get_if<std::string>()) {
          return false;
        }
        break;
      case value_kind::bytes:
        if (*a->get_if<Bytes>() != *b->get_if<Bytes>()) {
          return false;
        }
        break;
      case value_kind::array: {
        const auto* la = a->as_array();
        const auto* lb = b->as_array();
        if (la == lb) {
          break;
        }
        if (la->size() != lb->size()) {
          return false;
        }
        for (std::size_t i = 0; i < la->size(); ++i) {
          work.emplace_back(&(*la)[i], &(*lb)[i]);
        }
        break;
      }
      case value_kind::object: {
        const auto* oa = a->as_object();
        const auto* ob = b->as_object();
        if (oa == ob) {
          break;
        }
        if (!push_object_pairs(*oa, *ob, work)) {
          return false;
        }
        break;
      }
      case value_kind::extension:
        if (a->identity() != b->identity()) {
          return false;
        }
        break;
      default:
        return false;
    }
  }
  return true;
}

}  // namespace

std::string_view to_string(value_kind kind) noexcept {
  switch (kind) {
    case value_kind::null:
      return "null";
    case value_kind::boolean:
      return "bool";
    case value_kind::integer:
      return "integer";
    case value_kind::decimal:
      return "decimal";
    case value_kind::float32:
      return "float32";
    case value_kind::float64:
      return "float64";
    case value_kind::string:
      return "string";
    case value_kind::bytes:
      return "bytes";
    case value_kind::array:
      return "array";
    case value_kind::object:
      return "object";
    case value_kind::extension:
      return "extension";
  }
  return "unknown";
}

Value::~Value() { release_children(); }

Value::Value(Value&& other) noexcept : storage_(std::exchange(other.storage_, storage_type{})) {}

Value& Value::operator=(Value&& other) noexcept {
  if (this != &other) {
    storage_ = std::exchange(other.storage_, storage_type{});
  }
  return *this;
}

/*
 * 非递归析构：
 * - 只有当本 Value 是容器的唯一持有者时才需要拆解（共享容器由最后一个持有者负责）；
 * - 把子容器逐个“搬”到 pending 栈上，再由循环依次拆解，
 *   每个子 Value 真正析构时其容器已为空，不会再向下递归。
 */
void Value::release_children() noexcept {
  if (!is_container()) {
    return;
  }

  std::vector<Value> pending;
  const auto harvest = [&pending](Value& v) {
    if (auto* arr = v.get_if<std::shared_ptr<Array>>(); arr != nullptr && *arr && arr->use_count() == 1) {
      for (auto& child : **arr) {
        if (child.is_container()) {
          pending.push_back(std::move(child));
        }
      }
      (*arr)->clear();
    } else if (auto* obj = v.get_if<std::shared_ptr<Object>>(); obj != nullptr && *obj && obj->use_count() == 1) {
      for (auto& entry : (*obj)->entries_) {
        if (entry.second.is_container()) {
          pending.push_back(std::move(entry.second));
        }
      }
      (*obj)->clear();
    }
  };

  harvest(*this);
  while (!pending.empty()) {
    Value next = std::move(pending.back());
    pending.pop_back();
    harvest(next);
  }
}

Value Value::boolean(bool v) { return Value{storage_type{std::in_place_type<bool>, v}}; }

Value Value::integer(std::int64_t v) { return Value{storage_type{std::in_place_type<std::int64_t>, v}}; }

Value Value::from_unsigned(std::uint64_t v) {
  if (v > static_cast<std::uint64_t>(INT64_MAX)) {
    return decimal(Decimal::from_unsigned(v));
  }
  return integer(static_cast<std::int64_t>(v));
}

Value Value::decimal(Decimal v) { return Value{storage_type{std::in_place_type<Decimal>, std::move(v)}}; }

Value Value::float32(float v) { return Value{storage_type{std::in_place_type<float>, v}}; }

Value Value::float64(double v) { return Value{storage_type{std::in_place_type<double>, v}}; }

Value Value::string(std::string v) { return Value{storage_type{std::in_place_type<std::string>, std::move(v)}}; }

Value Value::bytes(Bytes v) { return Value{storage_type{std::in_place_type<Bytes>, std::move(v)}}; }

Value Value::array(Array v) { return shared(std::make_shared<Array>(std::move(v))); }

Value Value::object(Object v) { return shared(std::make_shared<Object>(std::move(v))); }

Value Value::object() { return shared(std::make_shared<Object>()); }

Value Value::shared(std::shared_ptr<Array> v) {
  return Value{storage_type{std::in_place_type<std::shared_ptr<Array>>, std::move(v)}};
}

Value Value::shared(std::shared_ptr<Object> v) {
  return Value{storage_type{std::in_place_type<std::shared_ptr<Object>>, std::move(v)}};
}

Value Value::extension(std::shared_ptr<const Extension> v) {
  return Value{storage_type{std::in_place_type<std::shared_ptr<const Extension>>, std::move(v)}};
}

Array* Value::as_array() const noexcept {
  if (const auto* p = std::get_if<std::shared_ptr<Array>>(&storage_)) {
    return p->get();
  }
  return nullptr;
}

Object* Value::as_object() const noexcept {
  if (const auto* p = std::get_if<std::shared_ptr<Object>>(&storage_)) {
    return p->get();
  }
  return nullptr;
}

const void* Value::identity() const noexcept {
  return std::visit(
    [](const auto& v) -> const void* {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::shared_ptr<Array>> || std::is_same_v<T, std::shared_ptr<Object>> ||
                    std::is_same_v<T, std::shared_ptr<const Extension>>) {
        return v.get();
      } else {
        return nullptr;
      }
    },
    storage_);
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  work_list work;
  work.emplace_back(&lhs, &rhs);
  return drain_equal(work);
}

Object::Object(std::initializer_list<entry_type> entries) {
  reserve(entries.size());
  for (const auto& e : entries) {
    insert_or_assign(e.first, e.second);
  }
}

bool Object::insert_or_assign(std::string key, Value value) {
  const auto [it, inserted] = index_.try_emplace(key, entries_.size());
  if (!inserted) {
    entries_[it->second].second = std::move(value);
    return false;
  }
  entries_.emplace_back(std::move(key), std::move(value));
  return true;
}

const Value* Object::find(std::string_view key) const noexcept {
  const auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

Value* Object::find(std::string_view key) noexcept {
  const auto* v = static_cast<const Object&>(*this).find(key);
  return const_cast<Value*>(v);
}

void Object::reserve(std::size_t n) {
  entries_.reserve(n);
  index_.reserve(n);
}

void Object::clear() noexcept {
  entries_.clear();
  index_.clear();
}

std::vector<const Object::entry_type*> Object::sorted_entries() const {
  std::vector<const entry_type*> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    out.push_back(&e);
  }
  // std::string 按 char 比较；转为无符号字节比较，保证 UTF-8 字节序 == 码点序。
  std::sort(out.begin(), out.end(), [](const entry_type* a, const entry_type* b) {
    return std::lexicographical_compare(
      a->first.begin(), a->first.end(), b->first.begin(), b->first.end(),
      [](char x, char y) { return static_cast<unsigned char>(x) < static_cast<unsigned char>(y); });
  });
  return out;
}

bool operator==(const Object& lhs, const Object& rhs) noexcept {
  if (&lhs == &rhs) {
    return true;
  }
  work_list work;
  if (!push_object_pairs(lhs, rhs, work)) {
    return false;
  }
  return drain_equal(work);
}

}  // namespace ubj::format
