#include "ubj/codec/decoder.hpp"
#include "ubj/core/error.hpp"
#include "ubj/format/value.hpp"
#include "ubj/io/source.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace std::string_view_literals;

using ubj::codec::DecodeOptions;
using ubj::codec::Decoder;
using ubj::codec::Entry;
using ubj::codec::decode;
using ubj::codec::decode_errc;
using ubj::codec::decode_one;
using ubj::format::Array;
using ubj::format::Bytes;
using ubj::format::Decimal;
using ubj::format::Object;
using ubj::format::Value;
using ubj::format::byte;
using ubj::format::bytes_view;
using ubj::format::value_kind;

bytes_view view_of(std::string_view s) {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

Value decode_ok(std::string_view in, const DecodeOptions& options = {}) {
  Value out;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(decode_one(view_of(in), out, consumed, options));
  TEST_EXPECT_EQ(consumed, in.size());
  return out;
}

std::error_code decode_err(std::string_view in, const DecodeOptions& options = {}) {
  Value out = Value::string("untouched");
  std::size_t consumed = 0;
  const auto ec = decode_one(view_of(in), out, consumed, options);
  TEST_EXPECT(ec);
  // 失败时不返回部分结果。
  TEST_EXPECT_EQ(out, Value::string("untouched"));
  return ec;
}

void test_scalars() {
  TEST_EXPECT(decode_ok("Z").is_null());
  TEST_EXPECT_EQ(decode_ok("T"), Value::boolean(true));
  TEST_EXPECT_EQ(decode_ok("F"), Value::boolean(false));
  TEST_EXPECT_EQ(decode_ok("U\xff"), Value::integer(255));
  TEST_EXPECT_EQ(decode_ok("i\xff"), Value::integer(-1));
  TEST_EXPECT_EQ(decode_ok("I\x01\x00"sv), Value::integer(256));
  TEST_EXPECT_EQ(decode_ok("l\x80\x00\x00\x00"sv), Value::integer(-2147483648LL));
  TEST_EXPECT_EQ(decode_ok("L\x00\x00\x00\x01\x00\x00\x00\x00"sv), Value::integer(4294967296LL));

  const auto f32 = decode_ok("d\x3f\xc0\x00\x00"sv);
  TEST_EXPECT_EQ(f32.kind(), value_kind::float32);
  TEST_EXPECT_EQ(*f32.get_if<float>(), 1.5f);

  const auto f64 = decode_ok("D\xc0\x04\x00\x00\x00\x00\x00\x00"sv);
  TEST_EXPECT_EQ(f64.kind(), value_kind::float64);
  TEST_EXPECT_EQ(*f64.get_if<double>(), -2.5);

  TEST_EXPECT_EQ(decode_ok("Ca"), Value::string("a"));
  TEST_EXPECT_EQ(decode_ok("SU\x02" "ab"), Value::string("ab"));
  TEST_EXPECT_EQ(decode_ok("SU\x00"sv), Value::string(""));
  TEST_EXPECT_EQ(decode_ok("SI\x00\x03xyz"sv), Value::string("xyz"));
}

void test_high_precision() {
  const auto big = decode_ok("HU\x14" "18446744073709551616");
  TEST_EXPECT_EQ(big.kind(), value_kind::decimal);
  TEST_EXPECT_EQ(big.get_if<Decimal>()->to_string(), "18446744073709551616");

  const auto nan = decode_ok("HU\x03NaN");
  TEST_EXPECT(nan.get_if<Decimal>()->is_nan());

  const auto inf = decode_ok("HU\x09-Infinity");
  TEST_EXPECT_EQ(inf.get_if<Decimal>()->to_string(), "-Infinity");

  TEST_EXPECT_ERR(decode_err("HU\x03" "abc"), decode_errc::invalid_decimal);
  TEST_EXPECT_ERR(decode_err("HU\x00"sv), decode_errc::invalid_decimal);
  TEST_EXPECT_ERR(decode_err("HU\x02\xff\xfe"), decode_errc::invalid_utf8);
}

void test_trailing_bytes_ignored() {
  Value out;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(decode_one(view_of("TTTTT"), out, consumed));
  TEST_EXPECT_EQ(out, Value::boolean(true));
  TEST_EXPECT_EQ(consumed, 1u);
}

void test_invalid_inputs() {
  TEST_EXPECT_ERR(decode_err(""), decode_errc::no_input);
  TEST_EXPECT_ERR(decode_err("A"), decode_errc::invalid_marker);
  TEST_EXPECT_ERR(decode_err("]"), decode_errc::invalid_marker);
  TEST_EXPECT_ERR(decode_err("N"), decode_errc::invalid_marker);
  TEST_EXPECT_ERR(decode_err("[A]"), decode_errc::invalid_container_marker);
  TEST_EXPECT_ERR(decode_err("[}"), decode_errc::invalid_container_marker);
  TEST_EXPECT_ERR(decode_err("{U\x01" "a]"), decode_errc::invalid_container_marker);
  TEST_EXPECT_ERR(decode_err("{Sa"), decode_errc::integer_marker_expected);
  TEST_EXPECT_ERR(decode_err("Sd"), decode_errc::integer_marker_expected);
  TEST_EXPECT_ERR(decode_err("Si\xff"), decode_errc::negative_length);
  TEST_EXPECT_ERR(decode_err("[#i\xfe"), decode_errc::negative_length);
  TEST_EXPECT_ERR(decode_err("[$U]"), decode_errc::type_without_count);
  TEST_EXPECT_ERR(decode_err("[$N#U\x01"), decode_errc::invalid_container_type);
  TEST_EXPECT_ERR(decode_err("[$]#U\x01"), decode_errc::invalid_container_type);
  TEST_EXPECT_ERR(decode_err("SU\x02\xc3"), decode_errc::insufficient_input);
  TEST_EXPECT_ERR(decode_err("SU\x01\xff"), decode_errc::invalid_utf8);
  TEST_EXPECT_ERR(decode_err("C\xc3"), decode_errc::invalid_utf8);
  TEST_EXPECT_ERR(decode_err("{U\x01\xff" "Z}"), decode_errc::invalid_utf8);
}

void test_insufficient_input() {
  const std::string_view truncated[] = {"U", "I\x01", "l\x00\x00"sv, "d\x00"sv, "D", "S", "SU", "SU\x05" "abc",
                                        "[", "[T", "{", "{U", "{U\x01", "{U\x01" "a", "[#", "[#U\x02T",
                                        "[$", "[$T", "[$U#U\x04\x01\x02", "H", "HU\x02" "1", "C"};
  for (const auto in : truncated) {
    TEST_EXPECT_ERR(decode_err(in), decode_errc::insufficient_input);
  }
}

void test_untyped_containers() {
  TEST_EXPECT_EQ(decode_ok("[]"), Value::array());
  TEST_EXPECT_EQ(decode_ok("{}"), Value::object());
  TEST_EXPECT_EQ(decode_ok("[TFZ]"), Value::array({Value::boolean(true), Value::boolean(false), Value::null()}));

  const auto obj = decode_ok("{U\x01" "aU\x01U\x01" "bU\x02}");
  TEST_EXPECT_EQ(obj, Value::object(Object{{"a", Value::integer(1)}, {"b", Value::integer(2)}}));

  // 后出现的重复键覆盖先前的值。
  const auto dup = decode_ok("{U\x01" "aU\x01U\x01" "aU\x02}");
  TEST_EXPECT_EQ(dup.as_object()->size(), 1u);
  TEST_EXPECT_EQ(*dup.as_object()->find("a"), Value::integer(2));
}

void test_counted_containers() {
  TEST_EXPECT_EQ(decode_ok("[#U\x00"sv), Value::array());
  TEST_EXPECT_EQ(decode_ok("[#U\x02TF"), Value::array({Value::boolean(true), Value::boolean(false)}));
  TEST_EXPECT_EQ(decode_ok("{#U\x01U\x01" "aZ"), Value::object(Object{{"a", Value::null()}}));

  // 声明数量之后不再需要结束标记；剩余字节不被消费。
  Value out;
  std::size_t consumed = 0;
  TEST_EXPECT_OK(decode_one(view_of("[#U\x01T]"), out, consumed));
  TEST_EXPECT_EQ(consumed, 5u);
}

void test_typed_containers() {
  TEST_EXPECT_EQ(decode_ok("[$i#U\x03\x01\x02\xff"),
                 Value::array({Value::integer(1), Value::integer(2), Value::integer(-1)}));
  TEST_EXPECT_EQ(decode_ok("{$U#U\x02U\x01" "a\x05U\x01" "b\x06"),
                 Value::object(Object{{"a", Value::integer(5)}, {"b", Value::integer(6)}}));

  // 元素类型为容器：起始标记被省略。
  TEST_EXPECT_EQ(decode_ok("[$[#U\x02#U\x01T#U\x00"sv),
                 Value::array({Value::array({Value::boolean(true)}), Value::array()}));
  TEST_EXPECT_EQ(decode_ok("[$S#U\x02U\x01xU\x02yz"), Value::array({Value::string("x"), Value::string("yz")}));
}

void test_no_data_repetition() {
  const auto nulls = decode_ok("[$Z#U\x04");
  TEST_EXPECT_EQ(nulls.as_array()->size(), 4u);
  TEST_EXPECT_EQ(nulls, Value::array({Value::null(), Value::null(), Value::null(), Value::null()}));

  const auto trues = decode_ok("[$T#I\x01\x00"sv);
  TEST_EXPECT_EQ(trues.as_array()->size(), 256u);
  TEST_EXPECT_EQ(trues.as_array()->back(), Value::boolean(true));

  const auto obj = decode_ok("{$F#U\x02U\x01xU\x01y");
  TEST_EXPECT_EQ(obj, Value::object(Object{{"x", Value::boolean(false)}, {"y", Value::boolean(false)}}));
}

void test_bytes_shortcut() {
  const auto b = decode_ok("[$U#U\x03\x01\x02\xff");
  TEST_EXPECT_EQ(b.kind(), value_kind::bytes);
  TEST_EXPECT_EQ(*b.get_if<Bytes>(), (Bytes{0x01, 0x02, 0xFF}));

  DecodeOptions as_list;
  as_list.no_bytes = true;
  const auto l = decode_ok("[$U#U\x03\x01\x02\xff", as_list);
  TEST_EXPECT_EQ(l, Value::array({Value::integer(1), Value::integer(2), Value::integer(255)}));

  // object 中的 `$U` 总是整数。
  const auto obj = decode_ok("{$U#U\x01U\x01k\x09");
  TEST_EXPECT_EQ(*obj.as_object()->find("k"), Value::integer(9));
}

void test_noop_handling() {
  TEST_EXPECT_EQ(decode_ok("[NTNNFN]"), decode_ok("[TF]"));
}

void test_noop_rules() {
  TEST_EXPECT_EQ(decode_ok("[NNTN]"), Value::array({Value::boolean(true)}));
  TEST_EXPECT_EQ(decode_ok("{NU\x01" "aTN}"), Value::object(Object{{"a", Value::boolean(true)}}));

  TEST_EXPECT_ERR(decode_err("[#U\x02NTT"), decode_errc::noop_in_typed_container);
  TEST_EXPECT_ERR(decode_err("{#U\x01NU\x01" "aT"), decode_errc::noop_in_typed_container);
  TEST_EXPECT_ERR(decode_err("{#U\x01U\x01" "aN"), decode_errc::noop_in_typed_container);
  // key 与 value 之间不允许 no-op。
  TEST_EXPECT_ERR(decode_err("{U\x01" "aNT}"), decode_errc::invalid_container_marker);
}

void test_object_hook() {
  DecodeOptions options;
  options.object_hook = [](Object&& obj, Value& out) -> std::error_code {
    out = Value::integer(static_cast<std::int64_t>(obj.size()));
    return {};
  };
  TEST_EXPECT_EQ(decode_ok("[{U\x01" "aT}{}]", options), Value::array({Value::integer(1), Value::integer(0)}));
}

void test_object_pairs_hook_wins() {
  DecodeOptions options;
  options.object_hook = [](Object&&, Value& out) -> std::error_code {
    out = Value::string("object_hook");
    return {};
  };
  options.object_pairs_hook = [](std::vector<Entry>&& pairs, Value& out) -> std::error_code {
    Array keys;
    for (auto& [key, value] : pairs) {
      keys.push_back(Value::string(key));
    }
    out = Value::array(std::move(keys));
    return {};
  };
  // 重复键在 pairs 中保留，并保持出现顺序。
  TEST_EXPECT_EQ(decode_ok("{U\x01" "bTU\x01" "aFU\x01" "bZ}", options),
                 Value::array({Value::string("b"), Value::string("a"), Value::string("b")}));
}

void test_hook_failure() {
  DecodeOptions options;
  options.object_hook = [](Object&&, Value&) -> std::error_code {
    return make_error_code(decode_errc::hook_failed);
  };
  TEST_EXPECT_ERR(decode_err("{}", options), decode_errc::hook_failed);
}

void test_allocation_failure_maps_to_buffer_overflow() {
  DecodeOptions options;
  options.object_hook = [](Object&&, Value&) -> std::error_code { throw std::bad_alloc(); };

  const auto in = "[{}]"sv;
  ubj::io::BytesSource source(view_of(in));
  Decoder decoder(source, options);
  Value out;
  TEST_EXPECT_ERR(decoder.decode(out), ubj::core::errc::buffer_overflow);
  TEST_EXPECT_EQ(decoder.error_context(), std::string_view("allocation"));

  // 失败后解码器可继续使用（帧栈已清空）。
  const auto next = "[i\x05]"sv;
  ubj::io::BytesSource again(view_of(next));
  Decoder plain(again);
  TEST_EXPECT_OK(plain.decode(out));
  TEST_EXPECT_EQ(out.kind(), value_kind::array);
}

void test_intern_object_keys() {
  DecodeOptions options;
  options.intern_object_keys = true;
  const std::string_view doc = "[{U\x01kT}{U\x01kF}]";
  TEST_EXPECT_EQ(decode_ok(doc, options), decode_ok(doc));

  // 非法键不会因为缓存而被放过。
  TEST_EXPECT_ERR(decode_err("[{U\x01kT}{U\x01\xffT}]", options), decode_errc::invalid_utf8);
}

void test_max_depth() {
  DecodeOptions options;
  options.max_depth = 2;
  TEST_EXPECT_EQ(decode_ok("[[]]", options), Value::array({Value::array()}));
  TEST_EXPECT_ERR(decode_err("[[[]]]", options), ubj::core::errc::depth_exceeded);
}

void test_deep_nesting_without_recursion() {
  constexpr std::size_t kDepth = 100000;
  std::string doc(kDepth, '[');
  doc.append(kDepth, ']');

  const auto v = decode_ok(doc);
  std::size_t depth = 0;
  const Value* cur = &v;
  while (cur->as_array() != nullptr && !cur->as_array()->empty()) {
    cur = &cur->as_array()->front();
    ++depth;
  }
  TEST_EXPECT_EQ(depth, kDepth - 1);
}

void test_hostile_lengths() {
  // 声明 2^62 字节的字符串但没有数据：必须干净地失败而不是先分配。
  TEST_EXPECT_ERR(decode_err("SL\x40\x00\x00\x00\x00\x00\x00\x00"sv), decode_errc::insufficient_input);
  TEST_EXPECT_ERR(decode_err("[$U#L\x40\x00\x00\x00\x00\x00\x00\x00"sv), decode_errc::insufficient_input);
  TEST_EXPECT_ERR(decode_err("[#L\x40\x00\x00\x00\x00\x00\x00\x00T"sv), decode_errc::insufficient_input);
  TEST_EXPECT_ERR(decode_err("[$Z#L\x40\x00\x00\x00\x00\x00\x00\x00"sv), ubj::core::errc::buffer_overflow);
}

void test_error_offset_and_context() {
  const std::string_view doc = "[U\x01SU\x05" "ab";
  ubj::io::BytesSource source(view_of(doc));
  Decoder decoder(source);
  Value out;
  TEST_EXPECT_ERR(decoder.decode(out), decode_errc::insufficient_input);
  TEST_EXPECT_EQ(decoder.error_offset(), doc.size());
  TEST_EXPECT_EQ(decoder.error_context(), "string");

  ubj::io::BytesSource bad(view_of("[TTX]"));
  Decoder decoder2(bad);
  TEST_EXPECT_ERR(decoder2.decode(out), decode_errc::invalid_container_marker);
  TEST_EXPECT_EQ(decoder2.error_offset(), 4u);
}

void test_back_to_back_documents() {
  const std::string_view stream = "TU\x05[Z]SU\x02hi";
  ubj::io::BytesSource source(view_of(stream));
  Decoder decoder(source);

  Value out;
  TEST_EXPECT_OK(decoder.decode(out));
  TEST_EXPECT_EQ(out, Value::boolean(true));
  TEST_EXPECT_OK(decoder.decode(out));
  TEST_EXPECT_EQ(out, Value::integer(5));
  TEST_EXPECT_OK(decoder.decode(out));
  TEST_EXPECT_EQ(out, Value::array({Value::null()}));
  TEST_EXPECT_OK(decoder.decode(out));
  TEST_EXPECT_EQ(out, Value::string("hi"));
  TEST_EXPECT_EQ(source.remaining(), 0u);
  TEST_EXPECT_ERR(decoder.decode(out), decode_errc::no_input);

  ubj::io::BytesSource again(view_of(stream));
  TEST_EXPECT_OK(decode(again, out));
  TEST_EXPECT_EQ(again.position(), 1u);
}

void test_all_two_byte_inputs() {
  // 任意 1/2 字节输入：要么成功，要么返回错误；不崩溃、不越界、不挂起。
  for (int a = 0; a < 256; ++a) {
    for (int b = -1; b < 256; ++b) {
      std::string in(1, static_cast<char>(a));
      if (b >= 0) {
        in.push_back(static_cast<char>(b));
      }
      Value out;
      std::size_t consumed = 0;
      const auto ec = decode_one(view_of(in), out, consumed);
      if (!ec) {
        TEST_EXPECT(consumed >= 1u && consumed <= in.size());
      }
    }
  }
}

}  // namespace

int main() {
  test_scalars();
  test_high_precision();
  test_trailing_bytes_ignored();
  test_invalid_inputs();
  test_insufficient_input();
  test_untyped_containers();
  test_counted_containers();
  test_typed_containers();
  test_no_data_repetition();
  test_bytes_shortcut();
  test_noop_handling();
  test_noop_rules();
  test_object_hook();
  test_object_pairs_hook_wins();
  test_hook_failure();
  test_allocation_failure_maps_to_buffer_overflow();
  test_intern_object_keys();
  test_max_depth();
  test_deep_nesting_without_recursion();
  test_hostile_lengths();
  test_error_offset_and_context();
  test_back_to_back_documents();
  test_all_two_byte_inputs();
  return ::ubj::tests::run_and_report();
}
