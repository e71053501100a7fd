#include "ubj/core/buffer.hpp"
#include "ubj/core/error.hpp"

#include "test_main.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace {

using ubj::core::FixedBuffer;
using ubj::core::byte;
using ubj::core::bytes_view;
using ubj::core::errc;
using ubj::core::make_error_code;
using ubj::core::mutable_bytes_view;

bytes_view as_bytes(std::string_view s) {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

std::string_view as_text(bytes_view b) {
  return std::string_view(reinterpret_cast<const char*>(b.data()), b.size());
}

void test_append_consume_basic() {
  FixedBuffer buf(16);
  TEST_EXPECT(buf.empty());
  TEST_EXPECT_EQ(buf.size(), 0u);

  TEST_EXPECT_OK(buf.append(as_bytes("hello")));
  TEST_EXPECT_EQ(buf.size(), 5u);
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "hello");

  TEST_EXPECT_OK(buf.consume(2));
  TEST_EXPECT_EQ(buf.size(), 3u);

  TEST_EXPECT_OK(buf.append(as_bytes("!")));
  TEST_EXPECT_EQ(buf.size(), 4u);

  TEST_EXPECT_OK(buf.consume(4));
  TEST_EXPECT(buf.empty());
}

void test_compact_on_append() {
  FixedBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("abcdef")));
  TEST_EXPECT_OK(buf.consume(4));  // 剩下 "ef"

  // 尾部只剩 2 字节：append 需要先回收已读前缀。
  TEST_EXPECT_OK(buf.append(as_bytes("WXYZ")));
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "efWXYZ");
  TEST_EXPECT_EQ(buf.capacity(), 8u);
}

void test_grow_preserve_data() {
  FixedBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("12345678")));
  TEST_EXPECT_OK(buf.append(as_bytes("9")));  // 触发扩容（grow）

  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "123456789");
  TEST_EXPECT(buf.capacity() >= 9u);
}

void test_grow_beyond_inline_storage() {
  FixedBuffer buf(16);
  const std::string big(ubj::core::kDefaultFixedBufferCapacity + 100, 'x');
  TEST_EXPECT_OK(buf.append(as_bytes(big)));
  TEST_EXPECT_EQ(buf.size(), big.size());
  TEST_EXPECT(buf.capacity() >= big.size());
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), big);
}

void test_prepare_commit() {
  FixedBuffer buf(8);
  mutable_bytes_view w{};
  TEST_EXPECT_OK(buf.prepare(4, w));
  TEST_EXPECT(w.size() >= 4u);
  w[0] = static_cast<byte>('t');
  w[1] = static_cast<byte>('e');
  w[2] = static_cast<byte>('s');
  w[3] = static_cast<byte>('t');
  TEST_EXPECT_OK(buf.commit(4));
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "test");
}

void test_take() {
  FixedBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("abcde")));

  std::array<byte, 3> out{};
  TEST_EXPECT_EQ(buf.take(mutable_bytes_view{out}), 3u);
  TEST_EXPECT_EQ(as_text(bytes_view{out}), "abc");
  TEST_EXPECT_EQ(buf.size(), 2u);

  TEST_EXPECT_EQ(buf.take(mutable_bytes_view{out}), 2u);
  TEST_EXPECT_EQ(as_text(bytes_view{out.data(), 2}), "de");
  TEST_EXPECT(buf.empty());

  TEST_EXPECT_EQ(buf.take(mutable_bytes_view{out}), 0u);
}

void test_bounds() {
  FixedBuffer buf(4);
  TEST_EXPECT_OK(buf.append(as_bytes("abcd")));

  auto ec = buf.consume(5);
  TEST_EXPECT_EQ(ec, make_error_code(errc::invalid_argument));

  ec = buf.commit(1);
  TEST_EXPECT_EQ(ec, make_error_code(errc::invalid_argument));
}

void test_clear() {
  FixedBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("data")));
  buf.clear();
  TEST_EXPECT(buf.empty());
  TEST_EXPECT_EQ(buf.readable_bytes().size(), 0u);
}

void test_zero_operations() {
  FixedBuffer buf(8);
  TEST_EXPECT_OK(buf.commit(0));
  TEST_EXPECT_OK(buf.consume(0));
  TEST_EXPECT_OK(buf.append(bytes_view{}));
}

void test_max_capacity_append_rejects() {
  FixedBuffer buf(4, 8);
  TEST_EXPECT_OK(buf.append(as_bytes("1234")));
  auto ec = buf.append(as_bytes("56789"));  // total=9 > max=8
  TEST_EXPECT_EQ(ec, make_error_code(errc::buffer_overflow));
  // 失败不破坏已有数据。
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "1234");
}

void test_max_capacity_zero_rejects_growth() {
  FixedBuffer buf(16, 0);
  TEST_EXPECT_EQ(buf.capacity(), 0u);
  auto ec = buf.append(as_bytes("a"));
  TEST_EXPECT_EQ(ec, make_error_code(errc::buffer_overflow));
}

void test_prepare_huge_rejects() {
  FixedBuffer buf(8, 64);
  mutable_bytes_view w{};
  auto ec = buf.prepare(std::numeric_limits<std::size_t>::max(), w);
  TEST_EXPECT_EQ(ec, make_error_code(errc::buffer_overflow));
}

}  // namespace

int main() {
  test_append_consume_basic();
  test_compact_on_append();
  test_grow_preserve_data();
  test_grow_beyond_inline_storage();
  test_prepare_commit();
  test_take();
  test_bounds();
  test_clear();
  test_zero_operations();
  test_max_capacity_append_rejects();
  test_max_capacity_zero_rejects_growth();
  test_prepare_huge_rejects();
  return ::ubj::tests::run_and_report();
}
