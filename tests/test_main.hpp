#pragma once

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace ubj::tests {

inline int& failure_count() {
  static int count = 0;
  return count;
}

inline void record_failure(
  const char* file,
  int line,
  std::string_view message) {
  ++failure_count();
  std::cerr << file << ":" << line << ": " << message << "\n";
}

inline void expect_true(bool value, const char* expr, const char* file, int line) {
  if (value) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT failed: " << expr;
  record_failure(file, line, oss.str());
}

template <class T>
concept streamable = requires(std::ostream& os, const T& v) { os << v; };

// 失败信息附带两侧的值；byte 等窄整数按数字输出。
template <class T>
inline void append_value(std::ostringstream& oss, const T& v) {
  if constexpr (std::is_arithmetic_v<T>) {
    oss << +v;
  } else if constexpr (streamable<T>) {
    oss << v;
  } else {
    oss << "?";
  }
}

template <class L, class R>
inline void expect_eq(
  const L& lhs,
  const R& rhs,
  const char* lhs_expr,
  const char* rhs_expr,
  const char* file,
  int line) {
  if (lhs == rhs) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_EQ failed: (" << lhs_expr << ") != (" << rhs_expr << "): ";
  append_value(oss, lhs);
  oss << " vs ";
  append_value(oss, rhs);
  record_failure(file, line, oss.str());
}

inline void expect_ok(const std::error_code& ec, const char* expr, const char* file, int line) {
  if (!ec) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_OK failed: " << expr << " -> [" << ec.category().name() << "] " << ec.message();
  record_failure(file, line, oss.str());
}

// 期望得到某个具体错误码；失败时同时打印实际得到的错误，便于定位。
inline void expect_err(
  const std::error_code& ec,
  const std::error_code& expected,
  const char* expr,
  const char* file,
  int line) {
  if (ec == expected) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_ERR failed: " << expr << " -> [" << ec.category().name() << "] " << ec.message()
      << ", expected [" << expected.category().name() << "] " << expected.message();
  record_failure(file, line, oss.str());
}

inline int run_and_report() {
  if (failure_count() == 0) {
    return 0;
  }
  std::cerr << "FAILED: " << failure_count() << " assertions\n";
  return 1;
}

}  // namespace ubj::tests

#define TEST_EXPECT(expr) ::ubj::tests::expect_true(static_cast<bool>(expr), #expr, __FILE__, __LINE__)
#define TEST_EXPECT_EQ(a, b) ::ubj::tests::expect_eq((a), (b), #a, #b, __FILE__, __LINE__)
#define TEST_EXPECT_OK(ec) ::ubj::tests::expect_ok((ec), #ec, __FILE__, __LINE__)
#define TEST_EXPECT_ERR(ec, expected) \
  ::ubj::tests::expect_err((ec), make_error_code(expected), #ec, __FILE__, __LINE__)
#define TEST_FAIL(msg) ::ubj::tests::record_failure(__FILE__, __LINE__, (msg))
