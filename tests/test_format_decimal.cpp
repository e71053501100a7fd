#include "ubj/core/error.hpp"
#include "ubj/format/decimal.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace {

using ubj::format::Decimal;

Decimal parse_ok(std::string_view text) {
  Decimal d;
  TEST_EXPECT_OK(Decimal::parse(text, d));
  return d;
}

std::string normalized(std::string_view text) { return parse_ok(text).to_string(); }

void test_parse_and_to_string_plain() {
  TEST_EXPECT_EQ(normalized("0"), "0");
  TEST_EXPECT_EQ(normalized("-0"), "-0");
  TEST_EXPECT_EQ(normalized("1.5"), "1.5");
  TEST_EXPECT_EQ(normalized("+1.5"), "1.5");
  TEST_EXPECT_EQ(normalized("123.450"), "123.450");
  TEST_EXPECT_EQ(normalized("007"), "7");
  TEST_EXPECT_EQ(normalized(".5"), "0.5");
  TEST_EXPECT_EQ(normalized("5."), "5");
  TEST_EXPECT_EQ(normalized("0.000001"), "0.000001");
  TEST_EXPECT_EQ(normalized("  42  "), "42");
  TEST_EXPECT_EQ(normalized("18446744073709551616"), "18446744073709551616");
}

void test_parse_and_to_string_exponent() {
  TEST_EXPECT_EQ(normalized("1e3"), "1E+3");
  TEST_EXPECT_EQ(normalized("1E+3"), "1E+3");
  TEST_EXPECT_EQ(normalized("0.0000001"), "1E-7");
  TEST_EXPECT_EQ(normalized("1.23e-10"), "1.23E-10");
  TEST_EXPECT_EQ(normalized("100E-2"), "1.00");
  TEST_EXPECT_EQ(normalized("-2.5e400"), "-2.5E+400");
  TEST_EXPECT_EQ(normalized("0e5"), "0E+5");
}

void test_parse_special_values() {
  auto inf = parse_ok("Infinity");
  TEST_EXPECT(!inf.is_finite());
  TEST_EXPECT_EQ(inf.kind_of(), Decimal::kind::infinity);
  TEST_EXPECT_EQ(inf.to_string(), "Infinity");

  TEST_EXPECT_EQ(normalized("-inf"), "-Infinity");
  TEST_EXPECT_EQ(normalized("nan"), "NaN");
  TEST_EXPECT_EQ(normalized("-NaN"), "-NaN");
  TEST_EXPECT_EQ(normalized("NaN123"), "NaN123");
  TEST_EXPECT_EQ(normalized("sNaN"), "sNaN");

  TEST_EXPECT(parse_ok("nan").is_nan());
  TEST_EXPECT(parse_ok("snan").is_nan());
}

void test_parse_rejects_garbage() {
  const std::string_view bad[] = {"", "   ", "+", "-", ".", "e5", "1e", "1e+", "1.2.3", "1x", "abc",
                                  "NaNx", "Infinit", "1 2", "0x10", "1e1234567890123456789"};
  for (const auto text : bad) {
    Decimal d = Decimal::from_integer(7);
    const auto ec = Decimal::parse(text, d);
    TEST_EXPECT_EQ(ec, ubj::core::make_error_code(ubj::core::errc::invalid_argument));
    // 失败时不修改输出。
    TEST_EXPECT_EQ(d.to_string(), "7");
  }
}

void test_from_integer() {
  TEST_EXPECT_EQ(Decimal::from_integer(0).to_string(), "0");
  TEST_EXPECT_EQ(Decimal::from_integer(-12).to_string(), "-12");
  TEST_EXPECT_EQ(Decimal::from_integer(std::numeric_limits<std::int64_t>::min()).to_string(),
                 "-9223372036854775808");
  TEST_EXPECT_EQ(Decimal::from_unsigned(std::numeric_limits<std::uint64_t>::max()).to_string(),
                 "18446744073709551615");
}

void test_from_double() {
  TEST_EXPECT_EQ(Decimal::from_double(1.5).to_string(), "1.5");
  TEST_EXPECT_EQ(Decimal::from_double(-0.25).to_string(), "-0.25");
  TEST_EXPECT_EQ(Decimal::from_double(-0.0).to_string(), "-0");
  TEST_EXPECT_EQ(Decimal::from_double(1e22).to_string(), "10000000000000000000000");
  TEST_EXPECT_EQ(Decimal::from_double(1152921504606846976.0).to_string(), "1152921504606846976");
  // 展开是精确的，而不是最短可往返文本。
  TEST_EXPECT_EQ(Decimal::from_double(0.1).to_string(), "0.1000000000000000055511151231257827021181583404541015625");

  // 次正规数：系数为 mantissa * 5^k。
  const auto tiny = Decimal::from_double(1e-310).to_string();
  TEST_EXPECT_EQ(tiny.size(), 770u);
  TEST_EXPECT_EQ(tiny.substr(0, 24), "9.9999999999999694493275");
  TEST_EXPECT_EQ(tiny.substr(tiny.size() - 12), "2421875E-311");

  const auto smallest = Decimal::from_double(5e-324).to_string();
  TEST_EXPECT_EQ(smallest.size(), 757u);
  TEST_EXPECT_EQ(smallest.substr(0, 20), "4.940656458412465441");
  TEST_EXPECT_EQ(smallest.substr(smallest.size() - 12), "7265625E-324");
}

void test_numeric_equality() {
  TEST_EXPECT(parse_ok("1.0") == parse_ok("1"));
  TEST_EXPECT(parse_ok("100") == parse_ok("1E+2"));
  TEST_EXPECT(parse_ok("0") == parse_ok("-0.000"));
  TEST_EXPECT(parse_ok("1.5") != parse_ok("-1.5"));
  TEST_EXPECT(parse_ok("1.5") != parse_ok("1.51"));
  TEST_EXPECT(parse_ok("Infinity") == parse_ok("inf"));
  TEST_EXPECT(parse_ok("Infinity") != parse_ok("-Infinity"));
  TEST_EXPECT(parse_ok("Infinity") != parse_ok("1"));

  const auto nan = parse_ok("NaN");
  TEST_EXPECT(!(nan == nan));
  TEST_EXPECT(nan != nan);
}

void test_roundtrip_through_text() {
  const std::string_view samples[] = {"0", "-1.5", "3.14159265358979323846264338327950288",
                                      "1E+400", "-1.00E-12", "12345678901234567890123", "Infinity",
                                      "-Infinity", "sNaN"};
  for (const auto text : samples) {
    const auto d = parse_ok(text);
    const auto again = parse_ok(d.to_string());
    TEST_EXPECT_EQ(again.to_string(), d.to_string());
  }
}

}  // namespace

int main() {
  test_parse_and_to_string_plain();
  test_parse_and_to_string_exponent();
  test_parse_special_values();
  test_parse_rejects_garbage();
  test_from_integer();
  test_from_double();
  test_numeric_equality();
  test_roundtrip_through_text();
  return ::ubj::tests::run_and_report();
}
