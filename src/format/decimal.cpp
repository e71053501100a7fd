#include "ubj/format/decimal.hpp"

#include "ubj/core/error.hpp"

#include <algorithm>
#include <bit>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ubj::format {
namespace {

// 指数绝对值上限：远大于任何实际用途，同时保证 exponent + digits 的运算不会溢出 int64。
constexpr std::int64_t kMaxExponent = 999'999'999'999'999'999LL;

[[nodiscard]] bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] bool starts_with_icase(std::string_view text, std::string_view prefix) noexcept {
  return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

[[nodiscard]] std::string strip_leading_zeros(std::string_view digits) {
  const auto first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return digits.empty() ? std::string{} : std::string{"0"};
  }
  return std::string{digits.substr(first)};
}

[[nodiscard]] bool all_digits(std::string_view s) noexcept {
  return std::all_of(s.begin(), s.end(), is_digit);
}

// 解析 NaN/sNaN 之后的诊断 payload（仅数字，前导零忽略）。
[[nodiscard]] bool parse_nan_payload(std::string_view rest, std::string& out) {
  if (!all_digits(rest)) {
    return false;
  }
  out = strip_leading_zeros(rest);
  if (out == "0") {
    out.clear();
  }
  return true;
}

std::error_code invalid() noexcept { return core::make_error_code(core::errc::invalid_argument); }

// 十进制大数：base 1e9，低位 limb 在前；仅用于 double 的精确展开。
constexpr std::uint32_t kLimbBase = 1'000'000'000u;

void multiply_small(std::vector<std::uint32_t>& limbs, std::uint32_t factor) {
  std::uint64_t carry = 0;
  for (auto& limb : limbs) {
    const std::uint64_t cur = std::uint64_t{limb} * factor + carry;
    limb = static_cast<std::uint32_t>(cur % kLimbBase);
    carry = cur / kLimbBase;
  }
  while (carry != 0) {
    limbs.push_back(static_cast<std::uint32_t>(carry % kLimbBase));
    carry /= kLimbBase;
  }
}

// limbs *= base^n，base 为 2 或 5；按块相乘（块内乘数 < 2^31，乘积不溢出 uint64）。
void multiply_by_power(std::vector<std::uint32_t>& limbs, std::uint32_t base, std::uint32_t n) {
  const std::uint32_t step = base == 2 ? 30 : 13;
  std::uint32_t chunk = 1;
  for (std::uint32_t i = 0; i < step; ++i) {
    chunk *= base;
  }
  for (; n >= step; n -= step) {
    multiply_small(limbs, chunk);
  }
  std::uint32_t rest = 1;
  for (; n > 0; --n) {
    rest *= base;
  }
  if (rest != 1) {
    multiply_small(limbs, rest);
  }
}

[[nodiscard]] std::string limbs_to_digits(const std::vector<std::uint32_t>& limbs) {
  std::string out = std::to_string(limbs.back());
  for (auto it = limbs.rbegin() + 1; it != limbs.rend(); ++it) {
    const auto part = std::to_string(*it);
    out.append(9 - part.size(), '0');
    out += part;
  }
  return out;
}

}  // namespace

std::error_code Decimal::parse(std::string_view text, Decimal& out) noexcept {
  auto s = trim(text);
  Decimal result;

  if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
    result.negative_ = (s.front() == '-');
    s.remove_prefix(1);
  }
  if (s.empty()) {
    return invalid();
  }

  if (iequals(s, "inf") || iequals(s, "infinity")) {
    result.kind_ = kind::infinity;
    result.coefficient_.clear();
    out = std::move(result);
    return {};
  }
  if (starts_with_icase(s, "snan")) {
    result.kind_ = kind::snan;
    if (!parse_nan_payload(s.substr(4), result.coefficient_)) {
      return invalid();
    }
    out = std::move(result);
    return {};
  }
  if (starts_with_icase(s, "nan")) {
    result.kind_ = kind::nan;
    if (!parse_nan_payload(s.substr(3), result.coefficient_)) {
      return invalid();
    }
    out = std::move(result);
    return {};
  }

  // 有限值：digits [ '.' digits ] [ ('e'|'E') [sign] digits ]
  std::size_t pos = 0;
  const auto int_begin = pos;
  while (pos < s.size() && is_digit(s[pos])) {
    ++pos;
  }
  const auto int_part = s.substr(int_begin, pos - int_begin);

  std::string_view frac_part{};
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    const auto frac_begin = pos;
    while (pos < s.size() && is_digit(s[pos])) {
      ++pos;
    }
    frac_part = s.substr(frac_begin, pos - frac_begin);
  }
  if (int_part.empty() && frac_part.empty()) {
    return invalid();
  }

  std::int64_t exponent = 0;
  if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
    ++pos;
    bool exp_negative = false;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
      exp_negative = (s[pos] == '-');
      ++pos;
    }
    const auto exp_digits = s.substr(pos);
    if (exp_digits.empty() || !all_digits(exp_digits)) {
      return invalid();
    }
    const auto significant = strip_leading_zeros(exp_digits);
    if (significant.size() > 18) {
      return invalid();
    }
    std::int64_t magnitude = 0;
    const auto [ptr, ec] = std::from_chars(significant.data(), significant.data() + significant.size(), magnitude);
    if (ec != std::errc{} || ptr != significant.data() + significant.size() || magnitude > kMaxExponent) {
      return invalid();
    }
    exponent = exp_negative ? -magnitude : magnitude;
    pos = s.size();
  }
  if (pos != s.size()) {
    return invalid();
  }

  const auto frac_len = static_cast<std::int64_t>(frac_part.size());
  if (frac_len > kMaxExponent || exponent - frac_len < -kMaxExponent) {
    return invalid();
  }

  std::string digits;
  digits.reserve(int_part.size() + frac_part.size());
  digits.append(int_part);
  digits.append(frac_part);

  result.kind_ = kind::finite;
  result.coefficient_ = strip_leading_zeros(digits);
  result.exponent_ = exponent - frac_len;
  out = std::move(result);
  return {};
}

Decimal Decimal::from_unsigned(std::uint64_t v) {
  Decimal d;
  d.coefficient_ = std::to_string(v);
  return d;
}

Decimal Decimal::from_integer(std::int64_t v) {
  // 先转为无符号幅值，避免 INT64_MIN 取负溢出。
  const auto magnitude = v < 0 ? (~static_cast<std::uint64_t>(v) + 1u) : static_cast<std::uint64_t>(v);
  auto d = from_unsigned(magnitude);
  d.negative_ = v < 0;
  return d;
}

Decimal Decimal::from_double(double v) {
  const auto bits = std::bit_cast<std::uint64_t>(v);
  const auto biased = static_cast<std::int64_t>((bits >> 52) & 0x7FF);
  std::uint64_t mantissa = bits & ((std::uint64_t{1} << 52) - 1);
  if (biased == 0x7FF) {
    // 非有限值应由调用方提前分流。
    if (mantissa != 0) {
      return quiet_nan(std::signbit(v));
    }
    return infinity(std::signbit(v));
  }

  // v = mantissa * 2^exp2（次正规数没有隐含的最高位）。
  std::int64_t exp2 = biased == 0 ? -1074 : biased - 1075;
  if (biased != 0) {
    mantissa |= std::uint64_t{1} << 52;
  }

  Decimal d;
  d.negative_ = std::signbit(v);
  if (mantissa == 0) {
    return d;
  }
  // 约分为最简分数 mantissa / 2^k，与 Python Decimal(float) 的精确展开一致。
  while (exp2 < 0 && (mantissa & 1u) == 0) {
    mantissa >>= 1;
    ++exp2;
  }

  std::vector<std::uint32_t> limbs;
  while (mantissa != 0) {
    limbs.push_back(static_cast<std::uint32_t>(mantissa % kLimbBase));
    mantissa /= kLimbBase;
  }
  if (exp2 >= 0) {
    multiply_by_power(limbs, 2, static_cast<std::uint32_t>(exp2));
    d.exponent_ = 0;
  } else {
    // mantissa / 2^k == mantissa * 5^k * 10^-k
    multiply_by_power(limbs, 5, static_cast<std::uint32_t>(-exp2));
    d.exponent_ = exp2;
  }
  d.coefficient_ = limbs_to_digits(limbs);
  return d;
}

Decimal Decimal::infinity(bool negative) {
  Decimal d;
  d.kind_ = kind::infinity;
  d.negative_ = negative;
  d.coefficient_.clear();
  return d;
}

Decimal Decimal::quiet_nan(bool negative) {
  Decimal d;
  d.kind_ = kind::nan;
  d.negative_ = negative;
  d.coefficient_.clear();
  return d;
}

std::string Decimal::to_string() const {
  std::string out;
  if (negative_) {
    out.push_back('-');
  }
  switch (kind_) {
    case kind::infinity:
      out += "Infinity";
      return out;
    case kind::nan:
      out += "NaN";
      out += coefficient_;
      return out;
    case kind::snan:
      out += "sNaN";
      out += coefficient_;
      return out;
    case kind::finite:
      break;
  }

  const auto ndigits = static_cast<std::int64_t>(coefficient_.size());
  const auto left_digits = exponent_ + ndigits;

  // 指数 <= 0 且不太小时用普通记法，否则小数点放在第一位数字之后。
  std::int64_t dot_place = 1;
  if (exponent_ <= 0 && left_digits > -6) {
    dot_place = left_digits;
  }

  if (dot_place <= 0) {
    out += "0.";
    out.append(static_cast<std::size_t>(-dot_place), '0');
    out += coefficient_;
  } else if (dot_place >= ndigits) {
    out += coefficient_;
    out.append(static_cast<std::size_t>(dot_place - ndigits), '0');
  } else {
    out.append(coefficient_, 0, static_cast<std::size_t>(dot_place));
    out.push_back('.');
    out.append(coefficient_, static_cast<std::size_t>(dot_place), std::string::npos);
  }

  if (left_digits != dot_place) {
    const auto e = left_digits - dot_place;
    out.push_back('E');
    out.push_back(e < 0 ? '-' : '+');
    out += std::to_string(e < 0 ? -e : e);
  }
  return out;
}

bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept {
  if (lhs.is_nan() || rhs.is_nan()) {
    return false;
  }
  if (lhs.kind_ != rhs.kind_) {
    return false;
  }
  if (lhs.kind_ == Decimal::kind::infinity) {
    return lhs.negative_ == rhs.negative_;
  }
  if (lhs.is_zero() || rhs.is_zero()) {
    return lhs.is_zero() && rhs.is_zero();
  }
  if (lhs.negative_ != rhs.negative_) {
    return false;
  }

  // 去掉系数末尾的 0 后逐位比较（等价于 normalize()）。
  const auto lz = lhs.coefficient_.find_last_not_of('0');
  const auto rz = rhs.coefficient_.find_last_not_of('0');
  const auto l_trailing = static_cast<std::int64_t>(lhs.coefficient_.size() - lz - 1);
  const auto r_trailing = static_cast<std::int64_t>(rhs.coefficient_.size() - rz - 1);
  if (lhs.exponent_ + l_trailing != rhs.exponent_ + r_trailing) {
    return false;
  }
  return std::string_view(lhs.coefficient_).substr(0, lz + 1) == std::string_view(rhs.coefficient_).substr(0, rz + 1);
}

}  // namespace ubj::format
