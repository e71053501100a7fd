#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace ubj::format {

/**
 * @brief 任意精度十进制数（UBJSON high-precision `H` 的值模型）。
 *
 * 表示为：符号 + 系数（十进制数字串，无前导零）+ 十进制指数，
 * 即 value = (-1)^negative * coefficient * 10^exponent。
 *
 * 额外支持非有限值（Infinity / NaN / sNaN），它们以文本形式编码，
 * 解码后仍是对应的非有限 Decimal（与 float 的 NaN/Inf -> null 不同）。
 *
 * 文本语法与输出规则与 Python decimal 模块的 str()/Decimal(str) 一致，
 * 以保证与其他实现交换的 `H` 文本可以无损往返。
 */
class Decimal final {
 public:
  enum class kind : std::uint8_t {
    finite = 0,
    infinity = 1,
    nan = 2,
    snan = 3,
  };

  Decimal() = default;

  /**
   * @brief 解析十进制文本（允许首尾空白、符号、小数点、e/E 指数、Inf/Infinity/NaN/sNaN）。
   *
   * 失败返回 core::errc::invalid_argument，out 保持不变。
   */
  static std::error_code parse(std::string_view text, Decimal& out) noexcept;

  static Decimal from_integer(std::int64_t v);
  static Decimal from_unsigned(std::uint64_t v);

  /**
   * @brief 由 double 构造：二进制值的精确十进制展开（不做舍入，系数为最简分数对应的位数）。
   */
  static Decimal from_double(double v);

  static Decimal infinity(bool negative = false);
  static Decimal quiet_nan(bool negative = false);

  [[nodiscard]] kind kind_of() const noexcept { return kind_; }
  [[nodiscard]] bool is_finite() const noexcept { return kind_ == kind::finite; }
  [[nodiscard]] bool is_nan() const noexcept { return kind_ == kind::nan || kind_ == kind::snan; }
  [[nodiscard]] bool is_negative() const noexcept { return negative_; }
  [[nodiscard]] bool is_zero() const noexcept { return is_finite() && coefficient_ == "0"; }

  // NaN 时为诊断 payload（可为空）。
  [[nodiscard]] const std::string& coefficient() const noexcept { return coefficient_; }
  [[nodiscard]] std::int64_t exponent() const noexcept { return exponent_; }

  /**
   * @brief 科学计数法字符串（Python `str(Decimal)` 语义）。
   *
   * 例：1.5 -> "1.5"，1E+3 -> "1E+3"，0.0000001 -> "1E-7"，-Inf -> "-Infinity"。
   */
  [[nodiscard]] std::string to_string() const;

  // 数值相等：末尾零与零的符号不参与比较；NaN 与任何值（包括自身）都不相等。
  friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept;
  friend bool operator!=(const Decimal& lhs, const Decimal& rhs) noexcept { return !(lhs == rhs); }

 private:
  kind kind_{kind::finite};
  bool negative_{false};
  std::string coefficient_{"0"};
  std::int64_t exponent_{0};
};

}  // namespace ubj::format
