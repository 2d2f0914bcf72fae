// argconv/value/decimal.hpp - Exact decimal numbers
//
// A decimal is sign * digits * 10^exponent. Trailing zeros are significant
// for display ("1.50" stays "1.50") but not for comparison.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace argconv
{

class Decimal
{
public:
  /// Zero
  Decimal() = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Parse decimal text.
   *
   * Accepts surrounding whitespace, an optional sign, digits with an
   * optional fraction and exponent, and the special values Infinity, Inf and
   * NaN (case-insensitive).
   *
   * @return std::nullopt if the text is not a decimal number
   */
  [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

  [[nodiscard]] static Decimal from_integer(int64_t value);

  /// Exact binary-to-decimal conversion: 0.1 becomes 0.1000000000000000055511...
  [[nodiscard]] static Decimal from_double(double value);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] bool is_nan() const noexcept { return special_ == Special::NaN; }
  [[nodiscard]] bool is_infinite() const noexcept { return special_ == Special::Infinity; }
  [[nodiscard]] bool is_finite() const noexcept { return special_ == Special::Finite; }
  [[nodiscard]] bool is_negative() const noexcept { return negative_; }
  [[nodiscard]] bool is_zero() const noexcept { return is_finite() && digits_ == "0"; }

  /// Finite with no non-zero fractional digits.
  [[nodiscard]] bool is_integral() const;

  /// The exact integer value, if integral and within int64_t.
  [[nodiscard]] std::optional<int64_t> to_integer() const;

  [[nodiscard]] double to_double() const;

  /// Display form following the usual decimal to-scientific-string rules.
  [[nodiscard]] std::string to_string() const;

  /**
   * Three-way numeric comparison (-1, 0, 1).
   *
   * Must not be called with NaN operands.
   */
  [[nodiscard]] int compare(const Decimal & other) const;

  friend bool operator==(const Decimal & a, const Decimal & b)
  {
    if (a.is_nan() || b.is_nan()) return false;
    return a.compare(b) == 0;
  }
  friend bool operator!=(const Decimal & a, const Decimal & b) { return !(a == b); }

private:
  enum class Special : uint8_t { Finite, Infinity, NaN };

  bool negative_ = false;
  std::string digits_ = "0";  ///< coefficient, no leading zeros
  int64_t exponent_ = 0;
  Special special_ = Special::Finite;
};

}  // namespace argconv
