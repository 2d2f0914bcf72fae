// argconv/value/decimal.cpp - Exact decimal implementation
//
#include "argconv/value/decimal.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "argconv/basic/text.hpp"

namespace argconv
{

namespace
{

constexpr int64_t k_exponent_limit = 1000000000000000;

/// Multiply a decimal digit string in place by a small factor.
void multiply_digits(std::string & digits, unsigned factor)
{
  unsigned carry = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    const unsigned d = static_cast<unsigned>(*it - '0') * factor + carry;
    *it = static_cast<char>('0' + d % 10);
    carry = d / 10;
  }
  while (carry > 0) {
    digits.insert(digits.begin(), static_cast<char>('0' + carry % 10));
    carry /= 10;
  }
}

std::string strip_leading_zeros(std::string digits)
{
  const auto first = digits.find_first_not_of('0');
  if (first == std::string::npos) return "0";
  return digits.substr(first);
}

/// Remove trailing zeros, adjusting the exponent accordingly.
void strip_trailing_zeros(std::string & digits, int64_t & exponent)
{
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
    ++exponent;
  }
}

int compare_magnitude(std::string a, int64_t ea, std::string b, int64_t eb)
{
  strip_trailing_zeros(a, ea);
  strip_trailing_zeros(b, eb);
  const int64_t adjusted_a = ea + static_cast<int64_t>(a.size());
  const int64_t adjusted_b = eb + static_cast<int64_t>(b.size());
  if (adjusted_a != adjusted_b) return adjusted_a < adjusted_b ? -1 : 1;
  const size_t n = std::max(a.size(), b.size());
  a.resize(n, '0');
  b.resize(n, '0');
  if (a == b) return 0;
  return a < b ? -1 : 1;
}

}  // namespace

std::optional<Decimal> Decimal::parse(std::string_view text)
{
  std::string_view s = strip(text);
  if (s.empty()) return std::nullopt;

  Decimal result;
  if (s.front() == '+' || s.front() == '-') {
    result.negative_ = s.front() == '-';
    s.remove_prefix(1);
  }

  const std::string lowered = to_lower_ascii(s);
  if (lowered == "inf" || lowered == "infinity") {
    result.special_ = Special::Infinity;
    return result;
  }
  if (lowered == "nan" || lowered == "snan") {
    result.special_ = Special::NaN;
    return result;
  }

  std::string int_part;
  std::string frac_part;
  size_t i = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) {
    int_part.push_back(s[i++]);
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) {
      frac_part.push_back(s[i++]);
    }
  }
  if (int_part.empty() && frac_part.empty()) return std::nullopt;

  int64_t exponent = 0;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    bool exp_negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
      exp_negative = s[i] == '-';
      ++i;
    }
    bool any = false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) {
      // Saturate; such a value is already infinite or zero as a double.
      if (exponent < k_exponent_limit) {
        exponent = exponent * 10 + (s[i] - '0');
      }
      any = true;
      ++i;
    }
    if (!any) return std::nullopt;
    if (exp_negative) exponent = -exponent;
  }
  if (i != s.size()) return std::nullopt;

  result.digits_ = strip_leading_zeros(int_part + frac_part);
  result.exponent_ = exponent - static_cast<int64_t>(frac_part.size());
  return result;
}

Decimal Decimal::from_integer(int64_t value)
{
  Decimal result;
  result.negative_ = value < 0;
  // Avoid overflow when negating INT64_MIN.
  const uint64_t magnitude =
    value < 0 ? static_cast<uint64_t>(-(value + 1)) + 1 : static_cast<uint64_t>(value);
  result.digits_ = std::to_string(magnitude);
  return result;
}

Decimal Decimal::from_double(double value)
{
  Decimal result;
  result.negative_ = std::signbit(value);
  if (std::isnan(value)) {
    result.special_ = Special::NaN;
    return result;
  }
  if (std::isinf(value)) {
    result.special_ = Special::Infinity;
    return result;
  }
  if (value == 0.0) {
    return result;
  }

  int exp2 = 0;
  const double fraction = std::frexp(std::fabs(value), &exp2);
  auto mantissa = static_cast<uint64_t>(std::ldexp(fraction, 53));
  exp2 -= 53;
  while (mantissa % 2 == 0 && exp2 < 0) {
    mantissa /= 2;
    ++exp2;
  }

  std::string digits = std::to_string(mantissa);
  if (exp2 >= 0) {
    for (int k = 0; k < exp2; ++k) multiply_digits(digits, 2);
    result.exponent_ = 0;
  } else {
    // m * 2^-k == m * 5^k * 10^-k
    for (int k = 0; k < -exp2; ++k) multiply_digits(digits, 5);
    result.exponent_ = exp2;
  }
  result.digits_ = strip_leading_zeros(std::move(digits));
  return result;
}

bool Decimal::is_integral() const
{
  if (!is_finite()) return false;
  if (exponent_ >= 0) return true;
  const auto frac_len = static_cast<size_t>(-exponent_);
  const size_t start = digits_.size() > frac_len ? digits_.size() - frac_len : 0;
  return digits_.find_first_not_of('0', start) == std::string::npos;
}

std::optional<int64_t> Decimal::to_integer() const
{
  if (!is_integral()) return std::nullopt;

  std::string int_digits;
  if (exponent_ >= 0) {
    if (digits_ == "0") {
      int_digits = "0";
    } else {
      if (exponent_ > 19) return std::nullopt;
      int_digits = digits_ + std::string(static_cast<size_t>(exponent_), '0');
    }
  } else {
    const auto frac_len = static_cast<size_t>(-exponent_);
    int_digits = digits_.size() > frac_len ? digits_.substr(0, digits_.size() - frac_len) : "0";
  }
  int_digits = strip_leading_zeros(int_digits);
  if (int_digits.size() > 19) return std::nullopt;

  uint64_t magnitude = 0;
  for (const char c : int_digits) {
    const auto d = static_cast<uint64_t>(c - '0');
    if (magnitude > (std::numeric_limits<uint64_t>::max() - d) / 10) return std::nullopt;
    magnitude = magnitude * 10 + d;
  }

  constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (negative_) {
    if (magnitude > k_max + 1) return std::nullopt;
    if (magnitude == k_max + 1) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(magnitude);
  }
  if (magnitude > k_max) return std::nullopt;
  return static_cast<int64_t>(magnitude);
}

double Decimal::to_double() const
{
  if (is_nan()) return std::numeric_limits<double>::quiet_NaN();
  if (is_infinite()) {
    return negative_ ? -std::numeric_limits<double>::infinity()
                     : std::numeric_limits<double>::infinity();
  }
  const std::string text =
    (negative_ ? "-" : "") + digits_ + "e" + std::to_string(exponent_);
  return std::strtod(text.c_str(), nullptr);
}

std::string Decimal::to_string() const
{
  const std::string sign = negative_ ? "-" : "";
  if (is_nan()) return "NaN";
  if (is_infinite()) return sign + "Infinity";

  const auto len = static_cast<int64_t>(digits_.size());
  const int64_t leftdigits = exponent_ + len;
  const int64_t dotplace = (exponent_ <= 0 && leftdigits > -6) ? leftdigits : 1;

  std::string intpart;
  std::string fracpart;
  if (dotplace <= 0) {
    intpart = "0";
    fracpart = "." + std::string(static_cast<size_t>(-dotplace), '0') + digits_;
  } else if (dotplace >= len) {
    intpart = digits_ + std::string(static_cast<size_t>(dotplace - len), '0');
  } else {
    intpart = digits_.substr(0, static_cast<size_t>(dotplace));
    fracpart = "." + digits_.substr(static_cast<size_t>(dotplace));
  }

  std::string exp;
  if (leftdigits != dotplace) {
    const int64_t e = leftdigits - dotplace;
    exp = std::string("E") + (e >= 0 ? "+" : "-") + std::to_string(e >= 0 ? e : -e);
  }
  return sign + intpart + fracpart + exp;
}

int Decimal::compare(const Decimal & other) const
{
  const auto rank = [](const Decimal & d) {
    if (d.is_infinite()) return d.negative_ ? -2 : 2;
    if (d.is_zero()) return 0;
    return d.negative_ ? -1 : 1;
  };
  const int ra = rank(*this);
  const int rb = rank(other);
  if (ra != rb) return ra < rb ? -1 : 1;
  if (ra == 0 || ra == 2 || ra == -2) return 0;

  const int magnitude = compare_magnitude(digits_, exponent_, other.digits_, other.exponent_);
  return negative_ ? -magnitude : magnitude;
}

}  // namespace argconv
