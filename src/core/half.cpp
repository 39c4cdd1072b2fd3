#include "structbuf/core/half.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace structbuf::core {
namespace {

// binary64: 1 + 11 + 52；binary16: 1 + 5 + 10
constexpr int kDoubleBias = 1023;
constexpr int kHalfBias = 15;
constexpr int kMantissaDrop = 52 - 10;

constexpr std::uint64_t kDoubleMantissaMask = (std::uint64_t{1} << 52) - 1;

// 按 ties-to-even 把 value 右移 shift 位（shift 取值 1..63）。
constexpr std::uint64_t shift_round_even(std::uint64_t value, unsigned shift) noexcept {
  const std::uint64_t kept = value >> shift;
  const std::uint64_t rest = value & ((std::uint64_t{1} << shift) - 1);
  const std::uint64_t halfway = std::uint64_t{1} << (shift - 1);
  if (rest > halfway || (rest == halfway && (kept & 1u) != 0)) {
    return kept + 1;
  }
  return kept;
}

}  // namespace

std::uint16_t float_to_half_bits(double value) noexcept {
  const auto bits = std::bit_cast<std::uint64_t>(value);
  const auto sign = static_cast<std::uint16_t>((bits >> 48) & 0x8000u);
  const auto exp = static_cast<int>((bits >> 52) & 0x7FFu);
  const std::uint64_t mantissa = bits & kDoubleMantissaMask;

  if (exp == 0x7FF) {
    if (mantissa == 0) {
      return static_cast<std::uint16_t>(sign | 0x7C00u);
    }
    return static_cast<std::uint16_t>(sign | 0x7C00u | 0x0200u | ((mantissa >> kMantissaDrop) & 0x03FFu));
  }
  if (exp == 0) {
    // double 的零与次正规数远小于 binary16 最小次正规数的一半。
    return sign;
  }

  const int half_exp = exp - kDoubleBias + kHalfBias;
  if (half_exp >= 0x1F) {
    return static_cast<std::uint16_t>(sign | 0x7C00u);
  }

  if (half_exp <= 0) {
    // 次正规数：带上隐含的最高位后整体右移。
    const auto shift = static_cast<unsigned>(kMantissaDrop + 1 - half_exp);
    if (shift > 63) {
      return sign;
    }
    const std::uint64_t full = mantissa | (std::uint64_t{1} << 52);
    // 进位到 0x0400 时恰好得到最小正规数的编码。
    return static_cast<std::uint16_t>(sign | shift_round_even(full, shift));
  }

  const std::uint64_t packed =
    (static_cast<std::uint64_t>(half_exp) << 10) | (mantissa >> kMantissaDrop);
  const std::uint64_t rest = mantissa & ((std::uint64_t{1} << kMantissaDrop) - 1);
  const std::uint64_t halfway = std::uint64_t{1} << (kMantissaDrop - 1);
  std::uint64_t rounded = packed;
  if (rest > halfway || (rest == halfway && (packed & 1u) != 0)) {
    // 尾数进位可能溢出到指数位，0x7C00 即 inf，编码依然正确。
    ++rounded;
  }
  return static_cast<std::uint16_t>(sign | rounded);
}

double half_bits_to_float(std::uint16_t bits) noexcept {
  const bool negative = (bits & 0x8000u) != 0;
  const int exp = (bits >> 10) & 0x1F;
  const int mantissa = bits & 0x03FF;

  double magnitude = 0.0;
  if (exp == 0x1F) {
    magnitude = mantissa == 0 ? std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::quiet_NaN();
  } else if (exp == 0) {
    magnitude = std::ldexp(static_cast<double>(mantissa), 1 - kHalfBias - 10);
  } else {
    magnitude = std::ldexp(static_cast<double>(mantissa | 0x0400), exp - kHalfBias - 10);
  }
  return std::copysign(magnitude, negative ? -1.0 : 1.0);
}

}  // namespace structbuf::core
