#pragma once

#include <cstdint>

namespace structbuf::core {

/**
 * @brief IEEE-754 binary16（半精度）位模式转换。
 *
 * - float_to_half_bits：就近舍入（ties-to-even）；超出范围变为 ±inf，
 *   过小的值渐进下溢为次正规数或 ±0；NaN 保持为 quiet NaN。
 * - half_bits_to_float：精确扩展为 double（binary16 的任何值都可被 double 精确表示）。
 */
[[nodiscard]] std::uint16_t float_to_half_bits(double value) noexcept;
[[nodiscard]] double half_bits_to_float(std::uint16_t bits) noexcept;

}  // namespace structbuf::core
