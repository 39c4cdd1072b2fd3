#pragma once

#include "structbuf/pack/error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace structbuf::pack {

/**
 * @brief 格式串中的单字符类型码。
 *
 * 枚举值即格式串中的字符本身，便于诊断信息直接回显。
 * i/l 与 I/L 是两组别名（均为 32 位）。
 */
enum class type_code : char {
  pad = 'x',
  character = 'c',
  int8 = 'b',
  uint8 = 'B',
  boolean = '?',
  int16 = 'h',
  uint16 = 'H',
  int32 = 'i',
  uint32 = 'I',
  long32 = 'l',
  ulong32 = 'L',
  int64 = 'q',
  uint64 = 'Q',
  float16 = 'e',
  float32 = 'f',
  float64 = 'd',
  string = 's',
  pascal = 'p',
};

// Pascal 字符串（'p'）的长度前缀只有 1 字节，重复数超过此值时被截断。
inline constexpr std::size_t kMaxPascalLength = 255;

/**
 * @brief 单个格式项：重复数 + 类型码。
 *
 * 对 's' / 'p'，repeat 表示字段总字节宽度；其他类型码表示连续元素个数。
 */
struct FormatItem final {
  std::size_t repeat{1};
  type_code code{type_code::pad};
  friend bool operator==(const FormatItem&, const FormatItem&) = default;
};

struct Format final {
  bool little_endian{false};
  std::vector<FormatItem> items;
  friend bool operator==(const Format&, const Format&) = default;
};

struct FormatResult {
  Format format;
  std::error_code ec;
  std::string error_message;
};

// c 是否属于类型码字母表；是则写入 out。
[[nodiscard]] bool to_type_code(char c, type_code& out) noexcept;

/**
 * @brief 单个元素的字节宽度（'s' / 'p' 返回 1，因为其 repeat 即总宽度）。
 *
 * 对不在字母表中的值返回 0。
 */
[[nodiscard]] std::size_t element_width(type_code code) noexcept;

/**
 * @brief 解析格式串。
 *
 * 语法：[@=<>!]? ( \d* [xcbB?hHiIlLqQefdsp] )+
 * - '<' 小端；'>' / '!' 大端；'@' / '=' / 无前缀为宿主机字节序；
 * - 省略重复数时为 1；'p' 的重复数超过 255 时截断为 255；
 * - 仅有前缀、没有任何类型码的格式串视为非法。
 *
 * 纯函数：相同输入总得到相同结果，不访问任何全局可变状态。
 */
[[nodiscard]] FormatResult parse_format(std::string_view format) noexcept;

/**
 * @brief 计算格式项序列需要的总字节数（空序列为 0）。
 *
 * 失败仅可能是 errc::length_overflow（重复数累加溢出 size_t）。
 */
std::error_code calc_size(std::span<const FormatItem> items, std::size_t& out_size) noexcept;

// 先解析再计算；格式串非法时返回 errc::invalid_format。
std::error_code calc_size(std::string_view format, std::size_t& out_size) noexcept;

}  // namespace structbuf::pack
