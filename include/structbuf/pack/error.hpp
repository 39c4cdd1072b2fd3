#pragma once

#include <system_error>

namespace structbuf::pack {

/**
 * @brief pack/unpack 引擎的错误码。
 *
 * - invalid_format：格式串不符合语法（含仅有字节序前缀、无任何类型码的情况）；
 * - invalid_argument：值的类型与格式项不匹配（例如向整数字段传入字节串）；
 * - buffer_too_small：Buffer 长度小于格式串要求的长度（写入/读取前即失败）；
 * - not_enough_values：pack 过程中值列表耗尽（此前的字段已写入）；
 * - unknown_format：格式项中出现无法识别的类型码（仅见于手工构造的 Format）；
 * - length_overflow：格式串要求的总长度超出 Buffer 上限。
 */
enum class errc : int {
  ok = 0,
  invalid_format = 1,
  invalid_argument = 2,
  buffer_too_small = 3,
  not_enough_values = 4,
  unknown_format = 5,
  length_overflow = 6,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace structbuf::pack

namespace std {
template <>
struct is_error_code_enum<structbuf::pack::errc> : true_type {};
}  // namespace std
